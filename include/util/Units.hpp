#pragma once
#include <cstdint>

namespace hostscope::util {

inline constexpr double kBytesPerGB  = 1'000'000'000.0; // 10^9
inline constexpr double kBytesPerGiB = 1'073'741'824.0; // 2^30

// bytes / 10^9. With rounded=true the result is rounded half-to-even to an
// integral value (2.5 -> 2.0, 3.5 -> 4.0).
[[nodiscard]] double bytes_to_gb(uint64_t bytes, bool rounded = false);

// bytes / 2^30, same rounding rule as bytes_to_gb.
[[nodiscard]] double bytes_to_gib(uint64_t bytes, bool rounded = false);

} // namespace hostscope::util
