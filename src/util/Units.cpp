#include "util/Units.hpp"

#include <cfenv>
#include <cmath>

namespace hostscope::util {

// std::nearbyint follows the current rounding mode; pin it to nearest-even.
static double round_half_even(double v) {
  const int saved = std::fegetround();
  if (saved == FE_TONEAREST) return std::nearbyint(v);
  std::fesetround(FE_TONEAREST);
  double r = std::nearbyint(v);
  std::fesetround(saved);
  return r;
}

double bytes_to_gb(uint64_t bytes, bool rounded) {
  double v = static_cast<double>(bytes) / kBytesPerGB;
  return rounded ? round_half_even(v) : v;
}

double bytes_to_gib(uint64_t bytes, bool rounded) {
  double v = static_cast<double>(bytes) / kBytesPerGiB;
  return rounded ? round_half_even(v) : v;
}

} // namespace hostscope::util
