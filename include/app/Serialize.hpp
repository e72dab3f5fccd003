#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "model/Snapshot.hpp"

namespace hostscope::app {

// Insertion-ordered so the output follows the record layout.
using Json = nlohmann::ordered_json;

Json to_json(const hostscope::model::CpuInfo& c);
Json to_json(const hostscope::model::CpuLoad& l);
Json to_json(const hostscope::model::DiskRecord& d);
Json to_json(const hostscope::model::GpuSample& g);
Json to_json(const hostscope::model::Memory& m);
Json to_json(const hostscope::model::NetIf& n);
Json to_json(const hostscope::model::HostInfo& h);
Json to_json(const hostscope::model::Snapshot& s);

template <typename T>
Json to_json(const std::vector<T>& v) {
  Json arr = Json::array();
  for (const auto& e : v) arr.push_back(to_json(e));
  return arr;
}

// Compact, or indented by two spaces. Invalid UTF-8 is replaced, not thrown.
std::string dump(const Json& j, bool indent);

template <typename T>
std::string encode(const T& v, bool indent) { return dump(to_json(v), indent); }

// Single-line renderings.
std::string to_string(const hostscope::model::CpuInfo& c);   // socket #0, name=..., vendor=..., countPhys=8, countLogical=16
std::string to_string(const hostscope::model::GpuSample& g); // gfx card #0, 42%, 1024 MiB, 10240 MiB, 215.5W, 65°C
std::string to_string(const hostscope::model::CpuLoad& l);
std::string to_string(const hostscope::model::DiskRecord& d);
std::string to_string(const hostscope::model::Memory& m);
std::string to_string(const hostscope::model::NetIf& n);
std::string to_string(const hostscope::model::HostInfo& h);

// Multi-line text view of a whole snapshot, used by the CLI.
std::string to_text(const hostscope::model::Snapshot& s);

} // namespace hostscope::app
