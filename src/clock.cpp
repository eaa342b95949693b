#include "tether/clock.hpp"

#include <chrono>

#include "tether/jsonlite.hpp"

namespace tether {

uint64_t steady_now_ms() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now().time_since_epoch())
                                   .count());
}

Clock steady_clock_source() {
  return [] { return steady_now_ms(); };
}

uint64_t vv_get(const VersionVector& vv, const std::string& node) {
  auto it = vv.find(node);
  return it == vv.end() ? 0 : it->second;
}

bool vv_leq(const VersionVector& a, const VersionVector& b) {
  for (const auto& [node, n] : a) {
    if (n > vv_get(b, node)) return false;
  }
  return true;
}

CausalOrder vv_compare(const VersionVector& a, const VersionVector& b) {
  const bool a_le_b = vv_leq(a, b);
  const bool b_le_a = vv_leq(b, a);
  if (a_le_b && b_le_a) return CausalOrder::equal;
  if (a_le_b) return CausalOrder::before;
  if (b_le_a) return CausalOrder::after;
  return CausalOrder::concurrent;
}

VersionVector vv_merge(const VersionVector& a, const VersionVector& b) {
  VersionVector out = a;
  for (const auto& [node, n] : b) {
    auto& slot = out[node];
    if (n > slot) slot = n;
  }
  return out;
}

std::string vv_to_json(const VersionVector& vv) {
  return jsonlite::to_json(jsonlite::Value{jsonlite::to_object(vv)});
}

}  // namespace tether
