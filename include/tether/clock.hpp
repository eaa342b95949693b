#pragma once

// tether/clock.hpp: Time sources and version vectors.
//
// Every timeout, backoff and TTL in the coordinator reads time through an
// injected Clock so tests can advance it by hand. Time is milliseconds on a
// monotonic scale; wall-clock time is never compared across nodes.
//
// VersionVector maps node id -> highest operation sequence observed from that
// node. Absent entries read as zero.

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace tether {

using Clock = std::function<uint64_t()>;

uint64_t steady_now_ms();
Clock steady_clock_source();

// Settable clock for deterministic tests and single-step drivers.
class ManualClock {
 public:
  explicit ManualClock(uint64_t start_ms = 1000) : now_(start_ms) {}

  uint64_t now() const {
    std::lock_guard<std::mutex> lk(mu_);
    return now_;
  }
  void advance(uint64_t ms) {
    std::lock_guard<std::mutex> lk(mu_);
    now_ += ms;
  }
  void set(uint64_t ms) {
    std::lock_guard<std::mutex> lk(mu_);
    now_ = ms;
  }
  Clock source() {
    return [this] { return now(); };
  }

 private:
  mutable std::mutex mu_;
  uint64_t now_;
};

using VersionVector = std::map<std::string, uint64_t>;

enum class CausalOrder { equal, before, after, concurrent };

uint64_t vv_get(const VersionVector& vv, const std::string& node);

// a <= b pointwise.
bool vv_leq(const VersionVector& a, const VersionVector& b);

CausalOrder vv_compare(const VersionVector& a, const VersionVector& b);

VersionVector vv_merge(const VersionVector& a, const VersionVector& b);

std::string vv_to_json(const VersionVector& vv);

}  // namespace tether
