#pragma once

// tether/observability.hpp: Coordination events, counters and latency.
//
// DESIGN:
//   CoordinationEvent is the observable unit. Node transitions, dispatch
//   outcomes, route failovers, replayed operations and conflicts each emit one.
//   emit_event():
//     1. records the event in the process-wide CoordinatorStats,
//     2. forwards it to an optional hook (set_event_hook),
//     3. otherwise appends one JSON line to $TETHER_EVENT_LOG when set.
//
// INVARIANT: emission never blocks a coordination path on I/O it does not own;
// the JSONL sink is a single O_APPEND write per event.
//
// Operator warnings (storage halts, TTL deregistration) go to stderr with a
// "[tether:<component>]" prefix through log_warning().

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "tether/types.hpp"

namespace tether {

struct CoordinationEvent {
  std::string kind;        // e.g. "node_transition", "task_dispatch", "conflict"
  std::string component;   // "registry", "distributor", "router", "offline_queue", "sync"
  std::string subject;     // node id, task id, service name or operation id
  std::string detail;
  bool        ok{true};
  ErrorCode   code{ErrorCode::none};
  uint64_t    duration_ns{0};
  uint64_t    at_ms{0};
};

// Bucket i covers [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);
  double percentile(double p) const;
  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;
  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

class CoordinatorStats {
 public:
  // Registry / health monitor
  alignas(64) std::atomic<uint64_t> nodes_registered{0};
  alignas(64) std::atomic<uint64_t> nodes_deregistered{0};
  alignas(64) std::atomic<uint64_t> node_transitions{0};
  alignas(64) std::atomic<uint64_t> probes_sent{0};
  alignas(64) std::atomic<uint64_t> probe_misses{0};

  // Distributor
  alignas(64) std::atomic<uint64_t> tasks_submitted{0};
  alignas(64) std::atomic<uint64_t> tasks_deduplicated{0};
  alignas(64) std::atomic<uint64_t> tasks_dispatched{0};
  alignas(64) std::atomic<uint64_t> tasks_succeeded{0};
  alignas(64) std::atomic<uint64_t> tasks_failed{0};
  alignas(64) std::atomic<uint64_t> task_retries{0};
  alignas(64) std::atomic<uint64_t> tasks_dead_lettered{0};
  alignas(64) std::atomic<uint64_t> tasks_cancelled{0};
  alignas(64) std::atomic<uint64_t> backpressure_signals{0};

  // Router
  alignas(64) std::atomic<uint64_t> routes_resolved{0};
  alignas(64) std::atomic<uint64_t> route_failovers{0};
  alignas(64) std::atomic<uint64_t> breaker_trips{0};

  // Offline queue / sync
  alignas(64) std::atomic<uint64_t> ops_enqueued{0};
  alignas(64) std::atomic<uint64_t> ops_replayed{0};
  alignas(64) std::atomic<uint64_t> ops_applied{0};
  alignas(64) std::atomic<uint64_t> ops_conflicted{0};
  alignas(64) std::atomic<uint64_t> merges{0};
  alignas(64) std::atomic<uint64_t> pending_reviews{0};
  alignas(64) std::atomic<uint64_t> storage_halts{0};

  LatencyHistogram dispatch_latency;
  LatencyHistogram probe_latency;
  LatencyHistogram replay_latency;

  static constexpr size_t kMaxRecentEvents = 512;

  void record_event(const CoordinationEvent& ev);
  std::vector<CoordinationEvent> recent_events_snapshot() const;
  uint64_t failures_for(ErrorCode code) const;
  std::string to_json() const;

 private:
  mutable std::mutex ring_mu_;
  std::vector<CoordinationEvent> ring_buffer_;
  size_t ring_head_{0};
  std::map<std::string, uint64_t> failure_categories_;  // guarded by ring_mu_
};

CoordinatorStats& global_stats();

void emit_event(const CoordinationEvent& ev);

using EventHook = void (*)(const CoordinationEvent&);
void set_event_hook(EventHook hook);

std::string event_to_json(const CoordinationEvent& ev);

void log_warning(std::string_view component, const std::string& message);

}  // namespace tether
