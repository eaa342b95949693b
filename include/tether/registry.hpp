#pragma once

// tether/registry.hpp: Worker registry: node identity, capacity and liveness.
//
// HEALTH STATE MACHINE (per node):
//
//   online --(miss_threshold_degraded misses | router failure)--> degraded
//   degraded --(miss_threshold_offline misses)--> offline
//   any --(successful heartbeat or probe)--> online
//   any --(mark_disconnected)--> offline        (the only permitted skip)
//   offline --(node_ttl elapsed)--> deregistered (lifecycle, not an error)
//
// INVARIANTS:
//   - Transitions for one node are serialized under that node's lock. Each
//     carries a per-node epoch so subscribers can order what they observe.
//   - try_acquire_slot() re-validates status, capabilities and load against
//     the latest record under the node lock. The scheduler never commits an
//     assignment from a stale snapshot.
//   - Subscribers are invoked after the node lock is released; they may call
//     back into the registry.
//
// Locking: map_mu_ (shared) guards the id -> slot map only. Per-node state is
// behind NodeSlot::mu. Never take map_mu_ exclusively while holding a node lock.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "tether/bounded_queue.hpp"
#include "tether/clock.hpp"
#include "tether/config.hpp"
#include "tether/types.hpp"

namespace tether {

struct NodeInfo {
  std::string           id;
  NodeRole              role{NodeRole::edge};
  std::string           address;
  std::set<std::string> capabilities;
  uint32_t              max_concurrency{1};
  std::string           platform;
  std::string           version;
};

struct NodeMetrics {
  double cpu_pct{0.0};
  double mem_pct{0.0};
};

struct HealthRecord {
  std::string node_id;
  double      latency_us{0.0};    // EWMA
  double      success_rate{1.0};  // EWMA, 0..1
  uint64_t    last_check_ms{0};
  uint64_t    checks{0};
};

struct NodeSnapshot {
  NodeInfo     info;
  NodeStatus   status{NodeStatus::online};
  uint32_t     active{0};
  NodeMetrics  metrics;
  uint64_t     registered_at_ms{0};
  uint64_t     last_heartbeat_ms{0};
  uint32_t     consecutive_misses{0};
  uint64_t     offline_since_ms{0};
  uint64_t     epoch{0};
  HealthRecord health;

  double load_ratio() const {
    return info.max_concurrency == 0
               ? 1.0
               : static_cast<double>(active) / static_cast<double>(info.max_concurrency);
  }
};

enum class TransitionCause {
  registered,
  heartbeat,
  probe_success,
  probe_miss,
  hard_disconnect,
  router_failure,
  ttl_expired,
  deregistered,
};

std::string to_string(TransitionCause c);

struct NodeTransition {
  std::string     node_id;
  NodeStatus      from{NodeStatus::offline};
  NodeStatus      to{NodeStatus::online};
  TransitionCause cause{TransitionCause::registered};
  uint64_t        at_ms{0};
  uint64_t        epoch{0};
  bool            removed{false};  // node left the registry with this transition
};

using TransitionListener = std::function<void(const NodeTransition&)>;

class WorkerRegistry {
 public:
  WorkerRegistry(HealthConfig cfg, Clock clock);

  WorkerRegistry(const WorkerRegistry&) = delete;
  WorkerRegistry& operator=(const WorkerRegistry&) = delete;

  Status register_node(const NodeInfo& info);
  Status deregister_node(const std::string& node_id);

  Status heartbeat(const std::string& node_id, const NodeMetrics& metrics);

  // Outcome of one active probe. Misses drive the degraded/offline thresholds.
  Status record_probe(const std::string& node_id, bool success, uint64_t latency_us);

  Status mark_disconnected(const std::string& node_id);

  // online -> degraded only; other statuses are left alone.
  Status mark_degraded(const std::string& node_id);

  // Deregisters nodes offline for longer than node_ttl. Returns removed ids.
  std::vector<std::string> expire_ttl();

  bool try_acquire_slot(const std::string& node_id, const std::set<std::string>& required);
  void release_slot(const std::string& node_id);

  std::optional<NodeSnapshot> snapshot(const std::string& node_id) const;
  std::vector<NodeSnapshot> snapshot_all() const;  // sorted by node id
  std::optional<NodeStatus> status(const std::string& node_id) const;
  std::optional<HealthRecord> health(const std::string& node_id) const;
  size_t size() const;

  void subscribe(TransitionListener listener);

  // Bounded transition channel for pull-style consumers. Transitions that do
  // not fit are counted in dropped_transitions() and stay visible in the ring.
  std::optional<NodeTransition> poll_transition(std::chrono::milliseconds timeout);
  uint64_t dropped_transitions() const;

  static constexpr size_t kRecentTransitions = 256;
  std::vector<NodeTransition> recent_transitions() const;

  std::string health_json() const;

  const HealthConfig& config() const { return cfg_; }
  uint64_t now() const { return clock_(); }

 private:
  struct NodeSlot {
    mutable std::mutex mu;
    NodeSnapshot       rec;
  };

  std::shared_ptr<NodeSlot> find(const std::string& node_id) const;

  // Applies a status change to rec (node lock held) and returns the transition.
  std::optional<NodeTransition> transition_locked(NodeSnapshot& rec, NodeStatus to,
                                                  TransitionCause cause);
  void update_health_locked(NodeSnapshot& rec, bool success, uint64_t latency_us);
  void publish(const NodeTransition& t);

  HealthConfig cfg_;
  Clock        clock_;

  mutable std::shared_mutex map_mu_;
  std::unordered_map<std::string, std::shared_ptr<NodeSlot>> nodes_;

  mutable std::mutex listeners_mu_;
  std::vector<TransitionListener> listeners_;

  BoundedQueue<NodeTransition> channel_;
  std::atomic<uint64_t> dropped_{0};

  mutable std::mutex ring_mu_;
  std::vector<NodeTransition> ring_;
  size_t ring_head_{0};
};

std::string snapshot_to_json(const NodeSnapshot& s);

}  // namespace tether
