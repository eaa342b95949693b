#pragma once

// tether/coordinator.hpp: Facade that wires registry, health monitor,
// distributor, router, offline queue and sync engine into one node.
//
// WIRING:
//   registry transitions --> distributor.on_node_transition  (requeue lost work)
//                        --> offline_queue.on_node_transition (drain trigger)
//   offline drain sink   --> router.execute(sync_service)
//                              self candidate   -> local SyncEngine::apply
//                              remote candidate -> "sync_apply" message
//   applied operations with a follow-up --> distributor.submit(key "catchup:<op id>")
//
// write(op) always captures the operation durably first; when the sync
// service resolves it is drained immediately, otherwise it waits for the
// authoritative node to come back.
//
// handle(msg) answers messages addressed to this node ("probe",
// "sync_apply", "heartbeat"), so two coordinators can be joined through a
// transport. One-way messages arrive through transport.receive(); start()
// runs a loop that feeds them to handle().
//
// Lifecycle: construct -> init() -> [start() ... stop()]. Every operation
// except the read-only accessors needs a successful init().

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "tether/clock.hpp"
#include "tether/config.hpp"
#include "tether/entity.hpp"
#include "tether/health_monitor.hpp"
#include "tether/offline_queue.hpp"
#include "tether/registry.hpp"
#include "tether/router.hpp"
#include "tether/scheduler.hpp"
#include "tether/store.hpp"
#include "tether/sync_engine.hpp"
#include "tether/transport.hpp"

namespace tether {

struct WriteResult {
  bool        ok{false};
  ErrorCode   code{ErrorCode::none};
  std::string detail;
  std::string op_id;
  OpState     state{OpState::queued};  // queued = captured offline, not yet applied
};

class Coordinator {
 public:
  Coordinator(CoordinatorConfig cfg, ITransport& transport, IStateStore& store,
              Clock clock = steady_clock_source());
  ~Coordinator();

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  // Validates the config, recovers the offline log and registers this node.
  Status init();
  void start();
  void stop();

  Status register_node(const NodeInfo& info);
  Status deregister_node(const std::string& node_id);
  Status heartbeat(const std::string& node_id, const NodeMetrics& metrics);

  SubmitResult submit_task(const TaskSpec& spec);
  std::optional<TaskSnapshot> get_task_status(const std::string& task_id) const;
  Status cancel_task(const std::string& task_id);

  ResolveResult resolve_endpoint(const std::string& service) const;

  EnqueueResult enqueue_offline_operation(OfflineOperation op);
  WriteResult write(OfflineOperation op);
  DrainReport drain_now();
  DrainStatus drain_status() const;

  Status resolve_pending(const std::string& entity_id, PendingDecision decision);
  // Lifts a storage-corruption halt from the sync engine and the offline queue.
  Status operator_reset();
  Status load_entity(const std::string& entity_id, std::optional<Entity>* out) const;

  std::vector<NodeSnapshot> health_snapshot() const;
  std::string health_json() const;
  std::string stats_json() const;

  SendResult handle(const Message& msg);
  // Takes one message from transport.receive() and handles it. False on timeout.
  bool poll_inbound(std::chrono::milliseconds timeout);

  WorkerRegistry& registry() { return registry_; }
  HealthMonitor& health_monitor() { return monitor_; }
  TaskDistributor& distributor() { return distributor_; }
  ConnectionRouter& router() { return router_; }
  OfflineQueueManager& offline_queue() { return queue_; }
  SyncEngine& sync_engine() { return sync_; }
  const CoordinatorConfig& config() const { return cfg_; }

 private:
  ApplyResult replay(const OfflineOperation& op);
  ApplyResult replay_remote(const std::string& node_id, const OfflineOperation& op);
  void submit_follow_ups(const DrainReport& report);
  Status require_ready() const;
  void inbound_loop();

  CoordinatorConfig cfg_;
  ITransport&       transport_;
  IStateStore&      store_;
  Clock             clock_;

  WorkerRegistry      registry_;
  HealthMonitor       monitor_;
  TaskDistributor     distributor_;
  ConnectionRouter    router_;
  OfflineQueueManager queue_;
  SyncEngine          sync_;

  bool initialized_{false};
  bool started_{false};
  std::thread       inbound_;
  std::atomic<bool> inbound_stopping_{false};
};

}  // namespace tether
