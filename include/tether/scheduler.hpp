#pragma once

// tether/scheduler.hpp: Task distributor: priority queue, assignment,
// dispatch, retry and dead-lettering.
//
// TASK LIFECYCLE:
//
//   submit -> queued -> assigned -> running -> succeeded
//                ^          |          |----> failed          (permanent_task_failure)
//                |          |          |----> queued          (transient, retry_count+1, backoff)
//                |          |          '----> dead_lettered   (retries exhausted)
//                |          '-> cancelled (cooperative; abort sent to the node)
//                '-- node went offline while assigned/running
//   queued -> dead_lettered (deadline_exceeded) | cancelled
//
// INVARIANTS:
//   - A task holds at most one node slot. The slot is taken through
//     WorkerRegistry::try_acquire_slot() and released exactly once when the
//     task leaves assigned/running.
//   - Every dispatch carries an attempt number. A completion whose attempt no
//     longer matches (task cancelled, requeued or already finished) is ignored.
//   - Resubmitting an idempotency key returns the existing task id and never
//     executes twice.
//   - Queued tasks are bounded by max_queued_tasks. Lack of an eligible node is
//     backpressure (capacity_exhausted), never a failure.
//
// ORDERING: effective priority descending, then submission order. A task's
// effective priority grows by escalation_step for every full max_wait it has
// spent queued.
//
// assign_once() and pump() are single-step entry points for tests and
// embedded drivers; start() runs one assign thread plus dispatch_workers
// dispatch threads connected by a BoundedQueue.
//
// The coordinator's own registry entry (self_id) is never an assignment target.
//
// Lock order: TaskDistributor::mu_ before any registry node lock.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "tether/bounded_queue.hpp"
#include "tether/clock.hpp"
#include "tether/config.hpp"
#include "tether/registry.hpp"
#include "tether/transport.hpp"
#include "tether/types.hpp"

namespace tether {

struct TaskSpec {
  std::string           idempotency_key;  // empty = no deduplication
  std::string           kind;
  std::string           payload;
  std::set<std::string> required_capabilities;
  int32_t               priority{0};
  uint64_t              deadline_ms{0};   // absolute, on the coordinator clock; 0 = none
};

struct TaskSnapshot {
  std::string           id;
  std::string           idempotency_key;
  std::string           kind;
  std::string           payload;
  std::set<std::string> required_capabilities;
  TaskStatus            status{TaskStatus::queued};
  std::string           assigned_node;
  uint32_t              retry_count{0};
  uint32_t              attempt{0};
  int32_t               priority{0};
  int32_t               effective_priority{0};
  uint64_t              created_ms{0};
  uint64_t              next_eligible_ms{0};
  uint64_t              deadline_ms{0};
  ErrorCode             last_error{ErrorCode::none};
  std::string           result;
};

struct SubmitResult {
  bool        ok{false};
  std::string task_id;
  bool        deduplicated{false};
  // capacity_exhausted with ok=true: accepted, but no node can take it now.
  ErrorCode   code{ErrorCode::none};
  std::string detail;
};

struct Assignment {
  std::string task_id;
  std::string node_id;
  uint32_t    attempt{0};
};

uint64_t backoff_delay_ms(uint32_t retry_count, uint64_t base_ms, uint64_t cap_ms);

class TaskDistributor {
 public:
  TaskDistributor(WorkerRegistry& registry, ITransport& transport, SchedulerConfig cfg,
                  std::string self_id, Clock clock);
  ~TaskDistributor();

  TaskDistributor(const TaskDistributor&) = delete;
  TaskDistributor& operator=(const TaskDistributor&) = delete;

  SubmitResult submit(const TaskSpec& spec);

  std::optional<TaskSnapshot> task(const std::string& task_id) const;
  std::optional<TaskStatus> status(const std::string& task_id) const;

  Status cancel(const std::string& task_id);

  // Selects ready tasks and commits assignments (slots acquired).
  std::vector<Assignment> assign_once();

  // Sends one assignment to its node and records the outcome. Blocks up to
  // the dispatch timeout.
  void execute(const Assignment& assignment);

  // assign_once() + execute() each assignment on the calling thread.
  size_t pump();

  // Registry subscriber: requeues work held by nodes that went offline.
  void on_node_transition(const NodeTransition& t);

  std::vector<TaskSnapshot> dead_letters() const;
  std::map<TaskStatus, size_t> counts() const;
  size_t queued_count() const;

  void start();
  void stop();

  std::string to_json() const;

 private:
  struct TaskRecord {
    TaskSnapshot snap;
    uint64_t     seq{0};
    bool         slot_held{false};
  };

  TaskRecord* find_locked(const std::string& task_id);
  int32_t effective_priority_locked(const TaskRecord& t, uint64_t now) const;
  void release_locked(TaskRecord& t);
  void retry_or_dead_letter_locked(TaskRecord& t, ErrorCode code, uint64_t now);
  void dead_letter_locked(TaskRecord& t, ErrorCode code);
  void revert_assignment(const Assignment& a);
  bool any_eligible_node(const std::set<std::string>& required) const;
  void emit_task_event(const std::string& kind, const TaskSnapshot& t, bool ok) const;

  void assign_loop();
  void dispatch_loop();
  void wake();

  WorkerRegistry& registry_;
  ITransport&     transport_;
  SchedulerConfig cfg_;
  std::string     self_id_;
  Clock           clock_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, TaskRecord> tasks_;
  std::unordered_map<std::string, std::string> by_key_;
  std::map<uint64_t, std::string> queue_;  // submission seq -> task id, queued only
  std::vector<std::string> dead_letter_ids_;
  uint64_t next_seq_{0};

  std::mutex                  loop_mu_;
  std::condition_variable     loop_cv_;
  bool                        wake_{false};
  std::atomic<bool>           stopping_{false};
  std::thread                 assign_thread_;
  std::vector<std::thread>    dispatch_threads_;
  std::unique_ptr<BoundedQueue<Assignment>> dispatch_q_;
};

}  // namespace tether
