#pragma once

// tether/offline_queue.hpp: Durable, per-origin ordered buffer of local
// writes captured while the authoritative node is unreachable.
//
// LOG FORMAT (IStateStore offline log, NDJSON):
//   line 1   {"type":"header","version":OFFLINE_LOG_VERSION[,"seqs":{...},"lamport":n]}
//   op       {"type":"op","op":{...},"sum":<checksum>}
//   state    {"type":"state","id":<op id>,"state":<OpState>,"at":ms,"error":"...","sum":<checksum>}
//   sum = record_checksum(canonical JSON of the record without "sum").
//
// INVARIANTS:
//   - Sequence numbers are strictly increasing per origin; an operation's
//     captured vv holds its origin's previous sequence.
//   - recover() runs before anything else: it verifies every checksum and the
//     format version, and turns replaying entries back into queued. Until it
//     succeeds enqueue/drain return not_ready.
//   - drain_once() delivers each origin's entries in sequence order. A
//     transient failure stops that origin until the next trigger; a
//     storage_corrupt outcome halts draining entirely.
//   - A crash between delivery and the outcome record replays the entry;
//     the sync engine reports it as a duplicate.
//
// Drain trigger: the authoritative node transitioning offline -> online
// (on_node_transition), or an explicit request_drain().
//
// compact() rewrites the log with a header that also carries the per-origin
// sequence high-water marks and the Lamport clock, so numbering survives the
// removal of every record of an origin.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "tether/clock.hpp"
#include "tether/config.hpp"
#include "tether/entity.hpp"
#include "tether/registry.hpp"
#include "tether/store.hpp"
#include "tether/types.hpp"

namespace tether {

struct EnqueueResult {
  bool        ok{false};
  ErrorCode   code{ErrorCode::none};
  std::string detail;
  std::string op_id;
  uint64_t    sequence{0};
};

struct DrainReport {
  bool        ok{true};
  ErrorCode   code{ErrorCode::none};
  std::string detail;
  size_t      attempted{0};
  size_t      applied{0};
  size_t      conflicted{0};
  std::vector<std::string> stalled_origins;
  // (op id, task) for operations that reached applied/resolved this drain.
  std::vector<std::pair<std::string, FollowUpTask>> follow_ups;
};

struct DrainStatus {
  bool                       recovered{false};
  bool                       draining{false};
  bool                       halted{false};
  bool                       drain_requested{false};
  std::map<OpState, size_t>  counts;
  size_t                     unapplied{0};
  uint64_t                   last_drain_ms{0};
  ErrorCode                  last_error{ErrorCode::none};
  std::string                last_error_detail;
};

struct CompactReport {
  bool        ok{false};
  ErrorCode   code{ErrorCode::none};
  std::string detail;
  size_t      removed{0};
  size_t      kept{0};
};

class OfflineQueueManager {
 public:
  using ReplaySink = std::function<ApplyResult(const OfflineOperation&)>;

  OfflineQueueManager(IStateStore& store, OfflineConfig cfg, std::string node_id, Clock clock);
  ~OfflineQueueManager();

  OfflineQueueManager(const OfflineQueueManager&) = delete;
  OfflineQueueManager& operator=(const OfflineQueueManager&) = delete;

  Status recover();

  // Assigns id, sequence, logical timestamp and capture time. An empty origin
  // means this node.
  EnqueueResult enqueue(OfflineOperation op);

  DrainReport drain_once(const ReplaySink& sink);

  void on_node_transition(const NodeTransition& t);
  void request_drain();
  // Consumes a pending drain request.
  bool take_drain_request();

  // Marks conflicted operations resolved after their review was settled.
  Status mark_resolved(const std::vector<std::string>& op_ids);

  CompactReport compact();

  // Clears a drain halt once the operator repaired storage, and requests a drain.
  void operator_reset();

  DrainStatus drain_status() const;
  std::vector<OfflineOperation> operations() const;  // capture order
  std::optional<OfflineOperation> operation(const std::string& op_id) const;

  // Background drain thread; follow-ups from each drain go to on_drained.
  void start(ReplaySink sink, std::function<void(const DrainReport&)> on_drained);
  void stop();

 private:
  Status append_record_locked(jsonlite::Object record);
  Status append_state_locked(const std::string& op_id, OpState state, ErrorCode error);
  size_t unapplied_locked() const;
  void drain_loop();

  IStateStore&  store_;
  OfflineConfig cfg_;
  std::string   node_id_;
  Clock         clock_;

  mutable std::mutex mu_;
  bool recovered_{false};
  bool halted_{false};
  std::vector<std::string> order_;                  // capture order
  std::map<std::string, OfflineOperation> ops_;
  std::map<std::string, uint64_t> next_seq_;        // origin -> last sequence
  uint64_t lamport_{0};
  uint64_t last_drain_ms_{0};
  ErrorCode last_error_{ErrorCode::none};
  std::string last_error_detail_;

  std::mutex drain_mu_;  // one drain at a time
  std::atomic<bool> draining_{false};

  mutable std::mutex      loop_mu_;
  std::condition_variable loop_cv_;
  bool                    drain_requested_{false};
  bool                    stopping_{false};
  std::thread             worker_;
  ReplaySink              sink_;
  std::function<void(const DrainReport&)> on_drained_;
};

std::string drain_status_to_json(const DrainStatus& s);

}  // namespace tether
