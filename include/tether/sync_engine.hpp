#pragma once

// tether/sync_engine.hpp: Applies offline operations to canonical state and
// resolves conflicts.
//
// APPLY PIPELINE (per operation, serialized per entity):
//   1. halted?                       -> storage_corrupt
//   2. load entity (revision N)      -> storage_corrupt halts the engine
//   3. vv[origin] >= seq             -> duplicate, reported as applied
//   4. concurrent = canonical vv holds changes the op's captured vv lacks
//   5. merge fields through merge_table(); tombstone rules below
//   6. deadline passed?              -> pending review (deadline_expired)
//   7. store_entity(expected N)      -> version_mismatch reloads from step 2
//   8. conflicting outcomes are appended to the conflict journal
//
// TOMBSTONES:
//   delete, causally after everything seen     -> tombstone
//   delete vs concurrent update (either order) -> pending review: tombstone
//                                                 cleared, fields kept, delete
//                                                 op id recorded
//   delete vs concurrent delete                -> tombstone, greater stamp wins
//   resolve_pending(keep | remove) settles the review.
//
// VERSION VECTORS: vv[origin] = max(seq). Each conflicting apply increments
// vv[merge_key()], the resolving node's own merge counter. Merge counters are
// not part of the causality check.
//
// CONFLICT JOURNAL: NDJSON through IStateStore::append_journal(). Each line
// carries seq (1-based, gap-free) and prev = journal_link(previous line), or
// 64 zeros for the first entry. verify() walks the chain.

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tether/clock.hpp"
#include "tether/entity.hpp"
#include "tether/store.hpp"
#include "tether/types.hpp"

namespace tether {

struct JournalVerifyResult {
  bool        ok{true};
  uint64_t    entries{0};
  uint64_t    first_bad_seq{0};
  std::string detail;
};

class ConflictJournal {
 public:
  explicit ConflictJournal(IStateStore& store);

  Status append(const ConflictResolution& r);
  Status entries(std::vector<jsonlite::Object>* out) const;
  JournalVerifyResult verify() const;

 private:
  Status load_tail_locked();

  IStateStore& store_;
  std::mutex   mu_;
  bool         loaded_{false};
  uint64_t     last_seq_{0};
  std::string  last_link_;
};

JournalVerifyResult verify_journal_lines(const std::vector<std::string>& lines);

enum class PendingDecision { keep, remove };

class SyncEngine {
 public:
  SyncEngine(IStateStore& store, std::string node_id, Clock clock);

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  // deadline_ms: absolute on the engine clock, 0 = none.
  ApplyResult apply(const OfflineOperation& op, uint64_t deadline_ms = 0);

  // Settles a pending review. settled receives the operation ids that were
  // waiting on it.
  Status resolve_pending(const std::string& entity_id, PendingDecision decision,
                         std::vector<std::string>* settled = nullptr);

  Status load(const std::string& entity_id, std::optional<Entity>* out) const;

  bool halted() const { return halted_.load(); }
  std::string halt_reason() const;
  void operator_reset();

  ConflictJournal& journal() { return journal_; }
  const std::string& node_id() const { return node_id_; }
  std::string merge_key() const { return node_id_ + "#merge"; }

 private:
  static constexpr size_t kStripes = 64;
  static constexpr int kMaxCasAttempts = 8;

  std::mutex& stripe(const std::string& entity_id);
  Status halt(const Status& cause);
  bool concurrent_with(const Entity& e, const OfflineOperation& op) const;

  IStateStore&    store_;
  std::string     node_id_;
  Clock           clock_;
  ConflictJournal journal_;

  std::array<std::mutex, kStripes> stripes_;

  std::atomic<bool>  halted_{false};
  mutable std::mutex halt_mu_;
  std::string        halt_reason_;
};

}  // namespace tether
