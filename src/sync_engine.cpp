#include "tether/sync_engine.hpp"

#include <algorithm>
#include <chrono>
#include <functional>

#include "tether/hash.hpp"
#include "tether/merge.hpp"
#include "tether/observability.hpp"
#include "tether/version.hpp"

namespace tether {

namespace {

const std::string kGenesisLink(64, '0');

bool is_merge_key(const std::string& k) {
  static const std::string suffix = "#merge";
  return k.size() > suffix.size() && k.compare(k.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Several parked deletes keep the one with the greatest stamp.
void note_pending_delete(Entity& e, const std::string& op_id, const WriteStamp& stamp) {
  if (e.pending_delete.empty() || e.pending_delete_stamp < stamp) {
    e.pending_delete       = op_id;
    e.pending_delete_stamp = stamp;
  }
}

void emit_sync_event(const std::string& kind, const OfflineOperation& op, const std::string& detail,
                     bool ok, ErrorCode code, uint64_t duration_ns, uint64_t at_ms) {
  CoordinationEvent ev;
  ev.kind        = kind;
  ev.component   = "sync";
  ev.subject     = op.id;
  ev.detail      = op.entity_id + ": " + detail;
  ev.ok          = ok;
  ev.code        = code;
  ev.duration_ns = duration_ns;
  ev.at_ms       = at_ms;
  emit_event(ev);
}

}  // namespace

// ---------------------------------------------------------------------------
// ConflictJournal
// ---------------------------------------------------------------------------

ConflictJournal::ConflictJournal(IStateStore& store) : store_(store) {}

Status ConflictJournal::load_tail_locked() {
  if (loaded_) return Status::success();
  std::vector<std::string> lines;
  Status st = store_.read_journal(&lines);
  if (!st.ok) return st;
  JournalVerifyResult v = verify_journal_lines(lines);
  if (!v.ok) return Status::failure(ErrorCode::storage_corrupt, "conflict journal: " + v.detail);
  last_seq_  = lines.size();
  last_link_ = lines.empty() ? kGenesisLink : journal_link(lines.back());
  loaded_    = true;
  return Status::success();
}

Status ConflictJournal::append(const ConflictResolution& r) {
  std::lock_guard<std::mutex> lk(mu_);
  Status st = load_tail_locked();
  if (!st.ok) return st;

  jsonlite::Object entry = resolution_to_object(r);
  entry["seq"]     = last_seq_ + 1;
  entry["prev"]    = last_link_;
  entry["version"] = version::CONFLICT_JOURNAL_VERSION;
  const std::string line = jsonlite::to_json(jsonlite::Value{entry});

  st = store_.append_journal(line);
  if (!st.ok) return st;
  ++last_seq_;
  last_link_ = journal_link(line);
  return Status::success();
}

Status ConflictJournal::entries(std::vector<jsonlite::Object>* out) const {
  std::vector<std::string> lines;
  Status st = store_.read_journal(&lines);
  if (!st.ok) return st;
  out->clear();
  for (size_t i = 0; i < lines.size(); ++i) {
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(lines[i], &err);
    if (err) {
      return Status::failure(ErrorCode::storage_corrupt,
                             "conflict journal line " + std::to_string(i + 1) + ": " + err->message);
    }
    out->push_back(std::move(obj));
  }
  return Status::success();
}

JournalVerifyResult ConflictJournal::verify() const {
  std::vector<std::string> lines;
  Status st = store_.read_journal(&lines);
  if (!st.ok) {
    JournalVerifyResult r;
    r.ok     = false;
    r.detail = st.detail;
    return r;
  }
  return verify_journal_lines(lines);
}

JournalVerifyResult verify_journal_lines(const std::vector<std::string>& lines) {
  JournalVerifyResult r;
  std::string expected_prev = kGenesisLink;
  for (size_t i = 0; i < lines.size(); ++i) {
    const uint64_t seq = i + 1;
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(lines[i], &err);
    if (err) {
      r.ok            = false;
      r.first_bad_seq = seq;
      r.detail        = "line " + std::to_string(seq) + ": " + err->message;
      return r;
    }
    auto compat = version::check_format(
        "conflict_journal", static_cast<uint32_t>(jsonlite::get_u64(obj, "version")),
        version::CONFLICT_JOURNAL_VERSION);
    if (!compat.ok) {
      r.ok            = false;
      r.first_bad_seq = seq;
      r.detail        = compat.description;
      return r;
    }
    if (jsonlite::get_u64(obj, "seq") != seq) {
      r.ok            = false;
      r.first_bad_seq = seq;
      r.detail        = "line " + std::to_string(seq) + ": sequence gap";
      return r;
    }
    if (jsonlite::get_string(obj, "prev") != expected_prev) {
      r.ok            = false;
      r.first_bad_seq = seq;
      r.detail        = "line " + std::to_string(seq) + ": broken chain link";
      return r;
    }
    expected_prev = journal_link(lines[i]);
    ++r.entries;
  }
  return r;
}

// ---------------------------------------------------------------------------
// SyncEngine
// ---------------------------------------------------------------------------

SyncEngine::SyncEngine(IStateStore& store, std::string node_id, Clock clock)
    : store_(store), node_id_(std::move(node_id)), clock_(std::move(clock)), journal_(store) {}

std::mutex& SyncEngine::stripe(const std::string& entity_id) {
  return stripes_[std::hash<std::string>{}(entity_id) % kStripes];
}

std::string SyncEngine::halt_reason() const {
  std::lock_guard<std::mutex> lk(halt_mu_);
  return halt_reason_;
}

Status SyncEngine::halt(const Status& cause) {
  {
    std::lock_guard<std::mutex> lk(halt_mu_);
    if (!halted_.load()) halt_reason_ = cause.detail;
    halted_ = true;
  }
  global_stats().storage_halts.fetch_add(1, std::memory_order_relaxed);
  log_warning("sync", "halting on storage corruption: " + cause.detail +
                          " (operator_reset() required)");
  CoordinationEvent ev;
  ev.kind      = "sync_halt";
  ev.component = "sync";
  ev.subject   = node_id_;
  ev.detail    = cause.detail;
  ev.ok        = false;
  ev.code      = ErrorCode::storage_corrupt;
  ev.at_ms     = clock_();
  emit_event(ev);
  return Status::failure(ErrorCode::storage_corrupt, cause.detail);
}

void SyncEngine::operator_reset() {
  std::lock_guard<std::mutex> lk(halt_mu_);
  halted_ = false;
  halt_reason_.clear();
}

Status SyncEngine::load(const std::string& entity_id, std::optional<Entity>* out) const {
  std::optional<EntityRecord> rec;
  Status st = store_.load_entity(entity_id, &rec);
  if (!st.ok) return st;
  if (!rec) {
    out->reset();
    return Status::success();
  }
  Entity e;
  st = entity_from_json(rec->body, &e);
  if (!st.ok) return st;
  *out = std::move(e);
  return Status::success();
}

bool SyncEngine::concurrent_with(const Entity& e, const OfflineOperation& op) const {
  for (const auto& [node, counter] : e.vv) {
    if (is_merge_key(node)) continue;
    if (counter > vv_get(op.captured_vv, node)) return true;
  }
  return false;
}

ApplyResult SyncEngine::apply(const OfflineOperation& op, uint64_t deadline_ms) {
  ApplyResult out;
  if (halted_) {
    out.code   = ErrorCode::storage_corrupt;
    out.detail = "sync engine halted: " + halt_reason();
    return out;
  }
  if (op.entity_id.empty() || op.origin.empty() || op.sequence == 0) {
    out.code   = ErrorCode::invalid_argument;
    out.detail = "operation needs entity, origin and sequence";
    return out;
  }

  const auto started = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lk(stripe(op.entity_id));
  const WriteStamp stamp{op.logical_ts, op.origin};

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    std::optional<EntityRecord> rec;
    Status st = store_.load_entity(op.entity_id, &rec);
    if (!st.ok) {
      out.code   = st.code;
      out.detail = st.detail;
      if (st.code == ErrorCode::storage_corrupt) halt(st);
      return out;
    }
    Entity cur;
    cur.id = op.entity_id;
    uint64_t revision = 0;
    if (rec) {
      revision = rec->revision;
      st = entity_from_json(rec->body, &cur);
      if (!st.ok) {
        out.code   = ErrorCode::storage_corrupt;
        out.detail = st.detail;
        halt(st);
        return out;
      }
    }

    if (vv_get(cur.vv, op.origin) >= op.sequence) {
      out.ok        = true;
      out.duplicate = true;
      out.state     = OpState::applied;
      out.revision  = revision;
      global_stats().ops_replayed.fetch_add(1, std::memory_order_relaxed);
      return out;
    }

    const bool concurrent = concurrent_with(cur, op);
    Entity next = cur;
    ConflictResolution res;
    res.entity_id = op.entity_id;
    res.resolver  = node_id_;
    res.op_ids.push_back(op.id);
    ResolutionStrategy strategy = ResolutionStrategy::fast_forward;

    if (op.kind == OpKind::remove) {
      if (!concurrent) {
        next.deleted       = true;
        next.deleted_by    = op.id;
        next.deleted_stamp = stamp;
      } else if (cur.deleted) {
        // Concurrent deletes agree; the greater stamp names the tombstone.
        if (cur.deleted_stamp < stamp) {
          next.deleted_by    = op.id;
          next.deleted_stamp = stamp;
        }
        strategy = ResolutionStrategy::field_merge;
      } else {
        next.pending_review.insert(op.id);
        note_pending_delete(next, op.id, stamp);
        strategy = ResolutionStrategy::pending_review;
      }
    } else {
      merge_delta(next.fields, op.delta, stamp);
      if (cur.deleted) {
        if (concurrent) {
          next.pending_review.insert(cur.deleted_by);
          note_pending_delete(next, cur.deleted_by, cur.deleted_stamp);
          res.op_ids.insert(res.op_ids.begin(), cur.deleted_by);
          strategy = ResolutionStrategy::pending_review;
        }
        next.deleted       = false;
        next.deleted_by.clear();
        next.deleted_stamp = WriteStamp{};
      } else if (concurrent) {
        strategy = ResolutionStrategy::field_merge;
      }
    }

    if (deadline_ms != 0 && clock_() >= deadline_ms) {
      next = cur;
      next.pending_review.insert(op.id);
      if (op.kind == OpKind::remove) note_pending_delete(next, op.id, stamp);
      strategy = ResolutionStrategy::deadline_expired;
    } else {
      next.vv[op.origin] = std::max(vv_get(next.vv, op.origin), op.sequence);
      if (concurrent) ++next.vv[merge_key()];
    }

    st = store_.store_entity(op.entity_id, revision, entity_to_json(next));
    if (!st.ok) {
      if (st.code == ErrorCode::version_mismatch) continue;
      out.code   = st.code;
      out.detail = st.detail;
      if (st.code == ErrorCode::storage_corrupt) halt(st);
      return out;
    }

    out.ok       = true;
    out.revision = revision + 1;
    out.strategy = strategy;
    const bool pending = strategy == ResolutionStrategy::pending_review ||
                         strategy == ResolutionStrategy::deadline_expired;
    if (strategy == ResolutionStrategy::fast_forward) {
      out.state = OpState::applied;
    } else if (pending) {
      out.state  = OpState::conflicted;
      out.code   = ErrorCode::conflict_unresolved;
      out.detail = "escalated to pending review (" + to_string(strategy) + ")";
    } else {
      out.state = OpState::resolved;
    }

    global_stats().ops_replayed.fetch_add(1, std::memory_order_relaxed);
    if (!pending) global_stats().ops_applied.fetch_add(1, std::memory_order_relaxed);
    if (concurrent || pending) global_stats().ops_conflicted.fetch_add(1, std::memory_order_relaxed);
    if (strategy == ResolutionStrategy::field_merge) {
      global_stats().merges.fetch_add(1, std::memory_order_relaxed);
    }
    if (pending) global_stats().pending_reviews.fetch_add(1, std::memory_order_relaxed);

    if (strategy != ResolutionStrategy::fast_forward) {
      res.strategy     = strategy;
      res.resulting_vv = next.vv;
      res.resolved     = !pending;
      res.at_ms        = clock_();
      res.detail       = to_string(op.kind) + " by " + op.origin;
      Status js = journal_.append(res);
      if (!js.ok) {
        out.ok     = false;
        out.code   = ErrorCode::storage_corrupt;
        out.detail = "conflict journal append failed: " + js.detail;
        halt(js);
        return out;
      }
    }
    const auto elapsed_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() -
                                                             started)
            .count());
    emit_sync_event(pending ? "conflict" : "op_applied", op, to_string(strategy), !pending,
                    out.code, elapsed_ns, clock_());
    global_stats().replay_latency.record(elapsed_ns);
    return out;
  }

  out.code   = ErrorCode::version_mismatch;
  out.detail = "entity " + op.entity_id + " kept changing under concurrent writers";
  return out;
}

Status SyncEngine::resolve_pending(const std::string& entity_id, PendingDecision decision,
                                   std::vector<std::string>* settled) {
  if (halted_) return Status::failure(ErrorCode::storage_corrupt, "sync engine halted: " + halt_reason());
  std::lock_guard<std::mutex> lk(stripe(entity_id));

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    std::optional<EntityRecord> rec;
    Status st = store_.load_entity(entity_id, &rec);
    if (!st.ok) {
      if (st.code == ErrorCode::storage_corrupt) return halt(st);
      return st;
    }
    if (!rec) return Status::failure(ErrorCode::invalid_argument, "no entity " + entity_id);
    Entity e;
    st = entity_from_json(rec->body, &e);
    if (!st.ok) return halt(st);
    if (e.pending_review.empty()) {
      return Status::failure(ErrorCode::invalid_argument, "entity " + entity_id + " has no pending review");
    }

    Entity next = e;
    next.pending_review.clear();
    next.pending_delete.clear();
    next.pending_delete_stamp = WriteStamp{};
    if (decision == PendingDecision::remove) {
      next.deleted = true;
      if (!e.pending_delete.empty()) {
        next.deleted_by    = e.pending_delete;
        next.deleted_stamp = e.pending_delete_stamp;
      } else {
        // Only updates were parked; the tombstone belongs to the operator.
        next.deleted_by    = "operator@" + node_id_;
        next.deleted_stamp = WriteStamp{clock_(), node_id_};
      }
    } else {
      next.deleted = false;
      next.deleted_by.clear();
      next.deleted_stamp = WriteStamp{};
    }
    ++next.vv[merge_key()];

    st = store_.store_entity(entity_id, rec->revision, entity_to_json(next));
    if (!st.ok) {
      if (st.code == ErrorCode::version_mismatch) continue;
      if (st.code == ErrorCode::storage_corrupt) return halt(st);
      return st;
    }

    ConflictResolution res;
    res.entity_id    = entity_id;
    res.op_ids.assign(e.pending_review.begin(), e.pending_review.end());
    res.strategy     = ResolutionStrategy::operator_decision;
    res.resulting_vv = next.vv;
    res.resolver     = node_id_;
    res.resolved     = true;
    res.at_ms        = clock_();
    res.detail       = decision == PendingDecision::remove ? "delete" : "keep";
    Status js = journal_.append(res);
    if (!js.ok) return halt(js);

    if (settled) *settled = res.op_ids;
    return Status::success();
  }
  return Status::failure(ErrorCode::version_mismatch,
                         "entity " + entity_id + " kept changing under concurrent writers");
}

}  // namespace tether
