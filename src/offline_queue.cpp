#include "tether/offline_queue.hpp"

#include <algorithm>
#include <chrono>

#include "tether/hash.hpp"
#include "tether/observability.hpp"
#include "tether/version.hpp"

namespace tether {

namespace {

std::string record_sum(jsonlite::Object rec) {
  rec.erase("sum");
  return record_checksum(jsonlite::to_json(jsonlite::Value{rec}));
}

std::string line_error(size_t index, const std::string& what) {
  return "offline log line " + std::to_string(index + 1) + ": " + what;
}

void emit_queue_event(const std::string& kind, const std::string& subject, const std::string& detail,
                      bool ok, ErrorCode code, uint64_t at_ms) {
  CoordinationEvent ev;
  ev.kind      = kind;
  ev.component = "offline_queue";
  ev.subject   = subject;
  ev.detail    = detail;
  ev.ok        = ok;
  ev.code      = code;
  ev.at_ms     = at_ms;
  emit_event(ev);
}

}  // namespace

OfflineQueueManager::OfflineQueueManager(IStateStore& store, OfflineConfig cfg, std::string node_id,
                                         Clock clock)
    : store_(store), cfg_(std::move(cfg)), node_id_(std::move(node_id)), clock_(std::move(clock)) {}

OfflineQueueManager::~OfflineQueueManager() { stop(); }

Status OfflineQueueManager::append_record_locked(jsonlite::Object record) {
  record["sum"] = record_sum(record);
  return store_.append_log(jsonlite::to_json(jsonlite::Value{record}));
}

Status OfflineQueueManager::append_state_locked(const std::string& op_id, OpState state,
                                                ErrorCode error) {
  jsonlite::Object rec;
  rec["type"]  = "state";
  rec["id"]    = op_id;
  rec["state"] = to_string(state);
  rec["at"]    = clock_();
  rec["error"] = to_string(error);
  return append_record_locked(std::move(rec));
}

size_t OfflineQueueManager::unapplied_locked() const {
  size_t n = 0;
  for (const auto& [id, op] : ops_) {
    if (op.state == OpState::captured || op.state == OpState::queued ||
        op.state == OpState::replaying) {
      ++n;
    }
  }
  return n;
}

Status OfflineQueueManager::recover() {
  std::lock_guard<std::mutex> lk(mu_);
  if (recovered_) return Status::success();

  std::vector<std::string> lines;
  Status st = store_.read_log(&lines);
  if (!st.ok) return st;

  if (lines.empty()) {
    jsonlite::Object header;
    header["type"]    = "header";
    header["version"] = version::OFFLINE_LOG_VERSION;
    st = store_.append_log(jsonlite::to_json(jsonlite::Value{header}));
    if (!st.ok) return st;
    recovered_ = true;
    return Status::success();
  }

  std::vector<std::string> order;
  std::map<std::string, OfflineOperation> ops;
  std::map<std::string, uint64_t> seqs;
  uint64_t lamport = 0;

  for (size_t i = 0; i < lines.size(); ++i) {
    std::optional<jsonlite::JsonError> err;
    auto rec = jsonlite::parse(lines[i], &err);
    if (err) return Status::failure(ErrorCode::storage_corrupt, line_error(i, err->message));
    const std::string type = jsonlite::get_string(rec, "type");

    if (i == 0) {
      if (type != "header") {
        return Status::failure(ErrorCode::storage_corrupt, line_error(i, "missing header"));
      }
      auto compat = version::check_format(
          "offline_log", static_cast<uint32_t>(jsonlite::get_u64(rec, "version")),
          version::OFFLINE_LOG_VERSION);
      if (!compat.ok) return Status::failure(ErrorCode::storage_corrupt, compat.description);
      seqs    = jsonlite::get_u64_map(rec, "seqs");
      lamport = jsonlite::get_u64(rec, "lamport");
      continue;
    }

    if (jsonlite::get_string(rec, "sum") != record_sum(rec)) {
      return Status::failure(ErrorCode::storage_corrupt, line_error(i, "checksum mismatch"));
    }
    if (type == "op") {
      OfflineOperation op;
      st = op_from_object(jsonlite::get_object(rec, "op"), &op);
      if (!st.ok) return Status::failure(ErrorCode::storage_corrupt, line_error(i, st.detail));
      if (ops.count(op.id)) {
        return Status::failure(ErrorCode::storage_corrupt, line_error(i, "duplicate op " + op.id));
      }
      seqs[op.origin] = std::max(seqs[op.origin], op.sequence);
      lamport         = std::max(lamport, op.logical_ts);
      order.push_back(op.id);
      ops.emplace(op.id, std::move(op));
    } else if (type == "state") {
      auto it = ops.find(jsonlite::get_string(rec, "id"));
      if (it == ops.end()) {
        return Status::failure(ErrorCode::storage_corrupt, line_error(i, "state for unknown op"));
      }
      auto s = op_state_from_string(jsonlite::get_string(rec, "state"));
      if (!s) return Status::failure(ErrorCode::storage_corrupt, line_error(i, "unknown state"));
      it->second.state = *s;
    } else {
      return Status::failure(ErrorCode::storage_corrupt, line_error(i, "unknown record type '" + type + "'"));
    }
  }

  size_t requeued = 0;
  for (auto& [id, op] : ops) {
    if (op.state == OpState::replaying || op.state == OpState::captured) {
      op.state = OpState::queued;
      ++requeued;
    }
  }

  order_     = std::move(order);
  ops_       = std::move(ops);
  next_seq_  = std::move(seqs);
  lamport_   = lamport;
  recovered_ = true;
  if (requeued > 0) {
    emit_queue_event("queue_recovered", node_id_,
                     std::to_string(requeued) + " interrupted entries requeued", true,
                     ErrorCode::none, clock_());
  }
  return Status::success();
}

EnqueueResult OfflineQueueManager::enqueue(OfflineOperation op) {
  EnqueueResult r;
  std::lock_guard<std::mutex> lk(mu_);
  if (!recovered_) {
    r.code   = ErrorCode::not_ready;
    r.detail = "offline log not recovered";
    return r;
  }
  if (op.entity_id.empty()) {
    r.code   = ErrorCode::invalid_argument;
    r.detail = "operation without entity id";
    return r;
  }
  const size_t unapplied = unapplied_locked();
  if (unapplied >= cfg_.max_queue_size) {
    r.code   = ErrorCode::queue_full;
    r.detail = "offline queue holds " + std::to_string(unapplied) + " unapplied entries";
    emit_queue_event("enqueue", op.entity_id, r.detail, false, r.code, clock_());
    return r;
  }

  if (op.origin.empty()) op.origin = node_id_;
  const uint64_t prev_seq = next_seq_[op.origin];
  const uint64_t prev_ts  = lamport_;
  op.sequence = prev_seq + 1;
  if (prev_seq > 0) {
    op.captured_vv[op.origin] = std::max(vv_get(op.captured_vv, op.origin), prev_seq);
  }
  lamport_          = std::max(lamport_, op.logical_ts) + 1;
  op.logical_ts     = lamport_;
  op.id             = op.origin + ":" + std::to_string(op.sequence);
  op.captured_at_ms = clock_();
  op.state          = OpState::queued;

  jsonlite::Object rec;
  rec["type"] = "op";
  rec["op"]   = op_to_object(op);
  Status st = append_record_locked(std::move(rec));
  if (!st.ok) {
    lamport_   = prev_ts;
    r.code     = st.code;
    r.detail   = st.detail;
    last_error_        = st.code;
    last_error_detail_ = st.detail;
    return r;
  }

  next_seq_[op.origin] = op.sequence;
  r.ok       = true;
  r.op_id    = op.id;
  r.sequence = op.sequence;
  order_.push_back(op.id);
  ops_.emplace(op.id, std::move(op));
  global_stats().ops_enqueued.fetch_add(1, std::memory_order_relaxed);
  return r;
}

DrainReport OfflineQueueManager::drain_once(const ReplaySink& sink) {
  DrainReport report;
  std::unique_lock<std::mutex> drain_lk(drain_mu_, std::try_to_lock);
  if (!drain_lk.owns_lock()) {
    report.ok     = false;
    report.code   = ErrorCode::not_ready;
    report.detail = "drain already in progress";
    return report;
  }

  std::map<std::string, std::vector<std::pair<uint64_t, std::string>>> by_origin;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!recovered_ || halted_) {
      report.ok     = false;
      report.code   = recovered_ ? ErrorCode::storage_corrupt : ErrorCode::not_ready;
      report.detail = recovered_ ? "drain halted: " + last_error_detail_ : "offline log not recovered";
      return report;
    }
    for (const auto& id : order_) {
      const auto& op = ops_.at(id);
      if (op.state == OpState::queued) by_origin[op.origin].emplace_back(op.sequence, id);
    }
  }
  draining_ = true;

  auto fail = [&](const Status& st) {
    halted_            = true;
    last_error_        = st.code;
    last_error_detail_ = st.detail;
    report.ok          = false;
    report.code        = st.code;
    report.detail      = st.detail;
  };

  bool stop_all = false;
  for (auto& [origin, entries] : by_origin) {
    if (stop_all) break;
    std::sort(entries.begin(), entries.end());
    for (const auto& [seq, id] : entries) {
      OfflineOperation op;
      {
        std::lock_guard<std::mutex> lk(mu_);
        Status st = append_state_locked(id, OpState::replaying, ErrorCode::none);
        if (!st.ok) {
          fail(st);
          stop_all = true;
          break;
        }
        ops_[id].state = OpState::replaying;
        op = ops_[id];
      }

      ++report.attempted;
      ApplyResult r = sink(op);

      std::lock_guard<std::mutex> lk(mu_);
      if (r.ok) {
        Status st = append_state_locked(id, r.state, r.code);
        ops_[id].state = r.state;
        if (!st.ok) {
          fail(st);
          stop_all = true;
          break;
        }
        if (r.state == OpState::conflicted) {
          ++report.conflicted;
        } else {
          ++report.applied;
          if (op.follow_up) report.follow_ups.emplace_back(id, *op.follow_up);
        }
        continue;
      }

      ops_[id].state     = OpState::queued;
      last_error_        = r.code;
      last_error_detail_ = r.detail;
      Status st = append_state_locked(id, OpState::queued, r.code);
      if (r.code == ErrorCode::storage_corrupt || !st.ok) {
        fail(r.code == ErrorCode::storage_corrupt ? Status::failure(r.code, r.detail) : st);
        stop_all = true;
        break;
      }
      // Transient: later entries of this origin wait for the next trigger.
      report.stalled_origins.push_back(origin);
      if (report.code == ErrorCode::none) {
        report.code   = r.code;
        report.detail = origin + ": " + r.detail;
      }
      break;
    }
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    last_drain_ms_ = clock_();
    if (report.ok && report.stalled_origins.empty()) {
      last_error_ = ErrorCode::none;
      last_error_detail_.clear();
    }
  }
  draining_ = false;

  emit_queue_event("drain", node_id_,
                   std::to_string(report.applied) + " applied, " +
                       std::to_string(report.conflicted) + " conflicted, " +
                       std::to_string(report.stalled_origins.size()) + " origins stalled",
                   report.ok && report.stalled_origins.empty(), report.code, clock_());
  if (!report.ok) {
    log_warning("offline_queue", "drain halted: " + report.detail);
  }
  return report;
}

void OfflineQueueManager::on_node_transition(const NodeTransition& t) {
  if (t.node_id != cfg_.authoritative_node) return;
  if (t.from == NodeStatus::offline && t.to == NodeStatus::online) request_drain();
}

void OfflineQueueManager::request_drain() {
  {
    std::lock_guard<std::mutex> lk(loop_mu_);
    drain_requested_ = true;
  }
  loop_cv_.notify_all();
}

void OfflineQueueManager::operator_reset() {
  bool was_halted = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    was_halted = halted_;
    halted_    = false;
    last_error_ = ErrorCode::none;
    last_error_detail_.clear();
  }
  if (was_halted) emit_queue_event("queue_reset", node_id_, "drain halt cleared", true, ErrorCode::none, clock_());
  request_drain();
}

bool OfflineQueueManager::take_drain_request() {
  std::lock_guard<std::mutex> lk(loop_mu_);
  const bool requested = drain_requested_;
  drain_requested_ = false;
  return requested;
}

Status OfflineQueueManager::mark_resolved(const std::vector<std::string>& op_ids) {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& id : op_ids) {
    auto it = ops_.find(id);
    if (it == ops_.end() || it->second.state != OpState::conflicted) continue;
    Status st = append_state_locked(id, OpState::resolved, ErrorCode::none);
    if (!st.ok) return st;
    it->second.state = OpState::resolved;
  }
  return Status::success();
}

CompactReport OfflineQueueManager::compact() {
  CompactReport report;
  std::lock_guard<std::mutex> drain_lk(drain_mu_);
  std::lock_guard<std::mutex> lk(mu_);
  if (!recovered_) {
    report.code   = ErrorCode::not_ready;
    report.detail = "offline log not recovered";
    return report;
  }

  const uint64_t now = clock_();
  std::vector<std::string> keep;
  for (const auto& id : order_) {
    const auto& op = ops_.at(id);
    const bool expired = is_terminal(op.state) && now >= op.captured_at_ms &&
                         now - op.captured_at_ms >= cfg_.retention_ms;
    if (expired) {
      ++report.removed;
    } else {
      keep.push_back(id);
    }
  }
  if (report.removed == 0) {
    report.ok   = true;
    report.kept = keep.size();
    return report;
  }

  jsonlite::Object header;
  header["type"]    = "header";
  header["version"] = version::OFFLINE_LOG_VERSION;
  header["seqs"]    = jsonlite::to_object(next_seq_);
  header["lamport"] = lamport_;
  std::vector<std::string> lines;
  lines.push_back(jsonlite::to_json(jsonlite::Value{header}));
  for (const auto& id : keep) {
    jsonlite::Object rec;
    rec["type"] = "op";
    rec["op"]   = op_to_object(ops_.at(id));
    rec["sum"]  = record_sum(rec);
    lines.push_back(jsonlite::to_json(jsonlite::Value{rec}));
  }
  Status st = store_.rewrite_log(lines);
  if (!st.ok) {
    report.code   = st.code;
    report.detail = st.detail;
    return report;
  }

  std::map<std::string, OfflineOperation> kept_ops;
  for (const auto& id : keep) kept_ops.emplace(id, std::move(ops_.at(id)));
  ops_   = std::move(kept_ops);
  order_ = std::move(keep);
  report.ok   = true;
  report.kept = order_.size();
  emit_queue_event("compact", node_id_, std::to_string(report.removed) + " entries past retention",
                   true, ErrorCode::none, now);
  return report;
}

DrainStatus OfflineQueueManager::drain_status() const {
  DrainStatus s;
  {
    std::lock_guard<std::mutex> lk(mu_);
    s.recovered = recovered_;
    s.halted    = halted_;
    for (const auto& [id, op] : ops_) ++s.counts[op.state];
    s.unapplied         = unapplied_locked();
    s.last_drain_ms     = last_drain_ms_;
    s.last_error        = last_error_;
    s.last_error_detail = last_error_detail_;
  }
  s.draining = draining_.load();
  {
    std::lock_guard<std::mutex> lk(loop_mu_);
    s.drain_requested = drain_requested_;
  }
  return s;
}

std::vector<OfflineOperation> OfflineQueueManager::operations() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<OfflineOperation> out;
  out.reserve(order_.size());
  for (const auto& id : order_) out.push_back(ops_.at(id));
  return out;
}

std::optional<OfflineOperation> OfflineQueueManager::operation(const std::string& op_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = ops_.find(op_id);
  if (it == ops_.end()) return std::nullopt;
  return it->second;
}

// ---------------------------------------------------------------------------
// Background drain
// ---------------------------------------------------------------------------

void OfflineQueueManager::start(ReplaySink sink, std::function<void(const DrainReport&)> on_drained) {
  std::lock_guard<std::mutex> lk(loop_mu_);
  if (worker_.joinable()) return;
  sink_       = std::move(sink);
  on_drained_ = std::move(on_drained);
  stopping_   = false;
  worker_     = std::thread([this] { drain_loop(); });
}

void OfflineQueueManager::stop() {
  {
    std::lock_guard<std::mutex> lk(loop_mu_);
    stopping_ = true;
  }
  loop_cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void OfflineQueueManager::drain_loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lk(loop_mu_);
      loop_cv_.wait_for(lk, std::chrono::milliseconds(cfg_.replay_timeout_ms),
                        [this] { return stopping_ || drain_requested_; });
      if (stopping_) return;
      if (!drain_requested_) continue;
      drain_requested_ = false;
    }
    DrainReport report = drain_once(sink_);
    if (on_drained_) on_drained_(report);
  }
}

std::string drain_status_to_json(const DrainStatus& s) {
  jsonlite::Object counts;
  for (OpState st : {OpState::captured, OpState::queued, OpState::replaying, OpState::applied,
                     OpState::conflicted, OpState::resolved}) {
    auto it = s.counts.find(st);
    counts[to_string(st)] = it == s.counts.end() ? size_t{0} : it->second;
  }
  jsonlite::Object o;
  o["recovered"]       = s.recovered;
  o["draining"]        = s.draining;
  o["halted"]          = s.halted;
  o["drain_requested"] = s.drain_requested;
  o["counts"]          = std::move(counts);
  o["unapplied"]       = s.unapplied;
  o["last_drain_ms"]   = s.last_drain_ms;
  o["last_error"]      = to_string(s.last_error);
  o["last_error_detail"] = s.last_error_detail;
  return jsonlite::to_json(jsonlite::Value{o});
}

}  // namespace tether
