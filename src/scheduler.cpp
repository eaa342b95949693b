#include "tether/scheduler.hpp"

#include <algorithm>
#include <sstream>

#include "tether/hash.hpp"
#include "tether/jsonlite.hpp"
#include "tether/observability.hpp"

namespace tether {

uint64_t backoff_delay_ms(uint32_t retry_count, uint64_t base_ms, uint64_t cap_ms) {
  if (retry_count == 0) return 0;
  uint64_t delay = base_ms;
  for (uint32_t i = 1; i < retry_count; ++i) {
    if (delay >= cap_ms) break;
    delay *= 2;
  }
  return std::min(delay, cap_ms);
}

TaskDistributor::TaskDistributor(WorkerRegistry& registry, ITransport& transport,
                                 SchedulerConfig cfg, std::string self_id, Clock clock)
    : registry_(registry),
      transport_(transport),
      cfg_(cfg),
      self_id_(std::move(self_id)),
      clock_(std::move(clock)) {}

TaskDistributor::~TaskDistributor() { stop(); }

TaskDistributor::TaskRecord* TaskDistributor::find_locked(const std::string& task_id) {
  auto it = tasks_.find(task_id);
  return it == tasks_.end() ? nullptr : &it->second;
}

int32_t TaskDistributor::effective_priority_locked(const TaskRecord& t, uint64_t now) const {
  if (cfg_.max_wait_ms == 0 || now <= t.snap.created_ms) return t.snap.priority;
  const uint64_t intervals = (now - t.snap.created_ms) / cfg_.max_wait_ms;
  return t.snap.priority + static_cast<int32_t>(intervals) * cfg_.escalation_step;
}

void TaskDistributor::emit_task_event(const std::string& kind, const TaskSnapshot& t, bool ok) const {
  CoordinationEvent ev;
  ev.kind      = kind;
  ev.component = "distributor";
  ev.subject   = t.id;
  ev.detail    = to_string(t.status) + (t.assigned_node.empty() ? "" : " on " + t.assigned_node);
  ev.ok        = ok;
  ev.code      = ok ? ErrorCode::none : t.last_error;
  ev.at_ms     = clock_();
  emit_event(ev);
}

bool TaskDistributor::any_eligible_node(const std::set<std::string>& required) const {
  for (const auto& n : registry_.snapshot_all()) {
    if (n.info.id == self_id_ || n.status != NodeStatus::online) continue;
    if (n.active >= n.info.max_concurrency) continue;
    if (std::includes(n.info.capabilities.begin(), n.info.capabilities.end(), required.begin(),
                      required.end())) {
      return true;
    }
  }
  return false;
}

SubmitResult TaskDistributor::submit(const TaskSpec& spec) {
  SubmitResult r;
  const uint64_t now = clock_();
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!spec.idempotency_key.empty()) {
      auto it = by_key_.find(spec.idempotency_key);
      if (it != by_key_.end()) {
        global_stats().tasks_deduplicated.fetch_add(1, std::memory_order_relaxed);
        r.ok           = true;
        r.task_id      = it->second;
        r.deduplicated = true;
        return r;
      }
    }
    if (queue_.size() >= cfg_.max_queued_tasks) {
      r.code   = ErrorCode::queue_full;
      r.detail = "task queue holds " + std::to_string(queue_.size()) + " entries";
      return r;
    }
    if (spec.deadline_ms != 0 && spec.deadline_ms <= now) {
      r.code   = ErrorCode::deadline_exceeded;
      r.detail = "deadline already passed";
      return r;
    }

    // Keyed and unkeyed ids are drawn from disjoint digest inputs.
    const uint64_t seq = ++next_seq_;
    const std::string id_source = spec.idempotency_key.empty()
                                      ? "seq:" + self_id_ + "#" + std::to_string(seq)
                                      : "key:" + spec.idempotency_key;
    const std::string id = "t-" + idempotency_digest(id_source).substr(0, 16);
    if (tasks_.count(id) != 0) {
      r.code   = ErrorCode::invalid_argument;
      r.detail = "task id " + id + " already in use";
      return r;
    }
    TaskRecord rec;
    rec.seq                        = seq;
    rec.snap.id                    = id;
    rec.snap.idempotency_key       = spec.idempotency_key;
    rec.snap.kind                  = spec.kind;
    rec.snap.payload               = spec.payload;
    rec.snap.required_capabilities = spec.required_capabilities;
    rec.snap.priority              = spec.priority;
    rec.snap.effective_priority    = spec.priority;
    rec.snap.created_ms            = now;
    rec.snap.next_eligible_ms      = now;
    rec.snap.deadline_ms           = spec.deadline_ms;
    rec.snap.status                = TaskStatus::queued;

    r.task_id = rec.snap.id;
    if (!spec.idempotency_key.empty()) by_key_[spec.idempotency_key] = rec.snap.id;
    queue_[seq] = rec.snap.id;
    tasks_.emplace(rec.snap.id, std::move(rec));
  }
  global_stats().tasks_submitted.fetch_add(1, std::memory_order_relaxed);
  r.ok = true;
  if (!any_eligible_node(spec.required_capabilities)) {
    r.code = ErrorCode::capacity_exhausted;
    r.detail = "no eligible node has free capacity; task stays queued";
    global_stats().backpressure_signals.fetch_add(1, std::memory_order_relaxed);
  }
  wake();
  return r;
}

std::optional<TaskSnapshot> TaskDistributor::task(const std::string& task_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return std::nullopt;
  TaskSnapshot s = it->second.snap;
  if (s.status == TaskStatus::queued) s.effective_priority = effective_priority_locked(it->second, clock_());
  return s;
}

std::optional<TaskStatus> TaskDistributor::status(const std::string& task_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return std::nullopt;
  return it->second.snap.status;
}

void TaskDistributor::release_locked(TaskRecord& t) {
  if (t.slot_held) {
    registry_.release_slot(t.snap.assigned_node);
    t.slot_held = false;
  }
}

void TaskDistributor::dead_letter_locked(TaskRecord& t, ErrorCode code) {
  queue_.erase(t.seq);
  t.snap.status     = TaskStatus::dead_lettered;
  t.snap.last_error = code;
  dead_letter_ids_.push_back(t.snap.id);
  global_stats().tasks_dead_lettered.fetch_add(1, std::memory_order_relaxed);
  emit_task_event("task_dead_letter", t.snap, false);
}

void TaskDistributor::retry_or_dead_letter_locked(TaskRecord& t, ErrorCode code, uint64_t now) {
  release_locked(t);
  t.snap.last_error = code;
  if (t.snap.retry_count >= cfg_.max_retries) {
    dead_letter_locked(t, code);
    return;
  }
  ++t.snap.retry_count;
  t.snap.status           = TaskStatus::queued;
  t.snap.assigned_node.clear();
  t.snap.next_eligible_ms = now + backoff_delay_ms(t.snap.retry_count, cfg_.backoff_base_ms,
                                                   cfg_.backoff_cap_ms);
  queue_[t.seq] = t.snap.id;
  global_stats().task_retries.fetch_add(1, std::memory_order_relaxed);
  emit_task_event("task_retry", t.snap, false);
}

std::vector<Assignment> TaskDistributor::assign_once() {
  std::vector<Assignment> out;
  std::lock_guard<std::mutex> lk(mu_);
  const uint64_t now = clock_();

  struct Ready {
    TaskRecord* task;
    int32_t     priority;
  };
  std::vector<Ready> ready;
  std::vector<TaskRecord*> expired;
  for (const auto& [seq, id] : queue_) {
    TaskRecord* t = find_locked(id);
    if (!t) continue;
    if (t->snap.deadline_ms != 0 && now >= t->snap.deadline_ms) {
      expired.push_back(t);
      continue;
    }
    if (t->snap.next_eligible_ms > now) continue;
    ready.push_back(Ready{t, effective_priority_locked(*t, now)});
  }
  for (TaskRecord* t : expired) {
    if (t->snap.status == TaskStatus::queued) dead_letter_locked(*t, ErrorCode::deadline_exceeded);
  }
  if (ready.empty()) return out;

  // queue_ iterates in submission order, so a stable sort keeps FIFO ties.
  std::stable_sort(ready.begin(), ready.end(),
                   [](const Ready& a, const Ready& b) { return a.priority > b.priority; });

  std::vector<NodeSnapshot> nodes = registry_.snapshot_all();
  for (const Ready& r : ready) {
    TaskRecord& t = *r.task;
    if (t.snap.status != TaskStatus::queued) continue;
    std::vector<NodeSnapshot*> eligible;
    for (auto& n : nodes) {
      if (n.info.id == self_id_) continue;
      if (n.status != NodeStatus::online || n.active >= n.info.max_concurrency) continue;
      const auto& need = t.snap.required_capabilities;
      if (!std::includes(n.info.capabilities.begin(), n.info.capabilities.end(), need.begin(),
                         need.end())) {
        continue;
      }
      eligible.push_back(&n);
    }
    std::sort(eligible.begin(), eligible.end(), [](const NodeSnapshot* a, const NodeSnapshot* b) {
      if (a->load_ratio() != b->load_ratio()) return a->load_ratio() < b->load_ratio();
      if (a->active != b->active) return a->active < b->active;
      return a->info.id < b->info.id;
    });

    for (NodeSnapshot* n : eligible) {
      if (!registry_.try_acquire_slot(n->info.id, t.snap.required_capabilities)) {
        // Stale snapshot: the node filled up or changed status since.
        n->active = n->info.max_concurrency;
        continue;
      }
      ++n->active;
      queue_.erase(t.seq);
      t.slot_held               = true;
      t.snap.status             = TaskStatus::assigned;
      t.snap.assigned_node      = n->info.id;
      t.snap.effective_priority = r.priority;
      ++t.snap.attempt;
      out.push_back(Assignment{t.snap.id, n->info.id, t.snap.attempt});
      break;
    }
  }
  return out;
}

void TaskDistributor::revert_assignment(const Assignment& a) {
  std::lock_guard<std::mutex> lk(mu_);
  TaskRecord* t = find_locked(a.task_id);
  if (!t || t->snap.attempt != a.attempt || t->snap.status != TaskStatus::assigned) return;
  release_locked(*t);
  t->snap.status = TaskStatus::queued;
  t->snap.assigned_node.clear();
  queue_[t->seq] = t->snap.id;
}

void TaskDistributor::execute(const Assignment& a) {
  Message msg;
  uint64_t timeout_ms = cfg_.dispatch_timeout_ms;
  {
    std::lock_guard<std::mutex> lk(mu_);
    TaskRecord* t = find_locked(a.task_id);
    if (!t || t->snap.attempt != a.attempt || t->snap.status != TaskStatus::assigned) return;
    const uint64_t now = clock_();
    if (t->snap.deadline_ms != 0) {
      if (now >= t->snap.deadline_ms) {
        release_locked(*t);
        dead_letter_locked(*t, ErrorCode::deadline_exceeded);
        return;
      }
      timeout_ms = std::min(timeout_ms, t->snap.deadline_ms - now);
    }
    t->snap.status = TaskStatus::running;

    jsonlite::Object body;
    body["task_id"] = t->snap.id;
    body["kind"]    = t->snap.kind;
    body["payload"] = t->snap.payload;
    body["attempt"] = t->snap.attempt;
    msg.kind           = "dispatch";
    msg.from           = self_id_;
    msg.to             = a.node_id;
    msg.correlation_id = t->snap.id;
    msg.body           = jsonlite::to_json(jsonlite::Value{body});
  }

  global_stats().tasks_dispatched.fetch_add(1, std::memory_order_relaxed);
  SendResult r = transport_.send(a.node_id, msg, std::chrono::milliseconds(timeout_ms));
  global_stats().dispatch_latency.record(r.latency_us * 1000u);

  std::string reply_status = "retry";
  std::string result;
  if (r.delivered) {
    std::optional<jsonlite::JsonError> err;
    auto reply = r.reply.empty() ? jsonlite::Object{} : jsonlite::parse(r.reply, &err);
    if (!err) {
      reply_status = jsonlite::get_string(reply, "status", "ok");
      result       = jsonlite::get_string(reply, "result");
    }
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    TaskRecord* t = find_locked(a.task_id);
    // Cancelled, requeued after node loss, or finished by another path.
    if (!t || t->snap.attempt != a.attempt || t->snap.status != TaskStatus::running) return;
    const uint64_t now = clock_();
    if (reply_status == "ok") {
      release_locked(*t);
      t->snap.status     = TaskStatus::succeeded;
      t->snap.result     = result;
      t->snap.last_error = ErrorCode::none;
      global_stats().tasks_succeeded.fetch_add(1, std::memory_order_relaxed);
      emit_task_event("task_complete", t->snap, true);
    } else if (reply_status == "permanent_failure") {
      release_locked(*t);
      t->snap.status     = TaskStatus::failed;
      t->snap.result     = result;
      t->snap.last_error = ErrorCode::permanent_task_failure;
      global_stats().tasks_failed.fetch_add(1, std::memory_order_relaxed);
      emit_task_event("task_complete", t->snap, false);
    } else {
      retry_or_dead_letter_locked(*t, r.delivered ? ErrorCode::transient_network : r.code, now);
    }
  }
  wake();
}

size_t TaskDistributor::pump() {
  auto assignments = assign_once();
  for (const auto& a : assignments) execute(a);
  return assignments.size();
}

Status TaskDistributor::cancel(const std::string& task_id) {
  std::string node;
  uint32_t attempt = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    TaskRecord* t = find_locked(task_id);
    if (!t) return Status::failure(ErrorCode::unknown_task, task_id);
    if (is_terminal(t->snap.status)) {
      return Status::failure(ErrorCode::invalid_argument,
                             "task " + task_id + " already " + to_string(t->snap.status));
    }
    if (t->snap.status == TaskStatus::assigned || t->snap.status == TaskStatus::running) {
      node    = t->snap.assigned_node;
      attempt = t->snap.attempt;
      release_locked(*t);
    }
    queue_.erase(t->seq);
    t->snap.status     = TaskStatus::cancelled;
    t->snap.last_error = ErrorCode::cancelled;
    // Invalidate any completion still in flight.
    ++t->snap.attempt;
    global_stats().tasks_cancelled.fetch_add(1, std::memory_order_relaxed);
    emit_task_event("task_cancel", t->snap, true);
  }
  if (!node.empty()) {
    Message abort;
    abort.kind           = "abort";
    abort.from           = self_id_;
    abort.to             = node;
    abort.correlation_id = task_id;
    abort.body           = "{\"task_id\":\"" + jsonlite::escape(task_id) +
                           "\",\"attempt\":" + std::to_string(attempt) + "}";
    SendResult r = transport_.send(node, abort, std::chrono::milliseconds(cfg_.dispatch_timeout_ms));
    if (!r.delivered) {
      log_warning("distributor", "abort for " + task_id + " not delivered to " + node);
    }
  }
  wake();
  return Status::success();
}

void TaskDistributor::on_node_transition(const NodeTransition& t) {
  if (t.to == NodeStatus::online) {
    wake();
    return;
  }
  if (t.to != NodeStatus::offline) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const uint64_t now = clock_();
    for (auto& [id, task] : tasks_) {
      if (task.snap.assigned_node != t.node_id) continue;
      if (task.snap.status != TaskStatus::assigned && task.snap.status != TaskStatus::running) continue;
      ++task.snap.attempt;
      retry_or_dead_letter_locked(task, ErrorCode::transient_network, now);
    }
  }
  wake();
}

std::vector<TaskSnapshot> TaskDistributor::dead_letters() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<TaskSnapshot> out;
  for (const auto& id : dead_letter_ids_) {
    auto it = tasks_.find(id);
    if (it != tasks_.end()) out.push_back(it->second.snap);
  }
  return out;
}

std::map<TaskStatus, size_t> TaskDistributor::counts() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::map<TaskStatus, size_t> out;
  for (const auto& [id, t] : tasks_) ++out[t.snap.status];
  return out;
}

size_t TaskDistributor::queued_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

std::string TaskDistributor::to_json() const {
  auto c = counts();
  std::ostringstream o;
  o << "{";
  bool first = true;
  for (TaskStatus s : {TaskStatus::queued, TaskStatus::assigned, TaskStatus::running,
                       TaskStatus::succeeded, TaskStatus::failed, TaskStatus::dead_lettered,
                       TaskStatus::cancelled}) {
    if (!first) o << ",";
    first = false;
    o << "\"" << to_string(s) << "\":" << (c.contains(s) ? c[s] : 0);
  }
  o << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// Background loops
// ---------------------------------------------------------------------------

void TaskDistributor::wake() {
  {
    std::lock_guard<std::mutex> lk(loop_mu_);
    wake_ = true;
  }
  loop_cv_.notify_all();
}

void TaskDistributor::start() {
  std::lock_guard<std::mutex> lk(loop_mu_);
  if (assign_thread_.joinable()) return;
  stopping_   = false;
  dispatch_q_ = std::make_unique<BoundedQueue<Assignment>>(cfg_.dispatch_queue_capacity);
  for (uint32_t i = 0; i < cfg_.dispatch_workers; ++i) {
    dispatch_threads_.emplace_back([this] { dispatch_loop(); });
  }
  assign_thread_ = std::thread([this] { assign_loop(); });
}

void TaskDistributor::stop() {
  {
    std::lock_guard<std::mutex> lk(loop_mu_);
    stopping_ = true;
  }
  loop_cv_.notify_all();
  if (assign_thread_.joinable()) assign_thread_.join();
  if (dispatch_q_) dispatch_q_->close();
  for (auto& th : dispatch_threads_) {
    if (th.joinable()) th.join();
  }
  dispatch_threads_.clear();
  if (dispatch_q_) {
    // Assignments accepted but never dispatched go back to the queue.
    while (auto a = dispatch_q_->try_pop()) revert_assignment(*a);
    dispatch_q_.reset();
  }
}

void TaskDistributor::assign_loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lk(loop_mu_);
      loop_cv_.wait_for(lk, std::chrono::milliseconds(cfg_.assign_interval_ms),
                        [this] { return stopping_.load() || wake_; });
      if (stopping_) return;
      wake_ = false;
    }
    for (const auto& a : assign_once()) {
      if (!dispatch_q_->try_push(a)) {
        // Dispatch workers are saturated; keep the task queued.
        revert_assignment(a);
      }
    }
  }
}

void TaskDistributor::dispatch_loop() {
  while (true) {
    auto a = dispatch_q_->pop_for(std::chrono::milliseconds(100));
    if (!a) {
      if (dispatch_q_->closed()) return;
      continue;
    }
    execute(*a);
  }
}

}  // namespace tether
