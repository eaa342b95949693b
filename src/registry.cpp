#include "tether/registry.hpp"

#include <algorithm>
#include <sstream>

#include "tether/jsonlite.hpp"
#include "tether/observability.hpp"

namespace tether {

std::string to_string(TransitionCause c) {
  switch (c) {
    case TransitionCause::registered: return "registered";
    case TransitionCause::heartbeat: return "heartbeat";
    case TransitionCause::probe_success: return "probe_success";
    case TransitionCause::probe_miss: return "probe_miss";
    case TransitionCause::hard_disconnect: return "hard_disconnect";
    case TransitionCause::router_failure: return "router_failure";
    case TransitionCause::ttl_expired: return "ttl_expired";
    case TransitionCause::deregistered: return "deregistered";
  }
  return "registered";
}

WorkerRegistry::WorkerRegistry(HealthConfig cfg, Clock clock)
    : cfg_(cfg), clock_(std::move(clock)), channel_(cfg.transition_channel_capacity) {}

std::shared_ptr<WorkerRegistry::NodeSlot> WorkerRegistry::find(const std::string& node_id) const {
  std::shared_lock<std::shared_mutex> lk(map_mu_);
  auto it = nodes_.find(node_id);
  return it == nodes_.end() ? nullptr : it->second;
}

std::optional<NodeTransition> WorkerRegistry::transition_locked(NodeSnapshot& rec, NodeStatus to,
                                                                TransitionCause cause) {
  if (rec.status == to) return std::nullopt;
  NodeTransition t;
  t.node_id = rec.info.id;
  t.from    = rec.status;
  t.to      = to;
  t.cause   = cause;
  t.at_ms   = clock_();
  t.epoch   = ++rec.epoch;
  rec.status = to;
  if (to == NodeStatus::offline) {
    rec.offline_since_ms = t.at_ms;
  } else {
    rec.offline_since_ms = 0;
  }
  return t;
}

void WorkerRegistry::update_health_locked(NodeSnapshot& rec, bool success, uint64_t latency_us) {
  HealthRecord& h = rec.health;
  const double a = cfg_.ewma_alpha;
  const double outcome = success ? 1.0 : 0.0;
  if (h.checks == 0) {
    h.success_rate = outcome;
    if (success) h.latency_us = static_cast<double>(latency_us);
  } else {
    h.success_rate = a * outcome + (1.0 - a) * h.success_rate;
    if (success) h.latency_us = a * static_cast<double>(latency_us) + (1.0 - a) * h.latency_us;
  }
  h.last_check_ms = clock_();
  ++h.checks;
}

void WorkerRegistry::publish(const NodeTransition& t) {
  global_stats().node_transitions.fetch_add(1, std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lk(ring_mu_);
    if (ring_.size() < kRecentTransitions) {
      ring_.push_back(t);
    } else {
      ring_[ring_head_] = t;
    }
    ring_head_ = (ring_head_ + 1) % kRecentTransitions;
  }
  if (!channel_.try_push(t)) dropped_.fetch_add(1, std::memory_order_relaxed);

  CoordinationEvent ev;
  ev.kind      = "node_transition";
  ev.component = "registry";
  ev.subject   = t.node_id;
  ev.detail    = to_string(t.from) + "->" + to_string(t.to) + " (" + to_string(t.cause) + ")";
  ev.at_ms     = t.at_ms;
  if (t.cause == TransitionCause::ttl_expired) ev.code = ErrorCode::node_ttl_expired;
  emit_event(ev);

  std::vector<TransitionListener> listeners;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    listeners = listeners_;
  }
  for (const auto& l : listeners) l(t);
}

Status WorkerRegistry::register_node(const NodeInfo& info) {
  if (info.id.empty()) return Status::failure(ErrorCode::invalid_argument, "node id must not be empty");
  if (info.max_concurrency == 0) {
    return Status::failure(ErrorCode::invalid_argument, "max_concurrency must be >= 1");
  }
  auto slot = std::make_shared<NodeSlot>();
  const uint64_t now = clock_();
  slot->rec.info              = info;
  slot->rec.status            = NodeStatus::online;
  slot->rec.registered_at_ms  = now;
  slot->rec.last_heartbeat_ms = now;
  slot->rec.epoch             = 1;
  slot->rec.health.node_id    = info.id;
  {
    std::unique_lock<std::shared_mutex> lk(map_mu_);
    if (nodes_.contains(info.id)) {
      return Status::failure(ErrorCode::duplicate_node, "node '" + info.id + "' already registered");
    }
    nodes_.emplace(info.id, slot);
  }
  global_stats().nodes_registered.fetch_add(1, std::memory_order_relaxed);

  NodeTransition t;
  t.node_id = info.id;
  t.from    = NodeStatus::offline;
  t.to      = NodeStatus::online;
  t.cause   = TransitionCause::registered;
  t.at_ms   = now;
  t.epoch   = 1;
  publish(t);
  return Status::success();
}

Status WorkerRegistry::deregister_node(const std::string& node_id) {
  std::shared_ptr<NodeSlot> slot;
  {
    std::unique_lock<std::shared_mutex> lk(map_mu_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) return Status::failure(ErrorCode::unknown_node, node_id);
    slot = it->second;
    nodes_.erase(it);
  }
  NodeTransition t;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    t.node_id = node_id;
    t.from    = slot->rec.status;
    t.to      = NodeStatus::offline;
    t.cause   = TransitionCause::deregistered;
    t.at_ms   = clock_();
    t.epoch   = ++slot->rec.epoch;
    t.removed = true;
    slot->rec.status = NodeStatus::offline;
  }
  global_stats().nodes_deregistered.fetch_add(1, std::memory_order_relaxed);
  publish(t);
  return Status::success();
}

Status WorkerRegistry::heartbeat(const std::string& node_id, const NodeMetrics& metrics) {
  auto slot = find(node_id);
  if (!slot) return Status::failure(ErrorCode::unknown_node, node_id);
  std::optional<NodeTransition> t;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    slot->rec.metrics            = metrics;
    slot->rec.last_heartbeat_ms  = clock_();
    slot->rec.consecutive_misses = 0;
    t = transition_locked(slot->rec, NodeStatus::online, TransitionCause::heartbeat);
  }
  if (t) publish(*t);
  return Status::success();
}

Status WorkerRegistry::record_probe(const std::string& node_id, bool success, uint64_t latency_us) {
  auto slot = find(node_id);
  if (!slot) return Status::failure(ErrorCode::unknown_node, node_id);
  std::optional<NodeTransition> t;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    NodeSnapshot& rec = slot->rec;
    update_health_locked(rec, success, latency_us);
    if (success) {
      rec.consecutive_misses = 0;
      t = transition_locked(rec, NodeStatus::online, TransitionCause::probe_success);
    } else {
      ++rec.consecutive_misses;
      if (rec.status == NodeStatus::online &&
          rec.consecutive_misses >= cfg_.miss_threshold_degraded) {
        t = transition_locked(rec, NodeStatus::degraded, TransitionCause::probe_miss);
      } else if (rec.status == NodeStatus::degraded &&
                 rec.consecutive_misses >= cfg_.miss_threshold_offline) {
        t = transition_locked(rec, NodeStatus::offline, TransitionCause::probe_miss);
      }
    }
  }
  if (t) publish(*t);
  return Status::success();
}

Status WorkerRegistry::mark_disconnected(const std::string& node_id) {
  auto slot = find(node_id);
  if (!slot) return Status::failure(ErrorCode::unknown_node, node_id);
  std::optional<NodeTransition> t;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    t = transition_locked(slot->rec, NodeStatus::offline, TransitionCause::hard_disconnect);
  }
  if (t) publish(*t);
  return Status::success();
}

Status WorkerRegistry::mark_degraded(const std::string& node_id) {
  auto slot = find(node_id);
  if (!slot) return Status::failure(ErrorCode::unknown_node, node_id);
  std::optional<NodeTransition> t;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    if (slot->rec.status == NodeStatus::online) {
      t = transition_locked(slot->rec, NodeStatus::degraded, TransitionCause::router_failure);
    }
  }
  if (t) publish(*t);
  return Status::success();
}

std::vector<std::string> WorkerRegistry::expire_ttl() {
  const uint64_t now = clock_();
  std::vector<std::shared_ptr<NodeSlot>> candidates;
  {
    std::shared_lock<std::shared_mutex> lk(map_mu_);
    for (const auto& [id, slot] : nodes_) candidates.push_back(slot);
  }

  std::vector<std::string> expired;
  for (const auto& slot : candidates) {
    std::string id;
    {
      std::lock_guard<std::mutex> lk(slot->mu);
      const NodeSnapshot& rec = slot->rec;
      if (rec.status != NodeStatus::offline) continue;
      if (now < rec.offline_since_ms + cfg_.node_ttl_ms) continue;
      id = rec.info.id;
    }
    expired.push_back(id);
  }
  std::sort(expired.begin(), expired.end());

  std::vector<std::string> removed;
  for (const auto& id : expired) {
    std::shared_ptr<NodeSlot> slot;
    {
      std::unique_lock<std::shared_mutex> lk(map_mu_);
      auto it = nodes_.find(id);
      if (it == nodes_.end()) continue;
      slot = it->second;
      // Re-check under the node lock: a heartbeat may have revived it.
      std::lock_guard<std::mutex> nlk(slot->mu);
      if (slot->rec.status != NodeStatus::offline ||
          now < slot->rec.offline_since_ms + cfg_.node_ttl_ms) {
        continue;
      }
      nodes_.erase(it);
    }
    NodeTransition t;
    t.node_id = id;
    t.from    = NodeStatus::offline;
    t.to      = NodeStatus::offline;
    t.cause   = TransitionCause::ttl_expired;
    t.at_ms   = now;
    t.removed = true;
    {
      std::lock_guard<std::mutex> lk(slot->mu);
      t.epoch = ++slot->rec.epoch;
    }
    global_stats().nodes_deregistered.fetch_add(1, std::memory_order_relaxed);
    log_warning("registry", "node '" + id + "' deregistered after " +
                                std::to_string(cfg_.node_ttl_ms) + "ms offline");
    publish(t);
    removed.push_back(id);
  }
  return removed;
}

bool WorkerRegistry::try_acquire_slot(const std::string& node_id,
                                      const std::set<std::string>& required) {
  auto slot = find(node_id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lk(slot->mu);
  NodeSnapshot& rec = slot->rec;
  if (rec.status != NodeStatus::online) return false;
  if (rec.active >= rec.info.max_concurrency) return false;
  for (const auto& cap : required) {
    if (!rec.info.capabilities.contains(cap)) return false;
  }
  ++rec.active;
  return true;
}

void WorkerRegistry::release_slot(const std::string& node_id) {
  auto slot = find(node_id);
  if (!slot) return;
  std::lock_guard<std::mutex> lk(slot->mu);
  if (slot->rec.active > 0) --slot->rec.active;
}

std::optional<NodeSnapshot> WorkerRegistry::snapshot(const std::string& node_id) const {
  auto slot = find(node_id);
  if (!slot) return std::nullopt;
  std::lock_guard<std::mutex> lk(slot->mu);
  return slot->rec;
}

std::vector<NodeSnapshot> WorkerRegistry::snapshot_all() const {
  std::vector<std::shared_ptr<NodeSlot>> slots;
  {
    std::shared_lock<std::shared_mutex> lk(map_mu_);
    slots.reserve(nodes_.size());
    for (const auto& [id, slot] : nodes_) slots.push_back(slot);
  }
  std::vector<NodeSnapshot> out;
  out.reserve(slots.size());
  for (const auto& slot : slots) {
    std::lock_guard<std::mutex> lk(slot->mu);
    out.push_back(slot->rec);
  }
  std::sort(out.begin(), out.end(),
            [](const NodeSnapshot& a, const NodeSnapshot& b) { return a.info.id < b.info.id; });
  return out;
}

std::optional<NodeStatus> WorkerRegistry::status(const std::string& node_id) const {
  auto slot = find(node_id);
  if (!slot) return std::nullopt;
  std::lock_guard<std::mutex> lk(slot->mu);
  return slot->rec.status;
}

std::optional<HealthRecord> WorkerRegistry::health(const std::string& node_id) const {
  auto slot = find(node_id);
  if (!slot) return std::nullopt;
  std::lock_guard<std::mutex> lk(slot->mu);
  return slot->rec.health;
}

size_t WorkerRegistry::size() const {
  std::shared_lock<std::shared_mutex> lk(map_mu_);
  return nodes_.size();
}

void WorkerRegistry::subscribe(TransitionListener listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.push_back(std::move(listener));
}

std::optional<NodeTransition> WorkerRegistry::poll_transition(std::chrono::milliseconds timeout) {
  return channel_.pop_for(timeout);
}

uint64_t WorkerRegistry::dropped_transitions() const {
  return dropped_.load(std::memory_order_relaxed);
}

std::vector<NodeTransition> WorkerRegistry::recent_transitions() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_.size() < kRecentTransitions) return ring_;
  std::vector<NodeTransition> out;
  out.reserve(ring_.size());
  for (size_t i = 0; i < ring_.size(); ++i) out.push_back(ring_[(ring_head_ + i) % kRecentTransitions]);
  return out;
}

std::string snapshot_to_json(const NodeSnapshot& s) {
  std::ostringstream o;
  o << "{\"id\":\"" << jsonlite::escape(s.info.id) << "\""
    << ",\"role\":\"" << to_string(s.info.role) << "\""
    << ",\"address\":\"" << jsonlite::escape(s.info.address) << "\""
    << ",\"status\":\"" << to_string(s.status) << "\""
    << ",\"active\":" << s.active
    << ",\"max_concurrency\":" << s.info.max_concurrency
    << ",\"load_ratio\":" << jsonlite::format_double(s.load_ratio())
    << ",\"consecutive_misses\":" << s.consecutive_misses
    << ",\"last_heartbeat_ms\":" << s.last_heartbeat_ms
    << ",\"offline_since_ms\":" << s.offline_since_ms
    << ",\"capabilities\":" << jsonlite::to_json(jsonlite::Value{jsonlite::to_array(s.info.capabilities)})
    << ",\"health\":{\"latency_us\":" << jsonlite::format_double(s.health.latency_us)
    << ",\"success_rate\":" << jsonlite::format_double(s.health.success_rate)
    << ",\"checks\":" << s.health.checks << "}"
    << "}";
  return o.str();
}

std::string WorkerRegistry::health_json() const {
  std::string out = "[";
  bool first = true;
  for (const auto& s : snapshot_all()) {
    if (!first) out += ",";
    first = false;
    out += snapshot_to_json(s);
  }
  out += "]";
  return out;
}

}  // namespace tether
