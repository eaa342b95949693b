#include "tether/router.hpp"

#include <algorithm>
#include <sstream>

#include "tether/jsonlite.hpp"
#include "tether/observability.hpp"

namespace tether {

std::string to_string(BreakerState s) {
  switch (s) {
    case BreakerState::closed: return "closed";
    case BreakerState::open: return "open";
    case BreakerState::half_open: return "half_open";
  }
  return "closed";
}

// ---------------------------------------------------------------------------
// CircuitBreaker
// ---------------------------------------------------------------------------

CircuitBreaker::CircuitBreaker(uint32_t failure_threshold, uint64_t cooldown_ms)
    : threshold_(failure_threshold == 0 ? 1 : failure_threshold), cooldown_ms_(cooldown_ms) {}

BreakerState CircuitBreaker::state(uint64_t now_ms) const {
  if (!open_) return BreakerState::closed;
  if (now_ms >= opened_at_ms_ + cooldown_ms_) return BreakerState::half_open;
  return BreakerState::open;
}

bool CircuitBreaker::allow(uint64_t now_ms) {
  switch (state(now_ms)) {
    case BreakerState::closed:
      return true;
    case BreakerState::open:
      return false;
    case BreakerState::half_open:
      if (trial_in_flight_) return false;
      trial_in_flight_ = true;
      return true;
  }
  return false;
}

void CircuitBreaker::record_success() {
  failures_        = 0;
  open_            = false;
  trial_in_flight_ = false;
}

bool CircuitBreaker::record_failure(uint64_t now_ms) {
  const bool was_trial = trial_in_flight_;
  trial_in_flight_ = false;
  ++failures_;
  if (was_trial || (!open_ && failures_ >= threshold_)) {
    open_         = true;
    opened_at_ms_ = now_ms;
    return true;
  }
  return false;
}

// ---------------------------------------------------------------------------
// Policies
// ---------------------------------------------------------------------------

namespace {

bool healthy(const RankedCandidate& c, const RouteContext& ctx) {
  return c.status == NodeStatus::online && c.health.success_rate >= ctx.health_threshold;
}

int tier_rank(Tier t) {
  switch (t) {
    case Tier::local: return 0;
    case Tier::edge: return 1;
    case Tier::cloud: return 2;
  }
  return 2;
}

bool by_template(const RankedCandidate& a, const RankedCandidate& b) {
  return a.template_index < b.template_index;
}

}  // namespace

void LocalFirstPolicy::order(std::vector<RankedCandidate>& candidates,
                             const RouteContext& ctx) const {
  auto promoted = [&](const RankedCandidate& c) {
    return c.candidate.tier != Tier::cloud && healthy(c, ctx);
  };
  std::sort(candidates.begin(), candidates.end(),
            [&](const RankedCandidate& a, const RankedCandidate& b) {
              const bool pa = promoted(a);
              const bool pb = promoted(b);
              if (pa != pb) return pa;
              if (pa && tier_rank(a.candidate.tier) != tier_rank(b.candidate.tier)) {
                return tier_rank(a.candidate.tier) < tier_rank(b.candidate.tier);
              }
              return by_template(a, b);
            });
}

void PerformancePolicy::order(std::vector<RankedCandidate>& candidates,
                              const RouteContext& ctx) const {
  // Unprobed nodes report zero latency; they rank after every measured one.
  std::sort(candidates.begin(), candidates.end(),
            [&](const RankedCandidate& a, const RankedCandidate& b) {
              const bool ha = healthy(a, ctx);
              const bool hb = healthy(b, ctx);
              if (ha != hb) return ha;
              const bool ma = a.health.checks > 0;
              const bool mb = b.health.checks > 0;
              if (ma != mb) return ma;
              if (a.health.latency_us != b.health.latency_us) {
                return a.health.latency_us < b.health.latency_us;
              }
              if (a.health.success_rate != b.health.success_rate) {
                return a.health.success_rate > b.health.success_rate;
              }
              return by_template(a, b);
            });
}

void CostOptimizedPolicy::order(std::vector<RankedCandidate>& candidates,
                                const RouteContext& ctx) const {
  std::sort(candidates.begin(), candidates.end(),
            [&](const RankedCandidate& a, const RankedCandidate& b) {
              const bool ha = healthy(a, ctx);
              const bool hb = healthy(b, ctx);
              if (ha != hb) return ha;
              if (ha && a.candidate.cost != b.candidate.cost) {
                return a.candidate.cost < b.candidate.cost;
              }
              return by_template(a, b);
            });
}

std::unique_ptr<IRoutingPolicy> make_policy(RoutePolicy p) {
  switch (p) {
    case RoutePolicy::local_first: return std::make_unique<LocalFirstPolicy>();
    case RoutePolicy::performance: return std::make_unique<PerformancePolicy>();
    case RoutePolicy::cost_optimized: return std::make_unique<CostOptimizedPolicy>();
  }
  return std::make_unique<LocalFirstPolicy>();
}

// ---------------------------------------------------------------------------
// ConnectionRouter
// ---------------------------------------------------------------------------

ConnectionRouter::ConnectionRouter(WorkerRegistry& registry, RouterConfig cfg, Clock clock)
    : registry_(registry), cfg_(std::move(cfg)), clock_(std::move(clock)) {
  for (const auto& r : cfg_.routes) routes_[r.service] = r;
}

void ConnectionRouter::set_route(RouteTemplate route) {
  std::lock_guard<std::mutex> lk(mu_);
  std::string service = route.service;
  routes_[service] = std::move(route);
}

bool ConnectionRouter::has_route(const std::string& service) const {
  std::lock_guard<std::mutex> lk(mu_);
  return routes_.count(service) != 0;
}

std::vector<std::string> ConnectionRouter::services() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  for (const auto& [name, r] : routes_) out.push_back(name);
  return out;
}

CircuitBreaker& ConnectionRouter::breaker_locked(const std::string& node_id) const {
  auto it = breakers_.find(node_id);
  if (it == breakers_.end()) {
    it = breakers_
             .emplace(node_id,
                      CircuitBreaker(cfg_.breaker_failure_threshold, cfg_.breaker_cooldown_ms))
             .first;
  }
  return it->second;
}

ResolveResult ConnectionRouter::resolve(const std::string& service) const {
  RoutePolicy policy = RoutePolicy::local_first;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = routes_.find(service);
    if (it != routes_.end()) policy = it->second.policy;
  }
  return resolve(service, policy);
}

ResolveResult ConnectionRouter::resolve(const std::string& service, RoutePolicy policy) const {
  ResolveResult out;
  out.service = service;
  out.policy  = policy;

  RouteTemplate tmpl;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = routes_.find(service);
    if (it == routes_.end()) {
      out.code   = ErrorCode::unknown_service;
      out.detail = "no route template for service " + service;
      return out;
    }
    tmpl = it->second;
  }

  std::vector<RankedCandidate> ranked;
  for (size_t i = 0; i < tmpl.candidates.size(); ++i) {
    const RouteCandidate& c = tmpl.candidates[i];
    auto snap = registry_.snapshot(c.node_id);
    if (!snap || snap->status == NodeStatus::offline) continue;
    RankedCandidate rc;
    rc.candidate      = c;
    rc.status         = snap->status;
    rc.health         = snap->health;
    rc.template_index = i;
    ranked.push_back(std::move(rc));
  }

  {
    const uint64_t now = clock_();
    std::lock_guard<std::mutex> lk(mu_);
    ranked.erase(std::remove_if(ranked.begin(), ranked.end(),
                                [&](RankedCandidate& rc) {
                                  rc.breaker = breaker_locked(rc.candidate.node_id).state(now);
                                  return rc.breaker == BreakerState::open;
                                }),
                 ranked.end());
  }

  if (ranked.empty()) {
    out.code   = ErrorCode::no_healthy_candidate;
    out.detail = "all " + std::to_string(tmpl.candidates.size()) + " candidates for " + service +
                 " are offline or circuit-open";
    return out;
  }

  RouteContext ctx;
  ctx.health_threshold = cfg_.health_threshold;
  make_policy(policy)->order(ranked, ctx);

  out.ok         = true;
  out.candidates = std::move(ranked);
  global_stats().routes_resolved.fetch_add(1, std::memory_order_relaxed);
  return out;
}

void ConnectionRouter::record_outcome(const std::string& service, const std::string& node_id,
                                      const Status& st) {
  if (st.ok) {
    std::lock_guard<std::mutex> lk(mu_);
    breaker_locked(node_id).record_success();
    return;
  }

  bool tripped = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    tripped = breaker_locked(node_id).record_failure(clock_());
  }
  Status deg = registry_.mark_degraded(node_id);
  if (!deg.ok && deg.code != ErrorCode::unknown_node) {
    log_warning("router", "mark_degraded(" + node_id + ") failed: " + deg.detail);
  }

  CoordinationEvent ev;
  ev.kind      = "route_failover";
  ev.component = "router";
  ev.subject   = service;
  ev.detail    = node_id + ": " + (st.detail.empty() ? to_string(st.code) : st.detail);
  ev.ok        = false;
  ev.code      = st.code;
  ev.at_ms     = clock_();
  emit_event(ev);

  if (tripped) {
    global_stats().breaker_trips.fetch_add(1, std::memory_order_relaxed);
    CoordinationEvent trip;
    trip.kind      = "breaker_open";
    trip.component = "router";
    trip.subject   = node_id;
    trip.detail    = "circuit opened for " + std::to_string(cfg_.breaker_cooldown_ms) + "ms";
    trip.ok        = false;
    trip.code      = st.code;
    trip.at_ms     = ev.at_ms;
    emit_event(trip);
  }
}

RouteExecution ConnectionRouter::execute(const std::string& service, const AttemptFn& attempt) {
  RouteExecution out;
  ResolveResult resolved = resolve(service);
  if (!resolved.ok) {
    out.code   = resolved.code;
    out.detail = resolved.detail;
    return out;
  }

  std::string last_detail;
  for (const RankedCandidate& c : resolved.candidates) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (!breaker_locked(c.candidate.node_id).allow(clock_())) continue;
    }
    ++out.attempts;
    Status st = attempt(c);
    record_outcome(service, c.candidate.node_id, st);
    if (st.ok) {
      out.ok      = true;
      out.node_id = c.candidate.node_id;
      return out;
    }
    ++out.failovers;
    global_stats().route_failovers.fetch_add(1, std::memory_order_relaxed);
    last_detail = c.candidate.node_id + ": " + (st.detail.empty() ? to_string(st.code) : st.detail);
  }

  out.code   = ErrorCode::no_healthy_candidate;
  out.detail = out.attempts == 0 ? "no candidate admitted by its circuit breaker"
                                 : "all candidates failed; last " + last_detail;
  return out;
}

BreakerState ConnectionRouter::breaker_state(const std::string& node_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = breakers_.find(node_id);
  if (it == breakers_.end()) return BreakerState::closed;
  return it->second.state(clock_());
}

std::string ConnectionRouter::to_json() const {
  const uint64_t now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  jsonlite::Object routes;
  for (const auto& [name, r] : routes_) {
    jsonlite::Array cands;
    for (const auto& c : r.candidates) {
      jsonlite::Object o;
      o["node_id"]  = c.node_id;
      o["endpoint"] = c.endpoint;
      o["tier"]     = to_string(c.tier);
      o["cost"]     = c.cost;
      cands.push_back(std::move(o));
    }
    jsonlite::Object ro;
    ro["policy"]     = to_string(r.policy);
    ro["candidates"] = std::move(cands);
    routes[name]     = std::move(ro);
  }
  jsonlite::Object breakers;
  for (const auto& [node, b] : breakers_) {
    jsonlite::Object bo;
    bo["state"]    = to_string(b.state(now));
    bo["failures"] = b.consecutive_failures();
    breakers[node] = std::move(bo);
  }
  jsonlite::Object root;
  root["routes"]   = std::move(routes);
  root["breakers"] = std::move(breakers);
  return jsonlite::to_json(jsonlite::Value{root});
}

std::string resolve_result_to_json(const ResolveResult& r) {
  jsonlite::Object root;
  root["ok"]      = r.ok;
  root["service"] = r.service;
  root["policy"]  = to_string(r.policy);
  if (!r.ok) {
    root["error"]  = to_string(r.code);
    root["detail"] = r.detail;
  }
  jsonlite::Array cands;
  for (const auto& c : r.candidates) {
    jsonlite::Object o;
    o["node_id"]      = c.candidate.node_id;
    o["endpoint"]     = c.candidate.endpoint;
    o["tier"]         = to_string(c.candidate.tier);
    o["status"]       = to_string(c.status);
    o["latency_us"]   = c.health.latency_us;
    o["success_rate"] = c.health.success_rate;
    o["breaker"]      = to_string(c.breaker);
    cands.push_back(std::move(o));
  }
  root["candidates"] = std::move(cands);
  return jsonlite::to_json(jsonlite::Value{root});
}

}  // namespace tether
