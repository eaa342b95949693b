#pragma once

// tether/router.hpp: Connection router: health-aware candidate ordering with
// failover and per-node circuit breakers.
//
// resolve(service) pipeline:
//   1. look up the RouteTemplate (unknown_service when absent)
//   2. drop candidates whose node is offline, unknown to the registry, or
//      behind an open circuit
//   3. order the survivors with the selected IRoutingPolicy
//   4. nothing left -> no_healthy_candidate
//
// CIRCUIT BREAKER (per node):
//
//   closed --(breaker_failure_threshold consecutive failures)--> open
//   open --(breaker_cooldown elapsed)--> half_open
//   half_open --(trial succeeds)--> closed
//   half_open --(trial fails)--> open
//
// Only one half-open trial runs at a time; other callers skip the node until
// the trial reports.
//
// EXTENSION_POINT: routing_policy
//   New policies implement IRoutingPolicy::order() and get a RoutePolicy tag
//   plus a case in make_policy().

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "tether/clock.hpp"
#include "tether/config.hpp"
#include "tether/registry.hpp"
#include "tether/types.hpp"

namespace tether {

enum class BreakerState { closed, open, half_open };

std::string to_string(BreakerState s);

class CircuitBreaker {
 public:
  CircuitBreaker(uint32_t failure_threshold, uint64_t cooldown_ms);

  BreakerState state(uint64_t now_ms) const;

  // False while open, or while another half-open trial is in flight.
  // Returning true in half_open reserves the trial.
  bool allow(uint64_t now_ms);

  void record_success();
  // Returns true when this failure opened the circuit.
  bool record_failure(uint64_t now_ms);

  uint32_t consecutive_failures() const { return failures_; }

 private:
  uint32_t threshold_;
  uint64_t cooldown_ms_;
  uint32_t failures_{0};
  bool     open_{false};
  bool     trial_in_flight_{false};
  uint64_t opened_at_ms_{0};
};

struct RankedCandidate {
  RouteCandidate candidate;
  NodeStatus     status{NodeStatus::online};
  HealthRecord   health;
  BreakerState   breaker{BreakerState::closed};
  size_t         template_index{0};
};

struct RouteContext {
  double health_threshold{0.5};
};

class IRoutingPolicy {
 public:
  virtual ~IRoutingPolicy() = default;
  virtual RoutePolicy kind() const = 0;
  virtual void order(std::vector<RankedCandidate>& candidates, const RouteContext& ctx) const = 0;
};

// Healthy local/edge candidates first (local before edge), then the template's
// fallback chain.
class LocalFirstPolicy : public IRoutingPolicy {
 public:
  RoutePolicy kind() const override { return RoutePolicy::local_first; }
  void order(std::vector<RankedCandidate>& candidates, const RouteContext& ctx) const override;
};

// Ascending latency, then descending success rate, then template order.
class PerformancePolicy : public IRoutingPolicy {
 public:
  RoutePolicy kind() const override { return RoutePolicy::performance; }
  void order(std::vector<RankedCandidate>& candidates, const RouteContext& ctx) const override;
};

// Healthy candidates by ascending cost, then the rest in template order.
class CostOptimizedPolicy : public IRoutingPolicy {
 public:
  RoutePolicy kind() const override { return RoutePolicy::cost_optimized; }
  void order(std::vector<RankedCandidate>& candidates, const RouteContext& ctx) const override;
};

std::unique_ptr<IRoutingPolicy> make_policy(RoutePolicy p);

struct ResolveResult {
  bool                         ok{false};
  ErrorCode                    code{ErrorCode::none};
  std::string                  detail;
  std::string                  service;
  RoutePolicy                  policy{RoutePolicy::local_first};
  std::vector<RankedCandidate> candidates;
};

struct RouteExecution {
  bool        ok{false};
  ErrorCode   code{ErrorCode::none};
  std::string detail;
  std::string node_id;  // candidate that served the request
  uint32_t    attempts{0};
  uint32_t    failovers{0};
};

class ConnectionRouter {
 public:
  using AttemptFn = std::function<Status(const RankedCandidate&)>;

  ConnectionRouter(WorkerRegistry& registry, RouterConfig cfg, Clock clock);

  ConnectionRouter(const ConnectionRouter&) = delete;
  ConnectionRouter& operator=(const ConnectionRouter&) = delete;

  void set_route(RouteTemplate route);
  bool has_route(const std::string& service) const;
  std::vector<std::string> services() const;

  ResolveResult resolve(const std::string& service) const;
  ResolveResult resolve(const std::string& service, RoutePolicy policy) const;

  // Tries candidates in resolved order until one attempt succeeds. A failed
  // candidate is marked degraded in the registry and charged to its breaker.
  RouteExecution execute(const std::string& service, const AttemptFn& attempt);

  BreakerState breaker_state(const std::string& node_id) const;

  std::string to_json() const;

 private:
  CircuitBreaker& breaker_locked(const std::string& node_id) const;
  void record_outcome(const std::string& service, const std::string& node_id, const Status& st);

  WorkerRegistry& registry_;
  RouterConfig    cfg_;
  Clock           clock_;

  mutable std::mutex mu_;
  std::map<std::string, RouteTemplate> routes_;
  mutable std::map<std::string, CircuitBreaker> breakers_;
};

std::string resolve_result_to_json(const ResolveResult& r);

}  // namespace tether
