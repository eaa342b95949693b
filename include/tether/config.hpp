#pragma once

// tether/config.hpp: Coordinator configuration.
//
// Resolution order (later wins):
//   1. compiled defaults (default_config)
//   2. JSON document (config_from_json), including route templates
//   3. TETHER_* environment variables (apply_env_overrides)
//
// validate_config() must pass before a Coordinator is constructed from the
// result; it never mutates the config.

#include <cstdint>
#include <string>
#include <vector>

#include "tether/types.hpp"

namespace tether {

struct RouteCandidate {
  std::string node_id;
  std::string endpoint;
  Tier        tier{Tier::cloud};
  double      cost{1.0};
};

struct RouteTemplate {
  std::string                 service;
  RoutePolicy                 policy{RoutePolicy::local_first};
  std::vector<RouteCandidate> candidates;  // fallback chain order
};

struct HealthConfig {
  uint32_t miss_threshold_degraded{3};
  uint32_t miss_threshold_offline{5};
  uint64_t heartbeat_interval_ms{10000};
  uint64_t probe_interval_ms{5000};
  uint64_t probe_timeout_ms{1000};
  uint64_t node_ttl_ms{15ull * 60 * 1000};
  double   ewma_alpha{0.3};
  size_t   transition_channel_capacity{1024};
};

struct SchedulerConfig {
  size_t   max_queued_tasks{10000};
  uint32_t max_retries{3};
  uint64_t backoff_base_ms{500};
  uint64_t backoff_cap_ms{30000};
  uint64_t max_wait_ms{60000};
  int32_t  escalation_step{1};
  uint64_t dispatch_timeout_ms{5000};
  uint32_t dispatch_workers{2};
  size_t   dispatch_queue_capacity{64};
  uint64_t assign_interval_ms{50};
};

struct RouterConfig {
  double   health_threshold{0.5};
  uint32_t breaker_failure_threshold{3};
  uint64_t breaker_cooldown_ms{30000};
  std::vector<RouteTemplate> routes;
};

struct OfflineConfig {
  size_t      max_queue_size{10000};
  uint64_t    retention_ms{30ull * 24 * 60 * 60 * 1000};
  uint64_t    replay_timeout_ms{5000};
  std::string authoritative_node{"central"};
  std::string sync_service{"sync"};
};

struct CoordinatorConfig {
  std::string     node_id;
  NodeRole        role{NodeRole::edge};
  std::string     state_dir{".tether"};
  HealthConfig    health;
  SchedulerConfig scheduler;
  RouterConfig    router;
  OfflineConfig   offline;
};

struct ConfigValidationResult {
  bool ok{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

CoordinatorConfig default_config();

// Missing keys keep their defaults. Parse errors and unknown enum names are
// reported through *result (ok=false) and leave the defaults in place.
CoordinatorConfig config_from_json(const std::string& json, ConfigValidationResult* result);

void apply_env_overrides(CoordinatorConfig& cfg);

ConfigValidationResult validate_config(const CoordinatorConfig& cfg);

std::string config_to_json(const CoordinatorConfig& cfg);

}  // namespace tether
