#include "tether/config.hpp"

#include <cstdlib>
#include <set>
#include <unistd.h>

#include "tether/jsonlite.hpp"

namespace tether {

namespace {

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0]) return buf;
  return "unknown-host";
}

template <typename T>
void env_uint(const char* name, T& out) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return;
  char* end = nullptr;
  unsigned long long v = std::strtoull(e, &end, 10);
  if (end && *end == '\0') out = static_cast<T>(v);
}

void env_string(const char* name, std::string& out) {
  const char* e = std::getenv(name);
  if (e && e[0]) out = e;
}

void fail(ConfigValidationResult* r, std::string msg) {
  if (!r) return;
  r->ok = false;
  r->errors.push_back(std::move(msg));
}

RouteTemplate route_from_json(const jsonlite::Object& o, ConfigValidationResult* r) {
  RouteTemplate t;
  t.service = jsonlite::get_string(o, "service");
  const std::string policy = jsonlite::get_string(o, "policy", "local_first");
  if (auto p = route_policy_from_string(policy)) {
    t.policy = *p;
  } else {
    fail(r, "route '" + t.service + "': unknown policy '" + policy + "'");
  }
  for (const auto& item : jsonlite::get_array(o, "candidates")) {
    if (!std::holds_alternative<jsonlite::Object>(item.v)) {
      fail(r, "route '" + t.service + "': candidate must be an object");
      continue;
    }
    const auto& c = std::get<jsonlite::Object>(item.v);
    RouteCandidate rc;
    rc.node_id  = jsonlite::get_string(c, "node_id");
    rc.endpoint = jsonlite::get_string(c, "endpoint");
    rc.cost     = jsonlite::get_double(c, "cost", 1.0);
    const std::string tier = jsonlite::get_string(c, "tier", "cloud");
    if (auto tv = tier_from_string(tier)) {
      rc.tier = *tv;
    } else {
      fail(r, "route '" + t.service + "': unknown tier '" + tier + "'");
    }
    t.candidates.push_back(std::move(rc));
  }
  return t;
}

}  // namespace

CoordinatorConfig default_config() {
  CoordinatorConfig cfg;
  cfg.node_id = get_hostname();
  return cfg;
}

CoordinatorConfig config_from_json(const std::string& json, ConfigValidationResult* result) {
  CoordinatorConfig cfg = default_config();
  std::optional<jsonlite::JsonError> err;
  auto root = jsonlite::parse(json, &err);
  if (err) {
    fail(result, "config: " + err->code + ": " + err->message);
    return cfg;
  }

  cfg.node_id   = jsonlite::get_string(root, "node_id", cfg.node_id);
  cfg.state_dir = jsonlite::get_string(root, "state_dir", cfg.state_dir);
  if (root.contains("role")) {
    const std::string role = jsonlite::get_string(root, "role");
    if (auto r = node_role_from_string(role)) cfg.role = *r;
    else fail(result, "config: unknown role '" + role + "'");
  }

  auto h = jsonlite::get_object(root, "health");
  cfg.health.miss_threshold_degraded = static_cast<uint32_t>(
      jsonlite::get_u64(h, "miss_threshold_degraded", cfg.health.miss_threshold_degraded));
  cfg.health.miss_threshold_offline = static_cast<uint32_t>(
      jsonlite::get_u64(h, "miss_threshold_offline", cfg.health.miss_threshold_offline));
  cfg.health.heartbeat_interval_ms =
      jsonlite::get_u64(h, "heartbeat_interval_ms", cfg.health.heartbeat_interval_ms);
  cfg.health.probe_interval_ms = jsonlite::get_u64(h, "probe_interval_ms", cfg.health.probe_interval_ms);
  cfg.health.probe_timeout_ms  = jsonlite::get_u64(h, "probe_timeout_ms", cfg.health.probe_timeout_ms);
  cfg.health.node_ttl_ms       = jsonlite::get_u64(h, "node_ttl_ms", cfg.health.node_ttl_ms);
  cfg.health.ewma_alpha        = jsonlite::get_double(h, "ewma_alpha", cfg.health.ewma_alpha);

  auto s = jsonlite::get_object(root, "scheduler");
  cfg.scheduler.max_queued_tasks =
      jsonlite::get_u64(s, "max_queued_tasks", cfg.scheduler.max_queued_tasks);
  cfg.scheduler.max_retries =
      static_cast<uint32_t>(jsonlite::get_u64(s, "max_retries", cfg.scheduler.max_retries));
  cfg.scheduler.backoff_base_ms = jsonlite::get_u64(s, "backoff_base_ms", cfg.scheduler.backoff_base_ms);
  cfg.scheduler.backoff_cap_ms  = jsonlite::get_u64(s, "backoff_cap_ms", cfg.scheduler.backoff_cap_ms);
  cfg.scheduler.max_wait_ms     = jsonlite::get_u64(s, "max_wait_ms", cfg.scheduler.max_wait_ms);
  cfg.scheduler.escalation_step = static_cast<int32_t>(
      jsonlite::get_i64(s, "escalation_step", cfg.scheduler.escalation_step));
  cfg.scheduler.dispatch_timeout_ms =
      jsonlite::get_u64(s, "dispatch_timeout_ms", cfg.scheduler.dispatch_timeout_ms);
  cfg.scheduler.dispatch_workers = static_cast<uint32_t>(
      jsonlite::get_u64(s, "dispatch_workers", cfg.scheduler.dispatch_workers));

  auto r = jsonlite::get_object(root, "router");
  cfg.router.health_threshold = jsonlite::get_double(r, "health_threshold", cfg.router.health_threshold);
  cfg.router.breaker_failure_threshold = static_cast<uint32_t>(
      jsonlite::get_u64(r, "breaker_failure_threshold", cfg.router.breaker_failure_threshold));
  cfg.router.breaker_cooldown_ms =
      jsonlite::get_u64(r, "breaker_cooldown_ms", cfg.router.breaker_cooldown_ms);
  for (const auto& item : jsonlite::get_array(r, "routes")) {
    if (!std::holds_alternative<jsonlite::Object>(item.v)) {
      fail(result, "router.routes: entries must be objects");
      continue;
    }
    cfg.router.routes.push_back(route_from_json(std::get<jsonlite::Object>(item.v), result));
  }

  auto o = jsonlite::get_object(root, "offline");
  cfg.offline.max_queue_size = jsonlite::get_u64(o, "max_queue_size", cfg.offline.max_queue_size);
  cfg.offline.retention_ms   = jsonlite::get_u64(o, "retention_ms", cfg.offline.retention_ms);
  cfg.offline.replay_timeout_ms =
      jsonlite::get_u64(o, "replay_timeout_ms", cfg.offline.replay_timeout_ms);
  cfg.offline.authoritative_node =
      jsonlite::get_string(o, "authoritative_node", cfg.offline.authoritative_node);
  cfg.offline.sync_service = jsonlite::get_string(o, "sync_service", cfg.offline.sync_service);
  return cfg;
}

void apply_env_overrides(CoordinatorConfig& cfg) {
  env_string("TETHER_NODE_ID", cfg.node_id);
  if (const char* e = std::getenv("TETHER_ROLE")) {
    if (auto r = node_role_from_string(e)) cfg.role = *r;
  }
  env_uint("TETHER_MISS_DEGRADED", cfg.health.miss_threshold_degraded);
  env_uint("TETHER_MISS_OFFLINE", cfg.health.miss_threshold_offline);
  env_uint("TETHER_NODE_TTL_MS", cfg.health.node_ttl_ms);
  env_uint("TETHER_PROBE_INTERVAL_MS", cfg.health.probe_interval_ms);
  env_uint("TETHER_PROBE_TIMEOUT_MS", cfg.health.probe_timeout_ms);
  env_uint("TETHER_MAX_RETRIES", cfg.scheduler.max_retries);
  env_string("TETHER_STATE_DIR", cfg.state_dir);
  env_string("TETHER_AUTHORITATIVE_NODE", cfg.offline.authoritative_node);
  env_uint("TETHER_OFFLINE_QUEUE_MAX", cfg.offline.max_queue_size);
}

ConfigValidationResult validate_config(const CoordinatorConfig& cfg) {
  ConfigValidationResult r;
  auto error = [&r](std::string m) {
    r.ok = false;
    r.errors.push_back(std::move(m));
  };

  if (cfg.node_id.empty()) error("node_id must not be empty");
  if (cfg.health.miss_threshold_degraded == 0) error("health.miss_threshold_degraded must be >= 1");
  if (cfg.health.miss_threshold_offline <= cfg.health.miss_threshold_degraded) {
    error("health.miss_threshold_offline must exceed miss_threshold_degraded");
  }
  if (cfg.health.probe_timeout_ms == 0) error("health.probe_timeout_ms must be > 0");
  if (cfg.health.probe_timeout_ms > cfg.health.probe_interval_ms) {
    r.warnings.push_back("health.probe_timeout_ms exceeds probe_interval_ms; cycles will overlap");
  }
  if (cfg.health.ewma_alpha <= 0.0 || cfg.health.ewma_alpha > 1.0) {
    error("health.ewma_alpha must be in (0, 1]");
  }

  if (cfg.scheduler.max_queued_tasks == 0) error("scheduler.max_queued_tasks must be > 0");
  if (cfg.scheduler.dispatch_workers == 0) error("scheduler.dispatch_workers must be > 0");
  if (cfg.scheduler.backoff_base_ms > cfg.scheduler.backoff_cap_ms) {
    error("scheduler.backoff_base_ms must not exceed backoff_cap_ms");
  }
  if (cfg.scheduler.escalation_step < 0) error("scheduler.escalation_step must be >= 0");

  if (cfg.router.health_threshold < 0.0 || cfg.router.health_threshold > 1.0) {
    error("router.health_threshold must be in [0, 1]");
  }
  if (cfg.router.breaker_failure_threshold == 0) {
    error("router.breaker_failure_threshold must be >= 1");
  }
  std::set<std::string> services;
  for (const auto& route : cfg.router.routes) {
    if (route.service.empty()) {
      error("router.routes: service name must not be empty");
      continue;
    }
    if (!services.insert(route.service).second) {
      error("router.routes: duplicate service '" + route.service + "'");
    }
    if (route.candidates.empty()) {
      error("router.routes: service '" + route.service + "' has no candidates");
    }
    for (const auto& c : route.candidates) {
      if (c.node_id.empty()) error("router.routes: '" + route.service + "' candidate without node_id");
      if (c.cost < 0.0) error("router.routes: '" + route.service + "' candidate with negative cost");
    }
  }

  if (cfg.offline.max_queue_size == 0) error("offline.max_queue_size must be > 0");
  if (cfg.offline.authoritative_node.empty()) error("offline.authoritative_node must not be empty");
  if (!services.contains(cfg.offline.sync_service)) {
    r.warnings.push_back("offline.sync_service '" + cfg.offline.sync_service +
                         "' has no route template; writes stay offline unless node_id is the authoritative node");
  }
  return r;
}

std::string config_to_json(const CoordinatorConfig& cfg) {
  using jsonlite::Object;
  using jsonlite::Value;
  Object root;
  root["node_id"]   = cfg.node_id;
  root["role"]      = to_string(cfg.role);
  root["state_dir"] = cfg.state_dir;

  Object h;
  h["miss_threshold_degraded"] = cfg.health.miss_threshold_degraded;
  h["miss_threshold_offline"]  = cfg.health.miss_threshold_offline;
  h["heartbeat_interval_ms"]   = cfg.health.heartbeat_interval_ms;
  h["probe_interval_ms"]       = cfg.health.probe_interval_ms;
  h["probe_timeout_ms"]        = cfg.health.probe_timeout_ms;
  h["node_ttl_ms"]             = cfg.health.node_ttl_ms;
  h["ewma_alpha"]              = cfg.health.ewma_alpha;
  root["health"] = h;

  Object s;
  s["max_queued_tasks"]    = static_cast<uint64_t>(cfg.scheduler.max_queued_tasks);
  s["max_retries"]         = cfg.scheduler.max_retries;
  s["backoff_base_ms"]     = cfg.scheduler.backoff_base_ms;
  s["backoff_cap_ms"]      = cfg.scheduler.backoff_cap_ms;
  s["max_wait_ms"]         = cfg.scheduler.max_wait_ms;
  s["escalation_step"]     = cfg.scheduler.escalation_step;
  s["dispatch_timeout_ms"] = cfg.scheduler.dispatch_timeout_ms;
  s["dispatch_workers"]    = cfg.scheduler.dispatch_workers;
  root["scheduler"] = s;

  Object r;
  r["health_threshold"]          = cfg.router.health_threshold;
  r["breaker_failure_threshold"] = cfg.router.breaker_failure_threshold;
  r["breaker_cooldown_ms"]       = cfg.router.breaker_cooldown_ms;
  jsonlite::Array routes;
  for (const auto& route : cfg.router.routes) {
    Object t;
    t["service"] = route.service;
    t["policy"]  = to_string(route.policy);
    jsonlite::Array cands;
    for (const auto& c : route.candidates) {
      Object co;
      co["node_id"]  = c.node_id;
      co["endpoint"] = c.endpoint;
      co["tier"]     = to_string(c.tier);
      co["cost"]     = c.cost;
      cands.emplace_back(co);
    }
    t["candidates"] = cands;
    routes.emplace_back(t);
  }
  r["routes"] = routes;
  root["router"] = r;

  Object o;
  o["max_queue_size"]     = static_cast<uint64_t>(cfg.offline.max_queue_size);
  o["retention_ms"]       = cfg.offline.retention_ms;
  o["replay_timeout_ms"]  = cfg.offline.replay_timeout_ms;
  o["authoritative_node"] = cfg.offline.authoritative_node;
  o["sync_service"]       = cfg.offline.sync_service;
  root["offline"] = o;

  return jsonlite::to_json(Value{root});
}

}  // namespace tether
