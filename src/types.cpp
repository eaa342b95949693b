#include "tether/types.hpp"

namespace tether {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::transient_network: return "transient_network";
    case ErrorCode::capacity_exhausted: return "capacity_exhausted";
    case ErrorCode::permanent_task_failure: return "permanent_task_failure";
    case ErrorCode::conflict_unresolved: return "conflict_unresolved";
    case ErrorCode::node_ttl_expired: return "node_ttl_expired";
    case ErrorCode::storage_corrupt: return "storage_corrupt";
    case ErrorCode::duplicate_node: return "duplicate_node";
    case ErrorCode::unknown_node: return "unknown_node";
    case ErrorCode::unknown_task: return "unknown_task";
    case ErrorCode::unknown_service: return "unknown_service";
    case ErrorCode::no_healthy_candidate: return "no_healthy_candidate";
    case ErrorCode::queue_full: return "queue_full";
    case ErrorCode::not_ready: return "not_ready";
    case ErrorCode::deadline_exceeded: return "deadline_exceeded";
    case ErrorCode::version_mismatch: return "version_mismatch";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::invalid_argument: return "invalid_argument";
    case ErrorCode::cancelled: return "cancelled";
  }
  return "";
}

std::optional<ErrorCode> error_code_from_string(const std::string& s) {
  static const ErrorCode kAll[] = {
      ErrorCode::none,
      ErrorCode::transient_network,
      ErrorCode::capacity_exhausted,
      ErrorCode::permanent_task_failure,
      ErrorCode::conflict_unresolved,
      ErrorCode::node_ttl_expired,
      ErrorCode::storage_corrupt,
      ErrorCode::duplicate_node,
      ErrorCode::unknown_node,
      ErrorCode::unknown_task,
      ErrorCode::unknown_service,
      ErrorCode::no_healthy_candidate,
      ErrorCode::queue_full,
      ErrorCode::not_ready,
      ErrorCode::deadline_exceeded,
      ErrorCode::version_mismatch,
      ErrorCode::config_invalid,
      ErrorCode::invalid_argument,
      ErrorCode::cancelled,
  };
  for (ErrorCode c : kAll) {
    if (to_string(c) == s) return c;
  }
  return std::nullopt;
}

std::string to_string(NodeRole r) {
  switch (r) {
    case NodeRole::cloud: return "cloud";
    case NodeRole::edge: return "edge";
    case NodeRole::client: return "client";
  }
  return "client";
}

std::string to_string(NodeStatus s) {
  switch (s) {
    case NodeStatus::online: return "online";
    case NodeStatus::degraded: return "degraded";
    case NodeStatus::offline: return "offline";
  }
  return "offline";
}

std::string to_string(TaskStatus s) {
  switch (s) {
    case TaskStatus::queued: return "queued";
    case TaskStatus::assigned: return "assigned";
    case TaskStatus::running: return "running";
    case TaskStatus::succeeded: return "succeeded";
    case TaskStatus::failed: return "failed";
    case TaskStatus::dead_lettered: return "dead_lettered";
    case TaskStatus::cancelled: return "cancelled";
  }
  return "queued";
}

std::string to_string(OpKind k) {
  switch (k) {
    case OpKind::create: return "create";
    case OpKind::update: return "update";
    case OpKind::remove: return "delete";
  }
  return "update";
}

std::string to_string(OpState s) {
  switch (s) {
    case OpState::captured: return "captured";
    case OpState::queued: return "queued";
    case OpState::replaying: return "replaying";
    case OpState::applied: return "applied";
    case OpState::conflicted: return "conflicted";
    case OpState::resolved: return "resolved";
  }
  return "captured";
}

std::string to_string(RoutePolicy p) {
  switch (p) {
    case RoutePolicy::local_first: return "local_first";
    case RoutePolicy::performance: return "performance";
    case RoutePolicy::cost_optimized: return "cost_optimized";
  }
  return "local_first";
}

std::string to_string(Tier t) {
  switch (t) {
    case Tier::local: return "local";
    case Tier::edge: return "edge";
    case Tier::cloud: return "cloud";
  }
  return "cloud";
}

std::optional<NodeRole> node_role_from_string(const std::string& s) {
  if (s == "cloud" || s == "server" || s == "central") return NodeRole::cloud;
  if (s == "edge") return NodeRole::edge;
  if (s == "client" || s == "node" || s == "desktop") return NodeRole::client;
  return std::nullopt;
}

std::optional<NodeStatus> node_status_from_string(const std::string& s) {
  if (s == "online") return NodeStatus::online;
  if (s == "degraded") return NodeStatus::degraded;
  if (s == "offline") return NodeStatus::offline;
  return std::nullopt;
}

std::optional<TaskStatus> task_status_from_string(const std::string& s) {
  if (s == "queued") return TaskStatus::queued;
  if (s == "assigned") return TaskStatus::assigned;
  if (s == "running") return TaskStatus::running;
  if (s == "succeeded") return TaskStatus::succeeded;
  if (s == "failed") return TaskStatus::failed;
  if (s == "dead_lettered") return TaskStatus::dead_lettered;
  if (s == "cancelled") return TaskStatus::cancelled;
  return std::nullopt;
}

std::optional<OpKind> op_kind_from_string(const std::string& s) {
  if (s == "create") return OpKind::create;
  if (s == "update") return OpKind::update;
  if (s == "delete") return OpKind::remove;
  return std::nullopt;
}

std::optional<OpState> op_state_from_string(const std::string& s) {
  if (s == "captured") return OpState::captured;
  if (s == "queued") return OpState::queued;
  if (s == "replaying") return OpState::replaying;
  if (s == "applied") return OpState::applied;
  if (s == "conflicted") return OpState::conflicted;
  if (s == "resolved") return OpState::resolved;
  return std::nullopt;
}

std::optional<RoutePolicy> route_policy_from_string(const std::string& s) {
  if (s == "local_first" || s == "local-first") return RoutePolicy::local_first;
  if (s == "performance" || s == "performance_based" || s == "performance-based") {
    return RoutePolicy::performance;
  }
  if (s == "cost_optimized" || s == "cost-optimized") return RoutePolicy::cost_optimized;
  return std::nullopt;
}

std::optional<Tier> tier_from_string(const std::string& s) {
  if (s == "local") return Tier::local;
  if (s == "edge") return Tier::edge;
  if (s == "cloud") return Tier::cloud;
  return std::nullopt;
}

bool is_terminal(TaskStatus s) {
  return s == TaskStatus::succeeded || s == TaskStatus::failed ||
         s == TaskStatus::dead_lettered || s == TaskStatus::cancelled;
}

bool is_terminal(OpState s) {
  return s == OpState::applied || s == OpState::resolved;
}

}  // namespace tether
