#pragma once

// tether/types.hpp: Core enums, error taxonomy and status values.
//
// ERROR MODEL:
//   Public operations never throw for expected conditions. They return value
//   types that carry ok + ErrorCode (+ a human-readable detail). Callers branch
//   on the code; the detail string is for logs and operators only.
//
//   transient_network       retried locally, invisible unless retries exhaust
//   capacity_exhausted      backpressure signal, the work stays queued
//   permanent_task_failure  worker-reported, terminal, never retried
//   conflict_unresolved     escalated to pending-review, never dropped
//   node_ttl_expired        lifecycle event, node is deregistered
//   storage_corrupt         halts the sync engine until an operator resets it
//
// INVARIANT: to_string() of every code is stable; it is written into the
// offline log, the conflict journal and the event stream.

#include <cstdint>
#include <optional>
#include <string>

namespace tether {

enum class ErrorCode {
  none,
  transient_network,
  capacity_exhausted,
  permanent_task_failure,
  conflict_unresolved,
  node_ttl_expired,
  storage_corrupt,
  duplicate_node,
  unknown_node,
  unknown_task,
  unknown_service,
  no_healthy_candidate,
  queue_full,
  not_ready,
  deadline_exceeded,
  version_mismatch,
  config_invalid,
  invalid_argument,
  cancelled,
};

std::string to_string(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(const std::string& s);

// ---------------------------------------------------------------------------
// Status: result of an operation with no payload.
// ---------------------------------------------------------------------------
struct Status {
  bool        ok{true};
  ErrorCode   code{ErrorCode::none};
  std::string detail;

  static Status success() { return {}; }
  static Status failure(ErrorCode c, std::string d = "") {
    Status s;
    s.ok     = false;
    s.code   = c;
    s.detail = std::move(d);
    return s;
  }
};

// ---------------------------------------------------------------------------
// Node / task / operation vocabularies
// ---------------------------------------------------------------------------

enum class NodeRole { cloud, edge, client };
enum class NodeStatus { online, degraded, offline };

enum class TaskStatus {
  queued,
  assigned,
  running,
  succeeded,
  failed,
  dead_lettered,
  cancelled,
};

// captured -> queued -> replaying -> {applied | conflicted} -> resolved
enum class OpKind { create, update, remove };
enum class OpState { captured, queued, replaying, applied, conflicted, resolved };

enum class RoutePolicy { local_first, performance, cost_optimized };
enum class Tier { local, edge, cloud };

std::string to_string(NodeRole r);
std::string to_string(NodeStatus s);
std::string to_string(TaskStatus s);
std::string to_string(OpKind k);
std::string to_string(OpState s);
std::string to_string(RoutePolicy p);
std::string to_string(Tier t);

std::optional<NodeRole>    node_role_from_string(const std::string& s);
std::optional<NodeStatus>  node_status_from_string(const std::string& s);
std::optional<TaskStatus>  task_status_from_string(const std::string& s);
std::optional<OpKind>      op_kind_from_string(const std::string& s);
std::optional<OpState>     op_state_from_string(const std::string& s);
std::optional<RoutePolicy> route_policy_from_string(const std::string& s);
std::optional<Tier>        tier_from_string(const std::string& s);

// Terminal task states never leave; a task there holds no node slot.
bool is_terminal(TaskStatus s);

// Terminal operation states for the offline log.
bool is_terminal(OpState s);

}  // namespace tether
