#include "tether/coordinator.hpp"

#include <chrono>

#include "tether/jsonlite.hpp"
#include "tether/observability.hpp"
#include "tether/version.hpp"

namespace tether {

namespace {

std::string error_reply(ErrorCode code, const std::string& detail) {
  jsonlite::Object o;
  o["status"] = "error";
  o["code"]   = to_string(code);
  o["detail"] = detail;
  return jsonlite::to_json(jsonlite::Value{o});
}

std::string apply_reply(const ApplyResult& r) {
  if (!r.ok) return error_reply(r.code, r.detail);
  jsonlite::Object o;
  o["status"]    = "ok";
  o["state"]     = to_string(r.state);
  o["duplicate"] = r.duplicate;
  o["code"]      = to_string(r.code);
  o["detail"]    = r.detail;
  if (r.strategy) o["strategy"] = to_string(*r.strategy);
  return jsonlite::to_json(jsonlite::Value{o});
}

}  // namespace

Coordinator::Coordinator(CoordinatorConfig cfg, ITransport& transport, IStateStore& store,
                         Clock clock)
    : cfg_(std::move(cfg)),
      transport_(transport),
      store_(store),
      clock_(std::move(clock)),
      registry_(cfg_.health, clock_),
      monitor_(registry_, &transport_, cfg_.health, cfg_.node_id, clock_),
      distributor_(registry_, transport_, cfg_.scheduler, cfg_.node_id, clock_),
      router_(registry_, cfg_.router, clock_),
      queue_(store_, cfg_.offline, cfg_.node_id, clock_),
      sync_(store_, cfg_.node_id, clock_) {}

Coordinator::~Coordinator() { stop(); }

Status Coordinator::require_ready() const {
  if (!initialized_) return Status::failure(ErrorCode::not_ready, "coordinator not initialized");
  return Status::success();
}

Status Coordinator::init() {
  if (initialized_) return Status::success();
  ConfigValidationResult v = validate_config(cfg_);
  if (!v.ok) {
    std::string detail;
    for (const auto& e : v.errors) detail += (detail.empty() ? "" : "; ") + e;
    return Status::failure(ErrorCode::config_invalid, detail);
  }
  for (const auto& w : v.warnings) log_warning("config", w);

  Status st = queue_.recover();
  if (!st.ok) {
    log_warning("offline_queue", "recovery failed: " + st.detail);
    return st;
  }

  registry_.subscribe([this](const NodeTransition& t) {
    distributor_.on_node_transition(t);
    queue_.on_node_transition(t);
  });

  NodeInfo self;
  self.id              = cfg_.node_id;
  self.role            = cfg_.role;
  self.address         = "local";
  self.max_concurrency = 1;
  self.version         = version::kSemver;
  st = registry_.register_node(self);
  if (!st.ok) return st;

  initialized_ = true;
  return Status::success();
}

void Coordinator::start() {
  if (!initialized_ || started_) return;
  monitor_.start();
  distributor_.start();
  queue_.start([this](const OfflineOperation& op) { return replay(op); },
               [this](const DrainReport& report) { submit_follow_ups(report); });
  inbound_stopping_ = false;
  inbound_ = std::thread([this] { inbound_loop(); });
  started_ = true;
}

void Coordinator::stop() {
  if (!started_) return;
  inbound_stopping_ = true;
  if (inbound_.joinable()) inbound_.join();
  queue_.stop();
  distributor_.stop();
  monitor_.stop();
  started_ = false;
}

Status Coordinator::register_node(const NodeInfo& info) {
  Status st = require_ready();
  if (!st.ok) return st;
  return registry_.register_node(info);
}

Status Coordinator::deregister_node(const std::string& node_id) {
  Status st = require_ready();
  if (!st.ok) return st;
  if (node_id == cfg_.node_id) {
    return Status::failure(ErrorCode::invalid_argument, "cannot deregister the local node");
  }
  return registry_.deregister_node(node_id);
}

Status Coordinator::heartbeat(const std::string& node_id, const NodeMetrics& metrics) {
  Status st = require_ready();
  if (!st.ok) return st;
  return registry_.heartbeat(node_id, metrics);
}

SubmitResult Coordinator::submit_task(const TaskSpec& spec) {
  Status st = require_ready();
  if (!st.ok) {
    SubmitResult r;
    r.code   = st.code;
    r.detail = st.detail;
    return r;
  }
  return distributor_.submit(spec);
}

std::optional<TaskSnapshot> Coordinator::get_task_status(const std::string& task_id) const {
  return distributor_.task(task_id);
}

Status Coordinator::cancel_task(const std::string& task_id) {
  return distributor_.cancel(task_id);
}

ResolveResult Coordinator::resolve_endpoint(const std::string& service) const {
  return router_.resolve(service);
}

EnqueueResult Coordinator::enqueue_offline_operation(OfflineOperation op) {
  return queue_.enqueue(std::move(op));
}

WriteResult Coordinator::write(OfflineOperation op) {
  WriteResult w;
  Status st = require_ready();
  if (!st.ok) {
    w.code   = st.code;
    w.detail = st.detail;
    return w;
  }
  EnqueueResult e = queue_.enqueue(std::move(op));
  if (!e.ok) {
    w.code   = e.code;
    w.detail = e.detail;
    return w;
  }
  w.ok    = true;
  w.op_id = e.op_id;

  const bool reachable = router_.has_route(cfg_.offline.sync_service)
                             ? router_.resolve(cfg_.offline.sync_service).ok
                             : cfg_.node_id == cfg_.offline.authoritative_node;
  if (reachable) {
    DrainReport report = drain_now();
    if (!report.ok) {
      w.code   = report.code;
      w.detail = report.detail;
    }
  } else {
    w.detail = "captured offline; sync service unreachable";
  }
  if (auto captured = queue_.operation(w.op_id)) w.state = captured->state;
  return w;
}

DrainReport Coordinator::drain_now() {
  DrainReport report = queue_.drain_once([this](const OfflineOperation& op) { return replay(op); });
  submit_follow_ups(report);
  return report;
}

DrainStatus Coordinator::drain_status() const { return queue_.drain_status(); }

ApplyResult Coordinator::replay(const OfflineOperation& op) {
  const std::string& service = cfg_.offline.sync_service;
  if (!router_.has_route(service)) {
    if (cfg_.node_id == cfg_.offline.authoritative_node) {
      return sync_.apply(op, clock_() + cfg_.offline.replay_timeout_ms);
    }
    ApplyResult r;
    r.code   = ErrorCode::transient_network;
    r.detail = "no route for sync service " + service;
    return r;
  }

  ApplyResult result;
  bool answered = false;
  RouteExecution ex = router_.execute(service, [&](const RankedCandidate& c) {
    ApplyResult r = c.candidate.node_id == cfg_.node_id
                        ? sync_.apply(op, clock_() + cfg_.offline.replay_timeout_ms)
                        : replay_remote(c.candidate.node_id, op);
    // Only an unreachable target is a routing failure; any answer ends the walk.
    if (!r.ok && r.code == ErrorCode::transient_network) return Status::failure(r.code, r.detail);
    result   = std::move(r);
    answered = true;
    return Status::success();
  });
  if (!answered) {
    result.ok     = false;
    result.code   = ErrorCode::transient_network;
    result.detail = ex.detail;
  }
  return result;
}

ApplyResult Coordinator::replay_remote(const std::string& node_id, const OfflineOperation& op) {
  ApplyResult out;
  Message msg;
  msg.kind           = "sync_apply";
  msg.from           = cfg_.node_id;
  msg.to             = node_id;
  msg.correlation_id = op.id;
  msg.body           = jsonlite::to_json(jsonlite::Value{op_to_object(op)});

  SendResult r = transport_.send(node_id, msg, std::chrono::milliseconds(cfg_.offline.replay_timeout_ms));
  if (!r.delivered) {
    out.code   = ErrorCode::transient_network;
    out.detail = "sync_apply to " + node_id + " not delivered";
    return out;
  }
  std::optional<jsonlite::JsonError> err;
  auto reply = jsonlite::parse(r.reply, &err);
  if (err) {
    out.code   = ErrorCode::transient_network;
    out.detail = "malformed sync reply from " + node_id + ": " + err->message;
    return out;
  }
  auto code  = error_code_from_string(jsonlite::get_string(reply, "code"));
  out.code   = code ? *code : ErrorCode::transient_network;
  out.detail = jsonlite::get_string(reply, "detail");
  if (jsonlite::get_string(reply, "status") != "ok") return out;

  auto state = op_state_from_string(jsonlite::get_string(reply, "state"));
  if (!state) {
    out.code   = ErrorCode::transient_network;
    out.detail = "sync reply from " + node_id + " without a valid state";
    return out;
  }
  out.ok        = true;
  out.state     = *state;
  out.duplicate = jsonlite::get_bool(reply, "duplicate");
  out.strategy  = resolution_strategy_from_string(jsonlite::get_string(reply, "strategy"));
  return out;
}

void Coordinator::submit_follow_ups(const DrainReport& report) {
  for (const auto& [op_id, task] : report.follow_ups) {
    TaskSpec spec;
    spec.idempotency_key       = "catchup:" + op_id;
    spec.kind                  = task.kind;
    spec.payload               = task.payload;
    spec.required_capabilities = task.required_capabilities;
    spec.priority              = task.priority;
    SubmitResult r = distributor_.submit(spec);
    if (!r.ok) {
      log_warning("coordinator", "catch-up task for " + op_id + " rejected: " + to_string(r.code));
    }
  }
}

Status Coordinator::resolve_pending(const std::string& entity_id, PendingDecision decision) {
  std::vector<std::string> settled;
  Status st = sync_.resolve_pending(entity_id, decision, &settled);
  if (!st.ok) return st;
  return queue_.mark_resolved(settled);
}

Status Coordinator::operator_reset() {
  if (!initialized_) return Status::failure(ErrorCode::not_ready, "coordinator not initialized");
  sync_.operator_reset();
  queue_.operator_reset();
  log_warning("coordinator", "operator reset: sync and offline drain resumed");
  return Status::success();
}

Status Coordinator::load_entity(const std::string& entity_id, std::optional<Entity>* out) const {
  return sync_.load(entity_id, out);
}

std::vector<NodeSnapshot> Coordinator::health_snapshot() const { return registry_.snapshot_all(); }

std::string Coordinator::health_json() const { return registry_.health_json(); }

std::string Coordinator::stats_json() const {
  std::string out = "{\"node\":\"" + jsonlite::escape(cfg_.node_id) + "\"";
  out += ",\"stats\":" + global_stats().to_json();
  out += ",\"tasks\":" + distributor_.to_json();
  out += ",\"offline\":" + drain_status_to_json(queue_.drain_status());
  out += ",\"router\":" + router_.to_json();
  out += "}";
  return out;
}

bool Coordinator::poll_inbound(std::chrono::milliseconds timeout) {
  std::optional<Message> msg = transport_.receive(timeout);
  if (!msg) return false;
  if (!msg->to.empty() && msg->to != cfg_.node_id) {
    log_warning("coordinator", "dropping inbound '" + msg->kind + "' addressed to " + msg->to);
    return true;
  }
  SendResult r = handle(*msg);
  std::optional<jsonlite::JsonError> err;
  auto reply = jsonlite::parse(r.reply, &err);
  if (err || jsonlite::get_string(reply, "status") != "ok") {
    log_warning("coordinator", "inbound '" + msg->kind + "' from " + msg->from + " failed: " + r.reply);
  }
  return true;
}

void Coordinator::inbound_loop() {
  while (!inbound_stopping_.load()) poll_inbound(std::chrono::milliseconds(50));
}

SendResult Coordinator::handle(const Message& msg) {
  SendResult r;
  r.delivered = true;
  if (msg.kind == "probe") {
    r.reply = "{\"status\":\"ok\"}";
    return r;
  }
  if (msg.kind == "sync_apply") {
    if (!initialized_) {
      r.reply = error_reply(ErrorCode::not_ready, "coordinator not initialized");
      return r;
    }
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(msg.body, &err);
    OfflineOperation op;
    Status st = err ? Status::failure(ErrorCode::invalid_argument, err->message)
                    : op_from_object(obj, &op);
    if (!st.ok) {
      r.reply = error_reply(ErrorCode::invalid_argument, st.detail);
      return r;
    }
    r.reply = apply_reply(sync_.apply(op, clock_() + cfg_.offline.replay_timeout_ms));
    return r;
  }
  if (msg.kind == "heartbeat") {
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(msg.body, &err);
    NodeMetrics m;
    m.cpu_pct = jsonlite::get_double(obj, "cpu_pct");
    m.mem_pct = jsonlite::get_double(obj, "mem_pct");
    Status st = err ? Status::failure(ErrorCode::invalid_argument, err->message)
                    : registry_.heartbeat(msg.from, m);
    r.reply = st.ok ? "{\"status\":\"ok\"}" : error_reply(st.code, st.detail);
    return r;
  }
  r.reply = error_reply(ErrorCode::invalid_argument, "unsupported message kind '" + msg.kind + "'");
  return r;
}

}  // namespace tether
