#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "tether/clock.hpp"
#include "tether/config.hpp"
#include "tether/coordinator.hpp"
#include "tether/entity.hpp"
#include "tether/hash.hpp"
#include "tether/health_monitor.hpp"
#include "tether/jsonlite.hpp"
#include "tether/merge.hpp"
#include "tether/observability.hpp"
#include "tether/offline_queue.hpp"
#include "tether/registry.hpp"
#include "tether/router.hpp"
#include "tether/scheduler.hpp"
#include "tether/store.hpp"
#include "tether/sync_engine.hpp"
#include "tether/transport.hpp"
#include "tether/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

std::string fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("tether_tests_" + name);
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir, ec);
  return dir.string();
}

std::vector<std::string> read_file_lines(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(ifs, line)) lines.push_back(line);
  return lines;
}

void write_file_lines(const std::string& path, const std::vector<std::string>& lines) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  for (const auto& l : lines) ofs << l << "\n";
}

tether::NodeInfo make_node(const std::string& id, uint32_t max_concurrency = 1,
                           std::set<std::string> caps = {},
                           tether::NodeRole role = tether::NodeRole::edge) {
  tether::NodeInfo n;
  n.id              = id;
  n.role            = role;
  n.address         = "inproc://" + id;
  n.capabilities    = std::move(caps);
  n.max_concurrency = max_concurrency;
  n.version         = tether::version::kSemver;
  return n;
}

tether::SendResult reply(const std::string& body) {
  return tether::SendResult{true, tether::ErrorCode::none, body, 0};
}

tether::SendResult ok_reply() { return reply("{\"status\":\"ok\",\"result\":\"done\"}"); }

tether::FieldDelta lww(const std::string& value) {
  tether::FieldDelta d;
  d.type   = tether::FieldType::lww;
  d.scalar = value;
  return d;
}

tether::FieldDelta counter(uint64_t value) {
  tether::FieldDelta d;
  d.type    = tether::FieldType::counter;
  d.counter = value;
  return d;
}

tether::FieldDelta members(std::set<std::string> items) {
  tether::FieldDelta d;
  d.type    = tether::FieldType::set;
  d.members = std::move(items);
  return d;
}

// A fully stamped operation, as it arrives at the authoritative node.
tether::OfflineOperation make_op(const std::string& origin, uint64_t seq, const std::string& entity,
                                 tether::OpKind kind, uint64_t ts,
                                 tether::VersionVector captured = {}) {
  tether::OfflineOperation op;
  op.id          = origin + ":" + std::to_string(seq);
  op.origin      = origin;
  op.entity_id   = entity;
  op.kind        = kind;
  op.sequence    = seq;
  op.logical_ts  = ts;
  op.captured_vv = std::move(captured);
  op.state       = tether::OpState::queued;
  return op;
}

// An unstamped write, as a client hands it to the offline queue.
tether::OfflineOperation draft(const std::string& entity, tether::OpKind kind,
                               std::map<std::string, tether::FieldDelta> delta) {
  tether::OfflineOperation op;
  op.entity_id = entity;
  op.kind      = kind;
  op.delta     = std::move(delta);
  return op;
}

tether::ApplyResult applied() {
  tether::ApplyResult r;
  r.ok    = true;
  r.state = tether::OpState::applied;
  return r;
}

tether::ApplyResult failed_with(tether::ErrorCode code, const std::string& detail) {
  tether::ApplyResult r;
  r.code   = code;
  r.detail = detail;
  return r;
}

std::optional<tether::Entity> load_entity(tether::SyncEngine& engine, const std::string& id) {
  std::optional<tether::Entity> e;
  tether::Status st = engine.load(id, &e);
  expect(st.ok, "load " + id + ": " + st.detail);
  return e;
}

// ============================================================================
// Phase 1: Hashing, canonical JSON, version vectors
// ============================================================================

void test_blake3_known_vectors() {
  expect(tether::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(tether::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "{\"id\":\"doc\"}";
  expect(tether::record_checksum(payload) == tether::blake3_hex("log:" + payload),
         "record checksum is the log: domain hash");
  expect(tether::record_checksum(payload) != tether::entity_digest(payload),
         "log and entity domains differ");
  expect(tether::journal_link(payload) != tether::idempotency_digest(payload),
         "journal and idempotency domains differ");
  expect(tether::hash_runtime_info().primitive == "blake3", "hash primitive reported");
}

void test_json_canonicalization() {
  std::optional<tether::jsonlite::JsonError> err;
  auto v = tether::jsonlite::parse_value("{\"b\":1,\"a\":[true,null,\"x\"]}", &err);
  expect(!err, "canonical input parses");
  expect(tether::jsonlite::to_json(v) == "{\"a\":[true,null,\"x\"],\"b\":1}", "keys sorted on output");
  expect(tether::jsonlite::validate_strict("{\"a\":1,\"a\":2}").has_value(), "duplicate keys rejected");
  expect(tether::jsonlite::validate_strict("{\"a\":1} trailing").has_value(), "trailing bytes rejected");
}

void test_version_vector_order() {
  tether::VersionVector a{{"n1", 2}, {"n2", 1}};
  tether::VersionVector b{{"n1", 2}, {"n2", 3}};
  tether::VersionVector c{{"n1", 3}};
  expect(tether::vv_compare(a, a) == tether::CausalOrder::equal, "vv equal");
  expect(tether::vv_compare(a, b) == tether::CausalOrder::before, "vv before");
  expect(tether::vv_compare(b, a) == tether::CausalOrder::after, "vv after");
  expect(tether::vv_compare(b, c) == tether::CausalOrder::concurrent, "vv concurrent");
  auto m = tether::vv_merge(b, c);
  expect(tether::vv_get(m, "n1") == 3 && tether::vv_get(m, "n2") == 3, "vv merge takes max");
  expect(tether::vv_get(m, "missing") == 0, "absent node reads as zero");
}

// ============================================================================
// Phase 2: Configuration
// ============================================================================

void test_config_defaults_valid() {
  auto cfg = tether::default_config();
  expect(!cfg.node_id.empty(), "default node id from hostname");
  auto v = tether::validate_config(cfg);
  expect(v.ok, "defaults validate");
  expect(!v.warnings.empty(), "missing sync route reported as a warning");
  expect(cfg.offline.max_queue_size == 10000, "default offline bound");
  expect(cfg.offline.retention_ms == 30ull * 24 * 60 * 60 * 1000, "default retention is 30 days");
}

void test_config_from_json() {
  tether::ConfigValidationResult r;
  auto cfg = tether::config_from_json(
      "{\"node_id\":\"edge-7\",\"role\":\"edge\","
      "\"health\":{\"miss_threshold_degraded\":2,\"miss_threshold_offline\":4},"
      "\"router\":{\"routes\":[{\"service\":\"sync\",\"policy\":\"cost-optimized\","
      "\"candidates\":[{\"node_id\":\"central\",\"tier\":\"cloud\",\"cost\":2.5}]}]},"
      "\"offline\":{\"authoritative_node\":\"central\",\"max_queue_size\":50}}",
      &r);
  expect(r.ok, "config parses");
  expect(cfg.node_id == "edge-7", "node id read");
  expect(cfg.health.miss_threshold_degraded == 2 && cfg.health.miss_threshold_offline == 4,
         "thresholds read");
  expect(cfg.router.routes.size() == 1, "one route");
  expect(cfg.router.routes[0].policy == tether::RoutePolicy::cost_optimized, "policy alias accepted");
  expect(cfg.router.routes[0].candidates[0].cost == 2.5, "candidate cost read");
  expect(cfg.offline.max_queue_size == 50, "offline bound read");
  expect(tether::validate_config(cfg).ok, "parsed config validates");

  tether::ConfigValidationResult bad;
  tether::config_from_json(
      "{\"router\":{\"routes\":[{\"service\":\"x\",\"policy\":\"random\",\"candidates\":[]}]}}", &bad);
  expect(!bad.ok, "unknown policy rejected");
}

void test_config_validation_errors() {
  auto cfg = tether::default_config();
  cfg.health.miss_threshold_offline = cfg.health.miss_threshold_degraded;
  expect(!tether::validate_config(cfg).ok, "offline threshold must exceed degraded threshold");

  cfg = tether::default_config();
  tether::RouteTemplate empty;
  empty.service = "sync";
  cfg.router.routes.push_back(empty);
  expect(!tether::validate_config(cfg).ok, "route without candidates rejected");

  cfg = tether::default_config();
  cfg.node_id.clear();
  expect(!tether::validate_config(cfg).ok, "empty node id rejected");
}

void test_config_env_overrides() {
  ::setenv("TETHER_MISS_DEGRADED", "4", 1);
  ::setenv("TETHER_NODE_ID", "edge-env", 1);
  auto cfg = tether::default_config();
  tether::apply_env_overrides(cfg);
  ::unsetenv("TETHER_MISS_DEGRADED");
  ::unsetenv("TETHER_NODE_ID");
  expect(cfg.health.miss_threshold_degraded == 4, "env overrides degraded threshold");
  expect(cfg.node_id == "edge-env", "env overrides node id");
}

// ============================================================================
// Phase 3: Worker registry and health monitor
// ============================================================================

void test_registry_errors() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  expect(reg.register_node(make_node("w1")).ok, "register w1");
  expect(reg.register_node(make_node("w1")).code == tether::ErrorCode::duplicate_node, "duplicate rejected");
  expect(reg.register_node(make_node("w2", 0)).code == tether::ErrorCode::invalid_argument,
         "zero concurrency rejected");
  expect(reg.heartbeat("ghost", {}).code == tether::ErrorCode::unknown_node, "unknown heartbeat");
  expect(reg.deregister_node("ghost").code == tether::ErrorCode::unknown_node, "unknown deregister");

  auto t = reg.poll_transition(std::chrono::milliseconds(0));
  expect(t.has_value() && t->node_id == "w1", "registration published on the channel");
  expect(t->cause == tether::TransitionCause::registered && t->to == tether::NodeStatus::online,
         "registration transition is offline->online");
}

void test_probe_miss_thresholds() {
  tether::ManualClock clock;
  tether::HealthConfig hc;
  tether::WorkerRegistry reg(hc, clock.source());
  tether::InProcessTransport transport;
  bool up = false;
  transport.attach("w1", [&up](const tether::Message&) {
    return tether::SendResult{up, tether::ErrorCode::none, "{\"status\":\"ok\"}", 0};
  });
  tether::HealthMonitor monitor(reg, &transport, hc, "coord", clock.source());
  expect(reg.register_node(make_node("w1")).ok, "register w1");

  monitor.probe_once();
  monitor.probe_once();
  expect(reg.status("w1") == tether::NodeStatus::online, "two misses keep the node online");
  monitor.probe_once();
  expect(reg.status("w1") == tether::NodeStatus::degraded, "third miss degrades");
  monitor.probe_once();
  expect(reg.status("w1") == tether::NodeStatus::degraded, "fourth miss stays degraded");
  auto report = monitor.probe_once();
  expect(report.missed == 1, "cycle reports the miss");
  expect(reg.status("w1") == tether::NodeStatus::offline, "fifth miss takes the node offline");

  up = true;
  report = monitor.probe_once();
  expect(report.succeeded == 1, "cycle reports the success");
  expect(reg.status("w1") == tether::NodeStatus::online, "successful probe restores online");
  expect(reg.snapshot("w1")->consecutive_misses == 0, "misses reset");

  auto ts = reg.recent_transitions();
  expect(ts.size() == 4, "four transitions recorded");
  expect(ts[1].to == tether::NodeStatus::degraded && ts[1].cause == tether::TransitionCause::probe_miss,
         "degrade caused by probe misses");
  expect(ts[2].from == tether::NodeStatus::degraded && ts[2].to == tether::NodeStatus::offline,
         "offline reached through degraded");
  expect(ts[3].cause == tether::TransitionCause::probe_success, "recovery caused by probe");
  expect(ts[3].epoch > ts[2].epoch, "epochs increase");
  expect(transport.sent_count("w1", "probe") == 6, "one probe per cycle");
}

void test_heartbeat_only_mode() {
  tether::ManualClock clock;
  tether::HealthConfig hc;
  hc.heartbeat_interval_ms = 100;
  tether::WorkerRegistry reg(hc, clock.source());
  tether::HealthMonitor monitor(reg, nullptr, hc, "coord", clock.source());
  expect(reg.register_node(make_node("w1")).ok, "register w1");

  monitor.probe_once();
  expect(reg.snapshot("w1")->consecutive_misses == 0, "fresh heartbeat counts as alive");
  clock.advance(100);
  for (int i = 0; i < 3; ++i) monitor.probe_once();
  expect(reg.status("w1") == tether::NodeStatus::degraded, "stale heartbeat degrades after 3 cycles");
  expect(reg.heartbeat("w1", tether::NodeMetrics{12.0, 40.0}).ok, "heartbeat accepted");
  expect(reg.status("w1") == tether::NodeStatus::online, "heartbeat restores online");
  expect(reg.snapshot("w1")->metrics.mem_pct == 40.0, "metrics recorded");
}

void test_hard_disconnect_and_ttl() {
  tether::ManualClock clock;
  tether::HealthConfig hc;
  hc.node_ttl_ms = 1000;
  tether::WorkerRegistry reg(hc, clock.source());
  expect(reg.register_node(make_node("w1")).ok, "register w1");
  expect(reg.mark_disconnected("w1").ok, "hard disconnect");
  expect(reg.status("w1") == tether::NodeStatus::offline, "disconnect skips degraded");
  expect(reg.mark_degraded("w1").ok, "mark_degraded on offline node");
  expect(reg.status("w1") == tether::NodeStatus::offline, "router failure never revives a node");

  clock.advance(999);
  expect(reg.expire_ttl().empty(), "not yet expired");
  clock.advance(1);
  auto removed = reg.expire_ttl();
  expect(removed.size() == 1 && removed[0] == "w1", "expired after ttl");
  expect(reg.size() == 0, "node removed");
  auto ts = reg.recent_transitions();
  expect(ts.back().cause == tether::TransitionCause::ttl_expired && ts.back().removed,
         "ttl removal published");
}

void test_slot_accounting_concurrent() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  expect(reg.register_node(make_node("w1", 100, {"cpu"})).ok, "register w1");
  expect(!reg.try_acquire_slot("w1", {"gpu"}), "missing capability refused");

  std::atomic<int> granted{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        if (reg.try_acquire_slot("w1", {"cpu"})) granted.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(granted.load() == 100, "exactly max_concurrency slots granted");
  expect(reg.snapshot("w1")->active == 100, "active count matches");
  reg.release_slot("w1");
  expect(reg.try_acquire_slot("w1", {}), "released slot reusable");
}

// ============================================================================
// Phase 4: Task distributor
// ============================================================================

void test_backoff_schedule() {
  expect(tether::backoff_delay_ms(0, 500, 30000) == 0, "no delay before first retry");
  expect(tether::backoff_delay_ms(1, 500, 30000) == 500, "first retry waits base");
  expect(tether::backoff_delay_ms(2, 500, 30000) == 1000, "second retry doubles");
  expect(tether::backoff_delay_ms(3, 500, 30000) == 2000, "third retry doubles again");
  expect(tether::backoff_delay_ms(10, 500, 30000) == 30000, "delay capped");
}

void test_idempotent_submit() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  transport.attach("w1", [](const tether::Message&) { return ok_reply(); });
  expect(reg.register_node(make_node("w1", 2)).ok, "register w1");
  tether::TaskDistributor dist(reg, transport, tether::SchedulerConfig{}, "coord", clock.source());

  tether::TaskSpec spec;
  spec.idempotency_key = "render-42";
  spec.kind            = "render";
  auto first = dist.submit(spec);
  expect(first.ok && !first.deduplicated, "first submit accepted");
  expect(first.code == tether::ErrorCode::none, "capacity available");
  for (int i = 0; i < 4; ++i) {
    auto again = dist.submit(spec);
    expect(again.ok && again.deduplicated && again.task_id == first.task_id, "resubmit deduplicated");
  }
  expect(dist.pump() == 1, "one assignment");
  expect(dist.pump() == 0, "nothing left");
  expect(dist.status(first.task_id) == tether::TaskStatus::succeeded, "task succeeded");
  expect(dist.task(first.task_id)->result == "done", "result recorded");

  auto late = dist.submit(spec);
  expect(late.deduplicated && late.task_id == first.task_id, "finished key still deduplicates");
  expect(dist.pump() == 0, "no second run");
  expect(transport.sent_count("w1", "dispatch") == 1, "exactly one dispatch");
}

void test_keyed_and_unkeyed_ids_disjoint() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  expect(reg.register_node(make_node("w1", 4)).ok, "register w1");
  tether::TaskDistributor dist(reg, transport, tether::SchedulerConfig{}, "coord", clock.source());

  tether::TaskSpec plain;
  plain.kind = "plain";
  auto unkeyed = dist.submit(plain);
  expect(unkeyed.ok, "unkeyed accepted");

  // A key spelled like the internal sequence source must not alias task 1.
  tether::TaskSpec keyed;
  keyed.kind            = "keyed";
  keyed.idempotency_key = "coord#1";
  auto k = dist.submit(keyed);
  expect(k.ok && !k.deduplicated, "keyed accepted as new task");
  expect(k.task_id != unkeyed.task_id, "distinct task ids");
  expect(dist.task(k.task_id)->kind == "keyed", "caller sees its own task");
  expect(dist.task(unkeyed.task_id)->kind == "plain", "unkeyed task intact");

  auto a = dist.assign_once();
  expect(a.size() == 2, "two assignments");
  expect(a[0].task_id != a[1].task_id, "each task assigned once");
  expect(a[0].attempt == 1 && a[1].attempt == 1, "first attempt for both");
  expect(reg.snapshot("w1")->active == 2, "one slot per task");
}

void test_priority_order() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  transport.attach("w1", [](const tether::Message&) { return ok_reply(); });
  expect(reg.register_node(make_node("w1", 1)).ok, "register w1");
  tether::TaskDistributor dist(reg, transport, tether::SchedulerConfig{}, "coord", clock.source());

  tether::TaskSpec busy;
  busy.kind = "busy";
  expect(dist.submit(busy).code == tether::ErrorCode::none, "busy task accepted");
  auto held = dist.assign_once();
  expect(held.size() == 1, "busy task holds the only slot");

  tether::TaskSpec low;
  low.kind     = "low";
  low.priority = 5;
  auto low_r = dist.submit(low);
  expect(low_r.ok && low_r.code == tether::ErrorCode::capacity_exhausted, "backpressure signalled");
  tether::TaskSpec high;
  high.kind     = "high";
  high.priority = 10;
  auto high_r = dist.submit(high);
  expect(high_r.ok, "high queued");
  expect(dist.assign_once().empty(), "no free slot");

  dist.execute(held[0]);
  auto next = dist.assign_once();
  expect(next.size() == 1 && next[0].task_id == high_r.task_id, "priority 10 dispatched first");
  expect(dist.status(low_r.task_id) == tether::TaskStatus::queued, "priority 5 still queued");
}

void test_least_loaded_and_capabilities() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  expect(reg.register_node(make_node("w1", 4)).ok, "register w1");
  expect(reg.register_node(make_node("w2", 2, {"gpu"})).ok, "register w2");
  tether::TaskDistributor dist(reg, transport, tether::SchedulerConfig{}, "coord", clock.source());

  tether::TaskSpec plain;
  plain.kind = "plain";
  for (int i = 0; i < 3; ++i) dist.submit(plain);
  tether::TaskSpec gpu;
  gpu.kind                  = "train";
  gpu.required_capabilities = {"gpu"};
  dist.submit(gpu);
  tether::TaskSpec tpu;
  tpu.kind                  = "tpu";
  tpu.required_capabilities = {"tpu"};
  expect(dist.submit(tpu).code == tether::ErrorCode::capacity_exhausted, "no node offers tpu");

  auto a = dist.assign_once();
  expect(a.size() == 4, "four assignable tasks");
  expect(a[0].node_id == "w1" && a[1].node_id == "w2" && a[2].node_id == "w1",
         "plain tasks spread by load ratio");
  expect(a[3].node_id == "w2", "gpu task lands on the gpu node");
  expect(reg.snapshot("w1")->active == 2 && reg.snapshot("w2")->active == 2, "slots held");
}

void test_retry_backoff_dead_letter() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  transport.attach("w1", [](const tether::Message&) {
    return tether::SendResult{false, tether::ErrorCode::transient_network, "", 0};
  });
  expect(reg.register_node(make_node("w1")).ok, "register w1");
  tether::TaskDistributor dist(reg, transport, tether::SchedulerConfig{}, "coord", clock.source());

  tether::TaskSpec spec;
  spec.kind = "flaky";
  auto r = dist.submit(spec);
  expect(dist.pump() == 1, "first attempt");
  auto snap = dist.task(r.task_id);
  expect(snap->status == tether::TaskStatus::queued && snap->retry_count == 1, "requeued for retry");
  expect(snap->next_eligible_ms == clock.now() + 500, "first backoff is base");
  expect(dist.pump() == 0, "not eligible during backoff");
  expect(reg.snapshot("w1")->active == 0, "slot released on failure");

  for (uint64_t wait : {500ull, 1000ull, 2000ull}) {
    clock.advance(wait);
    expect(dist.pump() == 1, "retry dispatched after backoff");
  }
  snap = dist.task(r.task_id);
  expect(snap->status == tether::TaskStatus::dead_lettered, "dead-lettered after max retries");
  expect(snap->retry_count == 3, "three retries recorded");
  expect(snap->last_error == tether::ErrorCode::transient_network, "last error kept");
  expect(dist.dead_letters().size() == 1, "dead letter queue holds it");
  expect(transport.sent_count("w1", "dispatch") == 4, "one attempt plus three retries");
}

void test_permanent_failure_not_retried() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  transport.attach("w1", [](const tether::Message&) {
    return reply("{\"status\":\"permanent_failure\",\"result\":\"bad input\"}");
  });
  expect(reg.register_node(make_node("w1")).ok, "register w1");
  tether::TaskDistributor dist(reg, transport, tether::SchedulerConfig{}, "coord", clock.source());

  tether::TaskSpec spec;
  spec.kind = "parse";
  auto r = dist.submit(spec);
  dist.pump();
  auto snap = dist.task(r.task_id);
  expect(snap->status == tether::TaskStatus::failed, "task failed");
  expect(snap->last_error == tether::ErrorCode::permanent_task_failure, "permanent failure code");
  expect(snap->result == "bad input", "failure detail kept");
  clock.advance(60000);
  expect(dist.pump() == 0, "no retry");
  expect(transport.sent_count("w1", "dispatch") == 1, "single dispatch");
}

void test_cancel_paths() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  transport.attach("w1", [](const tether::Message&) { return ok_reply(); });
  tether::TaskDistributor dist(reg, transport, tether::SchedulerConfig{}, "coord", clock.source());

  tether::TaskSpec spec;
  spec.kind = "job";
  auto queued = dist.submit(spec);
  expect(dist.cancel(queued.task_id).ok, "queued task cancelled");
  expect(dist.status(queued.task_id) == tether::TaskStatus::cancelled, "status cancelled");
  expect(dist.cancel(queued.task_id).code == tether::ErrorCode::invalid_argument, "terminal task refused");
  expect(dist.cancel("t-does-not-exist").code == tether::ErrorCode::unknown_task, "unknown task");

  expect(reg.register_node(make_node("w1")).ok, "register w1");
  auto assigned = dist.submit(spec);
  auto a = dist.assign_once();
  expect(a.size() == 1 && a[0].task_id == assigned.task_id, "task assigned");
  expect(dist.cancel(assigned.task_id).ok, "assigned task cancelled");
  expect(transport.sent_count("w1", "abort") == 1, "abort sent to the worker");
  expect(reg.snapshot("w1")->active == 0, "slot released");
  dist.execute(a[0]);
  expect(transport.sent_count("w1", "dispatch") == 0, "stale assignment not dispatched");
  expect(dist.status(assigned.task_id) == tether::TaskStatus::cancelled, "still cancelled");
}

void test_late_success_after_cancel_ignored() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  tether::TaskDistributor* dist_ptr = nullptr;
  transport.attach("w1", [&dist_ptr](const tether::Message& msg) {
    // The operator cancels while the worker is still running the task.
    if (msg.kind == "dispatch" && dist_ptr) dist_ptr->cancel(msg.correlation_id);
    return ok_reply();
  });
  expect(reg.register_node(make_node("w1")).ok, "register w1");
  tether::TaskDistributor dist(reg, transport, tether::SchedulerConfig{}, "coord", clock.source());
  dist_ptr = &dist;

  tether::TaskSpec spec;
  spec.kind = "slow";
  auto r = dist.submit(spec);
  expect(dist.pump() == 1, "dispatched");
  auto snap = dist.task(r.task_id);
  expect(snap->status == tether::TaskStatus::cancelled, "late success does not override cancel");
  expect(snap->result.empty(), "late result discarded");
  expect(transport.sent_count("w1", "abort") == 1, "abort delivered");
}

void test_deadline_dead_letter() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  tether::TaskDistributor dist(reg, transport, tether::SchedulerConfig{}, "coord", clock.source());

  tether::TaskSpec past;
  past.kind        = "late";
  past.deadline_ms = clock.now();
  auto rejected = dist.submit(past);
  expect(!rejected.ok && rejected.code == tether::ErrorCode::deadline_exceeded, "past deadline rejected");

  tether::TaskSpec spec;
  spec.kind        = "soon";
  spec.deadline_ms = clock.now() + 100;
  auto r = dist.submit(spec);
  expect(r.ok, "accepted");
  clock.advance(100);
  expect(dist.assign_once().empty(), "expired task not assigned");
  auto snap = dist.task(r.task_id);
  expect(snap->status == tether::TaskStatus::dead_lettered, "dead-lettered at deadline");
  expect(snap->last_error == tether::ErrorCode::deadline_exceeded, "deadline code");
}

void test_task_queue_full() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  tether::SchedulerConfig sc;
  sc.max_queued_tasks = 2;
  tether::TaskDistributor dist(reg, transport, sc, "coord", clock.source());
  tether::TaskSpec spec;
  spec.kind = "x";
  expect(dist.submit(spec).ok && dist.submit(spec).ok, "two accepted");
  auto third = dist.submit(spec);
  expect(!third.ok && third.code == tether::ErrorCode::queue_full, "third rejected");
  expect(dist.queued_count() == 2, "queue unchanged");
}

void test_node_loss_requeues() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  transport.attach("w2", [](const tether::Message&) { return ok_reply(); });
  tether::TaskDistributor dist(reg, transport, tether::SchedulerConfig{}, "coord", clock.source());
  reg.subscribe([&dist](const tether::NodeTransition& t) { dist.on_node_transition(t); });
  expect(reg.register_node(make_node("w1")).ok, "register w1");

  tether::TaskSpec spec;
  spec.kind = "job";
  auto r = dist.submit(spec);
  auto a = dist.assign_once();
  expect(a.size() == 1 && a[0].node_id == "w1", "assigned to w1");

  expect(reg.mark_disconnected("w1").ok, "w1 lost");
  auto snap = dist.task(r.task_id);
  expect(snap->status == tether::TaskStatus::queued, "task requeued");
  expect(snap->retry_count == 1 && snap->assigned_node.empty(), "counted as a retry");
  dist.execute(a[0]);
  expect(dist.status(r.task_id) == tether::TaskStatus::queued, "stale attempt ignored");

  expect(reg.register_node(make_node("w2")).ok, "register w2");
  clock.advance(500);
  expect(dist.pump() == 1, "retried");
  snap = dist.task(r.task_id);
  expect(snap->status == tether::TaskStatus::succeeded && snap->assigned_node == "w2", "finished on w2");
}

void test_priority_escalation() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  tether::SchedulerConfig sc;
  sc.max_wait_ms = 1000;
  tether::TaskDistributor dist(reg, transport, sc, "coord", clock.source());

  tether::TaskSpec old_spec;
  old_spec.kind = "old";
  auto old_task = dist.submit(old_spec);
  clock.advance(3000);
  tether::TaskSpec fresh;
  fresh.kind     = "fresh";
  fresh.priority = 2;
  dist.submit(fresh);
  expect(dist.task(old_task.task_id)->effective_priority == 3, "escalated one step per interval");

  expect(reg.register_node(make_node("w1")).ok, "register w1");
  auto a = dist.assign_once();
  expect(a.size() == 1 && a[0].task_id == old_task.task_id, "starved task goes first");
}

void test_background_dispatch() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  tether::InProcessTransport transport;
  transport.attach("w1", [](const tether::Message&) { return ok_reply(); });
  expect(reg.register_node(make_node("w1", 4)).ok, "register w1");
  tether::SchedulerConfig sc;
  sc.assign_interval_ms = 10;
  tether::TaskDistributor dist(reg, transport, sc, "coord", clock.source());
  dist.start();
  tether::TaskSpec spec;
  spec.kind = "bg";
  for (int i = 0; i < 5; ++i) dist.submit(spec);

  size_t done = 0;
  for (int i = 0; i < 300 && done < 5; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    auto c = dist.counts();
    done = c.contains(tether::TaskStatus::succeeded) ? c[tether::TaskStatus::succeeded] : 0;
  }
  dist.stop();
  expect(done == 5, "all tasks finished by the background loops");
  expect(transport.sent_count("w1", "dispatch") == 5, "each dispatched once");
}

// ============================================================================
// Phase 5: Connection router
// ============================================================================

tether::RouteCandidate candidate(const std::string& node, tether::Tier tier, double cost = 1.0) {
  tether::RouteCandidate c;
  c.node_id  = node;
  c.endpoint = "inproc://" + node;
  c.tier     = tier;
  c.cost     = cost;
  return c;
}

void test_local_first_fallback() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  for (const char* n : {"laptop", "edge-a", "cloud-a"}) expect(reg.register_node(make_node(n)).ok, "register");
  expect(reg.mark_disconnected("laptop").ok, "laptop offline");

  tether::RouterConfig rc;
  tether::RouteTemplate t;
  t.service    = "sync";
  t.policy     = tether::RoutePolicy::local_first;
  t.candidates = {candidate("laptop", tether::Tier::local), candidate("cloud-a", tether::Tier::cloud),
                  candidate("edge-a", tether::Tier::edge)};
  rc.routes.push_back(t);
  tether::ConnectionRouter router(reg, rc, clock.source());

  auto r = router.resolve("sync");
  expect(r.ok, "resolved");
  expect(r.candidates.size() == 2, "offline local node excluded");
  expect(r.candidates[0].candidate.node_id == "edge-a", "healthy edge promoted over cloud");
  expect(r.candidates[1].candidate.node_id == "cloud-a", "cloud as fallback");

  expect(reg.heartbeat("laptop", {}).ok, "laptop back");
  r = router.resolve("sync");
  expect(r.candidates.size() == 3 && r.candidates[0].candidate.node_id == "laptop", "local first again");
}

void test_resolve_errors() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  expect(reg.register_node(make_node("cloud-a")).ok, "register");
  tether::RouterConfig rc;
  tether::RouteTemplate t;
  t.service    = "api";
  t.candidates = {candidate("cloud-a", tether::Tier::cloud), candidate("never-seen", tether::Tier::edge)};
  rc.routes.push_back(t);
  tether::ConnectionRouter router(reg, rc, clock.source());

  expect(router.resolve("nope").code == tether::ErrorCode::unknown_service, "unknown service");
  expect(router.resolve("api").candidates.size() == 1, "unregistered candidate skipped");
  expect(reg.mark_disconnected("cloud-a").ok, "cloud offline");
  auto r = router.resolve("api");
  expect(!r.ok && r.code == tether::ErrorCode::no_healthy_candidate, "nothing healthy");
  auto ex = router.execute("api", [](const tether::RankedCandidate&) { return tether::Status::success(); });
  expect(!ex.ok && ex.attempts == 0, "execute makes no attempt without candidates");
}

void test_performance_and_cost_policies() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  for (const char* n : {"dear", "cheap", "mid"}) expect(reg.register_node(make_node(n)).ok, "register");
  expect(reg.record_probe("dear", true, 900).ok, "probe dear");
  expect(reg.record_probe("cheap", true, 500).ok, "probe cheap");
  expect(reg.record_probe("mid", true, 100).ok, "probe mid");

  tether::RouterConfig rc;
  tether::RouteTemplate t;
  t.service    = "infer";
  t.candidates = {candidate("dear", tether::Tier::cloud, 3.0), candidate("cheap", tether::Tier::cloud, 1.0),
                  candidate("mid", tether::Tier::cloud, 2.0)};
  rc.routes.push_back(t);
  tether::ConnectionRouter router(reg, rc, clock.source());

  auto perf = router.resolve("infer", tether::RoutePolicy::performance);
  expect(perf.candidates[0].candidate.node_id == "mid", "lowest latency first");
  expect(perf.candidates[2].candidate.node_id == "dear", "highest latency last");

  auto cost = router.resolve("infer", tether::RoutePolicy::cost_optimized);
  expect(cost.candidates[0].candidate.node_id == "cheap" && cost.candidates[1].candidate.node_id == "mid" &&
             cost.candidates[2].candidate.node_id == "dear",
         "ordered by cost");

  for (int i = 0; i < 4; ++i) expect(reg.record_probe("cheap", false, 0).ok, "cheap failing");
  cost = router.resolve("infer", tether::RoutePolicy::cost_optimized);
  expect(cost.candidates.back().candidate.node_id == "cheap", "unhealthy candidate demoted");
}

void test_performance_prefers_measured_online() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  for (const char* n : {"fresh", "slow", "fast"}) expect(reg.register_node(make_node(n)).ok, "register");
  expect(reg.record_probe("slow", true, 800).ok, "probe slow");
  expect(reg.record_probe("fast", true, 50).ok, "probe fast");

  tether::RouterConfig rc;
  tether::RouteTemplate t;
  t.service    = "infer";
  t.candidates = {candidate("fresh", tether::Tier::edge), candidate("slow", tether::Tier::edge),
                  candidate("fast", tether::Tier::edge)};
  rc.routes.push_back(t);
  tether::ConnectionRouter router(reg, rc, clock.source());

  auto perf = router.resolve("infer", tether::RoutePolicy::performance);
  expect(perf.candidates.size() == 3, "all candidates listed");
  expect(perf.candidates[0].candidate.node_id == "fast", "measured fast node first");
  expect(perf.candidates[2].candidate.node_id == "fresh", "unprobed node after measured ones");

  expect(reg.mark_degraded("fast").ok, "fast degraded");
  perf = router.resolve("infer", tether::RoutePolicy::performance);
  expect(perf.candidates[0].candidate.node_id == "slow", "online node outranks degraded one");
}

void test_circuit_breaker_states() {
  tether::CircuitBreaker cb(2, 1000);
  expect(cb.allow(0), "closed allows");
  expect(!cb.record_failure(0), "first failure does not trip");
  expect(cb.record_failure(0), "second failure trips");
  expect(cb.state(0) == tether::BreakerState::open, "open");
  expect(!cb.allow(500), "open refuses");
  expect(cb.state(1000) == tether::BreakerState::half_open, "half-open after cooldown");
  expect(cb.allow(1000), "one trial admitted");
  expect(!cb.allow(1000), "second trial refused");
  expect(cb.record_failure(1000), "failed trial reopens");
  expect(cb.state(1500) == tether::BreakerState::open, "open again");
  expect(cb.allow(2000), "next trial");
  cb.record_success();
  expect(cb.state(2000) == tether::BreakerState::closed && cb.consecutive_failures() == 0, "closed on success");
}

void test_router_failover_and_breaker() {
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  expect(reg.register_node(make_node("a")).ok && reg.register_node(make_node("b")).ok, "register");
  tether::RouterConfig rc;
  rc.breaker_failure_threshold = 2;
  rc.breaker_cooldown_ms       = 1000;
  tether::RouteTemplate t;
  t.service    = "sync";
  t.candidates = {candidate("a", tether::Tier::edge), candidate("b", tether::Tier::cloud)};
  rc.routes.push_back(t);
  tether::ConnectionRouter router(reg, rc, clock.source());

  std::map<std::string, bool> failing{{"a", true}, {"b", false}};
  auto attempt = [&failing](const tether::RankedCandidate& c) {
    return failing[c.candidate.node_id]
               ? tether::Status::failure(tether::ErrorCode::transient_network, "refused")
               : tether::Status::success();
  };

  auto ex = router.execute("sync", attempt);
  expect(ex.ok && ex.node_id == "b", "failed over to b");
  expect(ex.attempts == 2 && ex.failovers == 1, "one failover");
  expect(reg.status("a") == tether::NodeStatus::degraded, "failed candidate degraded");

  ex = router.execute("sync", attempt);
  expect(ex.ok && ex.node_id == "b", "second failover");
  expect(router.breaker_state("a") == tether::BreakerState::open, "breaker tripped");
  expect(router.resolve("sync").candidates.size() == 1, "open breaker excluded");

  ex = router.execute("sync", attempt);
  expect(ex.attempts == 1 && ex.node_id == "b", "a skipped while open");

  clock.advance(1000);
  expect(router.breaker_state("a") == tether::BreakerState::half_open, "half-open");
  expect(router.resolve("sync").candidates.size() == 2, "half-open candidate offered");
  failing["a"] = false;
  ex = router.execute("sync", attempt);
  expect(ex.ok && ex.node_id == "a", "trial succeeds");
  expect(router.breaker_state("a") == tether::BreakerState::closed, "breaker closed");

  std::optional<tether::jsonlite::JsonError> err;
  tether::jsonlite::parse(router.to_json(), &err);
  expect(!err, "router json well formed");
}

// ============================================================================
// Phase 6: Entity merge and sync engine
// ============================================================================

void test_field_merge_rules() {
  tether::FieldValue a;
  a.scalar = "from-a";
  a.stamp  = {5, "a"};
  tether::FieldValue b;
  b.scalar = "from-b";
  b.stamp  = {5, "b"};
  expect(tether::merge_field(a, b).scalar == "from-b", "stamp tie broken by node id");
  expect(tether::merge_field(b, a) == tether::merge_field(a, b), "lww commutes");

  tether::FieldValue c1;
  c1.type    = tether::FieldType::counter;
  c1.counter = 3;
  c1.stamp   = {9, "a"};
  tether::FieldValue c2 = c1;
  c2.counter = 7;
  c2.stamp   = {2, "b"};
  expect(tether::merge_field(c1, c2).counter == 7, "counter keeps max");

  tether::FieldValue s1;
  s1.type    = tether::FieldType::set;
  s1.members = {"x"};
  tether::FieldValue s2 = s1;
  s2.members = {"y"};
  expect(tether::merge_field(s1, s2).members == std::set<std::string>({"x", "y"}), "set union");

  tether::FieldValue mismatch = c1;
  mismatch.stamp = {10, "a"};
  expect(tether::merge_field(a, mismatch).type == tether::FieldType::counter, "type mismatch: greater stamp");
  expect(tether::merge_field(mismatch, a) == tether::merge_field(a, mismatch), "mismatch commutes");
}

void test_entity_json_roundtrip() {
  tether::Entity e;
  e.id = "doc";
  std::map<std::string, tether::FieldDelta> delta{
      {"title", lww("hello \"world\"")}, {"views", counter(3)}, {"tags", members({"a", "b"})}};
  tether::merge_delta(e.fields, delta, tether::WriteStamp{4, "edge-1"});
  e.vv             = {{"edge-1", 2}, {"central#merge", 1}};
  e.pending_review = {"edge-2:1"};
  tether::Entity back;
  expect(tether::entity_from_json(tether::entity_to_json(e), &back).ok, "decode");
  expect(back == e, "entity survives its snapshot encoding");
}

void test_concurrent_updates_commute() {
  auto op_a = make_op("a", 1, "doc", tether::OpKind::update, 5);
  op_a.delta = {{"title", lww("A")}, {"count", counter(3)}, {"tags", members({"x"})}};
  auto op_b = make_op("b", 1, "doc", tether::OpKind::update, 5);
  op_b.delta = {{"title", lww("B")}, {"count", counter(7)}, {"tags", members({"y"})}};

  tether::ManualClock clock;
  tether::MemoryStateStore s1;
  tether::MemoryStateStore s2;
  tether::SyncEngine e1(s1, "central", clock.source());
  tether::SyncEngine e2(s2, "central", clock.source());

  expect(e1.apply(op_a).strategy == tether::ResolutionStrategy::fast_forward, "first op fast-forwards");
  auto second = e1.apply(op_b);
  expect(second.ok && second.state == tether::OpState::resolved, "concurrent op resolved");
  expect(second.strategy == tether::ResolutionStrategy::field_merge, "field merge");
  expect(e2.apply(op_b).ok && e2.apply(op_a).ok, "reverse order applied");

  auto r1 = load_entity(e1, "doc");
  auto r2 = load_entity(e2, "doc");
  expect(r1 && r2 && *r1 == *r2, "both orders converge");
  expect(r1->fields.at("title").scalar == "B", "lww winner");
  expect(r1->fields.at("count").counter == 7, "counter max");
  expect(r1->fields.at("tags").members == std::set<std::string>({"x", "y"}), "set union");
  expect(tether::vv_get(r1->vv, "central#merge") == 1, "one merge recorded");
  expect(e1.journal().verify().entries == 1, "merge journaled");
}

void test_duplicate_and_fast_forward() {
  tether::ManualClock clock;
  tether::MemoryStateStore store;
  tether::SyncEngine engine(store, "central", clock.source());
  auto op1 = make_op("edge-1", 1, "doc", tether::OpKind::create, 1);
  op1.delta = {{"title", lww("v1")}};
  auto op2 = make_op("edge-1", 2, "doc", tether::OpKind::update, 2, {{"edge-1", 1}});
  op2.delta = {{"title", lww("v2")}};

  auto r1 = engine.apply(op1);
  expect(r1.ok && r1.state == tether::OpState::applied && !r1.duplicate, "first applied");
  auto again = engine.apply(op1);
  expect(again.ok && again.duplicate, "replay detected as duplicate");
  expect(again.revision == r1.revision, "duplicate leaves the entity untouched");
  auto r2 = engine.apply(op2);
  expect(r2.strategy == tether::ResolutionStrategy::fast_forward, "causal successor fast-forwards");
  expect(load_entity(engine, "doc")->fields.at("title").scalar == "v2", "successor wins");
  expect(engine.journal().verify().entries == 0, "no conflict journaled");

  auto bad = make_op("edge-1", 0, "doc", tether::OpKind::update, 3);
  expect(engine.apply(bad).code == tether::ErrorCode::invalid_argument, "sequence zero rejected");
}

void test_delete_vs_update_pending_review() {
  auto base = make_op("c", 1, "doc", tether::OpKind::create, 1);
  base.delta = {{"title", lww("base")}};
  auto del = make_op("a", 1, "doc", tether::OpKind::remove, 10, {{"c", 1}});
  auto upd = make_op("b", 1, "doc", tether::OpKind::update, 11, {{"c", 1}});
  upd.delta = {{"count", counter(5)}};

  tether::ManualClock clock;
  tether::MemoryStateStore s1;
  tether::MemoryStateStore s2;
  tether::SyncEngine e1(s1, "central", clock.source());
  tether::SyncEngine e2(s2, "central", clock.source());

  expect(e1.apply(base).ok && e1.apply(del).ok, "delete applied");
  expect(load_entity(e1, "doc")->deleted, "tombstone set");
  auto r = e1.apply(upd);
  expect(r.ok && r.state == tether::OpState::conflicted, "update after concurrent delete escalates");
  expect(r.code == tether::ErrorCode::conflict_unresolved, "conflict code");

  expect(e2.apply(base).ok && e2.apply(upd).ok, "update applied");
  auto r2 = e2.apply(del);
  expect(r2.state == tether::OpState::conflicted, "delete after concurrent update escalates");

  auto x1 = load_entity(e1, "doc");
  auto x2 = load_entity(e2, "doc");
  expect(*x1 == *x2, "pending state identical in both orders");
  expect(!x1->deleted && x1->pending_review == std::set<std::string>({"a:1"}), "delete held for review");

  expect(e1.resolve_pending("doc", tether::PendingDecision::keep).ok, "operator keeps");
  auto kept = load_entity(e1, "doc");
  expect(!kept->deleted && kept->pending_review.empty(), "review cleared");
  expect(kept->fields.at("count").counter == 5, "update survives");
  expect(e1.resolve_pending("doc", tether::PendingDecision::keep).code == tether::ErrorCode::invalid_argument,
         "nothing left to resolve");

  std::vector<std::string> settled;
  expect(e2.resolve_pending("doc", tether::PendingDecision::remove, &settled).ok, "operator deletes");
  expect(settled == std::vector<std::string>({"a:1"}), "settled op ids reported");
  auto removed = load_entity(e2, "doc");
  expect(removed->deleted && removed->deleted_by == "a:1", "tombstone restored");
  expect(e2.journal().verify().entries == 2, "escalation and decision journaled");
}

void test_remove_decision_uses_parked_delete() {
  tether::ManualClock clock;
  tether::MemoryStateStore store;
  tether::SyncEngine engine(store, "central", clock.source());
  auto base = make_op("c", 1, "doc", tether::OpKind::create, 1);
  base.delta = {{"title", lww("base")}};
  auto upd = make_op("b", 1, "doc", tether::OpKind::update, 5, {{"c", 1}});
  upd.delta = {{"title", lww("edited")}};
  expect(engine.apply(base).ok && engine.apply(upd).ok, "base and update applied");

  auto del = make_op("a", 1, "doc", tether::OpKind::remove, 10, {{"c", 1}});
  auto r = engine.apply(del);
  expect(r.state == tether::OpState::conflicted, "concurrent delete parked");
  auto late = make_op("z", 1, "doc", tether::OpKind::update, 12, {{"c", 1}});
  late.delta = {{"title", lww("late")}};
  auto lr = engine.apply(late, clock.now());
  expect(lr.strategy == tether::ResolutionStrategy::deadline_expired, "late update parked");
  auto parked = load_entity(engine, "doc");
  expect(parked->pending_review.size() == 2, "both ops pending");
  expect(parked->pending_delete == "a:1", "parked delete remembered");

  std::vector<std::string> settled;
  expect(engine.resolve_pending("doc", tether::PendingDecision::remove, &settled).ok, "operator deletes");
  auto removed = load_entity(engine, "doc");
  expect(removed->deleted, "tombstone set");
  expect(removed->deleted_by == "a:1", "tombstone names the delete, not the late update");
  expect(removed->deleted_stamp == tether::WriteStamp{10, "a"}, "delete stamp carried");
  expect(removed->pending_delete.empty(), "parked delete cleared");
  expect(settled.size() == 2, "both ops settled");
}

void test_deadline_expired_goes_pending() {
  tether::ManualClock clock;
  tether::MemoryStateStore store;
  tether::SyncEngine engine(store, "central", clock.source());
  auto op = make_op("edge-1", 1, "doc", tether::OpKind::create, 1);
  op.delta = {{"title", lww("late")}};
  auto r = engine.apply(op, clock.now());
  expect(r.ok && r.state == tether::OpState::conflicted, "expired replay parked");
  expect(r.strategy == tether::ResolutionStrategy::deadline_expired, "deadline strategy");
  auto e = load_entity(engine, "doc");
  expect(e->pending_review.contains("edge-1:1"), "op awaits review");
  expect(tether::vv_get(e->vv, "edge-1") == 0, "op not applied");
}

void test_storage_corrupt_halts() {
  tether::ManualClock clock;
  tether::MemoryStateStore store;
  tether::SyncEngine engine(store, "central", clock.source());
  auto op1 = make_op("edge-1", 1, "doc", tether::OpKind::create, 1);
  op1.delta = {{"title", lww("v1")}};
  expect(engine.apply(op1).ok, "applied");
  store.corrupt_entity("doc");

  auto op2 = make_op("edge-1", 2, "doc", tether::OpKind::update, 2, {{"edge-1", 1}});
  auto r = engine.apply(op2);
  expect(!r.ok && r.code == tether::ErrorCode::storage_corrupt, "corruption detected");
  expect(engine.halted() && !engine.halt_reason().empty(), "engine halted");

  auto other = make_op("edge-1", 3, "other", tether::OpKind::create, 3);
  expect(engine.apply(other).code == tether::ErrorCode::storage_corrupt, "halt blocks every write");
  engine.operator_reset();
  expect(!engine.halted(), "operator reset");
  expect(engine.apply(other).ok, "unaffected entity writable again");
}

void test_file_store_integrity() {
  const std::string dir = fresh_dir("store");
  tether::FileStateStore store(dir);
  expect(store.store_entity("doc", 0, "{\"v\":1}").ok, "first write");
  expect(store.store_entity("doc", 0, "{\"v\":2}").code == tether::ErrorCode::version_mismatch,
         "stale revision rejected");
  expect(store.store_entity("doc", 1, "{\"v\":2}").ok, "compare-and-swap write");
  std::optional<tether::EntityRecord> rec;
  expect(store.load_entity("doc", &rec).ok && rec && rec->body == "{\"v\":2}", "latest body");
  expect(rec->revision == 2, "revision advanced");
  expect(store.list_entities() == std::vector<std::string>({"doc"}), "entity listed");

  const std::string path = store.entity_path("doc");
  std::string content;
  {
    std::ifstream ifs(path, std::ios::binary);
    content.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  }
  content.back() = static_cast<char>(content.back() ^ 0x01);
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
  }
  auto st = store.load_entity("doc", &rec);
  expect(!st.ok && st.code == tether::ErrorCode::storage_corrupt, "flipped byte detected");
}

void test_journal_tamper_detected() {
  const std::string dir = fresh_dir("journal");
  tether::ManualClock clock;
  {
    tether::FileStateStore store(dir);
    tether::SyncEngine engine(store, "central", clock.source());
    for (const char* entity : {"doc-1", "doc-2"}) {
      auto a = make_op("a", 1, entity, tether::OpKind::update, 1);
      a.delta = {{"n", counter(1)}};
      auto b = make_op("b", 1, entity, tether::OpKind::update, 1);
      b.delta = {{"n", counter(2)}};
      expect(engine.apply(a).ok && engine.apply(b).ok, "concurrent pair applied");
    }
    auto v = engine.journal().verify();
    expect(v.ok && v.entries == 2, "chain intact");
    std::vector<tether::jsonlite::Object> entries;
    expect(engine.journal().entries(&entries).ok, "entries readable");
    expect(tether::jsonlite::get_string(entries[0], "strategy") == "field_merge", "strategy recorded");
    expect(tether::jsonlite::get_string(entries[0], "resolver") == "central", "resolver recorded");
  }

  tether::FileStateStore store(dir);
  auto lines = read_file_lines(store.journal_path());
  expect(lines.size() == 2, "two journal lines");
  const std::string needle = "\"resolver\":\"central\"";
  const size_t at = lines[0].find(needle);
  expect(at != std::string::npos, "resolver present");
  lines[0].replace(at, needle.size(), "\"resolver\":\"mallory\"");
  write_file_lines(store.journal_path(), lines);

  tether::SyncEngine engine(store, "central", clock.source());
  auto v = engine.journal().verify();
  expect(!v.ok && v.first_bad_seq == 2, "rewritten entry breaks the next link");
}

// ============================================================================
// Phase 7: Offline queue
// ============================================================================

tether::OfflineConfig offline_config() {
  tether::OfflineConfig oc;
  oc.authoritative_node = "central";
  return oc;
}

void test_enqueue_requires_recovery() {
  tether::ManualClock clock;
  tether::MemoryStateStore store;
  tether::OfflineQueueManager q(store, offline_config(), "edge-1", clock.source());
  auto early = q.enqueue(draft("doc", tether::OpKind::create, {{"title", lww("x")}}));
  expect(!early.ok && early.code == tether::ErrorCode::not_ready, "enqueue before recovery refused");
  expect(q.recover().ok, "recover empty log");

  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    auto r = q.enqueue(draft("doc", tether::OpKind::update, {{"n", counter(i + 1)}}));
    expect(r.ok && r.sequence == static_cast<uint64_t>(i + 1), "sequences increase from 1");
    ids.push_back(r.op_id);
  }
  expect(ids[1] == "edge-1:2", "op id is origin:sequence");
  auto ops = q.operations();
  expect(ops[0].captured_vv.empty(), "first op depends on nothing");
  expect(tether::vv_get(ops[1].captured_vv, "edge-1") == 1, "second op depends on the first");
  expect(ops[0].logical_ts < ops[1].logical_ts && ops[1].logical_ts < ops[2].logical_ts,
         "logical clock advances");
  expect(ops[2].state == tether::OpState::queued, "queued after capture");
  expect(q.enqueue(draft("", tether::OpKind::update, {})).code == tether::ErrorCode::invalid_argument,
         "entity id required");
}

void test_offline_queue_full() {
  tether::ManualClock clock;
  tether::MemoryStateStore store;
  auto oc = offline_config();
  oc.max_queue_size = 2;
  tether::OfflineQueueManager q(store, oc, "edge-1", clock.source());
  expect(q.recover().ok, "recover");
  expect(q.enqueue(draft("a", tether::OpKind::create, {})).ok, "first");
  expect(q.enqueue(draft("b", tether::OpKind::create, {})).ok, "second");
  auto r = q.enqueue(draft("c", tether::OpKind::create, {}));
  expect(!r.ok && r.code == tether::ErrorCode::queue_full, "bound enforced");

  q.drain_once([](const tether::OfflineOperation&) { return applied(); });
  expect(q.enqueue(draft("c", tether::OpKind::create, {})).ok, "applied entries free capacity");
}

void test_replay_survives_restart() {
  const std::string dir = fresh_dir("replay");
  tether::ManualClock clock;
  tether::MemoryStateStore central_store;
  tether::SyncEngine central(central_store, "central", clock.source());
  std::vector<tether::OfflineOperation> captured;

  {
    tether::FileStateStore store(dir);
    tether::OfflineQueueManager q(store, offline_config(), "edge-1", clock.source());
    expect(q.recover().ok, "recover");
    for (int i = 1; i <= 5; ++i) {
      auto kind = i == 1 ? tether::OpKind::create : tether::OpKind::update;
      auto r = q.enqueue(draft("doc", kind,
                               {{"title", lww("v" + std::to_string(i))},
                                {"edits", counter(static_cast<uint64_t>(i))},
                                {"tags", members({"t" + std::to_string(i)})}}));
      expect(r.ok, "captured offline");
    }
    captured = q.operations();

    // The third apply lands but its acknowledgement is lost.
    auto report = q.drain_once([&central](const tether::OfflineOperation& op) {
      auto r = central.apply(op);
      if (op.sequence == 3) return failed_with(tether::ErrorCode::transient_network, "ack lost");
      return r;
    });
    expect(report.ok, "transient failure is not a halt");
    expect(report.attempted == 3 && report.applied == 2, "stopped at the lost ack");
    expect(report.stalled_origins == std::vector<std::string>({"edge-1"}), "origin stalled");
    expect(q.operation("edge-1:4")->state == tether::OpState::queued, "later entries wait");

    // Simulate a crash while op 4 was in flight.
    tether::jsonlite::Object rec;
    rec["type"]  = "state";
    rec["id"]    = "edge-1:4";
    rec["state"] = "replaying";
    rec["at"]    = clock.now();
    rec["error"] = "";
    rec["sum"]   = tether::record_checksum(tether::jsonlite::to_json(tether::jsonlite::Value{rec}));
    expect(store.append_log(tether::jsonlite::to_json(tether::jsonlite::Value{rec})).ok, "in-flight marker");
  }

  tether::FileStateStore store(dir);
  tether::OfflineQueueManager q(store, offline_config(), "edge-1", clock.source());
  expect(q.recover().ok, "recover after restart");
  expect(q.operation("edge-1:2")->state == tether::OpState::applied, "applied state persisted");
  expect(q.operation("edge-1:4")->state == tether::OpState::queued, "interrupted replay requeued");
  auto report = q.drain_once([&central](const tether::OfflineOperation& op) { return central.apply(op); });
  expect(report.ok && report.attempted == 3 && report.applied == 3, "remaining entries replayed");
  expect(q.drain_status().unapplied == 0, "queue drained");

  tether::MemoryStateStore ref_store;
  tether::SyncEngine reference(ref_store, "central", clock.source());
  for (const auto& op : captured) expect(reference.apply(op).ok, "reference apply");
  auto got  = load_entity(central, "doc");
  auto want = load_entity(reference, "doc");
  expect(got && want && *got == *want, "restart mid-replay matches sequential application");
  expect(got->fields.at("title").scalar == "v5", "last write wins");
  expect(tether::vv_get(got->vv, "edge-1") == 5, "all five applied once");
}

void test_offline_log_checksum_mismatch() {
  const std::string dir = fresh_dir("checksum");
  tether::ManualClock clock;
  {
    tether::FileStateStore store(dir);
    tether::OfflineQueueManager q(store, offline_config(), "edge-1", clock.source());
    expect(q.recover().ok, "recover");
    expect(q.enqueue(draft("doc", tether::OpKind::create, {{"title", lww("a")}})).ok, "first");
    expect(q.enqueue(draft("doc", tether::OpKind::update, {{"title", lww("b")}})).ok, "second");
  }

  tether::FileStateStore store(dir);
  auto lines = read_file_lines(store.log_path());
  expect(lines.size() == 3, "header plus two records");
  const std::string needle = "\"entity\":\"doc\"";
  const size_t at = lines[2].find(needle);
  expect(at != std::string::npos, "entity field present");
  lines[2].replace(at, needle.size(), "\"entity\":\"dox\"");
  write_file_lines(store.log_path(), lines);

  tether::OfflineQueueManager q(store, offline_config(), "edge-1", clock.source());
  auto st = q.recover();
  expect(!st.ok && st.code == tether::ErrorCode::storage_corrupt, "tampered record refused");
  expect(st.detail.find("line 3") != std::string::npos, "offending line named");
  expect(q.enqueue(draft("doc", tether::OpKind::update, {})).code == tether::ErrorCode::not_ready,
         "queue stays closed");
}

void test_torn_tail_dropped() {
  const std::string dir = fresh_dir("torn");
  tether::ManualClock clock;
  {
    tether::FileStateStore store(dir);
    tether::OfflineQueueManager q(store, offline_config(), "edge-1", clock.source());
    expect(q.recover().ok, "recover");
    expect(q.enqueue(draft("doc", tether::OpKind::create, {})).ok, "captured");
    std::ofstream ofs(store.log_path(), std::ios::binary | std::ios::app);
    ofs << "{\"type\":\"op\",\"op\":{\"id\":";
  }
  tether::FileStateStore store(dir);
  tether::OfflineQueueManager q(store, offline_config(), "edge-1", clock.source());
  expect(q.recover().ok, "unacknowledged tail ignored");
  expect(q.operations().size() == 1, "acknowledged record kept");
  auto r = q.enqueue(draft("doc", tether::OpKind::update, {}));
  expect(r.ok && r.sequence == 2, "append continues after the torn tail");

  tether::OfflineQueueManager again(store, offline_config(), "edge-1", clock.source());
  expect(again.recover().ok && again.operations().size() == 2, "log readable after the repair");
}

void test_compaction_keeps_sequences() {
  tether::ManualClock clock;
  tether::MemoryStateStore store;
  auto oc = offline_config();
  oc.retention_ms = 1000;
  {
    tether::OfflineQueueManager q(store, oc, "edge-1", clock.source());
    expect(q.recover().ok, "recover");
    for (int i = 0; i < 3; ++i) expect(q.enqueue(draft("doc", tether::OpKind::update, {})).ok, "enqueue");
    auto report = q.drain_once([](const tether::OfflineOperation&) { return applied(); });
    expect(report.applied == 3, "drained");
    clock.advance(1000);
    expect(q.enqueue(draft("doc", tether::OpKind::update, {})).sequence == 4, "fourth captured");
    auto c = q.compact();
    expect(c.ok && c.removed == 3 && c.kept == 1, "applied entries past retention removed");
  }
  tether::OfflineQueueManager q(store, oc, "edge-1", clock.source());
  expect(q.recover().ok, "recover compacted log");
  expect(q.operations().size() == 1, "one entry left");
  auto r = q.enqueue(draft("doc", tether::OpKind::update, {}));
  expect(r.sequence == 5 && r.op_id == "edge-1:5", "sequence continues past compacted entries");
}

void test_drain_halts_on_storage_corrupt() {
  tether::ManualClock clock;
  tether::MemoryStateStore store;
  tether::OfflineQueueManager q(store, offline_config(), "edge-1", clock.source());
  expect(q.recover().ok, "recover");
  expect(q.enqueue(draft("doc", tether::OpKind::create, {})).ok, "enqueue");
  auto report = q.drain_once([](const tether::OfflineOperation&) {
    return failed_with(tether::ErrorCode::storage_corrupt, "digest mismatch");
  });
  expect(!report.ok && report.code == tether::ErrorCode::storage_corrupt, "drain halted");
  auto status = q.drain_status();
  expect(status.halted && status.last_error == tether::ErrorCode::storage_corrupt, "halt visible");
  auto again = q.drain_once([](const tether::OfflineOperation&) { return applied(); });
  expect(!again.ok && again.attempted == 0, "no replay while halted");
}

void test_stalled_origin_does_not_block_others() {
  tether::ManualClock clock;
  tether::MemoryStateStore store;
  tether::OfflineQueueManager q(store, offline_config(), "relay", clock.source());
  expect(q.recover().ok, "recover");
  for (const char* origin : {"a", "b", "a", "b"}) {
    auto op   = draft("doc", tether::OpKind::update, {});
    op.origin = origin;
    expect(q.enqueue(op).ok, "enqueue");
  }
  auto report = q.drain_once([](const tether::OfflineOperation& op) {
    if (op.id == "a:1") return failed_with(tether::ErrorCode::transient_network, "timeout");
    return applied();
  });
  expect(report.ok, "transient only");
  expect(report.attempted == 3 && report.applied == 2, "origin b drained");
  expect(report.stalled_origins == std::vector<std::string>({"a"}), "origin a stalled");
  expect(q.operation("a:2")->state == tether::OpState::queued, "a:2 not attempted out of order");
  expect(q.operation("b:2")->state == tether::OpState::applied, "b:2 applied");
}

void test_drain_trigger_on_reconnect() {
  tether::ManualClock clock;
  tether::MemoryStateStore store;
  tether::OfflineQueueManager q(store, offline_config(), "edge-1", clock.source());
  tether::NodeTransition t;
  t.node_id = "worker-9";
  t.from    = tether::NodeStatus::offline;
  t.to      = tether::NodeStatus::online;
  q.on_node_transition(t);
  expect(!q.take_drain_request(), "other nodes do not trigger a drain");
  t.node_id = "central";
  t.from    = tether::NodeStatus::degraded;
  q.on_node_transition(t);
  expect(!q.take_drain_request(), "degraded->online is not a reconnect");
  t.from = tether::NodeStatus::offline;
  q.on_node_transition(t);
  expect(q.take_drain_request(), "authoritative reconnect triggers a drain");
  expect(!q.take_drain_request(), "request consumed");
}

// ============================================================================
// Phase 8: Coordinator
// ============================================================================

tether::CoordinatorConfig node_config(const std::string& node_id) {
  tether::CoordinatorConfig cfg = tether::default_config();
  cfg.node_id                    = node_id;
  cfg.offline.authoritative_node = "central";
  return cfg;
}

void test_coordinator_lifecycle_errors() {
  tether::InProcessTransport transport;
  tether::MemoryStateStore store;
  auto bad = node_config("");
  tether::Coordinator broken(bad, transport, store);
  expect(broken.init().code == tether::ErrorCode::config_invalid, "invalid config refused");

  tether::Coordinator coord(node_config("edge-1"), transport, store);
  auto early = coord.write(draft("doc", tether::OpKind::create, {}));
  expect(!early.ok && early.code == tether::ErrorCode::not_ready, "write before init refused");
  expect(coord.init().ok, "init");
  expect(coord.registry().status("edge-1") == tether::NodeStatus::online, "self registered");
  expect(coord.deregister_node("edge-1").code == tether::ErrorCode::invalid_argument, "self protected");

  auto w = coord.write(draft("doc", tether::OpKind::create, {{"title", lww("x")}}));
  expect(w.ok && w.state == tether::OpState::queued, "no sync route: captured offline");
  expect(w.detail.find("unreachable") != std::string::npos, "reason reported");

  tether::Message probe;
  probe.kind = "probe";
  auto pr = coord.handle(probe);
  expect(pr.delivered && pr.reply == "{\"status\":\"ok\"}", "probe answered");
  tether::Message junk;
  junk.kind = "gossip";
  expect(coord.handle(junk).reply.find("invalid_argument") != std::string::npos, "unknown kind refused");

  std::optional<tether::jsonlite::JsonError> err;
  auto stats = tether::jsonlite::parse(coord.stats_json(), &err);
  expect(!err, "stats json well formed");
  expect(stats.contains("tasks") && stats.contains("offline") && stats.contains("router"), "stats sections");
}

void test_standalone_authoritative_write() {
  tether::ManualClock clock;
  tether::InProcessTransport transport;
  tether::MemoryStateStore store;
  tether::Coordinator central(node_config("central"), transport, store, clock.source());
  expect(central.init().ok, "init");
  auto w = central.write(draft("doc", tether::OpKind::create, {{"title", lww("hello")}}));
  expect(w.ok && w.state == tether::OpState::applied, "authoritative node applies locally");
  std::optional<tether::Entity> e;
  expect(central.load_entity("doc", &e).ok && e, "entity stored");
  expect(e->fields.at("title").scalar == "hello", "field written");
}

void test_operator_reset_resumes_writes() {
  const std::string dir = fresh_dir("reset");
  tether::ManualClock clock;
  tether::InProcessTransport transport;
  tether::FileStateStore store(dir);
  tether::Coordinator central(node_config("central"), transport, store, clock.source());
  expect(central.init().ok, "init");
  expect(central.write(draft("doc", tether::OpKind::create, {{"title", lww("v1")}})).state ==
             tether::OpState::applied,
         "first write applied");

  const std::string path = store.entity_path("doc");
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::app);
    ofs << "garbage";
  }
  auto bad = central.write(draft("doc", tether::OpKind::update, {{"title", lww("v2")}}));
  expect(bad.ok && bad.state == tether::OpState::queued, "write kept in the log");
  expect(bad.code == tether::ErrorCode::storage_corrupt, "corruption reported");
  expect(central.sync_engine().halted() && central.drain_status().halted, "both halted");

  auto blocked = central.write(draft("other", tether::OpKind::create, {{"title", lww("x")}}));
  expect(blocked.state == tether::OpState::queued, "unrelated entity waits while halted");

  // The operator moves the damaged snapshot aside, then lifts the halt.
  std::error_code ec;
  fs::remove(path, ec);
  expect(!ec, "corrupt snapshot removed");
  expect(central.operator_reset().ok, "operator reset");
  auto status = central.drain_status();
  expect(!status.halted && status.drain_requested, "queue unhalted with a drain requested");
  expect(!central.sync_engine().halted(), "sync engine unhalted");

  auto report = central.drain_now();
  expect(report.ok && report.applied == 2, "parked writes replayed");
  expect(central.drain_status().unapplied == 0, "log drained");
  std::optional<tether::Entity> e;
  expect(central.load_entity("other", &e).ok && e && e->fields.at("title").scalar == "x", "other written");
  expect(central.load_entity("doc", &e).ok && e && e->fields.at("title").scalar == "v2", "doc rewritten");
}

void test_offline_writes_replay_on_reconnect() {
  tether::ManualClock clock;
  tether::InProcessTransport transport;
  tether::MemoryStateStore central_store;
  tether::MemoryStateStore edge_store;

  tether::Coordinator central(node_config("central"), transport, central_store, clock.source());
  expect(central.init().ok, "central init");
  transport.attach("central", [&central](const tether::Message& m) { return central.handle(m); });

  auto edge_cfg = node_config("edge-1");
  tether::RouteTemplate sync;
  sync.service    = "sync";
  sync.candidates = {candidate("central", tether::Tier::cloud)};
  edge_cfg.router.routes.push_back(sync);
  tether::Coordinator edge(edge_cfg, transport, edge_store, clock.source());
  expect(edge.init().ok, "edge init");
  expect(edge.register_node(make_node("central", 4, {}, tether::NodeRole::cloud)).ok, "central known");

  transport.set_reachable("central", false);
  expect(edge.registry().mark_disconnected("central").ok, "link down");
  for (int i = 1; i <= 4; ++i) {
    auto op = draft("doc-" + std::to_string(i), tether::OpKind::create,
                    {{"title", lww("t" + std::to_string(i))}, {"rev", counter(1)}});
    if (i == 1) {
      tether::FollowUpTask f;
      f.kind                  = "reindex";
      f.payload               = "doc-1";
      f.required_capabilities = {"indexer"};
      op.follow_up            = f;
    }
    auto w = edge.write(op);
    expect(w.ok && w.state == tether::OpState::queued, "captured while disconnected");
  }
  expect(edge.drain_status().unapplied == 4, "four waiting");
  std::optional<tether::Entity> missing;
  expect(central.load_entity("doc-1", &missing).ok && !missing, "nothing reached central yet");

  transport.set_reachable("central", true);
  expect(edge.heartbeat("central", {}).ok, "link up");
  expect(edge.offline_queue().take_drain_request(), "reconnect requested a drain");
  auto report = edge.drain_now();
  expect(report.ok && report.applied == 4, "all four replayed");
  expect(transport.sent_count("central", "sync_apply") == 4, "one sync_apply per op");
  expect(edge.drain_status().unapplied == 0, "queue empty");

  tether::MemoryStateStore ref_store;
  tether::SyncEngine reference(ref_store, "central", clock.source());
  for (const auto& op : edge.offline_queue().operations()) expect(reference.apply(op).ok, "reference");
  for (int i = 1; i <= 4; ++i) {
    const std::string id = "doc-" + std::to_string(i);
    std::optional<tether::Entity> got;
    expect(central.load_entity(id, &got).ok && got, "replicated " + id);
    expect(*got == *load_entity(reference, id), id + " matches sequential application");
  }

  expect(edge.distributor().queued_count() == 1, "catch-up task queued");
  tether::TaskSpec again;
  again.idempotency_key = "catchup:edge-1:1";
  expect(edge.submit_task(again).deduplicated, "catch-up task keyed by op id");

  auto live = edge.write(draft("doc-5", tether::OpKind::create, {{"title", lww("online")}}));
  expect(live.ok && live.state == tether::OpState::applied, "online write applied immediately");
}

void test_pending_review_through_coordinator() {
  tether::ManualClock clock;
  tether::InProcessTransport transport;
  tether::MemoryStateStore store;
  tether::Coordinator central(node_config("central"), transport, store, clock.source());
  expect(central.init().ok, "init");

  auto base = make_op("c", 1, "doc", tether::OpKind::create, 1);
  base.delta = {{"title", lww("base")}};
  auto upd = make_op("b", 1, "doc", tether::OpKind::update, 2, {{"c", 1}});
  upd.delta = {{"title", lww("edited")}};
  auto del = make_op("a", 1, "doc", tether::OpKind::remove, 3, {{"c", 1}});
  expect(central.sync_engine().apply(base).ok && central.sync_engine().apply(upd).ok, "seeded");

  tether::Message m;
  m.kind = "sync_apply";
  m.from = "a";
  m.body = tether::jsonlite::to_json(tether::jsonlite::Value{tether::op_to_object(del)});
  auto r = central.handle(m);
  std::optional<tether::jsonlite::JsonError> err;
  auto body = tether::jsonlite::parse(r.reply, &err);
  expect(!err && tether::jsonlite::get_string(body, "state") == "conflicted", "remote delete parked");
  expect(tether::jsonlite::get_string(body, "strategy") == "pending_review", "pending review strategy");

  expect(central.resolve_pending("doc", tether::PendingDecision::remove).ok, "operator decision");
  std::optional<tether::Entity> e;
  expect(central.load_entity("doc", &e).ok && e->deleted, "delete confirmed");
  expect(central.resolve_pending("doc", tether::PendingDecision::keep).code ==
             tether::ErrorCode::invalid_argument,
         "no second decision");
}

std::mutex g_events_mu;
std::vector<tether::CoordinationEvent> g_events;

void capture_event(const tether::CoordinationEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

void test_inbound_heartbeat_delivered() {
  tether::ManualClock clock;
  tether::InProcessTransport transport;
  tether::MemoryStateStore store;
  tether::Coordinator central(node_config("central"), transport, store, clock.source());
  expect(central.init().ok, "init");
  expect(central.register_node(make_node("w1")).ok, "register w1");
  expect(central.registry().mark_disconnected("w1").ok, "w1 offline");

  expect(!central.poll_inbound(std::chrono::milliseconds(0)), "empty inbox times out");
  tether::Message hb;
  hb.kind = "heartbeat";
  hb.from = "w1";
  hb.to   = "central";
  hb.body = "{\"cpu_pct\":12.5,\"mem_pct\":40}";
  expect(transport.post(hb), "heartbeat posted");
  expect(central.poll_inbound(std::chrono::milliseconds(0)), "heartbeat taken");
  expect(central.registry().status("w1") == tether::NodeStatus::online, "w1 back online");

  tether::Message stray = hb;
  stray.to = "elsewhere";
  expect(central.registry().mark_disconnected("w1").ok, "w1 offline again");
  expect(transport.post(stray), "stray posted");
  expect(central.poll_inbound(std::chrono::milliseconds(0)), "stray consumed");
  expect(central.registry().status("w1") == tether::NodeStatus::offline, "misaddressed heartbeat ignored");

  central.start();
  expect(transport.post(hb), "heartbeat posted to running node");
  bool online = false;
  for (int i = 0; i < 200 && !online; ++i) {
    online = central.registry().status("w1") == tether::NodeStatus::online;
    if (!online) std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  central.stop();
  expect(online, "receive loop delivered the heartbeat");
}

void test_event_hook_and_stats() {
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    g_events.clear();
  }
  tether::set_event_hook(&capture_event);
  tether::ManualClock clock;
  tether::WorkerRegistry reg(tether::HealthConfig{}, clock.source());
  const uint64_t before = tether::global_stats().nodes_registered.load();
  expect(reg.register_node(make_node("w-events")).ok, "register");
  expect(reg.mark_disconnected("w-events").ok, "disconnect");
  tether::set_event_hook(nullptr);

  std::lock_guard<std::mutex> lk(g_events_mu);
  size_t transitions = 0;
  for (const auto& ev : g_events) {
    if (ev.kind == "node_transition" && ev.subject == "w-events") ++transitions;
  }
  expect(transitions == 2, "both transitions reported to the hook");
  expect(tether::global_stats().nodes_registered.load() == before + 1, "registration counted");
  expect(!tether::jsonlite::validate_strict(tether::global_stats().to_json()).has_value(),
         "stats json well formed");
}

}  // namespace

int main() {
  std::cout << "=== Tether Coordinator Test Suite ===\n";

  std::cout << "\n[Phase 1] Hashing, canonical JSON, version vectors\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("JSON canonicalization", test_json_canonicalization);
  run_test("version vector order", test_version_vector_order);

  std::cout << "\n[Phase 2] Configuration\n";
  run_test("defaults valid", test_config_defaults_valid);
  run_test("config from json", test_config_from_json);
  run_test("validation errors", test_config_validation_errors);
  run_test("env overrides", test_config_env_overrides);

  std::cout << "\n[Phase 3] Worker registry and health\n";
  run_test("registry errors", test_registry_errors);
  run_test("probe miss thresholds", test_probe_miss_thresholds);
  run_test("heartbeat-only mode", test_heartbeat_only_mode);
  run_test("hard disconnect and ttl", test_hard_disconnect_and_ttl);
  run_test("slot accounting (8 threads)", test_slot_accounting_concurrent);

  std::cout << "\n[Phase 4] Task distributor\n";
  run_test("backoff schedule", test_backoff_schedule);
  run_test("idempotent submit", test_idempotent_submit);
  run_test("keyed and unkeyed ids disjoint", test_keyed_and_unkeyed_ids_disjoint);
  run_test("priority order", test_priority_order);
  run_test("least loaded + capabilities", test_least_loaded_and_capabilities);
  run_test("retry, backoff, dead letter", test_retry_backoff_dead_letter);
  run_test("permanent failure not retried", test_permanent_failure_not_retried);
  run_test("cancel paths", test_cancel_paths);
  run_test("late success after cancel", test_late_success_after_cancel_ignored);
  run_test("deadline dead letter", test_deadline_dead_letter);
  run_test("task queue full", test_task_queue_full);
  run_test("node loss requeues", test_node_loss_requeues);
  run_test("priority escalation", test_priority_escalation);
  run_test("background dispatch", test_background_dispatch);

  std::cout << "\n[Phase 5] Connection router\n";
  run_test("local-first fallback", test_local_first_fallback);
  run_test("resolve errors", test_resolve_errors);
  run_test("performance + cost policies", test_performance_and_cost_policies);
  run_test("performance prefers measured online", test_performance_prefers_measured_online);
  run_test("circuit breaker states", test_circuit_breaker_states);
  run_test("failover and breaker", test_router_failover_and_breaker);

  std::cout << "\n[Phase 6] Merge and sync engine\n";
  run_test("field merge rules", test_field_merge_rules);
  run_test("entity json roundtrip", test_entity_json_roundtrip);
  run_test("concurrent updates commute", test_concurrent_updates_commute);
  run_test("duplicate and fast-forward", test_duplicate_and_fast_forward);
  run_test("delete vs update pending review", test_delete_vs_update_pending_review);
  run_test("remove decision uses parked delete", test_remove_decision_uses_parked_delete);
  run_test("deadline expired goes pending", test_deadline_expired_goes_pending);
  run_test("storage corruption halts", test_storage_corrupt_halts);
  run_test("file store integrity", test_file_store_integrity);
  run_test("journal tamper detected", test_journal_tamper_detected);

  std::cout << "\n[Phase 7] Offline queue\n";
  run_test("enqueue requires recovery", test_enqueue_requires_recovery);
  run_test("offline queue full", test_offline_queue_full);
  run_test("replay survives restart", test_replay_survives_restart);
  run_test("offline log checksum mismatch", test_offline_log_checksum_mismatch);
  run_test("torn tail dropped", test_torn_tail_dropped);
  run_test("compaction keeps sequences", test_compaction_keeps_sequences);
  run_test("drain halts on storage corruption", test_drain_halts_on_storage_corrupt);
  run_test("stalled origin isolated", test_stalled_origin_does_not_block_others);
  run_test("drain trigger on reconnect", test_drain_trigger_on_reconnect);

  std::cout << "\n[Phase 8] Coordinator\n";
  run_test("lifecycle errors", test_coordinator_lifecycle_errors);
  run_test("standalone authoritative write", test_standalone_authoritative_write);
  run_test("operator reset resumes writes", test_operator_reset_resumes_writes);
  run_test("offline writes replay on reconnect", test_offline_writes_replay_on_reconnect);
  run_test("pending review through coordinator", test_pending_review_through_coordinator);
  run_test("inbound heartbeat delivered", test_inbound_heartbeat_delivered);
  run_test("event hook + stats", test_event_hook_and_stats);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
