#include "tether/health_monitor.hpp"

#include <chrono>

#include "tether/jsonlite.hpp"
#include "tether/observability.hpp"

namespace tether {

HealthMonitor::HealthMonitor(WorkerRegistry& registry, ITransport* transport, HealthConfig cfg,
                             std::string self_id, Clock clock)
    : registry_(registry),
      transport_(transport),
      cfg_(cfg),
      self_id_(std::move(self_id)),
      clock_(std::move(clock)) {}

HealthMonitor::~HealthMonitor() { stop(); }

bool HealthMonitor::probe_node(const std::string& node_id, uint64_t* latency_us) {
  Message msg;
  msg.kind           = "probe";
  msg.from           = self_id_;
  msg.to             = node_id;
  msg.correlation_id = std::to_string(++probe_seq_);
  msg.body           = "{\"seq\":" + msg.correlation_id + "}";

  global_stats().probes_sent.fetch_add(1, std::memory_order_relaxed);
  SendResult r = transport_->send(node_id, msg, std::chrono::milliseconds(cfg_.probe_timeout_ms));
  *latency_us = r.latency_us;
  if (!r.delivered) return false;
  global_stats().probe_latency.record(r.latency_us * 1000u);
  if (r.reply.empty()) return true;
  std::optional<jsonlite::JsonError> err;
  auto reply = jsonlite::parse(r.reply, &err);
  if (err) return false;
  return jsonlite::get_string(reply, "status", "ok") == "ok";
}

ProbeCycleReport HealthMonitor::probe_once() {
  ProbeCycleReport report;
  const uint64_t now = clock_();
  for (const auto& node : registry_.snapshot_all()) {
    const std::string& id = node.info.id;
    if (id == self_id_) continue;
    ++report.probed;

    bool ok = false;
    uint64_t latency_us = 0;
    if (transport_) {
      ok = probe_node(id, &latency_us);
    } else {
      ok = now < node.last_heartbeat_ms + cfg_.heartbeat_interval_ms;
      if (ok) continue;  // a fresh heartbeat already reset the counters
    }

    if (ok) {
      ++report.succeeded;
    } else {
      ++report.missed;
      global_stats().probe_misses.fetch_add(1, std::memory_order_relaxed);
    }
    // The node may have been deregistered since the snapshot.
    Status st = registry_.record_probe(id, ok, latency_us);
    if (!st.ok && st.code != ErrorCode::unknown_node) {
      log_warning("health", "record_probe(" + id + ") failed: " + st.detail);
    }
  }
  report.expired = registry_.expire_ttl();
  return report;
}

void HealthMonitor::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable()) return;
  stopping_ = false;
  worker_ = std::thread([this] { worker_loop(); });
}

void HealthMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void HealthMonitor::worker_loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, std::chrono::milliseconds(cfg_.probe_interval_ms),
                   [this] { return stopping_.load(); });
      if (stopping_) return;
    }
    probe_once();
  }
}

}  // namespace tether
