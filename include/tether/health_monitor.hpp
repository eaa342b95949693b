#pragma once

// tether/health_monitor.hpp: Active liveness probing.
//
// Each cycle sends one "probe" message to every registered node through the
// transport, bounded by probe_timeout. The outcome feeds
// WorkerRegistry::record_probe(), which owns the state machine. After the
// probes the cycle expires nodes past their TTL.
//
// Without a transport the monitor runs in heartbeat-only mode: a node whose
// last heartbeat is older than heartbeat_interval accrues one miss per cycle.
//
// probe_once() is the single-step entry point; start() runs it every
// probe_interval on a background thread.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "tether/clock.hpp"
#include "tether/config.hpp"
#include "tether/registry.hpp"
#include "tether/transport.hpp"

namespace tether {

struct ProbeCycleReport {
  uint32_t probed{0};
  uint32_t succeeded{0};
  uint32_t missed{0};
  std::vector<std::string> expired;
};

class HealthMonitor {
 public:
  // transport may be nullptr (heartbeat-only mode).
  HealthMonitor(WorkerRegistry& registry, ITransport* transport, HealthConfig cfg,
                std::string self_id, Clock clock);
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  ProbeCycleReport probe_once();

  void start();
  void stop();
  bool running() const { return worker_.joinable(); }

 private:
  bool probe_node(const std::string& node_id, uint64_t* latency_us);
  void worker_loop();

  WorkerRegistry& registry_;
  ITransport*     transport_;
  HealthConfig    cfg_;
  std::string     self_id_;
  Clock           clock_;
  std::atomic<uint64_t> probe_seq_{0};

  std::thread             worker_;
  std::mutex              mu_;
  std::condition_variable cv_;
  std::atomic<bool>       stopping_{false};
};

}  // namespace tether
