#include "tether/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "tether/jsonlite.hpp"

namespace tether {

namespace {

inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<EventHook> g_event_hook{nullptr};

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += ",\"p99_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// CoordinatorStats
// ---------------------------------------------------------------------------

void CoordinatorStats::record_event(const CoordinationEvent& ev) {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (!ev.ok && ev.code != ErrorCode::none) {
    ++failure_categories_[to_string(ev.code)];
  }
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
}

std::vector<CoordinationEvent> CoordinatorStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Oldest first.
  std::vector<CoordinationEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % kMaxRecentEvents]);
  }
  return out;
}

uint64_t CoordinatorStats::failures_for(ErrorCode code) const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  auto it = failure_categories_.find(to_string(code));
  return it == failure_categories_.end() ? 0 : it->second;
}

std::string CoordinatorStats::to_json() const {
  auto n = [](const std::atomic<uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  std::string out;
  out.reserve(1024);
  out += "{\"registry\":{\"nodes_registered\":" + n(nodes_registered);
  out += ",\"nodes_deregistered\":" + n(nodes_deregistered);
  out += ",\"node_transitions\":" + n(node_transitions);
  out += ",\"probes_sent\":" + n(probes_sent);
  out += ",\"probe_misses\":" + n(probe_misses);
  out += ",\"probe_latency\":" + probe_latency.to_json();
  out += "},\"distributor\":{\"tasks_submitted\":" + n(tasks_submitted);
  out += ",\"tasks_deduplicated\":" + n(tasks_deduplicated);
  out += ",\"tasks_dispatched\":" + n(tasks_dispatched);
  out += ",\"tasks_succeeded\":" + n(tasks_succeeded);
  out += ",\"tasks_failed\":" + n(tasks_failed);
  out += ",\"task_retries\":" + n(task_retries);
  out += ",\"tasks_dead_lettered\":" + n(tasks_dead_lettered);
  out += ",\"tasks_cancelled\":" + n(tasks_cancelled);
  out += ",\"backpressure_signals\":" + n(backpressure_signals);
  out += ",\"dispatch_latency\":" + dispatch_latency.to_json();
  out += "},\"router\":{\"routes_resolved\":" + n(routes_resolved);
  out += ",\"route_failovers\":" + n(route_failovers);
  out += ",\"breaker_trips\":" + n(breaker_trips);
  out += "},\"sync\":{\"ops_enqueued\":" + n(ops_enqueued);
  out += ",\"ops_replayed\":" + n(ops_replayed);
  out += ",\"ops_applied\":" + n(ops_applied);
  out += ",\"ops_conflicted\":" + n(ops_conflicted);
  out += ",\"merges\":" + n(merges);
  out += ",\"pending_reviews\":" + n(pending_reviews);
  out += ",\"storage_halts\":" + n(storage_halts);
  out += ",\"replay_latency\":" + replay_latency.to_json();
  out += "},\"failure_categories\":{";
  {
    std::lock_guard<std::mutex> lk(ring_mu_);
    bool first = true;
    for (const auto& [code, count] : failure_categories_) {
      if (!first) out += ",";
      first = false;
      out += "\"" + code + "\":" + std::to_string(count);
    }
  }
  out += "}}";
  return out;
}

CoordinatorStats& global_stats() {
  static CoordinatorStats inst;
  return inst;
}

// ---------------------------------------------------------------------------
// Emission
// ---------------------------------------------------------------------------

void set_event_hook(EventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

std::string event_to_json(const CoordinationEvent& ev) {
  jsonlite::Object o;
  o["kind"]        = ev.kind;
  o["component"]   = ev.component;
  o["subject"]     = ev.subject;
  o["detail"]      = ev.detail;
  o["ok"]          = ev.ok;
  o["error_code"]  = to_string(ev.code);
  o["duration_ns"] = ev.duration_ns;
  o["at_ms"]       = ev.at_ms;
  return jsonlite::to_json(o);
}

void emit_event(const CoordinationEvent& ev) {
  global_stats().record_event(ev);

  EventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("TETHER_EVENT_LOG");
  if (!log_path || !log_path[0]) return;
  std::string line = event_to_json(ev);
  line += '\n';
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

void log_warning(std::string_view component, const std::string& message) {
  std::fprintf(stderr, "[tether:%.*s] %s\n", static_cast<int>(component.size()),
               component.data(), message.c_str());
}

}  // namespace tether
