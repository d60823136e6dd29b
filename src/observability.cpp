#include "symlinkio/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "symlinkio/jsonlite.hpp"

namespace symlinkio {

namespace {

// std::bit_width gives floor(log2(x)) + 1 in O(1) (BSR/CLZ).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<PlanningEventHook> g_event_hook{nullptr};

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
      // Midpoint of bucket i. Bucket 0 covers [0,1)us.
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
// PlannerStats
// ---------------------------------------------------------------------------

void PlannerStats::record(const PlanningEvent& ev) {
  if (!ev.ok) failures.fetch_add(1, std::memory_order_relaxed);

  if (ev.operation == "read_split") {
    splits_read.fetch_add(1, std::memory_order_relaxed);
    records_read.fetch_add(ev.records, std::memory_order_relaxed);
    read_latency.record(ev.duration_ns);
    return;
  }

  if (ev.operation == "content_summary") {
    summaries.fetch_add(1, std::memory_order_relaxed);
  } else {
    plans.fetch_add(1, std::memory_order_relaxed);
    splits_planned.fetch_add(ev.splits, std::memory_order_relaxed);
  }
  manifests_read.fetch_add(ev.manifests, std::memory_order_relaxed);
  targets_resolved.fetch_add(ev.targets, std::memory_order_relaxed);
  planning_latency.record(ev.duration_ns);
}

std::string PlannerStats::to_json() const {
  std::string out;
  out.reserve(512);
  auto field = [&out](const char* name, const std::atomic<uint64_t>& v, bool first = false) {
    if (!first) out += ',';
    out += '"';
    out += name;
    out += "\":";
    out += std::to_string(v.load(std::memory_order_relaxed));
  };
  out += '{';
  field("summaries", summaries, true);
  field("plans", plans);
  field("failures", failures);
  field("manifests_read", manifests_read);
  field("targets_resolved", targets_resolved);
  field("splits_planned", splits_planned);
  field("splits_read", splits_read);
  field("records_read", records_read);
  out += ",\"planning_latency\":";
  out += planning_latency.to_json();
  out += ",\"read_latency\":";
  out += read_latency.to_json();
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

PlannerStats& global_planner_stats() {
  static PlannerStats inst;
  return inst;
}

std::string event_to_json(const PlanningEvent& ev) {
  jsonlite::Object obj;
  obj["operation"] = ev.operation;
  obj["ok"] = ev.ok;
  obj["error_code"] = ev.error_code;
  if (!ev.error_detail.empty()) obj["error_detail"] = ev.error_detail;
  obj["input_paths"] = ev.input_paths;
  obj["manifests"] = ev.manifests;
  obj["targets"] = ev.targets;
  obj["splits"] = ev.splits;
  obj["total_bytes"] = ev.total_bytes;
  obj["records"] = ev.records;
  obj["duration_ns"] = ev.duration_ns;
  if (!ev.plan_digest.empty()) obj["plan_digest"] = ev.plan_digest;
  if (!ev.target_path.empty()) obj["target_path"] = ev.target_path;
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

void set_planning_event_hook(PlanningEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_planning_event(const PlanningEvent& ev) {
  global_planner_stats().record(ev);

  PlanningEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: SYMLINKIO_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("SYMLINKIO_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';
  // O_APPEND writes below PIPE_BUF are atomic on POSIX, so concurrent readers
  // closing on different threads do not interleave lines.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace symlinkio
