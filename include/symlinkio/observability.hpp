#pragma once

// symlinkio/observability.hpp: structured planning/read observability.
//
// DESIGN:
//   PlanningEvent is the observable unit. Every get_content_summary(),
//   get_splits() and record reader close emits one event, which is:
//     - recorded in the global PlannerStats counters (always),
//     - handed to a registered hook if one is set, otherwise
//     - appended as one JSON line to the file named by SYMLINKIO_EVENT_LOG.
//
// Invariant: event emission never throws and never fails the operation that
// produced it. A log file that cannot be opened is skipped.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "symlinkio/types.hpp"

namespace symlinkio {

struct PlanningEvent {
  std::string operation;        // "content_summary", "get_splits", "read_split"
  bool ok{false};
  std::string error_code;       // to_string(ErrorCode), empty when ok
  std::string error_detail;

  uint64_t input_paths{0};
  uint64_t manifests{0};
  uint64_t targets{0};
  uint64_t splits{0};
  uint64_t total_bytes{0};
  uint64_t records{0};
  uint64_t duration_ns{0};
  std::string plan_digest;      // get_splits only
  std::string target_path;      // read_split only
};

std::string event_to_json(const PlanningEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile, p in [0.0, 1.0]. Returns microseconds, 0.0 if
  // nothing has been recorded.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// PlannerStats: process-wide counters
// ---------------------------------------------------------------------------
// Thread-safe. Record readers on many worker threads update it concurrently.
class PlannerStats {
 public:
  void record(const PlanningEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> summaries{0};
  alignas(64) std::atomic<uint64_t> plans{0};
  alignas(64) std::atomic<uint64_t> failures{0};
  alignas(64) std::atomic<uint64_t> manifests_read{0};
  alignas(64) std::atomic<uint64_t> targets_resolved{0};
  alignas(64) std::atomic<uint64_t> splits_planned{0};
  alignas(64) std::atomic<uint64_t> splits_read{0};
  alignas(64) std::atomic<uint64_t> records_read{0};

  LatencyHistogram planning_latency;
  LatencyHistogram read_latency;
};

PlannerStats& global_planner_stats();

// Fire-and-forget. See the file comment for where the event goes.
void emit_planning_event(const PlanningEvent& ev);

// Replaces the JSONL sink. Pass nullptr to restore it.
using PlanningEventHook = void (*)(const PlanningEvent&);
void set_planning_event_hook(PlanningEventHook hook);

// ---------------------------------------------------------------------------
// Stopwatch: monotonic duration since construction
// ---------------------------------------------------------------------------
struct Stopwatch {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};

  uint64_t elapsed_ns() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace symlinkio
