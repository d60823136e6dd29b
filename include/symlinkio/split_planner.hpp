#pragma once

// symlinkio/split_planner.hpp: size-based split planning across targets.
//
// ALGORITHM:
//   goal       = total bytes of all targets / max(desired_splits, 1)
//   split_size = max(min_split_size, min(goal, target block size))
//                (default_block_size stands in when the target reports none)
//                capped by max_split_size when it is non-zero
//   Each target is then cut independently from offset 0:
//     - while remaining / split_size > split_slop, emit a split_size chunk,
//       shortened to end on the next block boundary if it would straddle one;
//     - the rest (at most split_slop * split_size bytes) becomes the last
//       split, so a tail under 10% of a split (slop 1.1) is merged into the
//       previous one instead of standing alone.
//   A zero-length target gets one empty split with no hosts. A non-splittable
//   (compressed) target gets one split covering the whole file.
//
// INVARIANTS:
//   - Splits of one target tile [0, length) exactly, in ascending order.
//   - No split spans two targets.
//   - Output order is target order, then offset.
//   - desired_splits is advisory. The split count depends on file sizes and
//     block layout.
//
// CONCURRENCY NOTES:
//   plan_target() reads only its argument and the immutable options, so
//   targets can be planned on separate threads and concatenated in order.

#include <cstdint>
#include <string>
#include <vector>

#include "symlinkio/config.hpp"
#include "symlinkio/types.hpp"

namespace symlinkio {

// Compressed targets cannot be entered mid-stream and are never cut.
bool is_splittable(const std::string& target_path);

struct SplitPlannerOptions {
  std::uint64_t min_split_size{1};
  std::uint64_t max_split_size{0};  // 0 = uncapped
  double split_slop{1.1};
  std::uint64_t default_block_size{0};  // used when a target reports none
};

class SplitPlanner {
 public:
  explicit SplitPlanner(SplitPlannerOptions options = {});
  explicit SplitPlanner(const PlannerConfig& config);

  // total / max(desired, 1).
  static std::uint64_t goal_size(const std::vector<ResolvedTarget>& targets,
                                 std::uint64_t desired_splits);

  // Effective split size for a target with the given block size (0 = none).
  std::uint64_t split_size(std::uint64_t goal, std::uint64_t block_size) const;

  std::vector<SplitDescriptor> plan_target(const ResolvedTarget& target,
                                           std::uint64_t goal) const;

  std::vector<SplitDescriptor> plan(const std::vector<ResolvedTarget>& targets,
                                    std::uint64_t desired_splits) const;

  const SplitPlannerOptions& options() const { return options_; }

 private:
  SplitPlannerOptions options_;
};

// Hosts of every block overlapping [start, start + length), in block order,
// without duplicates. A zero-length range takes the hosts of the block that
// contains start.
std::vector<std::string> hosts_for_range(const std::vector<BlockLocation>& blocks,
                                         std::uint64_t start, std::uint64_t length);

}  // namespace symlinkio
