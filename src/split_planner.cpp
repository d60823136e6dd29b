#include "symlinkio/split_planner.hpp"

#include <algorithm>

#include "symlinkio/compression.hpp"

namespace symlinkio {

namespace {

// First block end strictly after offset, or 0 if there is none.
std::uint64_t next_block_boundary(const std::vector<BlockLocation>& blocks, std::uint64_t offset) {
  for (const auto& b : blocks) {
    const std::uint64_t end = b.offset + b.length;
    if (end > offset) return end;
  }
  return 0;
}

}  // namespace

bool is_splittable(const std::string& target_path) {
  return !is_zstd_path(target_path);
}

std::vector<std::string> hosts_for_range(const std::vector<BlockLocation>& blocks,
                                         std::uint64_t start, std::uint64_t length) {
  std::vector<std::string> hosts;
  const std::uint64_t end = start + length;
  for (const auto& b : blocks) {
    const std::uint64_t b_end = b.offset + b.length;
    const bool overlaps = length == 0 ? (start >= b.offset && start < b_end)
                                      : (std::max(start, b.offset) < std::min(end, b_end));
    if (!overlaps) continue;
    for (const auto& h : b.hosts) {
      if (std::find(hosts.begin(), hosts.end(), h) == hosts.end()) hosts.push_back(h);
    }
  }
  return hosts;
}

SplitPlanner::SplitPlanner(SplitPlannerOptions options) : options_(options) {
  if (options_.min_split_size == 0) options_.min_split_size = 1;
}

SplitPlanner::SplitPlanner(const PlannerConfig& config)
    : SplitPlanner(SplitPlannerOptions{config.min_split_size, config.max_split_size,
                                       config.split_slop, config.block_size}) {}

std::uint64_t SplitPlanner::goal_size(const std::vector<ResolvedTarget>& targets,
                                      std::uint64_t desired_splits) {
  std::uint64_t total = 0;
  for (const auto& t : targets) total += t.length;
  return total / std::max<std::uint64_t>(desired_splits, 1);
}

std::uint64_t SplitPlanner::split_size(std::uint64_t goal, std::uint64_t block_size) const {
  std::uint64_t size = goal;
  if (block_size > 0) size = std::min(size, block_size);
  size = std::max(options_.min_split_size, size);
  if (options_.max_split_size > 0) size = std::min(size, options_.max_split_size);
  return std::max<std::uint64_t>(size, 1);
}

std::vector<SplitDescriptor> SplitPlanner::plan_target(const ResolvedTarget& target,
                                                       std::uint64_t goal) const {
  std::vector<SplitDescriptor> out;
  auto emit = [&](std::uint64_t start, std::uint64_t length, bool splittable) {
    SplitDescriptor s;
    s.target_path = target.path;
    s.start = start;
    s.length = length;
    s.hosts = hosts_for_range(target.blocks, start, length);
    s.manifest_path = target.manifest_path;
    s.splittable = splittable;
    out.push_back(std::move(s));
  };

  if (target.length == 0) {
    emit(0, 0, true);
    return out;
  }
  if (!is_splittable(target.path)) {
    emit(0, target.length, false);
    return out;
  }

  const std::uint64_t block_size =
      target.block_size != 0 ? target.block_size : options_.default_block_size;
  const std::uint64_t size = split_size(goal, block_size);
  const double slop = options_.split_slop < 1.0 ? 1.0 : options_.split_slop;
  std::uint64_t offset = 0;
  while (offset < target.length) {
    const std::uint64_t remaining = target.length - offset;
    if (static_cast<double>(remaining) / static_cast<double>(size) <= slop) {
      emit(offset, remaining, true);
      break;
    }
    std::uint64_t end = offset + size;
    const std::uint64_t boundary = next_block_boundary(target.blocks, offset);
    if (boundary != 0 && boundary < end) end = boundary;
    emit(offset, end - offset, true);
    offset = end;
  }
  return out;
}

std::vector<SplitDescriptor> SplitPlanner::plan(const std::vector<ResolvedTarget>& targets,
                                                std::uint64_t desired_splits) const {
  const std::uint64_t goal = goal_size(targets, desired_splits);
  std::vector<SplitDescriptor> out;
  for (const auto& t : targets) {
    auto splits = plan_target(t, goal);
    out.insert(out.end(), std::make_move_iterator(splits.begin()),
               std::make_move_iterator(splits.end()));
  }
  return out;
}

}  // namespace symlinkio
