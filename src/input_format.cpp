#include "symlinkio/input_format.hpp"

#include "symlinkio/content_summary.hpp"
#include "symlinkio/observability.hpp"
#include "symlinkio/split.hpp"
#include "symlinkio/split_planner.hpp"

namespace symlinkio {

namespace {

void require_valid_config(const PlannerConfig& config) {
  const auto r = validate_config(config);
  if (r.ok) return;
  std::string msg = "Invalid planner config:";
  for (const auto& e : r.errors) msg += " " + e + ";";
  throw Error(ErrorCode::config_invalid, msg);
}

ManifestResolution resolve_inputs(const InputFormat& format, const FileSystem& fs,
                                  const PlannerConfig& config) {
  validate_input_paths(config);
  require_valid_config(config);
  return std::visit([&](const auto& f) { return f.resolve(fs, config); }, format);
}

void record_failure(PlanningEvent& ev, const Error& e, const Stopwatch& timer) {
  ev.ok = false;
  ev.error_code = to_string(e.code());
  ev.error_detail = e.what();
  ev.duration_ns = timer.elapsed_ns();
  emit_planning_event(ev);
}

}  // namespace

ManifestResolution SymlinkFormat::resolve(const FileSystem& fs,
                                          const PlannerConfig& config) const {
  return ManifestResolver(fs, config.resolver_threads).resolve(config.input_paths);
}

ManifestResolution DirectFormat::resolve(const FileSystem& fs,
                                         const PlannerConfig& config) const {
  return ManifestResolver(fs, config.resolver_threads).resolve_direct(config.input_paths);
}

InputFormat select_input_format(InputFormatKind kind) {
  switch (kind) {
    case InputFormatKind::symlink: return SymlinkFormat{};
    case InputFormatKind::direct: return DirectFormat{};
  }
  return SymlinkFormat{};
}

void validate_input_paths(const PlannerConfig& config) {
  if (config.input_paths.empty()) {
    throw Error(ErrorCode::no_input_paths, kNoInputPathsMessage);
  }
}

ContentSummary get_content_summary(const InputFormat& format, const FileSystem& fs,
                                   const PlannerConfig& config) {
  const Stopwatch timer;
  PlanningEvent ev;
  ev.operation = "content_summary";
  ev.input_paths = config.input_paths.size();
  try {
    const auto resolution = resolve_inputs(format, fs, config);
    const ContentSummary summary = summarize(resolution.targets);
    ev.ok = true;
    ev.manifests = resolution.manifests.size();
    ev.targets = resolution.targets.size();
    ev.total_bytes = summary.total_length;
    ev.duration_ns = timer.elapsed_ns();
    emit_planning_event(ev);
    return summary;
  } catch (const Error& e) {
    record_failure(ev, e, timer);
    throw;
  }
}

std::vector<SplitDescriptor> get_splits(const InputFormat& format, const FileSystem& fs,
                                        const PlannerConfig& config) {
  const Stopwatch timer;
  PlanningEvent ev;
  ev.operation = "get_splits";
  ev.input_paths = config.input_paths.size();
  try {
    const auto resolution = resolve_inputs(format, fs, config);
    auto splits = SplitPlanner(config).plan(resolution.targets, config.desired_splits);
    ev.ok = true;
    ev.manifests = resolution.manifests.size();
    ev.targets = resolution.targets.size();
    ev.splits = splits.size();
    for (const auto& t : resolution.targets) ev.total_bytes += t.length;
    ev.plan_digest = plan_digest(splits);
    ev.duration_ns = timer.elapsed_ns();
    emit_planning_event(ev);
    return splits;
  } catch (const Error& e) {
    record_failure(ev, e, timer);
    throw;
  }
}

ContentSummary get_content_summary(const FileSystem& fs, const PlannerConfig& config) {
  return get_content_summary(select_input_format(config.format), fs, config);
}

std::vector<SplitDescriptor> get_splits(const FileSystem& fs, const PlannerConfig& config) {
  return get_splits(select_input_format(config.format), fs, config);
}

std::unique_ptr<RecordSource> get_record_reader(const FileSystem& fs,
                                                const SplitDescriptor& split) {
  const Stopwatch timer;
  try {
    return std::make_unique<SplitRecordReader>(fs, split);
  } catch (const Error& e) {
    PlanningEvent ev;
    ev.operation = "read_split";
    ev.targets = 1;
    ev.splits = 1;
    ev.target_path = split.target_path;
    record_failure(ev, e, timer);
    throw;
  }
}

}  // namespace symlinkio
