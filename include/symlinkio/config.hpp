#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace symlinkio {

// Which layout the input roots use. Chosen by the caller before planning.
enum class InputFormatKind {
  symlink,  // roots hold manifest files listing the real data files
  direct,   // roots hold the data files themselves
};

std::string to_string(InputFormatKind kind);

// Explicit job configuration handed to every entry point. Nothing in the
// library reads ambient configuration except apply_env_overrides().
struct PlannerConfig {
  std::vector<std::string> input_paths;
  InputFormatKind format{InputFormatKind::symlink};

  // Advisory number of splits. The planner may produce more or fewer.
  std::uint64_t desired_splits{1};

  std::uint64_t min_split_size{1};
  std::uint64_t max_split_size{0};   // 0 = uncapped

  // Keep cutting full-size splits while remaining / split_size > split_slop.
  // 1.1 merges a tail shorter than 10% of a split into the previous split.
  double split_slop{1.1};

  // Block size assumed for a target whose filesystem reports none
  // (FileStatus::block_size == 0). Caps the split size like a real block.
  std::uint64_t block_size{32ull * 1024 * 1024};

  // Manifests resolved concurrently. 1 = sequential.
  std::uint64_t resolver_threads{1};
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const PlannerConfig& config);

// Parse a JSON config document. Unknown keys produce warnings in *result,
// malformed JSON or invalid values produce errors. Throws nothing; check
// result->ok when a result pointer is given.
PlannerConfig parse_config_json(const std::string& json_payload, ConfigValidationResult* result);

// Same as parse_config_json but throws Error(config_invalid) on any error.
PlannerConfig load_config_json(const std::string& json_payload);

std::string config_to_json(const PlannerConfig& config);

// SYMLINKIO_MIN_SPLIT_SIZE, SYMLINKIO_MAX_SPLIT_SIZE, SYMLINKIO_BLOCK_SIZE,
// SYMLINKIO_SPLIT_SLOP, SYMLINKIO_RESOLVER_THREADS. Unparsable values are ignored.
void apply_env_overrides(PlannerConfig& config);

}  // namespace symlinkio
