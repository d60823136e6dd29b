#pragma once

// symlinkio/input_format.hpp: the surface an execution framework calls.
//
// Three operations, each taking an explicit FileSystem and PlannerConfig:
//   get_content_summary  size of the logical input
//   get_splits           partition the logical input into SplitDescriptors
//   get_record_reader    line records of one split, usually on a worker
//
// Every operation checks the configured input paths before touching the
// filesystem and fails with kNoInputPathsMessage when there are none. Each
// call emits one PlanningEvent, success or failure, and failures propagate
// to the caller unchanged.
//
// EXTENSION_POINT: additional_input_formats
//   InputFormat is a closed variant chosen before planning. A new layout adds
//   one alternative with a resolve() member; the operations stay untouched.

#include <memory>
#include <variant>
#include <vector>

#include "symlinkio/config.hpp"
#include "symlinkio/filesystem.hpp"
#include "symlinkio/manifest.hpp"
#include "symlinkio/record_reader.hpp"
#include "symlinkio/types.hpp"

namespace symlinkio {

// Roots hold manifest files; the data lives wherever their lines point.
struct SymlinkFormat {
  ManifestResolution resolve(const FileSystem& fs, const PlannerConfig& config) const;
};

// Roots hold the data files themselves.
struct DirectFormat {
  ManifestResolution resolve(const FileSystem& fs, const PlannerConfig& config) const;
};

using InputFormat = std::variant<SymlinkFormat, DirectFormat>;

InputFormat select_input_format(InputFormatKind kind);

// Throws Error(no_input_paths) with kNoInputPathsMessage.
void validate_input_paths(const PlannerConfig& config);

ContentSummary get_content_summary(const InputFormat& format, const FileSystem& fs,
                                   const PlannerConfig& config);
std::vector<SplitDescriptor> get_splits(const InputFormat& format, const FileSystem& fs,
                                        const PlannerConfig& config);

// Same, with the format taken from config.format.
ContentSummary get_content_summary(const FileSystem& fs, const PlannerConfig& config);
std::vector<SplitDescriptor> get_splits(const FileSystem& fs, const PlannerConfig& config);

// Splits are self-describing, so reading needs neither a format nor a config.
std::unique_ptr<RecordSource> get_record_reader(const FileSystem& fs,
                                                const SplitDescriptor& split);

}  // namespace symlinkio
