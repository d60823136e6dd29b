#pragma once

// symlinkio/types.hpp: core value types for the symlink input format.
//
// MEMORY OWNERSHIP:
//   - Every type here is a value type. All string members are value-owned.
//   - SplitDescriptor carries no pointer or reference back into resolver or
//     planner state, so it can be copied to another thread or serialized and
//     shipped to a remote worker.
//
// CONCURRENCY NOTES:
//   - ResolvedTarget and SplitDescriptor are immutable once produced.
//     Concurrent reads from several workers need no synchronization.
//
// ERROR MODEL:
//   Failures are raised as symlinkio::Error. code() is a stable ErrorCode,
//   what() is the human-readable message handed to the caller unchanged.

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace symlinkio {

enum class ErrorCode {
  none,
  no_input_paths,
  io_error,
  target_not_found,
  target_is_directory,
  config_invalid,
  split_invalid,
  json_parse_error,
  json_duplicate_key,
  compression_unavailable,
};

std::string to_string(ErrorCode code);

// Fixed message for a job with no configured input paths.
inline constexpr const char* kNoInputPathsMessage = "No input paths specified in job.";

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// ---------------------------------------------------------------------------
// Filesystem metadata
// ---------------------------------------------------------------------------

// One storage block of a file and the hosts holding a replica of it.
struct BlockLocation {
  std::uint64_t offset{0};
  std::uint64_t length{0};
  std::vector<std::string> hosts;
};

struct FileStatus {
  std::string path;
  std::uint64_t length{0};
  bool is_directory{false};
  std::uint64_t block_size{0};  // 0 = no block structure reported
  std::vector<BlockLocation> blocks;
};

// ---------------------------------------------------------------------------
// ResolvedTarget: one manifest line resolved to file metadata
// ---------------------------------------------------------------------------
// Duplicated references produce duplicated entries; nothing here dedups.
struct ResolvedTarget {
  std::string path;
  std::uint64_t length{0};
  std::uint64_t block_size{0};
  std::vector<BlockLocation> blocks;
  std::string manifest_path;  // empty when the target was listed directly
};

struct ContentSummary {
  std::uint64_t total_length{0};
  std::uint64_t file_count{0};
  std::uint64_t directory_count{0};
};

// ---------------------------------------------------------------------------
// SplitDescriptor: one contiguous byte range of exactly one target
// ---------------------------------------------------------------------------
// Invariant: for a given target, the [start, start+length) ranges of its
// splits tile [0, target length) with no gap and no overlap.
struct SplitDescriptor {
  std::string target_path;
  std::uint64_t start{0};
  std::uint64_t length{0};
  std::vector<std::string> hosts;
  std::string manifest_path;
  bool splittable{true};

  std::uint64_t end() const { return start + length; }
};

bool operator==(const SplitDescriptor& a, const SplitDescriptor& b);
inline bool operator!=(const SplitDescriptor& a, const SplitDescriptor& b) { return !(a == b); }

// A single line record: byte offset of the line start plus its text
// (terminator stripped).
struct Record {
  std::uint64_t position{0};
  std::string line;
};

}  // namespace symlinkio
