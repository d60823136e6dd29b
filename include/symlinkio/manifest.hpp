#pragma once

// symlinkio/manifest.hpp: manifest discovery and target resolution.
//
// A manifest ("symlink file") is UTF-8 text with one target path per line.
// Resolution is all-or-nothing: a single line naming a missing path or a
// directory fails the whole call, so no data silently drops out of the
// logical input.
//
// ORDERING:
//   Output follows (a) manifest enumeration order, which is the sorted
//   FileSystem::list() order walked depth-first, then (b) line order within
//   each manifest. Parallel resolution (threads > 1) produces the same order.

#include <cstdint>
#include <string>
#include <vector>

#include "symlinkio/filesystem.hpp"
#include "symlinkio/types.hpp"

namespace symlinkio {

struct ManifestResolution {
  std::vector<std::string> manifests;
  std::vector<ResolvedTarget> targets;
};

// Split manifest text into its references. '\r' before '\n' is stripped;
// blank and whitespace-only lines are skipped.
std::vector<std::string> parse_manifest_text(const std::string& text);

// True for names a file input format ignores: "_SUCCESS", ".crc" files etc.
bool is_hidden_name(const std::string& path);

class ManifestResolver {
 public:
  explicit ManifestResolver(const FileSystem& fs, std::uint64_t threads = 1);

  // Every non-hidden regular file under the roots, depth-first in listing
  // order. A root that is itself a file is returned as-is.
  // Throws Error(io_error) if a root does not exist.
  std::vector<std::string> enumerate_files(const std::vector<std::string>& roots) const;

  // References of one manifest, in line order. Throws Error(io_error).
  std::vector<std::string> read_manifest(const std::string& manifest_path) const;

  // Throws Error(target_not_found) or Error(target_is_directory).
  ResolvedTarget resolve_target(const std::string& target, const std::string& manifest_path) const;

  // Full symlink-format resolution of the roots.
  ManifestResolution resolve(const std::vector<std::string>& roots) const;

  // Direct-format resolution: every enumerated file is itself a target.
  ManifestResolution resolve_direct(const std::vector<std::string>& roots) const;

 private:
  std::vector<ResolvedTarget> resolve_manifest(const std::string& manifest_path) const;
  void walk(const std::string& dir, std::vector<std::string>& out) const;

  const FileSystem& fs_;
  std::uint64_t threads_;
};

}  // namespace symlinkio
