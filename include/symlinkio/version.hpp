#pragma once

// symlinkio/version.hpp: version constants for every format this library
// reads or writes.
//
// INVARIANT:
//   A reader must never silently accept data written in a newer format
//   version than it was compiled against. split_from_json() enforces this
//   for SPLIT_FORMAT_VERSION.

#include <cstdint>
#include <string>

namespace symlinkio {
namespace version {

// ---------------------------------------------------------------------------
// SPLIT_FORMAT_VERSION
// Layout of serialized SplitDescriptor JSON (the "v" field).
// Version 1 = {v, path, start, length, hosts, manifest, splittable}.
// Adding or removing a required field requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t SPLIT_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// MANIFEST_FORMAT_VERSION
// Manifest text format: one path per line, '\n' terminated, no escaping.
// ---------------------------------------------------------------------------
constexpr uint32_t MANIFEST_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256 with "split:" / "plan:" domain prefixes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t split_format{SPLIT_FORMAT_VERSION};
  uint32_t manifest_format{MANIFEST_FORMAT_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string library_semver;
  std::string hash_primitive;
  std::string hash_backend_version;
  bool zstd_enabled{false};
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace symlinkio
