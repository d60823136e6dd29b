#include "symlinkio/version.hpp"

#include "symlinkio/hash.hpp"
#include "symlinkio/jsonlite.hpp"

#ifndef SYMLINKIO_VERSION
#define SYMLINKIO_VERSION "0.1.0"
#endif

namespace symlinkio {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.library_semver = SYMLINKIO_VERSION;
  m.hash_primitive = "blake3";
  m.hash_backend_version = hash_backend_version();
#if defined(SYMLINKIO_WITH_ZSTD)
  m.zstd_enabled = true;
#endif
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object obj;
  obj["split_format"] = static_cast<std::uint64_t>(m.split_format);
  obj["manifest_format"] = static_cast<std::uint64_t>(m.manifest_format);
  obj["hash_algorithm"] = static_cast<std::uint64_t>(m.hash_algorithm);
  obj["library_semver"] = m.library_semver;
  obj["hash_primitive"] = m.hash_primitive;
  obj["hash_backend_version"] = m.hash_backend_version;
  obj["zstd_enabled"] = m.zstd_enabled;
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

}  // namespace version
}  // namespace symlinkio
