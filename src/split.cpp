#include "symlinkio/split.hpp"

#include "symlinkio/hash.hpp"
#include "symlinkio/jsonlite.hpp"
#include "symlinkio/version.hpp"

namespace symlinkio {

namespace {

bool holds_u64(const jsonlite::Object& obj, const char* key) {
  auto it = obj.find(key);
  return it != obj.end() && std::holds_alternative<std::uint64_t>(it->second.v);
}

}  // namespace

std::string split_to_json(const SplitDescriptor& split) {
  jsonlite::Object obj;
  jsonlite::Array hosts;
  for (const auto& h : split.hosts) hosts.push_back(jsonlite::Value{h});
  obj["hosts"] = std::move(hosts);
  obj["length"] = split.length;
  obj["manifest"] = split.manifest_path;
  obj["path"] = split.target_path;
  obj["splittable"] = split.splittable;
  obj["start"] = split.start;
  obj["v"] = static_cast<std::uint64_t>(version::SPLIT_FORMAT_VERSION);
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

SplitDescriptor split_from_json(const std::string& json) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json, &err);
  if (err) {
    throw Error(ErrorCode::split_invalid, "Malformed split: " + err->message);
  }
  const auto v = jsonlite::get_u64(obj, "v", 0);
  if (v == 0 || v > version::SPLIT_FORMAT_VERSION) {
    throw Error(ErrorCode::split_invalid,
                "Unsupported split format version " + std::to_string(v) +
                " (this build reads up to " + std::to_string(version::SPLIT_FORMAT_VERSION) + ")");
  }
  if (!holds_u64(obj, "start") || !holds_u64(obj, "length")) {
    throw Error(ErrorCode::split_invalid, "Split is missing start/length");
  }

  SplitDescriptor s;
  s.target_path = jsonlite::get_string(obj, "path", "");
  if (s.target_path.empty()) {
    throw Error(ErrorCode::split_invalid, "Split is missing a target path");
  }
  s.start = jsonlite::get_u64(obj, "start", 0);
  s.length = jsonlite::get_u64(obj, "length", 0);
  if (s.start + s.length < s.start) {
    throw Error(ErrorCode::split_invalid, "Split range overflows");
  }
  s.hosts = jsonlite::get_string_array(obj, "hosts");
  s.manifest_path = jsonlite::get_string(obj, "manifest", "");
  s.splittable = jsonlite::get_bool(obj, "splittable", true);
  return s;
}

std::string split_id(const SplitDescriptor& split) {
  return hash_domain("split:", split_to_json(split));
}

std::string plan_digest(const std::vector<SplitDescriptor>& splits) {
  std::vector<std::string> ids;
  ids.reserve(splits.size());
  for (const auto& s : splits) ids.push_back(split_id(s));
  return hash_domain_parts("plan:", ids);
}

}  // namespace symlinkio
