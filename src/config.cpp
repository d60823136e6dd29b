#include "symlinkio/config.hpp"

#include <cstdlib>
#include <set>

#include "symlinkio/jsonlite.hpp"
#include "symlinkio/types.hpp"

namespace symlinkio {

namespace {

const std::set<std::string>& known_keys() {
  static const std::set<std::string> keys{
      "block_size",     "desired_splits", "format",         "input_paths",
      "max_split_size", "min_split_size", "resolver_threads", "split_slop"};
  return keys;
}

// Leaves out untouched when the variable is unset or not a plain integer.
void override_u64_from_env(const char* name, std::uint64_t& out) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(e, &end, 10);
  if (end == e || *end != '\0') return;
  out = static_cast<std::uint64_t>(v);
}

bool is_number(const jsonlite::Value& v) {
  return v.is<std::uint64_t>() || v.is<double>();
}

}  // namespace

std::string to_string(InputFormatKind kind) {
  switch (kind) {
    case InputFormatKind::symlink: return "symlink";
    case InputFormatKind::direct: return "direct";
  }
  return "";
}

ConfigValidationResult validate_config(const PlannerConfig& config) {
  ConfigValidationResult r;
  if (config.min_split_size == 0) {
    r.errors.push_back("min_split_size must be at least 1");
  }
  if (config.max_split_size != 0 && config.max_split_size < config.min_split_size) {
    r.errors.push_back("max_split_size must be 0 or >= min_split_size");
  }
  if (!(config.split_slop >= 1.0)) {
    r.errors.push_back("split_slop must be >= 1.0");
  }
  if (config.block_size == 0) {
    r.errors.push_back("block_size must be at least 1");
  }
  if (config.resolver_threads == 0) {
    r.errors.push_back("resolver_threads must be at least 1");
  }
  if (config.desired_splits == 0) {
    r.warnings.push_back("desired_splits is 0; planning as if 1");
  }
  r.ok = r.errors.empty();
  return r;
}

PlannerConfig parse_config_json(const std::string& payload, ConfigValidationResult* result) {
  PlannerConfig cfg;
  ConfigValidationResult local;
  ConfigValidationResult& r = result ? *result : local;
  r = ConfigValidationResult{};

  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(payload, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    r.ok = false;
    return cfg;
  }

  for (const auto& [k, v] : obj) {
    if (!known_keys().contains(k)) r.warnings.push_back("unknown key: " + k);
  }
  // Counts must be JSON non-negative integers. -5 or 2.5 parse as double and
  // are rejected here rather than replaced by the default.
  for (const char* k : {"desired_splits", "min_split_size", "max_split_size", "block_size",
                        "resolver_threads"}) {
    auto it = obj.find(k);
    if (it != obj.end() && !it->second.is<std::uint64_t>()) {
      r.errors.push_back(std::string(k) + " must be a non-negative integer");
    }
  }
  if (auto it = obj.find("split_slop"); it != obj.end() && !is_number(it->second)) {
    r.errors.push_back("split_slop must be a number");
  }
  if (auto it = obj.find("format"); it != obj.end() && !it->second.is<std::string>()) {
    r.errors.push_back("format must be a string");
  }
  if (auto it = obj.find("input_paths"); it != obj.end()) {
    if (!it->second.is<jsonlite::Array>()) {
      r.errors.push_back("input_paths must be an array of strings");
    } else {
      const auto& items = std::get<jsonlite::Array>(it->second.v);
      for (size_t i = 0; i < items.size(); ++i) {
        if (!items[i].is<std::string>()) {
          r.errors.push_back("input_paths[" + std::to_string(i) + "] must be a string");
        }
      }
    }
  }

  cfg.input_paths = jsonlite::get_string_array(obj, "input_paths");
  const std::string format = jsonlite::get_string(obj, "format", "symlink");
  if (format == "symlink") {
    cfg.format = InputFormatKind::symlink;
  } else if (format == "direct") {
    cfg.format = InputFormatKind::direct;
  } else {
    r.errors.push_back("format must be \"symlink\" or \"direct\"");
  }
  cfg.desired_splits = jsonlite::get_u64(obj, "desired_splits", cfg.desired_splits);
  cfg.min_split_size = jsonlite::get_u64(obj, "min_split_size", cfg.min_split_size);
  cfg.max_split_size = jsonlite::get_u64(obj, "max_split_size", cfg.max_split_size);
  cfg.block_size = jsonlite::get_u64(obj, "block_size", cfg.block_size);
  cfg.resolver_threads = jsonlite::get_u64(obj, "resolver_threads", cfg.resolver_threads);
  cfg.split_slop = jsonlite::get_double(obj, "split_slop", cfg.split_slop);

  const ConfigValidationResult semantic = validate_config(cfg);
  r.errors.insert(r.errors.end(), semantic.errors.begin(), semantic.errors.end());
  r.warnings.insert(r.warnings.end(), semantic.warnings.begin(), semantic.warnings.end());
  r.ok = r.errors.empty();
  return cfg;
}

PlannerConfig load_config_json(const std::string& payload) {
  ConfigValidationResult r;
  PlannerConfig cfg = parse_config_json(payload, &r);
  if (!r.ok) {
    std::string msg = "Invalid planner config";
    for (const auto& e : r.errors) msg += "; " + e;
    throw Error(ErrorCode::config_invalid, msg);
  }
  return cfg;
}

std::string config_to_json(const PlannerConfig& config) {
  jsonlite::Object obj;
  jsonlite::Array paths;
  for (const auto& p : config.input_paths) paths.push_back(jsonlite::Value{p});
  obj["input_paths"] = std::move(paths);
  obj["format"] = to_string(config.format);
  obj["desired_splits"] = config.desired_splits;
  obj["min_split_size"] = config.min_split_size;
  obj["max_split_size"] = config.max_split_size;
  obj["split_slop"] = config.split_slop;
  obj["block_size"] = config.block_size;
  obj["resolver_threads"] = config.resolver_threads;
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

void apply_env_overrides(PlannerConfig& config) {
  override_u64_from_env("SYMLINKIO_MIN_SPLIT_SIZE", config.min_split_size);
  override_u64_from_env("SYMLINKIO_MAX_SPLIT_SIZE", config.max_split_size);
  override_u64_from_env("SYMLINKIO_BLOCK_SIZE", config.block_size);
  override_u64_from_env("SYMLINKIO_RESOLVER_THREADS", config.resolver_threads);
  if (const char* e = std::getenv("SYMLINKIO_SPLIT_SLOP")) {
    char* end = nullptr;
    const double v = std::strtod(e, &end);
    if (end != e && *end == '\0') config.split_slop = v;
  }
}

}  // namespace symlinkio
