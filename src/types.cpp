#include "symlinkio/types.hpp"

namespace symlinkio {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::no_input_paths: return "no_input_paths";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::target_not_found: return "target_not_found";
    case ErrorCode::target_is_directory: return "target_is_directory";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::split_invalid: return "split_invalid";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::compression_unavailable: return "compression_unavailable";
  }
  return "";
}

bool operator==(const SplitDescriptor& a, const SplitDescriptor& b) {
  return a.target_path == b.target_path &&
         a.start == b.start &&
         a.length == b.length &&
         a.hosts == b.hosts &&
         a.manifest_path == b.manifest_path &&
         a.splittable == b.splittable;
}

}  // namespace symlinkio
