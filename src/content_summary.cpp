#include "symlinkio/content_summary.hpp"

#include "symlinkio/jsonlite.hpp"

namespace symlinkio {

ContentSummary summarize(const std::vector<ResolvedTarget>& targets) {
  ContentSummary s;
  for (const auto& t : targets) {
    s.total_length += t.length;
    ++s.file_count;
  }
  return s;
}

std::string summary_to_json(const ContentSummary& summary) {
  jsonlite::Object obj;
  obj["total_length"] = summary.total_length;
  obj["file_count"] = summary.file_count;
  obj["directory_count"] = summary.directory_count;
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

}  // namespace symlinkio
