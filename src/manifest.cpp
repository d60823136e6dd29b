#include "symlinkio/manifest.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <future>
#include <istream>

namespace symlinkio {

namespace {

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

std::vector<std::string> parse_manifest_text(const std::string& text) {
  std::vector<std::string> refs;
  size_t begin = 0;
  while (begin < text.size()) {
    size_t nl = text.find('\n', begin);
    if (nl == std::string::npos) nl = text.size();
    std::string line = text.substr(begin, nl - begin);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!is_blank(line)) refs.push_back(std::move(line));
    begin = nl + 1;
  }
  return refs;
}

bool is_hidden_name(const std::string& path) {
  const std::string name = std::filesystem::path(path).filename().string();
  return !name.empty() && (name[0] == '_' || name[0] == '.');
}

ManifestResolver::ManifestResolver(const FileSystem& fs, std::uint64_t threads)
    : fs_(fs), threads_(threads == 0 ? 1 : threads) {}

void ManifestResolver::walk(const std::string& dir, std::vector<std::string>& out) const {
  for (const auto& entry : fs_.list(dir)) {
    if (is_hidden_name(entry.path)) continue;
    if (entry.is_directory) {
      walk(entry.path, out);
    } else {
      out.push_back(entry.path);
    }
  }
}

std::vector<std::string> ManifestResolver::enumerate_files(const std::vector<std::string>& roots) const {
  std::vector<std::string> out;
  for (const auto& root : roots) {
    const auto st = fs_.stat(root);
    if (!st) {
      throw Error(ErrorCode::io_error, "Input path does not exist: " + root);
    }
    if (st->is_directory) {
      walk(root, out);
    } else {
      out.push_back(root);
    }
  }
  return out;
}

std::vector<std::string> ManifestResolver::read_manifest(const std::string& manifest_path) const {
  auto in = fs_.open_read(manifest_path);
  std::string text;
  char buf[8192];
  while (in->read(buf, sizeof(buf)) || in->gcount() > 0) {
    text.append(buf, static_cast<size_t>(in->gcount()));
  }
  if (in->bad()) {
    throw Error(ErrorCode::io_error, "Read failed for manifest: " + manifest_path);
  }
  return parse_manifest_text(text);
}

ResolvedTarget ManifestResolver::resolve_target(const std::string& target,
                                                const std::string& manifest_path) const {
  const std::string origin = manifest_path.empty() ? "" : " (referenced by " + manifest_path + ")";
  const auto st = fs_.stat(target);
  if (!st) {
    throw Error(ErrorCode::target_not_found, "Target file does not exist: " + target + origin);
  }
  if (st->is_directory) {
    throw Error(ErrorCode::target_is_directory, "Target is a directory: " + target + origin);
  }
  ResolvedTarget t;
  t.path = target;
  t.length = st->length;
  t.block_size = st->block_size;
  t.blocks = st->blocks;
  t.manifest_path = manifest_path;
  return t;
}

std::vector<ResolvedTarget> ManifestResolver::resolve_manifest(const std::string& manifest_path) const {
  std::vector<ResolvedTarget> out;
  for (const auto& ref : read_manifest(manifest_path)) {
    out.push_back(resolve_target(ref, manifest_path));
  }
  return out;
}

ManifestResolution ManifestResolver::resolve(const std::vector<std::string>& roots) const {
  ManifestResolution res;
  res.manifests = enumerate_files(roots);

  const size_t n = res.manifests.size();
  std::vector<std::vector<ResolvedTarget>> per_manifest(n);
  if (threads_ <= 1 || n < 2) {
    for (size_t i = 0; i < n; ++i) per_manifest[i] = resolve_manifest(res.manifests[i]);
  } else {
    // Bounded fan-out: at most threads_ manifests in flight. Each task owns
    // its output slot, so results land in enumeration order. get() rethrows
    // the first failure in that order.
    const size_t width = static_cast<size_t>(threads_);
    for (size_t base = 0; base < n; base += width) {
      std::vector<std::future<std::vector<ResolvedTarget>>> batch;
      const size_t stop = std::min(n, base + width);
      for (size_t i = base; i < stop; ++i) {
        batch.push_back(std::async(std::launch::async,
                                   [this, &res, i] { return resolve_manifest(res.manifests[i]); }));
      }
      for (size_t j = 0; j < batch.size(); ++j) per_manifest[base + j] = batch[j].get();
    }
  }

  for (auto& targets : per_manifest) {
    res.targets.insert(res.targets.end(), std::make_move_iterator(targets.begin()),
                       std::make_move_iterator(targets.end()));
  }
  return res;
}

ManifestResolution ManifestResolver::resolve_direct(const std::vector<std::string>& roots) const {
  ManifestResolution res;
  for (const auto& path : enumerate_files(roots)) {
    res.targets.push_back(resolve_target(path, ""));
  }
  return res;
}

}  // namespace symlinkio
