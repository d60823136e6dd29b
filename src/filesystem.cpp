#include "symlinkio/filesystem.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace symlinkio {

namespace {

[[noreturn]] void throw_io(const std::string& what, const std::string& path,
                           const std::error_code& ec = {}) {
  std::string msg = what + ": " + path;
  if (ec) msg += " (" + ec.message() + ")";
  throw Error(ErrorCode::io_error, msg);
}

// Cut [0, length) into blocks of block_size. An empty file has no blocks.
std::vector<BlockLocation> synthesize_blocks(std::uint64_t length, std::uint64_t block_size,
                                             const std::vector<std::vector<std::string>>& hosts) {
  std::vector<BlockLocation> blocks;
  if (length == 0) return blocks;
  const std::uint64_t step = block_size == 0 ? length : block_size;
  size_t index = 0;
  for (std::uint64_t off = 0; off < length; off += step, ++index) {
    BlockLocation b;
    b.offset = off;
    b.length = std::min(step, length - off);
    if (index < hosts.size()) b.hosts = hosts[index];
    blocks.push_back(std::move(b));
  }
  return blocks;
}

std::string normalize(const std::string& path) {
  std::string p = fs::path(path).lexically_normal().generic_string();
  while (p.size() > 1 && p.back() == '/') p.pop_back();
  return p;
}

std::string parent_of(const std::string& normalized) {
  std::string parent = fs::path(normalized).parent_path().generic_string();
  return parent.empty() ? std::string(".") : parent;
}

}  // namespace

// ---------------------------------------------------------------------------
// LocalFileSystem
// ---------------------------------------------------------------------------

LocalFileSystem::LocalFileSystem(std::uint64_t block_size) : block_size_(block_size) {}

std::optional<FileStatus> LocalFileSystem::stat(const std::string& path) const {
  std::error_code ec;
  const fs::file_status st = fs::status(path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
      return std::nullopt;
    }
    throw_io("Cannot stat", path, ec);
  }
  if (!fs::exists(st)) return std::nullopt;

  FileStatus out;
  out.path = path;
  if (fs::is_directory(st)) {
    out.is_directory = true;
    return out;
  }
  const std::uintmax_t size = fs::file_size(path, ec);
  if (ec) throw_io("Cannot stat", path, ec);
  out.length = static_cast<std::uint64_t>(size);
  out.block_size = block_size_;
  out.blocks = synthesize_blocks(out.length, block_size_, {});
  for (auto& b : out.blocks) b.hosts = {"localhost"};
  return out;
}

std::vector<FileStatus> LocalFileSystem::list(const std::string& path) const {
  std::error_code ec;
  if (!fs::is_directory(path, ec)) {
    throw_io("Not a directory", path, ec);
  }
  std::vector<FileStatus> out;
  for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
    FileStatus entry;
    entry.path = it->path().string();
    std::error_code entry_ec;
    entry.is_directory = it->is_directory(entry_ec);
    if (!entry.is_directory) {
      const std::uintmax_t size = it->file_size(entry_ec);
      if (!entry_ec) entry.length = static_cast<std::uint64_t>(size);
    }
    out.push_back(std::move(entry));
  }
  if (ec) throw_io("Cannot list directory", path, ec);
  std::sort(out.begin(), out.end(),
            [](const FileStatus& a, const FileStatus& b) { return a.path < b.path; });
  return out;
}

std::unique_ptr<std::istream> LocalFileSystem::open_read(const std::string& path) const {
  auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!in->is_open()) throw_io("Cannot open file for reading", path);
  return in;
}

std::unique_ptr<std::ostream> LocalFileSystem::open_write(const std::string& path) {
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) throw_io("Cannot create directory", parent.string(), ec);
  }
  auto out = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
  if (!out->is_open()) throw_io("Cannot open file for writing", path);
  return out;
}

// ---------------------------------------------------------------------------
// MemoryFileSystem
// ---------------------------------------------------------------------------

// Buffers writes and hands the content to the owning MemoryFileSystem when
// destroyed.
class MemoryWriteStream : public std::ostringstream {
 public:
  MemoryWriteStream(MemoryFileSystem* owner, std::string path)
      : owner_(owner), path_(std::move(path)) {}
  ~MemoryWriteStream() override { owner_->commit(path_, str()); }

 private:
  MemoryFileSystem* owner_;
  std::string path_;
};

void MemoryFileSystem::mkdirs_locked(const std::string& normalized) {
  std::string cur = normalized;
  while (true) {
    auto it = nodes_.find(cur);
    if (it != nodes_.end()) {
      if (!it->second.is_directory) {
        throw Error(ErrorCode::io_error, "Not a directory: " + cur);
      }
      return;
    }
    Node dir;
    dir.is_directory = true;
    nodes_.emplace(cur, std::move(dir));
    const std::string parent = parent_of(cur);
    if (parent == cur) return;
    cur = parent;
  }
}

void MemoryFileSystem::mkdirs(const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  mkdirs_locked(normalize(path));
}

void MemoryFileSystem::put_file(const std::string& path, const std::string& data,
                                std::uint64_t block_size,
                                std::vector<std::vector<std::string>> block_hosts) {
  const std::string p = normalize(path);
  std::lock_guard<std::mutex> lk(mu_);
  auto existing = nodes_.find(p);
  if (existing != nodes_.end() && existing->second.is_directory) {
    throw Error(ErrorCode::io_error, "Is a directory: " + p);
  }
  mkdirs_locked(parent_of(p));
  Node node;
  node.data = data;
  node.block_size = block_size;
  node.block_hosts = std::move(block_hosts);
  nodes_[p] = std::move(node);
}

void MemoryFileSystem::commit(const std::string& path, std::string data) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = nodes_.find(path);
  if (it == nodes_.end() || it->second.is_directory) return;
  it->second.data = std::move(data);
}

bool MemoryFileSystem::remove(const std::string& path) {
  const std::string p = normalize(path);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = nodes_.find(p);
  if (it == nodes_.end()) return false;
  const std::string prefix = p == "/" ? p : p + "/";
  it = nodes_.erase(it);
  while (it != nodes_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
    it = nodes_.erase(it);
  }
  return true;
}

FileStatus MemoryFileSystem::status_of(const std::string& path, const Node& node) const {
  FileStatus out;
  out.path = path;
  out.is_directory = node.is_directory;
  if (node.is_directory) return out;
  out.length = node.data.size();
  out.block_size = node.block_size;
  out.blocks = synthesize_blocks(out.length, node.block_size, node.block_hosts);
  return out;
}

std::optional<FileStatus> MemoryFileSystem::stat(const std::string& path) const {
  const std::string p = normalize(path);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = nodes_.find(p);
  if (it == nodes_.end()) return std::nullopt;
  return status_of(p, it->second);
}

std::vector<FileStatus> MemoryFileSystem::list(const std::string& path) const {
  const std::string p = normalize(path);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = nodes_.find(p);
  if (it == nodes_.end() || !it->second.is_directory) {
    throw Error(ErrorCode::io_error, "Not a directory: " + p);
  }
  std::vector<FileStatus> out;
  for (const auto& [child, node] : nodes_) {
    if (child != p && parent_of(child) == p) {
      FileStatus st = status_of(child, node);
      st.blocks.clear();
      out.push_back(std::move(st));
    }
  }
  return out;
}

std::unique_ptr<std::istream> MemoryFileSystem::open_read(const std::string& path) const {
  const std::string p = normalize(path);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = nodes_.find(p);
  if (it == nodes_.end()) throw Error(ErrorCode::io_error, "Cannot open file for reading: " + p);
  if (it->second.is_directory) throw Error(ErrorCode::io_error, "Is a directory: " + p);
  // Snapshot: later writes do not change what an open reader sees.
  return std::make_unique<std::istringstream>(it->second.data, std::ios::in | std::ios::binary);
}

std::unique_ptr<std::ostream> MemoryFileSystem::open_write(const std::string& path) {
  const std::string p = normalize(path);
  put_file(p, "");
  return std::make_unique<MemoryWriteStream>(this, p);
}

}  // namespace symlinkio
