#pragma once

// symlinkio/filesystem.hpp: filesystem capability interface and backends.
//
// DESIGN INVARIANTS (must hold for every implementation):
//   1. stat() returns nullopt for a path that does not exist and throws
//      Error(io_error) for any other failure. "Missing" and "unreadable" are
//      different failures and callers report them differently.
//   2. list() returns the direct children of a directory sorted by path, so
//      manifest enumeration order is the same on every backend.
//   3. open_read() hands out an independent stream per call. Two readers of
//      the same file never share a position.
//
// Thread-safety: all implementations MUST be safe for concurrent calls.
// ManifestResolver stats targets from several threads at once.
//
// EXTENSION_POINT: remote_filesystem_backend
//   Current: LocalFileSystem (POSIX) and MemoryFileSystem (in-process).
//   Upgrade path: an object-store backend maps list() to a prefix listing and
//   reports real replica hosts in BlockLocation so split host hints become
//   meaningful for scheduling. Invariant 2 still applies: sort the listing.

#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "symlinkio/types.hpp"

namespace symlinkio {

// ---------------------------------------------------------------------------
// FileSystem: abstract capability interface
// ---------------------------------------------------------------------------
class FileSystem {
 public:
  virtual ~FileSystem() = default;

  // Direct children of a directory, sorted by path. Block locations of the
  // entries may be left empty; call stat() for them.
  // Throws Error(io_error) if path is missing or not a directory.
  virtual std::vector<FileStatus> list(const std::string& path) const = 0;

  // Metadata including block locations. nullopt if the path does not exist.
  virtual std::optional<FileStatus> stat(const std::string& path) const = 0;

  // Seekable read stream. Throws Error(io_error) on failure.
  virtual std::unique_ptr<std::istream> open_read(const std::string& path) const = 0;

  // Truncating write stream, creating parent directories. Used by producers
  // and tests only. Throws Error(io_error) on failure.
  virtual std::unique_ptr<std::ostream> open_write(const std::string& path) = 0;
};

// ---------------------------------------------------------------------------
// LocalFileSystem: POSIX files via std::filesystem
// ---------------------------------------------------------------------------
// The local disk has no block structure, so stat() synthesizes one block
// every block_size bytes, all hosted on "localhost".
class LocalFileSystem : public FileSystem {
 public:
  static constexpr std::uint64_t kDefaultBlockSize = 32ull * 1024 * 1024;

  explicit LocalFileSystem(std::uint64_t block_size = kDefaultBlockSize);

  std::vector<FileStatus> list(const std::string& path) const override;
  std::optional<FileStatus> stat(const std::string& path) const override;
  std::unique_ptr<std::istream> open_read(const std::string& path) const override;
  std::unique_ptr<std::ostream> open_write(const std::string& path) override;

  std::uint64_t block_size() const { return block_size_; }

 private:
  std::uint64_t block_size_;
};

// ---------------------------------------------------------------------------
// MemoryFileSystem: in-process tree
// ---------------------------------------------------------------------------
// Paths are normalized ("/a//b/" == "/a/b"). Parent directories are created
// implicitly by put_file() and open_write().
//
// Streams returned by open_write() commit their content when destroyed; the
// MemoryFileSystem must outlive them.
class MemoryFileSystem : public FileSystem {
 public:
  MemoryFileSystem() = default;

  std::vector<FileStatus> list(const std::string& path) const override;
  std::optional<FileStatus> stat(const std::string& path) const override;
  std::unique_ptr<std::istream> open_read(const std::string& path) const override;
  std::unique_ptr<std::ostream> open_write(const std::string& path) override;

  // Store a file. With block_size > 0 the file is cut into blocks of that
  // size and block i is hosted on block_hosts[i] (missing entries = no
  // hosts). With block_size == 0 the whole file is one block.
  void put_file(const std::string& path, const std::string& data,
                std::uint64_t block_size = 0,
                std::vector<std::vector<std::string>> block_hosts = {});

  void mkdirs(const std::string& path);

  // Remove a file or a directory subtree. Returns false if nothing existed.
  bool remove(const std::string& path);

 private:
  struct Node {
    bool is_directory{false};
    std::string data;
    std::uint64_t block_size{0};
    std::vector<std::vector<std::string>> block_hosts;
  };

  void mkdirs_locked(const std::string& normalized);
  void commit(const std::string& path, std::string data);
  FileStatus status_of(const std::string& path, const Node& node) const;

  friend class MemoryWriteStream;

  mutable std::mutex mu_;
  std::map<std::string, Node> nodes_;
};

}  // namespace symlinkio
