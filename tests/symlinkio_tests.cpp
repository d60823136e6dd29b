#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#if defined(SYMLINKIO_WITH_ZSTD)
#include <zstd.h>
#endif

#include "symlinkio/compression.hpp"
#include "symlinkio/config.hpp"
#include "symlinkio/content_summary.hpp"
#include "symlinkio/filesystem.hpp"
#include "symlinkio/hash.hpp"
#include "symlinkio/input_format.hpp"
#include "symlinkio/jsonlite.hpp"
#include "symlinkio/manifest.hpp"
#include "symlinkio/observability.hpp"
#include "symlinkio/record_reader.hpp"
#include "symlinkio/split.hpp"
#include "symlinkio/split_planner.hpp"
#include "symlinkio/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Scratch directory under the system temp dir, removed on scope exit.
struct TempDir {
  fs::path path;
  explicit TempDir(const std::string& name) {
    path = fs::temp_directory_path() / ("symlinkio_test_" + name);
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  std::string str(const std::string& rel = "") const {
    return rel.empty() ? path.string() : (path / rel).string();
  }
};

void write_file(const std::string& path, const std::string& data) {
  fs::create_directories(fs::path(path).parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << data;
}

std::vector<std::string> read_all_lines(const symlinkio::FileSystem& fsys,
                                        const std::vector<symlinkio::SplitDescriptor>& splits) {
  std::vector<std::string> lines;
  for (const auto& split : splits) {
    auto reader = symlinkio::get_record_reader(fsys, split);
    symlinkio::Record rec;
    while (reader->next(rec)) lines.push_back(rec.line);
  }
  return lines;
}

// Lines of text the way a whole-file reader sees them.
std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  size_t begin = 0;
  while (begin < text.size()) {
    size_t nl = text.find('\n', begin);
    if (nl == std::string::npos) {
      out.push_back(text.substr(begin));
      break;
    }
    std::string line = text.substr(begin, nl - begin);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    out.push_back(line);
    begin = nl + 1;
  }
  return out;
}

template <typename Fn>
symlinkio::ErrorCode error_code_of(Fn&& fn) {
  try {
    fn();
  } catch (const symlinkio::Error& e) {
    return e.code();
  }
  return symlinkio::ErrorCode::none;
}

symlinkio::ResolvedTarget make_target(const std::string& path, std::uint64_t length,
                                      std::uint64_t block_size = 0) {
  symlinkio::ResolvedTarget t;
  t.path = path;
  t.length = length;
  t.block_size = block_size;
  return t;
}

// ============================================================================
// Phase 1: Manifest resolution
// ============================================================================

void test_parse_manifest_text() {
  const auto refs = symlinkio::parse_manifest_text("/a\r\n\n  \n/b\n/c");
  expect(refs.size() == 3, "blank lines skipped, unterminated last line kept");
  expect(refs[0] == "/a", "CR stripped before LF");
  expect(refs[1] == "/b" && refs[2] == "/c", "line order preserved");
  expect(symlinkio::parse_manifest_text("").empty(), "empty manifest has no references");
}

void test_hidden_names() {
  expect(symlinkio::is_hidden_name("/in/_SUCCESS"), "underscore files hidden");
  expect(symlinkio::is_hidden_name("/in/.part-0.crc"), "dot files hidden");
  expect(!symlinkio::is_hidden_name("/in/part-0"), "regular file visible");
}

void test_resolver_order_and_duplicates() {
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/data/x", "xxxx\n");
  mfs.put_file("/data/y", "yy\n");
  mfs.put_file("/in/b_manifest", "/data/y\n");
  mfs.put_file("/in/a_manifest", "/data/x\n/data/y\n/data/x\n");
  mfs.put_file("/in/_SUCCESS", "");
  mfs.put_file("/in/sub/c_manifest", "/data/x\n");

  symlinkio::ManifestResolver resolver(mfs);
  const auto res = resolver.resolve({"/in"});
  expect(res.manifests.size() == 3, "hidden file not treated as a manifest");
  expect(res.manifests[0] == "/in/a_manifest", "manifests in sorted order");
  expect(res.manifests[2] == "/in/sub/c_manifest", "subdirectories walked");
  expect(res.targets.size() == 5, "duplicates kept");
  expect(res.targets[0].path == "/data/x" && res.targets[1].path == "/data/y" &&
             res.targets[2].path == "/data/x",
         "line order within a manifest");
  expect(res.targets[3].path == "/data/y", "second manifest follows the first");
  expect(res.targets[0].manifest_path == "/in/a_manifest", "origin manifest recorded");
}

void test_resolver_missing_and_directory_targets() {
  symlinkio::MemoryFileSystem mfs;
  mfs.mkdirs("/data/dir");
  mfs.put_file("/in/m1", "/data/nope\n");
  symlinkio::ManifestResolver resolver(mfs);

  std::string message;
  try {
    resolver.resolve({"/in"});
  } catch (const symlinkio::Error& e) {
    expect(e.code() == symlinkio::ErrorCode::target_not_found, "missing target code");
    message = e.what();
  }
  expect(message.find("/data/nope") != std::string::npos, "message names the target");
  expect(message.find("/in/m1") != std::string::npos, "message names the manifest");

  mfs.put_file("/in/m1", "/data/dir\n");
  expect(error_code_of([&] { resolver.resolve({"/in"}); }) ==
             symlinkio::ErrorCode::target_is_directory,
         "directory target rejected");

  expect(error_code_of([&] { resolver.resolve({"/missing"}); }) ==
             symlinkio::ErrorCode::io_error,
         "missing input root is an I/O error");
}

void test_parallel_resolution_preserves_order() {
  symlinkio::MemoryFileSystem mfs;
  std::vector<std::string> expected;
  for (int i = 0; i < 12; ++i) {
    const std::string target = "/data/t" + std::to_string(i);
    mfs.put_file(target, std::string(static_cast<size_t>(i + 1), 'z'));
    char name[32];
    std::snprintf(name, sizeof(name), "/in/m%02d", i);
    mfs.put_file(name, target + "\n");
    expected.push_back(target);
  }
  const auto sequential = symlinkio::ManifestResolver(mfs, 1).resolve({"/in"});
  const auto parallel = symlinkio::ManifestResolver(mfs, 4).resolve({"/in"});
  expect(parallel.targets.size() == expected.size(), "parallel resolves every manifest");
  for (size_t i = 0; i < expected.size(); ++i) {
    expect(sequential.targets[i].path == expected[i], "sequential order");
    expect(parallel.targets[i].path == expected[i], "parallel order matches sequential");
  }
}

void test_parallel_resolution_propagates_failure() {
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/data/ok", "ok\n");
  for (int i = 0; i < 6; ++i) mfs.put_file("/in/m" + std::to_string(i), "/data/ok\n");
  mfs.put_file("/in/m3", "/data/gone\n");
  symlinkio::ManifestResolver resolver(mfs, 3);
  expect(error_code_of([&] { resolver.resolve({"/in"}); }) ==
             symlinkio::ErrorCode::target_not_found,
         "failure in a worker reaches the caller");
}

void test_local_filesystem_listing() {
  TempDir dir("listing");
  write_file(dir.str("b"), "2");
  write_file(dir.str("a"), "1");
  write_file(dir.str("c/d"), "33");
  symlinkio::LocalFileSystem lfs(4);
  const auto entries = lfs.list(dir.str());
  expect(entries.size() == 3, "three children");
  expect(entries[0].path == dir.str("a") && entries[1].path == dir.str("b"), "sorted by name");
  expect(entries[2].is_directory, "directory flagged");

  write_file(dir.str("big"), std::string(10, 'q'));
  const auto st = lfs.stat(dir.str("big"));
  expect(st.has_value() && st->length == 10, "stat length");
  expect(st->blocks.size() == 3, "blocks synthesized every block_size bytes");
  expect(st->blocks[2].offset == 8 && st->blocks[2].length == 2, "last block is short");
  expect(st->blocks[0].hosts.size() == 1 && st->blocks[0].hosts[0] == "localhost",
         "local blocks hosted on localhost");
  expect(!lfs.stat(dir.str("absent")).has_value(), "missing path is nullopt");
}

void test_memory_filesystem_write_stream() {
  symlinkio::MemoryFileSystem mfs;
  {
    auto out = mfs.open_write("/w/file");
    *out << "hello\n";
  }
  const auto st = mfs.stat("/w/file");
  expect(st.has_value() && st->length == 6, "content committed on stream destruction");
  expect(mfs.stat("/w")->is_directory, "parent directory created");
  expect(mfs.remove("/w"), "remove subtree");
  expect(!mfs.stat("/w/file").has_value(), "subtree gone");
}

// ============================================================================
// Phase 2: Content summary
// ============================================================================

void test_scenario_b_content_summary() {
  TempDir dir("scenario_b");
  write_file(dir.str("data/A"), std::string(39, 'a') + "\n");
  write_file(dir.str("data/B"), std::string(41, 'b') + "\n");
  write_file(dir.str("in/manifest"), dir.str("data/A") + "\n" + dir.str("data/B") + "\n");

  symlinkio::LocalFileSystem lfs;
  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {dir.str("in")};
  const auto summary = symlinkio::get_content_summary(lfs, cfg);
  expect(summary.total_length == 82, "total length is the sum of target sizes");
  expect(summary.file_count == 2, "one file per reference");
  expect(summary.directory_count == 0, "no directories");
}

void test_summary_counts_duplicates() {
  std::vector<symlinkio::ResolvedTarget> targets{make_target("/x", 10), make_target("/x", 10),
                                                make_target("/y", 5)};
  const auto s = symlinkio::summarize(targets);
  expect(s.total_length == 25 && s.file_count == 3, "duplicate references counted twice");
  expect(symlinkio::summary_to_json(s) ==
             "{\"directory_count\":0,\"file_count\":3,\"total_length\":25}",
         "summary JSON is canonical");
}

void test_empty_root() {
  symlinkio::MemoryFileSystem mfs;
  mfs.mkdirs("/in");
  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {"/in"};
  const auto summary = symlinkio::get_content_summary(mfs, cfg);
  expect(summary.total_length == 0 && summary.file_count == 0, "empty input is not an error");
  const auto splits = symlinkio::get_splits(mfs, cfg);
  expect(splits.empty(), "empty input has no splits");
  expect(read_all_lines(mfs, splits).empty(), "and no records");
}

// ============================================================================
// Phase 3: Input validation
// ============================================================================

void test_no_input_paths() {
  // Any filesystem call would throw here: the root does not exist.
  symlinkio::MemoryFileSystem mfs;
  symlinkio::PlannerConfig cfg;

  std::string message;
  symlinkio::ErrorCode code = symlinkio::ErrorCode::none;
  try {
    symlinkio::get_splits(mfs, cfg);
  } catch (const symlinkio::Error& e) {
    message = e.what();
    code = e.code();
  }
  expect(code == symlinkio::ErrorCode::no_input_paths, "no_input_paths code");
  expect(message == "No input paths specified in job.", "exact no-input message");

  expect(error_code_of([&] { symlinkio::get_content_summary(mfs, cfg); }) ==
             symlinkio::ErrorCode::no_input_paths,
         "content summary checks input paths too");
}

void test_invalid_config_rejected_by_entry_points() {
  symlinkio::MemoryFileSystem mfs;
  mfs.mkdirs("/in");
  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {"/in"};
  cfg.min_split_size = 100;
  cfg.max_split_size = 10;
  expect(error_code_of([&] { symlinkio::get_splits(mfs, cfg); }) ==
             symlinkio::ErrorCode::config_invalid,
         "min > max rejected");
}

// ============================================================================
// Phase 4: Split planning
// ============================================================================

void test_split_size_formula() {
  symlinkio::SplitPlanner planner(symlinkio::SplitPlannerOptions{16, 0, 1.1});
  expect(planner.split_size(100, 64) == 64, "block size caps the goal");
  expect(planner.split_size(10, 64) == 16, "min split size floors the result");
  expect(planner.split_size(100, 0) == 100, "no block size: goal wins");

  symlinkio::SplitPlanner capped(symlinkio::SplitPlannerOptions{1, 50, 1.1});
  expect(capped.split_size(100, 0) == 50, "max split size caps the result");

  std::vector<symlinkio::ResolvedTarget> targets{make_target("/a", 60), make_target("/b", 40)};
  expect(symlinkio::SplitPlanner::goal_size(targets, 4) == 25, "goal = total / desired");
  expect(symlinkio::SplitPlanner::goal_size(targets, 0) == 100, "desired 0 treated as 1");
}

void test_slop_merges_small_tail() {
  symlinkio::SplitPlanner planner;
  const auto splits = planner.plan_target(make_target("/t", 105), 50);
  expect(splits.size() == 2, "5-byte tail merged (55/50 <= 1.1)");
  expect(splits[1].start == 50 && splits[1].length == 55, "tail absorbed by the last split");

  const auto more = planner.plan_target(make_target("/t", 106), 50);
  expect(more.size() == 3, "56/50 > 1.1 keeps cutting");
  expect(more[2].start == 100 && more[2].length == 6, "short tail split");
}

void test_splits_tile_each_target() {
  symlinkio::SplitPlanner planner(symlinkio::SplitPlannerOptions{1, 7, 1.1});
  std::vector<symlinkio::ResolvedTarget> targets{make_target("/a", 100, 16),
                                                make_target("/b", 3),
                                                make_target("/c", 41, 8)};
  const auto splits = planner.plan(targets, 3);
  for (const auto& t : targets) {
    std::uint64_t next = 0;
    for (const auto& s : splits) {
      if (s.target_path != t.path) continue;
      expect(s.start == next, "contiguous ranges for " + t.path);
      expect(s.length > 0, "no empty split for a non-empty target");
      next = s.end();
    }
    expect(next == t.length, "splits cover the whole target " + t.path);
  }
  expect(splits.front().target_path == "/a" && splits.back().target_path == "/c",
         "output in target order");
}

void test_empty_target_gets_empty_split() {
  symlinkio::SplitPlanner planner;
  const auto splits = planner.plan_target(make_target("/empty", 0), 10);
  expect(splits.size() == 1, "one split for an empty target");
  expect(splits[0].length == 0 && splits[0].hosts.empty(), "empty split, no hosts");
}

void test_host_hints_follow_blocks() {
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/data/t", std::string(100, 'x'), 40, {{"h1"}, {"h2"}, {"h3"}});
  mfs.put_file("/in/m", "/data/t\n");

  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {"/in"};
  auto splits = symlinkio::get_splits(mfs, cfg);
  expect(splits.size() == 3, "one split per block");
  expect(splits[0].hosts == std::vector<std::string>{"h1"}, "block 0 host");
  expect(splits[1].hosts == std::vector<std::string>{"h2"}, "block 1 host");
  expect(splits[2].hosts == std::vector<std::string>{"h3"}, "block 2 host");

  // 30-byte splits: cut at the 40-byte block end, last split straddles two blocks.
  cfg.max_split_size = 30;
  splits = symlinkio::get_splits(mfs, cfg);
  expect(splits.size() == 4, "four splits with block-end cuts");
  expect(splits[1].start == 30 && splits[1].length == 10, "split cut at block boundary");
  expect(splits[3].start == 70 && splits[3].length == 30, "tail split");
  expect((splits[3].hosts == std::vector<std::string>{"h2", "h3"}),
         "straddling split lists hosts of both blocks");
}

void test_compressed_split_hosts_cover_all_blocks() {
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/data/log.zst", std::string(90, 'z'), 40, {{"h1"}, {"h2", "h1"}, {"h3"}});
  mfs.put_file("/in/m", "/data/log.zst\n");
  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {"/in"};
  const auto splits = symlinkio::get_splits(mfs, cfg);
  expect(splits.size() == 1, "one split for the compressed target");
  expect((splits[0].hosts == std::vector<std::string>{"h1", "h2", "h3"}),
         "hosts of every block, deduplicated in block order");
}

void test_compressed_target_not_split() {
  symlinkio::SplitPlanner planner(symlinkio::SplitPlannerOptions{1, 10, 1.1});
  const auto splits = planner.plan_target(make_target("/data/part.zst", 500), 10);
  expect(splits.size() == 1, "compressed target planned as one split");
  expect(splits[0].length == 500 && !splits[0].splittable, "whole file, flagged non-splittable");
  expect(!symlinkio::is_splittable("/x.zst") && symlinkio::is_splittable("/x.txt"),
         "splittability by suffix");
}

// ============================================================================
// Phase 5: Record reading
// ============================================================================

void test_scenario_a_records() {
  TempDir dir("scenario_a");
  write_file(dir.str("data/A"), "a1\na2\n");
  write_file(dir.str("data/B"), "b1\nb2\n");
  write_file(dir.str("in/manifest"), dir.str("data/A") + "\n" + dir.str("data/B") + "\n");

  symlinkio::LocalFileSystem lfs;
  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {dir.str("in")};
  cfg.desired_splits = 2;
  const auto splits = symlinkio::get_splits(lfs, cfg);
  expect(splits.size() == 2, "one split per file");
  const auto lines = read_all_lines(lfs, splits);
  expect((lines == std::vector<std::string>{"a1", "a2", "b1", "b2"}),
         "records in manifest order, each line once");
}

void test_boundaries_at_every_split_size() {
  const std::string text = "alpha\nb\n\nccc\r\ndddddddddd\ne\r\nlast-without-newline";
  const auto expected = split_lines(text);
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/data/t", text);
  mfs.put_file("/in/m", "/data/t\n");

  for (std::uint64_t size = 1; size <= 12; ++size) {
    symlinkio::PlannerConfig cfg;
    cfg.input_paths = {"/in"};
    cfg.min_split_size = size;
    cfg.max_split_size = size;
    const auto splits = symlinkio::get_splits(mfs, cfg);
    expect(read_all_lines(mfs, splits) == expected,
           "every line exactly once at split size " + std::to_string(size));
  }
}

void test_record_positions() {
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/t", "ab\r\ncd\nef");
  symlinkio::SplitDescriptor split;
  split.target_path = "/t";
  split.start = 0;
  split.length = 9;
  auto reader = symlinkio::get_record_reader(mfs, split);
  symlinkio::Record rec;
  expect(reader->next(rec) && rec.position == 0 && rec.line == "ab", "first record");
  expect(reader->next(rec) && rec.position == 4 && rec.line == "cd", "offset counts the CR");
  expect(reader->next(rec) && rec.position == 7 && rec.line == "ef", "unterminated last line");
  expect(!reader->next(rec), "exhausted");
  expect(reader->progress() == 1.0, "progress complete");
}

void test_line_at_split_end_belongs_to_split() {
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/t", "aaa\nbbb\nccc\n");
  symlinkio::SplitDescriptor first;
  first.target_path = "/t";
  first.start = 0;
  first.length = 4;
  symlinkio::SplitDescriptor second = first;
  second.start = 4;
  second.length = 8;

  std::vector<std::string> a;
  std::vector<std::string> b;
  symlinkio::Record rec;
  for (auto r = symlinkio::get_record_reader(mfs, first); r->next(rec);) a.push_back(rec.line);
  for (auto r = symlinkio::get_record_reader(mfs, second); r->next(rec);) b.push_back(rec.line);
  expect((a == std::vector<std::string>{"aaa", "bbb"}), "line starting at end read by first");
  expect((b == std::vector<std::string>{"ccc"}), "second skips its leading line");
}

void test_reader_close_is_idempotent() {
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/t", "1\n2\n3\n");
  symlinkio::SplitDescriptor split;
  split.target_path = "/t";
  split.length = 6;

  const auto before = symlinkio::global_planner_stats().splits_read.load();
  auto reader = symlinkio::get_record_reader(mfs, split);
  symlinkio::Record rec;
  expect(reader->next(rec) && rec.line == "1", "read one record");
  reader->close();
  reader->close();
  expect(!reader->next(rec), "closed reader yields nothing");
  reader.reset();
  expect(symlinkio::global_planner_stats().splits_read.load() == before + 1,
         "early close reported once");
}

void test_missing_target_at_read_time() {
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/data/t", "x\n");
  mfs.put_file("/in/m", "/data/t\n");
  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {"/in"};
  const auto splits = symlinkio::get_splits(mfs, cfg);
  mfs.remove("/data/t");
  expect(error_code_of([&] { symlinkio::get_record_reader(mfs, splits[0]); }) ==
             symlinkio::ErrorCode::io_error,
         "vanished target is an I/O error");
}

void test_direct_format() {
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/raw/p1", "one\ntwo\n");
  mfs.put_file("/raw/p2", "three\n");
  mfs.put_file("/raw/_SUCCESS", "");
  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {"/raw"};
  cfg.format = symlinkio::InputFormatKind::direct;
  const auto summary = symlinkio::get_content_summary(mfs, cfg);
  expect(summary.file_count == 2 && summary.total_length == 14, "direct summary");
  const auto lines = read_all_lines(mfs, symlinkio::get_splits(mfs, cfg));
  expect((lines == std::vector<std::string>{"one", "two", "three"}), "direct records");

  const symlinkio::InputFormat format = symlinkio::SymlinkFormat{};
  cfg.format = symlinkio::InputFormatKind::symlink;
  mfs.put_file("/lists/m", "/raw/p2\n");
  cfg.input_paths = {"/lists"};
  const auto splits = symlinkio::get_splits(format, mfs, cfg);
  expect(splits.size() == 1 && splits[0].target_path == "/raw/p2", "symlink format variant");
}

void test_zstd_target() {
  symlinkio::MemoryFileSystem mfs;
  const std::string plain = "first\nsecond\nthird\n";
#if defined(SYMLINKIO_WITH_ZSTD)
  std::string packed(ZSTD_compressBound(plain.size()), '\0');
  const size_t n = ZSTD_compress(packed.data(), packed.size(), plain.data(), plain.size(), 3);
  expect(!ZSTD_isError(n), "compress fixture");
  packed.resize(n);
#else
  const std::string packed = "not really compressed";
#endif
  mfs.put_file("/data/log.zst", packed);
  mfs.put_file("/in/m", "/data/log.zst\n");
  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {"/in"};
  cfg.max_split_size = 4;
  const auto splits = symlinkio::get_splits(mfs, cfg);
  expect(splits.size() == 1 && !splits[0].splittable, "one split for a compressed target");

#if defined(SYMLINKIO_WITH_ZSTD)
  expect(symlinkio::zstd_available(), "zstd linked");
  const auto lines = read_all_lines(mfs, splits);
  expect((lines == std::vector<std::string>{"first", "second", "third"}),
         "decompressed records");
#else
  expect(error_code_of([&] { symlinkio::get_record_reader(mfs, splits[0]); }) ==
             symlinkio::ErrorCode::compression_unavailable,
         "compressed split unreadable without zstd");
#endif
}

// ============================================================================
// Phase 6: Split wire format
// ============================================================================

void test_split_json_roundtrip() {
  symlinkio::SplitDescriptor s;
  s.target_path = "/data/t";
  s.start = 64;
  s.length = 32;
  s.hosts = {"h1", "h2"};
  s.manifest_path = "/in/m";
  const std::string json = symlinkio::split_to_json(s);
  expect(json ==
             "{\"hosts\":[\"h1\",\"h2\"],\"length\":32,\"manifest\":\"/in/m\","
             "\"path\":\"/data/t\",\"splittable\":true,\"start\":64,\"v\":1}",
         "canonical split JSON");
  expect(symlinkio::split_from_json(json) == s, "split survives serialization");
  expect(symlinkio::split_id(s).size() == 64, "split id is 64 hex chars");
  expect(symlinkio::split_id(s) == symlinkio::split_id(symlinkio::split_from_json(json)),
         "split id stable across processes");
}

void test_split_json_rejects_bad_input() {
  auto code = [](const std::string& json) {
    return error_code_of([&] { symlinkio::split_from_json(json); });
  };
  expect(code("{") == symlinkio::ErrorCode::split_invalid, "malformed JSON");
  expect(code("{\"v\":2,\"path\":\"/t\",\"start\":0,\"length\":1}") ==
             symlinkio::ErrorCode::split_invalid,
         "newer format version rejected");
  expect(code("{\"v\":1,\"path\":\"/t\"}") == symlinkio::ErrorCode::split_invalid,
         "missing range rejected");
  expect(code("{\"v\":1,\"start\":0,\"length\":1}") == symlinkio::ErrorCode::split_invalid,
         "missing path rejected");
}

void test_jsonlite_strings_and_numbers() {
  namespace json = symlinkio::jsonlite;
  std::optional<json::JsonError> err;
  auto obj = json::parse("{\"s\":\"caf\\u00e9 \\ud83d\\ude00\",\"n\":-3,\"u\":42,\"d\":1e2}", &err);
  expect(!err, "valid document");
  expect(json::get_string(obj, "s") == "caf\xc3\xa9 \xf0\x9f\x98\x80", "\\u escapes decoded to UTF-8");
  expect(obj.at("n").is<double>(), "negative integer held as double");
  expect(json::get_u64(obj, "n", 7) == 7, "negative integer is not a count");
  expect(json::get_u64(obj, "u") == 42, "non-negative integer is a count");
  expect(json::get_double(obj, "d") == 100.0, "exponent form");

  json::Object out;
  out["path"] = std::string("a\"b\x01" "c");
  out["slop"] = 1.1;
  out["whole"] = 2.0;
  const std::string text = json::to_json(json::Value{out});
  expect(text == "{\"path\":\"a\\\"b\\u0001c\",\"slop\":1.1,\"whole\":2.0}",
         "quotes and control characters escaped, doubles stay doubles");
  const auto back = json::parse(text, &err);
  expect(!err && json::get_string(back, "path") == "a\"b\x01" "c", "escaped string reads back");
  expect(back.at("whole").is<double>(), "2.0 reads back as double");
}

void test_jsonlite_rejects_bad_documents() {
  namespace json = symlinkio::jsonlite;
  std::optional<json::JsonError> err;
  json::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key");
  json::parse("[1,2]", &err);
  expect(err && err->code == "json_parse_error", "top level must be an object");
  json::parse("{\"a\":01x}", &err);
  expect(err.has_value(), "trailing garbage after a number");
  json::parse("{\"a\":\"\\ud800\"}", &err);
  expect(err.has_value(), "unpaired surrogate");
  json::parse("{\"a\":99999999999999999999999}", &err);
  expect(err.has_value(), "integer overflow");
  expect(json::validate(std::string(100, '[') + std::string(100, ']')).has_value(),
         "nesting bound enforced");
  expect(!json::validate("[[[]]]").has_value(), "shallow nesting accepted");
}

void test_plan_digest_is_order_sensitive() {
  symlinkio::SplitPlanner planner;
  auto splits = planner.plan({make_target("/a", 10), make_target("/b", 10)}, 2);
  const std::string d1 = symlinkio::plan_digest(splits);
  expect(d1 == symlinkio::plan_digest(splits), "plan digest deterministic");
  std::swap(splits[0], splits[1]);
  expect(d1 != symlinkio::plan_digest(splits), "reordered plan has a different digest");
}

void test_hash_domains() {
  expect(symlinkio::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(symlinkio::hash_domain("split:", "x") != symlinkio::hash_domain("plan:", "x"),
         "domains separate digests");
  expect(symlinkio::hash_domain_parts("plan:", {"ab", "c"}) !=
             symlinkio::hash_domain_parts("plan:", {"a", "bc"}),
         "length-prefixed parts do not collide");
}

// ============================================================================
// Phase 7: Configuration
// ============================================================================

void test_config_json() {
  symlinkio::ConfigValidationResult r;
  const auto cfg = symlinkio::parse_config_json(
      "{\"input_paths\":[\"/in\"],\"format\":\"direct\",\"desired_splits\":8,"
      "\"split_slop\":1.5,\"colour\":\"blue\"}",
      &r);
  expect(r.ok, "valid config");
  expect(r.warnings.size() == 1, "unknown key warned");
  expect(cfg.input_paths.size() == 1 && cfg.input_paths[0] == "/in", "input paths");
  expect(cfg.format == symlinkio::InputFormatKind::direct, "format");
  expect(cfg.desired_splits == 8 && cfg.split_slop == 1.5, "numeric fields");

  const auto again = symlinkio::load_config_json(symlinkio::config_to_json(cfg));
  expect(again.desired_splits == 8 && again.format == symlinkio::InputFormatKind::direct,
         "config JSON round trip");
}

void test_config_rejections() {
  auto code = [](const std::string& json) {
    return error_code_of([&] { symlinkio::load_config_json(json); });
  };
  expect(code("{\"split_slop\":0.5}") == symlinkio::ErrorCode::config_invalid, "slop < 1");
  expect(code("{\"min_split_size\":10,\"max_split_size\":5}") ==
             symlinkio::ErrorCode::config_invalid,
         "min > max");
  expect(code("{\"format\":\"parquet\"}") == symlinkio::ErrorCode::config_invalid,
         "unknown format");
  expect(code("{\"desired_splits\":\"many\"}") == symlinkio::ErrorCode::config_invalid,
         "non-numeric value");
  expect(code("not json") == symlinkio::ErrorCode::config_invalid, "unparsable JSON");
}

void test_config_rejects_mistyped_values() {
  auto parsed = [](const std::string& json) {
    symlinkio::ConfigValidationResult r;
    symlinkio::parse_config_json(json, &r);
    return r;
  };
  auto r = parsed("{\"min_split_size\":-5}");
  expect(!r.ok && r.errors.size() == 1, "negative count rejected");
  expect(r.errors[0].find("min_split_size") != std::string::npos, "error names the field");

  r = parsed("{\"desired_splits\":2.5}");
  expect(!r.ok, "fractional count rejected");

  r = parsed("{\"input_paths\":[\"/in\",7]}");
  expect(!r.ok, "non-string input path rejected");
  expect(r.errors[0].find("input_paths[1]") != std::string::npos, "error names the element");

  r = parsed("{\"input_paths\":\"/in\"}");
  expect(!r.ok, "input_paths must be an array");

  r = parsed("{\"split_slop\":2,\"max_split_size\":0}");
  expect(r.ok, "integer slop and zero max are valid");
}

void test_config_block_size_caps_unblocked_targets() {
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/data/t", std::string(100, 'x'));  // no block structure reported
  mfs.put_file("/in/m", "/data/t\n");

  auto cfg = symlinkio::load_config_json("{\"input_paths\":[\"/in\"],\"block_size\":30}");
  auto splits = symlinkio::get_splits(mfs, cfg);
  expect(splits.size() == 4, "configured block size caps the split size");
  expect(splits[0].length == 30 && splits[3].start == 90 && splits[3].length == 10,
         "30-byte splits plus the 10-byte tail");

  // A block size the filesystem reports wins over the configured one.
  mfs.put_file("/data/t", std::string(100, 'x'), 50);
  splits = symlinkio::get_splits(mfs, cfg);
  expect(splits.size() == 2 && splits[0].length == 50, "reported block size used");

  ::setenv("SYMLINKIO_BLOCK_SIZE", "25", 1);
  symlinkio::apply_env_overrides(cfg);
  ::unsetenv("SYMLINKIO_BLOCK_SIZE");
  expect(cfg.block_size == 25, "block size from env");
}

void test_env_overrides() {
  ::setenv("SYMLINKIO_MIN_SPLIT_SIZE", "128", 1);
  ::setenv("SYMLINKIO_SPLIT_SLOP", "1.25", 1);
  ::setenv("SYMLINKIO_RESOLVER_THREADS", "bogus", 1);
  symlinkio::PlannerConfig cfg;
  symlinkio::apply_env_overrides(cfg);
  ::unsetenv("SYMLINKIO_MIN_SPLIT_SIZE");
  ::unsetenv("SYMLINKIO_SPLIT_SLOP");
  ::unsetenv("SYMLINKIO_RESOLVER_THREADS");
  expect(cfg.min_split_size == 128, "min split size from env");
  expect(cfg.split_slop == 1.25, "slop from env");
  expect(cfg.resolver_threads == 1, "unparsable value ignored");
}

// ============================================================================
// Phase 8: Observability
// ============================================================================

std::atomic<int> g_hook_calls{0};
std::string g_last_operation;
bool g_last_ok = false;
std::uint64_t g_last_duration_ns = 0;

void counting_hook(const symlinkio::PlanningEvent& ev) {
  g_hook_calls.fetch_add(1);
  g_last_operation = ev.operation;
  g_last_ok = ev.ok;
  g_last_duration_ns = ev.duration_ns;
}

void test_event_hook() {
  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/data/t", "x\n");
  mfs.put_file("/in/m", "/data/t\n");
  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {"/in"};

  g_hook_calls = 0;
  symlinkio::set_planning_event_hook(&counting_hook);
  const auto splits = symlinkio::get_splits(mfs, cfg);
  expect(g_hook_calls == 1 && g_last_operation == "get_splits" && g_last_ok, "plan event");
  read_all_lines(mfs, splits);
  expect(g_hook_calls == 2 && g_last_operation == "read_split", "read event on close");

  symlinkio::PlannerConfig empty;
  expect(error_code_of([&] { symlinkio::get_splits(mfs, empty); }) ==
             symlinkio::ErrorCode::no_input_paths,
         "failure still thrown");
  expect(g_hook_calls == 3 && !g_last_ok, "failure event emitted");
  symlinkio::set_planning_event_hook(nullptr);
}

void test_event_log_jsonl() {
  TempDir dir("event_log");
  const std::string log = dir.str("events.jsonl");
  ::setenv("SYMLINKIO_EVENT_LOG", log.c_str(), 1);

  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/data/t", "abc\n");
  mfs.put_file("/in/m", "/data/t\n");
  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {"/in"};
  symlinkio::get_content_summary(mfs, cfg);
  symlinkio::get_splits(mfs, cfg);
  ::unsetenv("SYMLINKIO_EVENT_LOG");

  std::ifstream ifs(log);
  std::vector<std::string> lines;
  for (std::string line; std::getline(ifs, line);) lines.push_back(line);
  expect(lines.size() == 2, "one line per operation");
  for (const auto& line : lines) {
    expect(!symlinkio::jsonlite::validate(line).has_value(), "each line is valid JSON");
  }
  std::optional<symlinkio::jsonlite::JsonError> err;
  const auto first = symlinkio::jsonlite::parse(lines[0], &err);
  expect(symlinkio::jsonlite::get_string(first, "operation") == "content_summary", "operation");
  expect(symlinkio::jsonlite::get_u64(first, "total_bytes") == 4, "bytes recorded");
  const auto second = symlinkio::jsonlite::parse(lines[1], &err);
  expect(symlinkio::jsonlite::get_string(second, "plan_digest").size() == 64, "plan digest logged");
  expect(first.count("duration_ns") == 1 && second.count("duration_ns") == 1,
         "durations logged");
}

void test_stopwatch_measures_operations() {
  const symlinkio::Stopwatch timer;
  const std::uint64_t a = timer.elapsed_ns();
  const std::uint64_t b = timer.elapsed_ns();
  expect(b >= a, "elapsed time never decreases");

  symlinkio::MemoryFileSystem mfs;
  mfs.put_file("/data/t", "x\n");
  mfs.put_file("/in/m", "/data/t\n");
  symlinkio::PlannerConfig cfg;
  cfg.input_paths = {"/in"};
  g_hook_calls = 0;
  symlinkio::set_planning_event_hook(&counting_hook);
  symlinkio::get_splits(mfs, cfg);
  symlinkio::set_planning_event_hook(nullptr);
  expect(g_hook_calls == 1, "one event per operation");
  expect(g_last_duration_ns <= timer.elapsed_ns(), "operation duration bounded by wall time");
}

void test_stats_and_histogram() {
  symlinkio::LatencyHistogram h;
  for (int i = 0; i < 100; ++i) h.record(5000);  // 5us
  expect(h.count() == 100, "histogram count");
  expect(h.percentile(0.5) > 0.0, "percentile non-zero");

  const std::string json = symlinkio::global_planner_stats().to_json();
  expect(!symlinkio::jsonlite::validate(json).has_value(), "stats JSON valid");
  expect(json.find("\"plans\"") != std::string::npos, "plans counter serialized");
}

void test_version_manifest() {
  const auto m = symlinkio::version::current_manifest();
  expect(m.split_format == symlinkio::version::SPLIT_FORMAT_VERSION, "split format version");
  expect(m.hash_primitive == "blake3", "hash primitive");
  expect(m.zstd_enabled == symlinkio::zstd_available(), "zstd flag matches build");
  const std::string json = symlinkio::version::manifest_to_json(m);
  expect(!symlinkio::jsonlite::validate(json).has_value(), "manifest JSON valid");
}

void test_version_manifest_escapes_fields() {
  auto m = symlinkio::version::current_manifest();
  m.library_semver = "1.0 \"rc\"";
  std::optional<symlinkio::jsonlite::JsonError> err;
  const auto obj = symlinkio::jsonlite::parse(symlinkio::version::manifest_to_json(m), &err);
  expect(!err, "manifest with quotes is valid JSON");
  expect(symlinkio::jsonlite::get_string(obj, "library_semver") == "1.0 \"rc\"",
         "semver survives serialization");
  expect(symlinkio::jsonlite::get_u64(obj, "split_format") ==
             symlinkio::version::SPLIT_FORMAT_VERSION,
         "split format version serialized as a count");
}

}  // namespace

int main() {
  std::cout << "=== symlinkio test suite ===\n";

  std::cout << "\n[Phase 1] Manifest resolution\n";
  run_test("parse manifest text", test_parse_manifest_text);
  run_test("hidden names", test_hidden_names);
  run_test("resolver order + duplicates", test_resolver_order_and_duplicates);
  run_test("missing + directory targets", test_resolver_missing_and_directory_targets);
  run_test("parallel resolution preserves order", test_parallel_resolution_preserves_order);
  run_test("parallel resolution propagates failure", test_parallel_resolution_propagates_failure);
  run_test("local filesystem listing + blocks", test_local_filesystem_listing);
  run_test("memory filesystem write stream", test_memory_filesystem_write_stream);

  std::cout << "\n[Phase 2] Content summary\n";
  run_test("scenario B summary", test_scenario_b_content_summary);
  run_test("duplicates counted", test_summary_counts_duplicates);
  run_test("empty input root", test_empty_root);

  std::cout << "\n[Phase 3] Input validation\n";
  run_test("no input paths", test_no_input_paths);
  run_test("invalid config rejected", test_invalid_config_rejected_by_entry_points);

  std::cout << "\n[Phase 4] Split planning\n";
  run_test("split size formula", test_split_size_formula);
  run_test("slop merges small tail", test_slop_merges_small_tail);
  run_test("splits tile each target", test_splits_tile_each_target);
  run_test("empty target", test_empty_target_gets_empty_split);
  run_test("host hints follow blocks", test_host_hints_follow_blocks);
  run_test("compressed split hosts", test_compressed_split_hosts_cover_all_blocks);
  run_test("compressed target not split", test_compressed_target_not_split);

  std::cout << "\n[Phase 5] Record reading\n";
  run_test("scenario A records", test_scenario_a_records);
  run_test("boundaries at every split size", test_boundaries_at_every_split_size);
  run_test("record positions", test_record_positions);
  run_test("line at split end", test_line_at_split_end_belongs_to_split);
  run_test("close is idempotent", test_reader_close_is_idempotent);
  run_test("missing target at read time", test_missing_target_at_read_time);
  run_test("direct format", test_direct_format);
  run_test("zstd target", test_zstd_target);

  std::cout << "\n[Phase 6] Split wire format\n";
  run_test("split JSON round trip", test_split_json_roundtrip);
  run_test("split JSON rejects bad input", test_split_json_rejects_bad_input);
  run_test("jsonlite strings + numbers", test_jsonlite_strings_and_numbers);
  run_test("jsonlite rejects bad documents", test_jsonlite_rejects_bad_documents);
  run_test("plan digest order-sensitive", test_plan_digest_is_order_sensitive);
  run_test("hash domains", test_hash_domains);

  std::cout << "\n[Phase 7] Configuration\n";
  run_test("config JSON", test_config_json);
  run_test("config rejections", test_config_rejections);
  run_test("config rejects mistyped values", test_config_rejects_mistyped_values);
  run_test("config block size caps unblocked targets", test_config_block_size_caps_unblocked_targets);
  run_test("env overrides", test_env_overrides);

  std::cout << "\n[Phase 8] Observability\n";
  run_test("event hook", test_event_hook);
  run_test("event log JSONL", test_event_log_jsonl);
  run_test("stopwatch measures operations", test_stopwatch_measures_operations);
  run_test("stats + histogram", test_stats_and_histogram);
  run_test("version manifest", test_version_manifest);
  run_test("version manifest escapes fields", test_version_manifest_escapes_fields);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
