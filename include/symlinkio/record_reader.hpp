#pragma once

// symlinkio/record_reader.hpp: line records of one split.
//
// BOUNDARY RULES (what makes adjacent splits agree without coordinating):
//   - A reader whose split starts past offset 0 discards everything up to and
//     including the first '\n'. That fragment belongs to the previous split.
//   - A reader keeps starting new lines while the line start is <= end, so a
//     line beginning exactly at end, or straddling it, is read here in full.
//   Together: every line of a target is returned by exactly one split.
//
// RESOURCE MODEL:
//   A SplitRecordReader owns its stream. close() drops it, is idempotent and
//   runs from the destructor, so an abandoned or failed reader never keeps a
//   handle open. Readers are single-consumer; never share one across threads.

#include <cstdint>
#include <istream>
#include <limits>
#include <memory>
#include <string>

#include "symlinkio/filesystem.hpp"
#include "symlinkio/observability.hpp"
#include "symlinkio/types.hpp"

namespace symlinkio {

// Lazy, finite, non-restartable sequence of (position, line) records.
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  // Fills out and returns true, or returns false once exhausted.
  virtual bool next(Record& out) = 0;

  // Fraction of the split consumed, in [0, 1].
  virtual double progress() const = 0;

  virtual void close() = 0;
};

// Lines of [start, end] over a stream positioned anywhere. Throws
// Error(io_error) if the stream cannot be positioned or fails mid-read.
class LineRecordReader : public RecordSource {
 public:
  static constexpr std::uint64_t kUnbounded = std::numeric_limits<std::uint64_t>::max();

  LineRecordReader(std::unique_ptr<std::istream> in, std::uint64_t start, std::uint64_t end,
                   std::string name);
  ~LineRecordReader() override;

  bool next(Record& out) override;
  double progress() const override;
  void close() override;

  // Byte offset of the next unread byte.
  std::uint64_t position() const { return pos_; }

 private:
  // Reads one line into text. Returns bytes consumed, 0 at end of stream.
  std::uint64_t read_line(std::string& text);

  std::unique_ptr<std::istream> in_;
  std::uint64_t start_;
  std::uint64_t end_;
  std::uint64_t pos_;
  std::string name_;
  bool done_{false};
};

// The per-split reader handed to execution workers. Opens the target named by
// the split, decompresses non-splittable .zst targets, and emits one
// "read_split" PlanningEvent when closed.
class SplitRecordReader : public RecordSource {
 public:
  // Throws Error(io_error) if the target cannot be opened, and
  // Error(compression_unavailable) for a .zst target without zstd support.
  SplitRecordReader(const FileSystem& fs, const SplitDescriptor& split);
  ~SplitRecordReader() override;

  SplitRecordReader(const SplitRecordReader&) = delete;
  SplitRecordReader& operator=(const SplitRecordReader&) = delete;

  bool next(Record& out) override;
  double progress() const override;
  void close() override;

  const SplitDescriptor& split() const { return split_; }
  std::uint64_t records_read() const { return records_; }

 private:
  SplitDescriptor split_;
  std::unique_ptr<LineRecordReader> reader_;
  std::uint64_t records_{0};
  std::uint64_t bytes_{0};
  Stopwatch opened_;
  double final_progress_{0.0};
  ErrorCode failure_{ErrorCode::none};
  std::string failure_detail_;
  bool closed_{false};
};

}  // namespace symlinkio
