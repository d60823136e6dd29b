#include "symlinkio/record_reader.hpp"

#include <algorithm>

#include "symlinkio/compression.hpp"
#include "symlinkio/observability.hpp"

namespace symlinkio {

// ---------------------------------------------------------------------------
// LineRecordReader
// ---------------------------------------------------------------------------

LineRecordReader::LineRecordReader(std::unique_ptr<std::istream> in, std::uint64_t start,
                                   std::uint64_t end, std::string name)
    : in_(std::move(in)), start_(start), end_(std::max(start, end)), pos_(start),
      name_(std::move(name)) {
  if (!in_) throw Error(ErrorCode::io_error, "No stream for " + name_);
  if (start_ == 0) return;

  in_->seekg(static_cast<std::streamoff>(start_));
  if (in_->fail()) {
    throw Error(ErrorCode::io_error,
                "Cannot seek to offset " + std::to_string(start_) + " in " + name_);
  }
  // The fragment up to the first '\n' was read by the previous split.
  std::string fragment;
  pos_ += read_line(fragment);
}

LineRecordReader::~LineRecordReader() { close(); }

std::uint64_t LineRecordReader::read_line(std::string& text) {
  text.clear();
  if (in_->peek() == std::char_traits<char>::eof()) {
    if (in_->bad()) throw Error(ErrorCode::io_error, "Read failed: " + name_);
    return 0;
  }
  std::getline(*in_, text);
  if (in_->bad()) throw Error(ErrorCode::io_error, "Read failed: " + name_);

  std::uint64_t consumed = text.size();
  if (!in_->eof()) {
    ++consumed;  // '\n'
    if (!text.empty() && text.back() == '\r') text.pop_back();
  }
  return consumed;
}

bool LineRecordReader::next(Record& out) {
  if (done_) return false;
  if (pos_ > end_) {
    done_ = true;
    return false;
  }
  std::string text;
  const std::uint64_t line_start = pos_;
  const std::uint64_t consumed = read_line(text);
  if (consumed == 0) {
    done_ = true;
    return false;
  }
  pos_ += consumed;
  out.position = line_start;
  out.line = std::move(text);
  return true;
}

double LineRecordReader::progress() const {
  if (done_) return 1.0;
  if (end_ == kUnbounded || end_ == start_) return 0.0;
  const double fraction =
      static_cast<double>(pos_ - start_) / static_cast<double>(end_ - start_);
  return std::min(1.0, fraction);
}

void LineRecordReader::close() {
  in_.reset();
  done_ = true;
}

// ---------------------------------------------------------------------------
// SplitRecordReader
// ---------------------------------------------------------------------------

SplitRecordReader::SplitRecordReader(const FileSystem& fs, const SplitDescriptor& split)
    : split_(split) {
  auto in = fs.open_read(split_.target_path);
  if (is_zstd_path(split_.target_path)) {
    if (split_.start != 0) {
      throw Error(ErrorCode::split_invalid,
                  "Compressed target cannot be read from offset " +
                      std::to_string(split_.start) + ": " + split_.target_path);
    }
    // Offsets refer to the decompressed stream, which has no known end.
    in = open_zstd_stream(std::move(in), split_.target_path);
    reader_ = std::make_unique<LineRecordReader>(std::move(in), 0,
                                                 LineRecordReader::kUnbounded,
                                                 split_.target_path);
    return;
  }
  reader_ = std::make_unique<LineRecordReader>(std::move(in), split_.start, split_.end(),
                                               split_.target_path);
}

SplitRecordReader::~SplitRecordReader() { close(); }

bool SplitRecordReader::next(Record& out) {
  if (closed_) return false;
  try {
    if (!reader_->next(out)) return false;
  } catch (const Error& e) {
    failure_ = e.code();
    failure_detail_ = e.what();
    throw;
  }
  ++records_;
  return true;
}

double SplitRecordReader::progress() const {
  return closed_ ? final_progress_ : reader_->progress();
}

void SplitRecordReader::close() {
  if (closed_) return;
  closed_ = true;
  final_progress_ = reader_->progress();
  bytes_ = reader_->position() - (is_zstd_path(split_.target_path) ? 0 : split_.start);
  reader_->close();

  PlanningEvent ev;
  ev.operation = "read_split";
  ev.ok = failure_ == ErrorCode::none;
  if (!ev.ok) {
    ev.error_code = to_string(failure_);
    ev.error_detail = failure_detail_;
  }
  ev.targets = 1;
  ev.splits = 1;
  ev.records = records_;
  ev.total_bytes = bytes_;
  ev.target_path = split_.target_path;
  ev.duration_ns = opened_.elapsed_ns();
  emit_planning_event(ev);
}

}  // namespace symlinkio
