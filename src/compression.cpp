#include "symlinkio/compression.hpp"

#include <streambuf>
#include <vector>

#if defined(SYMLINKIO_WITH_ZSTD)
#include <zstd.h>
#endif

#include "symlinkio/types.hpp"

namespace symlinkio {

bool is_zstd_path(const std::string& path) {
  static const std::string kSuffix = ".zst";
  return path.size() >= kSuffix.size() &&
         path.compare(path.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0;
}

#if defined(SYMLINKIO_WITH_ZSTD)

namespace {

// Pull-mode streambuf: refills the compressed input buffer from source_ and
// runs ZSTD_decompressStream into out_ on every underflow().
class ZstdStreambuf : public std::streambuf {
 public:
  ZstdStreambuf(std::unique_ptr<std::istream> source, std::string name)
      : source_(std::move(source)),
        name_(std::move(name)),
        dctx_(ZSTD_createDCtx(), &ZSTD_freeDCtx),
        in_(ZSTD_DStreamInSize()),
        out_(ZSTD_DStreamOutSize()) {
    if (!dctx_) throw Error(ErrorCode::io_error, "Cannot allocate zstd context for " + name_);
    setg(out_.data(), out_.data(), out_.data());
  }

 protected:
  int_type underflow() override {
    if (gptr() < egptr()) return traits_type::to_int_type(*gptr());
    while (true) {
      if (in_pos_ == in_len_) {
        if (source_eof_) {
          if (frame_pending_) {
            throw Error(ErrorCode::io_error, "Truncated zstd stream: " + name_);
          }
          return traits_type::eof();
        }
        source_->read(in_.data(), static_cast<std::streamsize>(in_.size()));
        in_len_ = static_cast<size_t>(source_->gcount());
        in_pos_ = 0;
        if (source_->bad()) throw Error(ErrorCode::io_error, "Read failed: " + name_);
        if (in_len_ == 0) {
          source_eof_ = true;
          continue;
        }
      }
      ZSTD_inBuffer input{in_.data(), in_len_, in_pos_};
      ZSTD_outBuffer output{out_.data(), out_.size(), 0};
      const size_t rc = ZSTD_decompressStream(dctx_.get(), &output, &input);
      if (ZSTD_isError(rc)) {
        throw Error(ErrorCode::io_error,
                    "zstd decompression failed for " + name_ + ": " + ZSTD_getErrorName(rc));
      }
      in_pos_ = input.pos;
      frame_pending_ = rc != 0;
      if (output.pos > 0) {
        setg(out_.data(), out_.data(), out_.data() + output.pos);
        return traits_type::to_int_type(*gptr());
      }
    }
  }

 private:
  std::unique_ptr<std::istream> source_;
  std::string name_;
  std::unique_ptr<ZSTD_DCtx, size_t (*)(ZSTD_DCtx*)> dctx_;
  std::vector<char> in_;
  std::vector<char> out_;
  size_t in_len_{0};
  size_t in_pos_{0};
  bool source_eof_{false};
  bool frame_pending_{false};
};

class ZstdInputStream : public std::istream {
 public:
  ZstdInputStream(std::unique_ptr<std::istream> source, std::string name)
      : std::istream(nullptr), buf_(std::move(source), std::move(name)) {
    init(&buf_);
    // Let Error thrown from underflow() reach the caller instead of being
    // turned into badbit.
    exceptions(std::ios::badbit);
  }

 private:
  ZstdStreambuf buf_;
};

}  // namespace

bool zstd_available() { return true; }

std::unique_ptr<std::istream> open_zstd_stream(std::unique_ptr<std::istream> source,
                                               const std::string& name) {
  return std::make_unique<ZstdInputStream>(std::move(source), name);
}

#else

bool zstd_available() { return false; }

std::unique_ptr<std::istream> open_zstd_stream(std::unique_ptr<std::istream> /*source*/,
                                               const std::string& name) {
  throw Error(ErrorCode::compression_unavailable,
              "Built without zstd support, cannot read " + name);
}

#endif

}  // namespace symlinkio
