#pragma once

#include <istream>
#include <memory>
#include <string>

namespace symlinkio {

// True when the target path names a zstd frame sequence (".zst").
bool is_zstd_path(const std::string& path);

// True if this build links zstd (SYMLINKIO_WITH_ZSTD).
bool zstd_available();

// Wrap a compressed stream in a stream of the decompressed bytes. Takes
// ownership of source. Throws Error(compression_unavailable) when built
// without zstd; decompression errors surface as Error(io_error) from reads.
std::unique_ptr<std::istream> open_zstd_stream(std::unique_ptr<std::istream> source,
                                               const std::string& name);

}  // namespace symlinkio
