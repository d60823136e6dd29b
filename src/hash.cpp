#include "symlinkio/hash.hpp"

// BLAKE3 is the sole hash primitive. Split ids and plan digests only need to
// be stable across processes and builds so a remote worker and the planner
// agree on which split is which.
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) rather than
// snprintf("%02x"), which pays for format-string parsing on every byte.

#include <array>
#include <cstdint>

extern "C" {
#include <blake3.h>
}

namespace symlinkio {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace

std::string hash_backend_version() {
  const char* v = blake3_version();
  return v ? v : "unknown";
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_domain_parts(std::string_view domain, const std::vector<std::string>& parts) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  for (const auto& part : parts) {
    // 8-byte little-endian length prefix.
    unsigned char len[8];
    std::uint64_t n = part.size();
    for (int i = 0; i < 8; ++i) {
      len[i] = static_cast<unsigned char>(n & 0xff);
      n >>= 8;
    }
    blake3_hasher_update(&hasher, len, sizeof(len));
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  return finalize_hex(hasher);
}

}  // namespace symlinkio
