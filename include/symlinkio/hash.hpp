#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace symlinkio {

// Core BLAKE3 hashing. All digests are 64-char lowercase hex.
std::string blake3_hex(std::string_view payload);

// Version string of the linked BLAKE3 library.
std::string hash_backend_version();

// Domain-separated hashing. The domain prefix is part of the digest schema:
// "split:" for split ids, "plan:" for whole-plan digests.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Domain-separated digest over an ordered list of parts. Each part is fed
// length-prefixed so ("ab","c") and ("a","bc") never collide.
std::string hash_domain_parts(std::string_view domain, const std::vector<std::string>& parts);

}  // namespace symlinkio
