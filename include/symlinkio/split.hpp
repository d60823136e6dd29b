#pragma once

// symlinkio/split.hpp: SplitDescriptor wire format and identity.
//
// A split travels to its worker as canonical JSON:
//   {"hosts":[...],"length":N,"manifest":"...","path":"...",
//    "splittable":true,"start":N,"v":1}
// Keys are sorted (jsonlite canonical form), so the same split always
// serializes to the same bytes and split_id() is stable across processes.

#include <string>
#include <vector>

#include "symlinkio/types.hpp"

namespace symlinkio {

std::string split_to_json(const SplitDescriptor& split);

// Throws Error(split_invalid) on malformed input or a newer format version.
SplitDescriptor split_from_json(const std::string& json);

// BLAKE3("split:" + canonical JSON), 64 hex chars.
std::string split_id(const SplitDescriptor& split);

// BLAKE3 over the ordered split ids with the "plan:" domain. Two plans with
// the same splits in a different order have different digests.
std::string plan_digest(const std::vector<SplitDescriptor>& splits);

}  // namespace symlinkio
