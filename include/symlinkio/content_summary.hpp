#pragma once

#include <string>
#include <vector>

#include "symlinkio/types.hpp"

namespace symlinkio {

// Pure reduction over already-resolved metadata. Every reference counts,
// duplicates included. directory_count is always 0: a target that resolves
// to a directory never gets this far.
ContentSummary summarize(const std::vector<ResolvedTarget>& targets);

std::string summary_to_json(const ContentSummary& summary);

}  // namespace symlinkio
