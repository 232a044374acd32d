#pragma once

#include <string>
#include <vector>

#include "source/common/common/assert.h"

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "re2/re2.h"

namespace CloudTrace {
namespace Regex {

/**
 * Capture groups of a successful full match. Index 0 is the whole match; an optional group that
 * did not participate in the match is absl::nullopt. Views point into the matched input.
 */
using CaptureGroups = std::vector<absl::optional<absl::string_view>>;

/**
 * A compiled RE2 expression. Only for constant expressions known to be valid: an expression that
 * fails to compile is a RELEASE_ASSERT.
 */
class CompiledGoogleReMatcher {
public:
  explicit CompiledGoogleReMatcher(const std::string& regex) : regex_(regex, re2::RE2::Quiet) {
    RELEASE_ASSERT(regex_.ok(), "Invalid regex");
  }

  /**
   * Matches the whole of value and extracts every capture group.
   * @return the capture groups, or absl::nullopt if value does not match.
   */
  absl::optional<CaptureGroups> fullMatchGroups(absl::string_view value) const;

private:
  const re2::RE2 regex_;
};

} // namespace Regex
} // namespace CloudTrace
