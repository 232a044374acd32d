#include "source/common/common/regex.h"

namespace CloudTrace {
namespace Regex {

absl::optional<CaptureGroups>
CompiledGoogleReMatcher::fullMatchGroups(absl::string_view value) const {
  const int group_count = regex_.NumberOfCapturingGroups() + 1;
  std::vector<re2::StringPiece> submatches(group_count);
  if (!regex_.Match(re2::StringPiece(value.data(), value.size()), 0, value.size(),
                    re2::RE2::ANCHOR_BOTH, submatches.data(), group_count)) {
    return absl::nullopt;
  }

  CaptureGroups groups;
  groups.reserve(group_count);
  for (const re2::StringPiece& submatch : submatches) {
    if (submatch.data() == nullptr) {
      groups.emplace_back(absl::nullopt);
    } else {
      groups.emplace_back(absl::string_view(submatch.data(), submatch.size()));
    }
  }
  return groups;
}

} // namespace Regex
} // namespace CloudTrace
