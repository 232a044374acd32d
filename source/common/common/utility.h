#pragma once

#include <cstddef>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"

namespace CloudTrace {

class StringUtil {
public:
  /**
   * Strip leading and trailing whitespace. Whitespace is any code point with the Unicode
   * White_Space property, so UTF-8 encoded forms such as U+00A0 and U+3000 are removed along with
   * the ASCII space and control characters.
   * @param source supplies the string view to be trimmed.
   * @return a view into source without the surrounding whitespace.
   */
  static absl::string_view trim(absl::string_view source);

  // Hash and equality for maps keyed case-insensitively by ASCII header names.
  struct CaseInsensitiveHash {
    using is_transparent = void; // NOLINT(readability-identifier-naming)
    size_t operator()(absl::string_view key) const;
  };
  struct CaseInsensitiveCompare {
    using is_transparent = void; // NOLINT(readability-identifier-naming)
    bool operator()(absl::string_view lhs, absl::string_view rhs) const;
  };

  template <class Value>
  using CaseUnorderedMap =
      absl::flat_hash_map<std::string, Value, CaseInsensitiveHash, CaseInsensitiveCompare>;
};

} // namespace CloudTrace
