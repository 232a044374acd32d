#include "source/common/common/utility.h"

#include "absl/hash/hash.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"

namespace CloudTrace {

namespace {

// UTF-8 encodings of the non-ASCII White_Space code points: U+0085, U+00A0, U+1680,
// U+2000..U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
const absl::string_view UnicodeWhitespace[] = {
    "\xc2\x85",     "\xc2\xa0",     "\xe1\x9a\x80", "\xe2\x80\x80", "\xe2\x80\x81",
    "\xe2\x80\x82", "\xe2\x80\x83", "\xe2\x80\x84", "\xe2\x80\x85", "\xe2\x80\x86",
    "\xe2\x80\x87", "\xe2\x80\x88", "\xe2\x80\x89", "\xe2\x80\x8a", "\xe2\x80\xa8",
    "\xe2\x80\xa9", "\xe2\x80\xaf", "\xe2\x81\x9f", "\xe3\x80\x80",
};

// Length of the whitespace code point at the front of source, or 0 if there is none.
size_t leadingWhitespace(absl::string_view source) {
  if (source.empty()) {
    return 0;
  }
  if (absl::ascii_isspace(static_cast<unsigned char>(source.front()))) {
    return 1;
  }
  for (const absl::string_view space : UnicodeWhitespace) {
    if (absl::StartsWith(source, space)) {
      return space.size();
    }
  }
  return 0;
}

// Length of the whitespace code point at the back of source, or 0 if there is none.
size_t trailingWhitespace(absl::string_view source) {
  if (source.empty()) {
    return 0;
  }
  if (absl::ascii_isspace(static_cast<unsigned char>(source.back()))) {
    return 1;
  }
  for (const absl::string_view space : UnicodeWhitespace) {
    if (absl::EndsWith(source, space)) {
      return space.size();
    }
  }
  return 0;
}

} // namespace

absl::string_view StringUtil::trim(absl::string_view source) {
  while (const size_t length = leadingWhitespace(source)) {
    source.remove_prefix(length);
  }
  while (const size_t length = trailingWhitespace(source)) {
    source.remove_suffix(length);
  }
  return source;
}

size_t StringUtil::CaseInsensitiveHash::operator()(absl::string_view key) const {
  return absl::Hash<std::string>()(absl::AsciiStrToLower(key));
}

bool StringUtil::CaseInsensitiveCompare::operator()(absl::string_view lhs,
                                                    absl::string_view rhs) const {
  return absl::EqualsIgnoreCase(lhs, rhs);
}

} // namespace CloudTrace
