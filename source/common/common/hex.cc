#include "source/common/common/hex.h"

#include <algorithm>

#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"

namespace CloudTrace {

std::string Hex::encode(const uint8_t* data, size_t length) {
  return absl::BytesToHexString(absl::string_view(reinterpret_cast<const char*>(data), length));
}

std::vector<uint8_t> Hex::decode(absl::string_view input) {
  // absl::HexStringToBytes does not validate its input.
  if (input.empty() || input.size() % 2 != 0 ||
      !std::all_of(input.begin(), input.end(),
                   [](char c) { return absl::ascii_isxdigit(static_cast<unsigned char>(c)); })) {
    return {};
  }
  const std::string bytes = absl::HexStringToBytes(input);
  return {bytes.begin(), bytes.end()};
}

} // namespace CloudTrace
