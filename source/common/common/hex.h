#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace CloudTrace {
/**
 * Hex encoder/decoder. Produces lowercase hex digits. Can consume either lowercase or uppercase
 * digits.
 */
class Hex final {
public:
  /**
   * @param data the binary data to convert.
   * @param length the length of the data.
   * @return the lowercase hex encoding of data.
   */
  static std::string encode(const uint8_t* data, size_t length);

  /**
   * @param input the hex digits to decode.
   * @return the decoded bytes, or an empty vector if input is empty, of odd length, or contains a
   * character that is not a hex digit.
   */
  static std::vector<uint8_t> decode(absl::string_view input);
};
} // namespace CloudTrace
