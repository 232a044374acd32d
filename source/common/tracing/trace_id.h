#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace CloudTrace {
namespace Tracing {

/**
 * 128-bit identifier of a distributed trace. The all-zero value is the invalid trace id.
 */
class TraceId {
public:
  static constexpr size_t Size = 16;
  using Bytes = std::array<uint8_t, Size>;

  TraceId() = default;
  explicit TraceId(const Bytes& bytes) : bytes_(bytes) {}

  /**
   * Parse a trace id from exactly 32 hex digits.
   * @param hex supplies the hex digits. Either case is accepted.
   * @return the trace id, or absl::nullopt if hex is not 32 hex digits.
   */
  static absl::optional<TraceId> fromHex(absl::string_view hex);

  /**
   * @return the trace id as 32 lowercase, zero-padded hex digits.
   */
  std::string toHex() const;

  bool isValid() const;
  const Bytes& bytes() const { return bytes_; }

  bool operator==(const TraceId& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const TraceId& other) const { return !(*this == other); }

private:
  Bytes bytes_{};
};

/**
 * 64-bit identifier of a span within a trace, held as 8 big-endian bytes. The all-zero value is
 * the invalid span id.
 */
class SpanId {
public:
  static constexpr size_t Size = 8;
  using Bytes = std::array<uint8_t, Size>;

  SpanId() = default;

  static SpanId fromBytes(const Bytes& bytes);
  static SpanId fromUint64(uint64_t value);

  uint64_t toUint64() const;

  bool isValid() const;
  const Bytes& bytes() const { return bytes_; }

  bool operator==(const SpanId& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const SpanId& other) const { return !(*this == other); }

private:
  explicit SpanId(const Bytes& bytes) : bytes_(bytes) {}

  Bytes bytes_{};
};

} // namespace Tracing
} // namespace CloudTrace
