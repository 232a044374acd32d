#include "source/common/tracing/trace_id.h"

#include <algorithm>
#include <vector>

#include "source/common/common/hex.h"

namespace CloudTrace {
namespace Tracing {

namespace {

template <class Bytes> bool allZero(const Bytes& bytes) {
  return std::all_of(bytes.begin(), bytes.end(), [](uint8_t byte) { return byte == 0; });
}

} // namespace

absl::optional<TraceId> TraceId::fromHex(absl::string_view hex) {
  if (hex.size() != 2 * Size) {
    return absl::nullopt;
  }
  const std::vector<uint8_t> decoded = Hex::decode(hex);
  if (decoded.size() != Size) {
    return absl::nullopt;
  }
  Bytes bytes;
  std::copy(decoded.begin(), decoded.end(), bytes.begin());
  return TraceId(bytes);
}

std::string TraceId::toHex() const { return Hex::encode(bytes_.data(), bytes_.size()); }

bool TraceId::isValid() const { return !allZero(bytes_); }

SpanId SpanId::fromBytes(const Bytes& bytes) { return SpanId(bytes); }

SpanId SpanId::fromUint64(uint64_t value) {
  Bytes bytes;
  for (size_t i = 0; i < Size; ++i) {
    bytes[Size - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
  }
  return SpanId(bytes);
}

uint64_t SpanId::toUint64() const {
  uint64_t value = 0;
  for (const uint8_t byte : bytes_) {
    value = (value << 8) | byte;
  }
  return value;
}

bool SpanId::isValid() const { return !allZero(bytes_); }

} // namespace Tracing
} // namespace CloudTrace
