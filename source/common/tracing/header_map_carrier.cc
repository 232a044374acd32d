#include "source/common/tracing/header_map_carrier.h"

namespace CloudTrace {
namespace Tracing {

HeaderMapCarrier::HeaderMapCarrier(
    std::initializer_list<std::pair<std::string, std::string>> headers) {
  for (const auto& header : headers) {
    set(header.first, header.second);
  }
}

absl::optional<absl::string_view> HeaderMapCarrier::get(absl::string_view key) const {
  const auto it = headers_.find(key);
  if (it == headers_.end()) {
    return absl::nullopt;
  }
  return absl::string_view(it->second.value);
}

void HeaderMapCarrier::set(absl::string_view key, absl::string_view value) {
  auto it = headers_.find(key);
  if (it != headers_.end()) {
    it->second.value = std::string(value);
    return;
  }
  headers_.emplace(std::string(key), Entry{std::string(key), std::string(value)});
}

void HeaderMapCarrier::forEach(IterateCallback callback) const {
  for (const auto& header : headers_) {
    if (!callback(header.second.key, header.second.value)) {
      return;
    }
  }
}

} // namespace Tracing
} // namespace CloudTrace
