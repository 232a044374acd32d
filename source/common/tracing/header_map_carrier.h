#pragma once

#include <functional>
#include <initializer_list>
#include <string>
#include <utility>

#include "cloudtrace/tracing/header_carrier.h"

#include "source/common/common/utility.h"

namespace CloudTrace {
namespace Tracing {

/**
 * In-memory carrier of tracing headers. Names match case-insensitively; a name keeps the case it
 * was first stored with, and set() replaces the value stored under any case variant.
 */
class HeaderMapCarrier : public HeaderReader, public HeaderWriter {
public:
  using IterateCallback = std::function<bool(absl::string_view key, absl::string_view value)>;

  HeaderMapCarrier() = default;
  HeaderMapCarrier(std::initializer_list<std::pair<std::string, std::string>> headers);

  // HeaderReader
  absl::optional<absl::string_view> get(absl::string_view key) const override;

  // HeaderWriter
  void set(absl::string_view key, absl::string_view value) override;

  size_t size() const { return headers_.size(); }
  bool empty() const { return headers_.empty(); }

  /**
   * Iterate over all headers in unspecified order until the callback returns false.
   */
  void forEach(IterateCallback callback) const;

private:
  struct Entry {
    std::string key;
    std::string value;
  };

  StringUtil::CaseUnorderedMap<Entry> headers_;
};

} // namespace Tracing
} // namespace CloudTrace
