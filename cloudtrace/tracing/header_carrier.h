#pragma once

#include "cloudtrace/common/pure.h"

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace CloudTrace {
namespace Tracing {

/**
 * Read side of a carrier of tracing headers, such as the request headers of an incoming stream.
 */
class HeaderReader {
public:
  virtual ~HeaderReader() = default;

  /**
   * Get a header value by name. Name matching is the carrier's concern; transport headers match
   * case-insensitively.
   *
   * @param key the header name.
   * @return the header value, or absl::nullopt if the header is absent. The view is valid until
   * the carrier is next modified.
   */
  virtual absl::optional<absl::string_view> get(absl::string_view key) const PURE;
};

/**
 * Write side of a carrier of tracing headers, such as the request headers of an outgoing stream.
 */
class HeaderWriter {
public:
  virtual ~HeaderWriter() = default;

  /**
   * Set a header, replacing any value already present under the same name.
   *
   * @param key the header name.
   * @param value the header value.
   */
  virtual void set(absl::string_view key, absl::string_view value) PURE;
};

} // namespace Tracing
} // namespace CloudTrace
