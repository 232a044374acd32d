#pragma once

#include <string>
#include <vector>

#include "source/common/common/logger.h"
#include "source/common/common/regex.h"
#include "source/common/tracing/propagator.h"

#include "absl/types/optional.h"

namespace CloudTrace {
namespace Extensions {
namespace Propagators {
namespace XCloudTraceContext {

/**
 * Propagator for the Google Cloud Trace header:
 *
 *   X-Cloud-Trace-Context: <32 lowercase hex trace id>/<decimal span id>[;o=<digit>]
 *
 * The header value is trimmed of surrounding whitespace and must match the grammar in full. A
 * missing ";o=" suffix or any digit other than 0 means sampled.
 */
class XCloudTraceContextPropagator : public Tracing::TextMapPropagator,
                                     Logger::Loggable<Logger::Id::tracing> {
public:
  static const std::string& headerName();

  /**
   * @return the header value for span_context, or absl::nullopt if span_context is not valid.
   * The sampling flag is written as 1 or 0 whatever the other flag bits hold.
   */
  static absl::optional<std::string> encode(const Tracing::SpanContext& span_context);

  // Tracing::TextMapPropagator
  void inject(const Tracing::Context& context, Tracing::HeaderWriter& writer) const override;
  absl::StatusOr<Tracing::SpanContext> extract(const Tracing::HeaderReader& reader) const override;
  Tracing::Context extractWithContext(const Tracing::Context& context,
                                      const Tracing::HeaderReader& reader) const override;
  const std::vector<std::string>& fields() const override;

private:
  static const Regex::CompiledGoogleReMatcher& headerRegex();
};

} // namespace XCloudTraceContext
} // namespace Propagators
} // namespace Extensions
} // namespace CloudTrace
