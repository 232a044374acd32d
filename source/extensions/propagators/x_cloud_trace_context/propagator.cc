#include "source/extensions/propagators/x_cloud_trace_context/propagator.h"

#include "source/common/common/fmt.h"
#include "source/common/common/macros.h"
#include "source/common/common/utility.h"
#include "source/common/tracing/decode_status.h"

#include "absl/strings/numbers.h"

namespace CloudTrace {
namespace Extensions {
namespace Propagators {
namespace XCloudTraceContext {

namespace {

// Capture group indexes of the header regex, in order of their opening parenthesis.
constexpr int TraceIdGroup = 1;
constexpr int SpanIdGroup = 2;
constexpr int TraceFlagsGroup = 4;

} // namespace

const std::string& XCloudTraceContextPropagator::headerName() {
  CONSTRUCT_ON_FIRST_USE(std::string, "X-Cloud-Trace-Context");
}

const Regex::CompiledGoogleReMatcher& XCloudTraceContextPropagator::headerRegex() {
  CONSTRUCT_ON_FIRST_USE(
      Regex::CompiledGoogleReMatcher,
      "^(?P<trace_id>[0-9a-f]{32})/(?P<span_id>[0-9]{1,20})(;o=(?P<trace_flags>[0-9]))?$");
}

absl::optional<std::string>
XCloudTraceContextPropagator::encode(const Tracing::SpanContext& span_context) {
  if (!span_context.isValid()) {
    return absl::nullopt;
  }
  return fmt::format("{}/{};o={}", span_context.traceId().toHex(),
                     span_context.spanId().toUint64(), span_context.sampled() ? 1 : 0);
}

void XCloudTraceContextPropagator::inject(const Tracing::Context& context,
                                          Tracing::HeaderWriter& writer) const {
  const auto& span_context = context.spanContext();
  if (!span_context.has_value()) {
    CLOUDTRACE_LOG(trace, "no span context to inject into {}", headerName());
    return;
  }
  const absl::optional<std::string> value = encode(span_context.value());
  if (!value.has_value()) {
    CLOUDTRACE_LOG(trace, "not injecting {}: span context is not valid", headerName());
    return;
  }
  writer.set(headerName(), value.value());
}

absl::StatusOr<Tracing::SpanContext>
XCloudTraceContextPropagator::extract(const Tracing::HeaderReader& reader) const {
  const absl::optional<absl::string_view> header = reader.get(headerName());
  if (!header.has_value()) {
    return Tracing::missingHeaderError(fmt::format("{} header is not present", headerName()));
  }
  const absl::string_view value = StringUtil::trim(header.value());

  const absl::optional<Regex::CaptureGroups> groups = headerRegex().fullMatchGroups(value);
  if (!groups.has_value()) {
    return Tracing::malformedHeaderError(
        fmt::format("{} header value '{}' is malformed", headerName(), value));
  }
  const Regex::CaptureGroups& captures = groups.value();

  const absl::optional<Tracing::TraceId> trace_id =
      Tracing::TraceId::fromHex(captures[TraceIdGroup].value());
  if (!trace_id.has_value()) {
    return Tracing::invalidTraceIdError(
        fmt::format("invalid trace id '{}'", captures[TraceIdGroup].value()));
  }

  uint64_t span_id;
  if (!absl::SimpleAtoi(captures[SpanIdGroup].value(), &span_id)) {
    return Tracing::invalidSpanIdError(
        fmt::format("span id '{}' does not fit in 64 bits", captures[SpanIdGroup].value()));
  }

  const absl::optional<absl::string_view>& trace_flags = captures[TraceFlagsGroup];
  const bool sampled = !trace_flags.has_value() || trace_flags.value() != "0";

  Tracing::SpanContext span_context(trace_id.value(), Tracing::SpanId::fromUint64(span_id),
                                    Tracing::TraceFlags::fromSampled(sampled), true);
  if (!span_context.isValid()) {
    return Tracing::invalidContextError(
        fmt::format("{} header value '{}' has a zero trace id or span id", headerName(), value));
  }
  return span_context;
}

Tracing::Context
XCloudTraceContextPropagator::extractWithContext(const Tracing::Context& context,
                                                 const Tracing::HeaderReader& reader) const {
  absl::StatusOr<Tracing::SpanContext> span_context = extract(reader);
  if (!span_context.ok()) {
    CLOUDTRACE_LOG(debug, "failed to extract span context: {}",
                   Tracing::decodeStatusToString(span_context.status()));
    return context;
  }
  return context.withRemoteSpanContext(span_context.value());
}

const std::vector<std::string>& XCloudTraceContextPropagator::fields() const {
  CONSTRUCT_ON_FIRST_USE(std::vector<std::string>, headerName());
}

} // namespace XCloudTraceContext
} // namespace Propagators
} // namespace Extensions
} // namespace CloudTrace
