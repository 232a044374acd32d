#pragma once

#include "source/common/tracing/span_context.h"

#include "absl/types/optional.h"

namespace CloudTrace {
namespace Tracing {

/**
 * Immutable propagation context. Carries the span context a propagator reads on inject and
 * attaches on extract. Modifiers return a new Context and leave this one untouched.
 */
class Context {
public:
  Context() = default;
  explicit Context(const SpanContext& span_context) : span_context_(span_context) {}

  /**
   * @return the span context, or absl::nullopt if none is attached.
   */
  const absl::optional<SpanContext>& spanContext() const { return span_context_; }

  /**
   * @return a copy of this context carrying span_context in place of any prior span context.
   * span_context is expected to be marked remote.
   */
  Context withRemoteSpanContext(const SpanContext& span_context) const;

  bool operator==(const Context& other) const { return span_context_ == other.span_context_; }
  bool operator!=(const Context& other) const { return !(*this == other); }

private:
  absl::optional<SpanContext> span_context_;
};

} // namespace Tracing
} // namespace CloudTrace
