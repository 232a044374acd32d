#include "source/common/tracing/span_context.h"

namespace CloudTrace {
namespace Tracing {

bool SpanContext::isValid() const { return trace_id_.isValid() && span_id_.isValid(); }

bool SpanContext::operator==(const SpanContext& other) const {
  return trace_id_ == other.trace_id_ && span_id_ == other.span_id_ &&
         trace_flags_ == other.trace_flags_ && is_remote_ == other.is_remote_;
}

} // namespace Tracing
} // namespace CloudTrace
