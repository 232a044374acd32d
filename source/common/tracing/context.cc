#include "source/common/tracing/context.h"

#include "source/common/common/assert.h"

namespace CloudTrace {
namespace Tracing {

Context Context::withRemoteSpanContext(const SpanContext& span_context) const {
  ASSERT(span_context.isRemote());
  Context copy(*this);
  copy.span_context_ = span_context;
  return copy;
}

} // namespace Tracing
} // namespace CloudTrace
