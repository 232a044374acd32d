#pragma once

#include <cstdint>
#include <string>

#include "source/common/common/assert.h"
#include "source/common/tracing/span_context.h"

#include "absl/strings/string_view.h"

namespace CloudTrace {

class TestUtility {
public:
  /**
   * @return the trace id parsed from 32 hex digits. Invalid input fails the test binary.
   */
  static Tracing::TraceId traceIdFromHex(absl::string_view hex) {
    const absl::optional<Tracing::TraceId> trace_id = Tracing::TraceId::fromHex(hex);
    RELEASE_ASSERT(trace_id.has_value(), std::string(hex));
    return trace_id.value();
  }

  /**
   * Build a span context for tests.
   */
  static Tracing::SpanContext makeSpanContext(absl::string_view trace_id_hex, uint64_t span_id,
                                              bool sampled, bool is_remote = false) {
    return {traceIdFromHex(trace_id_hex), Tracing::SpanId::fromUint64(span_id),
            Tracing::TraceFlags::fromSampled(sampled), is_remote};
  }
};

} // namespace CloudTrace
