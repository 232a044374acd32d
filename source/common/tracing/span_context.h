#pragma once

#include <cstdint>

#include "source/common/tracing/trace_id.h"

namespace CloudTrace {
namespace Tracing {

/**
 * Trace flag byte. Bit 0 carries the sampling decision; the other bits are reserved and kept
 * as received.
 */
class TraceFlags {
public:
  static constexpr uint8_t Sampled = 0x01;

  TraceFlags() = default;
  explicit TraceFlags(uint8_t flags) : flags_(flags) {}

  static TraceFlags fromSampled(bool sampled) { return TraceFlags(sampled ? Sampled : 0); }

  bool sampled() const { return (flags_ & Sampled) != 0; }
  uint8_t value() const { return flags_; }

  bool operator==(const TraceFlags& other) const { return flags_ == other.flags_; }
  bool operator!=(const TraceFlags& other) const { return !(*this == other); }

private:
  uint8_t flags_{0};
};

/**
 * Immutable identity of a span as it crosses process boundaries.
 */
class SpanContext {
public:
  SpanContext() = default;
  SpanContext(const TraceId& trace_id, const SpanId& span_id, TraceFlags trace_flags,
              bool is_remote)
      : trace_id_(trace_id), span_id_(span_id), trace_flags_(trace_flags), is_remote_(is_remote) {}

  const TraceId& traceId() const { return trace_id_; }
  const SpanId& spanId() const { return span_id_; }
  TraceFlags traceFlags() const { return trace_flags_; }
  bool sampled() const { return trace_flags_.sampled(); }

  /**
   * @return true if the context was received from another process rather than created locally.
   */
  bool isRemote() const { return is_remote_; }

  /**
   * @return true if both the trace id and the span id are non-zero.
   */
  bool isValid() const;

  bool operator==(const SpanContext& other) const;
  bool operator!=(const SpanContext& other) const { return !(*this == other); }

private:
  TraceId trace_id_;
  SpanId span_id_;
  TraceFlags trace_flags_;
  bool is_remote_{false};
};

} // namespace Tracing
} // namespace CloudTrace
