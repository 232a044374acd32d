#pragma once

#include <memory>
#include <string>

#include "cloudtrace/extensions/propagators/x_cloud_trace_context/v3/x_cloud_trace_context.pb.h"

#include "source/common/tracing/propagator.h"

namespace CloudTrace {
namespace Extensions {
namespace Propagators {
namespace XCloudTraceContext {

/**
 * Config registration for the X-Cloud-Trace-Context propagator. @see TextMapPropagatorFactory.
 */
class XCloudTraceContextPropagatorFactory : public Tracing::TextMapPropagatorFactory {
public:
  std::string name() const override { return "cloudtrace.propagators.x_cloud_trace_context"; }

  ProtobufTypes::MessagePtr createEmptyConfigProto() override {
    return std::make_unique<
        cloudtrace::extensions::propagators::x_cloud_trace_context::v3::XCloudTraceContextConfig>();
  }

  absl::StatusOr<Tracing::TextMapPropagatorPtr>
  createPropagator(const Protobuf::Message& config) override;

  /**
   * Same as createPropagator(), for callers configuring at startup. Throws CloudTraceException if
   * config is unusable.
   */
  Tracing::TextMapPropagatorPtr createPropagatorOrThrow(const Protobuf::Message& config);
};

} // namespace XCloudTraceContext
} // namespace Propagators
} // namespace Extensions
} // namespace CloudTrace
