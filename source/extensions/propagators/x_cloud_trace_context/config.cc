#include "source/extensions/propagators/x_cloud_trace_context/config.h"

#include "cloudtrace/common/exception.h"

#include "source/common/common/fmt.h"
#include "source/common/common/logger.h"
#include "source/extensions/propagators/x_cloud_trace_context/propagator.h"

namespace CloudTrace {
namespace Extensions {
namespace Propagators {
namespace XCloudTraceContext {

absl::StatusOr<Tracing::TextMapPropagatorPtr>
XCloudTraceContextPropagatorFactory::createPropagator(const Protobuf::Message& config) {
  if (dynamic_cast<const cloudtrace::extensions::propagators::x_cloud_trace_context::v3::
                       XCloudTraceContextConfig*>(&config) == nullptr) {
    return absl::InvalidArgumentError(
        fmt::format("{}: unexpected config type '{}'", name(), config.GetTypeName()));
  }
  CLOUDTRACE_LOG_TO_LOGGER(Logger::Registry::getLog(Logger::Id::config), debug,
                           "creating propagator {}", name());
  return Tracing::TextMapPropagatorPtr{std::make_unique<XCloudTraceContextPropagator>()};
}

Tracing::TextMapPropagatorPtr
XCloudTraceContextPropagatorFactory::createPropagatorOrThrow(const Protobuf::Message& config) {
  return THROW_OR_RETURN_VALUE(createPropagator(config), Tracing::TextMapPropagatorPtr);
}

} // namespace XCloudTraceContext
} // namespace Propagators
} // namespace Extensions
} // namespace CloudTrace
