#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cloudtrace/common/pure.h"
#include "cloudtrace/tracing/header_carrier.h"

#include "source/common/protobuf/protobuf.h"
#include "source/common/tracing/context.h"
#include "source/common/tracing/span_context.h"

#include "absl/status/statusor.h"

namespace CloudTrace {
namespace Tracing {

/**
 * Moves span contexts in and out of text headers of one wire format.
 */
class TextMapPropagator {
public:
  virtual ~TextMapPropagator() = default;

  /**
   * Write the span context of the given context to the carrier. Nothing is written if the context
   * has no span context or its span context is not valid.
   * @param context supplies the context to propagate.
   * @param writer supplies the carrier to write to.
   */
  virtual void inject(const Context& context, HeaderWriter& writer) const PURE;

  /**
   * Read a span context from the carrier.
   * @param reader supplies the carrier to read from.
   * @return the remote span context, or an error built by the functions in decode_status.h.
   */
  virtual absl::StatusOr<SpanContext> extract(const HeaderReader& reader) const PURE;

  /**
   * Read a span context from the carrier and attach it to context. Failures are not reported.
   * @param context supplies the context to extend.
   * @param reader supplies the carrier to read from.
   * @return context carrying the extracted remote span context, or context unchanged if nothing
   * valid could be extracted.
   */
  virtual Context extractWithContext(const Context& context, const HeaderReader& reader) const PURE;

  /**
   * @return the header names this propagator reads and writes.
   */
  virtual const std::vector<std::string>& fields() const PURE;
};

using TextMapPropagatorPtr = std::unique_ptr<TextMapPropagator>;

/**
 * Creates a propagator from a typed configuration message.
 */
class TextMapPropagatorFactory {
public:
  virtual ~TextMapPropagatorFactory() = default;

  /**
   * @return the name the propagator is configured by.
   */
  virtual std::string name() const PURE;

  /**
   * @return a new, default instance of the configuration message accepted by createPropagator().
   */
  virtual ProtobufTypes::MessagePtr createEmptyConfigProto() PURE;

  /**
   * @param config supplies the configuration. It must be of the type createEmptyConfigProto()
   * returns.
   * @return the propagator, or InvalidArgument if config is unusable.
   */
  virtual absl::StatusOr<TextMapPropagatorPtr>
  createPropagator(const Protobuf::Message& config) PURE;
};

} // namespace Tracing
} // namespace CloudTrace
