#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace CloudTrace {

/**
 * Base class for all cloudtrace exceptions. Exceptions are only thrown while configuring; the
 * per-request propagation path reports failures through absl::Status.
 */
class CloudTraceException : public std::runtime_error {
public:
  CloudTraceException(const std::string& message) : std::runtime_error(message) {}
};

#define throwCloudTraceException(x) throw ::CloudTrace::CloudTraceException(x)

#define THROW_IF_NOT_OK_REF(status)                                                                \
  do {                                                                                             \
    if (!(status).ok()) {                                                                          \
      throwCloudTraceException(std::string((status).message()));                                  \
    }                                                                                              \
  } while (0)

template <class Type> Type returnOrThrow(absl::StatusOr<Type> type_or_error) {
  THROW_IF_NOT_OK_REF(type_or_error.status());
  return std::move(type_or_error.value());
}

#define THROW_OR_RETURN_VALUE(expression, type) returnOrThrow<type>(expression)

} // namespace CloudTrace
