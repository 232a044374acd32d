#pragma once

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

/**
 * Errors reported when a tracing header cannot be turned into a span context.
 *
 * The kind of failure travels in the payload of an absl::Status. Use the creation and predicate
 * functions below rather than inspecting absl::Status::code() directly: several kinds share the
 * same absl::StatusCode.
 *
 * Usage example:
 *
 *  absl::StatusOr<SpanContext> result = propagator.extract(headers);
 *  if (!result.ok() && !isMissingHeaderError(result.status())) {
 *    CLOUDTRACE_LOG(debug, "bad trace header: {}", decodeStatusToString(result.status()));
 *  }
 */

namespace CloudTrace {
namespace Tracing {

enum class DecodeStatusCode : int {
  Ok = 0,
  // The header is not present in the carrier.
  Missing = 1,
  // The header is present but does not match the header grammar.
  Malformed = 2,
  InvalidTraceId = 3,
  InvalidSpanId = 4,
  // Both identifiers parsed but the resulting span context is not valid.
  InvalidContext = 5,
};

/**
 * Functions for creating error values. The error kind of the returned status object matches the
 * name of the function.
 */
absl::Status missingHeaderError(absl::string_view message);
absl::Status malformedHeaderError(absl::string_view message);
absl::Status invalidTraceIdError(absl::string_view message);
absl::Status invalidSpanIdError(absl::string_view message);
absl::Status invalidContextError(absl::string_view message);

/**
 * Returns the DecodeStatusCode of the given status object. An ok status is DecodeStatusCode::Ok.
 * A failed status that was not created by the functions above triggers RELEASE_ASSERT.
 */
DecodeStatusCode getDecodeStatusCode(const absl::Status& status);

/**
 * Returns true if the given status matches the error kind implied by the name of the function.
 */
ABSL_MUST_USE_RESULT bool isMissingHeaderError(const absl::Status& status);
ABSL_MUST_USE_RESULT bool isMalformedHeaderError(const absl::Status& status);
ABSL_MUST_USE_RESULT bool isInvalidTraceIdError(const absl::Status& status);
ABSL_MUST_USE_RESULT bool isInvalidSpanIdError(const absl::Status& status);
ABSL_MUST_USE_RESULT bool isInvalidContextError(const absl::Status& status);

absl::string_view decodeStatusCodeToString(DecodeStatusCode code);

/**
 * Returns the error kind name followed by the message, e.g. "Malformed: bad header".
 */
std::string decodeStatusToString(const absl::Status& status);

} // namespace Tracing
} // namespace CloudTrace
