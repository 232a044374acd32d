#include "source/common/tracing/decode_status.h"

#include "source/common/common/assert.h"

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/types/optional.h"

namespace CloudTrace {
namespace Tracing {

namespace {

constexpr absl::string_view DecodeStatusPayloadUrl = "cloudtrace.tracing.DecodeStatusCode";

absl::StatusCode toAbslStatusCode(DecodeStatusCode code) {
  switch (code) {
  case DecodeStatusCode::Ok:
    return absl::StatusCode::kOk;
  case DecodeStatusCode::Missing:
    return absl::StatusCode::kNotFound;
  case DecodeStatusCode::Malformed:
  case DecodeStatusCode::InvalidTraceId:
  case DecodeStatusCode::InvalidSpanId:
  case DecodeStatusCode::InvalidContext:
    return absl::StatusCode::kInvalidArgument;
  }
  PANIC_DUE_TO_CORRUPT_ENUM;
}

absl::Status makeError(DecodeStatusCode code, absl::string_view message) {
  absl::Status status(toAbslStatusCode(code), message);
  const char kind = static_cast<char>(code);
  status.SetPayload(DecodeStatusPayloadUrl, absl::Cord(absl::string_view(&kind, 1)));
  return status;
}

absl::optional<DecodeStatusCode> payloadCode(const absl::Status& status) {
  const absl::optional<absl::Cord> payload = status.GetPayload(DecodeStatusPayloadUrl);
  if (!payload.has_value()) {
    return absl::nullopt;
  }
  const std::string data(payload.value());
  if (data.size() != 1) {
    return absl::nullopt;
  }
  const int code = static_cast<int>(data[0]);
  if (code < static_cast<int>(DecodeStatusCode::Missing) ||
      code > static_cast<int>(DecodeStatusCode::InvalidContext)) {
    return absl::nullopt;
  }
  return static_cast<DecodeStatusCode>(code);
}

bool hasCode(const absl::Status& status, DecodeStatusCode code) {
  const absl::optional<DecodeStatusCode> actual = payloadCode(status);
  return actual.has_value() && actual.value() == code;
}

} // namespace

absl::Status missingHeaderError(absl::string_view message) {
  return makeError(DecodeStatusCode::Missing, message);
}

absl::Status malformedHeaderError(absl::string_view message) {
  return makeError(DecodeStatusCode::Malformed, message);
}

absl::Status invalidTraceIdError(absl::string_view message) {
  return makeError(DecodeStatusCode::InvalidTraceId, message);
}

absl::Status invalidSpanIdError(absl::string_view message) {
  return makeError(DecodeStatusCode::InvalidSpanId, message);
}

absl::Status invalidContextError(absl::string_view message) {
  return makeError(DecodeStatusCode::InvalidContext, message);
}

DecodeStatusCode getDecodeStatusCode(const absl::Status& status) {
  if (status.ok()) {
    return DecodeStatusCode::Ok;
  }
  const absl::optional<DecodeStatusCode> code = payloadCode(status);
  RELEASE_ASSERT(code.has_value(), "Must be a trace header decode error");
  return code.value();
}

bool isMissingHeaderError(const absl::Status& status) {
  return hasCode(status, DecodeStatusCode::Missing);
}

bool isMalformedHeaderError(const absl::Status& status) {
  return hasCode(status, DecodeStatusCode::Malformed);
}

bool isInvalidTraceIdError(const absl::Status& status) {
  return hasCode(status, DecodeStatusCode::InvalidTraceId);
}

bool isInvalidSpanIdError(const absl::Status& status) {
  return hasCode(status, DecodeStatusCode::InvalidSpanId);
}

bool isInvalidContextError(const absl::Status& status) {
  return hasCode(status, DecodeStatusCode::InvalidContext);
}

absl::string_view decodeStatusCodeToString(DecodeStatusCode code) {
  switch (code) {
  case DecodeStatusCode::Ok:
    return "Ok";
  case DecodeStatusCode::Missing:
    return "Missing";
  case DecodeStatusCode::Malformed:
    return "Malformed";
  case DecodeStatusCode::InvalidTraceId:
    return "InvalidTraceId";
  case DecodeStatusCode::InvalidSpanId:
    return "InvalidSpanId";
  case DecodeStatusCode::InvalidContext:
    return "InvalidContext";
  }
  PANIC_DUE_TO_CORRUPT_ENUM;
}

std::string decodeStatusToString(const absl::Status& status) {
  if (status.ok()) {
    return status.ToString();
  }
  return absl::StrCat(decodeStatusCodeToString(getDecodeStatusCode(status)), ": ",
                      status.message());
}

} // namespace Tracing
} // namespace CloudTrace
