#include "source/common/tracing/decode_status.h"

#include "gtest/gtest.h"

namespace CloudTrace {
namespace Tracing {
namespace {

TEST(DecodeStatusTest, Missing) {
  const absl::Status status = missingHeaderError("not there");
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(absl::StatusCode::kNotFound, status.code());
  EXPECT_EQ("not there", status.message());
  EXPECT_EQ(DecodeStatusCode::Missing, getDecodeStatusCode(status));
  EXPECT_TRUE(isMissingHeaderError(status));
  EXPECT_FALSE(isMalformedHeaderError(status));
  EXPECT_EQ("Missing: not there", decodeStatusToString(status));
}

TEST(DecodeStatusTest, KindsShareInvalidArgument) {
  const absl::Status malformed = malformedHeaderError("a");
  const absl::Status trace_id = invalidTraceIdError("b");
  const absl::Status span_id = invalidSpanIdError("c");
  const absl::Status context = invalidContextError("d");

  for (const absl::Status& status : {malformed, trace_id, span_id, context}) {
    EXPECT_EQ(absl::StatusCode::kInvalidArgument, status.code());
    EXPECT_FALSE(isMissingHeaderError(status));
  }

  EXPECT_TRUE(isMalformedHeaderError(malformed));
  EXPECT_TRUE(isInvalidTraceIdError(trace_id));
  EXPECT_TRUE(isInvalidSpanIdError(span_id));
  EXPECT_TRUE(isInvalidContextError(context));
  EXPECT_FALSE(isInvalidSpanIdError(malformed));
  EXPECT_FALSE(isInvalidContextError(span_id));

  EXPECT_EQ(DecodeStatusCode::Malformed, getDecodeStatusCode(malformed));
  EXPECT_EQ(DecodeStatusCode::InvalidTraceId, getDecodeStatusCode(trace_id));
  EXPECT_EQ(DecodeStatusCode::InvalidSpanId, getDecodeStatusCode(span_id));
  EXPECT_EQ(DecodeStatusCode::InvalidContext, getDecodeStatusCode(context));

  EXPECT_EQ("Malformed: a", decodeStatusToString(malformed));
  EXPECT_EQ("InvalidTraceId: b", decodeStatusToString(trace_id));
  EXPECT_EQ("InvalidSpanId: c", decodeStatusToString(span_id));
  EXPECT_EQ("InvalidContext: d", decodeStatusToString(context));
}

TEST(DecodeStatusTest, OkStatus) {
  EXPECT_EQ(DecodeStatusCode::Ok, getDecodeStatusCode(absl::OkStatus()));
  EXPECT_FALSE(isMissingHeaderError(absl::OkStatus()));
  EXPECT_EQ("OK", decodeStatusToString(absl::OkStatus()));
}

TEST(DecodeStatusTest, ForeignStatusIsNoKind) {
  const absl::Status foreign = absl::NotFoundError("elsewhere");
  EXPECT_FALSE(isMissingHeaderError(foreign));
  EXPECT_FALSE(isMalformedHeaderError(absl::InvalidArgumentError("elsewhere")));
}

TEST(DecodeStatusDeathTest, ForeignStatusHasNoDecodeCode) {
  EXPECT_DEATH(getDecodeStatusCode(absl::InternalError("elsewhere")),
               "Must be a trace header decode error");
}

TEST(DecodeStatusTest, CodeNames) {
  EXPECT_EQ("Ok", decodeStatusCodeToString(DecodeStatusCode::Ok));
  EXPECT_EQ("Missing", decodeStatusCodeToString(DecodeStatusCode::Missing));
  EXPECT_EQ("Malformed", decodeStatusCodeToString(DecodeStatusCode::Malformed));
}

} // namespace
} // namespace Tracing
} // namespace CloudTrace
