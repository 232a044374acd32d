#include "source/common/tracing/span_context.h"

#include "test/test_common/utility.h"

#include "gtest/gtest.h"

namespace CloudTrace {
namespace Tracing {
namespace {

constexpr absl::string_view TraceIdHex = "105445aa7843bc8bf206b12000100000";

TEST(TraceFlagsTest, Sampled) {
  EXPECT_FALSE(TraceFlags().sampled());
  EXPECT_TRUE(TraceFlags(0x01).sampled());
  EXPECT_TRUE(TraceFlags(0x03).sampled());
  EXPECT_FALSE(TraceFlags(0x02).sampled());
  EXPECT_EQ(0x01, TraceFlags::fromSampled(true).value());
  EXPECT_EQ(0x00, TraceFlags::fromSampled(false).value());
}

TEST(SpanContextTest, DefaultIsInvalid) {
  SpanContext span_context;
  EXPECT_FALSE(span_context.isValid());
  EXPECT_FALSE(span_context.sampled());
  EXPECT_FALSE(span_context.isRemote());
}

TEST(SpanContextTest, Accessors) {
  const SpanContext span_context = TestUtility::makeSpanContext(TraceIdHex, 1, true, true);
  EXPECT_TRUE(span_context.isValid());
  EXPECT_EQ(TraceIdHex, span_context.traceId().toHex());
  EXPECT_EQ(1, span_context.spanId().toUint64());
  EXPECT_TRUE(span_context.sampled());
  EXPECT_EQ(TraceFlags(TraceFlags::Sampled), span_context.traceFlags());
  EXPECT_TRUE(span_context.isRemote());
}

TEST(SpanContextTest, ValidityRequiresBothIds) {
  EXPECT_FALSE(TestUtility::makeSpanContext(TraceIdHex, 0, true).isValid());
  EXPECT_FALSE(
      TestUtility::makeSpanContext("00000000000000000000000000000000", 1, true).isValid());
  EXPECT_TRUE(TestUtility::makeSpanContext(TraceIdHex, 1, false).isValid());
}

TEST(SpanContextTest, Equality) {
  const SpanContext local = TestUtility::makeSpanContext(TraceIdHex, 1, true);
  EXPECT_EQ(local, TestUtility::makeSpanContext(TraceIdHex, 1, true));
  EXPECT_NE(local, TestUtility::makeSpanContext(TraceIdHex, 2, true));
  EXPECT_NE(local, TestUtility::makeSpanContext(TraceIdHex, 1, false));
  EXPECT_NE(local, TestUtility::makeSpanContext(TraceIdHex, 1, true, true));
}

} // namespace
} // namespace Tracing
} // namespace CloudTrace
