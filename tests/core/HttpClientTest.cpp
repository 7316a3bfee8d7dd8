#include "core/HttpClient.hpp"
#include <gtest/gtest.h>

using namespace podfetch::core;

TEST(ResponseHeadTest, ContentRangeStartAndTotal) {
    ResponseHead head;
    head.headers["content-range"] = "bytes 400-999/1000";

    EXPECT_EQ(head.contentRangeStart(), std::optional<std::uint64_t>(400));
    EXPECT_EQ(head.contentRangeTotal(), std::optional<std::uint64_t>(1000));
}

TEST(ResponseHeadTest, UnsatisfiedRangeHasNoStart) {
    ResponseHead head;
    head.headers["content-range"] = "bytes */1000";

    EXPECT_FALSE(head.contentRangeStart().has_value());
    EXPECT_EQ(head.contentRangeTotal(), std::optional<std::uint64_t>(1000));
}

TEST(ResponseHeadTest, MissingOrGarbledHeadersAreUnknown) {
    ResponseHead head;
    EXPECT_FALSE(head.contentRangeStart().has_value());
    EXPECT_FALSE(head.contentLength().has_value());

    head.headers["content-length"] = "12kb";
    head.headers["content-range"] = "bytes 4x-9/*";
    EXPECT_FALSE(head.contentLength().has_value());
    EXPECT_FALSE(head.contentRangeStart().has_value());
    EXPECT_FALSE(head.contentRangeTotal().has_value());
}
