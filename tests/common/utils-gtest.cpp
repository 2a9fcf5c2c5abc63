#include "fortune/common/utils.h"
#include <array>
#include <gtest/gtest.h>

using namespace fortune::common;

TEST(CommonUtils, BigEndianRoundTrip)
{
    std::array<uint8_t, 4> buffer{};
    put_uint32_be(buffer.data(), 0x01020304);
    EXPECT_EQ(buffer[0], 0x01);
    EXPECT_EQ(buffer[3], 0x04);
    EXPECT_EQ(get_uint32_be(buffer.data()), 0x01020304u);
}

TEST(CommonUtils, Rot13LeavesNonLetters)
{
    EXPECT_EQ(rot13("Hello, World! 123"), "Uryyb, Jbeyq! 123");
    EXPECT_EQ(rot13(rot13("Round trip")), "Round trip");
    EXPECT_EQ(rot13(""), "");
}

TEST(CommonUtils, FormatPercentage)
{
    EXPECT_EQ(format_percentage(12.5), "12.50%");
    EXPECT_EQ(format_percentage(100.0), "100.00%");
    EXPECT_EQ(format_percentage(33.333333), "33.33%");
}
