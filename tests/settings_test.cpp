#include "mdns_scan/settings.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

using namespace mdns_scan;

namespace
{

const std::chrono::milliseconds kDay = std::chrono::hours(24);

}

TEST(ParseSecondsTest, ReadsWholeAndFractionalSeconds)
{
    EXPECT_EQ(ParseSeconds("5", kDay), std::chrono::milliseconds(5000));
    EXPECT_EQ(ParseSeconds("2.5", kDay), std::chrono::milliseconds(2500));
    EXPECT_EQ(ParseSeconds("86400", kDay), kDay);
}

TEST(ParseSecondsTest, RejectsNonFiniteAndOutOfRange)
{
    EXPECT_THROW(ParseSeconds("nan", kDay), std::invalid_argument);
    EXPECT_THROW(ParseSeconds("inf", kDay), std::invalid_argument);
    EXPECT_THROW(ParseSeconds("1e300", kDay), std::invalid_argument);
    EXPECT_THROW(ParseSeconds("86401", kDay), std::invalid_argument);
    EXPECT_THROW(ParseSeconds("0", kDay), std::invalid_argument);
    EXPECT_THROW(ParseSeconds("-3", kDay), std::invalid_argument);
}

TEST(ParseSecondsTest, RejectsText)
{
    EXPECT_THROW(ParseSeconds("", kDay), std::invalid_argument);
    EXPECT_THROW(ParseSeconds("soon", kDay), std::invalid_argument);
    EXPECT_THROW(ParseSeconds("3s", kDay), std::invalid_argument);
}
