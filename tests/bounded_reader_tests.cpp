#include "codec/bounded_reader.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <sstream>
#include <string>

namespace {

using dfcompress::codec::BoundedReader;

} // namespace

TEST(BoundedReaderTest, StopsAtLimit)
{
    std::istringstream input("abcdefghij", std::ios::binary);
    std::array<std::uint8_t, 16> buffer {};

    {
        BoundedReader reader(input, 4);
        EXPECT_EQ(reader.fill(buffer.data(), buffer.size()), 4U);
        EXPECT_EQ(std::string(buffer.begin(), buffer.begin() + 4), "abcd");
        EXPECT_EQ(reader.read(buffer.data(), buffer.size()), 0U);
        EXPECT_EQ(reader.consumed(), 4U);
        EXPECT_EQ(reader.remaining(), 0U);
        EXPECT_FALSE(reader.truncated());
    }

    BoundedReader next(input, 3);
    EXPECT_EQ(next.fill(buffer.data(), buffer.size()), 3U);
    EXPECT_EQ(std::string(buffer.begin(), buffer.begin() + 3), "efg");
}

TEST(BoundedReaderTest, ReportsTruncatedSource)
{
    std::istringstream input("xyz", std::ios::binary);
    std::array<std::uint8_t, 16> buffer {};

    BoundedReader reader(input, 10);
    EXPECT_EQ(reader.fill(buffer.data(), buffer.size()), 3U);
    EXPECT_EQ(reader.consumed(), 3U);
    EXPECT_EQ(reader.remaining(), 7U);
    EXPECT_TRUE(reader.truncated());
}

TEST(BoundedReaderTest, SkipsRemainderOfBound)
{
    std::istringstream input("0123456789", std::ios::binary);
    std::array<std::uint8_t, 2> buffer {};

    {
        BoundedReader reader(input, 6);
        EXPECT_EQ(reader.read(buffer.data(), buffer.size()), 2U);
        EXPECT_EQ(reader.skipRemaining(), 4U);
        EXPECT_FALSE(reader.truncated());
    }

    BoundedReader rest(input, 100);
    std::array<std::uint8_t, 16> tail {};
    EXPECT_EQ(rest.fill(tail.data(), tail.size()), 4U);
    EXPECT_EQ(std::string(tail.begin(), tail.begin() + 4), "6789");
}

TEST(BoundedReaderTest, ZeroLimitReadsNothing)
{
    std::istringstream input("data", std::ios::binary);
    std::array<std::uint8_t, 4> buffer {};

    BoundedReader reader(input, 0);
    EXPECT_EQ(reader.read(buffer.data(), buffer.size()), 0U);
    EXPECT_FALSE(reader.truncated());
    EXPECT_EQ(input.peek(), 'd');
}
