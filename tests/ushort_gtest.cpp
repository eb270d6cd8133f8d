// GoogleTest unit tests for junsigned::UShort
#include "junsigned/UShort.hpp"
#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <limits>
#include <sstream>
#include <unordered_set>

using namespace junsigned;

TEST(UShortTest, Constants)
{
    EXPECT_EQ(UShort::MIN.intValue(), 0);
    EXPECT_EQ(UShort::MAX.intValue(), 65535);
    EXPECT_EQ(UShort::MIN_VALUE, 0);
    EXPECT_EQ(UShort::MAX_VALUE, 0xffff);
    EXPECT_LT(UShort::MIN, UShort::MAX);
}

TEST(UShortTest, IntRoundTripWholeRange)
{
    for (int n = UShort::MIN_VALUE; n <= UShort::MAX_VALUE; ++n)
    {
        ASSERT_EQ(UShort::valueOf(n).intValue(), n);
    }
}

TEST(UShortTest, IntOutOfRange)
{
    EXPECT_THROW((void) UShort::valueOf(-1), NumberRangeException);
    EXPECT_THROW((void) UShort::valueOf(65536), NumberRangeException);
    EXPECT_THROW((void) UShort::valueOf(std::numeric_limits<int>::min()), NumberRangeException);
    EXPECT_THROW((void) UShort::valueOf(std::numeric_limits<int>::max()), NumberRangeException);
}

TEST(UShortTest, RangeExceptionCarriesValue)
{
    try
    {
        (void) UShort::valueOf(70000);
        FAIL() << "expected NumberRangeException";
    }
    catch (const NumberRangeException& e)
    {
        EXPECT_EQ(e.getValue(), 70000);
        EXPECT_EQ(e.getMin(), 0);
        EXPECT_EQ(e.getMax(), 65535);
        EXPECT_NE(std::string(e.what()).find("70000"), std::string::npos);
    }
}

TEST(UShortTest, MaskingNeverThrows)
{
    static_assert(noexcept(UShort::valueOf(std::int16_t{})));
    for (int s = std::numeric_limits<std::int16_t>::min(); s <= std::numeric_limits<std::int16_t>::max(); ++s)
    {
        const auto v = static_cast<std::int16_t>(s);
        ASSERT_EQ(UShort::valueOf(v).intValue(), s & 0xFFFF);
    }
    EXPECT_EQ(UShort::valueOf(static_cast<std::int16_t>(-1)), UShort::MAX);
    EXPECT_EQ(UShort::valueOf(static_cast<std::int16_t>(-32768)).intValue(), 32768);
}

TEST(UShortTest, ShortValueInvertsMasking)
{
    EXPECT_EQ(UShort::MAX.shortValue(), -1);
    EXPECT_EQ(UShort::valueOf(32768).shortValue(), std::numeric_limits<std::int16_t>::min());
    EXPECT_EQ(UShort::valueOf(UShort::valueOf(40000).shortValue()).intValue(), 40000);
}

TEST(UShortTest, ComposeFromBytesUsesFixedOrder)
{
    for (int low = 0; low <= 255; ++low)
    {
        for (int high = 0; high <= 255; ++high)
        {
            const auto v = UShort::valueOf(UByte::valueOf(low), UByte::valueOf(high));
            ASSERT_EQ(v.intValue(), (low << 8) | high);
        }
    }
    EXPECT_EQ(UShort::valueOf(UByte::valueOf(0x12), UByte::valueOf(0x34)).intValue(), 0x1234);
}

TEST(UShortTest, ToBytesIsLittleEndian)
{
    const std::array<std::uint8_t, 2> expected{0x34, 0x12};
    EXPECT_EQ(UShort::valueOf(0x1234).toBytes(), expected);
    EXPECT_EQ(UShort::valueOf(4660).toBytes(), expected);

    const std::array<std::uint8_t, 2> zero{0x00, 0x00};
    const std::array<std::uint8_t, 2> max{0xff, 0xff};
    EXPECT_EQ(UShort::MIN.toBytes(), zero);
    EXPECT_EQ(UShort::MAX.toBytes(), max);

    const std::array<std::uint8_t, 2> port{0x90, 0x1f};
    EXPECT_EQ(UShort::valueOf(8080).toBytes(), port);
}

TEST(UShortTest, ToBytesWholeRange)
{
    for (int n = 0; n <= UShort::MAX_VALUE; ++n)
    {
        const auto bytes = UShort::valueOf(n).toBytes();
        ASSERT_EQ(bytes[0], n % 256);
        ASSERT_EQ(bytes[1], n / 256);
    }
}

TEST(UShortTest, ComposeIsNotInverseOfToBytes)
{
    const auto v = UShort::valueOf(0x1234);
    const auto bytes = v.toBytes();
    const auto back = UShort::valueOf(UByte::valueOf(bytes[0]), UByte::valueOf(bytes[1]));
    EXPECT_EQ(back.intValue(), 0x3412);
    const auto swapped = UShort::valueOf(UByte::valueOf(bytes[1]), UByte::valueOf(bytes[0]));
    EXPECT_EQ(swapped, v);
}

TEST(UShortTest, ParseValid)
{
    EXPECT_EQ(UShort::valueOf("0").intValue(), 0);
    EXPECT_EQ(UShort::valueOf("65535"), UShort::MAX);
    EXPECT_EQ(UShort::valueOf("8080").intValue(), 8080);
    EXPECT_EQ(UShort::valueOf("+42").intValue(), 42);
    EXPECT_EQ(UShort::valueOf("-0").intValue(), 0);
    EXPECT_EQ(UShort::valueOf("000123").intValue(), 123);
    EXPECT_EQ(UShort::valueOf(std::string("321")).intValue(), 321);
}

TEST(UShortTest, ParseOutOfRange)
{
    EXPECT_THROW((void) UShort::valueOf("65536"), NumberRangeException);
    EXPECT_THROW((void) UShort::valueOf("-1"), NumberRangeException);
    EXPECT_THROW((void) UShort::valueOf("2147483647"), NumberRangeException);
}

TEST(UShortTest, ParseInvalid)
{
    EXPECT_THROW((void) UShort::valueOf("abc"), NumberFormatException);
    EXPECT_THROW((void) UShort::valueOf(""), NumberFormatException);
    EXPECT_THROW((void) UShort::valueOf("+"), NumberFormatException);
    EXPECT_THROW((void) UShort::valueOf("-"), NumberFormatException);
    EXPECT_THROW((void) UShort::valueOf("+-5"), NumberFormatException);
    EXPECT_THROW((void) UShort::valueOf(" 5"), NumberFormatException);
    EXPECT_THROW((void) UShort::valueOf("5 "), NumberFormatException);
    EXPECT_THROW((void) UShort::valueOf("0x10"), NumberFormatException);
    EXPECT_THROW((void) UShort::valueOf("1.5"), NumberFormatException);
    // Too large for int: a format error, not a range error.
    EXPECT_THROW((void) UShort::valueOf("2147483648"), NumberFormatException);
    EXPECT_THROW((void) UShort::valueOf("99999999999999999999"), NumberFormatException);
}

TEST(UShortTest, BothErrorKindsAreNumberExceptions)
{
    EXPECT_THROW((void) UShort::valueOf("abc"), NumberException);
    EXPECT_THROW((void) UShort::valueOf("65536"), NumberException);
    EXPECT_THROW((void) UShort::MAX.add(1), NumberException);
}

TEST(UShortTest, Conversions)
{
    const auto v = UShort::valueOf(65535);
    EXPECT_EQ(v.intValue(), 65535);
    EXPECT_EQ(v.longValue(), 65535);
    EXPECT_FLOAT_EQ(v.floatValue(), 65535.0f);
    EXPECT_DOUBLE_EQ(v.doubleValue(), 65535.0);
    EXPECT_EQ(v.toBigInteger(), BigInteger(65535));
    EXPECT_EQ(v.toBigInteger() * v.toBigInteger(), BigInteger("4294836225"));
}

TEST(UShortTest, ToStringIsPlainDecimal)
{
    EXPECT_EQ(UShort::MIN.toString(), "0");
    EXPECT_EQ(UShort::MAX.toString(), "65535");
    EXPECT_EQ(UShort::valueOf("007").toString(), "7");
    EXPECT_EQ(UShort::valueOf(static_cast<std::int16_t>(-2)).toString(), "65534");

    std::ostringstream oss;
    oss << UShort::valueOf(1234);
    EXPECT_EQ(oss.str(), "1234");
}

TEST(UShortTest, EqualityAndOrderingAgree)
{
    const std::array<int, 6> samples{0, 1, 255, 256, 32768, 65535};
    for (const int x : samples)
    {
        for (const int y : samples)
        {
            const auto a = UShort::valueOf(x);
            const auto b = UShort::valueOf(y);
            EXPECT_EQ(a.equals(b), a.compareTo(b) == 0);
            EXPECT_EQ(a == b, a.equals(b));
            EXPECT_EQ(a.compareTo(b), x < y ? -1 : (x == y ? 0 : 1));
            EXPECT_EQ(a < b, x < y);
            EXPECT_EQ(a >= b, x >= y);
        }
    }
}

TEST(UShortTest, NotEqualToOtherTypes)
{
    const auto s = UShort::valueOf(200);
    const auto b = UByte::valueOf(200);
    EXPECT_FALSE(s.equals(b));
    EXPECT_FALSE(b.equals(s));
    EXPECT_TRUE(s.equals(UShort::valueOf("200")));
}

TEST(UShortTest, HashConsistentWithEquals)
{
    EXPECT_EQ(UShort::valueOf(4660).hashCode(), UShort::valueOf("4660").hashCode());
    EXPECT_EQ(std::hash<UShort>{}(UShort::MAX), std::hash<UShort>{}(UShort::valueOf(static_cast<std::int16_t>(-1))));

    std::unordered_set<UShort> set;
    set.insert(UShort::valueOf(1));
    set.insert(UShort::valueOf("1"));
    set.insert(UShort::valueOf(2));
    EXPECT_EQ(set.size(), 2u);
}

TEST(UShortTest, AddChecked)
{
    EXPECT_EQ(UShort::valueOf(60000).add(UShort::valueOf(5535)), UShort::MAX);
    EXPECT_EQ(UShort::MIN.add(UShort::MIN), UShort::MIN);
    EXPECT_THROW((void) UShort::MAX.add(UShort::valueOf(1)), NumberRangeException);
    EXPECT_THROW((void) UShort::valueOf(40000).add(UShort::valueOf(30000)), NumberRangeException);

    EXPECT_EQ(UShort::valueOf(10).add(5).intValue(), 15);
    EXPECT_EQ(UShort::valueOf(10).add(-10), UShort::MIN);
    EXPECT_THROW((void) UShort::valueOf(10).add(-11), NumberRangeException);
    EXPECT_THROW((void) UShort::MAX.add(1), NumberRangeException);
    EXPECT_THROW((void) UShort::MAX.add(std::numeric_limits<int>::max()), NumberRangeException);
    EXPECT_THROW((void) UShort::MIN.add(std::numeric_limits<int>::min()), NumberRangeException);
}

TEST(UShortTest, SubtractChecked)
{
    EXPECT_EQ(UShort::valueOf(100).subtract(UShort::valueOf(40)).intValue(), 60);
    EXPECT_EQ(UShort::MAX.subtract(UShort::MAX), UShort::MIN);
    EXPECT_THROW((void) UShort::valueOf(1).subtract(UShort::valueOf(2)), NumberRangeException);

    EXPECT_EQ(UShort::valueOf(100).subtract(1).intValue(), 99);
    EXPECT_EQ(UShort::valueOf(100).subtract(-100).intValue(), 200);
    EXPECT_THROW((void) UShort::MIN.subtract(1), NumberRangeException);
    EXPECT_THROW((void) UShort::MAX.subtract(-1), NumberRangeException);
    EXPECT_THROW((void) UShort::MIN.subtract(std::numeric_limits<int>::min()), NumberRangeException);
}

TEST(UShortTest, ArithmeticLeavesOperandsUnchanged)
{
    const auto a = UShort::valueOf(1000);
    const auto b = UShort::valueOf(24);
    const auto sum = a.add(b);
    const auto diff = a.subtract(b);
    EXPECT_EQ(a.intValue(), 1000);
    EXPECT_EQ(b.intValue(), 24);
    EXPECT_EQ(sum.intValue(), 1024);
    EXPECT_EQ(diff.intValue(), 976);
}

TEST(UShortTest, FailedArithmeticReportsResult)
{
    try
    {
        (void) UShort::valueOf(5).subtract(UShort::valueOf(7));
        FAIL() << "expected NumberRangeException";
    }
    catch (const NumberRangeException& e)
    {
        EXPECT_EQ(e.getValue(), -2);
    }
}
