#include "maskgate/security/Secrets.hpp"

#include <array>
#include <cstdint>
#include <gtest/gtest.h>
#include <span>

namespace
{

using maskgate::security::secureEquals;
using maskgate::security::secureRandomFill;
using maskgate::security::secureWipe;

using DigestBytes = std::array<std::uint8_t, 64U>;

} // namespace

TEST(SecureWipe, ZerosDigestBuffer)
{
    DigestBytes digest{};
    digest.fill(0xEEU);

    secureWipe(std::span<std::uint8_t>{ digest });

    for (const auto b : digest)
    {
        EXPECT_EQ(b, 0U);
    }
}

TEST(SecureWipe, ZerosKeyText)
{
    std::array<char, 12U> key{ '3', 'f', 'a', '9', 'c', '2', 'd', '0', '1', 'b', '7', 'e' };

    secureWipe(std::span<char>{ key });

    for (const char c : key)
    {
        EXPECT_EQ(c, '\0');
    }
}

TEST(SecureWipe, EmptySpanIsNoOp)
{
    secureWipe(std::span<std::uint8_t>{});
    secureWipe(std::span<char>{});
}

TEST(SecureEquals, DigestsCompareByContent)
{
    DigestBytes a{};
    DigestBytes b{};
    a.fill(0x11U);
    b.fill(0x11U);
    EXPECT_TRUE(secureEquals(a, b));

    b.back() = 0x12U;
    EXPECT_FALSE(secureEquals(a, b));

    b.back() = 0x11U;
    b.front() = 0x10U;
    EXPECT_FALSE(secureEquals(a, b));
}

TEST(SecureEquals, MismatchedSizesReturnFalse)
{
    const DigestBytes a{};
    EXPECT_FALSE(secureEquals(std::span<const std::uint8_t>{ a }, std::span<const std::uint8_t>{ a }.first(32U)));
}

TEST(SecureEquals, EmptySpansAreEqual)
{
    EXPECT_TRUE(secureEquals(std::span<const std::uint8_t>{}, std::span<const std::uint8_t>{}));
}

TEST(SecureRandom, FillEmptyIsNoOp)
{
    std::array<std::uint8_t, 0U> bytes{};
    EXPECT_TRUE(secureRandomFill(std::span<std::uint8_t>{ bytes }));
}

TEST(SecureRandom, ConsecutiveKeyBuffersDiffer)
{
    std::array<std::uint8_t, 32U> a{};
    std::array<std::uint8_t, 32U> b{};

    ASSERT_TRUE(secureRandomFill(std::span<std::uint8_t>{ a }));
    ASSERT_TRUE(secureRandomFill(std::span<std::uint8_t>{ b }));
    EXPECT_NE(a, b);
}
