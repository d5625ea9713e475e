#include "maskgate/security/SecureString.hpp"

#include <cstddef>
#include <gtest/gtest.h>
#include <string_view>

namespace
{

using maskgate::security::asBytes;
using maskgate::security::asStringView;
using maskgate::security::SecureString;
using maskgate::security::secureStringFrom;
using maskgate::security::WipingAllocator;

} // namespace

TEST(SecureString, EmptyViewsAreSafe)
{
    const SecureString s{};
    EXPECT_TRUE(asStringView(s).empty());
    EXPECT_TRUE(asBytes(s).empty());
}

TEST(SecureString, FromCopiesKeyText)
{
    constexpr std::string_view input{ "3fa9c2d01b7e" };
    const SecureString s{ secureStringFrom(input) };

    EXPECT_EQ(asStringView(s), input);
    ASSERT_EQ(asBytes(s).size(), input.size());
    EXPECT_EQ(asBytes(s).front(), std::byte{ 0x33 });
}

TEST(SecureString, SurvivesReallocation)
{
    SecureString s{ secureStringFrom("ab") };
    constexpr std::size_t kLarge{ 1000U };

    s.resize(kLarge, 'x');

    EXPECT_EQ(s.size(), kLarge);
    EXPECT_EQ(asStringView(s).substr(0U, 3U), "abx");
}

TEST(SecureString, AllocatorsAreInterchangeable)
{
    const WipingAllocator<char> a{};
    const WipingAllocator<char> b{};
    const WipingAllocator<unsigned char> rebound{ a };

    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a != b);
    EXPECT_TRUE(rebound == WipingAllocator<unsigned char>{});
}
