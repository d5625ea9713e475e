#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "maskgate/crypto/providers/CryptoProviders.hpp"

namespace
{

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

std::string toHex(const maskgate::crypto::Digest& digest)
{
    constexpr char kHex[] = "0123456789abcdef";
    std::string out{};
    for (const std::uint8_t b : digest)
    {
        out.push_back(kHex[b >> 4U]);
        out.push_back(kHex[b & 0x0FU]);
    }
    return out;
}

// RFC 7693, Appendix A.
constexpr std::string_view g_kAbcDigest{ "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
                                         "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923" };

} // namespace

TEST(OpenSslCryptoProvider, DigestMatchesKnownVector)
{
    const auto provider{ maskgate::crypto::providers::makeOpenSslCryptoProvider() };
    EXPECT_EQ(toHex(provider->digest(asBytes("abc"))), g_kAbcDigest);
}

TEST(OpenSslCryptoProvider, DigestDistinguishesInputs)
{
    const auto provider{ maskgate::crypto::providers::makeOpenSslCryptoProvider() };
    EXPECT_NE(provider->digest(asBytes("3fa9c2d01b7e")), provider->digest(asBytes("3fa9c2d01b7f")));
}

TEST(OpenSslCryptoProvider, DigestOfEmptyInputIsDefined)
{
    const auto provider{ maskgate::crypto::providers::makeOpenSslCryptoProvider() };
    EXPECT_EQ(provider->digest({}), provider->digest(asBytes("")));
}

TEST(OpenSslCryptoProvider, RandomBytesFills)
{
    const auto provider{ maskgate::crypto::providers::makeOpenSslCryptoProvider() };
    std::array<std::uint8_t, 32U> a{};
    std::array<std::uint8_t, 32U> b{};
    ASSERT_TRUE(provider->randomBytes(std::span<std::uint8_t>{ a }));
    ASSERT_TRUE(provider->randomBytes(std::span<std::uint8_t>{ b }));
    EXPECT_NE(a, b);
}
