#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <string_view>

#include "maskgate/crypto/providers/CryptoProviders.hpp"

namespace
{

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

} // namespace

// A session armed through one backend must accept keys checked through the other.
TEST(CryptoProviderParity, DigestNativeEqualsOpenSsl)
{
    using maskgate::crypto::providers::Backend;
    const auto native{ maskgate::crypto::providers::makeCryptoProvider(Backend::Native) };
    const auto openssl{ maskgate::crypto::providers::makeCryptoProvider(Backend::OpenSsl) };

    for (const std::string_view key : { "", "a", "3fa9c2d01b7e", "a much longer confirmation response than usual" })
    {
        EXPECT_EQ(native->digest(asBytes(key)), openssl->digest(asBytes(key))) << "input: " << key;
    }
}
