#include "maskgate/crypto/providers/CryptoProviders.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <gtest/gtest.h>
#include <span>
#include <stdexcept>
#include <string_view>

namespace
{

using maskgate::crypto::providers::availableBackends;
using maskgate::crypto::providers::Backend;
using maskgate::crypto::providers::makeCryptoProvider;
using maskgate::crypto::providers::makeDefaultCryptoProvider;

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

} // namespace

TEST(CryptoProviders, AtLeastOneBackendIsBuilt)
{
    const auto backends{ availableBackends() };
    ASSERT_FALSE(backends.empty());
#if defined(MASKGATE_HAS_MONOCYPHER)
    EXPECT_EQ(backends.front(), Backend::Native);
#else
    EXPECT_EQ(backends.front(), Backend::OpenSsl);
#endif
}

TEST(CryptoProviders, EveryBuiltBackendDigestsAndFills)
{
    for (const Backend backend : availableBackends())
    {
        const auto provider{ makeCryptoProvider(backend) };
        ASSERT_NE(provider, nullptr);

        std::array<std::uint8_t, 6U> raw{};
        EXPECT_TRUE(provider->randomBytes(raw));
        EXPECT_NE(provider->digest(asBytes("3fa9c2d01b7e")), provider->digest(asBytes("3fa9c2d01b7f")));
    }
}

TEST(CryptoProviders, DefaultMatchesPreferredBackend)
{
    const auto fallback{ makeDefaultCryptoProvider() };
    const auto preferred{ makeCryptoProvider(availableBackends().front()) };

    EXPECT_EQ(fallback->digest(asBytes("abc")), preferred->digest(asBytes("abc")));
}

TEST(CryptoProviders, MissingBackendThrows)
{
    const auto backends{ availableBackends() };
    for (const Backend backend : { Backend::Native, Backend::OpenSsl })
    {
        if (std::find(backends.begin(), backends.end(), backend) == backends.end())
        {
            EXPECT_THROW({ [[maybe_unused]] const auto p{ makeCryptoProvider(backend) }; }, std::invalid_argument);
        }
    }
}
