#ifndef INCLUDE_MASKGATE_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_MASKGATE_CRYPTO_ICRYPTOPROVIDER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace maskgate::crypto
{

constexpr std::size_t g_digestBytes{ 64 };

// BLAKE2b-512, unkeyed.
using Digest = std::array<std::uint8_t, g_digestBytes>;

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // Backend faults throw std::runtime_error; oversized input throws std::invalid_argument.
    [[nodiscard]] virtual Digest digest(std::span<const std::byte> message) const = 0;
};

} // namespace maskgate::crypto

#endif // INCLUDE_MASKGATE_CRYPTO_ICRYPTOPROVIDER_HPP
