#include "maskgate/crypto/providers/CryptoProviders.hpp"
#include "maskgate/security/Secrets.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <span>

namespace maskgate::crypto::providers
{
namespace
{

std::span<const std::uint8_t> asU8(std::span<const std::byte> s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

class NativeCryptoProvider final : public maskgate::crypto::ICryptoProvider
{
public:
    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return maskgate::security::secureRandomFill(out);
    }

    [[nodiscard]] maskgate::crypto::Digest digest(std::span<const std::byte> message) const override
    {
        maskgate::crypto::Digest out{};
        const auto msg{ asU8(message) };
        crypto_blake2b(out.data(), out.size(), msg.data(), msg.size());
        return out;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<maskgate::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace maskgate::crypto::providers
