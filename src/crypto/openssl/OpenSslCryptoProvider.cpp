#include "maskgate/crypto/providers/CryptoProviders.hpp"
#include "maskgate/security/Secrets.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <openssl/evp.h>
#include <span>
#include <stdexcept>

namespace maskgate::crypto::providers
{
namespace
{

using EvpMdPtr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

EvpMdPtr fetchBlake2b512()
{
    if (EVP_MD * md{ EVP_MD_fetch(nullptr, "BLAKE2B-512", nullptr) }; md != nullptr)
    {
        return EvpMdPtr{ md, &EVP_MD_free };
    }
    return EvpMdPtr{ nullptr, &EVP_MD_free };
}

class OpenSslCryptoProvider final : public maskgate::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_blake2b{ fetchBlake2b512() }
    {
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return maskgate::security::secureRandomFill(out);
    }

    [[nodiscard]] maskgate::crypto::Digest digest(std::span<const std::byte> message) const override
    {
        if (!m_blake2b)
        {
            throw std::runtime_error("digest: OpenSSL BLAKE2B-512 not available");
        }
        if (message.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("digest: message too large");
        }

        EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("digest: EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex2(ctx.get(), m_blake2b.get(), nullptr) != 1)
        {
            throw std::runtime_error("digest: EVP_DigestInit_ex2 failed");
        }
        if (EVP_DigestUpdate(ctx.get(), message.data(), message.size()) != 1)
        {
            throw std::runtime_error("digest: EVP_DigestUpdate failed");
        }

        maskgate::crypto::Digest out{};
        unsigned int written{ 0U };
        if (EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1)
        {
            throw std::runtime_error("digest: EVP_DigestFinal_ex failed");
        }
        if (written != out.size())
        {
            throw std::runtime_error("digest: unexpected digest length");
        }
        return out;
    }

private:
    EvpMdPtr m_blake2b{ nullptr, &EVP_MD_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<maskgate::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace maskgate::crypto::providers
