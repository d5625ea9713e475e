#ifndef INCLUDE_MASKGATE_CRYPTO_PROVIDERS_CRYPTOPROVIDERS_HPP
#define INCLUDE_MASKGATE_CRYPTO_PROVIDERS_CRYPTOPROVIDERS_HPP

#include "maskgate/crypto/ICryptoProvider.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace maskgate::crypto::providers
{

enum class Backend : std::uint8_t
{
    Native,  // getrandom(2) + Monocypher BLAKE2b
    OpenSsl, // getrandom(2) + EVP BLAKE2B-512
};

// Backends compiled into this build, most preferred first. Never empty.
[[nodiscard]] std::vector<Backend> availableBackends();

// Throws std::invalid_argument if `backend` was not compiled in.
[[nodiscard]] std::unique_ptr<maskgate::crypto::ICryptoProvider> makeCryptoProvider(Backend backend);

[[nodiscard]] std::unique_ptr<maskgate::crypto::ICryptoProvider> makeDefaultCryptoProvider();

#if defined(MASKGATE_HAS_MONOCYPHER)
[[nodiscard]] std::unique_ptr<maskgate::crypto::ICryptoProvider> makeNativeCryptoProvider();
#endif

#if defined(MASKGATE_ENABLE_OPENSSL)
[[nodiscard]] std::unique_ptr<maskgate::crypto::ICryptoProvider> makeOpenSslCryptoProvider();
#endif

} // namespace maskgate::crypto::providers

#endif // INCLUDE_MASKGATE_CRYPTO_PROVIDERS_CRYPTOPROVIDERS_HPP
