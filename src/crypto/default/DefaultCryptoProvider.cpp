#include "maskgate/crypto/providers/CryptoProviders.hpp"

#include <stdexcept>

#if !defined(MASKGATE_HAS_MONOCYPHER) && !defined(MASKGATE_ENABLE_OPENSSL)
#error No crypto backend enabled
#endif

namespace maskgate::crypto::providers
{

std::vector<Backend> availableBackends()
{
    std::vector<Backend> out{};
#if defined(MASKGATE_HAS_MONOCYPHER)
    out.push_back(Backend::Native);
#endif
#if defined(MASKGATE_ENABLE_OPENSSL)
    out.push_back(Backend::OpenSsl);
#endif
    return out;
}

std::unique_ptr<maskgate::crypto::ICryptoProvider> makeCryptoProvider(Backend backend)
{
    switch (backend)
    {
    case Backend::Native:
#if defined(MASKGATE_HAS_MONOCYPHER)
        return makeNativeCryptoProvider();
#else
        break;
#endif
    case Backend::OpenSsl:
#if defined(MASKGATE_ENABLE_OPENSSL)
        return makeOpenSslCryptoProvider();
#else
        break;
#endif
    }
    throw std::invalid_argument("makeCryptoProvider: backend not built");
}

std::unique_ptr<maskgate::crypto::ICryptoProvider> makeDefaultCryptoProvider()
{
    return makeCryptoProvider(availableBackends().front());
}

} // namespace maskgate::crypto::providers
