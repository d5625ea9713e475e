#ifndef INCLUDE_MASKGATE_CORE_CONFIRMATIONVERIFIER_HPP
#define INCLUDE_MASKGATE_CORE_CONFIRMATIONVERIFIER_HPP

#include "maskgate/core/IConfirmationVerifier.hpp"
#include "maskgate/core/Logging.hpp"
#include "maskgate/core/Session.hpp"
#include "maskgate/core/SessionErrors.hpp"
#include "maskgate/crypto/ICryptoProvider.hpp"
#include "maskgate/security/SecureString.hpp"
#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <variant>

namespace maskgate::core
{

constexpr std::size_t g_kConfirmationKeyBytes{ 6 };

// Issues one-time confirmation keys and checks the user's answer.
// A session stores only the BLAKE2b digest of its pending key.
class ConfirmationVerifier final : public IConfirmationVerifier
{
public:
    explicit ConfirmationVerifier(maskgate::crypto::ICryptoProvider& crypto,
                                  std::shared_ptr<spdlog::logger> logger = makeDefaultLogger());

    // Arms `session` with a fresh key and clears any earlier confirmation.
    // The returned hex key is for the host to deliver out of band.
    [[nodiscard]] ConfirmationResult<maskgate::security::SecureString> issue(Session& session) override;

    // NotRequired if no key is pending; KeyIncorrect leaves the key pending for a retry.
    [[nodiscard]] ConfirmationResult<std::monostate>
    confirm(Session& session, const maskgate::security::SecureString& response) override;

private:
    maskgate::crypto::ICryptoProvider* m_crypto{ nullptr };
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace maskgate::core

#endif // INCLUDE_MASKGATE_CORE_CONFIRMATIONVERIFIER_HPP
