#include "maskgate/core/ConfirmationVerifier.hpp"

#include "maskgate/security/Secrets.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <utility>

namespace maskgate::core
{
namespace
{

maskgate::security::SecureString toHexKey(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    maskgate::security::SecureString out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

} // namespace

ConfirmationVerifier::ConfirmationVerifier(maskgate::crypto::ICryptoProvider& crypto,
                                           std::shared_ptr<spdlog::logger> logger)
    : m_crypto(&crypto), m_logger(std::move(logger))
{
    if (!m_logger)
    {
        throw std::invalid_argument("ConfirmationVerifier: missing logger");
    }
}

ConfirmationResult<maskgate::security::SecureString> ConfirmationVerifier::issue(Session& session)
{
    std::array<std::uint8_t, g_kConfirmationKeyBytes> raw{};
    if (!m_crypto->randomBytes(std::span<std::uint8_t>{ raw }))
    {
        m_logger->error("could not generate a confirmation key for '{}'", session.mask());
        return ConfirmationError::RandomFailed;
    }

    maskgate::security::SecureString key{ toHexKey(raw) };
    maskgate::security::secureWipe(std::span<std::uint8_t>{ raw });

    session.armConfirmation(m_crypto->digest(maskgate::security::asBytes(key)));
    m_logger->debug("issued confirmation key for '{}'", session.mask());
    return key;
}

ConfirmationResult<std::monostate> ConfirmationVerifier::confirm(Session& session,
                                                                 const maskgate::security::SecureString& response)
{
    auto result{ session.completeConfirmation(m_crypto->digest(maskgate::security::asBytes(response))) };
    if (const auto* error{ std::get_if<ConfirmationError>(&result) }; error != nullptr)
    {
        m_logger->warn("rejected confirmation for '{}': {}", session.mask(), describe(*error));
        return result;
    }

    m_logger->info("session '{}' confirmed as '{}'", session.mask(), session.user().name());
    return result;
}

} // namespace maskgate::core
