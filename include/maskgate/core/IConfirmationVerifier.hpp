#ifndef INCLUDE_MASKGATE_CORE_ICONFIRMATIONVERIFIER_HPP
#define INCLUDE_MASKGATE_CORE_ICONFIRMATIONVERIFIER_HPP

#include "maskgate/core/Session.hpp"
#include "maskgate/core/SessionErrors.hpp"
#include "maskgate/security/SecureString.hpp"
#include <variant>

namespace maskgate::core
{

// A challenge scheme. Implementations drive Session::armConfirmation() and
// Session::completeConfirmation(); the session never learns how the challenge was built.
class IConfirmationVerifier
{
public:
    IConfirmationVerifier() = default;
    IConfirmationVerifier(const IConfirmationVerifier&) = delete;
    IConfirmationVerifier& operator=(const IConfirmationVerifier&) = delete;
    IConfirmationVerifier(IConfirmationVerifier&&) = delete;
    IConfirmationVerifier& operator=(IConfirmationVerifier&&) = delete;
    virtual ~IConfirmationVerifier() = default;

    // Returns the challenge text the host delivers to the user.
    [[nodiscard]] virtual ConfirmationResult<maskgate::security::SecureString> issue(Session& session) = 0;

    [[nodiscard]] virtual ConfirmationResult<std::monostate>
    confirm(Session& session, const maskgate::security::SecureString& response) = 0;
};

} // namespace maskgate::core

#endif // INCLUDE_MASKGATE_CORE_ICONFIRMATIONVERIFIER_HPP
