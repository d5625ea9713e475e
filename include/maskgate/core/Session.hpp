#ifndef INCLUDE_MASKGATE_CORE_SESSION_HPP
#define INCLUDE_MASKGATE_CORE_SESSION_HPP

#include "maskgate/core/Account.hpp"
#include "maskgate/core/SessionConfig.hpp"
#include "maskgate/core/SessionErrors.hpp"
#include "maskgate/core/SessionStorage.hpp"
#include "maskgate/crypto/ICryptoProvider.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace maskgate::core
{

class SessionIndex;
class SessionRegistry;

// A time-boxed authorization context for one mask. Created by SessionRegistry::create().
class Session final
{
public:
    // Only the registry can mint one, so every Session starts out registered.
    class RegistryKey final
    {
        friend class SessionRegistry;
        explicit RegistryKey() = default;
    };

    Session(RegistryKey key, const IAccount& user, std::string mask, const SessionConfig& config,
            std::weak_ptr<SessionIndex> index);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;
    ~Session() = default;

    [[nodiscard]] const IAccount& user() const noexcept;
    [[nodiscard]] std::string mask() const;
    [[nodiscard]] SessionStorage& storage() noexcept;
    [[nodiscard]] const SessionStorage& storage() const noexcept;

    // Empty until start() has been called.
    [[nodiscard]] std::optional<TimePoint> expiration() const;

    // Sets expiration to now + duration; calling again pushes it forward.
    void start();

    [[nodiscard]] bool active() const;
    [[nodiscard]] bool expired() const;
    [[nodiscard]] bool authed() const;
    [[nodiscard]] bool confirmed() const;
    [[nodiscard]] bool confirmationPending() const;

    // Moves the registry entry to newMask. Fails with MaskInUse if another session holds it,
    // or NotRegistered if this session was stopped or displaced.
    [[nodiscard]] RegistryResult<std::monostate> setMask(std::string_view newMask);

    // Drops the registry entry. Returns false if this session no longer owns it.
    bool stop();

    // Confirmation hooks for IConfirmationVerifier implementations. The session keeps only
    // the expected digest; how it is derived and delivered is up to the verifier.
    // Arming replaces any pending challenge and clears an earlier confirmation.
    void armConfirmation(const maskgate::crypto::Digest& expected);

    // NotRequired if nothing is armed. KeyIncorrect keeps the challenge armed.
    [[nodiscard]] ConfirmationResult<std::monostate> completeConfirmation(const maskgate::crypto::Digest& response);

private:
    friend class SessionIndex;

    void assignMask(std::string_view mask);

    [[nodiscard]] bool activeLocked() const;

    mutable std::mutex m_mutex;
    const IAccount* m_user{ nullptr };
    std::string m_mask;
    SessionStorage m_storage;
    Duration m_duration{};
    NowProvider m_now;
    std::optional<TimePoint> m_expiration;
    std::optional<maskgate::crypto::Digest> m_pendingKey;
    bool m_confirmed{ false };
    std::weak_ptr<SessionIndex> m_index;
};

} // namespace maskgate::core

#endif // INCLUDE_MASKGATE_CORE_SESSION_HPP
