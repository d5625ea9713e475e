#ifndef INCLUDE_MASKGATE_CORE_SESSIONREGISTRY_HPP
#define INCLUDE_MASKGATE_CORE_SESSIONREGISTRY_HPP

#include "maskgate/core/Account.hpp"
#include "maskgate/core/Logging.hpp"
#include "maskgate/core/Session.hpp"
#include "maskgate/core/SessionConfig.hpp"
#include "maskgate/core/SessionErrors.hpp"
#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <variant>

namespace maskgate::core
{

class SessionIndex;

using SessionMap = std::map<std::string, std::shared_ptr<Session>, std::less<>>;

// Anything the protocol layer hands us that can be reduced to a mask (a user, a message sender).
template <class T>
concept MaskSource = requires(const T& identity) {
    { identity.mask() } -> std::convertible_to<std::string_view>;
};

// Mask -> Session index. One registry is constructed at startup and injected into the dispatcher.
// All operations are safe to call from concurrent dispatch threads.
class SessionRegistry final
{
public:
    // Throws std::invalid_argument for a non-positive duration, an empty clock or a null logger.
    explicit SessionRegistry(SessionConfig config = {}, std::shared_ptr<spdlog::logger> logger = makeDefaultLogger());

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;
    SessionRegistry(SessionRegistry&&) = delete;
    SessionRegistry& operator=(SessionRegistry&&) = delete;
    ~SessionRegistry();

    // Registers a fresh, unstarted session. An existing entry for the mask is replaced;
    // the displaced session keeps working but can no longer touch the index.
    [[nodiscard]] std::shared_ptr<Session> create(const IAccount& user, std::string_view mask);

    // Exact match only. Returns nullptr when no session is registered for the mask.
    [[nodiscard]] std::shared_ptr<Session> lookup(std::string_view mask) const;

    template <MaskSource T> [[nodiscard]] std::shared_ptr<Session> lookup(const T& identity) const
    {
        return lookup(std::string_view{ identity.mask() });
    }

    // Renames an entry without going through the session, e.g. after a nick change seen on the wire.
    [[nodiscard]] RegistryResult<std::monostate> migrate(std::string_view oldMask, std::string_view newMask);

    [[nodiscard]] SessionMap all() const;
    [[nodiscard]] std::size_t size() const;

    // Drops every started session whose expiration has passed. Unstarted sessions stay.
    std::size_t reapExpired();

    [[nodiscard]] const SessionConfig& config() const noexcept;

private:
    SessionConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<SessionIndex> m_index;
};

} // namespace maskgate::core

#endif // INCLUDE_MASKGATE_CORE_SESSIONREGISTRY_HPP
