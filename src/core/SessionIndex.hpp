#ifndef MASKGATE_SRC_CORE_SESSIONINDEX_HPP
#define MASKGATE_SRC_CORE_SESSIONINDEX_HPP

#include "maskgate/core/Session.hpp"
#include "maskgate/core/SessionErrors.hpp"
#include "maskgate/core/SessionRegistry.hpp"
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <spdlog/spdlog.h>
#include <string_view>
#include <variant>
#include <vector>

namespace maskgate::core
{

// Shared between a registry and its sessions; sessions hold it weakly so a destroyed
// registry simply makes setMask()/stop() report NotRegistered.
// Lock order: index, then session.
class SessionIndex final
{
public:
    explicit SessionIndex(std::shared_ptr<spdlog::logger> logger);

    // Returns the displaced session, if any.
    std::shared_ptr<Session> insert(const std::shared_ptr<Session>& session);

    [[nodiscard]] std::shared_ptr<Session> find(std::string_view mask) const;

    [[nodiscard]] RegistryResult<std::monostate> migrate(std::string_view oldMask, std::string_view newMask);

    // Only succeeds if `session` is the entry currently registered under its own mask.
    [[nodiscard]] RegistryResult<std::monostate> migrate(const Session& session, std::string_view newMask);

    bool remove(const Session& session);

    [[nodiscard]] SessionMap snapshot() const;
    [[nodiscard]] std::size_t size() const;

    std::vector<std::shared_ptr<Session>> removeExpired();

private:
    [[nodiscard]] RegistryResult<std::monostate> moveEntryLocked(SessionMap::iterator entry,
                                                                 std::string_view newMask);

    mutable std::shared_mutex m_mutex;
    SessionMap m_entries;
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace maskgate::core

#endif // MASKGATE_SRC_CORE_SESSIONINDEX_HPP
