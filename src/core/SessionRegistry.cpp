#include "maskgate/core/SessionRegistry.hpp"

#include "SessionIndex.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace maskgate::core
{
namespace
{

SessionConfig requireValidConfig(SessionConfig config)
{
    if (config.duration <= Duration::zero())
    {
        throw std::invalid_argument("SessionRegistry: session duration must be positive");
    }
    if (!config.now)
    {
        throw std::invalid_argument("SessionRegistry: missing clock");
    }
    return config;
}

std::shared_ptr<spdlog::logger> requireLogger(std::shared_ptr<spdlog::logger> logger)
{
    if (!logger)
    {
        throw std::invalid_argument("SessionRegistry: missing logger");
    }
    return logger;
}

} // namespace

SessionRegistry::SessionRegistry(SessionConfig config, std::shared_ptr<spdlog::logger> logger)
    : m_config(requireValidConfig(std::move(config))), m_logger(requireLogger(std::move(logger))),
      m_index(std::make_shared<SessionIndex>(m_logger))
{
}

SessionRegistry::~SessionRegistry() = default;

std::shared_ptr<Session> SessionRegistry::create(const IAccount& user, std::string_view mask)
{
    auto session{ std::make_shared<Session>(Session::RegistryKey{}, user, std::string{ mask }, m_config, m_index) };

    if (const auto displaced{ m_index->insert(session) }; displaced)
    {
        m_logger->info("replaced session for '{}' (account '{}')", mask, displaced->user().name());
    }
    m_logger->debug("created session for '{}' (account '{}')", mask, user.name());
    return session;
}

std::shared_ptr<Session> SessionRegistry::lookup(std::string_view mask) const
{
    return m_index->find(mask);
}

RegistryResult<std::monostate> SessionRegistry::migrate(std::string_view oldMask, std::string_view newMask)
{
    return m_index->migrate(oldMask, newMask);
}

SessionMap SessionRegistry::all() const
{
    return m_index->snapshot();
}

std::size_t SessionRegistry::size() const
{
    return m_index->size();
}

std::size_t SessionRegistry::reapExpired()
{
    const std::vector<std::shared_ptr<Session>> removed{ m_index->removeExpired() };
    for (const auto& session : removed)
    {
        m_logger->debug("reaped expired session '{}'", session->mask());
    }
    if (!removed.empty())
    {
        m_logger->info("reaped {} expired session(s), {} remaining", removed.size(), m_index->size());
    }
    return removed.size();
}

const SessionConfig& SessionRegistry::config() const noexcept
{
    return m_config;
}

} // namespace maskgate::core
