#include "SessionIndex.hpp"

#include <mutex>
#include <string>
#include <utility>

namespace maskgate::core
{

SessionIndex::SessionIndex(std::shared_ptr<spdlog::logger> logger) : m_logger(std::move(logger))
{
}

std::shared_ptr<Session> SessionIndex::insert(const std::shared_ptr<Session>& session)
{
    std::string mask{ session->mask() };

    const std::unique_lock<std::shared_mutex> lock{ m_mutex };
    auto [it, inserted]{ m_entries.try_emplace(std::move(mask), session) };
    if (inserted)
    {
        return nullptr;
    }

    std::shared_ptr<Session> displaced{ std::exchange(it->second, session) };
    return displaced;
}

std::shared_ptr<Session> SessionIndex::find(std::string_view mask) const
{
    const std::shared_lock<std::shared_mutex> lock{ m_mutex };
    if (const auto it{ m_entries.find(mask) }; it != m_entries.end())
    {
        return it->second;
    }
    return nullptr;
}

RegistryResult<std::monostate> SessionIndex::migrate(std::string_view oldMask, std::string_view newMask)
{
    const std::unique_lock<std::shared_mutex> lock{ m_mutex };
    const auto it{ m_entries.find(oldMask) };
    if (it == m_entries.end())
    {
        m_logger->warn("cannot migrate '{}' to '{}': no session registered", oldMask, newMask);
        return RegistryError::NotRegistered;
    }
    return moveEntryLocked(it, newMask);
}

RegistryResult<std::monostate> SessionIndex::migrate(const Session& session, std::string_view newMask)
{
    const std::unique_lock<std::shared_mutex> lock{ m_mutex };
    const std::string current{ session.mask() };
    const auto it{ m_entries.find(current) };
    if (it == m_entries.end() || it->second.get() != &session)
    {
        m_logger->warn("cannot migrate '{}' to '{}': session is no longer registered", current, newMask);
        return RegistryError::NotRegistered;
    }
    return moveEntryLocked(it, newMask);
}

RegistryResult<std::monostate> SessionIndex::moveEntryLocked(SessionMap::iterator entry, std::string_view newMask)
{
    if (entry->first == newMask)
    {
        return std::monostate{};
    }
    if (m_entries.contains(newMask))
    {
        m_logger->warn("cannot migrate '{}' to '{}': mask belongs to another session", entry->first, newMask);
        return RegistryError::MaskInUse;
    }

    auto node{ m_entries.extract(entry) };
    const std::string oldMask{ std::move(node.key()) };
    node.key().assign(newMask);
    node.mapped()->assignMask(newMask);
    m_entries.insert(std::move(node));

    m_logger->debug("migrated session '{}' -> '{}'", oldMask, newMask);
    return std::monostate{};
}

bool SessionIndex::remove(const Session& session)
{
    const std::unique_lock<std::shared_mutex> lock{ m_mutex };
    const std::string mask{ session.mask() };
    const auto it{ m_entries.find(mask) };
    if (it == m_entries.end() || it->second.get() != &session)
    {
        return false;
    }

    m_entries.erase(it);
    m_logger->debug("stopped session '{}'", mask);
    return true;
}

SessionMap SessionIndex::snapshot() const
{
    const std::shared_lock<std::shared_mutex> lock{ m_mutex };
    return m_entries;
}

std::size_t SessionIndex::size() const
{
    const std::shared_lock<std::shared_mutex> lock{ m_mutex };
    return m_entries.size();
}

std::vector<std::shared_ptr<Session>> SessionIndex::removeExpired()
{
    std::vector<std::shared_ptr<Session>> removed{};

    const std::unique_lock<std::shared_mutex> lock{ m_mutex };
    for (auto it{ m_entries.begin() }; it != m_entries.end();)
    {
        if (it->second->expired())
        {
            removed.push_back(std::move(it->second));
            it = m_entries.erase(it);
            continue;
        }
        ++it;
    }
    return removed;
}

} // namespace maskgate::core
