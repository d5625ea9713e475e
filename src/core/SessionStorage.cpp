#include "maskgate/core/SessionStorage.hpp"

#include <utility>

namespace maskgate::core
{

std::optional<std::any> SessionStorage::get(const StorageKey& key) const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    if (const auto it{ m_slots.find(key.name()) }; it != m_slots.end())
    {
        return it->second;
    }
    return std::nullopt;
}

void SessionStorage::set(const StorageKey& key, std::any value)
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    m_slots.insert_or_assign(key.name(), std::move(value));
}

bool SessionStorage::contains(const StorageKey& key) const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    return m_slots.contains(key.name());
}

std::size_t SessionStorage::size() const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    return m_slots.size();
}

SessionStorage::Slots SessionStorage::all() const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    return m_slots;
}

} // namespace maskgate::core
