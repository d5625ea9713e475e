#ifndef INCLUDE_MASKGATE_CORE_SESSIONSTORAGE_HPP
#define INCLUDE_MASKGATE_CORE_SESSIONSTORAGE_HPP

#include "maskgate/core/StorageKey.hpp"
#include <any>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace maskgate::core
{

// Per-session plugin data, one slot per StorageKey. Lives exactly as long as its session.
class SessionStorage final
{
public:
    using Slots = std::map<std::string, std::any, std::less<>>;

    SessionStorage() = default;
    SessionStorage(const SessionStorage&) = delete;
    SessionStorage& operator=(const SessionStorage&) = delete;
    SessionStorage(SessionStorage&&) = delete;
    SessionStorage& operator=(SessionStorage&&) = delete;
    ~SessionStorage() = default;

    [[nodiscard]] std::optional<std::any> get(const StorageKey& key) const;

    // Absent on a miss or when the slot holds a different type.
    template <class T> [[nodiscard]] std::optional<T> get(const StorageKey& key) const
    {
        const std::optional<std::any> slot{ get(key) };
        if (!slot.has_value())
        {
            return std::nullopt;
        }
        if (const T* value{ std::any_cast<T>(&*slot) }; value != nullptr)
        {
            return *value;
        }
        return std::nullopt;
    }

    void set(const StorageKey& key, std::any value);

    [[nodiscard]] bool contains(const StorageKey& key) const;
    [[nodiscard]] std::size_t size() const;

    // Snapshot for host introspection; later writes are not reflected.
    [[nodiscard]] Slots all() const;

private:
    mutable std::mutex m_mutex;
    Slots m_slots;
};

} // namespace maskgate::core

#endif // INCLUDE_MASKGATE_CORE_SESSIONSTORAGE_HPP
