#include "maskgate/core/Session.hpp"

#include "SessionIndex.hpp"
#include "maskgate/security/Secrets.hpp"
#include <span>
#include <utility>

namespace maskgate::core
{

Session::Session([[maybe_unused]] RegistryKey key, const IAccount& user, std::string mask,
                 const SessionConfig& config, std::weak_ptr<SessionIndex> index)
    : m_user(&user), m_mask(std::move(mask)), m_duration(config.duration), m_now(config.now),
      m_index(std::move(index))
{
}

const IAccount& Session::user() const noexcept
{
    return *m_user;
}

std::string Session::mask() const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    return m_mask;
}

SessionStorage& Session::storage() noexcept
{
    return m_storage;
}

const SessionStorage& Session::storage() const noexcept
{
    return m_storage;
}

std::optional<TimePoint> Session::expiration() const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    return m_expiration;
}

void Session::start()
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    m_expiration = m_now() + m_duration;
}

bool Session::activeLocked() const
{
    return m_expiration.has_value() && m_now() < *m_expiration;
}

bool Session::active() const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    return activeLocked();
}

bool Session::expired() const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    return m_expiration.has_value() && !(m_now() < *m_expiration);
}

bool Session::authed() const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    return activeLocked() && m_confirmed;
}

bool Session::confirmed() const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    return m_confirmed;
}

bool Session::confirmationPending() const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    return m_pendingKey.has_value();
}

RegistryResult<std::monostate> Session::setMask(std::string_view newMask)
{
    const std::shared_ptr<SessionIndex> index{ m_index.lock() };
    if (!index)
    {
        return RegistryError::NotRegistered;
    }
    return index->migrate(*this, newMask);
}

bool Session::stop()
{
    const std::shared_ptr<SessionIndex> index{ m_index.lock() };
    if (!index)
    {
        return false;
    }
    return index->remove(*this);
}

void Session::assignMask(std::string_view mask)
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    m_mask.assign(mask);
}

void Session::armConfirmation(const maskgate::crypto::Digest& expected)
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    m_pendingKey = expected;
    m_confirmed = false;
}

ConfirmationResult<std::monostate> Session::completeConfirmation(const maskgate::crypto::Digest& response)
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    if (!m_pendingKey.has_value())
    {
        return ConfirmationError::NotRequired;
    }
    if (!maskgate::security::secureEquals(std::span<const std::uint8_t>{ *m_pendingKey },
                                          std::span<const std::uint8_t>{ response }))
    {
        return ConfirmationError::KeyIncorrect;
    }

    maskgate::security::secureWipe(std::span<std::uint8_t>{ *m_pendingKey });
    m_pendingKey.reset();
    m_confirmed = true;
    return std::monostate{};
}

} // namespace maskgate::core
