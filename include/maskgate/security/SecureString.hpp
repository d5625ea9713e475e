#ifndef INCLUDE_MASKGATE_SECURITY_SECURESTRING_HPP
#define INCLUDE_MASKGATE_SECURITY_SECURESTRING_HPP

#include "maskgate/security/Secrets.hpp"
#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace maskgate::security
{

// Character allocator that wipes each block before handing it back, including the
// blocks a growing vector abandons.
template <class T> struct WipingAllocator
{
    static_assert(sizeof(T) == 1U, "WipingAllocator holds key text only");

    using value_type = T;

    WipingAllocator() noexcept = default;
    template <class U> WipingAllocator([[maybe_unused]] const WipingAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        return std::allocator<T>{}.allocate(n);
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        secureWipe(std::span<char>{ reinterpret_cast<char*>(p), n });
        std::allocator<T>{}.deallocate(p, n);
    }

    friend bool operator==(const WipingAllocator&, const WipingAllocator&) noexcept = default;
};

// Confirmation keys and user responses.
using SecureString = std::vector<char, WipingAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    return s.empty() ? std::string_view{} : std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span<const char>{ s });
}

} // namespace maskgate::security

#endif // INCLUDE_MASKGATE_SECURITY_SECURESTRING_HPP
