#include "maskgate/security/Secrets.hpp"

#include <cerrno>
#include <cstddef>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <string.h>
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace maskgate::security
{
namespace
{

void wipeRegion(void* data, std::size_t size) noexcept
{
    if (size == 0U)
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(data, size);
#else
    ::explicit_bzero(data, size);
#endif
}

// One kernel call; returns how many bytes landed, 0 on a retryable interruption, -1 on failure.
long fillOnce(std::span<std::uint8_t> out) noexcept
{
#if defined(_WIN32)
    // Key and digest buffers are far below ULONG range.
    const NTSTATUS status{ ::BCryptGenRandom(nullptr, out.data(), static_cast<ULONG>(out.size()),
                                             BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
    return BCRYPT_SUCCESS(status) ? static_cast<long>(out.size()) : -1L;
#else
    const ssize_t got{ ::getrandom(out.data(), out.size(), 0) };
    if (got < 0)
    {
        return (errno == EINTR) ? 0L : -1L;
    }
    return static_cast<long>(got);
#endif
}

} // namespace

void secureWipe(std::span<std::uint8_t> bytes) noexcept
{
    wipeRegion(bytes.data(), bytes.size());
}

void secureWipe(std::span<char> text) noexcept
{
    wipeRegion(text.data(), text.size());
}

bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile std::uint8_t diff{ 0U };
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff = static_cast<std::uint8_t>(diff | (a[i] ^ b[i]));
    }
    return diff == 0U;
}

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    while (!out.empty())
    {
        const long got{ fillOnce(out) };
        if (got < 0 || static_cast<std::size_t>(got) > out.size())
        {
            return false;
        }
        out = out.subspan(static_cast<std::size_t>(got));
    }
    return true;
}

} // namespace maskgate::security
