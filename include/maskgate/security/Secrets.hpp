#ifndef INCLUDE_MASKGATE_SECURITY_SECRETS_HPP
#define INCLUDE_MASKGATE_SECURITY_SECRETS_HPP

#include <cstdint>
#include <span>

namespace maskgate::security
{

// Raw key bytes and digests.
void secureWipe(std::span<std::uint8_t> bytes) noexcept;
// Key text.
void secureWipe(std::span<char> text) noexcept;

// Runs over every byte when sizes match; a size mismatch returns early.
[[nodiscard]] bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept;

// Fills `out` from the OS CSPRNG. False if the kernel refuses.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace maskgate::security

#endif // INCLUDE_MASKGATE_SECURITY_SECRETS_HPP
