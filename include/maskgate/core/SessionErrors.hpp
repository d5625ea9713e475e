#ifndef INCLUDE_MASKGATE_CORE_SESSIONERRORS_HPP
#define INCLUDE_MASKGATE_CORE_SESSIONERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <variant>

namespace maskgate::core
{

enum class RegistryError : std::uint8_t
{
    NotRegistered,
    MaskInUse,
};

template <class T> using RegistryResult = std::variant<T, RegistryError>;

enum class ConfirmationError : std::uint8_t
{
    NotRequired,
    KeyIncorrect,
    RandomFailed,
};

template <class T> using ConfirmationResult = std::variant<T, ConfirmationError>;

[[nodiscard]] std::string_view describe(RegistryError error) noexcept;
[[nodiscard]] std::string_view describe(ConfirmationError error) noexcept;

// For hosts that unwind to the plugin-dispatch boundary instead of branching on the result.
// Must be caught there and reported as "access denied".
class SessionConfirmationError final : public std::runtime_error
{
public:
    explicit SessionConfirmationError(ConfirmationError reason);

    [[nodiscard]] ConfirmationError reason() const noexcept
    {
        return m_reason;
    }

private:
    ConfirmationError m_reason;
};

template <class T> [[nodiscard]] T valueOrThrow(ConfirmationResult<T>&& result)
{
    if (const auto* error{ std::get_if<ConfirmationError>(&result) }; error != nullptr)
    {
        throw SessionConfirmationError{ *error };
    }
    return std::get<T>(std::move(result));
}

} // namespace maskgate::core

#endif // INCLUDE_MASKGATE_CORE_SESSIONERRORS_HPP
