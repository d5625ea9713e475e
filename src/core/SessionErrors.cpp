#include "maskgate/core/SessionErrors.hpp"

#include <string>

namespace maskgate::core
{

std::string_view describe(RegistryError error) noexcept
{
    switch (error)
    {
    case RegistryError::NotRegistered:
        return "Session is not registered under that mask";
    case RegistryError::MaskInUse:
        return "Mask already belongs to another session";
    }
    return "Unknown registry error";
}

std::string_view describe(ConfirmationError error) noexcept
{
    switch (error)
    {
    case ConfirmationError::NotRequired:
    case ConfirmationError::KeyIncorrect:
        return "Confirmation key incorrect";
    case ConfirmationError::RandomFailed:
        return "Confirmation key could not be generated";
    }
    return "Unknown confirmation error";
}

SessionConfirmationError::SessionConfirmationError(ConfirmationError reason)
    : std::runtime_error(std::string{ describe(reason) }), m_reason(reason)
{
}

} // namespace maskgate::core
