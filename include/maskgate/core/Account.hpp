#ifndef INCLUDE_MASKGATE_CORE_ACCOUNT_HPP
#define INCLUDE_MASKGATE_CORE_ACCOUNT_HPP

#include <string_view>

namespace maskgate::core
{

// Implemented by the host's account store. Sessions keep a non-owning reference,
// so an account must outlive every session created for it.
class IAccount
{
public:
    IAccount() = default;
    IAccount(const IAccount&) = delete;
    IAccount& operator=(const IAccount&) = delete;
    IAccount(IAccount&&) = delete;
    IAccount& operator=(IAccount&&) = delete;
    virtual ~IAccount() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace maskgate::core

#endif // INCLUDE_MASKGATE_CORE_ACCOUNT_HPP
