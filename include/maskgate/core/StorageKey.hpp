#ifndef INCLUDE_MASKGATE_CORE_STORAGEKEY_HPP
#define INCLUDE_MASKGATE_CORE_STORAGEKEY_HPP

#include <concepts>
#include <string>
#include <string_view>

namespace maskgate::core
{

// Runtime-polymorphic plugins report their kind; all instances of one kind share a slot.
class IStorageOwner
{
public:
    IStorageOwner() = default;
    IStorageOwner(const IStorageOwner&) = default;
    IStorageOwner& operator=(const IStorageOwner&) = default;
    IStorageOwner(IStorageOwner&&) = default;
    IStorageOwner& operator=(IStorageOwner&&) = default;
    virtual ~IStorageOwner() = default;

    [[nodiscard]] virtual std::string_view storageName() const noexcept = 0;
};

template <class T>
concept StorageNamed = requires {
    { T::kStorageName } -> std::convertible_to<std::string_view>;
};

class StorageKey final
{
public:
    // Any name is valid, including the empty one.
    StorageKey(std::string_view name) : m_name(name)
    {
    }
    StorageKey(const char* name) : StorageKey(std::string_view{ name })
    {
    }
    StorageKey(const std::string& name) : StorageKey(std::string_view{ name })
    {
    }
    StorageKey(const IStorageOwner& owner) : StorageKey(owner.storageName())
    {
    }

    [[nodiscard]] const std::string& name() const noexcept
    {
        return m_name;
    }

    friend bool operator==(const StorageKey&, const StorageKey&) = default;

private:
    std::string m_name;
};

template <StorageNamed T> [[nodiscard]] StorageKey storageKeyFor()
{
    return StorageKey{ std::string_view{ T::kStorageName } };
}

template <StorageNamed T> [[nodiscard]] StorageKey storageKeyOf([[maybe_unused]] const T& instance)
{
    return storageKeyFor<T>();
}

} // namespace maskgate::core

#endif // INCLUDE_MASKGATE_CORE_STORAGEKEY_HPP
