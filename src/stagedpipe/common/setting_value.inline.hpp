/**
 * @file setting_value.inline.hpp
 * @brief Implementations for type-parameterized member methods of SettingValue.
 */
#pragma once
#include "stagedpipe/common/setting_value.hpp"

namespace stagedpipe
{

template <typename T, typename>
SettingValue SettingValue::of(T&& value)
{
    using StorageT = std::decay_t<T>;
    static_assert(!std::is_void_v<StorageT>, "SettingValue: T cannot be void");
    static_assert(!std::is_array_v<StorageT>, "SettingValue: T cannot be an array type");

    SettingValue result;
    auto ptr = std::make_shared<StorageT>(std::forward<T>(value));
    result.m_pvoid = std::static_pointer_cast<void>(ptr);
    result.m_ti = std::type_index{typeid(StorageT)};
    return result;
}

template <typename T>
bool SettingValue::has_type() const noexcept
{
    using StorageT = std::decay_t<T>;
    return m_pvoid != nullptr && m_ti == std::type_index{typeid(StorageT)};
}

template <typename T>
const T& SettingValue::as() const
{
    using StorageT = std::decay_t<T>;
    if (!m_pvoid)
    {
        throw SettingTypeError{"SettingValue is empty"};
    }
    if (m_ti != std::type_index{typeid(StorageT)})
    {
        throw SettingTypeError{
            "SettingValue type mismatch: expected " + std::string{typeid(StorageT).name()} +
            ", got " + std::string{m_ti.name()}
        };
    }
    return *static_cast<const StorageT*>(m_pvoid.get());
}

template <typename T>
const T* SettingValue::try_as() const noexcept
{
    using StorageT = std::decay_t<T>;
    if (!has_type<StorageT>())
    {
        return nullptr;
    }
    return static_cast<const StorageT*>(m_pvoid.get());
}

} // namespace stagedpipe
