/**
 * @file setting_value.hpp
 * @brief Definition of SettingValue, the type-erased value held by Settings.
 * @see setting_value.inline.hpp for implementations of type-parameterized methods.
 */

#pragma once
#include "stagedpipe/common/common.hpp"

namespace stagedpipe
{

/**
 * @brief Exception thrown when a setting is read with the wrong type.
 */
class SettingTypeError : public std::runtime_error
{
public:
    explicit SettingTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief A type-erased holder for one setting value.
 *
 * @details
 * The value is stored through `shared_ptr<void>` with a deleter that remembers
 * the original type, so releasing the last holder destroys the value
 * correctly. The stored type is recorded as a `std::type_index` and reads are
 * checked against it; there are no implicit conversions.
 *
 * @par Invariants
 * - `(m_ti == typeid(void))` if and only if `m_pvoid == nullptr`
 *
 * @par Thread Safety
 * - Safe for simultaneous reading and being copied from.
 * - No internal mutex; writes are serialized by the owning Settings.
 *
 * @par Ownership
 * - Copies share the underlying value.
 */
class SettingValue
{
public:
    SettingValue() = default;

    /**
     * @brief Construct a holder for a copy (or move) of `value`.
     */
    template <typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, SettingValue>>>
    static SettingValue of(T&& value);

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_pvoid != nullptr;
    }

    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    [[nodiscard]] std::type_index type() const noexcept
    {
        return m_ti;
    }

    /**
     * @brief Drop the held value.
     * @post has_value() == false
     */
    void reset() noexcept
    {
        m_pvoid.reset();
        m_ti = std::type_index{typeid(void)};
    }

    /**
     * @brief Access the held value.
     * @throws SettingTypeError if empty or holding another type.
     */
    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @brief Access the held value, or nullptr if empty or of another type.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

private:
    std::shared_ptr<void> m_pvoid{};
    std::type_index m_ti{typeid(void)};
};

} // namespace stagedpipe
