/**
 * @file settings.hpp
 * @brief Layered key/value settings used by step enable predicates.
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/common/pipeline_exceptions.hpp"
#include "stagedpipe/common/setting_value.hpp"
#include "stagedpipe/common/setting_value.inline.hpp"
#include "stagedpipe/common/step_id.hpp"

namespace stagedpipe
{

/**
 * @brief Exception thrown by `get()` when no layer holds the key.
 */
class SettingNotFoundError : public std::out_of_range
{
public:
    explicit SettingNotFoundError(const std::string& key)
        : std::out_of_range("The given key (" + key + ") was not present in the settings.")
        , m_key(key)
    {}

    const std::string& key() const noexcept
    {
        return m_key;
    }

private:
    std::string m_key;
};

namespace detail
{

template <typename T, typename = void>
struct has_setting_key : std::false_type
{};

template <typename T>
struct has_setting_key<T, std::void_t<decltype(T::setting_key())>> : std::true_type
{};

} // namespace detail

/**
 * @brief Key under which the type-keyed accessors store a `T`.
 *
 * @details
 * If `T` declares `static ... setting_key()`, its result is used; otherwise
 * the implementation-defined `typeid(T).name()`.
 */
template <typename T>
std::string settings_key()
{
    if constexpr (detail::has_setting_key<T>::value)
    {
        return std::string{T::setting_key()};
    }
    else
    {
        return std::string{typeid(T).name()};
    }
}

/**
 * @brief Read-only view of the settings.
 *
 * @details
 * Lookups consult the override layer first, then the default layer. Keys are
 * compared case-insensitively. The typed accessors are non-virtual helpers
 * built on `find()`, so implementations only provide the untyped lookup.
 * Each accessor also has a type-keyed form without a key argument, which
 * uses `settings_key<T>()`.
 *
 * @par Thread Safety
 * - Concurrent reads are safe once no writer is active (e.g. after locking).
 */
class IReadOnlySettings
{
public:
    virtual ~IReadOnlySettings() = default;

    /**
     * @brief Find the effective value for `key`.
     * @return Pointer to the value, or nullptr if neither layer holds the key.
     */
    virtual const SettingValue* find(const std::string& key) const = 0;

    /**
     * @brief Check whether either layer holds `key`.
     */
    virtual bool has_setting(const std::string& key) const = 0;

    /**
     * @brief Check whether the override layer holds `key`.
     */
    virtual bool has_explicit_value(const std::string& key) const = 0;

    /**
     * @brief Get the effective value for `key`.
     * @throws SettingNotFoundError if the key is absent.
     * @throws SettingTypeError if the value is not a `T`.
     */
    template <typename T>
    const T& get(const std::string& key) const
    {
        const SettingValue* value = find(key);
        if (value == nullptr)
        {
            throw SettingNotFoundError(key);
        }
        return value->as<T>();
    }

    /**
     * @brief Copy the effective value for `key` into `out`.
     * @return False (leaving `out` untouched) if absent or not a `T`.
     */
    template <typename T>
    bool try_get(const std::string& key, T& out) const
    {
        const SettingValue* value = find(key);
        if (value == nullptr)
        {
            return false;
        }
        const T* typed = value->try_as<T>();
        if (typed == nullptr)
        {
            return false;
        }
        out = *typed;
        return true;
    }

    /**
     * @brief Get the effective value for `key`, or a value-initialized `T`.
     * @throws SettingTypeError if the key is present but not a `T`.
     */
    template <typename T>
    T get_or_default(const std::string& key) const
    {
        const SettingValue* value = find(key);
        if (value == nullptr)
        {
            return T{};
        }
        return value->as<T>();
    }

    template <typename T>
    const T& get() const
    {
        return get<T>(settings_key<T>());
    }

    template <typename T>
    bool try_get(T& out) const
    {
        return try_get<T>(settings_key<T>(), out);
    }

    template <typename T>
    T get_or_default() const
    {
        return get_or_default<T>(settings_key<T>());
    }

    template <typename T>
    bool has_setting() const
    {
        return has_setting(settings_key<T>());
    }

    template <typename T>
    bool has_explicit_value() const
    {
        return has_explicit_value(settings_key<T>());
    }
};

/**
 * @brief Mutable settings with a default layer and an override layer.
 *
 * @details
 * Configuration code writes defaults and overrides; once `lock()` has been
 * called every further write, including `merge()`, fails with a
 * `PipelineConfigError` of code `SettingsLocked`. Reads are unaffected by
 * locking. `clear()` is the owner's explicit teardown: it drops both layers
 * and releases every held value; it is allowed after locking.
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - Writes are expected during single-threaded setup only.
 */
class Settings : public IReadOnlySettings
{
public:
    Settings() = default;

    using IReadOnlySettings::has_explicit_value;
    using IReadOnlySettings::has_setting;

    const SettingValue* find(const std::string& key) const override;
    bool has_setting(const std::string& key) const override;
    bool has_explicit_value(const std::string& key) const override;

    /**
     * @brief Write `value` to the override layer.
     * @throws PipelineConfigError with `SettingsLocked` after `lock()`.
     */
    template <typename T>
    void set(const std::string& key, T&& value)
    {
        set_value(key, SettingValue::of(std::forward<T>(value)));
    }

    /**
     * @brief Write `value` to the default layer.
     * @throws PipelineConfigError with `SettingsLocked` after `lock()`.
     */
    template <typename T>
    void set_default(const std::string& key, T&& value)
    {
        set_default_value(key, SettingValue::of(std::forward<T>(value)));
    }

    /**
     * @brief Write `value` to the override layer under `settings_key<T>()`.
     */
    template <typename T>
    void set(T value)
    {
        set_value(settings_key<T>(), SettingValue::of(std::move(value)));
    }

    template <typename T>
    void set_default(T value)
    {
        set_default_value(settings_key<T>(), SettingValue::of(std::move(value)));
    }

    /**
     * @brief Get the `T` stored under `settings_key<T>()`, first writing a
     * value-initialized `T` to the override layer if none is readable as `T`.
     * @throws PipelineConfigError with `SettingsLocked` if it must write
     * after `lock()`.
     */
    template <typename T>
    const T& get_or_create()
    {
        const std::string key = settings_key<T>();
        const SettingValue* value = find(key);
        if (value != nullptr)
        {
            if (const T* typed = value->try_as<T>())
            {
                return *typed;
            }
        }
        set_value(key, SettingValue::of(T{}));
        return find(key)->as<T>();
    }

    void set_value(const std::string& key, SettingValue value);
    void set_default_value(const std::string& key, SettingValue value);

    /**
     * @brief Copy both layers of `other` into this object, replacing
     * existing keys.
     * @throws PipelineConfigError with `SettingsLocked` after `lock()`.
     */
    void merge(const Settings& other);

    /**
     * @brief Prevent any further writes.
     */
    void lock() noexcept
    {
        m_locked = true;
    }

    bool is_locked() const noexcept
    {
        return m_locked;
    }

    /**
     * @brief Drop every value in both layers.
     */
    void clear() noexcept;

private:
    void ensure_write_enabled(const std::string& key) const;

    IdMap<SettingValue> m_defaults{};
    IdMap<SettingValue> m_overrides{};
    bool m_locked{false};
};

} // namespace stagedpipe
