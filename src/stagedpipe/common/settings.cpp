#include "stagedpipe/common/settings.hpp"

namespace stagedpipe
{

const SettingValue* Settings::find(const std::string& key) const
{
    auto it = m_overrides.find(key);
    if (it != m_overrides.end())
    {
        return &it->second;
    }
    it = m_defaults.find(key);
    if (it != m_defaults.end())
    {
        return &it->second;
    }
    return nullptr;
}

bool Settings::has_setting(const std::string& key) const
{
    return m_overrides.count(key) > 0 || m_defaults.count(key) > 0;
}

bool Settings::has_explicit_value(const std::string& key) const
{
    return m_overrides.count(key) > 0;
}

void Settings::set_value(const std::string& key, SettingValue value)
{
    ensure_write_enabled(key);
    m_overrides[key] = std::move(value);
}

void Settings::set_default_value(const std::string& key, SettingValue value)
{
    ensure_write_enabled(key);
    m_defaults[key] = std::move(value);
}

void Settings::merge(const Settings& other)
{
    if (m_locked)
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::SettingsLocked,
            "Unable to merge settings. The settings have been locked for modifications. "
            "Move any configuration code earlier in the configuration pipeline");
    }
    for (const auto& [key, value] : other.m_defaults)
    {
        m_defaults[key] = value;
    }
    for (const auto& [key, value] : other.m_overrides)
    {
        m_overrides[key] = value;
    }
}

void Settings::clear() noexcept
{
    m_defaults.clear();
    m_overrides.clear();
}

void Settings::ensure_write_enabled(const std::string& key) const
{
    if (m_locked)
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::SettingsLocked,
            "Unable to set the value for key: " + key +
                ". The settings have been locked for modifications. "
                "Move any configuration code earlier in the configuration pipeline");
    }
}

} // namespace stagedpipe
