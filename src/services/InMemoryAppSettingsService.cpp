// SPDX-License-Identifier: Apache-2.0
#include "InMemoryAppSettingsService.hpp"

#include <format>

namespace pagent
{

namespace
{
    constexpr auto DefaultProfileKey = std::string_view { "default_profile_id" };
    constexpr auto CurrentConversationKey = std::string_view { "current_conversation_id" };
    constexpr auto HotkeyKey = std::string_view { "hotkey" };
    constexpr auto ThemeKey = std::string_view { "theme" };
} // namespace

InMemoryAppSettingsService::InMemoryAppSettingsService()
{
    _values.emplace(HotkeyKey, DefaultHotkey);
    _values.emplace(ThemeKey, DefaultTheme);
}

auto InMemoryAppSettingsService::getUuid(std::string_view key) -> Result<std::optional<Uuid>>
{
    auto value = getSetting(key);
    if (!value)
        return std::unexpected(value.error());
    if (!*value)
        return std::nullopt;

    auto id = Uuid::parse(**value);
    if (!id)
        return makeError(ErrorCode::Serialization, std::format("Setting '{}' holds an invalid id", key));
    return *id;
}

auto InMemoryAppSettingsService::getDefaultProfileId() -> Result<std::optional<Uuid>>
{
    return getUuid(DefaultProfileKey);
}

auto InMemoryAppSettingsService::setDefaultProfileId(Uuid id) -> VoidResult
{
    return setSetting(DefaultProfileKey, id.toString());
}

auto InMemoryAppSettingsService::getCurrentConversationId() -> Result<std::optional<Uuid>>
{
    return getUuid(CurrentConversationKey);
}

auto InMemoryAppSettingsService::setCurrentConversationId(Uuid id) -> VoidResult
{
    return setSetting(CurrentConversationKey, id.toString());
}

auto InMemoryAppSettingsService::getHotkey() -> Result<std::optional<std::string>>
{
    return getSetting(HotkeyKey);
}

auto InMemoryAppSettingsService::setHotkey(std::string hotkey) -> VoidResult
{
    if (hotkey.empty())
        return makeError(ErrorCode::Validation, "Hotkey must not be empty");
    return setSetting(HotkeyKey, std::move(hotkey));
}

auto InMemoryAppSettingsService::getTheme() -> Result<std::optional<std::string>>
{
    return getSetting(ThemeKey);
}

auto InMemoryAppSettingsService::setTheme(std::string theme) -> VoidResult
{
    return setSetting(ThemeKey, std::move(theme));
}

auto InMemoryAppSettingsService::getSetting(std::string_view key) -> Result<std::optional<std::string>>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _values.find(key); it != _values.end())
        return it->second;
    return std::nullopt;
}

auto InMemoryAppSettingsService::setSetting(std::string_view key, std::string value) -> VoidResult
{
    if (key.empty())
        return makeError(ErrorCode::InvalidArgument, "Setting key must not be empty");

    auto lock = std::lock_guard(_mutex);
    _values.insert_or_assign(std::string(key), std::move(value));
    return {};
}

auto InMemoryAppSettingsService::resetToDefaults() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    _values.clear();
    _values.emplace(HotkeyKey, DefaultHotkey);
    _values.emplace(ThemeKey, DefaultTheme);
    return {};
}

} // namespace pagent
