// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <services/AppSettingsService.hpp>

#include <map>
#include <mutex>

namespace pagent
{

/// @brief AppSettingsService backed by a process-local map.
class InMemoryAppSettingsService final: public AppSettingsService
{
  public:
    static constexpr std::string_view DefaultHotkey = "Cmd+Shift+Space";
    static constexpr std::string_view DefaultTheme = "dark";

    InMemoryAppSettingsService();

    auto getDefaultProfileId() -> Result<std::optional<Uuid>> override;
    auto setDefaultProfileId(Uuid id) -> VoidResult override;
    auto getCurrentConversationId() -> Result<std::optional<Uuid>> override;
    auto setCurrentConversationId(Uuid id) -> VoidResult override;
    auto getHotkey() -> Result<std::optional<std::string>> override;
    auto setHotkey(std::string hotkey) -> VoidResult override;
    auto getTheme() -> Result<std::optional<std::string>> override;
    auto setTheme(std::string theme) -> VoidResult override;
    auto getSetting(std::string_view key) -> Result<std::optional<std::string>> override;
    auto setSetting(std::string_view key, std::string value) -> VoidResult override;
    auto resetToDefaults() -> VoidResult override;

  private:
    auto getUuid(std::string_view key) -> Result<std::optional<Uuid>>;

    std::mutex _mutex;
    std::map<std::string, std::string, std::less<>> _values;
};

} // namespace pagent
