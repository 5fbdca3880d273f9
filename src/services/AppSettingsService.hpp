// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Uuid.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace pagent
{

/// @brief Small persistent application preferences.
class AppSettingsService
{
  public:
    virtual ~AppSettingsService() = default;

    [[nodiscard]] virtual auto getDefaultProfileId() -> Result<std::optional<Uuid>> = 0;
    [[nodiscard]] virtual auto setDefaultProfileId(Uuid id) -> VoidResult = 0;

    [[nodiscard]] virtual auto getCurrentConversationId() -> Result<std::optional<Uuid>> = 0;
    [[nodiscard]] virtual auto setCurrentConversationId(Uuid id) -> VoidResult = 0;

    [[nodiscard]] virtual auto getHotkey() -> Result<std::optional<std::string>> = 0;
    [[nodiscard]] virtual auto setHotkey(std::string hotkey) -> VoidResult = 0;

    [[nodiscard]] virtual auto getTheme() -> Result<std::optional<std::string>> = 0;
    [[nodiscard]] virtual auto setTheme(std::string theme) -> VoidResult = 0;

    [[nodiscard]] virtual auto getSetting(std::string_view key) -> Result<std::optional<std::string>> = 0;
    [[nodiscard]] virtual auto setSetting(std::string_view key, std::string value) -> VoidResult = 0;

    [[nodiscard]] virtual auto resetToDefaults() -> VoidResult = 0;
};

} // namespace pagent
