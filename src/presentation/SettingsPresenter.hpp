// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <presentation/Presenter.hpp>
#include <services/AppSettingsService.hpp>
#include <services/McpService.hpp>
#include <services/ProfileService.hpp>

#include <memory>

namespace pagent
{

/// @brief Drives the settings view: profile list, default profile and MCP server toggles.
class SettingsPresenter final: public Presenter
{
  public:
    SettingsPresenter(std::shared_ptr<EventBus> bus,
                      ViewCommandSink sink,
                      std::shared_ptr<ProfileService> profiles,
                      std::shared_ptr<AppSettingsService> appSettings,
                      std::shared_ptr<McpService> mcp);
    ~SettingsPresenter() override;

  protected:
    void handleEvent(const AppEvent& event) override;

  private:
    void handleUserEvent(const UserEvent& event);
    void handleProfileEvent(const ProfileEvent& event);
    void handleMcpEvent(const McpEvent& event);
    void handleSystemEvent(const SystemEvent& event);

    void showSettings();
    void selectDefaultProfile(Uuid id);
    void deleteProfile(Uuid id);
    void toggleMcp(Uuid id, bool enabled);
    void deleteMcp(Uuid id);

    [[nodiscard]] auto collectMcpSummaries() -> Result<std::vector<McpSummary>>;

    std::shared_ptr<ProfileService> _profiles;
    std::shared_ptr<AppSettingsService> _appSettings;
    std::shared_ptr<McpService> _mcp;
};

} // namespace pagent
