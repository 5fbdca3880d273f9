// SPDX-License-Identifier: Apache-2.0
#include "SettingsPresenter.hpp"

#include <core/Log.hpp>
#include <core/Overloaded.hpp>

#include <format>

namespace pagent
{

namespace
{
    constexpr auto SettingsErrorTitle = std::string_view { "Settings Error" };
}

SettingsPresenter::SettingsPresenter(std::shared_ptr<EventBus> bus,
                                     ViewCommandSink sink,
                                     std::shared_ptr<ProfileService> profiles,
                                     std::shared_ptr<AppSettingsService> appSettings,
                                     std::shared_ptr<McpService> mcp):
    Presenter("SettingsPresenter", std::move(bus), std::move(sink)),
    _profiles(std::move(profiles)),
    _appSettings(std::move(appSettings)),
    _mcp(std::move(mcp))
{
}

SettingsPresenter::~SettingsPresenter()
{
    shutdown();
}

void SettingsPresenter::handleEvent(const AppEvent& event)
{
    std::visit(Overloaded {
                   [this](const UserEvent& e) { handleUserEvent(e); },
                   [this](const ProfileEvent& e) { handleProfileEvent(e); },
                   [this](const McpEvent& e) { handleMcpEvent(e); },
                   [this](const SystemEvent& e) { handleSystemEvent(e); },
                   [](const auto&) {},
               },
               event);
}

void SettingsPresenter::handleUserEvent(const UserEvent& event)
{
    using UE = UserEvent;
    using VC = ViewCommand;
    std::visit(Overloaded {
                   [this](const UE::Navigate& e) {
                       if (e.to == ViewId::Settings)
                           showSettings();
                   },
                   [this](const UE::SelectProfile& e) { selectDefaultProfile(e.id); },
                   [this](const UE::DeleteProfile& e) {
                       send(VC { VC::ShowModal { .modal = ModalId::ConfirmDeleteProfile, .target = e.id } });
                   },
                   [this](const UE::ConfirmDeleteProfile& e) { deleteProfile(e.id); },
                   [this](const UE::ToggleMcp& e) { toggleMcp(e.id, e.enabled); },
                   [this](const UE::DeleteMcp& e) {
                       send(VC { VC::ShowModal { .modal = ModalId::ConfirmDeleteMcp, .target = e.id } });
                   },
                   [this](const UE::ConfirmDeleteMcp& e) { deleteMcp(e.id); },
                   [](const auto&) {},
               },
               event.value);
}

void SettingsPresenter::handleProfileEvent(const ProfileEvent& event)
{
    using PE = ProfileEvent;
    using VC = ViewCommand;
    std::visit(Overloaded {
                   [this](const PE::Created& e) { send(VC { VC::ProfileCreated { .id = e.id, .name = e.name } }); },
                   [this](const PE::Updated& e) { send(VC { VC::ProfileUpdated { .id = e.id, .name = e.name } }); },
                   [this](const PE::Deleted& e) { send(VC { VC::ProfileDeleted { .id = e.id } }); },
                   [this](const PE::DefaultChanged& e) {
                       send(VC { VC::DefaultProfileChanged { .profileId = e.profileId } });
                   },
                   [](const auto&) {},
               },
               event.value);
}

void SettingsPresenter::handleMcpEvent(const McpEvent& event)
{
    using ME = McpEvent;
    using VC = ViewCommand;

    auto const statusChanged = [this](Uuid id, McpStatus status) {
        send(VC { VC::McpStatusChanged { .id = id, .status = status } });
    };

    std::visit(Overloaded {
                   [&](const ME::Starting& e) { statusChanged(e.id, McpStatus::Starting); },
                   [&](const ME::Restarting& e) { statusChanged(e.id, McpStatus::Starting); },
                   [&](const ME::Started& e) {
                       statusChanged(e.id, McpStatus::Running);
                       send(VC { VC::McpServerStarted { .id = e.id, .toolCount = e.tools.size() } });

                       auto tools = _mcp->getTools(e.id);
                       if (!tools)
                       {
                           log::warning("cannot list tools of {}: {}", e.name, tools.error());
                           return;
                       }
                       send(VC { VC::McpToolsUpdated { .id = e.id, .tools = std::move(*tools) } });
                   },
                   [&](const ME::StartFailed& e) {
                       statusChanged(e.id, McpStatus::Failed);
                       send(VC { VC::McpServerFailed { .id = e.id, .error = e.error } });
                   },
                   [&](const ME::Stopped& e) { statusChanged(e.id, McpStatus::Stopped); },
                   [&](const ME::Unhealthy& e) { statusChanged(e.id, McpStatus::Unhealthy); },
                   [&](const ME::Recovered& e) {
                       statusChanged(e.id, McpStatus::Running);
                       send(VC { VC::ShowNotification { .message = std::format("{} recovered", e.name) } });
                   },
                   [this](const ME::Deleted& e) { send(VC { VC::McpDeleted { .id = e.id } }); },
                   [](const auto&) {},
               },
               event.value);
}

void SettingsPresenter::handleSystemEvent(const SystemEvent& event)
{
    using SE = SystemEvent;
    auto const notify = [this](std::string message) {
        send(ViewCommand { ViewCommand::ShowNotification { .message = std::move(message) } });
    };

    std::visit(Overloaded {
                   [&](const SE::ConfigLoaded&) { notify("Configuration loaded"); },
                   [&](const SE::ConfigSaved&) { notify("Configuration saved"); },
                   [&](const SE::ModelsRegistryRefreshed& e) {
                       notify(std::format("Model catalog updated: {} models from {} providers",
                                          e.modelCount,
                                          e.providerCount));
                   },
                   [](const auto&) {},
               },
               event.value);
}

auto SettingsPresenter::collectMcpSummaries() -> Result<std::vector<McpSummary>>
{
    auto configs = _mcp->list();
    if (!configs)
        return std::unexpected(configs.error());

    auto summaries = std::vector<McpSummary> {};
    summaries.reserve(configs->size());
    for (auto const& config: *configs)
    {
        auto status = _mcp->getStatus(config.id);
        summaries.push_back(McpSummary {
            .id = config.id,
            .name = config.name,
            .enabled = config.enabled,
            .status = status.value_or(McpStatus::Stopped),
        });
    }
    return summaries;
}

void SettingsPresenter::showSettings()
{
    auto profiles = _profiles->list();
    if (!profiles)
    {
        reportError(std::string(SettingsErrorTitle), "Loading profiles", profiles.error());
        return;
    }

    auto defaultProfile = _profiles->getDefault();
    if (!defaultProfile)
    {
        reportError(std::string(SettingsErrorTitle), "Loading default profile", defaultProfile.error());
        return;
    }

    auto mcpServers = collectMcpSummaries();
    if (!mcpServers)
    {
        reportError(std::string(SettingsErrorTitle), "Loading MCP servers", mcpServers.error());
        return;
    }

    auto summaries = std::vector<ProfileSummary> {};
    summaries.reserve(profiles->size());
    for (auto const& profile: *profiles)
    {
        summaries.push_back(ProfileSummary {
            .id = profile.id,
            .name = profile.name,
            .providerId = profile.providerId,
            .modelId = profile.modelId,
            .isDefault = *defaultProfile && **defaultProfile == profile.id,
        });
    }

    send(ViewCommand { ViewCommand::ShowSettings {
        .profiles = std::move(summaries),
        .mcpServers = std::move(*mcpServers),
        .defaultProfileId = *defaultProfile,
    } });
}

void SettingsPresenter::selectDefaultProfile(Uuid id)
{
    if (auto result = _profiles->setDefault(id); !result)
    {
        reportError(std::string(SettingsErrorTitle), "Setting default profile", result.error());
        return;
    }

    if (auto result = _appSettings->setDefaultProfileId(id); !result)
    {
        reportError(std::string(SettingsErrorTitle), "Saving default profile", result.error());
        return;
    }

    publish(ProfileEvent { ProfileEvent::DefaultChanged { .profileId = id } });
}

void SettingsPresenter::deleteProfile(Uuid id)
{
    auto profile = _profiles->get(id);
    auto name = profile ? profile->name : std::string {};

    if (auto removed = _profiles->remove(id); !removed)
    {
        reportError(std::string(SettingsErrorTitle), "Deleting profile", removed.error());
        return;
    }

    send(ViewCommand { ViewCommand::DismissModal {} });
    publish(ProfileEvent { ProfileEvent::Deleted { .id = id, .name = std::move(name) } });
}

void SettingsPresenter::toggleMcp(Uuid id, bool enabled)
{
    if (auto result = _mcp->setEnabled(id, enabled); !result)
    {
        reportError(std::string(SettingsErrorTitle), enabled ? "Enabling MCP server" : "Disabling MCP server",
                    result.error());
        return;
    }

    // Running and Stopped follow from the lifecycle event the service publishes.
    if (enabled)
        send(ViewCommand { ViewCommand::McpStatusChanged { .id = id, .status = McpStatus::Starting } });
}

void SettingsPresenter::deleteMcp(Uuid id)
{
    auto config = _mcp->get(id);
    auto name = config ? config->name : std::string {};

    if (auto removed = _mcp->remove(id); !removed)
    {
        reportError(std::string(SettingsErrorTitle), "Deleting MCP server", removed.error());
        return;
    }

    send(ViewCommand { ViewCommand::DismissModal {} });
    publish(McpEvent { McpEvent::Deleted { .id = id, .name = std::move(name) } });
}

} // namespace pagent
