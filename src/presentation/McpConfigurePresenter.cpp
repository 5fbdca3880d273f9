// SPDX-License-Identifier: Apache-2.0
#include "McpConfigurePresenter.hpp"

#include <core/Overloaded.hpp>

#include <format>

namespace pagent
{

namespace
{
    constexpr auto McpErrorTitle = std::string_view { "MCP Configuration Error" };
}

McpConfigurePresenter::McpConfigurePresenter(std::shared_ptr<EventBus> bus,
                                             ViewCommandSink sink,
                                             std::shared_ptr<McpService> mcp,
                                             std::shared_ptr<SecretsService> secrets):
    Presenter("McpConfigurePresenter", std::move(bus), std::move(sink)),
    _mcp(std::move(mcp)),
    _secrets(std::move(secrets))
{
}

McpConfigurePresenter::~McpConfigurePresenter()
{
    shutdown();
}

auto McpConfigurePresenter::oauthTokenKey(std::string_view provider) -> std::string
{
    return std::format("oauth.{}", provider);
}

void McpConfigurePresenter::handleEvent(const AppEvent& event)
{
    std::visit(Overloaded {
                   [this](const UserEvent& e) { handleUserEvent(e); },
                   [this](const McpEvent& e) { handleMcpEvent(e); },
                   [](const auto&) {},
               },
               event);
}

void McpConfigurePresenter::handleUserEvent(const UserEvent& event)
{
    using UE = UserEvent;
    std::visit(Overloaded {
                   [this](const UE::ConfigureMcp& e) { loadConfig(e.id); },
                   [this](const UE::SaveMcpConfig& e) { saveConfig(e.id, e.config); },
                   [this](const UE::StartMcpOAuth& e) { startOAuth(e.id, e.provider); },
                   [](const auto&) {},
               },
               event.value);
}

void McpConfigurePresenter::handleMcpEvent(const McpEvent& event)
{
    if (auto const* saved = std::get_if<McpEvent::ConfigSaved>(&event.value))
        send(ViewCommand { ViewCommand::McpConfigSaved { .id = saved->id } });
}

void McpConfigurePresenter::loadConfig(Uuid id)
{
    auto config = _mcp->get(id);
    if (!config)
    {
        reportError(std::string(McpErrorTitle), "Loading MCP server", config.error());
        return;
    }

    send(ViewCommand { ViewCommand::McpConfigureLoaded { .config = std::move(*config) } });
    send(ViewCommand { ViewCommand::NavigateTo { .view = ViewId::McpConfigure } });
}

void McpConfigurePresenter::saveConfig(Uuid id, McpConfig config)
{
    auto updated = _mcp->update(id, std::move(config));
    if (!updated)
    {
        reportError(std::string(McpErrorTitle), "Saving MCP server", updated.error());
        return;
    }

    send(ViewCommand { ViewCommand::NavigateBack {} });
    publish(McpEvent { McpEvent::ConfigSaved { .id = id } });
}

void McpConfigurePresenter::startOAuth(Uuid id, const std::string& provider)
{
    auto token = _secrets->get(oauthTokenKey(provider));
    if (!token)
    {
        reportError(std::string(McpErrorTitle), "Reading OAuth token", token.error());
        return;
    }

    if (!*token)
    {
        showError("OAuth Required",
                  std::format("No {} credentials are stored for server {}", provider, id.shortString()),
                  ErrorSeverity::Warning);
        return;
    }

    send(ViewCommand { ViewCommand::ShowNotification {
        .message = std::format("Using stored {} credentials for server {}", provider, id.shortString()) } });
}

} // namespace pagent
