// SPDX-License-Identifier: Apache-2.0
#include "McpAddPresenter.hpp"

#include <core/Overloaded.hpp>

#include <format>

namespace pagent
{

namespace
{
    constexpr auto RegistryErrorTitle = std::string_view { "MCP Registry Error" };
}

McpAddPresenter::McpAddPresenter(std::shared_ptr<EventBus> bus,
                                 ViewCommandSink sink,
                                 std::shared_ptr<McpRegistryService> registry,
                                 std::shared_ptr<McpService> mcp):
    Presenter("McpAddPresenter", std::move(bus), std::move(sink)),
    _registry(std::move(registry)),
    _mcp(std::move(mcp))
{
}

McpAddPresenter::~McpAddPresenter()
{
    shutdown();
}

void McpAddPresenter::handleEvent(const AppEvent& event)
{
    auto const* userEvent = std::get_if<UserEvent>(&event);
    if (!userEvent)
        return;

    using UE = UserEvent;
    std::visit(Overloaded {
                   [this](const UE::AddMcp&) { showTrending(); },
                   [this](const UE::SearchMcpRegistry& e) { search(e.query, e.source); },
                   [this](const UE::SelectMcpFromRegistry& e) { install(e.source); },
                   [](const auto&) {},
               },
               userEvent->value);
}

void McpAddPresenter::showTrending()
{
    auto entries = _registry->listTrending();
    if (!entries)
    {
        reportError(std::string(RegistryErrorTitle), "Loading registry", entries.error());
        return;
    }

    send(ViewCommand { ViewCommand::McpRegistryResults { .entries = std::move(*entries) } });
    send(ViewCommand { ViewCommand::NavigateTo { .view = ViewId::McpAdd } });
}

void McpAddPresenter::search(std::string_view query, std::string_view source)
{
    auto entries = _registry->search(query, source);
    if (!entries)
    {
        reportError(std::string(RegistryErrorTitle), "Searching registry", entries.error());
        return;
    }

    send(ViewCommand { ViewCommand::McpRegistryResults { .entries = std::move(*entries) } });
}

void McpAddPresenter::install(const std::string& name)
{
    auto details = _registry->getDetails(name);
    if (!details)
    {
        reportError(std::string(RegistryErrorTitle), "Loading server details", details.error());
        return;
    }
    if (!*details)
    {
        showError(std::string(RegistryErrorTitle), std::format("Server '{}' is not listed in the registry", name));
        return;
    }

    auto config = _registry->install(name, (*details)->displayName);
    if (!config)
    {
        reportError(std::string(RegistryErrorTitle), "Installing server", config.error());
        return;
    }

    auto added = _mcp->add(std::move(*config));
    if (!added)
    {
        reportError(std::string(RegistryErrorTitle), "Adding server", added.error());
        return;
    }

    send(ViewCommand { ViewCommand::McpConfigureLoaded { .config = std::move(*added) } });
    send(ViewCommand { ViewCommand::NavigateTo { .view = ViewId::McpConfigure } });
}

} // namespace pagent
