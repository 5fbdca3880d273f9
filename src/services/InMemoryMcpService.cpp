// SPDX-License-Identifier: Apache-2.0
#include "InMemoryMcpService.hpp"

#include <core/Log.hpp>
#include <events/EventBus.hpp>

#include <algorithm>
#include <format>

namespace pagent
{

namespace
{
    auto notFound(Uuid id) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::NotFound, std::format("MCP server {} not found", id));
    }

    auto validate(const McpConfig& config) -> VoidResult
    {
        if (config.name.empty())
            return makeError(ErrorCode::Validation, "MCP server name is required");
        if (config.command.empty())
            return makeError(ErrorCode::Validation, std::format("MCP server '{}' has no command", config.name));
        return {};
    }
} // namespace

InMemoryMcpService::InMemoryMcpService(std::shared_ptr<EventBus> bus): _bus(std::move(bus))
{
}

auto InMemoryMcpService::find(Uuid id) -> Entry*
{
    auto const it = std::ranges::find_if(_entries, [id](const Entry& e) { return e.config.id == id; });
    return it != _entries.end() ? &*it : nullptr;
}

// Called without the mutex held; publishing may wake subscribers that call back into this service.
void InMemoryMcpService::announce(const Entry& entry)
{
    if (!_bus)
        return;

    auto event = McpEvent {};
    if (entry.status == McpStatus::Running)
    {
        auto toolNames = std::vector<std::string> {};
        for (auto const& tool: entry.tools)
            toolNames.push_back(tool.name);
        event.value = McpEvent::Started { .id = entry.config.id, .name = entry.config.name, .tools = toolNames };
    }
    else
    {
        event.value = McpEvent::Stopped { .id = entry.config.id, .name = entry.config.name };
    }

    if (auto const published = _bus->publish(std::move(event)); !published)
        log::debug("MCP '{}': lifecycle event not delivered ({})",
                   entry.config.name,
                   publishErrorToString(published.error()));
}

void InMemoryMcpService::registerTools(Uuid id, std::vector<ToolInfo> tools)
{
    auto lock = std::lock_guard(_mutex);
    if (auto* entry = find(id))
        entry->tools = std::move(tools);
}

auto InMemoryMcpService::list() -> Result<std::vector<McpConfig>>
{
    auto lock = std::lock_guard(_mutex);
    auto configs = std::vector<McpConfig> {};
    for (auto const& entry: _entries)
        configs.push_back(entry.config);
    return configs;
}

auto InMemoryMcpService::get(Uuid id) -> Result<McpConfig>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const* entry = find(id))
        return entry->config;
    return notFound(id);
}

auto InMemoryMcpService::getStatus(Uuid id) -> Result<McpStatus>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const* entry = find(id))
        return entry->status;
    return notFound(id);
}

auto InMemoryMcpService::setEnabled(Uuid id, bool enabled) -> VoidResult
{
    auto snapshot = Entry {};
    {
        auto lock = std::lock_guard(_mutex);
        auto* entry = find(id);
        if (!entry)
            return notFound(id);
        entry->config.enabled = enabled;
        entry->status = enabled ? McpStatus::Running : McpStatus::Stopped;
        snapshot = *entry;
    }

    log::info("MCP '{}' {}", snapshot.config.name, enabled ? "enabled" : "disabled");
    announce(snapshot);
    return {};
}

auto InMemoryMcpService::getAvailableTools() -> Result<std::vector<ToolInfo>>
{
    auto lock = std::lock_guard(_mutex);
    auto tools = std::vector<ToolInfo> {};
    for (auto const& entry: _entries)
    {
        if (entry.status == McpStatus::Running)
            tools.insert(tools.end(), entry.tools.begin(), entry.tools.end());
    }
    return tools;
}

auto InMemoryMcpService::getTools(Uuid id) -> Result<std::vector<ToolInfo>>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const* entry = find(id))
        return entry->tools;
    return notFound(id);
}

auto InMemoryMcpService::add(McpConfig config) -> Result<McpConfig>
{
    if (auto valid = validate(config); !valid)
        return std::unexpected(valid.error());

    if (config.id.isNil())
        config.id = Uuid::generate();

    auto lock = std::lock_guard(_mutex);
    if (find(config.id))
        return makeError(ErrorCode::Validation, std::format("MCP server {} already exists", config.id));
    _entries.push_back(Entry {
        .config = config,
        .status = config.enabled ? McpStatus::Running : McpStatus::Stopped,
        .tools = {},
    });
    return config;
}

auto InMemoryMcpService::update(Uuid id, McpConfig config) -> Result<McpConfig>
{
    if (auto valid = validate(config); !valid)
        return std::unexpected(valid.error());

    config.id = id;
    auto snapshot = Entry {};
    auto statusChanged = false;
    {
        auto lock = std::lock_guard(_mutex);
        auto* entry = find(id);
        if (!entry)
            return notFound(id);
        auto const status = config.enabled ? McpStatus::Running : McpStatus::Stopped;
        statusChanged = entry->config.enabled != config.enabled;
        entry->config = config;
        if (statusChanged)
            entry->status = status;
        snapshot = *entry;
    }

    if (statusChanged)
    {
        log::info("MCP '{}' {} by configuration", config.name, config.enabled ? "enabled" : "disabled");
        announce(snapshot);
    }
    return config;
}

auto InMemoryMcpService::remove(Uuid id) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (std::erase_if(_entries, [id](const Entry& e) { return e.config.id == id; }) == 0)
        return notFound(id);
    return {};
}

auto InMemoryMcpService::restart(Uuid id) -> VoidResult
{
    auto snapshot = Entry {};
    {
        auto lock = std::lock_guard(_mutex);
        auto* entry = find(id);
        if (!entry)
            return notFound(id);
        if (!entry->config.enabled)
            return makeError(ErrorCode::Validation,
                             std::format("MCP server '{}' is disabled", entry->config.name));
        entry->status = McpStatus::Running;
        snapshot = *entry;
    }

    if (_bus)
    {
        auto const published =
            _bus->publish(McpEvent { McpEvent::Restarting { .id = id, .name = snapshot.config.name } });
        if (!published)
            log::debug("MCP '{}': restart event not delivered ({})",
                       snapshot.config.name,
                       publishErrorToString(published.error()));
    }
    announce(snapshot);
    return {};
}

auto InMemoryMcpService::listEnabled() -> Result<std::vector<McpConfig>>
{
    auto lock = std::lock_guard(_mutex);
    auto configs = std::vector<McpConfig> {};
    for (auto const& entry: _entries)
    {
        if (entry.config.enabled)
            configs.push_back(entry.config);
    }
    return configs;
}

} // namespace pagent
