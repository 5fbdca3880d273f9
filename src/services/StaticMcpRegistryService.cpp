// SPDX-License-Identifier: Apache-2.0
#include "StaticMcpRegistryService.hpp"

#include <core/Log.hpp>
#include <core/StringUtils.hpp>

#include <algorithm>
#include <iterator>
#include <format>

namespace pagent
{

namespace
{
    auto matches(const McpRegistryEntry& entry, std::string_view query) -> bool
    {
        if (containsIgnoreCase(entry.name, query) || containsIgnoreCase(entry.displayName, query)
            || containsIgnoreCase(entry.description, query))
            return true;
        return std::ranges::any_of(entry.tags, [query](const std::string& tag) { return containsIgnoreCase(tag, query); });
    }
} // namespace

StaticMcpRegistryService::StaticMcpRegistryService(std::vector<McpRegistryEntry> entries):
    _entries(std::move(entries))
{
}

auto StaticMcpRegistryService::search(std::string_view query, std::string_view source)
    -> Result<std::vector<McpRegistryEntry>>
{
    if (!source.empty() && source != SourceName)
        return std::vector<McpRegistryEntry> {};

    auto const needle = trim(query);
    auto lock = std::lock_guard(_mutex);
    auto result = std::vector<McpRegistryEntry> {};
    std::ranges::copy_if(_entries, std::back_inserter(result), [needle](const McpRegistryEntry& e) { return matches(e, needle); });
    return result;
}

auto StaticMcpRegistryService::getDetails(std::string_view name) -> Result<std::optional<McpRegistryEntry>>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = std::ranges::find(_entries, name, &McpRegistryEntry::name);
    if (it == _entries.end())
        return std::nullopt;
    return *it;
}

auto StaticMcpRegistryService::listAll() -> Result<std::vector<McpRegistryEntry>>
{
    auto lock = std::lock_guard(_mutex);
    return _entries;
}

auto StaticMcpRegistryService::listByTag(std::string_view tag) -> Result<std::vector<McpRegistryEntry>>
{
    auto lock = std::lock_guard(_mutex);
    auto result = std::vector<McpRegistryEntry> {};
    std::ranges::copy_if(_entries, std::back_inserter(result), [tag](const McpRegistryEntry& e) {
        return std::ranges::any_of(e.tags, [tag](const std::string& t) { return toLower(t) == toLower(tag); });
    });
    return result;
}

auto StaticMcpRegistryService::listTrending() -> Result<std::vector<McpRegistryEntry>>
{
    auto lock = std::lock_guard(_mutex);
    auto result = std::vector<McpRegistryEntry> {};
    std::ranges::copy_if(_entries, std::back_inserter(result), &McpRegistryEntry::trending);
    return result;
}

auto StaticMcpRegistryService::refresh() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    log::debug("MCP registry: {} static entries, nothing to refresh", _entries.size());
    return {};
}

auto StaticMcpRegistryService::install(std::string_view name, std::optional<std::string> displayName)
    -> Result<McpConfig>
{
    auto details = getDetails(name);
    if (!details)
        return std::unexpected(details.error());
    if (!*details)
        return makeError(ErrorCode::NotFound, std::format("Registry entry '{}' not found", name));

    auto const& entry = **details;
    return McpConfig {
        .id = Uuid::generate(),
        .name = displayName.value_or(entry.displayName.empty() ? entry.name : entry.displayName),
        .command = entry.command,
        .args = entry.args,
        .env = {},
        .enabled = false,
        .source = entry.name,
    };
}

} // namespace pagent
