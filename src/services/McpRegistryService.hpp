// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagent
{

/// @brief Catalog of installable MCP servers.
class McpRegistryService
{
  public:
    virtual ~McpRegistryService() = default;

    /// @brief Case-insensitive search over name, display name, description and tags.
    /// @param source Registry source filter; empty searches every source.
    [[nodiscard]] virtual auto search(std::string_view query, std::string_view source)
        -> Result<std::vector<McpRegistryEntry>> = 0;

    [[nodiscard]] virtual auto getDetails(std::string_view name) -> Result<std::optional<McpRegistryEntry>> = 0;
    [[nodiscard]] virtual auto listAll() -> Result<std::vector<McpRegistryEntry>> = 0;
    [[nodiscard]] virtual auto listByTag(std::string_view tag) -> Result<std::vector<McpRegistryEntry>> = 0;
    [[nodiscard]] virtual auto listTrending() -> Result<std::vector<McpRegistryEntry>> = 0;
    [[nodiscard]] virtual auto refresh() -> VoidResult = 0;

    /// @brief Builds a server configuration from a registry entry.
    /// @param name Registry entry name.
    /// @param displayName Name for the new server, or std::nullopt to use the entry's display name.
    [[nodiscard]] virtual auto install(std::string_view name, std::optional<std::string> displayName)
        -> Result<McpConfig> = 0;
};

} // namespace pagent
