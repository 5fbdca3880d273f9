// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <services/McpRegistryService.hpp>

#include <mutex>
#include <vector>

namespace pagent
{

/// @brief McpRegistryService over a fixed list of entries (loaded from the configuration).
class StaticMcpRegistryService final: public McpRegistryService
{
  public:
    /// Source name reported for every entry of this registry.
    static constexpr std::string_view SourceName = "local";

    explicit StaticMcpRegistryService(std::vector<McpRegistryEntry> entries);

    auto search(std::string_view query, std::string_view source) -> Result<std::vector<McpRegistryEntry>> override;
    auto getDetails(std::string_view name) -> Result<std::optional<McpRegistryEntry>> override;
    auto listAll() -> Result<std::vector<McpRegistryEntry>> override;
    auto listByTag(std::string_view tag) -> Result<std::vector<McpRegistryEntry>> override;
    auto listTrending() -> Result<std::vector<McpRegistryEntry>> override;
    auto refresh() -> VoidResult override;
    auto install(std::string_view name, std::optional<std::string> displayName) -> Result<McpConfig> override;

  private:
    std::mutex _mutex;
    std::vector<McpRegistryEntry> _entries;
};

} // namespace pagent
