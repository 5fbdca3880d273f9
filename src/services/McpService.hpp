// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <core/Uuid.hpp>

#include <vector>

namespace pagent
{

/// @brief Manages configured MCP tool servers and their runtime status.
class McpService
{
  public:
    virtual ~McpService() = default;

    [[nodiscard]] virtual auto list() -> Result<std::vector<McpConfig>> = 0;
    [[nodiscard]] virtual auto get(Uuid id) -> Result<McpConfig> = 0;
    [[nodiscard]] virtual auto getStatus(Uuid id) -> Result<McpStatus> = 0;

    /// @brief Enables (starts) or disables (stops) a server.
    [[nodiscard]] virtual auto setEnabled(Uuid id, bool enabled) -> VoidResult = 0;

    /// @brief Returns the tools of every running server.
    [[nodiscard]] virtual auto getAvailableTools() -> Result<std::vector<ToolInfo>> = 0;

    /// @brief Returns the tools of one server.
    [[nodiscard]] virtual auto getTools(Uuid id) -> Result<std::vector<ToolInfo>> = 0;

    /// @brief Adds a server; a nil id in @p config is replaced by a fresh one.
    [[nodiscard]] virtual auto add(McpConfig config) -> Result<McpConfig> = 0;
    [[nodiscard]] virtual auto update(Uuid id, McpConfig config) -> Result<McpConfig> = 0;
    [[nodiscard]] virtual auto remove(Uuid id) -> VoidResult = 0;
    [[nodiscard]] virtual auto restart(Uuid id) -> VoidResult = 0;

    [[nodiscard]] virtual auto listEnabled() -> Result<std::vector<McpConfig>> = 0;
};

} // namespace pagent
