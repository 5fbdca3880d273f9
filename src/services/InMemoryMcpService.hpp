// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <services/McpService.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace pagent
{

class EventBus;

/// @brief McpService that tracks server configurations and simulated runtime status in memory.
///
/// Enabling a server marks it Running and publishes McpEvent::Started with its registered
/// tools; disabling publishes McpEvent::Stopped. No processes are spawned.
class InMemoryMcpService final: public McpService
{
  public:
    /// @param bus Bus for lifecycle events; may be null.
    explicit InMemoryMcpService(std::shared_ptr<EventBus> bus = nullptr);

    /// @brief Registers the tools a server exposes once running.
    void registerTools(Uuid id, std::vector<ToolInfo> tools);

    auto list() -> Result<std::vector<McpConfig>> override;
    auto get(Uuid id) -> Result<McpConfig> override;
    auto getStatus(Uuid id) -> Result<McpStatus> override;
    auto setEnabled(Uuid id, bool enabled) -> VoidResult override;
    auto getAvailableTools() -> Result<std::vector<ToolInfo>> override;
    auto getTools(Uuid id) -> Result<std::vector<ToolInfo>> override;
    auto add(McpConfig config) -> Result<McpConfig> override;
    auto update(Uuid id, McpConfig config) -> Result<McpConfig> override;
    auto remove(Uuid id) -> VoidResult override;
    auto restart(Uuid id) -> VoidResult override;
    auto listEnabled() -> Result<std::vector<McpConfig>> override;

  private:
    struct Entry
    {
        McpConfig config;
        McpStatus status = McpStatus::Stopped;
        std::vector<ToolInfo> tools;
    };

    auto find(Uuid id) -> Entry*;
    void announce(const Entry& entry);

    std::shared_ptr<EventBus> _bus;
    std::mutex _mutex;
    std::vector<Entry> _entries;
};

} // namespace pagent
