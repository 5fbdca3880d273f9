// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <presentation/Presenter.hpp>
#include <services/McpRegistryService.hpp>
#include <services/McpService.hpp>

#include <memory>

namespace pagent
{

/// @brief Drives the "add MCP server" view: registry browsing and installation.
class McpAddPresenter final: public Presenter
{
  public:
    McpAddPresenter(std::shared_ptr<EventBus> bus,
                    ViewCommandSink sink,
                    std::shared_ptr<McpRegistryService> registry,
                    std::shared_ptr<McpService> mcp);
    ~McpAddPresenter() override;

  protected:
    void handleEvent(const AppEvent& event) override;

  private:
    void showTrending();
    void search(std::string_view query, std::string_view source);
    void install(const std::string& name);

    std::shared_ptr<McpRegistryService> _registry;
    std::shared_ptr<McpService> _mcp;
};

} // namespace pagent
