// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <presentation/Presenter.hpp>
#include <services/McpService.hpp>
#include <services/SecretsService.hpp>

#include <memory>

namespace pagent
{

/// @brief Drives the MCP server configuration form.
class McpConfigurePresenter final: public Presenter
{
  public:
    McpConfigurePresenter(std::shared_ptr<EventBus> bus,
                          ViewCommandSink sink,
                          std::shared_ptr<McpService> mcp,
                          std::shared_ptr<SecretsService> secrets);
    ~McpConfigurePresenter() override;

    /// @brief Secrets key holding the OAuth token of @p provider.
    [[nodiscard]] static auto oauthTokenKey(std::string_view provider) -> std::string;

  protected:
    void handleEvent(const AppEvent& event) override;

  private:
    void handleUserEvent(const UserEvent& event);
    void handleMcpEvent(const McpEvent& event);

    void loadConfig(Uuid id);
    void saveConfig(Uuid id, McpConfig config);
    void startOAuth(Uuid id, const std::string& provider);

    std::shared_ptr<McpService> _mcp;
    std::shared_ptr<SecretsService> _secrets;
};

} // namespace pagent
