// SPDX-License-Identifier: Apache-2.0
#include "ErrorPresenter.hpp"

#include <core/Overloaded.hpp>

#include <format>

namespace pagent
{

ErrorPresenter::ErrorPresenter(std::shared_ptr<EventBus> bus, ViewCommandSink sink):
    Presenter("ErrorPresenter", std::move(bus), std::move(sink))
{
}

ErrorPresenter::~ErrorPresenter()
{
    shutdown();
}

void ErrorPresenter::handleEvent(const AppEvent& event)
{
    std::visit(
        Overloaded {
            [this](const SystemEvent& e) {
                if (auto const* error = std::get_if<SystemEvent::Error>(&e.value))
                {
                    auto message = std::format("{}: {}", error->source, error->error);
                    if (error->context)
                        message += std::format("\nContext: {}", *error->context);
                    showError(std::format("{} Error", error->source), std::move(message), ErrorSeverity::Critical);
                }
                else if (auto const* failed = std::get_if<SystemEvent::ModelsRegistryRefreshFailed>(&e.value))
                {
                    showError("Model Catalog", std::format("Refreshing the model catalog failed: {}", failed->error),
                              ErrorSeverity::Warning);
                }
            },
            [this](const ChatEvent& e) {
                if (auto const* error = std::get_if<ChatEvent::StreamError>(&e.value))
                {
                    showError("Chat Error", error->error,
                              error->recoverable ? ErrorSeverity::Warning : ErrorSeverity::Error);
                }
            },
            [this](const McpEvent& e) {
                if (auto const* failed = std::get_if<McpEvent::StartFailed>(&e.value))
                {
                    showError("MCP Server Error", std::format("{} failed to start: {}", failed->name, failed->error));
                }
                else if (auto const* unhealthy = std::get_if<McpEvent::Unhealthy>(&e.value))
                {
                    showError("MCP Server Unhealthy", std::format("{}: {}", unhealthy->name, unhealthy->error),
                              ErrorSeverity::Warning);
                }
            },
            [](const auto&) {},
        },
        event);
}

} // namespace pagent
