// SPDX-License-Identifier: Apache-2.0
#include "ViewCommand.hpp"

#include <core/Overloaded.hpp>

#include <array>
#include <format>

namespace pagent
{

namespace
{

    // Listed in variant declaration order.
    constexpr auto CommandNames = std::array<std::string_view, 46> {
        "ConversationCreated",
        "MessageAppended",
        "ShowThinking",
        "HideThinking",
        "AppendStream",
        "FinalizeStream",
        "StreamCancelled",
        "StreamError",
        "AppendThinking",
        "ShowToolCall",
        "UpdateToolCall",
        "MessageSaved",
        "ToggleThinkingVisibility",
        "ConversationRenamed",
        "ConversationCleared",
        "HistoryUpdated",
        "ConversationListRefreshed",
        "ConversationActivated",
        "ConversationDeleted",
        "ConversationTitleUpdated",
        "ShowSettings",
        "ShowNotification",
        "ProfileCreated",
        "ProfileUpdated",
        "ProfileDeleted",
        "DefaultProfileChanged",
        "ProfileTestStarted",
        "ProfileTestCompleted",
        "ProfileEditorLoaded",
        "ProfileValidationFailed",
        "McpServerStarted",
        "McpServerFailed",
        "McpToolsUpdated",
        "McpStatusChanged",
        "McpConfigSaved",
        "McpDeleted",
        "McpRegistryResults",
        "McpConfigureLoaded",
        "ModelSearchResults",
        "ModelSelected",
        "ShowError",
        "ClearError",
        "NavigateTo",
        "NavigateBack",
        "ShowModal",
        "DismissModal",
    };

    static_assert(CommandNames.size() == std::variant_size_v<ViewCommand::Variant>);

} // namespace

auto commandName(const ViewCommand& command) -> std::string_view
{
    return CommandNames[command.value.index()];
}

auto describe(const ViewCommand& command) -> std::string
{
    using VC = ViewCommand;
    auto const name = commandName(command);

    return std::visit(
        Overloaded {
            [&](const VC::MessageAppended& c) {
                return std::format("{} [{}] {}", name, roleToString(c.role), c.content);
            },
            [&](const VC::AppendStream& c) { return std::format("{} \"{}\"", name, c.chunk); },
            [&](const VC::AppendThinking& c) { return std::format("{} \"{}\"", name, c.content); },
            [&](const VC::StreamError& c) { return std::format("{} {}", name, c.error); },
            [&](const VC::ShowToolCall& c) { return std::format("{} {} ({})", name, c.toolName, c.status); },
            [&](const VC::UpdateToolCall& c) { return std::format("{} {} ({})", name, c.toolName, c.status); },
            [&](const VC::ConversationRenamed& c) { return std::format("{} {} -> {}", name, c.id, c.title); },
            [&](const VC::ConversationListRefreshed& c) {
                return std::format("{} ({} conversations)", name, c.conversations.size());
            },
            [&](const VC::ShowSettings& c) {
                return std::format("{} ({} profiles, {} MCP servers)", name, c.profiles.size(), c.mcpServers.size());
            },
            [&](const VC::ShowNotification& c) { return std::format("{} {}", name, c.message); },
            [&](const VC::ProfileTestCompleted& c) {
                return std::format("{} {} {}", name, c.id, c.success ? "succeeded" : "failed");
            },
            [&](const VC::ProfileValidationFailed& c) {
                return std::format("{} ({} errors)", name, c.errors.size());
            },
            [&](const VC::McpStatusChanged& c) {
                return std::format("{} {} {}", name, c.id, mcpStatusToString(c.status));
            },
            [&](const VC::McpRegistryResults& c) { return std::format("{} ({} entries)", name, c.entries.size()); },
            [&](const VC::ModelSearchResults& c) { return std::format("{} ({} models)", name, c.models.size()); },
            [&](const VC::ModelSelected& c) { return std::format("{} {}/{}", name, c.providerId, c.modelId); },
            [&](const VC::ShowError& c) {
                return std::format("{} [{}] {}: {}", name, severityToString(c.severity), c.title, c.message);
            },
            [&](const VC::NavigateTo& c) { return std::format("{} {}", name, viewIdToString(c.view)); },
            [&](const VC::ShowModal& c) { return std::format("{} {}", name, modalIdToString(c.modal)); },
            [&](const auto&) { return std::string(name); },
        },
        command.value);
}

} // namespace pagent
