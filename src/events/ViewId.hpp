// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string_view>

namespace pagent
{

/// @brief Top-level views the UI router can display.
enum class ViewId
{
    Chat,
    History,
    Settings,
    ProfileEditor,
    McpAdd,
    McpConfigure,
    ModelSelector,
};

/// @brief The root view every navigation stack starts from.
inline constexpr auto HomeView = ViewId::Chat;

/// @brief Modal dialogs that can be presented on top of a view.
enum class ModalId
{
    RenameConversation,
    ConfirmDeleteConversation,
    ConfirmDeleteProfile,
    ConfirmDeleteMcp,
};

[[nodiscard]] constexpr auto viewIdToString(ViewId view) -> std::string_view
{
    switch (view)
    {
        case ViewId::Chat: return "chat";
        case ViewId::History: return "history";
        case ViewId::Settings: return "settings";
        case ViewId::ProfileEditor: return "profile-editor";
        case ViewId::McpAdd: return "mcp-add";
        case ViewId::McpConfigure: return "mcp-configure";
        case ViewId::ModelSelector: return "model-selector";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto modalIdToString(ModalId modal) -> std::string_view
{
    switch (modal)
    {
        case ModalId::RenameConversation: return "rename-conversation";
        case ModalId::ConfirmDeleteConversation: return "confirm-delete-conversation";
        case ModalId::ConfirmDeleteProfile: return "confirm-delete-profile";
        case ModalId::ConfirmDeleteMcp: return "confirm-delete-mcp";
    }
    return "unknown";
}

} // namespace pagent
