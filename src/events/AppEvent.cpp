// SPDX-License-Identifier: Apache-2.0
#include "AppEvent.hpp"

#include <core/Overloaded.hpp>

#include <array>

namespace pagent
{

namespace
{

    // Names are listed in variant declaration order.
    constexpr auto UserEventNames = std::array<std::string_view, 32> {
        "User::SendMessage",
        "User::StopStreaming",
        "User::NewConversation",
        "User::SelectConversation",
        "User::ToggleThinking",
        "User::StartRenameConversation",
        "User::ConfirmRenameConversation",
        "User::CancelRenameConversation",
        "User::DeleteConversation",
        "User::RefreshHistory",
        "User::SelectProfile",
        "User::CreateProfile",
        "User::EditProfile",
        "User::SaveProfile",
        "User::DeleteProfile",
        "User::ConfirmDeleteProfile",
        "User::TestProfileConnection",
        "User::ToggleMcp",
        "User::AddMcp",
        "User::SearchMcpRegistry",
        "User::SelectMcpFromRegistry",
        "User::ConfigureMcp",
        "User::SaveMcpConfig",
        "User::DeleteMcp",
        "User::ConfirmDeleteMcp",
        "User::StartMcpOAuth",
        "User::OpenModelSelector",
        "User::SearchModels",
        "User::FilterModelsByProvider",
        "User::SelectModel",
        "User::Navigate",
        "User::NavigateBack",
    };

    constexpr auto ChatEventNames = std::array<std::string_view, 9> {
        "Chat::StreamStarted",   "Chat::TextDelta",      "Chat::ThinkingDelta",
        "Chat::ToolCallStarted", "Chat::ToolCallCompleted", "Chat::StreamCompleted",
        "Chat::StreamCancelled", "Chat::StreamError",    "Chat::MessageSaved",
    };

    constexpr auto McpEventNames = std::array<std::string_view, 11> {
        "Mcp::Starting",   "Mcp::Started",    "Mcp::StartFailed",   "Mcp::Stopped",
        "Mcp::Unhealthy",  "Mcp::Recovered",  "Mcp::Restarting",    "Mcp::ToolCalled",
        "Mcp::ToolCompleted", "Mcp::ConfigSaved", "Mcp::Deleted",
    };

    constexpr auto ProfileEventNames = std::array<std::string_view, 7> {
        "Profile::Created",     "Profile::Updated",       "Profile::Deleted",         "Profile::DefaultChanged",
        "Profile::TestStarted", "Profile::TestCompleted", "Profile::ValidationFailed",
    };

    constexpr auto ConversationEventNames = std::array<std::string_view, 7> {
        "Conversation::Created",   "Conversation::Loaded",      "Conversation::TitleUpdated",
        "Conversation::Deleted",   "Conversation::Activated",   "Conversation::Deactivated",
        "Conversation::ListRefreshed",
    };

    constexpr auto NavigationEventNames = std::array<std::string_view, 5> {
        "Navigation::Navigating",     "Navigation::Navigated",      "Navigation::Cancelled",
        "Navigation::ModalPresented", "Navigation::ModalDismissed",
    };

    constexpr auto SystemEventNames = std::array<std::string_view, 13> {
        "System::AppLaunched",     "System::AppWillTerminate",        "System::AppBecameActive",
        "System::AppResignedActive", "System::HotkeyPressed",         "System::HotkeyChanged",
        "System::PopoverShown",    "System::PopoverHidden",           "System::Error",
        "System::ConfigLoaded",    "System::ConfigSaved",             "System::ModelsRegistryRefreshed",
        "System::ModelsRegistryRefreshFailed",
    };

    static_assert(UserEventNames.size() == std::variant_size_v<UserEvent::Variant>);
    static_assert(ChatEventNames.size() == std::variant_size_v<ChatEvent::Variant>);
    static_assert(McpEventNames.size() == std::variant_size_v<McpEvent::Variant>);
    static_assert(ProfileEventNames.size() == std::variant_size_v<ProfileEvent::Variant>);
    static_assert(ConversationEventNames.size() == std::variant_size_v<ConversationEvent::Variant>);
    static_assert(NavigationEventNames.size() == std::variant_size_v<NavigationEvent::Variant>);
    static_assert(SystemEventNames.size() == std::variant_size_v<SystemEvent::Variant>);

    template <std::size_t N, typename Category>
    auto nameOf(const std::array<std::string_view, N>& names, const Category& category) -> std::string_view
    {
        return names[category.value.index()];
    }

} // namespace

auto eventName(const AppEvent& event) -> std::string_view
{
    return std::visit(
        Overloaded {
            [](const UserEvent& e) { return nameOf(UserEventNames, e); },
            [](const ChatEvent& e) { return nameOf(ChatEventNames, e); },
            [](const McpEvent& e) { return nameOf(McpEventNames, e); },
            [](const ProfileEvent& e) { return nameOf(ProfileEventNames, e); },
            [](const ConversationEvent& e) { return nameOf(ConversationEventNames, e); },
            [](const NavigationEvent& e) { return nameOf(NavigationEventNames, e); },
            [](const SystemEvent& e) { return nameOf(SystemEventNames, e); },
        },
        event);
}

} // namespace pagent
