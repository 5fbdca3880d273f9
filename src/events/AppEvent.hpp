// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <core/Uuid.hpp>
#include <events/ViewId.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pagent
{

/// @brief Actions initiated by the user in the UI.
struct UserEvent
{
    // Chat
    struct SendMessage { std::string text; };
    struct StopStreaming {};
    struct NewConversation {};
    struct SelectConversation { Uuid id; };
    struct ToggleThinking {};
    struct StartRenameConversation { Uuid id; };
    struct ConfirmRenameConversation { Uuid id; std::string title; };
    struct CancelRenameConversation {};

    // History
    struct DeleteConversation { Uuid id; };
    struct RefreshHistory {};

    // Profiles
    struct SelectProfile { Uuid id; };
    struct CreateProfile {};
    struct EditProfile { Uuid id; };
    struct SaveProfile { ProfileDraft profile; };
    struct DeleteProfile { Uuid id; };
    struct ConfirmDeleteProfile { Uuid id; };
    struct TestProfileConnection { Uuid id; };

    // MCP
    struct ToggleMcp { Uuid id; bool enabled = false; };
    struct AddMcp {};
    struct SearchMcpRegistry { std::string query; std::string source; };
    struct SelectMcpFromRegistry { std::string source; };
    struct ConfigureMcp { Uuid id; };
    struct SaveMcpConfig { Uuid id; McpConfig config; };
    struct DeleteMcp { Uuid id; };
    struct ConfirmDeleteMcp { Uuid id; };
    struct StartMcpOAuth { Uuid id; std::string provider; };

    // Model selector
    struct OpenModelSelector {};
    struct SearchModels { std::string query; };
    struct FilterModelsByProvider { std::optional<std::string> providerId; };
    struct SelectModel { std::string providerId; std::string modelId; };

    // Navigation
    struct Navigate { ViewId to = HomeView; };
    struct NavigateBack {};

    using Variant = std::variant<SendMessage,
                                 StopStreaming,
                                 NewConversation,
                                 SelectConversation,
                                 ToggleThinking,
                                 StartRenameConversation,
                                 ConfirmRenameConversation,
                                 CancelRenameConversation,
                                 DeleteConversation,
                                 RefreshHistory,
                                 SelectProfile,
                                 CreateProfile,
                                 EditProfile,
                                 SaveProfile,
                                 DeleteProfile,
                                 ConfirmDeleteProfile,
                                 TestProfileConnection,
                                 ToggleMcp,
                                 AddMcp,
                                 SearchMcpRegistry,
                                 SelectMcpFromRegistry,
                                 ConfigureMcp,
                                 SaveMcpConfig,
                                 DeleteMcp,
                                 ConfirmDeleteMcp,
                                 StartMcpOAuth,
                                 OpenModelSelector,
                                 SearchModels,
                                 FilterModelsByProvider,
                                 SelectModel,
                                 Navigate,
                                 NavigateBack>;

    Variant value;
};

/// @brief Progress of an LLM response stream.
struct ChatEvent
{
    struct StreamStarted { Uuid conversationId; Uuid messageId; std::string modelId; };
    struct TextDelta { std::string text; };
    struct ThinkingDelta { std::string text; };
    struct ToolCallStarted { std::string toolCallId; std::string toolName; };
    struct ToolCallCompleted
    {
        std::string toolCallId;
        std::string toolName;
        bool success = false;
        std::string result;
        std::uint64_t durationMs = 0;
    };
    struct StreamCompleted
    {
        Uuid conversationId;
        Uuid messageId;
        std::optional<std::uint64_t> totalTokens;
    };
    struct StreamCancelled { Uuid conversationId; Uuid messageId; std::string partialContent; };
    struct StreamError { Uuid conversationId; std::string error; bool recoverable = false; };
    struct MessageSaved { Uuid conversationId; Uuid messageId; };

    using Variant = std::variant<StreamStarted,
                                 TextDelta,
                                 ThinkingDelta,
                                 ToolCallStarted,
                                 ToolCallCompleted,
                                 StreamCompleted,
                                 StreamCancelled,
                                 StreamError,
                                 MessageSaved>;

    Variant value;
};

/// @brief Lifecycle and activity of MCP tool servers.
struct McpEvent
{
    struct Starting { Uuid id; std::string name; };
    struct Started { Uuid id; std::string name; std::vector<std::string> tools; };
    struct StartFailed { Uuid id; std::string name; std::string error; };
    struct Stopped { Uuid id; std::string name; };
    struct Unhealthy { Uuid id; std::string name; std::string error; };
    struct Recovered { Uuid id; std::string name; };
    struct Restarting { Uuid id; std::string name; };
    struct ToolCalled { Uuid mcpId; std::string toolName; std::string toolCallId; };
    struct ToolCompleted
    {
        Uuid mcpId;
        std::string toolName;
        std::string toolCallId;
        bool success = false;
        std::uint64_t durationMs = 0;
    };
    struct ConfigSaved { Uuid id; };
    struct Deleted { Uuid id; std::string name; };

    using Variant = std::variant<Starting,
                                 Started,
                                 StartFailed,
                                 Stopped,
                                 Unhealthy,
                                 Recovered,
                                 Restarting,
                                 ToolCalled,
                                 ToolCompleted,
                                 ConfigSaved,
                                 Deleted>;

    Variant value;
};

/// @brief Changes to model profiles.
struct ProfileEvent
{
    struct Created { Uuid id; std::string name; };
    struct Updated { Uuid id; std::string name; };
    struct Deleted { Uuid id; std::string name; };
    struct DefaultChanged { std::optional<Uuid> profileId; };
    struct TestStarted { Uuid id; };
    struct TestCompleted
    {
        Uuid id;
        bool success = false;
        std::optional<std::uint64_t> responseTimeMs;
        std::optional<std::string> error;
    };
    struct ValidationFailed { Uuid id; std::vector<std::string> errors; };

    using Variant = std::variant<Created, Updated, Deleted, DefaultChanged, TestStarted, TestCompleted, ValidationFailed>;

    Variant value;
};

/// @brief Changes to conversations.
struct ConversationEvent
{
    struct Created { Uuid id; std::string title; };
    struct Loaded { Uuid id; };
    struct TitleUpdated { Uuid id; std::string title; };
    struct Deleted { Uuid id; };
    struct Activated { Uuid id; };
    struct Deactivated {};
    struct ListRefreshed { std::size_t count = 0; };

    using Variant = std::variant<Created, Loaded, TitleUpdated, Deleted, Activated, Deactivated, ListRefreshed>;

    Variant value;
};

/// @brief Navigation activity reported by the UI router.
struct NavigationEvent
{
    struct Navigating { ViewId target; };
    struct Navigated { ViewId view = HomeView; };
    struct Cancelled { std::string reason; };
    struct ModalPresented { ModalId modal = ModalId::RenameConversation; };
    struct ModalDismissed { ModalId modal = ModalId::RenameConversation; };

    using Variant = std::variant<Navigating, Navigated, Cancelled, ModalPresented, ModalDismissed>;

    Variant value;
};

/// @brief Application-level lifecycle and failure notifications.
struct SystemEvent
{
    struct AppLaunched {};
    struct AppWillTerminate {};
    struct AppBecameActive {};
    struct AppResignedActive {};
    struct HotkeyPressed {};
    struct HotkeyChanged { std::string hotkey; };
    struct PopoverShown {};
    struct PopoverHidden {};
    struct Error { std::string source; std::string error; std::optional<std::string> context; };
    struct ConfigLoaded {};
    struct ConfigSaved {};
    struct ModelsRegistryRefreshed { std::size_t providerCount = 0; std::size_t modelCount = 0; };
    struct ModelsRegistryRefreshFailed { std::string error; };

    using Variant = std::variant<AppLaunched,
                                 AppWillTerminate,
                                 AppBecameActive,
                                 AppResignedActive,
                                 HotkeyPressed,
                                 HotkeyChanged,
                                 PopoverShown,
                                 PopoverHidden,
                                 Error,
                                 ConfigLoaded,
                                 ConfigSaved,
                                 ModelsRegistryRefreshed,
                                 ModelsRegistryRefreshFailed>;

    Variant value;
};

/// @brief Every event that flows through the EventBus.
using AppEvent =
    std::variant<UserEvent, ChatEvent, McpEvent, ProfileEvent, ConversationEvent, NavigationEvent, SystemEvent>;

/// @brief Returns a stable "Category::Variant" name for logging.
[[nodiscard]] auto eventName(const AppEvent& event) -> std::string_view;

} // namespace pagent
