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

/// @brief A single atomic UI mutation produced by a presenter.
///
/// Commands carry plain data only. The UI applies each one as a whole in the frame that
/// drained it.
struct ViewCommand
{
    // Chat transcript and streaming
    struct ConversationCreated { Uuid id; Uuid profileId; };
    struct MessageAppended { Uuid conversationId; MessageRole role = MessageRole::User; std::string content; };
    struct ShowThinking { Uuid conversationId; };
    struct HideThinking { Uuid conversationId; };
    struct AppendStream { Uuid conversationId; std::string chunk; };
    struct FinalizeStream { Uuid conversationId; std::optional<std::uint64_t> tokens; };
    struct StreamCancelled { Uuid conversationId; std::string partialContent; };
    struct StreamError { Uuid conversationId; std::string error; bool recoverable = false; };
    struct AppendThinking { Uuid conversationId; std::string content; };
    struct ShowToolCall { Uuid conversationId; std::string toolName; std::string status; };
    struct UpdateToolCall
    {
        Uuid conversationId;
        std::string toolName;
        std::string status;
        std::optional<std::string> result;
        std::optional<std::uint64_t> durationMs;
    };
    struct MessageSaved { Uuid conversationId; };
    struct ToggleThinkingVisibility {};
    struct ConversationRenamed { Uuid id; std::string title; };
    struct ConversationCleared {};
    struct HistoryUpdated { std::optional<std::size_t> count; };

    // History
    struct ConversationListRefreshed { std::vector<ConversationSummary> conversations; };
    struct ConversationActivated { Uuid id; };
    struct ConversationDeleted { Uuid id; };
    struct ConversationTitleUpdated { Uuid id; std::string title; };

    // Settings and profiles
    struct ShowSettings
    {
        std::vector<ProfileSummary> profiles;
        std::vector<McpSummary> mcpServers;
        std::optional<Uuid> defaultProfileId;
    };
    struct ShowNotification { std::string message; };
    struct ProfileCreated { Uuid id; std::string name; };
    struct ProfileUpdated { Uuid id; std::string name; };
    struct ProfileDeleted { Uuid id; };
    struct DefaultProfileChanged { std::optional<Uuid> profileId; };
    struct ProfileTestStarted { Uuid id; };
    struct ProfileTestCompleted
    {
        Uuid id;
        bool success = false;
        std::optional<std::uint64_t> responseTimeMs;
        std::optional<std::string> error;
    };
    struct ProfileEditorLoaded { ProfileDraft profile; };
    struct ProfileValidationFailed { std::vector<std::string> errors; };

    // MCP
    struct McpServerStarted { Uuid id; std::size_t toolCount = 0; };
    struct McpServerFailed { Uuid id; std::string error; };
    struct McpToolsUpdated { Uuid id; std::vector<ToolInfo> tools; };
    struct McpStatusChanged { Uuid id; McpStatus status = McpStatus::Stopped; };
    struct McpConfigSaved { Uuid id; };
    struct McpDeleted { Uuid id; };
    struct McpRegistryResults { std::vector<McpRegistryEntry> entries; };
    struct McpConfigureLoaded { McpConfig config; };

    // Model selector
    struct ModelSearchResults { std::vector<ModelInfo> models; };
    struct ModelSelected { std::string providerId; std::string modelId; std::uint32_t contextLength = 0; };

    // Errors
    struct ShowError { std::string title; std::string message; ErrorSeverity severity = ErrorSeverity::Error; };
    struct ClearError {};

    // Navigation
    struct NavigateTo { ViewId view = HomeView; };
    struct NavigateBack {};
    struct ShowModal { ModalId modal = ModalId::RenameConversation; std::optional<Uuid> target; };
    struct DismissModal {};

    using Variant = std::variant<ConversationCreated,
                                 MessageAppended,
                                 ShowThinking,
                                 HideThinking,
                                 AppendStream,
                                 FinalizeStream,
                                 StreamCancelled,
                                 StreamError,
                                 AppendThinking,
                                 ShowToolCall,
                                 UpdateToolCall,
                                 MessageSaved,
                                 ToggleThinkingVisibility,
                                 ConversationRenamed,
                                 ConversationCleared,
                                 HistoryUpdated,
                                 ConversationListRefreshed,
                                 ConversationActivated,
                                 ConversationDeleted,
                                 ConversationTitleUpdated,
                                 ShowSettings,
                                 ShowNotification,
                                 ProfileCreated,
                                 ProfileUpdated,
                                 ProfileDeleted,
                                 DefaultProfileChanged,
                                 ProfileTestStarted,
                                 ProfileTestCompleted,
                                 ProfileEditorLoaded,
                                 ProfileValidationFailed,
                                 McpServerStarted,
                                 McpServerFailed,
                                 McpToolsUpdated,
                                 McpStatusChanged,
                                 McpConfigSaved,
                                 McpDeleted,
                                 McpRegistryResults,
                                 McpConfigureLoaded,
                                 ModelSearchResults,
                                 ModelSelected,
                                 ShowError,
                                 ClearError,
                                 NavigateTo,
                                 NavigateBack,
                                 ShowModal,
                                 DismissModal>;

    Variant value;

    /// @brief Returns true if this command holds alternative @p T.
    template <typename T>
    [[nodiscard]] auto is() const noexcept -> bool
    {
        return std::holds_alternative<T>(value);
    }

    /// @brief Returns a pointer to alternative @p T, or nullptr.
    template <typename T>
    [[nodiscard]] auto get() const noexcept -> const T*
    {
        return std::get_if<T>(&value);
    }
};

/// @brief Returns the variant name of a command, for logging.
[[nodiscard]] auto commandName(const ViewCommand& command) -> std::string_view;

/// @brief Renders a one-line human readable description of a command.
[[nodiscard]] auto describe(const ViewCommand& command) -> std::string;

} // namespace pagent
