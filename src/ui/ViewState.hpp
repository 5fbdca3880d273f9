// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <core/Uuid.hpp>
#include <presentation/ViewCommand.hpp>
#include <ui/NavigationState.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pagent
{

/// @brief A message as rendered in the transcript.
struct TranscriptEntry
{
    MessageRole role = MessageRole::User;
    std::string content;
    std::optional<std::string> thinking;
    bool cancelled = false;
};

/// @brief A tool call row shown below the streaming reply.
struct ToolCallRow
{
    std::string toolName;
    std::string status;
    std::optional<std::string> result;
    std::optional<std::uint64_t> durationMs;
};

struct ErrorBanner
{
    std::string title;
    std::string message;
    ErrorSeverity severity = ErrorSeverity::Error;
};

struct ModalState
{
    ModalId modal = ModalId::RenameConversation;
    std::optional<Uuid> target;
};

struct ProfileTestState
{
    Uuid id;
    bool running = true;
    bool success = false;
    std::optional<std::uint64_t> responseTimeMs;
    std::optional<std::string> error;
};

struct ModelSelection
{
    std::string providerId;
    std::string modelId;
    std::uint32_t contextLength = 0;
};

/// @brief Headless render state of the whole UI.
///
/// Each ViewCommand is applied as a whole; the state is only touched from the UI thread.
class ViewState
{
  public:
    void apply(const ViewCommand& command);
    void applyAll(const std::vector<ViewCommand>& commands);

    [[nodiscard]] auto navigation() noexcept -> NavigationState& { return _navigation; }
    [[nodiscard]] auto navigation() const noexcept -> const NavigationState& { return _navigation; }

    // Chat
    [[nodiscard]] auto activeConversation() const noexcept -> const std::optional<Uuid>& { return _activeConversation; }
    [[nodiscard]] auto activeTitle() const noexcept -> const std::string& { return _activeTitle; }
    [[nodiscard]] auto transcript() const noexcept -> const std::vector<TranscriptEntry>& { return _transcript; }
    [[nodiscard]] auto streamBuffer() const noexcept -> const std::string& { return _streamBuffer; }
    [[nodiscard]] auto thinkingBuffer() const noexcept -> const std::string& { return _thinkingBuffer; }
    [[nodiscard]] auto isStreaming() const noexcept -> bool { return _streaming; }
    [[nodiscard]] auto isThinkingIndicatorVisible() const noexcept -> bool { return _thinkingIndicator; }
    [[nodiscard]] auto showThinking() const noexcept -> bool { return _showThinking; }
    [[nodiscard]] auto toolCalls() const noexcept -> const std::vector<ToolCallRow>& { return _toolCalls; }
    [[nodiscard]] auto lastStreamError() const noexcept -> const std::optional<std::string>& { return _lastStreamError; }
    [[nodiscard]] auto lastTokenCount() const noexcept -> std::optional<std::uint64_t> { return _lastTokenCount; }

    // History
    [[nodiscard]] auto conversations() const noexcept -> const std::vector<ConversationSummary>& { return _conversations; }
    [[nodiscard]] auto historyCount() const noexcept -> std::optional<std::size_t> { return _historyCount; }

    // Settings
    [[nodiscard]] auto profiles() const noexcept -> const std::vector<ProfileSummary>& { return _profiles; }
    [[nodiscard]] auto defaultProfileId() const noexcept -> const std::optional<Uuid>& { return _defaultProfileId; }
    [[nodiscard]] auto profileEditor() const noexcept -> const std::optional<ProfileDraft>& { return _profileEditor; }
    [[nodiscard]] auto validationErrors() const noexcept -> const std::vector<std::string>& { return _validationErrors; }
    [[nodiscard]] auto profileTest() const noexcept -> const std::optional<ProfileTestState>& { return _profileTest; }
    [[nodiscard]] auto mcpServers() const noexcept -> const std::vector<McpSummary>& { return _mcpServers; }
    [[nodiscard]] auto mcpTools(Uuid id) const -> std::vector<ToolInfo>;
    [[nodiscard]] auto registryResults() const noexcept -> const std::vector<McpRegistryEntry>& { return _registryResults; }
    [[nodiscard]] auto mcpConfigure() const noexcept -> const std::optional<McpConfig>& { return _mcpConfigure; }

    // Model selector
    [[nodiscard]] auto modelResults() const noexcept -> const std::vector<ModelInfo>& { return _modelResults; }
    [[nodiscard]] auto selectedModel() const noexcept -> const std::optional<ModelSelection>& { return _selectedModel; }

    // Overlays
    [[nodiscard]] auto error() const noexcept -> const std::optional<ErrorBanner>& { return _error; }
    [[nodiscard]] auto notification() const noexcept -> const std::optional<std::string>& { return _notification; }
    [[nodiscard]] auto modal() const noexcept -> const std::optional<ModalState>& { return _modal; }

  private:
    void commitStream(std::string content, bool cancelled);
    void clearTranscript();
    auto findConversation(Uuid id) -> ConversationSummary*;
    auto findProfile(Uuid id) -> ProfileSummary*;
    auto findMcpServer(Uuid id) -> McpSummary*;

    NavigationState _navigation;

    std::optional<Uuid> _activeConversation;
    std::string _activeTitle;
    std::vector<TranscriptEntry> _transcript;
    std::string _streamBuffer;
    std::string _thinkingBuffer;
    bool _streaming = false;
    bool _thinkingIndicator = false;
    bool _showThinking = false;
    std::vector<ToolCallRow> _toolCalls;
    std::optional<std::string> _lastStreamError;
    std::optional<std::uint64_t> _lastTokenCount;

    std::vector<ConversationSummary> _conversations;
    std::optional<std::size_t> _historyCount;

    std::vector<ProfileSummary> _profiles;
    std::optional<Uuid> _defaultProfileId;
    std::optional<ProfileDraft> _profileEditor;
    std::vector<std::string> _validationErrors;
    std::optional<ProfileTestState> _profileTest;
    std::vector<McpSummary> _mcpServers;
    std::unordered_map<Uuid, std::vector<ToolInfo>> _mcpTools;
    std::vector<McpRegistryEntry> _registryResults;
    std::optional<McpConfig> _mcpConfigure;

    std::vector<ModelInfo> _modelResults;
    std::optional<ModelSelection> _selectedModel;

    std::optional<ErrorBanner> _error;
    std::optional<std::string> _notification;
    std::optional<ModalState> _modal;
};

} // namespace pagent
