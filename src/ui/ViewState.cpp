// SPDX-License-Identifier: Apache-2.0
#include "ViewState.hpp"

#include <core/Log.hpp>
#include <core/Overloaded.hpp>

#include <algorithm>

namespace pagent
{

namespace
{
    template <typename Range>
    auto findById(Range& range, Uuid id) -> typename Range::value_type*
    {
        auto const it = std::ranges::find_if(range, [id](auto const& item) { return item.id == id; });
        return it != range.end() ? &*it : nullptr;
    }

    template <typename Range>
    void eraseById(Range& range, Uuid id)
    {
        std::erase_if(range, [id](auto const& item) { return item.id == id; });
    }
} // namespace

auto ViewState::findConversation(Uuid id) -> ConversationSummary*
{
    return findById(_conversations, id);
}

auto ViewState::findProfile(Uuid id) -> ProfileSummary*
{
    return findById(_profiles, id);
}

auto ViewState::findMcpServer(Uuid id) -> McpSummary*
{
    return findById(_mcpServers, id);
}

auto ViewState::mcpTools(Uuid id) const -> std::vector<ToolInfo>
{
    if (auto const it = _mcpTools.find(id); it != _mcpTools.end())
        return it->second;
    return {};
}

void ViewState::clearTranscript()
{
    _transcript.clear();
    _streamBuffer.clear();
    _thinkingBuffer.clear();
    _toolCalls.clear();
    _streaming = false;
    _thinkingIndicator = false;
}

void ViewState::commitStream(std::string content, bool cancelled)
{
    if (!content.empty() || !_thinkingBuffer.empty())
    {
        auto entry = TranscriptEntry { .role = MessageRole::Assistant, .content = std::move(content) };
        if (!_thinkingBuffer.empty())
            entry.thinking = std::move(_thinkingBuffer);
        entry.cancelled = cancelled;
        _transcript.push_back(std::move(entry));
    }
    _streamBuffer.clear();
    _thinkingBuffer.clear();
    _streaming = false;
}

void ViewState::applyAll(const std::vector<ViewCommand>& commands)
{
    for (auto const& command: commands)
        apply(command);
}

void ViewState::apply(const ViewCommand& command)
{
    using VC = ViewCommand;

    // Transcript updates for a conversation other than the displayed one are dropped.
    auto const displayed = [this](Uuid id) {
        if (!_activeConversation)
            _activeConversation = id;
        return *_activeConversation == id;
    };

    std::visit(
        Overloaded {
            // Chat transcript and streaming
            [this](const VC::ConversationCreated& c) {
                if (!findConversation(c.id))
                    _conversations.insert(_conversations.begin(), ConversationSummary { .id = c.id });
            },
            [&](const VC::MessageAppended& c) {
                if (displayed(c.conversationId))
                    _transcript.push_back(TranscriptEntry { .role = c.role, .content = c.content });
            },
            [&](const VC::ShowThinking& c) {
                if (!displayed(c.conversationId))
                    return;
                _thinkingIndicator = true;
                _streaming = true;
                _lastStreamError.reset();
            },
            [this](const VC::HideThinking&) { _thinkingIndicator = false; },
            [&](const VC::AppendStream& c) {
                if (displayed(c.conversationId))
                    _streamBuffer += c.chunk;
            },
            [&](const VC::FinalizeStream& c) {
                if (!displayed(c.conversationId))
                    return;
                _lastTokenCount = c.tokens;
                commitStream(std::move(_streamBuffer), false);
            },
            [&](const VC::StreamCancelled& c) {
                if (!displayed(c.conversationId))
                    return;
                commitStream(c.partialContent.empty() ? std::move(_streamBuffer) : c.partialContent, true);
            },
            [&](const VC::StreamError& c) {
                if (!displayed(c.conversationId))
                    return;
                _lastStreamError = c.error;
                _streamBuffer.clear();
                _thinkingBuffer.clear();
                _streaming = false;
            },
            [&](const VC::AppendThinking& c) {
                if (displayed(c.conversationId))
                    _thinkingBuffer += c.content;
            },
            [&](const VC::ShowToolCall& c) {
                if (displayed(c.conversationId))
                    _toolCalls.push_back(ToolCallRow { .toolName = c.toolName, .status = c.status });
            },
            [&](const VC::UpdateToolCall& c) {
                if (!displayed(c.conversationId))
                    return;
                auto const it = std::find_if(_toolCalls.rbegin(), _toolCalls.rend(), [&](const ToolCallRow& row) {
                    return row.toolName == c.toolName && row.status == "running";
                });
                auto row = ToolCallRow {
                    .toolName = c.toolName, .status = c.status, .result = c.result, .durationMs = c.durationMs };
                if (it != _toolCalls.rend())
                    *it = std::move(row);
                else
                    _toolCalls.push_back(std::move(row));
            },
            [](const VC::MessageSaved&) {},
            [this](const VC::ToggleThinkingVisibility&) { _showThinking = !_showThinking; },
            [this](const VC::ConversationRenamed& c) {
                if (_activeConversation == c.id)
                    _activeTitle = c.title;
                if (auto* row = findConversation(c.id))
                    row->title = c.title;
            },
            [this](const VC::ConversationCleared&) { clearTranscript(); },
            [this](const VC::HistoryUpdated& c) { _historyCount = c.count; },

            // History
            [this](const VC::ConversationListRefreshed& c) {
                _conversations = c.conversations;
                _historyCount = _conversations.size();
                if (_activeConversation)
                {
                    if (auto const* row = findConversation(*_activeConversation))
                        _activeTitle = row->title;
                }
            },
            [this](const VC::ConversationActivated& c) {
                _activeConversation = c.id;
                auto const* row = findConversation(c.id);
                _activeTitle = row ? row->title : std::string {};
            },
            [this](const VC::ConversationDeleted& c) {
                eraseById(_conversations, c.id);
                if (_activeConversation == c.id)
                {
                    _activeConversation.reset();
                    _activeTitle.clear();
                    clearTranscript();
                }
            },
            [this](const VC::ConversationTitleUpdated& c) {
                if (auto* row = findConversation(c.id))
                    row->title = c.title;
                if (_activeConversation == c.id)
                    _activeTitle = c.title;
            },

            // Settings and profiles
            [this](const VC::ShowSettings& c) {
                _profiles = c.profiles;
                _mcpServers = c.mcpServers;
                _defaultProfileId = c.defaultProfileId;
            },
            [this](const VC::ShowNotification& c) { _notification = c.message; },
            [this](const VC::ProfileCreated& c) {
                if (!findProfile(c.id))
                    _profiles.push_back(ProfileSummary { .id = c.id, .name = c.name });
            },
            [this](const VC::ProfileUpdated& c) {
                if (auto* profile = findProfile(c.id))
                    profile->name = c.name;
            },
            [this](const VC::ProfileDeleted& c) {
                eraseById(_profiles, c.id);
                if (_defaultProfileId == c.id)
                    _defaultProfileId.reset();
            },
            [this](const VC::DefaultProfileChanged& c) {
                _defaultProfileId = c.profileId;
                for (auto& profile: _profiles)
                    profile.isDefault = c.profileId == profile.id;
            },
            [this](const VC::ProfileTestStarted& c) { _profileTest = ProfileTestState { .id = c.id }; },
            [this](const VC::ProfileTestCompleted& c) {
                _profileTest = ProfileTestState {
                    .id = c.id,
                    .running = false,
                    .success = c.success,
                    .responseTimeMs = c.responseTimeMs,
                    .error = c.error,
                };
            },
            [this](const VC::ProfileEditorLoaded& c) {
                _profileEditor = c.profile;
                _validationErrors.clear();
                _profileTest.reset();
            },
            [this](const VC::ProfileValidationFailed& c) { _validationErrors = c.errors; },

            // MCP
            [this](const VC::McpServerStarted& c) {
                if (auto* server = findMcpServer(c.id))
                    server->status = McpStatus::Running;
            },
            [this](const VC::McpServerFailed& c) {
                if (auto* server = findMcpServer(c.id))
                    server->status = McpStatus::Failed;
            },
            [this](const VC::McpToolsUpdated& c) { _mcpTools[c.id] = c.tools; },
            [this](const VC::McpStatusChanged& c) {
                if (auto* server = findMcpServer(c.id))
                {
                    server->status = c.status;
                    if (c.status == McpStatus::Starting || c.status == McpStatus::Running)
                        server->enabled = true;
                    else if (c.status == McpStatus::Stopped)
                        server->enabled = false;
                }
            },
            [this](const VC::McpConfigSaved& c) {
                if (_mcpConfigure && _mcpConfigure->id == c.id)
                    _mcpConfigure.reset();
            },
            [this](const VC::McpDeleted& c) {
                eraseById(_mcpServers, c.id);
                _mcpTools.erase(c.id);
            },
            [this](const VC::McpRegistryResults& c) { _registryResults = c.entries; },
            [this](const VC::McpConfigureLoaded& c) {
                _mcpConfigure = c.config;
                if (!findMcpServer(c.config.id))
                {
                    _mcpServers.push_back(McpSummary {
                        .id = c.config.id,
                        .name = c.config.name,
                        .enabled = c.config.enabled,
                        .status = c.config.enabled ? McpStatus::Running : McpStatus::Stopped,
                    });
                }
            },

            // Model selector
            [this](const VC::ModelSearchResults& c) { _modelResults = c.models; },
            [this](const VC::ModelSelected& c) {
                _selectedModel = ModelSelection {
                    .providerId = c.providerId, .modelId = c.modelId, .contextLength = c.contextLength };
            },

            // Errors
            [this](const VC::ShowError& c) {
                _error = ErrorBanner { .title = c.title, .message = c.message, .severity = c.severity };
            },
            [this](const VC::ClearError&) { _error.reset(); },

            // Navigation
            [this](const VC::NavigateTo& c) { _navigation.navigate(c.view); },
            [this](const VC::NavigateBack&) {
                if (!_navigation.navigateBack())
                    log::debug("ViewState: already at the home view");
            },
            [this](const VC::ShowModal& c) { _modal = ModalState { .modal = c.modal, .target = c.target }; },
            [this](const VC::DismissModal&) { _modal.reset(); },
        },
        command.value);
}

} // namespace pagent
