// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Uuid.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagent
{

using Timestamp = std::chrono::system_clock::time_point;

/// @brief The role of a message participant in a conversation.
enum class MessageRole
{
    System,
    User,
    Assistant,
    Tool,
};

/// @brief Converts a MessageRole to its string representation.
[[nodiscard]] constexpr auto roleToString(MessageRole role) -> std::string_view
{
    switch (role)
    {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
        case MessageRole::Tool: return "tool";
    }
    return "unknown";
}

/// @brief How prominently an error should be presented to the user.
enum class ErrorSeverity
{
    Info,
    Warning,
    Error,
    Critical,
};

[[nodiscard]] constexpr auto severityToString(ErrorSeverity severity) -> std::string_view
{
    switch (severity)
    {
        case ErrorSeverity::Info: return "info";
        case ErrorSeverity::Warning: return "warning";
        case ErrorSeverity::Error: return "error";
        case ErrorSeverity::Critical: return "critical";
    }
    return "unknown";
}

/// @brief A single stored message of a conversation.
struct Message
{
    Uuid id;
    MessageRole role = MessageRole::User;
    std::string content;
    std::optional<std::string> thinking;
    Timestamp createdAt {};
};

/// @brief A conversation with its full message history.
struct Conversation
{
    Uuid id;
    std::string title;
    Uuid profileId;
    std::vector<Message> messages;
    Timestamp createdAt {};
    Timestamp updatedAt {};
};

/// @brief Lightweight conversation description for history lists.
struct ConversationSummary
{
    Uuid id;
    std::string title;
    std::size_t messageCount = 0;
    std::string preview;
    Timestamp updatedAt {};
};

/// @brief Generation parameters of a model profile.
struct ModelParameters
{
    double temperature = 0.7;
    int maxTokens = 4096;
    bool showThinking = false;
};

/// @brief A configured model endpoint the chat can talk to.
struct ModelProfile
{
    Uuid id;
    std::string name;
    std::string providerId;
    std::string modelId;
    std::string baseUrl;
    std::string systemPrompt;
    ModelParameters parameters;
};

/// @brief Editor payload for creating (nil id) or updating a profile.
struct ProfileDraft
{
    Uuid id;
    std::string name;
    std::string providerId;
    std::string modelId;
    std::string baseUrl;
    std::string systemPrompt;
    std::optional<std::string> apiKey;
    ModelParameters parameters;
};

/// @brief Row of the profile list in the settings view.
struct ProfileSummary
{
    Uuid id;
    std::string name;
    std::string providerId;
    std::string modelId;
    bool isDefault = false;
};

/// @brief Lifecycle status of an MCP tool server.
enum class McpStatus
{
    Starting,
    Running,
    Stopped,
    Failed,
    Unhealthy,
};

[[nodiscard]] constexpr auto mcpStatusToString(McpStatus status) -> std::string_view
{
    switch (status)
    {
        case McpStatus::Starting: return "starting";
        case McpStatus::Running: return "running";
        case McpStatus::Stopped: return "stopped";
        case McpStatus::Failed: return "failed";
        case McpStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

/// @brief Configuration of an MCP tool server.
struct McpConfig
{
    Uuid id;
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled = true;

    /// @brief Registry entry name this server was installed from, empty for manual entries.
    std::string source;
};

/// @brief Row of the MCP server list in the settings view.
struct McpSummary
{
    Uuid id;
    std::string name;
    bool enabled = false;
    McpStatus status = McpStatus::Stopped;
};

/// @brief A tool exposed by an MCP server.
struct ToolInfo
{
    std::string name;
    std::string description;
};

/// @brief Catalog entry of a model offered by a provider.
struct ModelInfo
{
    std::string providerId;
    std::string modelId;
    std::string name;
    std::uint32_t contextLength = 0;
    bool supportsTools = false;
    bool supportsReasoning = false;
};

/// @brief A model provider with the number of catalog models it offers.
struct ProviderInfo
{
    std::string id;
    std::string name;
    std::size_t modelCount = 0;
};

/// @brief An installable MCP server listed by a registry.
struct McpRegistryEntry
{
    std::string name;
    std::string displayName;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    std::vector<std::string> tags;
    bool trending = false;
};

} // namespace pagent
