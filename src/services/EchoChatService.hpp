// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <services/ChatService.hpp>
#include <services/ConversationService.hpp>
#include <services/McpService.hpp>
#include <services/ProfileService.hpp>

#include <chrono>
#include <memory>

namespace pagent
{

class EventBus;

struct EchoChatConfig
{
    /// @brief Pause between streamed chunks.
    std::chrono::milliseconds chunkDelay { 0 };
};

/// @brief ChatService that answers locally by echoing the user's message back word by word.
///
/// The reply is streamed on a background thread as ChatEvent::StreamStarted, TextDelta...,
/// StreamCompleted and MessageSaved, exactly like a remote model would. A message of the form
/// "/tool <name>" additionally simulates a call of that MCP tool. Only one stream may be
/// active at a time.
class EchoChatService final: public ChatService
{
  public:
    EchoChatService(std::shared_ptr<EventBus> bus,
                    std::shared_ptr<ConversationService> conversations,
                    std::shared_ptr<ProfileService> profiles,
                    std::shared_ptr<McpService> mcp,
                    EchoChatConfig config = {});
    ~EchoChatService() override;

    EchoChatService(const EchoChatService&) = delete;
    EchoChatService& operator=(const EchoChatService&) = delete;

    auto sendMessage(Uuid conversationId, std::string content) -> VoidResult override;
    void cancel() override;
    [[nodiscard]] auto isStreaming() const -> bool override;

    /// @brief Blocks until the active stream (if any) has finished.
    void waitIdle();

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace pagent
