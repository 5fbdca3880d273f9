// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <services/ConversationService.hpp>

#include <mutex>
#include <vector>

namespace pagent
{

/// @brief Thread-safe ConversationService keeping all conversations in memory.
class InMemoryConversationService final: public ConversationService
{
  public:
    auto create(std::optional<std::string> title, Uuid profileId) -> Result<Conversation> override;
    auto load(Uuid id) -> Result<Conversation> override;
    auto list(std::optional<std::size_t> limit, std::optional<std::size_t> offset)
        -> Result<std::vector<ConversationSummary>> override;
    auto addUserMessage(Uuid conversationId, std::string content) -> Result<Message> override;
    auto addAssistantMessage(Uuid conversationId, std::string content, std::optional<std::string> thinking)
        -> Result<Message> override;
    auto rename(Uuid id, std::string title) -> VoidResult override;
    auto remove(Uuid id) -> VoidResult override;
    auto setActive(Uuid id) -> VoidResult override;
    auto getActive() -> Result<std::optional<Uuid>> override;
    auto getMessages(Uuid conversationId) -> Result<std::vector<Message>> override;
    auto update(Uuid id, std::optional<std::string> title, std::optional<Uuid> profileId)
        -> Result<Conversation> override;

  private:
    auto find(Uuid id) -> Conversation*;
    auto appendMessage(Uuid conversationId, Message message) -> Result<Message>;

    std::mutex _mutex;
    std::vector<Conversation> _conversations;
    std::optional<Uuid> _active;
};

} // namespace pagent
