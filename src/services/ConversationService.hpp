// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <core/Uuid.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pagent
{

/// @brief Stores conversations and tracks which one is active.
class ConversationService
{
  public:
    virtual ~ConversationService() = default;

    /// @brief Creates an empty conversation.
    /// @param title Initial title, or std::nullopt for a generated one.
    /// @param profileId Model profile the conversation uses (may be nil).
    [[nodiscard]] virtual auto create(std::optional<std::string> title, Uuid profileId) -> Result<Conversation> = 0;

    [[nodiscard]] virtual auto load(Uuid id) -> Result<Conversation> = 0;

    /// @brief Lists conversations, most recently updated first.
    [[nodiscard]] virtual auto list(std::optional<std::size_t> limit, std::optional<std::size_t> offset)
        -> Result<std::vector<ConversationSummary>> = 0;

    [[nodiscard]] virtual auto addUserMessage(Uuid conversationId, std::string content) -> Result<Message> = 0;

    [[nodiscard]] virtual auto addAssistantMessage(Uuid conversationId,
                                                   std::string content,
                                                   std::optional<std::string> thinking) -> Result<Message> = 0;

    [[nodiscard]] virtual auto rename(Uuid id, std::string title) -> VoidResult = 0;

    /// @brief Deletes a conversation. Deleting the active conversation clears the active id.
    [[nodiscard]] virtual auto remove(Uuid id) -> VoidResult = 0;

    [[nodiscard]] virtual auto setActive(Uuid id) -> VoidResult = 0;
    [[nodiscard]] virtual auto getActive() -> Result<std::optional<Uuid>> = 0;

    [[nodiscard]] virtual auto getMessages(Uuid conversationId) -> Result<std::vector<Message>> = 0;

    /// @brief Updates title and/or profile of a conversation.
    [[nodiscard]] virtual auto update(Uuid id, std::optional<std::string> title, std::optional<Uuid> profileId)
        -> Result<Conversation> = 0;
};

} // namespace pagent
