// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Uuid.hpp>

#include <string>

namespace pagent
{

/// @brief Sends user messages to a model and streams the reply as ChatEvents on the bus.
class ChatService
{
  public:
    virtual ~ChatService() = default;

    /// @brief Starts generating a reply to @p content in the given conversation.
    ///
    /// Returns once the stream has been started. Progress is reported through
    /// ChatEvent::StreamStarted, TextDelta, ..., StreamCompleted or StreamCancelled.
    [[nodiscard]] virtual auto sendMessage(Uuid conversationId, std::string content) -> VoidResult = 0;

    /// @brief Cancels the active stream, if any.
    virtual void cancel() = 0;

    [[nodiscard]] virtual auto isStreaming() const -> bool = 0;
};

} // namespace pagent
