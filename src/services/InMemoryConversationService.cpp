// SPDX-License-Identifier: Apache-2.0
#include "InMemoryConversationService.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <ranges>

namespace pagent
{

namespace
{

    constexpr auto PreviewLength = std::size_t { 80 };

    /// @brief Generated titles are the UTC creation time down to milliseconds, e.g. 20260101120000123.
    auto generatedTitle(Timestamp now) -> std::string
    {
        auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        auto const seconds = std::chrono::floor<std::chrono::seconds>(now);
        return std::format("{:%Y%m%d%H%M%S}{:03}", seconds, ms.count());
    }

    auto notFound(Uuid id) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::NotFound, std::format("Conversation not found: {}", id));
    }

} // namespace

auto InMemoryConversationService::find(Uuid id) -> Conversation*
{
    auto const it = std::ranges::find(_conversations, id, &Conversation::id);
    return it != _conversations.end() ? &*it : nullptr;
}

auto InMemoryConversationService::create(std::optional<std::string> title, Uuid profileId) -> Result<Conversation>
{
    auto const now = std::chrono::system_clock::now();
    auto conversation = Conversation {
        .id = Uuid::generate(),
        .title = title.value_or(generatedTitle(now)),
        .profileId = profileId,
        .messages = {},
        .createdAt = now,
        .updatedAt = now,
    };

    auto lock = std::lock_guard(_mutex);
    _conversations.push_back(conversation);
    return conversation;
}

auto InMemoryConversationService::load(Uuid id) -> Result<Conversation>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const* conversation = find(id))
        return *conversation;
    return notFound(id);
}

auto InMemoryConversationService::list(std::optional<std::size_t> limit, std::optional<std::size_t> offset)
    -> Result<std::vector<ConversationSummary>>
{
    auto lock = std::lock_guard(_mutex);

    auto sorted = std::vector<const Conversation*> {};
    for (auto const& conversation: _conversations)
        sorted.push_back(&conversation);
    std::ranges::stable_sort(sorted, std::ranges::greater {}, [](const Conversation* c) { return c->updatedAt; });

    auto const first = std::min(offset.value_or(0), sorted.size());
    auto const count = std::min(limit.value_or(sorted.size()), sorted.size() - first);

    auto result = std::vector<ConversationSummary> {};
    result.reserve(count);
    for (auto const* conversation: sorted | std::views::drop(first) | std::views::take(count))
    {
        auto preview = std::string {};
        if (!conversation->messages.empty())
            preview = conversation->messages.back().content.substr(0, PreviewLength);

        result.push_back(ConversationSummary {
            .id = conversation->id,
            .title = conversation->title,
            .messageCount = conversation->messages.size(),
            .preview = std::move(preview),
            .updatedAt = conversation->updatedAt,
        });
    }
    return result;
}

auto InMemoryConversationService::appendMessage(Uuid conversationId, Message message) -> Result<Message>
{
    auto lock = std::lock_guard(_mutex);
    auto* conversation = find(conversationId);
    if (!conversation)
        return notFound(conversationId);

    conversation->messages.push_back(message);
    conversation->updatedAt = message.createdAt;
    return message;
}

auto InMemoryConversationService::addUserMessage(Uuid conversationId, std::string content) -> Result<Message>
{
    return appendMessage(conversationId,
                         Message {
                             .id = Uuid::generate(),
                             .role = MessageRole::User,
                             .content = std::move(content),
                             .thinking = std::nullopt,
                             .createdAt = std::chrono::system_clock::now(),
                         });
}

auto InMemoryConversationService::addAssistantMessage(Uuid conversationId,
                                                      std::string content,
                                                      std::optional<std::string> thinking) -> Result<Message>
{
    return appendMessage(conversationId,
                         Message {
                             .id = Uuid::generate(),
                             .role = MessageRole::Assistant,
                             .content = std::move(content),
                             .thinking = std::move(thinking),
                             .createdAt = std::chrono::system_clock::now(),
                         });
}

auto InMemoryConversationService::rename(Uuid id, std::string title) -> VoidResult
{
    if (title.empty())
        return makeError(ErrorCode::Validation, "Conversation title must not be empty");

    auto lock = std::lock_guard(_mutex);
    auto* conversation = find(id);
    if (!conversation)
        return notFound(id);
    conversation->title = std::move(title);
    conversation->updatedAt = std::chrono::system_clock::now();
    return {};
}

auto InMemoryConversationService::remove(Uuid id) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    auto const removed = std::erase_if(_conversations, [id](const Conversation& c) { return c.id == id; });
    if (removed == 0)
        return notFound(id);
    if (_active == id)
        _active.reset();
    return {};
}

auto InMemoryConversationService::setActive(Uuid id) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (!find(id))
        return notFound(id);
    _active = id;
    return {};
}

auto InMemoryConversationService::getActive() -> Result<std::optional<Uuid>>
{
    auto lock = std::lock_guard(_mutex);
    return _active;
}

auto InMemoryConversationService::getMessages(Uuid conversationId) -> Result<std::vector<Message>>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const* conversation = find(conversationId))
        return conversation->messages;
    return notFound(conversationId);
}

auto InMemoryConversationService::update(Uuid id, std::optional<std::string> title, std::optional<Uuid> profileId)
    -> Result<Conversation>
{
    auto lock = std::lock_guard(_mutex);
    auto* conversation = find(id);
    if (!conversation)
        return notFound(id);
    if (title)
        conversation->title = std::move(*title);
    if (profileId)
        conversation->profileId = *profileId;
    conversation->updatedAt = std::chrono::system_clock::now();
    return *conversation;
}

} // namespace pagent
