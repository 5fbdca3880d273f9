// SPDX-License-Identifier: Apache-2.0
#include "EchoChatService.hpp"

#include <core/Log.hpp>
#include <core/StringUtils.hpp>
#include <events/EventBus.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <thread>
#include <vector>

namespace pagent
{

namespace
{

    constexpr auto ToolCommandPrefix = std::string_view { "/tool " };

    /// @brief Splits text into chunks of one word each, keeping the trailing whitespace.
    auto splitIntoChunks(std::string_view text) -> std::vector<std::string>
    {
        auto chunks = std::vector<std::string> {};
        auto current = std::string {};
        for (auto const c: text)
        {
            current.push_back(c);
            if (c == ' ')
            {
                chunks.push_back(std::move(current));
                current.clear();
            }
        }
        if (!current.empty())
            chunks.push_back(std::move(current));
        return chunks;
    }

} // namespace

struct EchoChatService::Impl
{
    std::shared_ptr<EventBus> bus;
    std::shared_ptr<ConversationService> conversations;
    std::shared_ptr<ProfileService> profiles;
    std::shared_ptr<McpService> mcp;
    EchoChatConfig config;

    std::atomic<bool> streaming = false;
    std::mutex mutex;
    std::condition_variable_any cv;
    bool cancelRequested = false;

    // Declared last so it is joined before the members above are destroyed.
    std::jthread worker;

    void publish(ChatEvent event)
    {
        if (auto const published = bus->publish(std::move(event)); !published)
            log::debug("event not delivered ({})", publishErrorToString(published.error()));
    }

    /// @brief Waits for the chunk delay. Returns false when the stream should stop.
    auto pause(const std::stop_token& stopToken) -> bool
    {
        auto lock = std::unique_lock(mutex);
        if (config.chunkDelay.count() > 0)
            cv.wait_for(lock, stopToken, config.chunkDelay, [this] { return cancelRequested; });
        return !cancelRequested && !stopToken.stop_requested();
    }

    void finish(ChatEvent last)
    {
        {
            auto lock = std::lock_guard(mutex);
            streaming.store(false, std::memory_order_release);
        }
        cv.notify_all();
        publish(std::move(last));
    }

    void simulateToolCall(std::string_view toolName)
    {
        auto const callId = std::format("call_{}", Uuid::generate().shortString());
        auto const start = std::chrono::steady_clock::now();
        publish(ChatEvent { ChatEvent::ToolCallStarted { .toolCallId = callId, .toolName = std::string(toolName) } });

        auto tools = mcp ? mcp->getAvailableTools() : Result<std::vector<ToolInfo>> {};
        auto const found = tools && std::ranges::any_of(*tools, [&](const ToolInfo& t) { return t.name == toolName; });

        auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        publish(ChatEvent { ChatEvent::ToolCallCompleted {
            .toolCallId = callId,
            .toolName = std::string(toolName),
            .success = found,
            .result = found ? std::format("{} completed", toolName) : std::format("Tool '{}' is not available", toolName),
            .durationMs = static_cast<std::uint64_t>(elapsed.count()),
        } });
    }

    void run(const std::stop_token& stopToken, Uuid conversationId, std::string content, ModelProfile profile)
    {
        log::setThreadTag("EchoChat");
        auto const messageId = Uuid::generate();
        publish(ChatEvent { ChatEvent::StreamStarted {
            .conversationId = conversationId, .messageId = messageId, .modelId = profile.modelId } });

        auto thinking = std::optional<std::string> {};
        if (profile.parameters.showThinking)
        {
            thinking = std::format("The user wrote {} characters; repeating them back.", content.size());
            publish(ChatEvent { ChatEvent::ThinkingDelta { .text = *thinking } });
        }

        if (content.starts_with(ToolCommandPrefix))
            simulateToolCall(trim(std::string_view(content).substr(ToolCommandPrefix.size())));

        auto const reply = std::format("You said: {}", content);
        auto partial = std::string {};
        auto chunkCount = std::uint64_t { 0 };
        for (auto& chunk: splitIntoChunks(reply))
        {
            if (!pause(stopToken))
            {
                log::info("stream {} cancelled after {} chunks", messageId.shortString(), chunkCount);
                finish(ChatEvent { ChatEvent::StreamCancelled {
                    .conversationId = conversationId, .messageId = messageId, .partialContent = partial } });
                return;
            }
            partial += chunk;
            ++chunkCount;
            publish(ChatEvent { ChatEvent::TextDelta { .text = std::move(chunk) } });
        }

        auto saved = conversations->addAssistantMessage(conversationId, partial, thinking);
        if (!saved)
        {
            log::error("failed to store reply: {}", saved.error());
            finish(ChatEvent { ChatEvent::StreamError {
                .conversationId = conversationId, .error = saved.error().message, .recoverable = false } });
            return;
        }

        finish(ChatEvent { ChatEvent::StreamCompleted {
            .conversationId = conversationId, .messageId = messageId, .totalTokens = chunkCount } });
        publish(ChatEvent { ChatEvent::MessageSaved { .conversationId = conversationId, .messageId = saved->id } });
    }
};

EchoChatService::EchoChatService(std::shared_ptr<EventBus> bus,
                                 std::shared_ptr<ConversationService> conversations,
                                 std::shared_ptr<ProfileService> profiles,
                                 std::shared_ptr<McpService> mcp,
                                 EchoChatConfig config):
    _impl(std::make_unique<Impl>())
{
    _impl->bus = std::move(bus);
    _impl->conversations = std::move(conversations);
    _impl->profiles = std::move(profiles);
    _impl->mcp = std::move(mcp);
    _impl->config = config;
}

EchoChatService::~EchoChatService()
{
    if (_impl->worker.joinable())
    {
        _impl->worker.request_stop();
        _impl->worker.join();
    }
}

auto EchoChatService::sendMessage(Uuid conversationId, std::string content) -> VoidResult
{
    auto expected = false;
    if (!_impl->streaming.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        return makeError(ErrorCode::Internal, "Stream already in progress");

    auto fail = [this](Error error) -> VoidResult {
        {
            auto lock = std::lock_guard(_impl->mutex);
            _impl->streaming.store(false, std::memory_order_release);
        }
        _impl->cv.notify_all();
        return std::unexpected(std::move(error));
    };

    auto defaultId = _impl->profiles->getDefault();
    if (!defaultId)
        return fail(defaultId.error());
    if (!*defaultId)
        return fail(Error { ErrorCode::ConfigError, "No default profile available" });

    auto profile = _impl->profiles->get(**defaultId);
    if (!profile)
        return fail(profile.error());

    auto stored = _impl->conversations->addUserMessage(conversationId, content);
    if (!stored)
        return fail(stored.error());

    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->cancelRequested = false;
    }

    // The previous stream has already reset the streaming flag; joining it is immediate.
    if (_impl->worker.joinable())
        _impl->worker.join();

    _impl->worker = std::jthread([impl = _impl.get(), conversationId, content = std::move(content), p = std::move(*profile)](
                                     std::stop_token stopToken) mutable {
        impl->run(stopToken, conversationId, std::move(content), std::move(p));
    });
    return {};
}

void EchoChatService::cancel()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->cancelRequested = true;
    }
    _impl->cv.notify_all();
}

auto EchoChatService::isStreaming() const -> bool
{
    return _impl->streaming.load(std::memory_order_acquire);
}

void EchoChatService::waitIdle()
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->cv.wait(lock, [this] { return !_impl->streaming.load(std::memory_order_acquire); });
}

} // namespace pagent
