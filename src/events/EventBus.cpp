// SPDX-License-Identifier: Apache-2.0
#include "EventBus.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace pagent
{

namespace detail
{
    struct BusState
    {
        explicit BusState(std::size_t cap): capacity(std::max<std::size_t>(cap, 1)) {}

        std::size_t const capacity;
        mutable std::mutex mutex;
        std::condition_variable_any cv;

        /// Retained events; ring.front() carries sequence number `nextSeq - ring.size()`.
        std::deque<AppEvent> ring;
        std::uint64_t nextSeq = 0;
        std::size_t subscribers = 0;
        bool closed = false;

        [[nodiscard]] auto oldestSeq() const -> std::uint64_t { return nextSeq - ring.size(); }

        /// Attempts to produce a result for a reader at @p cursor. Caller holds the mutex.
        [[nodiscard]] auto poll(std::uint64_t& cursor) const -> std::optional<RecvResult>
        {
            auto const oldest = oldestSeq();
            if (cursor < oldest)
            {
                auto const skipped = oldest - cursor;
                cursor = oldest;
                return RecvResult { std::unexpect, RecvError { .kind = RecvErrorKind::Lagged, .skipped = skipped } };
            }

            if (cursor < nextSeq)
            {
                auto event = ring[static_cast<std::size_t>(cursor - oldest)];
                ++cursor;
                return RecvResult { std::move(event) };
            }

            if (closed)
                return RecvResult { std::unexpect, RecvError { .kind = RecvErrorKind::Closed } };

            return std::nullopt;
        }

        [[nodiscard]] auto ready(std::uint64_t cursor) const -> bool { return cursor < nextSeq || closed; }
    };
} // namespace detail

auto publishErrorToString(PublishError error) -> std::string_view
{
    switch (error)
    {
        case PublishError::NoSubscribers: return "no subscribers";
        case PublishError::Closed: return "bus closed";
    }
    return "unknown";
}

Subscriber::Subscriber(std::shared_ptr<detail::BusState> state): _state(std::move(state))
{
    auto lock = std::lock_guard(_state->mutex);
    ++_state->subscribers;
    _cursor = _state->nextSeq;
}

Subscriber::~Subscriber()
{
    detach();
}

Subscriber::Subscriber(Subscriber&& other) noexcept:
    _state(std::exchange(other._state, nullptr)), _cursor(other._cursor)
{
}

Subscriber& Subscriber::operator=(Subscriber&& other) noexcept
{
    if (this != &other)
    {
        detach();
        _state = std::exchange(other._state, nullptr);
        _cursor = other._cursor;
    }
    return *this;
}

void Subscriber::detach()
{
    if (!_state)
        return;
    {
        auto lock = std::lock_guard(_state->mutex);
        --_state->subscribers;
    }
    _state.reset();
}

auto Subscriber::receive(std::stop_token stopToken) -> RecvResult
{
    if (!_state)
        return std::unexpected(RecvError { .kind = RecvErrorKind::Closed });

    auto lock = std::unique_lock(_state->mutex);
    _state->cv.wait(lock, stopToken, [this] { return _state->ready(_cursor); });

    if (auto result = _state->poll(_cursor))
        return std::move(*result);

    // Only reachable when the stop token fired while nothing was pending.
    return std::unexpected(RecvError { .kind = RecvErrorKind::Closed });
}

auto Subscriber::tryReceive() -> RecvResult
{
    if (!_state)
        return std::unexpected(RecvError { .kind = RecvErrorKind::Closed });

    auto lock = std::lock_guard(_state->mutex);
    if (auto result = _state->poll(_cursor))
        return std::move(*result);
    return std::unexpected(RecvError { .kind = RecvErrorKind::Empty });
}

auto Subscriber::receiveFor(std::chrono::milliseconds timeout) -> RecvResult
{
    if (!_state)
        return std::unexpected(RecvError { .kind = RecvErrorKind::Closed });

    auto lock = std::unique_lock(_state->mutex);
    _state->cv.wait_for(lock, timeout, [this] { return _state->ready(_cursor); });

    if (auto result = _state->poll(_cursor))
        return std::move(*result);
    return std::unexpected(RecvError { .kind = RecvErrorKind::Timeout });
}

EventBus::EventBus(std::size_t capacity): _state(std::make_shared<detail::BusState>(capacity))
{
}

EventBus::~EventBus()
{
    close();
}

auto EventBus::subscribe() -> Subscriber
{
    return Subscriber(_state);
}

auto EventBus::publish(AppEvent event) -> std::expected<std::size_t, PublishError>
{
    auto const name = eventName(event);
    auto receivers = std::size_t { 0 };
    {
        auto lock = std::lock_guard(_state->mutex);
        if (_state->closed)
            return std::unexpected(PublishError::Closed);
        if (_state->subscribers == 0)
            return std::unexpected(PublishError::NoSubscribers);

        _state->ring.push_back(std::move(event));
        if (_state->ring.size() > _state->capacity)
            _state->ring.pop_front();
        ++_state->nextSeq;
        receivers = _state->subscribers;
    }
    _state->cv.notify_all();

    log::trace("EventBus: published {} to {} subscriber(s)", name, receivers);
    return receivers;
}

auto EventBus::subscriberCount() const -> std::size_t
{
    auto lock = std::lock_guard(_state->mutex);
    return _state->subscribers;
}

auto EventBus::capacity() const noexcept -> std::size_t
{
    return _state->capacity;
}

void EventBus::close()
{
    {
        auto lock = std::lock_guard(_state->mutex);
        if (_state->closed)
            return;
        _state->closed = true;
    }
    _state->cv.notify_all();
    log::debug("EventBus: closed");
}

auto EventBus::isClosed() const -> bool
{
    auto lock = std::lock_guard(_state->mutex);
    return _state->closed;
}

} // namespace pagent
