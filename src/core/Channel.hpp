// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace pagent
{

/// @brief Why a non-blocking send did not enqueue its value.
enum class TrySendError
{
    Full,
    Disconnected,
};

/// @brief Why a non-blocking receive produced no value.
enum class TryReceiveError
{
    Empty,
    Disconnected,
};

namespace detail
{
    template <typename T>
    struct ChannelState
    {
        explicit ChannelState(std::size_t cap): capacity(std::max<std::size_t>(cap, 1)) {}

        std::mutex mutex;
        std::condition_variable_any cv;
        std::deque<T> queue;
        std::size_t const capacity;
        std::size_t senders = 0;
        std::size_t receivers = 0;
    };
} // namespace detail

template <typename T>
class Receiver;

/// @brief Sending half of a bounded multi-producer multi-consumer channel.
///
/// Copies share the same channel. The channel counts as disconnected for receivers
/// once every Sender has been destroyed or reset.
template <typename T>
class Sender
{
  public:
    Sender() = default;

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state): _state(std::move(state))
    {
        attach();
    }

    Sender(const Sender& other): _state(other._state) { attach(); }
    Sender(Sender&& other) noexcept: _state(std::exchange(other._state, nullptr)) {}

    Sender& operator=(const Sender& other)
    {
        if (this != &other)
        {
            reset();
            _state = other._state;
            attach();
        }
        return *this;
    }

    Sender& operator=(Sender&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            _state = std::exchange(other._state, nullptr);
        }
        return *this;
    }

    ~Sender() { reset(); }

    /// @brief Enqueues a value without blocking.
    /// @return Full when the channel is at capacity, Disconnected when no receiver is left.
    ///         In both cases the value is dropped.
    auto trySend(T value) -> std::expected<void, TrySendError>
    {
        if (!_state)
            return std::unexpected(TrySendError::Disconnected);

        {
            auto lock = std::lock_guard(_state->mutex);
            if (_state->receivers == 0)
                return std::unexpected(TrySendError::Disconnected);
            if (_state->queue.size() >= _state->capacity)
                return std::unexpected(TrySendError::Full);
            _state->queue.push_back(std::move(value));
        }
        _state->cv.notify_one();
        return {};
    }

    /// @brief Returns true when every receiver is gone.
    [[nodiscard]] auto isClosed() const -> bool
    {
        if (!_state)
            return true;
        auto lock = std::lock_guard(_state->mutex);
        return _state->receivers == 0;
    }

    /// @brief Detaches this handle from the channel.
    void reset()
    {
        if (!_state)
            return;
        auto lastSender = false;
        {
            auto lock = std::lock_guard(_state->mutex);
            lastSender = --_state->senders == 0;
        }
        if (lastSender)
            _state->cv.notify_all();
        _state.reset();
    }

  private:
    void attach()
    {
        if (!_state)
            return;
        auto lock = std::lock_guard(_state->mutex);
        ++_state->senders;
    }

    std::shared_ptr<detail::ChannelState<T>> _state;
};

/// @brief Receiving half of a bounded multi-producer multi-consumer channel.
template <typename T>
class Receiver
{
  public:
    Receiver() = default;

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state): _state(std::move(state))
    {
        attach();
    }

    Receiver(const Receiver& other): _state(other._state) { attach(); }
    Receiver(Receiver&& other) noexcept: _state(std::exchange(other._state, nullptr)) {}

    Receiver& operator=(const Receiver& other)
    {
        if (this != &other)
        {
            reset();
            _state = other._state;
            attach();
        }
        return *this;
    }

    Receiver& operator=(Receiver&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            _state = std::exchange(other._state, nullptr);
        }
        return *this;
    }

    ~Receiver() { reset(); }

    /// @brief Dequeues the oldest value without blocking.
    auto tryReceive() -> std::expected<T, TryReceiveError>
    {
        if (!_state)
            return std::unexpected(TryReceiveError::Disconnected);

        auto lock = std::lock_guard(_state->mutex);
        if (_state->queue.empty())
        {
            if (_state->senders == 0)
                return std::unexpected(TryReceiveError::Disconnected);
            return std::unexpected(TryReceiveError::Empty);
        }
        auto value = std::move(_state->queue.front());
        _state->queue.pop_front();
        return value;
    }

    /// @brief Blocks until a value arrives.
    /// @return The value, or std::nullopt once all senders are gone and the queue is drained,
    ///         or when a stop is requested through @p stopToken.
    auto receive(std::stop_token stopToken) -> std::optional<T>
    {
        if (!_state)
            return std::nullopt;

        auto lock = std::unique_lock(_state->mutex);
        _state->cv.wait(lock, stopToken, [this] { return !_state->queue.empty() || _state->senders == 0; });

        if (_state->queue.empty())
            return std::nullopt;

        auto value = std::move(_state->queue.front());
        _state->queue.pop_front();
        return value;
    }

    /// @brief Returns true when no value is queued.
    [[nodiscard]] auto empty() const -> bool
    {
        if (!_state)
            return true;
        auto lock = std::lock_guard(_state->mutex);
        return _state->queue.empty();
    }

    [[nodiscard]] auto size() const -> std::size_t
    {
        if (!_state)
            return 0;
        auto lock = std::lock_guard(_state->mutex);
        return _state->queue.size();
    }

    /// @brief Detaches this handle from the channel.
    void reset()
    {
        if (!_state)
            return;
        {
            auto lock = std::lock_guard(_state->mutex);
            --_state->receivers;
        }
        _state.reset();
    }

  private:
    void attach()
    {
        if (!_state)
            return;
        auto lock = std::lock_guard(_state->mutex);
        ++_state->receivers;
    }

    std::shared_ptr<detail::ChannelState<T>> _state;
};

/// @brief Creates a bounded channel.
/// @param capacity Maximum number of queued values; zero is treated as one.
template <typename T>
[[nodiscard]] auto makeChannel(std::size_t capacity) -> std::pair<Sender<T>, Receiver<T>>
{
    auto state = std::make_shared<detail::ChannelState<T>>(capacity);
    return { Sender<T>(state), Receiver<T>(state) };
}

} // namespace pagent
