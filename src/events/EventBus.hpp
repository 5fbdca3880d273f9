// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <events/AppEvent.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>
#include <string_view>

namespace pagent
{

/// @brief Why EventBus::publish() did not deliver an event.
enum class PublishError
{
    /// No subscriber was registered; the event was discarded. Usually benign.
    NoSubscribers,
    /// The bus was closed.
    Closed,
};

/// @brief Outcome categories of a failed receive on a Subscriber.
enum class RecvErrorKind
{
    /// The subscriber fell behind by more than the bus capacity; `skipped` events were lost.
    Lagged,
    /// The bus is closed and every buffered event has been consumed.
    Closed,
    /// Non-blocking receive found nothing to read.
    Empty,
    /// Timed receive expired before an event arrived.
    Timeout,
};

struct RecvError
{
    RecvErrorKind kind = RecvErrorKind::Closed;
    std::uint64_t skipped = 0;
};

using RecvResult = std::expected<AppEvent, RecvError>;

[[nodiscard]] auto publishErrorToString(PublishError error) -> std::string_view;

namespace detail
{
    struct BusState;
}

/// @brief Independent, ordered view of the events published after it was created.
///
/// A Subscriber that stops reading never blocks publishers. Once more than the bus
/// capacity of unread events accumulated, the oldest ones are overwritten and the next
/// receive reports RecvErrorKind::Lagged with the exact number of skipped events, after
/// which reading resumes at the oldest retained event.
class Subscriber
{
  public:
    Subscriber() = default;
    explicit Subscriber(std::shared_ptr<detail::BusState> state);
    ~Subscriber();

    Subscriber(Subscriber&& other) noexcept;
    Subscriber& operator=(Subscriber&& other) noexcept;
    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    /// @brief Blocks until an event is available, the subscriber lagged, or the bus is closed.
    /// @param stopToken When stop is requested the call returns RecvErrorKind::Closed.
    [[nodiscard]] auto receive(std::stop_token stopToken = {}) -> RecvResult;

    /// @brief Returns immediately, with RecvErrorKind::Empty when nothing is pending.
    [[nodiscard]] auto tryReceive() -> RecvResult;

    /// @brief Blocks for at most @p timeout, returning RecvErrorKind::Timeout when it expires.
    [[nodiscard]] auto receiveFor(std::chrono::milliseconds timeout) -> RecvResult;

  private:
    void detach();

    std::shared_ptr<detail::BusState> _state;
    std::uint64_t _cursor = 0;
};

/// @brief Capacity-bounded broadcast channel of AppEvents.
///
/// Every live Subscriber receives each event published after its creation, in publish
/// order. Publishing never blocks.
class EventBus
{
  public:
    static constexpr std::size_t DefaultCapacity = 16;

    explicit EventBus(std::size_t capacity = DefaultCapacity);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// @brief Registers a new subscriber. No previously published event is replayed.
    [[nodiscard]] auto subscribe() -> Subscriber;

    /// @brief Delivers @p event to all registered subscribers.
    /// @return The number of subscribers at publish time, or PublishError::NoSubscribers
    ///         when there were none (the event is then discarded).
    auto publish(AppEvent event) -> std::expected<std::size_t, PublishError>;

    [[nodiscard]] auto subscriberCount() const -> std::size_t;
    [[nodiscard]] auto capacity() const noexcept -> std::size_t;

    /// @brief Closes the bus. Subscribers drain what is buffered, then receive Closed.
    void close();

    [[nodiscard]] auto isClosed() const -> bool;

  private:
    std::shared_ptr<detail::BusState> _state;
};

} // namespace pagent
