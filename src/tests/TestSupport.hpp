// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/UiBridge.hpp>
#include <events/EventBus.hpp>
#include <presentation/ViewCommand.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace pagent::test
{

using namespace std::chrono_literals;

inline constexpr auto DefaultTimeout = std::chrono::milliseconds { 2000 };

/// @brief Plays the UI side of the bridge: keeps every command presenters send.
class CommandCollector
{
  public:
    explicit CommandCollector(std::size_t capacity = 1024):
        _channels(makeBridge(64, capacity, [this] { ++_notifications; }))
    {
    }

    CommandCollector(const CommandCollector&) = delete;
    CommandCollector& operator=(const CommandCollector&) = delete;

    [[nodiscard]] auto sink() const -> const ViewCommandSink& { return _channels.sink; }
    [[nodiscard]] auto ui() -> UiBridge& { return _channels.ui; }
    [[nodiscard]] auto userEvents() -> Receiver<UserEvent>& { return _channels.userEvents; }
    [[nodiscard]] auto notifications() const -> std::size_t { return _notifications.load(); }

    auto drain() -> const std::vector<ViewCommand>&
    {
        for (auto& command: _channels.ui.drainCommands())
            _received.push_back(std::move(command));
        return _received;
    }

    /// @brief Drains until @p predicate holds for the received commands or the timeout expires.
    template <typename Predicate>
    auto waitUntil(Predicate predicate, std::chrono::milliseconds timeout = DefaultTimeout) -> bool
    {
        auto const deadline = std::chrono::steady_clock::now() + timeout;
        while (true)
        {
            drain();
            if (predicate())
                return true;
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(2ms);
        }
    }

    template <typename T>
    auto count() -> std::size_t
    {
        auto n = std::size_t { 0 };
        for (auto const& command: drain())
            n += command.is<T>() ? 1 : 0;
        return n;
    }

    template <typename T>
    auto waitFor(std::size_t n = 1, std::chrono::milliseconds timeout = DefaultTimeout) -> bool
    {
        return waitUntil([&] { return count<T>() >= n; }, timeout);
    }

    /// @brief Returns the most recent command of type @p T.
    template <typename T>
    auto last() -> std::optional<T>
    {
        auto const& commands = drain();
        for (auto it = commands.rbegin(); it != commands.rend(); ++it)
        {
            if (auto const* command = it->get<T>())
                return *command;
        }
        return std::nullopt;
    }

    /// @brief Position of the first command of type @p T, or std::nullopt.
    template <typename T>
    auto indexOf() -> std::optional<std::size_t>
    {
        auto const& commands = drain();
        for (auto i = std::size_t { 0 }; i < commands.size(); ++i)
        {
            if (commands[i].is<T>())
                return i;
        }
        return std::nullopt;
    }

    auto names() -> std::vector<std::string>
    {
        auto result = std::vector<std::string> {};
        for (auto const& command: drain())
            result.emplace_back(commandName(command));
        return result;
    }

    void clear()
    {
        drain();
        _received.clear();
    }

  private:
    std::atomic<std::size_t> _notifications = 0;
    BridgeChannels _channels;
    std::vector<ViewCommand> _received;
};

/// @brief Reads @p subscriber until an event of @p Category holding @p Alternative arrives.
template <typename Category, typename Alternative>
auto waitForEvent(Subscriber& subscriber, std::chrono::milliseconds timeout = DefaultTimeout)
    -> std::optional<Alternative>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return std::nullopt;

        auto result = subscriber.receiveFor(remaining);
        if (!result)
        {
            if (result.error().kind == RecvErrorKind::Lagged)
                continue;
            return std::nullopt;
        }
        if (auto const* category = std::get_if<Category>(&*result))
        {
            if (auto const* alternative = std::get_if<Alternative>(&category->value))
                return *alternative;
        }
    }
}

} // namespace pagent::test
