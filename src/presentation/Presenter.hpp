// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/ViewCommandSink.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <events/AppEvent.hpp>
#include <presentation/ViewCommand.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace pagent
{

class EventBus;
class Subscriber;

/// @brief Base class of all presenters.
///
/// A presenter subscribes to the EventBus and translates the events it cares about into
/// service calls and ViewCommands. Each running presenter owns exactly one worker thread
/// that processes events strictly in publish order.
///
/// Concrete presenters must call shutdown() from their destructor so the worker never
/// dispatches into a partially destroyed object.
class Presenter
{
  public:
    Presenter(std::string name, std::shared_ptr<EventBus> bus, ViewCommandSink sink);
    virtual ~Presenter();

    Presenter(const Presenter&) = delete;
    Presenter& operator=(const Presenter&) = delete;

    /// @brief Subscribes and starts the worker. Does nothing while already running.
    ///
    /// The subscription is registered before start() returns, so every event published
    /// afterwards is observed.
    void start();

    /// @brief Marks the presenter as stopped.
    ///
    /// The worker is not interrupted: it exits the next time it wakes up, without
    /// dispatching the event that woke it.
    void stop();

    [[nodiscard]] auto isRunning() const noexcept -> bool { return _running.load(std::memory_order_acquire); }
    [[nodiscard]] auto name() const noexcept -> std::string_view { return _name; }

  protected:
    /// @brief Handles one event. Unrecognized events must be ignored.
    virtual void handleEvent(const AppEvent& event) = 0;

    void send(ViewCommand command);
    void showError(std::string title, std::string message, ErrorSeverity severity = ErrorSeverity::Error);

    /// @brief Reports a failed service call as a single ShowError carrying the error text.
    void reportError(std::string title, std::string_view action, const Error& error);

    /// @brief Publishes a follow-up event for other presenters.
    void publish(AppEvent event);

    /// @brief Stops the worker and waits for it to exit.
    void shutdown();

  private:
    void run(const std::stop_token& stopToken, Subscriber subscriber);
    void dispatch(const AppEvent& event);

    std::string _name;
    std::shared_ptr<EventBus> _bus;
    ViewCommandSink _sink;
    std::atomic<bool> _running = false;
    std::jthread _worker;
};

} // namespace pagent
