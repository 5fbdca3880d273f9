// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <events/AppEvent.hpp>

#include <atomic>
#include <memory>
#include <thread>

namespace pagent
{

class EventBus;

/// @brief Republishes user events from the UI channel onto the EventBus as AppEvent::User.
///
/// Runs on its own thread and exits once every UiBridge sender is gone and the queue is drained.
class UserEventForwarder
{
  public:
    UserEventForwarder(Receiver<UserEvent> userEvents, std::shared_ptr<EventBus> bus);
    ~UserEventForwarder();

    UserEventForwarder(const UserEventForwarder&) = delete;
    UserEventForwarder& operator=(const UserEventForwarder&) = delete;

    void start();

    /// @brief Blocks until the forwarding thread has exited.
    void join();

    [[nodiscard]] auto isRunning() const -> bool;

  private:
    void run(const std::stop_token& stopToken);

    Receiver<UserEvent> _userEvents;
    std::shared_ptr<EventBus> _bus;
    std::atomic<bool> _running = false;
    std::jthread _worker;
};

} // namespace pagent
