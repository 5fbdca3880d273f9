// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/ViewCommandSink.hpp>
#include <core/Channel.hpp>
#include <events/AppEvent.hpp>
#include <presentation/ViewCommand.hpp>

#include <cstddef>
#include <vector>

namespace pagent
{

/// @brief UI-side end of the bridge between the render loop and the presenter runtime.
///
/// Every member is non-blocking and meant to be called from the UI thread.
class UiBridge
{
  public:
    UiBridge(Sender<UserEvent> userEvents, Receiver<ViewCommand> viewCommands);

    /// @brief Queues a user action for the presenters.
    /// @return False when the queue is full or the runtime is gone; the event is then dropped.
    auto emit(UserEvent event) -> bool;

    /// @brief Removes and returns every pending command in FIFO order.
    [[nodiscard]] auto drainCommands() -> std::vector<ViewCommand>;

    [[nodiscard]] auto hasPendingCommands() const -> bool;

    /// @brief Closes the user event direction; the forwarder exits once it has drained.
    void disconnect();

  private:
    Sender<UserEvent> _userEvents;
    Receiver<ViewCommand> _viewCommands;
};

/// @brief Everything the two sides of the bridge need.
struct BridgeChannels
{
    UiBridge ui;
    ViewCommandSink sink;
    Receiver<UserEvent> userEvents;
};

/// @brief Creates the user event and view command channels.
/// @param userEventCapacity Bound of the UI to runtime queue.
/// @param viewCommandCapacity Bound of the runtime to UI queue.
/// @param notifier Invoked by the sink after each send attempt.
[[nodiscard]] auto makeBridge(std::size_t userEventCapacity, std::size_t viewCommandCapacity, Notifier notifier)
    -> BridgeChannels;

} // namespace pagent
