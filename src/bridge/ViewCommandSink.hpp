// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <presentation/ViewCommand.hpp>

#include <functional>

namespace pagent
{

/// @brief Wakes the UI render loop so it drains pending commands on its next tick.
using Notifier = std::function<void()>;

/// @brief Presenter-side end of the ViewCommand channel.
///
/// Copies share the same channel and notifier.
class ViewCommandSink
{
  public:
    ViewCommandSink(Sender<ViewCommand> sender, Notifier notifier);

    /// @brief Sends a command toward the UI without blocking.
    ///
    /// The notifier runs after every attempt while the UI side is alive, including when the
    /// channel was full and the command was dropped, so the UI drains the backlog. When the UI
    /// side is gone the command is dropped silently and the notifier is not invoked.
    /// @return True if the command was enqueued.
    auto send(ViewCommand command) -> bool;

  private:
    Sender<ViewCommand> _sender;
    Notifier _notifier;
};

} // namespace pagent
