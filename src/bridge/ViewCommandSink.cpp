// SPDX-License-Identifier: Apache-2.0
#include "ViewCommandSink.hpp"

#include <core/Log.hpp>

namespace pagent
{

ViewCommandSink::ViewCommandSink(Sender<ViewCommand> sender, Notifier notifier):
    _sender(std::move(sender)), _notifier(std::move(notifier))
{
}

auto ViewCommandSink::send(ViewCommand command) -> bool
{
    auto const name = commandName(command);
    auto const result = _sender.trySend(std::move(command));
    if (!result && result.error() == TrySendError::Disconnected)
    {
        log::debug("ViewCommandSink: UI gone, dropping {}", name);
        return false;
    }

    if (!result)
        log::warning("ViewCommandSink: command channel full, dropping {}", name);

    if (_notifier)
        _notifier();

    return result.has_value();
}

} // namespace pagent
