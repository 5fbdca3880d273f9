// SPDX-License-Identifier: Apache-2.0
#include "UiBridge.hpp"

#include <core/Log.hpp>

namespace pagent
{

UiBridge::UiBridge(Sender<UserEvent> userEvents, Receiver<ViewCommand> viewCommands):
    _userEvents(std::move(userEvents)), _viewCommands(std::move(viewCommands))
{
}

auto UiBridge::emit(UserEvent event) -> bool
{
    auto const name = eventName(AppEvent { event });
    auto const result = _userEvents.trySend(std::move(event));
    if (result)
        return true;

    switch (result.error())
    {
        case TrySendError::Full: log::warning("UiBridge: user event queue full, dropping {}", name); break;
        case TrySendError::Disconnected: log::warning("UiBridge: runtime disconnected, dropping {}", name); break;
    }
    return false;
}

auto UiBridge::drainCommands() -> std::vector<ViewCommand>
{
    auto commands = std::vector<ViewCommand> {};
    while (auto command = _viewCommands.tryReceive())
        commands.push_back(std::move(*command));
    return commands;
}

auto UiBridge::hasPendingCommands() const -> bool
{
    return !_viewCommands.empty();
}

void UiBridge::disconnect()
{
    _userEvents.reset();
}

auto makeBridge(std::size_t userEventCapacity, std::size_t viewCommandCapacity, Notifier notifier) -> BridgeChannels
{
    auto [userSender, userReceiver] = makeChannel<UserEvent>(userEventCapacity);
    auto [commandSender, commandReceiver] = makeChannel<ViewCommand>(viewCommandCapacity);

    return BridgeChannels {
        .ui = UiBridge(std::move(userSender), std::move(commandReceiver)),
        .sink = ViewCommandSink(std::move(commandSender), std::move(notifier)),
        .userEvents = std::move(userReceiver),
    };
}

} // namespace pagent
