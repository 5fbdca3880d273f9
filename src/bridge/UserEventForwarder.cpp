// SPDX-License-Identifier: Apache-2.0
#include "UserEventForwarder.hpp"

#include <core/Log.hpp>
#include <events/EventBus.hpp>

namespace pagent
{

UserEventForwarder::UserEventForwarder(Receiver<UserEvent> userEvents, std::shared_ptr<EventBus> bus):
    _userEvents(std::move(userEvents)), _bus(std::move(bus))
{
}

UserEventForwarder::~UserEventForwarder()
{
    if (_worker.joinable())
    {
        _worker.request_stop();
        _worker.join();
    }
}

void UserEventForwarder::start()
{
    if (_running.exchange(true))
        return;
    _worker = std::jthread([this](std::stop_token stopToken) { run(stopToken); });
}

void UserEventForwarder::join()
{
    if (_worker.joinable())
        _worker.join();
}

auto UserEventForwarder::isRunning() const -> bool
{
    return _running.load();
}

void UserEventForwarder::run(const std::stop_token& stopToken)
{
    log::setThreadTag("UserEventForwarder");
    log::debug("started");
    while (auto event = _userEvents.receive(stopToken))
    {
        auto appEvent = AppEvent { std::move(*event) };
        auto const name = eventName(appEvent);
        if (auto const published = _bus->publish(std::move(appEvent)); !published)
            log::debug("{} not delivered ({})", name, publishErrorToString(published.error()));
    }
    _running = false;
    log::debug("stopped");
}

} // namespace pagent
