// SPDX-License-Identifier: Apache-2.0
#include "PopoverController.hpp"

#include <core/Log.hpp>
#include <core/Overloaded.hpp>
#include <events/EventBus.hpp>

namespace pagent
{

PopoverController::PopoverController(PopoverHost& host, std::shared_ptr<EventBus> bus):
    _host(host), _bus(std::move(bus))
{
}

auto PopoverController::processPendingOperations() -> bool
{
    return _slot.drainAndApply([this](Operation operation) {
        std::visit(Overloaded {
                       [this](const Show& op) { show(op.anchor); },
                       [this](const Hide&) { hide(); },
                       [this](const Toggle& op) {
                           if (_host.isShown())
                               hide();
                           else
                               show(op.anchor);
                       },
                   },
                   operation);
    });
}

void PopoverController::show(PopoverAnchor anchor)
{
    if (_host.isShown())
        return;
    _host.show(anchor);
    announce(true);
}

void PopoverController::hide()
{
    if (!_host.isShown())
        return;
    _host.close();
    announce(false);
}

void PopoverController::announce(bool shown)
{
    auto event = shown ? SystemEvent { SystemEvent::PopoverShown {} } : SystemEvent { SystemEvent::PopoverHidden {} };
    if (auto published = _bus->publish(std::move(event)); !published)
        log::debug("Popover: {} not published: {}", shown ? "shown" : "hidden", publishErrorToString(published.error()));
}

} // namespace pagent
