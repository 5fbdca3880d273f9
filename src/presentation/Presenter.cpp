// SPDX-License-Identifier: Apache-2.0
#include "Presenter.hpp"

#include <core/Log.hpp>
#include <events/EventBus.hpp>

#include <exception>
#include <format>

namespace pagent
{

Presenter::Presenter(std::string name, std::shared_ptr<EventBus> bus, ViewCommandSink sink):
    _name(std::move(name)), _bus(std::move(bus)), _sink(std::move(sink))
{
}

Presenter::~Presenter()
{
    shutdown();
}

void Presenter::start()
{
    if (_running.exchange(true, std::memory_order_acq_rel))
        return;

    // A worker left over from a previous run may still be blocked in receive.
    if (_worker.joinable())
    {
        _worker.request_stop();
        _worker.join();
    }

    auto subscriber = _bus->subscribe();
    _worker = std::jthread([this, subscriber = std::move(subscriber)](std::stop_token stopToken) mutable {
        run(stopToken, std::move(subscriber));
    });
    log::debug("{}: started", _name);
}

void Presenter::stop()
{
    if (_running.exchange(false, std::memory_order_acq_rel))
        log::debug("{}: stop requested", _name);
}

void Presenter::shutdown()
{
    _running.store(false, std::memory_order_release);
    if (_worker.joinable())
    {
        _worker.request_stop();
        _worker.join();
    }
}

void Presenter::run(const std::stop_token& stopToken, Subscriber subscriber)
{
    log::setThreadTag(_name);
    while (true)
    {
        auto result = subscriber.receive(stopToken);
        if (stopToken.stop_requested() || !_running.load(std::memory_order_acquire))
            break;

        if (!result)
        {
            if (result.error().kind == RecvErrorKind::Lagged)
            {
                log::warning("lagged, skipped {} events", result.error().skipped);
                continue;
            }
            break;
        }

        dispatch(*result);
    }
    log::debug("worker exited");
}

void Presenter::dispatch(const AppEvent& event)
{
    log::trace("handling {}", eventName(event));
    try
    {
        handleEvent(event);
    }
    catch (const std::exception& e)
    {
        log::error("unhandled exception while handling {}: {}", eventName(event), e.what());
        showError(std::format("{} Failure", _name), e.what(), ErrorSeverity::Critical);
    }
}

void Presenter::send(ViewCommand command)
{
    _sink.send(std::move(command));
}

void Presenter::showError(std::string title, std::string message, ErrorSeverity severity)
{
    send(ViewCommand { ViewCommand::ShowError {
        .title = std::move(title), .message = std::move(message), .severity = severity } });
}

void Presenter::reportError(std::string title, std::string_view action, const Error& error)
{
    log::error("{} failed: {}", action, error);
    showError(std::move(title), std::format("{}: {}", action, error.message));
}

void Presenter::publish(AppEvent event)
{
    auto const name = eventName(event);
    if (auto const published = _bus->publish(std::move(event)); !published)
        log::debug("{} not delivered ({})", name, publishErrorToString(published.error()));
}

} // namespace pagent
