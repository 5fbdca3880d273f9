// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <bridge/UserEventForwarder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>

using namespace pagent;
using namespace pagent::test;

namespace
{
    auto notification(std::string message) -> ViewCommand
    {
        return ViewCommand { ViewCommand::ShowNotification { .message = std::move(message) } };
    }
} // namespace

TEST_CASE("ViewCommandSink delivers commands to the UI in order", "[bridge]")
{
    auto collector = CommandCollector(8);
    auto sink = collector.sink();

    CHECK(sink.send(notification("one")));
    CHECK(sink.send(ViewCommand { ViewCommand::ClearError {} }));
    CHECK(sink.send(notification("two")));

    CHECK(collector.ui().hasPendingCommands());
    auto const names = collector.names();
    REQUIRE(names.size() == 3);
    CHECK(names[0] == "ShowNotification");
    CHECK(names[1] == "ClearError");
    CHECK(names[2] == "ShowNotification");
    CHECK(!collector.ui().hasPendingCommands());
    CHECK(collector.notifications() == 3);
}

TEST_CASE("ViewCommandSink drops commands when the UI queue is full but still notifies", "[bridge]")
{
    auto collector = CommandCollector(2);
    auto sink = collector.sink();

    CHECK(sink.send(notification("1")));
    CHECK(sink.send(notification("2")));
    CHECK(!sink.send(notification("3")));
    CHECK(collector.notifications() == 3);

    auto const commands = collector.drain();
    REQUIRE(commands.size() == 2);
    CHECK(commands[1].get<ViewCommand::ShowNotification>()->message == "2");
}

TEST_CASE("ViewCommandSink drops commands silently once the UI is gone", "[bridge]")
{
    auto notified = 0;
    auto sink = std::optional<ViewCommandSink> {};
    {
        auto channels = makeBridge(4, 4, [&notified] { ++notified; });
        sink.emplace(channels.sink);
    }

    CHECK(!sink->send(notification("nobody listens")));
    CHECK(notified == 0);
}

TEST_CASE("UiBridge::emit fails once the runtime side is gone", "[bridge]")
{
    auto channels = makeBridge(4, 4, {});
    CHECK(channels.ui.emit(UserEvent { UserEvent::RefreshHistory {} }));

    channels.userEvents.reset();
    CHECK(!channels.ui.emit(UserEvent { UserEvent::RefreshHistory {} }));
}

TEST_CASE("UiBridge::emit fails when the user event queue is full", "[bridge]")
{
    auto channels = makeBridge(1, 4, {});
    CHECK(channels.ui.emit(UserEvent { UserEvent::RefreshHistory {} }));
    CHECK(!channels.ui.emit(UserEvent { UserEvent::RefreshHistory {} }));
}

TEST_CASE("UserEventForwarder republishes user events on the bus in order", "[bridge]")
{
    auto bus = std::make_shared<EventBus>(16);
    auto subscriber = bus->subscribe();
    auto channels = makeBridge(16, 16, {});
    auto forwarder = UserEventForwarder(std::move(channels.userEvents), bus);
    forwarder.start();

    REQUIRE(channels.ui.emit(UserEvent { UserEvent::SendMessage { .text = "first" } }));
    REQUIRE(channels.ui.emit(UserEvent { UserEvent::SendMessage { .text = "second" } }));

    auto const first = waitForEvent<UserEvent, UserEvent::SendMessage>(subscriber);
    auto const second = waitForEvent<UserEvent, UserEvent::SendMessage>(subscriber);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->text == "first");
    CHECK(second->text == "second");

    channels.ui.disconnect();
    forwarder.join();
    CHECK(!forwarder.isRunning());
}

TEST_CASE("UserEventForwarder drains queued events before exiting", "[bridge]")
{
    auto bus = std::make_shared<EventBus>(16);
    auto subscriber = bus->subscribe();
    auto channels = makeBridge(16, 16, {});

    REQUIRE(channels.ui.emit(UserEvent { UserEvent::NewConversation {} }));
    channels.ui.disconnect();

    auto forwarder = UserEventForwarder(std::move(channels.userEvents), bus);
    forwarder.start();
    forwarder.join();

    CHECK(waitForEvent<UserEvent, UserEvent::NewConversation>(subscriber, 100ms).has_value());
}
