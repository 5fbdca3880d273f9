// SPDX-License-Identifier: Apache-2.0
#include <core/Channel.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace pagent;

TEST_CASE("Channel delivers values in FIFO order", "[channel]")
{
    auto [sender, receiver] = makeChannel<int>(8);

    for (auto i = 1; i <= 3; ++i)
        REQUIRE(sender.trySend(i).has_value());

    CHECK(receiver.size() == 3);
    CHECK(receiver.tryReceive().value() == 1);
    CHECK(receiver.tryReceive().value() == 2);
    CHECK(receiver.tryReceive().value() == 3);
    CHECK(receiver.tryReceive().error() == TryReceiveError::Empty);
}

TEST_CASE("Channel rejects values beyond its capacity", "[channel]")
{
    auto [sender, receiver] = makeChannel<std::string>(2);

    REQUIRE(sender.trySend("a").has_value());
    REQUIRE(sender.trySend("b").has_value());

    auto const overflow = sender.trySend("c");
    REQUIRE(!overflow);
    CHECK(overflow.error() == TrySendError::Full);

    CHECK(receiver.tryReceive().value() == "a");
    CHECK(sender.trySend("c").has_value());
}

TEST_CASE("Channel with zero capacity holds one value", "[channel]")
{
    auto [sender, receiver] = makeChannel<int>(0);

    CHECK(sender.trySend(1).has_value());
    CHECK(sender.trySend(2).error() == TrySendError::Full);
}

TEST_CASE("Receiver sees Disconnected once every sender is gone and the queue is drained", "[channel]")
{
    auto [sender, receiver] = makeChannel<int>(4);
    auto copy = sender;

    REQUIRE(sender.trySend(7).has_value());
    sender.reset();
    CHECK(receiver.tryReceive().value() == 7);
    CHECK(receiver.tryReceive().error() == TryReceiveError::Empty);

    copy.reset();
    CHECK(receiver.tryReceive().error() == TryReceiveError::Disconnected);
}

TEST_CASE("Sender sees Disconnected once the receiver is gone", "[channel]")
{
    auto [sender, receiver] = makeChannel<int>(4);
    CHECK(!sender.isClosed());

    receiver.reset();
    CHECK(sender.isClosed());
    CHECK(sender.trySend(1).error() == TrySendError::Disconnected);
}

TEST_CASE("Blocking receive wakes up for a value sent from another thread", "[channel]")
{
    auto [sender, receiver] = makeChannel<int>(4);

    auto producer = std::jthread([s = std::move(sender)]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds { 10 });
        (void) s.trySend(42);
    });

    auto value = receiver.receive(std::stop_token {});
    REQUIRE(value.has_value());
    CHECK(*value == 42);

    // The producer dropped its sender on exit.
    producer.join();
    CHECK(!receiver.receive(std::stop_token {}).has_value());
}

TEST_CASE("Blocking receive returns when a stop is requested", "[channel]")
{
    auto [sender, receiver] = makeChannel<int>(4);
    auto source = std::stop_source {};

    auto stopper = std::jthread([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds { 10 });
        source.request_stop();
    });

    CHECK(!receiver.receive(source.get_token()).has_value());
}
