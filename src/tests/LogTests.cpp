// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace pagent;

namespace
{
    /// Routes log output into a vector for the lifetime of the guard.
    class CapturedLog
    {
      public:
        explicit CapturedLog(log::Level level): _previousLevel(log::getLevel())
        {
            log::setLevel(level);
            log::setCallback([this](const log::Record& record) {
                lines.emplace_back(record.level, std::string(record.message));
                threads.emplace_back(record.thread);
            });
        }

        ~CapturedLog()
        {
            log::setCallback({});
            log::setLevel(_previousLevel);
        }

        std::vector<std::pair<log::Level, std::string>> lines;
        std::vector<std::string> threads;

      private:
        log::Level _previousLevel;
    };
} // namespace

TEST_CASE("levelFromString parses known names", "[log]")
{
    CHECK(log::levelFromString("error") == log::Level::Error);
    CHECK(log::levelFromString("warning") == log::Level::Warning);
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("info") == log::Level::Info);
    CHECK(log::levelFromString("debug") == log::Level::Debug);
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(!log::levelFromString("verbose").has_value());
}

TEST_CASE("Log callback receives formatted messages", "[log]")
{
    auto capture = CapturedLog(log::Level::Info);

    log::info("loaded {} profiles", 3);
    log::error("failed: {}", "disk full");

    REQUIRE(capture.lines.size() == 2);
    CHECK(capture.lines[0].first == log::Level::Info);
    CHECK(capture.lines[0].second == "loaded 3 profiles");
    CHECK(capture.lines[1].first == log::Level::Error);
    CHECK(capture.lines[1].second == "failed: disk full");
}

TEST_CASE("Messages above the current level are dropped", "[log]")
{
    auto capture = CapturedLog(log::Level::Warning);

    log::debug("hidden");
    log::info("hidden too");
    log::warning("shown");

    REQUIRE(capture.lines.size() == 1);
    CHECK(capture.lines[0].second == "shown");
}

TEST_CASE("Records carry the tag of the emitting thread", "[log]")
{
    auto capture = CapturedLog(log::Level::Info);

    log::info("untagged");
    auto worker = std::jthread([] {
        log::setThreadTag("HistoryPresenter");
        log::info("tagged");
    });
    worker.join();

    REQUIRE(capture.lines.size() == 2);
    CHECK(capture.threads[0].empty());
    CHECK(capture.threads[1] == "HistoryPresenter");
    CHECK(log::threadTag().empty());
}

TEST_CASE("levelName is the inverse of levelFromString", "[log]")
{
    for (auto const level: { log::Level::Error, log::Level::Warning, log::Level::Info, log::Level::Debug, log::Level::Trace })
        CHECK(log::levelFromString(log::levelName(level)) == level);
}
