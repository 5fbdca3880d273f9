// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <pagent/App.hpp>
#include <pagent/Config.hpp>

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>

int main(int argc, char** argv)
{
    auto app = CLI::App { "pagent - personal AI agent desktop shell (console front end)" };

    auto configPath = std::string {};
    auto scriptPath = std::string {};
    auto busCapacity = std::size_t { 0 };
    auto logLevel = std::string {};
    auto verbose = false;
    auto showThinking = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-s,--script", scriptPath, "Read commands from a file instead of stdin");
    app.add_option("--bus-capacity", busCapacity, "Event bus ring capacity per subscriber");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--thinking", showThinking, "Show reasoning output on startup");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        pagent::log::setLevel(pagent::log::Level::Debug);

    auto configResult = configPath.empty() ? pagent::loadConfig() : pagent::loadConfigFromFile(configPath);
    if (!configResult)
    {
        pagent::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (busCapacity > 0)
        config.bus.capacity = busCapacity;
    if (!logLevel.empty())
        config.log.level = logLevel;
    else if (verbose)
        config.log.level = "debug";
    if (showThinking)
        config.ui.showThinking = true;

    auto application = pagent::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        pagent::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    if (scriptPath.empty())
        return application.run(std::cin, pagent::InputMode::Interactive);

    auto script = std::ifstream(scriptPath);
    if (!script)
    {
        pagent::log::error("Cannot open script file: {}", scriptPath);
        return 1;
    }
    return application.run(script, pagent::InputMode::Script);
}
