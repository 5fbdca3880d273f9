// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace pagent
{

namespace
{

    auto getSizeOr(const nlohmann::json& obj, std::string_view key, std::size_t defaultValue) -> Result<std::size_t>
    {
        auto const keyStr = std::string(key);
        if (!obj.contains(keyStr))
            return defaultValue;
        if (!obj[keyStr].is_number_integer() || obj[keyStr].get<long long>() < 1)
            return makeError(ErrorCode::ConfigError, std::format("'{}' must be a positive integer", key));
        return obj[keyStr].get<std::size_t>();
    }

    auto parseProfile(const nlohmann::json& item) -> ProfileSeed
    {
        auto profile = ProfileSeed {
            .name = json::getStringOr(item, "name", ""),
            .providerId = json::getStringOr(item, "provider", ""),
            .modelId = json::getStringOr(item, "model", ""),
            .baseUrl = json::getStringOr(item, "baseUrl", ""),
            .systemPrompt = json::getStringOr(item, "systemPrompt", ""),
            .parameters = {},
            .isDefault = json::getBoolOr(item, "default", false),
        };
        profile.parameters.temperature = json::getDoubleOr(item, "temperature", profile.parameters.temperature);
        profile.parameters.maxTokens = json::getIntOr(item, "maxTokens", profile.parameters.maxTokens);
        profile.parameters.showThinking = json::getBoolOr(item, "showThinking", profile.parameters.showThinking);
        return profile;
    }

    auto parseModel(const nlohmann::json& item) -> ModelInfo
    {
        auto const contextLength = json::getIntOr(item, "contextLength", 0);
        return ModelInfo {
            .providerId = json::getStringOr(item, "provider", ""),
            .modelId = json::getStringOr(item, "id", ""),
            .name = json::getStringOr(item, "name", ""),
            .contextLength = contextLength > 0 ? static_cast<std::uint32_t>(contextLength) : 0U,
            .supportsTools = json::getBoolOr(item, "supportsTools", false),
            .supportsReasoning = json::getBoolOr(item, "supportsReasoning", false),
        };
    }

    auto parseRegistryEntry(const nlohmann::json& item) -> McpRegistryEntry
    {
        return McpRegistryEntry {
            .name = json::getStringOr(item, "name", ""),
            .displayName = json::getStringOr(item, "displayName", ""),
            .description = json::getStringOr(item, "description", ""),
            .command = json::getStringOr(item, "command", ""),
            .args = json::getStringList(item, "args"),
            .tags = json::getStringList(item, "tags"),
            .trending = json::getBoolOr(item, "trending", false),
        };
    }

    auto toJson(const std::vector<std::string>& values) -> nlohmann::json
    {
        auto array = nlohmann::json::array();
        for (auto const& value: values)
            array.push_back(value);
        return array;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\pagent";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/pagent";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/pagent";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/pagent";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    if (config.bus.capacity == 0)
        return makeError(ErrorCode::ConfigError, "bus.capacity must be positive");
    if (config.bridge.userEventCapacity == 0 || config.bridge.viewCommandCapacity == 0)
        return makeError(ErrorCode::ConfigError, "bridge capacities must be positive");
    if (config.ui.tickIntervalMs <= 0)
        return makeError(ErrorCode::ConfigError, "ui.tickIntervalMs must be positive");
    if (!log::levelFromString(config.log.level))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", config.log.level));

    auto defaults = 0;
    for (auto const& profile: config.profiles)
    {
        if (profile.name.empty())
            return makeError(ErrorCode::ConfigError, "Every profile needs a name");
        if (profile.isDefault)
            ++defaults;
    }
    if (defaults > 1)
        return makeError(ErrorCode::ConfigError, "At most one profile may be marked as default");

    for (auto const& [name, server]: config.mcpServers)
    {
        if (server.command.empty())
            return makeError(ErrorCode::ConfigError, std::format("MCP server '{}' has no command", name));
    }
    return {};
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    // Bus section
    if (root.contains("bus"))
    {
        auto capacity = getSizeOr(root["bus"], "capacity", config.bus.capacity);
        if (!capacity)
            return std::unexpected(capacity.error());
        config.bus.capacity = *capacity;
    }

    // Bridge section
    if (root.contains("bridge"))
    {
        auto const& bridge = root["bridge"];
        auto userEvents = getSizeOr(bridge, "userEventCapacity", config.bridge.userEventCapacity);
        if (!userEvents)
            return std::unexpected(userEvents.error());
        auto viewCommands = getSizeOr(bridge, "viewCommandCapacity", config.bridge.viewCommandCapacity);
        if (!viewCommands)
            return std::unexpected(viewCommands.error());
        config.bridge.userEventCapacity = *userEvents;
        config.bridge.viewCommandCapacity = *viewCommands;
    }

    // Log section
    if (root.contains("log"))
        config.log.level = json::getStringOr(root["log"], "level", config.log.level);

    // UI section
    if (root.contains("ui"))
    {
        auto const& ui = root["ui"];
        config.ui.tickIntervalMs = json::getIntOr(ui, "tickIntervalMs", config.ui.tickIntervalMs);
        config.ui.showThinking = json::getBoolOr(ui, "showThinking", config.ui.showThinking);
    }

    // Profiles section
    if (root.contains("profiles") && root["profiles"].is_array())
    {
        for (auto const& item: root["profiles"])
        {
            if (item.is_object())
                config.profiles.push_back(parseProfile(item));
        }
    }

    // Model catalog section
    if (root.contains("models") && root["models"].is_array())
    {
        for (auto const& item: root["models"])
        {
            if (item.is_object())
                config.models.push_back(parseModel(item));
        }
    }

    // MCP servers section
    if (root.contains("mcpServers") && root["mcpServers"].is_object())
    {
        for (auto const& [name, serverJson]: root["mcpServers"].items())
        {
            auto server = McpServerSeed {
                .command = json::getStringOr(serverJson, "command", ""),
                .args = json::getStringList(serverJson, "args"),
                .env = {},
                .enabled = json::getBoolOr(serverJson, "enabled", true),
                .tools = json::getStringList(serverJson, "tools"),
            };

            if (serverJson.contains("env") && serverJson["env"].is_object())
            {
                for (auto const& [key, value]: serverJson["env"].items())
                {
                    if (value.is_string())
                        server.env[key] = value.get<std::string>();
                }
            }

            config.mcpServers[name] = std::move(server);
        }
    }

    // MCP registry section
    if (root.contains("mcpRegistry") && root["mcpRegistry"].is_array())
    {
        for (auto const& item: root["mcpRegistry"])
        {
            if (item.is_object())
                config.mcpRegistry.push_back(parseRegistryEntry(item));
        }
    }

    if (auto valid = validateConfig(config); !valid)
        return std::unexpected(valid.error());

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));

    log::debug("Loaded config from {}", path);
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["bus"] = { { "capacity", config.bus.capacity } };
    root["bridge"] = {
        { "userEventCapacity", config.bridge.userEventCapacity },
        { "viewCommandCapacity", config.bridge.viewCommandCapacity },
    };
    root["log"] = { { "level", config.log.level } };
    root["ui"] = {
        { "tickIntervalMs", config.ui.tickIntervalMs },
        { "showThinking", config.ui.showThinking },
    };

    // Profiles section
    auto profiles = nlohmann::json::array();
    for (auto const& profile: config.profiles)
    {
        auto item = nlohmann::json::object();
        item["name"] = profile.name;
        item["provider"] = profile.providerId;
        item["model"] = profile.modelId;
        if (!profile.baseUrl.empty())
            item["baseUrl"] = profile.baseUrl;
        if (!profile.systemPrompt.empty())
            item["systemPrompt"] = profile.systemPrompt;
        item["temperature"] = profile.parameters.temperature;
        item["maxTokens"] = profile.parameters.maxTokens;
        item["showThinking"] = profile.parameters.showThinking;
        if (profile.isDefault)
            item["default"] = true;
        profiles.push_back(std::move(item));
    }
    root["profiles"] = std::move(profiles);

    // Model catalog section
    auto models = nlohmann::json::array();
    for (auto const& model: config.models)
    {
        models.push_back({
            { "provider", model.providerId },
            { "id", model.modelId },
            { "name", model.name },
            { "contextLength", model.contextLength },
            { "supportsTools", model.supportsTools },
            { "supportsReasoning", model.supportsReasoning },
        });
    }
    root["models"] = std::move(models);

    // MCP servers section
    if (!config.mcpServers.empty())
    {
        auto servers = nlohmann::json::object();
        for (auto const& [name, server]: config.mcpServers)
        {
            auto item = nlohmann::json::object();
            item["command"] = server.command;
            if (!server.args.empty())
                item["args"] = toJson(server.args);
            if (!server.env.empty())
            {
                auto env = nlohmann::json::object();
                for (auto const& [key, value]: server.env)
                    env[key] = value;
                item["env"] = std::move(env);
            }
            item["enabled"] = server.enabled;
            if (!server.tools.empty())
                item["tools"] = toJson(server.tools);
            servers[name] = std::move(item);
        }
        root["mcpServers"] = std::move(servers);
    }

    // MCP registry section
    if (!config.mcpRegistry.empty())
    {
        auto registry = nlohmann::json::array();
        for (auto const& entry: config.mcpRegistry)
        {
            registry.push_back({
                { "name", entry.name },
                { "displayName", entry.displayName },
                { "description", entry.description },
                { "command", entry.command },
                { "args", toJson(entry.args) },
                { "tags", toJson(entry.tags) },
                { "trending", entry.trending },
            });
        }
        root["mcpRegistry"] = std::move(registry);
    }

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace pagent
