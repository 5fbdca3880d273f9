// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace pagent
{

/// @brief Event bus configuration section.
struct BusConfig
{
    std::size_t capacity = 64;
};

/// @brief Capacities of the UI/runtime channel pair.
struct BridgeConfig
{
    std::size_t userEventCapacity = 64;
    std::size_t viewCommandCapacity = 256;
};

/// @brief Logging configuration section.
struct LogConfig
{
    std::string level = "info";
};

/// @brief UI loop configuration section.
struct UiConfig
{
    /// @brief Interval between two command drains of the console loop.
    int tickIntervalMs = 50;
    bool showThinking = false;
};

/// @brief A model profile created at startup.
struct ProfileSeed
{
    std::string name;
    std::string providerId;
    std::string modelId;
    std::string baseUrl;
    std::string systemPrompt;
    ModelParameters parameters;

    /// @brief Whether this profile becomes the default profile.
    bool isDefault = false;
};

/// @brief An MCP server registered at startup.
struct McpServerSeed
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled = true;

    /// @brief Names of the tools the server announces once running.
    std::vector<std::string> tools;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    BusConfig bus;
    BridgeConfig bridge;
    LogConfig log;
    UiConfig ui;
    std::vector<ProfileSeed> profiles;
    std::vector<ModelInfo> models;
    std::map<std::string, McpServerSeed> mcpServers;
    std::vector<McpRegistryEntry> mcpRegistry;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, the defaults when no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating parent directories.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Checks value ranges that the JSON schema cannot express.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/pagent or ~/.config/pagent
/// On macOS: ~/Library/Application Support/pagent
/// On Windows: %APPDATA%\pagent
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace pagent
