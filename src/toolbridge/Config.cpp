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

namespace toolbridge
{

namespace
{

    auto readFile(std::string_view path) -> Result<std::string>
    {
        auto file = std::ifstream(std::string(path));
        if (!file.is_open())
            return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

        auto ss = std::stringstream {};
        ss << file.rdbuf();
        return ss.str();
    }

    auto parseProvider(std::string name, const nlohmann::json& serverJson) -> ProviderConfig
    {
        auto provider = ProviderConfig {
            .name = std::move(name),
            .command = json::getStringOr(serverJson, "command", ""),
            .args = {},
            .env = {},
        };

        if (serverJson.contains("args") && serverJson["args"].is_array())
        {
            for (const auto& arg: serverJson["args"])
            {
                if (arg.is_string())
                    provider.args.push_back(arg.get<std::string>());
            }
        }

        if (serverJson.contains("env") && serverJson["env"].is_object())
        {
            for (const auto& [key, value]: serverJson["env"].items())
            {
                if (value.is_string())
                    provider.env[key] = value.get<std::string>();
            }
        }

        return provider;
    }

    auto parseProviders(const nlohmann::ordered_json& root) -> std::vector<ProviderConfig>
    {
        auto providers = std::vector<ProviderConfig> {};
        if (!root.is_object() || !root.contains("mcpServers") || !root["mcpServers"].is_object())
            return providers;

        for (const auto& [name, serverJson]: root["mcpServers"].items())
            providers.push_back(parseProvider(name, nlohmann::json(serverJson)));
        return providers;
    }

    auto parseDocument(std::string_view path) -> Result<nlohmann::ordered_json>
    {
        return readFile(path).and_then([](const std::string& content) { return json::parseOrdered(content); });
    }

} // namespace

auto loadProviderConfigs(std::string_view path) -> std::vector<ProviderConfig>
{
    if (path.empty())
        return {};

    if (!std::filesystem::exists(path))
    {
        log::info("No mcp config file found at {}", path);
        return {};
    }

    auto root = parseDocument(path);
    if (!root)
    {
        log::error("Error reading mcp config file: {}", root.error().message);
        return {};
    }

    return parseProviders(*root);
}

auto loadConfigFromFile(std::string_view path) -> Result<BridgeConfig>
{
    auto config = BridgeConfig {};

    // An unusable document means no providers, never a fatal error.
    auto root = parseDocument(path);
    if (!root)
    {
        log::error("Error reading mcp config file: {}", root.error().message);
        return config;
    }
    if (!root->is_object())
    {
        log::error("Config file {} is not a JSON object", path);
        return config;
    }

    config.providers = parseProviders(*root);

    // Bridge section
    if (root->contains("bridge"))
    {
        auto const bridge = nlohmann::json((*root)["bridge"]);
        config.handshakeTimeoutMs = json::getIntOr(bridge, "handshakeTimeoutMs", config.handshakeTimeoutMs);
        config.callTimeoutMs = json::getIntOr(bridge, "callTimeoutMs", config.callTimeoutMs);
        config.shutdownGraceMs = json::getIntOr(bridge, "shutdownGraceMs", config.shutdownGraceMs);
        config.workerThreads = json::getIntOr(bridge, "workerThreads", config.workerThreads);
        config.protocolVersion = json::getStringOr(bridge, "protocolVersion", config.protocolVersion);
        config.clientName = json::getStringOr(bridge, "clientName", config.clientName);
        config.clientVersion = json::getStringOr(bridge, "clientVersion", config.clientVersion);
        config.logLevel = json::getStringOr(bridge, "logLevel", config.logLevel);
    }

    if (config.handshakeTimeoutMs <= 0 || config.callTimeoutMs <= 0 || config.shutdownGraceMs < 0
        || config.workerThreads < 0)
        return makeError(ErrorCode::ConfigError, "Timeouts must be positive and workerThreads must not be negative");

    if (!log::parseLevel(config.logLevel))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", config.logLevel));

    return config;
}

auto configPathFromEnvironment() -> std::string
{
    auto const* const value = std::getenv(std::string(ConfigPathVariable).c_str());
    return value ? std::string(value) : std::string {};
}

auto loadConfig() -> Result<BridgeConfig>
{
    auto const path = configPathFromEnvironment();
    if (path.empty())
        return BridgeConfig {};

    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return BridgeConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace toolbridge
