// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Name of the environment variable holding the config file path.
inline constexpr auto ConfigPathVariable = std::string_view { "MCP_CONFIG_PATH" };

/// @brief Top-level configuration: the providers plus the bridge tunables.
struct BridgeConfig
{
    /// @brief Providers in the order they appear in the file.
    std::vector<ProviderConfig> providers;

    int handshakeTimeoutMs = 10000;
    int callTimeoutMs = 30000;
    int shutdownGraceMs = 2000;

    /// @brief Worker threads; 0 selects a default based on the machine.
    int workerThreads = 0;

    std::string protocolVersion = "2025-03-26";
    std::string clientName = "toolbridge";
    std::string clientVersion = "1.0.0";
    std::string logLevel = "info";
};

/// @brief Reads the provider definitions of a config file.
///
/// An empty path, a missing file or an unparsable document yields an empty list; the
/// reason is logged.
[[nodiscard]] auto loadProviderConfigs(std::string_view path) -> std::vector<ProviderConfig>;

/// @brief Loads the complete configuration from a file.
///
/// A file that cannot be read or parsed is logged and yields the defaults with no providers.
/// @return The configuration, or a ConfigError if the `bridge` section holds invalid values.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<BridgeConfig>;

/// @brief Returns the value of MCP_CONFIG_PATH, or an empty string.
[[nodiscard]] auto configPathFromEnvironment() -> std::string;

/// @brief Loads the configuration named by MCP_CONFIG_PATH.
///
/// Returns the defaults when the variable is unset or the file does not exist.
[[nodiscard]] auto loadConfig() -> Result<BridgeConfig>;

} // namespace toolbridge
