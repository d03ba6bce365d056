// SPDX-License-Identifier: Apache-2.0
#include <bridge/ToolBridge.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <toolbridge/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <print>

namespace
{

auto toBridgeOptions(const toolbridge::BridgeConfig& config) -> toolbridge::BridgeOptions
{
    return toolbridge::BridgeOptions {
        .handshake =
            toolbridge::HandshakeOptions {
                .protocolVersion = config.protocolVersion,
                .clientName = config.clientName,
                .clientVersion = config.clientVersion,
                .timeout = std::chrono::milliseconds(config.handshakeTimeoutMs),
            },
        .callTimeout = std::chrono::milliseconds(config.callTimeoutMs),
        .shutdownGrace = std::chrono::milliseconds(config.shutdownGraceMs),
        .workerThreads = static_cast<std::size_t>(config.workerThreads),
    };
}

void printTool(const toolbridge::ToolProxy& tool)
{
    std::println("  {}/{}: {}", tool.providerName(), tool.name(), tool.description());
    for (const auto& param: tool.parameters())
    {
        std::println("      {} ({}{}){}{}",
                     param.name,
                     toolbridge::parameterTypeToString(param.type),
                     param.required ? ", required" : "",
                     param.description.empty() ? "" : " ",
                     param.description);
    }
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "toolbridge: exposes stdio MCP tool providers as callable tools" };

    auto configPath = std::string {};
    auto group = false;
    auto callTarget = std::string {};
    auto callArgs = std::string { "{}" };
    auto callTimeoutMs = 0;
    auto handshakeTimeoutMs = 0;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file (defaults to $MCP_CONFIG_PATH)");
    app.add_flag("--group", group, "Print the tools grouped by provider");
    app.add_option("--call", callTarget, "Call a tool, given as <provider>/<tool>");
    app.add_option("--args", callArgs, "JSON object of arguments for --call");
    app.add_option("--call-timeout", callTimeoutMs, "Tool call timeout in milliseconds")->check(CLI::PositiveNumber);
    app.add_option("--handshake-timeout", handshakeTimeoutMs, "Handshake timeout in milliseconds")
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    auto configResult =
        configPath.empty() ? toolbridge::loadConfig() : toolbridge::loadConfigFromFile(configPath);
    if (!configResult)
    {
        toolbridge::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (callTimeoutMs > 0)
        config.callTimeoutMs = callTimeoutMs;
    if (handshakeTimeoutMs > 0)
        config.handshakeTimeoutMs = handshakeTimeoutMs;

    if (verbose)
        toolbridge::log::setLevel(toolbridge::log::Level::Debug);
    else if (auto const level = toolbridge::log::parseLevel(config.logLevel))
        toolbridge::log::setLevel(*level);

    auto arguments = toolbridge::json::parse(callArgs, toolbridge::ErrorCode::InvalidArgument);
    if (!callTarget.empty() && (!arguments || !arguments->is_object()))
    {
        toolbridge::log::error("--args must be a JSON object");
        return 1;
    }

    if (config.providers.empty())
        toolbridge::log::warning("No MCP servers configured");

    auto bridge = toolbridge::ToolBridge(toBridgeOptions(config));

    if (group)
    {
        for (const auto& [provider, tools]: bridge.loadGrouped(config.providers))
        {
            std::println("{} ({} tools)", provider, tools.size());
            for (const auto& tool: tools)
                printTool(tool);
        }
    }
    else
    {
        for (const auto& tool: bridge.loadFlat(config.providers))
            printTool(tool);
    }

    for (const auto& status: bridge.status())
    {
        if (status.lastError)
            toolbridge::log::warning("{} is {}: {}",
                                     status.name,
                                     toolbridge::processStateToString(status.state),
                                     status.lastError->message);
    }

    if (callTarget.empty())
        return 0;

    auto const slash = callTarget.find('/');
    if (slash == std::string::npos)
    {
        toolbridge::log::error("--call expects <provider>/<tool>, got '{}'", callTarget);
        return 1;
    }

    auto const tool = bridge.findTool(callTarget.substr(0, slash), callTarget.substr(slash + 1));
    if (!tool)
    {
        toolbridge::log::error("Tool '{}' not found", callTarget);
        return 1;
    }

    std::println("{}", tool->invoke(*arguments));
    return 0;
}
