// SPDX-License-Identifier: Apache-2.0
#include "InvocationRouter.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace toolbridge
{

namespace
{

    auto extractContent(const nlohmann::json& content) -> std::string
    {
        if (content.is_string())
            return content.get<std::string>();

        if (content.is_array())
        {
            auto text = std::string {};
            auto found = false;
            for (const auto& item: content)
            {
                if (!item.is_object() || json::getStringOr(item, "type", "") != "text")
                    continue;
                if (found)
                    text += '\n';
                text += json::getStringOr(item, "text", "");
                found = true;
            }
            if (found)
                return text;
        }

        return json::dump(content);
    }

} // namespace

InvocationRouter::InvocationRouter(ProviderRegistry& registry, WorkerPool& pool, std::chrono::milliseconds callTimeout):
    _registry(registry), _pool(pool), _callTimeout(callTimeout)
{
}

auto InvocationRouter::route(const ToolProxy& proxy, const nlohmann::json& explicitArgs) const -> Result<std::string>
{
    auto arguments = proxy.buildArguments(explicitArgs);
    if (!arguments)
        return std::unexpected(arguments.error());

    auto const process = _registry.findProcess(proxy.providerName());
    if (!process)
        return makeError(ErrorCode::UnknownProvider, proxy.providerName());

    if (auto const state = process->state(); state != ProcessState::Ready)
    {
        return makeError(ErrorCode::TransportError,
                         std::format("Provider '{}' is {}", proxy.providerName(), processStateToString(state)));
    }

    log::debug("[{}] Calling tool '{}' with {}", proxy.providerName(), proxy.name(), json::dump(*arguments));

    auto result = process->callTool(proxy.name(), *arguments, _callTimeout);
    if (!result)
    {
        log::warning("[{}] Tool '{}' failed: {}", proxy.providerName(), proxy.name(), result.error());
        return std::unexpected(result.error());
    }

    return extractText(*result);
}

auto InvocationRouter::invoke(const ToolProxy& proxy, const nlohmann::json& explicitArgs) const -> std::string
{
    auto result = route(proxy, explicitArgs);
    if (!result)
        return describe(result.error());
    return std::move(*result);
}

auto InvocationRouter::invokeAsync(const ToolProxy& proxy, const nlohmann::json& explicitArgs) const
    -> std::future<std::string>
{
    return _pool.submit([this, proxy, explicitArgs]() { return invoke(proxy, explicitArgs); });
}

auto InvocationRouter::describe(const Error& error) -> std::string
{
    switch (error.code)
    {
        case ErrorCode::UnknownProvider: return std::format("Error: MCP process '{}' not found", error.message);
        case ErrorCode::InvocationTimeout: return "Error: Tool execution timed out";
        case ErrorCode::RemoteToolError: return std::format("Error: {}", error.message);
        case ErrorCode::InvalidArgument: return std::format("Error: invalid arguments: {}", error.message);
        default: return std::format("Error executing tool: {}", error.message);
    }
}

auto InvocationRouter::extractText(const nlohmann::json& result) -> std::string
{
    if (result.is_object())
    {
        if (result.contains("content"))
            return extractContent(result["content"]);
        return json::dump(result);
    }

    if (result.is_string())
        return result.get<std::string>();

    return json::dump(result);
}

} // namespace toolbridge
