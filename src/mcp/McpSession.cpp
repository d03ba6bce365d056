// SPDX-License-Identifier: Apache-2.0
#include "McpSession.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ToolSchema.hpp>

#include <algorithm>
#include <format>
#include <set>

namespace toolbridge
{

namespace
{
    constexpr auto MethodNotFound = -32601;

    auto trimmed(std::string text) -> std::string
    {
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
            text.pop_back();
        return text;
    }
} // namespace

McpSession::McpSession(std::unique_ptr<Transport> transport, std::string providerName):
    _transport(std::move(transport)), _providerName(std::move(providerName))
{
}

McpSession::~McpSession() = default;

auto McpSession::handshake(const HandshakeOptions& options) -> Result<std::vector<ToolDescriptor>>
{
    return initialize(options).and_then(
        [&](const ServerInfo&) -> Result<std::vector<ToolDescriptor>> { return listTools(options.timeout); });
}

auto McpSession::initialize(const HandshakeOptions& options) -> Result<ServerInfo>
{
    auto params = nlohmann::json {
        { "protocolVersion", options.protocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", options.clientName },
              { "version", options.clientVersion },
          } },
    };

    if (auto sent = sendMessage(jsonrpc::makeRequest(InitializeRequestId, "initialize", std::move(params))); !sent)
        return handshakeError("initialize", sent.error());
    _step = HandshakeStep::SentInitialize;
    log::debug("[{}] Sent initialize (protocol {})", _providerName, options.protocolVersion);

    _step = HandshakeStep::AwaitingInitializeResponse;
    auto response = awaitResponse(InitializeRequestId, options.timeout);
    if (!response)
        return handshakeError("initialize", response.error());
    if (response->error)
    {
        return handshakeError(
            "initialize",
            Error { ErrorCode::RemoteToolError,
                    std::format("RPC error {}: {}", response->error->code, response->error->message) });
    }

    auto const result = response->result.value_or(nlohmann::json::object());
    auto const serverInfo = result.is_object() ? result.value("serverInfo", nlohmann::json::object())
                                               : nlohmann::json::object();
    _serverInfo = ServerInfo {
        .name = json::getStringOr(serverInfo, "name", "unknown"),
        .version = json::getStringOr(serverInfo, "version", "unknown"),
        .protocolVersion = json::getStringOr(result, "protocolVersion", options.protocolVersion),
    };

    if (auto sent = sendMessage(jsonrpc::makeNotification("notifications/initialized")); !sent)
        return handshakeError("notifications/initialized", sent.error());
    _step = HandshakeStep::SentInitializedNotification;

    log::info("[{}] Session initialized: {} v{} (protocol {})",
              _providerName,
              _serverInfo.name,
              _serverInfo.version,
              _serverInfo.protocolVersion);
    return _serverInfo;
}

auto McpSession::listTools(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDescriptor>>
{
    if (!isInitialized())
        return makeError(ErrorCode::HandshakeFailure, "Session not initialized");

    if (auto sent = sendMessage(jsonrpc::makeRequest(ToolsListRequestId, "tools/list")); !sent)
        return handshakeError("tools/list", sent.error());
    _step = HandshakeStep::SentToolsList;

    _step = HandshakeStep::AwaitingToolsResponse;
    auto response = awaitResponse(ToolsListRequestId, timeout);
    if (!response)
        return handshakeError("tools/list", response.error());

    auto tools = std::vector<ToolDescriptor> {};
    auto const& result = response->result;

    if (!result || !result->is_object() || !result->contains("tools") || !(*result)["tools"].is_array())
    {
        auto const received = response->error ? json::dump(response->error->raw)
                                               : json::dump(result.value_or(nlohmann::json {}));
        log::warning("[{}] No tools found in tools/list response: {}", _providerName, received);
        _step = HandshakeStep::Ready;
        return tools;
    }

    auto seen = std::set<std::string> {};
    for (const auto& entry: (*result)["tools"])
    {
        auto descriptor = parseToolDescriptor(entry);
        if (!descriptor)
        {
            log::warning("[{}] Skipping tool: {}", _providerName, descriptor.error().message);
            continue;
        }
        if (!seen.insert(descriptor->name).second)
        {
            log::warning("[{}] Skipping duplicate tool '{}'", _providerName, descriptor->name);
            continue;
        }
        tools.push_back(std::move(*descriptor));
    }

    auto names = std::string {};
    for (const auto& tool: tools)
        names += names.empty() ? tool.name : ", " + tool.name;
    log::info("[{}] Found {} tools: [{}]", _providerName, tools.size(), names);

    _step = HandshakeStep::Ready;
    return tools;
}

auto McpSession::callTool(std::string_view name, const nlohmann::json& arguments, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    if (step() != HandshakeStep::Ready)
        return makeError(ErrorCode::TransportError,
                         std::format("Session is not ready ({})", handshakeStepToString(step())));

    auto const id = _nextCallId++;
    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    if (auto sent = sendMessage(jsonrpc::makeRequest(id, "tools/call", std::move(params))); !sent)
        return std::unexpected(sent.error());

    auto response = awaitResponse(id, timeout);
    if (!response)
    {
        if (response.error().code == ErrorCode::TimeoutError)
            return makeError(ErrorCode::InvocationTimeout,
                             std::format("Tool '{}' did not respond within {} ms", name, timeout.count()));
        // An undecodable line fails this call only; its reply, if any, is later dropped as stale.
        if (response.error().code == ErrorCode::MalformedMessage)
            return std::unexpected(response.error());
        return makeError(ErrorCode::TransportError, response.error().message);
    }

    if (response->error)
        return makeError(ErrorCode::RemoteToolError, json::dump(response->error->raw));

    return response->result.value_or(nlohmann::json {});
}

auto McpSession::step() const -> HandshakeStep
{
    return _step.load();
}

auto McpSession::serverInfo() const -> const ServerInfo&
{
    return _serverInfo;
}

auto McpSession::isInitialized() const -> bool
{
    switch (step())
    {
        case HandshakeStep::SentInitializedNotification:
        case HandshakeStep::SentToolsList:
        case HandshakeStep::AwaitingToolsResponse:
        case HandshakeStep::Ready: return true;
        default: return false;
    }
}

auto McpSession::transport() -> Transport&
{
    return *_transport;
}

void McpSession::close()
{
    _transport->close();
}

auto McpSession::sendMessage(const nlohmann::json& message) -> VoidResult
{
    auto const line = jsonrpc::encode(message);
    log::trace("[{}] -> {}", _providerName, std::string_view(line).substr(0, line.size() - 1));
    return _transport->send(line);
}

auto McpSession::awaitResponse(int64_t id, std::chrono::milliseconds timeout) -> Result<jsonrpc::Response>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        auto const remaining = std::max(std::chrono::duration_cast<std::chrono::milliseconds>(
                                            deadline - std::chrono::steady_clock::now()),
                                        std::chrono::milliseconds(0));

        auto line = _transport->receive(remaining);
        if (!line)
            return std::unexpected(line.error());
        log::trace("[{}] <- {}", _providerName, *line);

        auto response = jsonrpc::decode(*line);
        if (!response)
            return std::unexpected(response.error());

        if (response->method)
        {
            // The bridge advertises no capabilities, so any request from the provider is unknown.
            if (!response->id.is_null())
            {
                auto reply = jsonrpc::makeErrorResponse(response->id, MethodNotFound, "Method not found");
                if (auto sent = sendMessage(reply); !sent)
                    return std::unexpected(sent.error());
            }
            log::debug("[{}] Ignoring provider message '{}'", _providerName, *response->method);
            continue;
        }

        if (response->hasId(id))
            return std::move(*response);

        log::warning("[{}] Discarding stale response with id {} (expected {})",
                     _providerName,
                     json::dump(response->id),
                     id);
    }
}

auto McpSession::handshakeError(std::string_view stage, const Error& cause) -> std::unexpected<Error>
{
    _step = HandshakeStep::Failed;

    auto message = std::format("{} failed: {}", stage, cause.message);
    if (auto const stderrOutput = trimmed(_transport->diagnostics()); !stderrOutput.empty())
        message += std::format(". Stderr: {}", stderrOutput);

    return makeError(ErrorCode::HandshakeFailure, std::move(message));
}

} // namespace toolbridge
