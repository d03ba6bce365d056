// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>

namespace toolbridge::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error",
          {
              { "code", code },
              { "message", message },
          } },
    };
}

auto encode(const nlohmann::json& message) -> std::string
{
    // dump() escapes control characters, so the result never contains a raw newline.
    return json::dump(message) + "\n";
}

auto decode(std::string_view line) -> Result<Response>
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    if (std::ranges::all_of(line, [](char c) { return c == ' ' || c == '\t'; }))
        return makeError(ErrorCode::MalformedMessage, "Empty JSON-RPC message");

    return json::parse(line).and_then(
        [](const nlohmann::json& message) -> Result<Response> { return parseResponse(message); });
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::MalformedMessage, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("error"))
    {
        auto const& err = message["error"];
        auto rpcError = RpcError {};
        rpcError.raw = err;
        if (err.is_object())
        {
            rpcError.code = json::getIntOr(err, "code", 0);
            rpcError.message = json::getStringOr(err, "message", "Unknown error");
            rpcError.data = err.value("data", nlohmann::json {});
        }
        else
        {
            rpcError.message = err.is_string() ? err.get<std::string>() : json::dump(err);
        }
        response.error = std::move(rpcError);
    }
    else if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("method") && message["method"].is_string())
    {
        response.method = message["method"].get<std::string>();
    }
    else
    {
        return makeError(ErrorCode::MalformedMessage,
                         "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

} // namespace toolbridge::jsonrpc
