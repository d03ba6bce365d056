// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace toolbridge::jsonrpc
{

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;

    /// @brief The error object exactly as received.
    nlohmann::json raw;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Set when the peer sent a request or notification instead of a response.
    std::optional<std::string> method;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief Returns true if the id is the given integer.
    [[nodiscard]] auto hasId(int64_t expected) const -> bool
    {
        return id.is_number_integer() && id.get<int64_t>() == expected;
    }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters, omitted when null.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response to a request received from the peer.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Serializes a message to a single newline-terminated line.
[[nodiscard]] auto encode(const nlohmann::json& message) -> std::string;

/// @brief Parses one line into a JSON-RPC 2.0 response.
/// @return The response, or a MalformedMessage error if the line is empty, not JSON,
///         or not a JSON-RPC 2.0 message.
[[nodiscard]] auto decode(std::string_view line) -> Result<Response>;

/// @brief Interprets an already parsed JSON value as a JSON-RPC 2.0 response.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

} // namespace toolbridge::jsonrpc
