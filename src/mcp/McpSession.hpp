// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Parameters of the initialize handshake.
struct HandshakeOptions
{
    std::string protocolVersion = "2025-03-26";
    std::string clientName = "toolbridge";
    std::string clientVersion = "1.0.0";

    /// @brief Bound on each wait for a handshake response.
    std::chrono::milliseconds timeout { 10000 };
};

/// @brief Identity a provider reported in its initialize response.
struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocolVersion;
};

/// @brief Position of a session in the handshake sequence.
enum class HandshakeStep : std::uint8_t
{
    Spawning,
    SentInitialize,
    AwaitingInitializeResponse,
    SentInitializedNotification,
    SentToolsList,
    AwaitingToolsResponse,
    Ready,
    Failed,
};

[[nodiscard]] constexpr auto handshakeStepToString(HandshakeStep step) -> std::string_view
{
    switch (step)
    {
        case HandshakeStep::Spawning: return "spawning";
        case HandshakeStep::SentInitialize: return "sent-initialize";
        case HandshakeStep::AwaitingInitializeResponse: return "awaiting-initialize-response";
        case HandshakeStep::SentInitializedNotification: return "sent-initialized-notification";
        case HandshakeStep::SentToolsList: return "sent-tools-list";
        case HandshakeStep::AwaitingToolsResponse: return "awaiting-tools-response";
        case HandshakeStep::Ready: return "ready";
        case HandshakeStep::Failed: return "failed";
    }
    return "unknown";
}

/// @brief MCP client session over one transport.
///
/// Drives the initialize → notifications/initialized → tools/list handshake and performs
/// tools/call round trips. Not thread-safe; the owner serializes access.
class McpSession
{
  public:
    /// @brief Request id of the initialize request.
    static constexpr int64_t InitializeRequestId = 1;

    /// @brief Request id of the tools/list request.
    static constexpr int64_t ToolsListRequestId = 2;

    /// @brief First request id used for tools/call.
    static constexpr int64_t FirstCallRequestId = 3;

    /// @param transport A connected transport.
    /// @param providerName Label used in log and error messages.
    explicit McpSession(std::unique_ptr<Transport> transport, std::string providerName = "provider");
    ~McpSession();

    McpSession(const McpSession&) = delete;
    McpSession& operator=(const McpSession&) = delete;

    /// @brief Runs the complete handshake.
    /// @return The provider's tool descriptors, or a HandshakeFailure.
    [[nodiscard]] auto handshake(const HandshakeOptions& options) -> Result<std::vector<ToolDescriptor>>;

    /// @brief Sends initialize, awaits its response and sends notifications/initialized.
    [[nodiscard]] auto initialize(const HandshakeOptions& options) -> Result<ServerInfo>;

    /// @brief Requests tools/list and maps `result.tools` into descriptors.
    ///
    /// A missing or malformed `result.tools` yields an empty list, not an error.
    [[nodiscard]] auto listTools(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDescriptor>>;

    /// @brief Calls a tool and waits for the response carrying the same request id.
    ///
    /// Replies with other ids are stale leftovers of timed-out calls and are discarded.
    /// @return The JSON-RPC `result` value, or InvocationTimeout, RemoteToolError,
    ///         MalformedMessage (undecodable line) or TransportError.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    [[nodiscard]] auto step() const -> HandshakeStep;
    [[nodiscard]] auto serverInfo() const -> const ServerInfo&;
    [[nodiscard]] auto isInitialized() const -> bool;
    [[nodiscard]] auto transport() -> Transport&;

    /// @brief Closes the transport, ending the provider process.
    void close();

  private:
    std::unique_ptr<Transport> _transport;
    std::string _providerName;
    ServerInfo _serverInfo;
    std::atomic<HandshakeStep> _step = HandshakeStep::Spawning;
    int64_t _nextCallId = FirstCallRequestId;

    [[nodiscard]] auto sendMessage(const nlohmann::json& message) -> VoidResult;
    [[nodiscard]] auto awaitResponse(int64_t id, std::chrono::milliseconds timeout) -> Result<jsonrpc::Response>;
    [[nodiscard]] auto handshakeError(std::string_view stage, const Error& cause) -> std::unexpected<Error>;
};

} // namespace toolbridge
