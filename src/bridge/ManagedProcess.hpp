// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/TicketLock.hpp>
#include <core/Types.hpp>
#include <mcp/McpSession.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Lifecycle state of a provider process.
enum class ProcessState : std::uint8_t
{
    Spawning,
    Handshaking,
    Ready,
    Failed,
    Terminated,
};

[[nodiscard]] constexpr auto processStateToString(ProcessState state) -> std::string_view
{
    switch (state)
    {
        case ProcessState::Spawning: return "spawning";
        case ProcessState::Handshaking: return "handshaking";
        case ProcessState::Ready: return "ready";
        case ProcessState::Failed: return "failed";
        case ProcessState::Terminated: return "terminated";
    }
    return "unknown";
}

/// @brief One provider process together with its session and serialization lock.
///
/// Calls are serialized through a fair ticket lock, so concurrent invocations against the
/// same provider are served in the order they arrived.
class ManagedProcess
{
  public:
    /// @param config The configuration the process was launched from.
    /// @param session The session over the spawned transport, or nullptr if spawning failed.
    ManagedProcess(ProviderConfig config, std::unique_ptr<McpSession> session);
    ~ManagedProcess();

    ManagedProcess(const ManagedProcess&) = delete;
    ManagedProcess& operator=(const ManagedProcess&) = delete;

    /// @brief Launches the provider described by config over a StdioTransport.
    ///
    /// Never fails: a spawn failure yields a process in the Failed state carrying the error.
    [[nodiscard]] static auto spawn(const ProviderConfig& config, std::chrono::milliseconds shutdownGrace)
        -> std::shared_ptr<ManagedProcess>;

    /// @brief Runs the protocol handshake and moves the process to Ready or Failed.
    [[nodiscard]] auto handshake(const HandshakeOptions& options) -> Result<std::vector<ToolDescriptor>>;

    /// @brief Performs one tools/call while holding the process lock.
    [[nodiscard]] auto callTool(std::string_view tool,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    /// @brief Stops the provider process. Safe to call more than once.
    void terminate();

    /// @brief Records an error and moves the process to Failed.
    void markFailed(Error error);

    [[nodiscard]] auto name() const -> const std::string& { return _config.name; }
    [[nodiscard]] auto config() const -> const ProviderConfig& { return _config; }
    [[nodiscard]] auto state() const -> ProcessState { return _state.load(); }
    [[nodiscard]] auto lastError() const -> std::optional<Error>;

  private:
    void setError(Error error);

    ProviderConfig _config;
    std::unique_ptr<McpSession> _session;
    TicketLock _callLock;
    std::atomic<ProcessState> _state = ProcessState::Spawning;

    mutable std::mutex _errorMutex;
    std::optional<Error> _lastError;
};

} // namespace toolbridge
