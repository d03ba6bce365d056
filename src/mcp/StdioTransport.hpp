// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolbridge
{

/// @brief Configuration for spawning a provider process.
struct StdioTransportConfig
{
    /// @brief Label used in log messages; defaults to the command.
    std::string name;
    std::string command;
    std::vector<std::string> args;

    /// @brief Overrides applied on top of the current environment.
    std::map<std::string, std::string> env;

    /// @brief How long close() waits for a voluntary exit after closing stdin.
    std::chrono::milliseconds shutdownGrace { 2000 };
};

/// @brief Transport that communicates with a provider process via stdio pipes.
///
/// Spawns a child process and exchanges newline-delimited messages over its stdin/stdout.
/// The child's stderr is drained by a background thread: each line is logged at debug
/// level and the most recent output is kept for diagnostics().
class StdioTransport: public Transport
{
  public:
    /// @brief Size of the retained stderr tail.
    static constexpr std::size_t DiagnosticsCapacity = 4096;

    /// @brief Longest stdout line accepted before receive() gives up on the channel.
    static constexpr std::size_t MaxLineLength = 4 * 1024 * 1024;

    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the provider process.
    /// @param config The process configuration.
    /// @return Success or a SpawnError.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(std::string_view line) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<std::string> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto isRunning() const -> bool override;
    [[nodiscard]] auto diagnostics() const -> std::string override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
