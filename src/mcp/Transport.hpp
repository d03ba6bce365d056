// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace toolbridge
{

/// @brief Abstract line-oriented channel to a tool provider.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Writes one already encoded, newline-terminated line.
    /// @return Success or a TransportError.
    [[nodiscard]] virtual auto send(std::string_view line) -> VoidResult = 0;

    /// @brief Receives the next non-blank line, waiting at most @p timeout.
    /// @return The line without its terminator, a TimeoutError if no complete line arrived
    ///         in time, or a TransportError if the channel is closed.
    [[nodiscard]] virtual auto receive(std::chrono::milliseconds timeout) -> Result<std::string> = 0;

    /// @brief Closes the channel and ends the peer. Idempotent.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Returns true while the peer process is alive.
    [[nodiscard]] virtual auto isRunning() const -> bool { return isConnected(); }

    /// @brief Recent diagnostic output of the peer (its stderr), possibly empty.
    [[nodiscard]] virtual auto diagnostics() const -> std::string { return {}; }
};

} // namespace toolbridge
