// SPDX-License-Identifier: Apache-2.0
#include "ManagedProcess.hpp"

#include <core/Log.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>

namespace toolbridge
{

ManagedProcess::ManagedProcess(ProviderConfig config, std::unique_ptr<McpSession> session):
    _config(std::move(config)), _session(std::move(session))
{
}

ManagedProcess::~ManagedProcess()
{
    terminate();
}

auto ManagedProcess::spawn(const ProviderConfig& config, std::chrono::milliseconds shutdownGrace)
    -> std::shared_ptr<ManagedProcess>
{
    auto transport = std::make_unique<StdioTransport>();
    auto started = transport->start(StdioTransportConfig {
        .name = config.name,
        .command = config.command,
        .args = config.args,
        .env = config.env,
        .shutdownGrace = shutdownGrace,
    });

    if (!started)
    {
        auto process = std::make_shared<ManagedProcess>(config, nullptr);
        process->markFailed(started.error());
        return process;
    }

    auto session = std::make_unique<McpSession>(std::move(transport), config.name);
    return std::make_shared<ManagedProcess>(config, std::move(session));
}

auto ManagedProcess::handshake(const HandshakeOptions& options) -> Result<std::vector<ToolDescriptor>>
{
    if (!_session || state() != ProcessState::Spawning)
    {
        return makeError(ErrorCode::HandshakeFailure,
                         std::format("Cannot handshake provider '{}' in state {}",
                                     _config.name,
                                     processStateToString(state())));
    }

    auto const guard = std::lock_guard(_callLock);
    _state = ProcessState::Handshaking;

    auto tools = _session->handshake(options);
    if (!tools)
    {
        markFailed(tools.error());
        // The process stays registered as Failed but is not left running.
        _session->close();
        return std::unexpected(tools.error());
    }

    auto expected = ProcessState::Handshaking;
    _state.compare_exchange_strong(expected, ProcessState::Ready);
    return tools;
}

auto ManagedProcess::callTool(std::string_view tool,
                              const nlohmann::json& arguments,
                              std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    auto const guard = std::lock_guard(_callLock);

    // State may have changed while this caller was queued.
    if (auto const current = state(); current != ProcessState::Ready)
    {
        return makeError(ErrorCode::TransportError,
                         std::format("Provider '{}' is {}", _config.name, processStateToString(current)));
    }

    auto result = _session->callTool(tool, arguments, timeout);
    if (!result && result.error().code == ErrorCode::TransportError)
    {
        if (_session->transport().isRunning())
        {
            markFailed(result.error());
        }
        else
        {
            setError(result.error());
            _state = ProcessState::Terminated;
            log::error("[{}] Provider process has exited: {}", _config.name, result.error().message);
        }
    }
    return result;
}

void ManagedProcess::terminate()
{
    auto const previous = _state.exchange(ProcessState::Terminated);
    if (!_session)
        return;

    // Waits for an in-flight call to finish or time out.
    auto const guard = std::lock_guard(_callLock);
    _session->close();

    if (previous != ProcessState::Terminated)
        log::debug("[{}] Provider terminated", _config.name);
}

void ManagedProcess::markFailed(Error error)
{
    log::error("[{}] Provider failed: {}", _config.name, error);
    setError(std::move(error));

    auto current = state();
    while (current != ProcessState::Terminated
           && !_state.compare_exchange_weak(current, ProcessState::Failed))
    {
    }
}

auto ManagedProcess::lastError() const -> std::optional<Error>
{
    auto const guard = std::lock_guard(_errorMutex);
    return _lastError;
}

void ManagedProcess::setError(Error error)
{
    auto const guard = std::lock_guard(_errorMutex);
    _lastError = std::move(error);
}

} // namespace toolbridge
