// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <format>
#include <mutex>
#include <stop_token>
#include <thread>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <sys/wait.h>

    #include <cerrno>
    #include <csignal>
    #include <fcntl.h>
    #include <poll.h>
    #include <spawn.h>
    #include <unistd.h>

extern char** environ;
#endif

namespace toolbridge
{

namespace
{

    constexpr auto ReadChunkSize = std::size_t { 4096 };
    constexpr auto PumpInterval = std::chrono::milliseconds(100);
    constexpr auto TerminateWait = std::chrono::milliseconds(500);
    constexpr auto DiagnosticsSettleTime = std::chrono::milliseconds(250);

    /// Applies @p overrides on top of the inherited "KEY=VALUE" entries.
    auto mergeEnvironment(std::vector<std::string> inherited,
                          const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto merged = std::vector<std::string> {};
        merged.reserve(inherited.size() + overrides.size());
        for (auto& entry: inherited)
        {
            // Search from 1: Windows keeps per-drive entries such as "=C:=C:\".
            auto const eq = entry.find('=', 1);
            if (!overrides.contains(entry.substr(0, eq)))
                merged.push_back(std::move(entry));
        }
        for (const auto& [key, value]: overrides)
            merged.push_back(std::format("{}={}", key, value));
        return merged;
    }

#ifdef _WIN32
    void closeHandle(HANDLE& handle)
    {
        if (handle != INVALID_HANDLE_VALUE)
        {
            CloseHandle(handle);
            handle = INVALID_HANDLE_VALUE;
        }
    }

    auto inheritedEnvironment() -> std::vector<std::string>
    {
        auto entries = std::vector<std::string> {};
        auto* block = GetEnvironmentStringsA();
        if (!block)
            return entries;
        for (auto const* p = block; *p; p += std::strlen(p) + 1)
            entries.emplace_back(p);
        FreeEnvironmentStringsA(block);
        return entries;
    }

    /// Quotes one argument following the MSVC runtime's parsing rules.
    auto quoteArgument(const std::string& arg) -> std::string
    {
        if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos)
            return arg;

        auto quoted = std::string { "\"" };
        auto backslashes = std::size_t { 0 };
        for (auto const c: arg)
        {
            if (c == '\\')
            {
                ++backslashes;
                continue;
            }
            if (c == '"')
                quoted.append(backslashes * 2 + 1, '\\');
            else
                quoted.append(backslashes, '\\');
            quoted += c;
            backslashes = 0;
        }
        quoted.append(backslashes * 2, '\\');
        quoted += '"';
        return quoted;
    }
#else
    auto makePipe(int fds[2]) -> bool
    {
    #ifdef __linux__
        return pipe2(fds, O_CLOEXEC) == 0;
    #else
        if (pipe(fds) != 0)
            return false;
        fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
    #endif
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto inheritedEnvironment() -> std::vector<std::string>
    {
        auto entries = std::vector<std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
                entries.emplace_back(*e);
        }
        return entries;
    }

    auto exitCodeOf(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return status;
    }

    /// Reads whatever is immediately available on @p fd, up to @p limit bytes.
    auto readAvailable(int fd, std::size_t limit) -> std::string
    {
        auto text = std::string {};
        auto buf = std::array<char, ReadChunkSize> {};
        while (text.size() < limit)
        {
            auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
            if (poll(&pfd, 1, 0) <= 0)
                break;
            auto const n = ::read(fd, buf.data(), std::min(buf.size(), limit - text.size()));
            if (n <= 0)
                break;
            text.append(buf.data(), static_cast<std::size_t>(n));
        }
        return text;
    }

    void ignoreSigpipe()
    {
        // A provider that dies mid-write must surface as EPIPE, not kill the host.
        static auto once = std::once_flag {};
        std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
    }
#endif

} // namespace

struct StdioTransport::Impl
{
#ifdef _WIN32
    HANDLE childProcess = INVALID_HANDLE_VALUE;
    HANDLE stdinWrite = INVALID_HANDLE_VALUE;
    HANDLE stdoutRead = INVALID_HANDLE_VALUE;
    HANDLE stderrRead = INVALID_HANDLE_VALUE;
#else
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
#endif
    std::string name;
    std::chrono::milliseconds shutdownGrace { 2000 };
    std::atomic<bool> connected = false;
    std::string readBuffer;

    // Guarded by processMutex.
    mutable std::mutex processMutex;
    bool started = false;
    bool exited = false;

    // Guarded by stderrMutex.
    mutable std::mutex stderrMutex;
    std::condition_variable stderrClosedCv;
    bool stderrClosed = true;
    std::string stderrTail;
    std::string stderrLine;

    std::jthread stderrPump;

    void appendStderr(std::string_view chunk)
    {
        auto const lock = std::lock_guard(stderrMutex);

        stderrTail.append(chunk);
        if (stderrTail.size() > DiagnosticsCapacity)
            stderrTail.erase(0, stderrTail.size() - DiagnosticsCapacity);

        stderrLine.append(chunk);
        for (auto pos = stderrLine.find('\n'); pos != std::string::npos; pos = stderrLine.find('\n'))
        {
            auto line = std::string_view(stderrLine).substr(0, pos);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            log::debug("[{}] stderr: {}", name, line);
            stderrLine.erase(0, pos + 1);
        }
        if (stderrLine.size() > DiagnosticsCapacity)
            stderrLine.clear();
    }

    void markStderrClosed()
    {
        {
            auto const lock = std::lock_guard(stderrMutex);
            stderrClosed = true;
        }
        stderrClosedCv.notify_all();
    }

    void pumpStderr(const std::stop_token& stopToken)
    {
        auto buf = std::array<char, ReadChunkSize> {};
        while (!stopToken.stop_requested())
        {
#ifdef _WIN32
            auto available = DWORD { 0 };
            if (!PeekNamedPipe(stderrRead, nullptr, 0, nullptr, &available, nullptr))
                break;
            if (available == 0)
            {
                std::this_thread::sleep_for(PumpInterval / 10);
                continue;
            }
            auto bytesRead = DWORD { 0 };
            auto const toRead = std::min<DWORD>(available, static_cast<DWORD>(buf.size()));
            if (!ReadFile(stderrRead, buf.data(), toRead, &bytesRead, nullptr) || bytesRead == 0)
                break;
            appendStderr(std::string_view(buf.data(), bytesRead));
#else
            auto pfd = pollfd { .fd = stderrRead, .events = POLLIN, .revents = 0 };
            auto const ready = poll(&pfd, 1, static_cast<int>(PumpInterval.count()));
            if (ready < 0 && errno == EINTR)
                continue;
            if (ready < 0)
                break;
            if (ready == 0)
                continue;
            auto const n = ::read(stderrRead, buf.data(), buf.size());
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                break;
            appendStderr(std::string_view(buf.data(), static_cast<std::size_t>(n)));
#endif
        }
        markStderrClosed();
    }

    /// Non-blocking exit check. Requires processMutex.
    auto pollExit() -> bool
    {
        if (exited)
            return true;
#ifdef _WIN32
        if (childProcess == INVALID_HANDLE_VALUE)
            return true;
        if (WaitForSingleObject(childProcess, 0) != WAIT_OBJECT_0)
            return false;
        auto code = DWORD { 0 };
        GetExitCodeProcess(childProcess, &code);
        exited = true;
        log::info("[{}] Provider process exited with code {}", name, code);
#else
        if (childPid <= 0)
            return true;
        auto status = 0;
        auto const result = waitpid(childPid, &status, WNOHANG);
        if (result == 0)
            return false;
        exited = true;
        if (result == childPid)
            log::info("[{}] Provider process exited with code {}", name, exitCodeOf(status));
#endif
        return true;
    }

    /// Waits up to @p timeout for the child to exit. Requires processMutex.
    auto waitForExit(std::chrono::milliseconds timeout) -> bool
    {
#ifdef _WIN32
        if (exited || childProcess == INVALID_HANDLE_VALUE)
            return true;
        if (WaitForSingleObject(childProcess, static_cast<DWORD>(timeout.count())) != WAIT_OBJECT_0)
            return false;
        return pollExit();
#else
        auto const deadline = std::chrono::steady_clock::now() + timeout;
        while (!pollExit())
        {
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
#endif
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    {
        auto const lock = std::lock_guard(_impl->processMutex);
        if (_impl->started)
            return makeError(ErrorCode::SpawnError, "Transport already started");
    }
    if (config.command.empty())
        return makeError(ErrorCode::SpawnError, "No command specified");

    _impl->name = config.name.empty() ? config.command : config.name;
    _impl->shutdownGrace = config.shutdownGrace;
    _impl->readBuffer.clear();
    {
        auto const lock = std::lock_guard(_impl->stderrMutex);
        _impl->stderrTail.clear();
        _impl->stderrLine.clear();
    }

    auto const environment = mergeEnvironment(inheritedEnvironment(), config.env);

#ifdef _WIN32
    SECURITY_ATTRIBUTES sa {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE stdinRead = INVALID_HANDLE_VALUE;
    HANDLE stdinWrite = INVALID_HANDLE_VALUE;
    HANDLE stdoutRead = INVALID_HANDLE_VALUE;
    HANDLE stdoutWrite = INVALID_HANDLE_VALUE;
    HANDLE stderrRead = INVALID_HANDLE_VALUE;
    HANDLE stderrWrite = INVALID_HANDLE_VALUE;

    auto const closeAll = [&] {
        for (auto* handle: { &stdinRead, &stdinWrite, &stdoutRead, &stdoutWrite, &stderrRead, &stderrWrite })
            closeHandle(*handle);
    };

    if (!CreatePipe(&stdinRead, &stdinWrite, &sa, 0) || !CreatePipe(&stdoutRead, &stdoutWrite, &sa, 0)
        || !CreatePipe(&stderrRead, &stderrWrite, &sa, 0))
    {
        closeAll();
        return makeError(ErrorCode::SpawnError, "Failed to create pipes");
    }

    SetHandleInformation(stdinWrite, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stdoutRead, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stderrRead, HANDLE_FLAG_INHERIT, 0);

    // Launchers such as npx are batch files, which only cmd.exe can run.
    auto inner = quoteArgument(config.command);
    for (const auto& arg: config.args)
        inner += " " + quoteArgument(arg);
    auto cmdLine = std::format("cmd.exe /d /s /c \"{}\"", inner);

    auto envBlock = std::string {};
    for (const auto& entry: environment)
    {
        envBlock += entry;
        envBlock.push_back('\0');
    }
    envBlock.push_back('\0');

    STARTUPINFOA si {};
    si.cb = sizeof(si);
    si.hStdInput = stdinRead;
    si.hStdOutput = stdoutWrite;
    si.hStdError = stderrWrite;
    si.dwFlags |= STARTF_USESTDHANDLES;

    PROCESS_INFORMATION pi {};
    if (!CreateProcessA(nullptr,
                        cmdLine.data(),
                        nullptr,
                        nullptr,
                        TRUE,
                        CREATE_NO_WINDOW,
                        envBlock.data(),
                        nullptr,
                        &si,
                        &pi))
    {
        auto const code = GetLastError();
        closeAll();
        return makeError(ErrorCode::SpawnError,
                         std::format("Failed to start process '{}': error {}", config.command, code));
    }

    closeHandle(stdinRead);
    closeHandle(stdoutWrite);
    closeHandle(stderrWrite);
    CloseHandle(pi.hThread);

    if (WaitForSingleObject(pi.hProcess, 0) == WAIT_OBJECT_0)
    {
        auto code = DWORD { 0 };
        GetExitCodeProcess(pi.hProcess, &code);
        CloseHandle(pi.hProcess);
        closeAll();
        return makeError(ErrorCode::SpawnError,
                         std::format("Process failed to start. Exit code: {}", code));
    }

    _impl->childProcess = pi.hProcess;
    _impl->stdinWrite = stdinWrite;
    _impl->stdoutRead = stdoutRead;
    _impl->stderrRead = stderrRead;
    auto const pid = static_cast<unsigned long>(pi.dwProcessId);
#else
    ignoreSigpipe();

    int stdinPipe[2] = { -1, -1 };
    int stdoutPipe[2] = { -1, -1 };
    int stderrPipe[2] = { -1, -1 };

    auto const closeAll = [&] {
        for (auto* pipeFds: { stdinPipe, stdoutPipe, stderrPipe })
        {
            closeFd(pipeFds[0]);
            closeFd(pipeFds[1]);
        }
    };

    if (!makePipe(stdinPipe) || !makePipe(stdoutPipe) || !makePipe(stderrPipe))
    {
        closeAll();
        return makeError(ErrorCode::SpawnError, std::format("Failed to create pipes: {}", strerror(errno)));
    }

    // All pipe ends are close-on-exec; dup2 makes the child's copies inheritable.
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // The host ignores SIGPIPE; the child gets the default disposition back.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t defaultSignals;
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaultSignals);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF);

    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = environment;
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    if (status != 0)
    {
        closeAll();
        return makeError(ErrorCode::SpawnError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    auto waitStatus = 0;
    if (waitpid(pid, &waitStatus, WNOHANG) == pid)
    {
        auto const stderrOutput = readAvailable(stderrPipe[0], 1024);
        closeAll();
        return makeError(ErrorCode::SpawnError,
                         std::format("Process failed to start. Exit code: {}. Stderr: {}",
                                     exitCodeOf(waitStatus),
                                     stderrOutput));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
#endif

    {
        auto const lock = std::lock_guard(_impl->processMutex);
        _impl->started = true;
        _impl->exited = false;
    }
    {
        auto const lock = std::lock_guard(_impl->stderrMutex);
        _impl->stderrClosed = false;
    }
    _impl->stderrPump = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->pumpStderr(token); });

    _impl->connected = true;
    log::info("[{}] Provider process started: {} (pid {})", _impl->name, config.command, pid);
    return {};
}

auto StdioTransport::send(std::string_view line) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    while (!line.empty())
    {
#ifdef _WIN32
        auto written = DWORD { 0 };
        if (!WriteFile(_impl->stdinWrite, line.data(), static_cast<DWORD>(line.size()), &written, nullptr))
            return makeError(ErrorCode::TransportError, "Failed to write to process stdin");
        line.remove_prefix(written);
#else
        auto const written = ::write(_impl->stdinWrite, line.data(), line.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                return makeError(ErrorCode::TransportError, "Broken pipe (provider terminated)");
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", strerror(errno)));
        }
        line.remove_prefix(static_cast<std::size_t>(written));
#endif
    }

    return {};
}

auto StdioTransport::receive(std::chrono::milliseconds timeout) -> Result<std::string>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos)
                continue;

            return line;
        }

        auto const remaining =
            std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError,
                             std::format("No response within {} ms", timeout.count()));

        auto buf = std::array<char, ReadChunkSize> {};
#ifdef _WIN32
        auto available = DWORD { 0 };
        if (!PeekNamedPipe(_impl->stdoutRead, nullptr, 0, nullptr, &available, nullptr))
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        if (available == 0)
        {
            std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(5)));
            continue;
        }
        auto bytesRead = DWORD { 0 };
        auto const toRead = std::min<DWORD>(available, static_cast<DWORD>(buf.size()));
        if (!ReadFile(_impl->stdoutRead, buf.data(), toRead, &bytesRead, nullptr) || bytesRead == 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), bytesRead);
#else
        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), static_cast<std::size_t>(bytesRead));
#endif

        if (_impl->readBuffer.size() > MaxLineLength && _impl->readBuffer.find('\n') == std::string::npos)
        {
            _impl->readBuffer.clear();
            return makeError(ErrorCode::TransportError,
                             std::format("Provider output line exceeds {} bytes", MaxLineLength));
        }
    }
}

void StdioTransport::close()
{
    {
        auto const lock = std::lock_guard(_impl->processMutex);
        if (!_impl->started)
            return;

        _impl->started = false;
        _impl->connected = false;

#ifdef _WIN32
        closeHandle(_impl->stdinWrite);
        if (!_impl->waitForExit(_impl->shutdownGrace))
        {
            log::warning("[{}] Provider did not exit within {} ms, terminating",
                         _impl->name,
                         _impl->shutdownGrace.count());
            TerminateProcess(_impl->childProcess, 1);
            (void) _impl->waitForExit(TerminateWait);
        }
        closeHandle(_impl->childProcess);
#else
        // EOF on stdin asks the provider to exit on its own.
        closeFd(_impl->stdinWrite);
        if (!_impl->waitForExit(_impl->shutdownGrace))
        {
            log::warning("[{}] Provider did not exit within {} ms, sending SIGTERM",
                         _impl->name,
                         _impl->shutdownGrace.count());
            kill(_impl->childPid, SIGTERM);
            if (!_impl->waitForExit(TerminateWait))
            {
                log::warning("[{}] Provider ignored SIGTERM, killing it", _impl->name);
                kill(_impl->childPid, SIGKILL);
                auto status = 0;
                while (waitpid(_impl->childPid, &status, 0) < 0 && errno == EINTR)
                    ;
                _impl->exited = true;
            }
        }
        _impl->childPid = -1;
#endif
    }

    if (_impl->stderrPump.joinable())
    {
        _impl->stderrPump.request_stop();
        _impl->stderrPump.join();
    }

#ifdef _WIN32
    closeHandle(_impl->stdoutRead);
    closeHandle(_impl->stderrRead);
#else
    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);
#endif

    log::debug("[{}] Provider transport closed", _impl->name);
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::isRunning() const -> bool
{
    auto const lock = std::lock_guard(_impl->processMutex);
    return _impl->started && !_impl->pollExit();
}

auto StdioTransport::diagnostics() const -> std::string
{
    // Give the pump a moment to collect the last words of a process that just died.
    auto const settle = !isRunning();

    auto lock = std::unique_lock(_impl->stderrMutex);
    if (settle)
        _impl->stderrClosedCv.wait_for(lock, DiagnosticsSettleTime, [this] { return _impl->stderrClosed; });
    return _impl->stderrTail;
}

} // namespace toolbridge
