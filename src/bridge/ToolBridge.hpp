// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/InvocationRouter.hpp>
#include <bridge/ManagedProcess.hpp>
#include <bridge/ProviderRegistry.hpp>
#include <bridge/ToolProxy.hpp>
#include <core/Types.hpp>
#include <core/WorkerPool.hpp>
#include <mcp/McpSession.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolbridge
{

/// @brief Tunables of a bridge instance.
struct BridgeOptions
{
    HandshakeOptions handshake;
    std::chrono::milliseconds callTimeout = InvocationRouter::DefaultCallTimeout;
    std::chrono::milliseconds shutdownGrace { 2000 };

    /// @brief Worker threads; 0 selects WorkerPool::defaultThreadCount().
    std::size_t workerThreads = 0;
};

/// @brief Snapshot of one provider for diagnostics.
struct ProviderStatus
{
    std::string name;
    ProcessState state = ProcessState::Spawning;
    std::size_t toolCount = 0;
    std::optional<Error> lastError;
};

using ToolList = std::vector<ToolProxy>;
using GroupedTools = std::map<std::string, ToolList>;

/// @brief Result of loading providers: a flat list or a per-provider map.
using LoadedTools = std::variant<ToolList, GroupedTools>;

/// @brief Loads tool providers and exposes their tools as proxies.
///
/// Owns the registry of provider processes, the worker pool and the invocation router.
/// Proxies handed out by a bridge must not be used after the bridge is destroyed.
class ToolBridge
{
  public:
    explicit ToolBridge(BridgeOptions options = {});
    ~ToolBridge();

    ToolBridge(const ToolBridge&) = delete;
    ToolBridge& operator=(const ToolBridge&) = delete;

    /// @brief Spawns and handshakes every configured provider concurrently.
    ///
    /// Providers that fail are registered with no tools and logged; they never abort the
    /// load. Configs whose name is already taken are skipped.
    /// @param configs Providers to start, in presentation order.
    /// @param group Selects the grouped result instead of the flat one.
    [[nodiscard]] auto loadAll(const std::vector<ProviderConfig>& configs, bool group) -> LoadedTools;

    [[nodiscard]] auto loadFlat(const std::vector<ProviderConfig>& configs) -> ToolList;
    [[nodiscard]] auto loadGrouped(const std::vector<ProviderConfig>& configs) -> GroupedTools;

    /// @brief Looks up a tool by provider and tool name.
    [[nodiscard]] auto findTool(std::string_view provider, std::string_view tool) const -> std::optional<ToolProxy>;

    [[nodiscard]] auto status() const -> std::vector<ProviderStatus>;

    /// @brief Terminates every provider. Safe to call more than once.
    void shutdown();

    [[nodiscard]] auto registry() -> ProviderRegistry& { return _registry; }
    [[nodiscard]] auto router() -> InvocationRouter& { return _router; }
    [[nodiscard]] auto options() const -> const BridgeOptions& { return _options; }

  private:
    void loadProvider(const ProviderConfig& config);

    BridgeOptions _options;
    ProviderRegistry _registry;

    // Declared before the pool it refers to, so queued jobs drain while it still exists.
    InvocationRouter _router;
    WorkerPool _pool;
    std::atomic<bool> _shutdown = false;
};

} // namespace toolbridge
