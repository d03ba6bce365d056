// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/ManagedProcess.hpp>
#include <bridge/ToolProxy.hpp>
#include <core/Error.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Live provider processes and the tool proxies materialized from them.
///
/// Entries keep their insertion order. Reads take a shared lock and writes an exclusive one,
/// so lookups from concurrent invocations do not block each other.
class ProviderRegistry
{
  public:
    ProviderRegistry() = default;
    ~ProviderRegistry();

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    /// @brief Registers a provider together with its tools.
    /// @return Success, or InvalidArgument if a provider of that name already exists.
    [[nodiscard]] auto add(std::shared_ptr<ManagedProcess> process, std::vector<ToolProxy> tools) -> VoidResult;

    /// @brief Returns the process registered under @p name, or nullptr.
    [[nodiscard]] auto findProcess(std::string_view name) const -> std::shared_ptr<ManagedProcess>;

    /// @brief Returns the tools of one provider (empty if unknown).
    [[nodiscard]] auto tools(std::string_view name) const -> std::vector<ToolProxy>;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /// @brief Provider names in registration order.
    [[nodiscard]] auto providerNames() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const -> std::size_t;

    /// @brief All tools, ordered by provider registration and then by tool order.
    [[nodiscard]] auto flatTools() const -> std::vector<ToolProxy>;

    /// @brief All tools keyed by provider name. Providers without tools map to an empty list.
    [[nodiscard]] auto groupedTools() const -> std::map<std::string, std::vector<ToolProxy>>;

    /// @brief Terminates every registered process. Entries stay registered.
    void shutdown();

  private:
    struct Entry
    {
        std::shared_ptr<ManagedProcess> process;
        std::vector<ToolProxy> tools;
    };

    [[nodiscard]] auto findEntry(std::string_view name) const -> const Entry*;

    mutable std::shared_mutex _mutex;
    std::vector<Entry> _entries;
};

} // namespace toolbridge
