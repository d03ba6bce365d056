// SPDX-License-Identifier: Apache-2.0
#include "ToolBridge.hpp"

#include <core/Log.hpp>

#include <format>
#include <future>
#include <set>

namespace toolbridge
{

ToolBridge::ToolBridge(BridgeOptions options):
    _options(std::move(options)),
    _router(_registry, _pool, _options.callTimeout),
    _pool(_options.workerThreads > 0 ? _options.workerThreads : WorkerPool::defaultThreadCount())
{
}

ToolBridge::~ToolBridge()
{
    shutdown();
}

auto ToolBridge::loadAll(const std::vector<ProviderConfig>& configs, bool group) -> LoadedTools
{
    auto accepted = std::vector<std::string> {};
    auto pending = std::vector<std::future<void>> {};
    auto batchNames = std::set<std::string> {};

    for (const auto& config: configs)
    {
        if (_registry.contains(config.name) || !batchNames.insert(config.name).second)
        {
            log::error("MCP server '{}' is configured more than once; skipping duplicate", config.name);
            continue;
        }
        accepted.push_back(config.name);
        pending.push_back(_pool.submit([this, config]() { loadProvider(config); }));
    }

    for (auto& task: pending)
        task.get();

    log::info("Loaded {} of {} MCP servers", accepted.size(), configs.size());

    if (group)
    {
        auto grouped = GroupedTools {};
        for (const auto& name: accepted)
            grouped.emplace(name, _registry.tools(name));
        return grouped;
    }

    auto flat = ToolList {};
    for (const auto& name: accepted)
    {
        auto tools = _registry.tools(name);
        flat.insert(flat.end(), std::make_move_iterator(tools.begin()), std::make_move_iterator(tools.end()));
    }
    return flat;
}

auto ToolBridge::loadFlat(const std::vector<ProviderConfig>& configs) -> ToolList
{
    return std::get<ToolList>(loadAll(configs, false));
}

auto ToolBridge::loadGrouped(const std::vector<ProviderConfig>& configs) -> GroupedTools
{
    return std::get<GroupedTools>(loadAll(configs, true));
}

auto ToolBridge::findTool(std::string_view provider, std::string_view tool) const -> std::optional<ToolProxy>
{
    for (auto& proxy: _registry.tools(provider))
    {
        if (proxy.name() == tool)
            return std::move(proxy);
    }
    return std::nullopt;
}

auto ToolBridge::status() const -> std::vector<ProviderStatus>
{
    auto result = std::vector<ProviderStatus> {};
    for (const auto& name: _registry.providerNames())
    {
        auto const process = _registry.findProcess(name);
        if (!process)
            continue;
        result.push_back(ProviderStatus {
            .name = name,
            .state = process->state(),
            .toolCount = _registry.tools(name).size(),
            .lastError = process->lastError(),
        });
    }
    return result;
}

void ToolBridge::shutdown()
{
    if (_shutdown.exchange(true))
        return;

    log::debug("Shutting down {} MCP servers", _registry.size());
    _registry.shutdown();
}

void ToolBridge::loadProvider(const ProviderConfig& config)
{
    auto process = std::shared_ptr<ManagedProcess> {};
    auto tools = std::vector<ToolProxy> {};

    if (config.command.empty())
    {
        process = std::make_shared<ManagedProcess>(config, nullptr);
        process->markFailed(
            Error { ErrorCode::SpawnError, std::format("No command specified for MCP server '{}'", config.name) });
    }
    else
    {
        log::debug("[{}] Spawning {}", config.name, config.command);
        process = ManagedProcess::spawn(config, _options.shutdownGrace);

        if (process->state() == ProcessState::Spawning)
        {
            // A failed handshake is logged and recorded by the process itself.
            if (auto descriptors = process->handshake(_options.handshake); descriptors)
            {
                tools.reserve(descriptors->size());
                for (auto& descriptor: *descriptors)
                    tools.push_back(materialize(std::move(descriptor), config.name, _router));
            }
        }
    }

    if (_shutdown.load())
        process->terminate();

    if (auto added = _registry.add(process, std::move(tools)); !added)
    {
        log::error("{}", added.error().message);
        process->terminate();
    }
}

} // namespace toolbridge
