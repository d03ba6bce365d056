// SPDX-License-Identifier: Apache-2.0
#include "ProviderRegistry.hpp"

#include <format>
#include <mutex>

namespace toolbridge
{

ProviderRegistry::~ProviderRegistry()
{
    shutdown();
}

auto ProviderRegistry::add(std::shared_ptr<ManagedProcess> process, std::vector<ToolProxy> tools) -> VoidResult
{
    if (!process)
        return makeError(ErrorCode::InvalidArgument, "Cannot register a null provider");

    auto const lock = std::unique_lock(_mutex);
    if (findEntry(process->name()))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Provider '{}' is already registered", process->name()));

    _entries.push_back(Entry { .process = std::move(process), .tools = std::move(tools) });
    return {};
}

auto ProviderRegistry::findProcess(std::string_view name) const -> std::shared_ptr<ManagedProcess>
{
    auto const lock = std::shared_lock(_mutex);
    auto const* entry = findEntry(name);
    return entry ? entry->process : nullptr;
}

auto ProviderRegistry::tools(std::string_view name) const -> std::vector<ToolProxy>
{
    auto const lock = std::shared_lock(_mutex);
    auto const* entry = findEntry(name);
    return entry ? entry->tools : std::vector<ToolProxy> {};
}

auto ProviderRegistry::contains(std::string_view name) const -> bool
{
    auto const lock = std::shared_lock(_mutex);
    return findEntry(name) != nullptr;
}

auto ProviderRegistry::providerNames() const -> std::vector<std::string>
{
    auto const lock = std::shared_lock(_mutex);
    auto names = std::vector<std::string> {};
    names.reserve(_entries.size());
    for (const auto& entry: _entries)
        names.push_back(entry.process->name());
    return names;
}

auto ProviderRegistry::size() const -> std::size_t
{
    auto const lock = std::shared_lock(_mutex);
    return _entries.size();
}

auto ProviderRegistry::flatTools() const -> std::vector<ToolProxy>
{
    auto const lock = std::shared_lock(_mutex);
    auto result = std::vector<ToolProxy> {};
    for (const auto& entry: _entries)
        result.insert(result.end(), entry.tools.begin(), entry.tools.end());
    return result;
}

auto ProviderRegistry::groupedTools() const -> std::map<std::string, std::vector<ToolProxy>>
{
    auto const lock = std::shared_lock(_mutex);
    auto result = std::map<std::string, std::vector<ToolProxy>> {};
    for (const auto& entry: _entries)
        result.emplace(entry.process->name(), entry.tools);
    return result;
}

void ProviderRegistry::shutdown()
{
    auto processes = std::vector<std::shared_ptr<ManagedProcess>> {};
    {
        auto const lock = std::shared_lock(_mutex);
        for (const auto& entry: _entries)
            processes.push_back(entry.process);
    }

    // Terminate outside the lock; a process may still be finishing a call.
    for (auto& process: processes)
        process->terminate();
}

auto ProviderRegistry::findEntry(std::string_view name) const -> const Entry*
{
    for (const auto& entry: _entries)
    {
        if (entry.process->name() == name)
            return &entry;
    }
    return nullptr;
}

} // namespace toolbridge
