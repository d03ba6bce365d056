// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/ProviderRegistry.hpp>
#include <bridge/ToolProxy.hpp>
#include <core/Error.hpp>
#include <core/WorkerPool.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <string>

namespace toolbridge
{

/// @brief Routes tool invocations to the provider process that owns the tool.
///
/// The router resolves the owner in the registry, lets the owner serialize the call, enforces
/// the per-call timeout and turns the response into text.
class InvocationRouter
{
  public:
    /// @brief Default bound on a single tools/call round trip.
    static constexpr auto DefaultCallTimeout = std::chrono::milliseconds(30000);

    /// @param registry Registry used to resolve providers. Must outlive the router.
    /// @param pool Pool running asynchronous invocations. Must outlive the router.
    InvocationRouter(ProviderRegistry& registry,
                     WorkerPool& pool,
                     std::chrono::milliseconds callTimeout = DefaultCallTimeout);

    InvocationRouter(const InvocationRouter&) = delete;
    InvocationRouter& operator=(const InvocationRouter&) = delete;

    /// @brief Invokes a tool and returns its text, or the structured failure.
    [[nodiscard]] auto route(const ToolProxy& proxy, const nlohmann::json& explicitArgs) const -> Result<std::string>;

    /// @brief Invokes a tool; failures are rendered with describe().
    [[nodiscard]] auto invoke(const ToolProxy& proxy, const nlohmann::json& explicitArgs) const -> std::string;

    /// @brief Runs invoke() on the worker pool.
    [[nodiscard]] auto invokeAsync(const ToolProxy& proxy, const nlohmann::json& explicitArgs) const
        -> std::future<std::string>;

    [[nodiscard]] auto callTimeout() const -> std::chrono::milliseconds { return _callTimeout; }

    /// @brief Renders an invocation failure as the text returned to tool callers.
    [[nodiscard]] static auto describe(const Error& error) -> std::string;

    /// @brief Turns a tools/call `result` value into text.
    ///
    /// Text content items are joined by newlines; any other shape is serialized as JSON.
    [[nodiscard]] static auto extractText(const nlohmann::json& result) -> std::string;

  private:
    ProviderRegistry& _registry;
    WorkerPool& _pool;
    std::chrono::milliseconds _callTimeout;
};

} // namespace toolbridge
