// SPDX-License-Identifier: Apache-2.0
#include <bridge/InvocationRouter.hpp>
#include <bridge/ManagedProcess.hpp>
#include <bridge/ProviderRegistry.hpp>
#include <core/WorkerPool.hpp>

#include <catch2/catch_test_macros.hpp>

#include "MockTransport.hpp"

using namespace toolbridge;
using namespace toolbridge::testing;
using namespace std::chrono_literals;

namespace
{

auto idleProcess(std::string name) -> std::shared_ptr<ManagedProcess>
{
    return std::make_shared<ManagedProcess>(ProviderConfig { .name = std::move(name), .command = "unused" }, nullptr);
}

auto mockProcess(std::string name, MockTransport** mockOut = nullptr) -> std::shared_ptr<ManagedProcess>
{
    auto transport = std::make_unique<MockTransport>();
    transport->responder = providerResponder(nlohmann::json::parse(R"([{"name": "ping"}])"), nullptr);
    if (mockOut)
        *mockOut = transport.get();
    auto session = std::make_unique<McpSession>(std::move(transport), name);
    return std::make_shared<ManagedProcess>(ProviderConfig { .name = std::move(name), .command = "unused" },
                                            std::move(session));
}

struct RegistryFixture
{
    ProviderRegistry registry;
    WorkerPool pool { 1 };
    InvocationRouter router { registry, pool };

    auto proxies(const std::string& provider, std::initializer_list<std::string_view> names) -> std::vector<ToolProxy>
    {
        auto result = std::vector<ToolProxy> {};
        for (auto const name: names)
            result.push_back(materialize(ToolDescriptor { .name = std::string(name) }, provider, router));
        return result;
    }
};

} // namespace

TEST_CASE("ManagedProcess handshake moves the process to ready", "[registry]")
{
    auto process = mockProcess("alpha");
    CHECK(process->state() == ProcessState::Spawning);

    auto tools = process->handshake(HandshakeOptions { .timeout = 200ms });

    REQUIRE(tools.has_value());
    CHECK(tools->size() == 1);
    CHECK(process->state() == ProcessState::Ready);
    CHECK(!process->lastError().has_value());

    // A second handshake is refused.
    CHECK(!process->handshake(HandshakeOptions { .timeout = 200ms }).has_value());
}

TEST_CASE("ManagedProcess without a session cannot handshake", "[registry]")
{
    auto process = idleProcess("alpha");
    process->markFailed(Error { ErrorCode::SpawnError, "not found" });

    auto tools = process->handshake(HandshakeOptions {});

    REQUIRE(!tools.has_value());
    CHECK(process->state() == ProcessState::Failed);
    REQUIRE(process->lastError().has_value());
    CHECK(process->lastError()->code == ErrorCode::SpawnError);
}

TEST_CASE("ManagedProcess terminate is final and idempotent", "[registry]")
{
    MockTransport* mock = nullptr;
    auto process = mockProcess("alpha", &mock);
    REQUIRE(process->handshake(HandshakeOptions { .timeout = 200ms }).has_value());

    process->terminate();
    process->terminate();

    CHECK(process->state() == ProcessState::Terminated);
    CHECK(mock->closeCount >= 1);

    // A terminated process stays terminated when a failure is recorded later.
    process->markFailed(Error { ErrorCode::TransportError, "late" });
    CHECK(process->state() == ProcessState::Terminated);
}

TEST_CASE("ProviderRegistry keeps insertion order", "[registry]")
{
    auto fixture = RegistryFixture();

    REQUIRE(fixture.registry.add(idleProcess("zeta"), fixture.proxies("zeta", { "z1", "z2" })).has_value());
    REQUIRE(fixture.registry.add(idleProcess("alpha"), fixture.proxies("alpha", { "a1" })).has_value());
    REQUIRE(fixture.registry.add(idleProcess("empty"), {}).has_value());

    CHECK(fixture.registry.size() == 3);
    CHECK(fixture.registry.providerNames() == std::vector<std::string> { "zeta", "alpha", "empty" });

    auto const flat = fixture.registry.flatTools();
    REQUIRE(flat.size() == 3);
    CHECK(flat[0].name() == "z1");
    CHECK(flat[1].name() == "z2");
    CHECK(flat[2].name() == "a1");
    CHECK(flat[2].providerName() == "alpha");

    auto const grouped = fixture.registry.groupedTools();
    REQUIRE(grouped.size() == 3);
    CHECK(grouped.at("zeta").size() == 2);
    CHECK(grouped.at("alpha").size() == 1);
    CHECK(grouped.at("empty").empty());
}

TEST_CASE("ProviderRegistry rejects duplicate provider names", "[registry]")
{
    auto fixture = RegistryFixture();

    REQUIRE(fixture.registry.add(idleProcess("alpha"), fixture.proxies("alpha", { "a1" })).has_value());
    auto duplicate = fixture.registry.add(idleProcess("alpha"), fixture.proxies("alpha", { "other" }));

    REQUIRE(!duplicate.has_value());
    CHECK(duplicate.error().code == ErrorCode::InvalidArgument);
    CHECK(fixture.registry.size() == 1);
    CHECK(fixture.registry.tools("alpha").front().name() == "a1");

    CHECK(!fixture.registry.add(nullptr, {}).has_value());
}

TEST_CASE("ProviderRegistry lookups", "[registry]")
{
    auto fixture = RegistryFixture();
    auto process = idleProcess("alpha");
    REQUIRE(fixture.registry.add(process, fixture.proxies("alpha", { "a1" })).has_value());

    CHECK(fixture.registry.contains("alpha"));
    CHECK(!fixture.registry.contains("beta"));
    CHECK(fixture.registry.findProcess("alpha") == process);
    CHECK(fixture.registry.findProcess("beta") == nullptr);
    CHECK(fixture.registry.tools("beta").empty());
}

TEST_CASE("ProviderRegistry shutdown terminates every process", "[registry]")
{
    auto fixture = RegistryFixture();
    auto first = mockProcess("first");
    auto second = idleProcess("second");
    REQUIRE(first->handshake(HandshakeOptions { .timeout = 200ms }).has_value());
    REQUIRE(fixture.registry.add(first, {}).has_value());
    REQUIRE(fixture.registry.add(second, {}).has_value());

    fixture.registry.shutdown();

    CHECK(first->state() == ProcessState::Terminated);
    CHECK(second->state() == ProcessState::Terminated);
    CHECK(fixture.registry.size() == 2);
}
