// SPDX-License-Identifier: Apache-2.0
#include <bridge/InvocationRouter.hpp>
#include <bridge/ManagedProcess.hpp>
#include <bridge/ProviderRegistry.hpp>
#include <core/WorkerPool.hpp>
#include <mcp/ToolSchema.hpp>

#include <catch2/catch_test_macros.hpp>

#include <future>

#include "MockTransport.hpp"

using namespace toolbridge;
using namespace toolbridge::testing;
using namespace std::chrono_literals;

namespace
{

auto mockTools() -> nlohmann::json
{
    return nlohmann::json::parse(R"([
        {"name": "ping"},
        {"name": "boom"},
        {"name": "hang"},
        {"name": "raw"},
        {"name": "noisy"},
        {"name": "repeat", "inputSchema": {"properties": {"text": {"type": "string"}}, "required": ["text"]}}
    ])");
}

auto answer(const nlohmann::json& id, const nlohmann::json& params) -> std::string
{
    auto const tool = params["name"].get<std::string>();
    if (tool == "ping")
        return resultLine(id, textResult("pong"));
    if (tool == "boom")
        return errorLine(id, -32000, "boom");
    if (tool == "raw")
        return resultLine(id, { { "value", 42 } });
    if (tool == "noisy")
        return "Debugger listening on ws://127.0.0.1:9229\n" + resultLine(id, textResult("noise"));
    if (tool == "repeat")
        return resultLine(id, textResult(params["arguments"]["text"].get<std::string>()));
    return {};
}

struct RouterFixture
{
    ProviderRegistry registry;
    WorkerPool pool { 8 };
    InvocationRouter router { registry, pool, 200ms };
    MockTransport* mock = nullptr;
    std::shared_ptr<ManagedProcess> process;
    std::vector<ToolProxy> tools;

    RouterFixture()
    {
        auto transport = std::make_unique<MockTransport>();
        transport->responder = providerResponder(mockTools(), answer);
        mock = transport.get();

        process = std::make_shared<ManagedProcess>(ProviderConfig { .name = "mock", .command = "unused" },
                                                   std::make_unique<McpSession>(std::move(transport), "mock"));
        auto descriptors = process->handshake(HandshakeOptions { .timeout = 200ms });
        REQUIRE(descriptors.has_value());
        for (auto& descriptor: *descriptors)
            tools.push_back(materialize(std::move(descriptor), "mock", router));
        REQUIRE(registry.add(process, tools).has_value());
    }

    auto tool(std::string_view name) const -> const ToolProxy&
    {
        for (const auto& proxy: tools)
        {
            if (proxy.name() == name)
                return proxy;
        }
        FAIL("no such tool");
        return tools.front();
    }
};

} // namespace

TEST_CASE("InvocationRouter extractText joins text content", "[router]")
{
    auto const result = nlohmann::json::parse(R"({"content": [
        {"type": "text", "text": "first"},
        {"type": "image", "data": "..."},
        {"type": "text", "text": "second"}
    ]})");

    CHECK(InvocationRouter::extractText(result) == "first\nsecond");
}

TEST_CASE("InvocationRouter extractText falls back to JSON", "[router]")
{
    CHECK(InvocationRouter::extractText(nlohmann::json { { "content", "plain" } }) == "plain");
    CHECK(InvocationRouter::extractText(nlohmann::json::parse(R"({"content": [{"type": "image"}]})"))
          == R"([{"type":"image"}])");
    CHECK(InvocationRouter::extractText(nlohmann::json { { "content", 7 } }) == "7");
    CHECK(InvocationRouter::extractText(nlohmann::json { { "value", 1 } }) == R"({"value":1})");
    CHECK(InvocationRouter::extractText("just text") == "just text");
    CHECK(InvocationRouter::extractText(nlohmann::json {}) == "null");
}

TEST_CASE("InvocationRouter describe renders error kinds", "[router]")
{
    CHECK(InvocationRouter::describe(Error { ErrorCode::UnknownProvider, "gone" })
          == "Error: MCP process 'gone' not found");
    CHECK(InvocationRouter::describe(Error { ErrorCode::InvocationTimeout, "whatever" })
          == "Error: Tool execution timed out");
    CHECK(InvocationRouter::describe(Error { ErrorCode::RemoteToolError, R"({"code":1})" })
          == R"(Error: {"code":1})");
    CHECK(InvocationRouter::describe(Error { ErrorCode::InvalidArgument, "bad" }) == "Error: invalid arguments: bad");
    CHECK(InvocationRouter::describe(Error { ErrorCode::TransportError, "Broken pipe" })
          == "Error executing tool: Broken pipe");
}

TEST_CASE("InvocationRouter returns the text of a successful call", "[router]")
{
    auto fixture = RouterFixture();

    auto result = fixture.router.route(fixture.tool("ping"), nlohmann::json::object());
    REQUIRE(result.has_value());
    CHECK(*result == "pong");

    CHECK(fixture.tool("ping").invoke() == "pong");
    CHECK(fixture.tool("raw").invoke() == R"({"value":42})");
    CHECK(fixture.tool("repeat").invoke({ { "text", "again" } }) == "again");
}

TEST_CASE("InvocationRouter reports remote errors verbatim", "[router]")
{
    auto fixture = RouterFixture();

    auto result = fixture.router.route(fixture.tool("boom"), nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::RemoteToolError);

    CHECK(fixture.tool("boom").invoke() == R"(Error: {"code":-32000,"message":"boom"})");
    CHECK(fixture.process->state() == ProcessState::Ready);
}

TEST_CASE("InvocationRouter times out and keeps the process ready", "[router]")
{
    auto fixture = RouterFixture();

    auto result = fixture.router.route(fixture.tool("hang"), nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvocationTimeout);
    CHECK(fixture.process->state() == ProcessState::Ready);

    CHECK(fixture.tool("hang").invoke() == "Error: Tool execution timed out");
    CHECK(fixture.tool("ping").invoke() == "pong");
}

TEST_CASE("InvocationRouter validates arguments before sending", "[router]")
{
    auto fixture = RouterFixture();
    auto const sentBefore = fixture.mock->sentCount();

    auto const text = fixture.tool("repeat").invoke();

    CHECK(text == "Error: invalid arguments: Missing required parameter 'text' for tool 'repeat'");
    CHECK(fixture.mock->sentCount() == sentBefore);
}

TEST_CASE("InvocationRouter reports unknown providers", "[router]")
{
    auto fixture = RouterFixture();
    auto const orphan = materialize(ToolDescriptor { .name = "ping" }, "ghost", fixture.router);

    auto result = fixture.router.route(orphan, nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::UnknownProvider);
    CHECK(orphan.invoke() == "Error: MCP process 'ghost' not found");
}

TEST_CASE("InvocationRouter refuses providers that are not ready", "[router]")
{
    auto fixture = RouterFixture();
    fixture.process->terminate();

    auto result = fixture.router.route(fixture.tool("ping"), nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
    CHECK(fixture.tool("ping").invoke() == "Error executing tool: Provider 'mock' is terminated");
}

TEST_CASE("InvocationRouter marks the provider failed on a transport error", "[router]")
{
    auto fixture = RouterFixture();
    fixture.mock->disconnect(true);

    auto result = fixture.router.route(fixture.tool("ping"), nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
    CHECK(fixture.process->state() == ProcessState::Failed);
    REQUIRE(fixture.process->lastError().has_value());
}

TEST_CASE("InvocationRouter keeps the provider ready after an undecodable line", "[router]")
{
    auto fixture = RouterFixture();

    auto result = fixture.router.route(fixture.tool("noisy"), nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::MalformedMessage);
    CHECK(fixture.process->state() == ProcessState::Ready);
    CHECK(!fixture.process->lastError().has_value());

    CHECK(fixture.tool("ping").invoke() == "pong");
    CHECK(fixture.tool("ping").invoke() == "pong");
}

TEST_CASE("InvocationRouter marks the provider terminated when it has exited", "[router]")
{
    auto fixture = RouterFixture();
    fixture.mock->disconnect(false);

    auto result = fixture.router.route(fixture.tool("ping"), nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(fixture.process->state() == ProcessState::Terminated);
}

TEST_CASE("InvocationRouter serializes concurrent calls to one provider", "[router]")
{
    auto fixture = RouterFixture();
    fixture.mock->replyDelay = 5ms;

    auto futures = std::vector<std::future<std::string>> {};
    for (auto i = 0; i < 16; ++i)
        futures.push_back(fixture.tool("repeat").call({ { "text", std::to_string(i) } }));

    for (auto i = 0; i < 16; ++i)
        CHECK(futures[static_cast<std::size_t>(i)].get() == std::to_string(i));

    CHECK(fixture.mock->maxInFlight() == 1);
}
