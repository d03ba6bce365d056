// SPDX-License-Identifier: Apache-2.0
#include <mcp/McpSession.hpp>

#include <catch2/catch_test_macros.hpp>

#include "MockTransport.hpp"

using namespace toolbridge;
using namespace toolbridge::testing;
using namespace std::chrono_literals;

namespace
{

auto sampleTools() -> nlohmann::json
{
    return nlohmann::json::parse(R"([
        {"name": "ping", "description": "Answers pong", "inputSchema": {"type": "object", "properties": {}}},
        {"name": "add", "description": "Adds", "inputSchema": {
            "type": "object",
            "properties": {"a": {"type": "integer"}, "b": {"type": "integer"}},
            "required": ["a", "b"]}}
    ])");
}

auto shortOptions() -> HandshakeOptions
{
    return HandshakeOptions { .timeout = 200ms };
}

struct SessionFixture
{
    MockTransport* mock = nullptr;
    std::unique_ptr<McpSession> session;

    SessionFixture()
    {
        auto transport = std::make_unique<MockTransport>();
        mock = transport.get();
        session = std::make_unique<McpSession>(std::move(transport), "mock");
    }
};

} // namespace

TEST_CASE("McpSession handshake sends initialize, notification and tools/list", "[session]")
{
    auto fixture = SessionFixture();
    fixture.mock->responder = providerResponder(sampleTools(), nullptr);

    auto tools = fixture.session->handshake(HandshakeOptions { .clientName = "tests", .clientVersion = "9.9" });

    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 2);
    CHECK((*tools)[0].name == "ping");
    CHECK((*tools)[1].name == "add");
    CHECK((*tools)[1].parameters.size() == 2);
    CHECK(fixture.session->step() == HandshakeStep::Ready);
    CHECK(fixture.session->serverInfo().name == "mock");
    CHECK(fixture.session->serverInfo().version == "0.1");

    auto const& sent = fixture.mock->sentMessages;
    REQUIRE(sent.size() == 3);
    CHECK(sent[0]["method"] == "initialize");
    CHECK(sent[0]["id"] == McpSession::InitializeRequestId);
    CHECK(sent[0]["params"]["protocolVersion"] == "2025-03-26");
    CHECK(sent[0]["params"]["clientInfo"]["name"] == "tests");
    CHECK(sent[0]["params"]["clientInfo"]["version"] == "9.9");
    CHECK(sent[0]["params"]["capabilities"].empty());
    CHECK(sent[1]["method"] == "notifications/initialized");
    CHECK(!sent[1].contains("id"));
    CHECK(sent[2]["method"] == "tools/list");
    CHECK(sent[2]["id"] == McpSession::ToolsListRequestId);
}

TEST_CASE("McpSession handshake fails when initialize is not answered", "[session]")
{
    auto fixture = SessionFixture();
    fixture.mock->stderrText = "provider: missing API key\n";

    auto tools = fixture.session->handshake(shortOptions());

    REQUIRE(!tools.has_value());
    CHECK(tools.error().code == ErrorCode::HandshakeFailure);
    CHECK(tools.error().message.starts_with("initialize failed: No response within 200 ms"));
    CHECK(tools.error().message.ends_with("Stderr: provider: missing API key"));
    CHECK(fixture.session->step() == HandshakeStep::Failed);
    CHECK(fixture.mock->sentMessages.size() == 1);
}

TEST_CASE("McpSession handshake fails on an unparsable initialize response", "[session]")
{
    auto fixture = SessionFixture();
    fixture.mock->queueLine("Starting server...");

    auto tools = fixture.session->handshake(shortOptions());

    REQUIRE(!tools.has_value());
    CHECK(tools.error().code == ErrorCode::HandshakeFailure);
    CHECK(fixture.session->step() == HandshakeStep::Failed);
}

TEST_CASE("McpSession handshake fails on an initialize error response", "[session]")
{
    auto fixture = SessionFixture();
    fixture.mock->responder = [](const nlohmann::json& message) {
        return std::vector<std::string> { errorLine(message["id"], -32602, "Unsupported protocol version") };
    };

    auto tools = fixture.session->handshake(shortOptions());

    REQUIRE(!tools.has_value());
    CHECK(tools.error().code == ErrorCode::HandshakeFailure);
    CHECK(tools.error().message.find("Unsupported protocol version") != std::string::npos);
}

TEST_CASE("McpSession handshake fails when the provider goes away", "[session]")
{
    auto fixture = SessionFixture();
    fixture.mock->disconnect(false);

    auto tools = fixture.session->handshake(shortOptions());

    REQUIRE(!tools.has_value());
    CHECK(tools.error().code == ErrorCode::HandshakeFailure);
}

TEST_CASE("McpSession treats a missing tools array as zero tools", "[session]")
{
    auto fixture = SessionFixture();
    fixture.mock->responder = [](const nlohmann::json& message) {
        auto const method = message.value("method", "");
        if (method == "initialize")
            return std::vector<std::string> { resultLine(message["id"], nlohmann::json::object()) };
        if (method == "tools/list")
            return std::vector<std::string> { resultLine(message["id"], { { "tools", "none" } }) };
        return std::vector<std::string> {};
    };

    auto tools = fixture.session->handshake(shortOptions());

    REQUIRE(tools.has_value());
    CHECK(tools->empty());
    CHECK(fixture.session->step() == HandshakeStep::Ready);
    CHECK(fixture.session->serverInfo().name == "unknown");
}

TEST_CASE("McpSession skips invalid and duplicate tool entries", "[session]")
{
    auto fixture = SessionFixture();
    fixture.mock->responder = providerResponder(nlohmann::json::parse(R"([
        {"name": "first", "description": "kept"},
        {"description": "no name"},
        42,
        {"name": "first", "description": "duplicate"},
        {"name": "second"}
    ])"),
                                                nullptr);

    auto tools = fixture.session->handshake(shortOptions());

    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 2);
    CHECK((*tools)[0].name == "first");
    CHECK((*tools)[0].description == "kept");
    CHECK((*tools)[1].name == "second");
}

TEST_CASE("McpSession answers provider requests during the handshake", "[session]")
{
    auto fixture = SessionFixture();
    auto inner = providerResponder(sampleTools(), nullptr);
    fixture.mock->responder = [&inner](const nlohmann::json& message) {
        auto replies = std::vector<std::string> {};
        if (message.value("method", "") == "initialize")
        {
            replies.push_back(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info"}})");
            replies.push_back(R"({"jsonrpc":"2.0","id":"srv-1","method":"roots/list"})");
        }
        for (auto& reply: inner(message))
            replies.push_back(std::move(reply));
        return replies;
    };

    auto tools = fixture.session->handshake(shortOptions());

    REQUIRE(tools.has_value());
    CHECK(tools->size() == 2);

    auto const& sent = fixture.mock->sentMessages;
    REQUIRE(sent.size() == 4);
    CHECK(sent[1]["id"] == "srv-1");
    CHECK(sent[1]["error"]["code"] == -32601);
    CHECK(sent[2]["method"] == "notifications/initialized");
}

TEST_CASE("McpSession callTool requires a completed handshake", "[session]")
{
    auto fixture = SessionFixture();

    auto result = fixture.session->callTool("ping", nlohmann::json::object(), 100ms);

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
    CHECK(fixture.mock->sentMessages.empty());
}

TEST_CASE("McpSession callTool uses increasing request ids", "[session]")
{
    auto fixture = SessionFixture();
    fixture.mock->responder = providerResponder(sampleTools(), [](const nlohmann::json& id, const nlohmann::json& params) {
        return resultLine(id, textResult(params["name"].get<std::string>()));
    });
    REQUIRE(fixture.session->handshake(shortOptions()).has_value());

    auto first = fixture.session->callTool("ping", nullptr, 200ms);
    auto second = fixture.session->callTool("add", { { "a", 1 }, { "b", 2 } }, 200ms);

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK((*first)["content"][0]["text"] == "ping");
    CHECK((*second)["content"][0]["text"] == "add");

    auto const& sent = fixture.mock->sentMessages;
    REQUIRE(sent.size() == 5);
    CHECK(sent[3]["id"] == McpSession::FirstCallRequestId);
    CHECK(sent[3]["params"]["arguments"] == nlohmann::json::object());
    CHECK(sent[4]["id"] == McpSession::FirstCallRequestId + 1);
    CHECK(sent[4]["params"]["arguments"]["a"] == 1);
}

TEST_CASE("McpSession callTool maps an error response to RemoteToolError", "[session]")
{
    auto fixture = SessionFixture();
    fixture.mock->responder = providerResponder(sampleTools(), [](const nlohmann::json& id, const nlohmann::json&) {
        return errorLine(id, -32000, "boom");
    });
    REQUIRE(fixture.session->handshake(shortOptions()).has_value());

    auto result = fixture.session->callTool("ping", nlohmann::json::object(), 200ms);

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::RemoteToolError);
    CHECK(result.error().message == R"({"code":-32000,"message":"boom"})");
}

TEST_CASE("McpSession callTool times out and discards the late reply", "[session]")
{
    auto fixture = SessionFixture();
    auto callCount = 0;
    fixture.mock->responder = providerResponder(sampleTools(), [&](const nlohmann::json& id, const nlohmann::json&) {
        // The first call goes unanswered; its reply shows up ahead of the second one.
        if (++callCount == 1)
            return std::string {};
        return resultLine(3, textResult("late")) + "\n" + resultLine(id, textResult("on time"));
    });
    REQUIRE(fixture.session->handshake(shortOptions()).has_value());

    auto timedOut = fixture.session->callTool("ping", nlohmann::json::object(), 50ms);
    REQUIRE(!timedOut.has_value());
    CHECK(timedOut.error().code == ErrorCode::InvocationTimeout);
    CHECK(fixture.session->step() == HandshakeStep::Ready);

    auto next = fixture.session->callTool("ping", nlohmann::json::object(), 200ms);
    REQUIRE(next.has_value());
    CHECK((*next)["content"][0]["text"] == "on time");
}

TEST_CASE("McpSession callTool reports a closed channel as TransportError", "[session]")
{
    auto fixture = SessionFixture();
    fixture.mock->responder = providerResponder(sampleTools(), nullptr);
    REQUIRE(fixture.session->handshake(shortOptions()).has_value());

    fixture.mock->responder = nullptr;
    fixture.mock->disconnect(false);

    auto result = fixture.session->callTool("ping", nlohmann::json::object(), 200ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("McpSession callTool fails only the call that reads an undecodable line", "[session]")
{
    auto fixture = SessionFixture();
    auto callCount = 0;
    fixture.mock->responder = providerResponder(sampleTools(), [&](const nlohmann::json& id, const nlohmann::json&) {
        if (++callCount == 1)
            return "Debugger listening on ws://127.0.0.1:9229\n" + resultLine(id, textResult("first"));
        return resultLine(id, textResult("second"));
    });
    REQUIRE(fixture.session->handshake(shortOptions()).has_value());

    auto broken = fixture.session->callTool("ping", nlohmann::json::object(), 200ms);
    REQUIRE(!broken.has_value());
    CHECK(broken.error().code == ErrorCode::MalformedMessage);
    CHECK(fixture.session->step() == HandshakeStep::Ready);

    auto next = fixture.session->callTool("ping", nlohmann::json::object(), 200ms);
    REQUIRE(next.has_value());
    CHECK((*next)["content"][0]["text"] == "second");
}
