// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcplink;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "tools/list");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "tools/list");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "name", "read_file" } };
    auto request = jsonrpc::makeRequest(42, "tools/call", params);

    CHECK(request["id"] == 42);
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["name"] == "read_file");
}

TEST_CASE("makeNotification creates a message without id", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "notifications/initialized");
}

TEST_CASE("encode produces a single line", "[jsonrpc]")
{
    auto const text = jsonrpc::encode(jsonrpc::makeRequest(7, "ping", { { "note", "a\nb" } }));
    CHECK(text.find('\n') == std::string::npos);
    CHECK(text.starts_with("{"));
}

TEST_CASE("decode classifies a success response", "[jsonrpc]")
{
    auto message = jsonrpc::decode(R"({"jsonrpc":"2.0","id":3,"result":{"status":"ok"}})");
    REQUIRE(message.has_value());

    auto const* response = std::get_if<jsonrpc::Response>(&*message);
    REQUIRE(response != nullptr);
    CHECK(response->id == 3);
    CHECK(response->isSuccess());
    CHECK(response->result->at("status") == "ok");
}

TEST_CASE("decode classifies an error response", "[jsonrpc]")
{
    auto message =
        jsonrpc::decode(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found"}})");
    REQUIRE(message.has_value());

    auto const* response = std::get_if<jsonrpc::Response>(&*message);
    REQUIRE(response != nullptr);
    CHECK(!response->isSuccess());
    REQUIRE(response->error.has_value());
    CHECK(response->error->code == jsonrpc::codes::MethodNotFound);
    CHECK(response->error->message == "Method not found");
}

TEST_CASE("decode classifies server requests and notifications", "[jsonrpc]")
{
    auto request = jsonrpc::decode(R"({"jsonrpc":"2.0","id":"abc","method":"ping"})");
    REQUIRE(request.has_value());
    REQUIRE(std::holds_alternative<jsonrpc::Request>(*request));
    CHECK(std::get<jsonrpc::Request>(*request).id == "abc");

    auto notification = jsonrpc::decode(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");
    REQUIRE(notification.has_value());
    REQUIRE(std::holds_alternative<jsonrpc::Notification>(*notification));
    CHECK(std::get<jsonrpc::Notification>(*notification).method == "notifications/tools/list_changed");
}

TEST_CASE("decode rejects malformed frames with ProtocolError", "[jsonrpc]")
{
    SECTION("not JSON")
    {
        auto message = jsonrpc::decode("{not json");
        REQUIRE(!message.has_value());
        CHECK(message.error().code == ErrorCode::ProtocolError);
    }

    SECTION("wrong version")
    {
        auto message = jsonrpc::decode(R"({"jsonrpc":"1.0","id":1,"result":{}})");
        REQUIRE(!message.has_value());
        CHECK(message.error().code == ErrorCode::ProtocolError);
    }

    SECTION("response without id")
    {
        auto message = jsonrpc::decode(R"({"jsonrpc":"2.0","result":{}})");
        REQUIRE(!message.has_value());
        CHECK(message.error().code == ErrorCode::ProtocolError);
    }

    SECTION("neither result nor error")
    {
        auto message = jsonrpc::decode(R"({"jsonrpc":"2.0","id":1})");
        REQUIRE(!message.has_value());
        CHECK(message.error().code == ErrorCode::ProtocolError);
    }
}

TEST_CASE("makeResult and makeErrorResponse echo the request id", "[jsonrpc]")
{
    auto const id = nlohmann::json("srv-1");

    auto result = jsonrpc::makeResult(id, nlohmann::json::object());
    CHECK(result["id"] == "srv-1");
    CHECK(result["result"].is_object());

    auto error = jsonrpc::makeErrorResponse(id, jsonrpc::codes::MethodNotFound, "nope");
    CHECK(error["id"] == "srv-1");
    CHECK(error["error"]["code"] == -32601);
    CHECK(error["error"]["message"] == "nope");
}

TEST_CASE("IdGenerator hands out increasing ids", "[jsonrpc]")
{
    auto ids = jsonrpc::IdGenerator {};
    auto const first = ids.next();
    auto const second = ids.next();
    CHECK(first == 1);
    CHECK(second == 2);
}
