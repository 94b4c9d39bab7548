#include "mcp/Handlers.hpp"
#include "tools/EchoTool.hpp"
#include <gtest/gtest.h>

using namespace mini_mcp;
using json = nlohmann::json;

class HandlersTest : public ::testing::Test {
protected:
    HandlersTest()
        : executor(registry),
          context{info, registry, executor, reader} {
    }

    void register_echo() {
        auto echo = std::make_shared<EchoTool>();
        registry.register_tool(EchoTool::get_info(),
            [echo](const json& args) { return echo->execute(args); });
    }

    static Request make_request(const std::string& method, const json& params = json::object()) {
        return Request{"2.0", 42, method, params};
    }

    ServerInfo info{"handlers-test", "0.0.1"};
    Registry registry;
    ResourceReader reader;
    ToolExecutor executor;
    HandlerContext context;
};

TEST_F(HandlersTest, InitializeAdvertisesCapabilities) {
    Response response = handle_initialize(make_request("initialize"), context);

    ASSERT_FALSE(response.is_error());
    const json& result = response.result();
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_EQ(result["capabilities"]["tools"]["listChanged"], true);
    EXPECT_EQ(result["capabilities"]["resources"]["subscribe"], true);
    EXPECT_EQ(result["capabilities"]["resources"]["listChanged"], true);
    EXPECT_EQ(result["serverInfo"]["name"], "handlers-test");
    EXPECT_EQ(result["serverInfo"]["version"], "0.0.1");
}

TEST_F(HandlersTest, InitializeIsIdempotent) {
    json client_params = {{"clientInfo", {{"name", "client"}, {"version", "1"}}}};

    std::string first = to_json(handle_initialize(make_request("initialize"), context)).dump();
    std::string second = to_json(handle_initialize(make_request("initialize", client_params), context)).dump();
    std::string third = to_json(handle_initialize(make_request("initialize", json()), context)).dump();

    EXPECT_EQ(first, second);
    EXPECT_EQ(first, third);
}

TEST_F(HandlersTest, ToolsListExactlyRegisteredTools) {
    registry.register_tool({"B", "tool b", {{"type", "object"}}},
        [](const json&) -> ToolOutcome { return json::object(); });
    registry.register_tool({"A", "tool a", {{"type", "object"}}},
        [](const json&) -> ToolOutcome { return json::object(); });

    json first = handle_tools_list(make_request("tools/list"), context).result();
    json second = handle_tools_list(make_request("tools/list"), context).result();

    ASSERT_EQ(first["tools"].size(), 2u);
    EXPECT_EQ(first["tools"][0]["name"], "A");
    EXPECT_EQ(first["tools"][1]["name"], "B");
    EXPECT_EQ(first["tools"][0]["description"], "tool a");
    EXPECT_EQ(first, second);
}

TEST_F(HandlersTest, ToolsCallEcho) {
    register_echo();

    Response response = handle_tools_call(make_request("tools/call", {
        {"name", "echo"},
        {"arguments", {{"message", "hi"}}}
    }), context);

    ASSERT_FALSE(response.is_error());
    const json& content = response.result()["content"];
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]["type"], "text");
    EXPECT_EQ(content[0]["text"], "Echo: hi");
}

TEST_F(HandlersTest, ToolsCallBadArgumentsIsApplicationError) {
    register_echo();

    for (const json& arguments : {json::object(), json(), json("hi"), json{{"message", 1}}}) {
        Response response = handle_tools_call(make_request("tools/call", {
            {"name", "echo"},
            {"arguments", arguments}
        }), context);

        ASSERT_FALSE(response.is_error()) << arguments;
        EXPECT_TRUE(response.result().contains("error")) << arguments;
        EXPECT_TRUE(response.result()["error"].is_string());
    }
}

TEST_F(HandlersTest, ToolsCallMissingArgumentsPassesNull) {
    json seen = "unset";
    registry.register_tool({"spy", "", json::object()},
        [&seen](const json& args) -> ToolOutcome {
            seen = args;
            return json::object();
        });

    handle_tools_call(make_request("tools/call", {{"name", "spy"}}), context);

    EXPECT_TRUE(seen.is_null());
}

TEST_F(HandlersTest, ToolsCallUnknownTool) {
    register_echo();

    Response response = handle_tools_call(make_request("tools/call", {
        {"name", "does_not_exist"},
        {"arguments", json::object()}
    }), context);

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, error_code::MethodNotFound);
    EXPECT_EQ(response.error().message, "Tool not found");
}

TEST_F(HandlersTest, ToolsCallInvalidParams) {
    register_echo();

    for (const json& params : {json(), json::array(), json("echo"), json::object(),
                               json{{"name", 5}}, json{{"arguments", json::object()}}}) {
        Response response = handle_tools_call(make_request("tools/call", params), context);

        ASSERT_TRUE(response.is_error()) << params;
        EXPECT_EQ(response.error().code, error_code::InvalidParams);
        EXPECT_EQ(response.error().message, "Invalid parameters");
    }
}

TEST_F(HandlersTest, ResourcesList) {
    registry.register_resource({"https://example.com", "web", "Web page", "text/html"});
    registry.register_resource({"file:///a.txt", "a", "File A", "text/plain"});

    json result = handle_resources_list(make_request("resources/list"), context).result();

    ASSERT_EQ(result["resources"].size(), 2u);
    EXPECT_EQ(result["resources"][0]["uri"], "file:///a.txt");
    EXPECT_EQ(result["resources"][0]["mimeType"], "text/plain");
    EXPECT_EQ(result["resources"][1]["uri"], "https://example.com");
    EXPECT_EQ(result["resources"][1]["description"], "Web page");
    EXPECT_EQ(result, handle_resources_list(make_request("resources/list"), context).result());
}

TEST_F(HandlersTest, ResourcesListEmpty) {
    json result = handle_resources_list(make_request("resources/list"), context).result();
    EXPECT_TRUE(result["resources"].is_array());
    EXPECT_TRUE(result["resources"].empty());
}

TEST_F(HandlersTest, ResourcesReadFile) {
    Response response = handle_resources_read(
        make_request("resources/read", {{"uri", "file:///a.txt"}}), context);

    ASSERT_FALSE(response.is_error());
    const json& contents = response.result()["contents"];
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(contents[0]["uri"], "file:///a.txt");
    EXPECT_EQ(contents[0]["mimeType"], "text/plain");
    EXPECT_FALSE(contents[0]["text"].get<std::string>().empty());
}

TEST_F(HandlersTest, ResourcesReadHttps) {
    Response response = handle_resources_read(
        make_request("resources/read", {{"uri", "https://example.com/doc"}}), context);

    ASSERT_FALSE(response.is_error());
    EXPECT_EQ(response.result()["contents"][0]["text"], "Web content of https://example.com/doc");
}

TEST_F(HandlersTest, ResourcesReadInvalidScheme) {
    for (const std::string uri : {"ftp://x", "http://example.com", "", "/etc/passwd"}) {
        Response response = handle_resources_read(
            make_request("resources/read", {{"uri", uri}}), context);

        ASSERT_TRUE(response.is_error()) << uri;
        EXPECT_EQ(response.error().code, error_code::InvalidParams);
        EXPECT_EQ(response.error().message, "Invalid URI scheme");
    }
}

TEST_F(HandlersTest, ResourcesReadInvalidParams) {
    Response not_object = handle_resources_read(make_request("resources/read", json::array()), context);
    ASSERT_TRUE(not_object.is_error());
    EXPECT_EQ(not_object.error().code, error_code::InvalidParams);
    EXPECT_EQ(not_object.error().message, "Invalid parameters");

    Response missing_uri = handle_resources_read(make_request("resources/read"), context);
    ASSERT_TRUE(missing_uri.is_error());
    EXPECT_EQ(missing_uri.error().code, error_code::InvalidParams);
    EXPECT_EQ(missing_uri.error().message, "URI is required");

    Response numeric_uri = handle_resources_read(make_request("resources/read", {{"uri", 7}}), context);
    ASSERT_TRUE(numeric_uri.is_error());
    EXPECT_EQ(numeric_uri.error().code, error_code::InvalidParams);
}

TEST(DecodeParamsTest, ToolCall) {
    ToolCallParams params = decode_tool_call_params({{"name", "echo"}, {"arguments", {{"message", "x"}}}});
    EXPECT_EQ(params.name, "echo");
    EXPECT_EQ(params.arguments["message"], "x");

    EXPECT_THROW(decode_tool_call_params(json::array()), InvalidParams);
}

TEST(DecodeParamsTest, ResourceRead) {
    EXPECT_EQ(decode_resource_read_params({{"uri", "file:///x"}}).uri, "file:///x");
    EXPECT_THROW(decode_resource_read_params(json()), InvalidParams);
    EXPECT_THROW(decode_resource_read_params({{"uri", nullptr}}), InvalidParams);
}
