#include "services/mcp/client.hpp"
#include <gtest/gtest.h>

using namespace vigil::services::mcp;
using namespace std::chrono_literals;

namespace {

// A server scripted in sh: answers the initialize handshake, skips the
// initialized notification, then prints the given reply to the next request.
McpServer scripted_server(const std::string& name, const std::string& reply) {
    std::string script =
        "read l; echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"capabilities\":{}}}'; "
        "read l; read l; "
        "echo 'starting up'; "
        "echo '{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\"}'; "
        "echo '" + reply + "'; cat >/dev/null";
    return McpServer{name, "/bin/sh", {"-c", script}, std::nullopt};
}

McpConfigResult config_with(std::vector<McpServer> servers) {
    McpConfigResult config;
    config.path = ".mcp.json";
    config.servers = std::move(servers);
    return config;
}

} // namespace

TEST(McpClientTest, ServerNamesFollowConfigOrder) {
    McpClient client(config_with({
        McpServer{"b", "true", {}, std::nullopt},
        McpServer{"a", "true", {}, std::nullopt},
    }));
    EXPECT_EQ(client.server_names(), (std::vector<std::string>{"b", "a"}));
}

TEST(McpClientTest, ListsResources) {
    McpClient client(config_with({scripted_server("docs",
        R"({"jsonrpc":"2.0","id":2,"result":{"resources":[)"
        R"({"uri":"file:///a.md","name":"A","description":"first","mimeType":"text/markdown"},)"
        R"({"uri":"file:///b.md"}]}})")}), 5s);

    auto resources = client.list_resources("docs");
    ASSERT_EQ(resources.size(), 2u);
    EXPECT_EQ(resources[0].uri, "file:///a.md");
    EXPECT_EQ(resources[0].name, "A");
    EXPECT_EQ(resources[0].description, "first");
    EXPECT_EQ(resources[0].mime_type, "text/markdown");
    EXPECT_EQ(resources[1].name, "file:///b.md");
    EXPECT_FALSE(resources[1].mime_type.has_value());
}

TEST(McpClientTest, ReadJoinsTextParts) {
    McpClient client(config_with({scripted_server("docs",
        R"({"jsonrpc":"2.0","id":2,"result":{"contents":[)"
        R"({"uri":"file:///a.md","text":"line one"},)"
        R"({"uri":"file:///a.md","blob":"AAAA"},)"
        R"({"uri":"file:///a.md","text":"line two"}]}})")}), 5s);

    EXPECT_EQ(client.read_resource("docs", "file:///a.md"),
              "line one\n[Binary data: 4 bytes]\nline two");
}

TEST(McpClientTest, ServerErrorIsReportedAsText) {
    McpClient client(config_with({scripted_server("docs",
        R"({"jsonrpc":"2.0","id":2,"error":{"code":-32002,"message":"Resource not found"}})")}), 5s);

    EXPECT_EQ(client.read_resource("docs", "file:///missing"),
              "Error reading resource: Resource not found");
}

TEST(McpClientTest, UnknownServer) {
    McpClient client(config_with({}));
    EXPECT_EQ(client.read_resource("nope", "x"), "Server not found: nope");
    EXPECT_TRUE(client.list_resources("nope").empty());
}

TEST(McpClientTest, MissingExecutableYieldsNothing) {
    McpClient client(config_with({McpServer{"ghost", "/nonexistent/vigil-mcp-server", {}, std::nullopt}}), 2s);
    EXPECT_TRUE(client.list_resources("ghost").empty());
    EXPECT_EQ(client.read_resource("ghost", "x").rfind("Error reading resource:", 0), 0u);
}

TEST(McpClientTest, SilentServerTimesOut) {
    McpClient client(config_with({McpServer{"mute", "/bin/sh", {"-c", "exec sleep 5"}, std::nullopt}}), 200ms);
    EXPECT_EQ(client.read_resource("mute", "x"),
              "Error reading resource: timed out waiting for server response");
}
