#include <gtest/gtest.h>
#include "pipe_harness.hpp"
#include <chrono>

using namespace mockmcp;
using mockmcp::test_support::PipeHarness;
using nlohmann::json;

TEST(StdioLifecycle, FullHandshake) {
    PipeHarness h;

    auto init = h.request({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                           {"params", {{"protocolVersion", "2025-03-26"},
                                       {"capabilities", json::object()},
                                       {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}}}}});
    EXPECT_EQ(init["jsonrpc"], "2.0");
    EXPECT_EQ(init["id"], 1);
    EXPECT_EQ(init["result"]["protocolVersion"], "2025-03-26");
    EXPECT_EQ(init["result"]["serverInfo"]["name"], "mock-mcp-server");

    // Notification: nothing comes back; the next response belongs to id 2.
    h.send({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    auto list = h.request({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    EXPECT_EQ(list["id"], 2);
    EXPECT_EQ(list["result"]["tools"].size(), 4u);

    h.close_input();
    EXPECT_TRUE(h.wait_for_exit());
}

TEST(StdioLifecycle, NotificationProducesNoOutput) {
    PipeHarness h;
    h.send({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    EXPECT_FALSE(h.read_line(std::chrono::milliseconds(100)).has_value());
}

TEST(StdioLifecycle, ServeReturnsWhenInputCloses) {
    PipeHarness h;
    h.close_input();
    EXPECT_TRUE(h.wait_for_exit());
    EXPECT_FALSE(h.server().is_running());
}

TEST(StdioLifecycle, ShutdownStopsServing) {
    PipeHarness h;
    auto resp = h.request({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    EXPECT_EQ(resp["id"], 1);

    h.server().shutdown();
    EXPECT_TRUE(h.wait_for_exit());
}

TEST(StdioLifecycle, BlankLinesAreIgnored) {
    PipeHarness h;
    h.write_raw("\n   \n\r\n");
    auto resp = h.request({{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/list"}});
    EXPECT_EQ(resp["id"], 7);
}

TEST(StdioLifecycle, UnterminatedLastLineIsAnswered) {
    PipeHarness h;
    h.write_raw(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})");
    h.close_input();
    auto resp = h.read_json();
    EXPECT_EQ(resp["id"], 3);
    EXPECT_TRUE(h.wait_for_exit());
}

TEST(StdioLifecycle, ParseErrorKeepsServing) {
    PipeHarness h;
    h.write_raw("{bad json\n");
    auto err = h.read_json();
    EXPECT_TRUE(err["id"].is_null());
    EXPECT_EQ(err["error"]["code"], -32700);

    auto resp = h.request({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/list"}});
    EXPECT_EQ(resp["id"], 4);

    h.close_input();
    ASSERT_TRUE(h.wait_for_exit());
    EXPECT_NE(h.log().find("parse error"), std::string::npos);
}

TEST(StdioLifecycle, UnknownMethodAnswered) {
    PipeHarness h;
    auto resp = h.request({{"jsonrpc", "2.0"}, {"id", 5}, {"method", "prompts/list"}});
    EXPECT_EQ(resp["error"]["code"], -32601);
    EXPECT_EQ(resp["error"]["message"], "Method not found: prompts/list");
}
