#include <gtest/gtest.h>
#include "mcp/Correlator.h"
#include "mcp/McpErrors.h"
#include "FakeTransport.h"
#include <chrono>
#include <future>
#include <thread>

using namespace std::chrono_literals;

class CorrelatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_shared<FakeServer>();
        transport = std::make_shared<FakeTransport>(server);
        transport->start(ServerCommand{},
                         [this](const std::string& line) { correlator.handleLine(line); },
                         [](int) {});
        correlator.attach(transport);
    }

    // Waits until a request for method has been written.
    nlohmann::json waitForRequest(const std::string& method) {
        for (int i = 0; i < 200; ++i) {
            auto reqs = server->requests(method);
            if (!reqs.empty()) return reqs.back();
            std::this_thread::sleep_for(5ms);
        }
        return nullptr;
    }

    std::shared_ptr<FakeServer> server;
    std::shared_ptr<FakeTransport> transport;
    Correlator correlator;
};

TEST_F(CorrelatorTest, ReturnsResultOfMatchingResponse) {
    server->on("echo", [](const nlohmann::json& req) {
        return FakeServer::reply(req, {{"echo", req["params"]["value"]}});
    });
    auto result = correlator.call("echo", {{"value", 42}}, 1s);
    EXPECT_EQ(result["echo"], 42);
    EXPECT_EQ(correlator.pendingCount(), 0u);

    auto sent = server->requests("echo");
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["jsonrpc"], "2.0");
    EXPECT_TRUE(sent[0]["id"].is_number_integer());
}

TEST_F(CorrelatorTest, IdsAreUniqueAndIncreasing) {
    correlator.call("ping", nullptr, 1s);
    correlator.call("ping", nullptr, 1s);
    correlator.call("ping", nullptr, 1s);
    auto sent = server->requests("ping");
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_LT(sent[0]["id"].get<int64_t>(), sent[1]["id"].get<int64_t>());
    EXPECT_LT(sent[1]["id"].get<int64_t>(), sent[2]["id"].get<int64_t>());
    EXPECT_FALSE(sent[0].contains("params"));
    EXPECT_EQ(correlator.lastIssuedId(), sent[2]["id"].get<int64_t>());
}

TEST_F(CorrelatorTest, OutOfOrderResponsesReachTheirCallers) {
    server->on("slow", [](const nlohmann::json&) { return nlohmann::json(); });

    auto first = std::async(std::launch::async, [this] {
        return correlator.call("slow", {{"n", 1}}, 2s);
    });
    auto req1 = waitForRequest("slow");
    ASSERT_FALSE(req1.is_null());

    auto second = std::async(std::launch::async, [this] {
        return correlator.call("slow", {{"n", 2}}, 2s);
    });
    nlohmann::json req2;
    for (int i = 0; i < 200 && server->requests("slow").size() < 2; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    auto reqs = server->requests("slow");
    ASSERT_EQ(reqs.size(), 2u);
    req2 = reqs[1];

    transport->deliver(FakeServer::reply(req2, {{"n", 2}}).dump());
    transport->deliver(FakeServer::reply(req1, {{"n", 1}}).dump());

    EXPECT_EQ(first.get()["n"], 1);
    EXPECT_EQ(second.get()["n"], 2);
}

TEST_F(CorrelatorTest, TimeoutFailsOnlyThatCallAndLateResponseIsDropped) {
    server->on("never", [](const nlohmann::json&) { return nlohmann::json(); });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(correlator.call("never", nullptr, 50ms), TimeoutError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
    EXPECT_EQ(correlator.pendingCount(), 0u);

    // The late answer matches nothing and is dropped.
    auto req = server->requests("never").at(0);
    transport->deliver(FakeServer::reply(req, {{"late", true}}).dump());

    // The connection stays usable.
    EXPECT_NO_THROW(correlator.call("ping", nullptr, 1s));
}

TEST_F(CorrelatorTest, TimeoutLeavesConcurrentCallPending) {
    server->on("slow", [](const nlohmann::json&) { return nlohmann::json(); });
    server->on("never", [](const nlohmann::json&) { return nlohmann::json(); });

    auto slow = std::async(std::launch::async, [this] {
        return correlator.call("slow", {{"n", 1}}, 2s);
    });
    auto slowReq = waitForRequest("slow");
    ASSERT_FALSE(slowReq.is_null());

    EXPECT_THROW(correlator.call("never", nullptr, 20ms), TimeoutError);
    EXPECT_EQ(correlator.pendingCount(), 1u);

    transport->deliver(FakeServer::reply(slowReq, {{"n", 1}}).dump());
    ASSERT_EQ(slow.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(slow.get()["n"], 1);
    EXPECT_EQ(correlator.pendingCount(), 0u);
}

TEST_F(CorrelatorTest, ErrorResponseBecomesRemoteError) {
    server->on("bad", [](const nlohmann::json& req) {
        return FakeServer::error(req, -32602, "Invalid params");
    });
    try {
        correlator.call("bad", nullptr, 1s);
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.code(), -32602);
        EXPECT_STREQ(e.what(), "Invalid params");
        EXPECT_EQ(e.kind(), ErrorKind::Remote);
    }
}

TEST_F(CorrelatorTest, FailAllWakesEveryPendingCall) {
    server->on("hang", [](const nlohmann::json&) { return nlohmann::json(); });
    auto a = std::async(std::launch::async, [this] { return correlator.call("hang", nullptr, 5s); });
    auto b = std::async(std::launch::async, [this] { return correlator.call("hang", nullptr, 5s); });
    for (int i = 0; i < 200 && correlator.pendingCount() < 2; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(correlator.pendingCount(), 2u);

    correlator.failAll("server went away");
    EXPECT_THROW(a.get(), ConnectionLostError);
    EXPECT_THROW(b.get(), ConnectionLostError);
    EXPECT_EQ(correlator.pendingCount(), 0u);
}

TEST_F(CorrelatorTest, NonJsonAndUnknownIdsAreIgnored) {
    transport->deliver("Starting server...");
    transport->deliver("[1,2,3]");
    transport->deliver("{\"jsonrpc\":\"2.0\",\"id\":99999,\"result\":{}}");
    transport->deliver("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{}}");
    EXPECT_NO_THROW(correlator.call("ping", nullptr, 1s));
}

TEST_F(CorrelatorTest, StringIdsAreMatched) {
    server->on("str", [](const nlohmann::json& req) {
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", std::to_string(req["id"].get<int64_t>())}, {"result", {{"ok", true}}}};
    });
    EXPECT_EQ(correlator.call("str", nullptr, 1s)["ok"], true);
}

TEST_F(CorrelatorTest, MissingResultYieldsEmptyObject) {
    server->on("bare", [](const nlohmann::json& req) {
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", req["id"]}};
    });
    auto result = correlator.call("bare", nullptr, 1s);
    EXPECT_TRUE(result.is_object());
    EXPECT_TRUE(result.empty());
}

TEST_F(CorrelatorTest, AnswersServerPingAndRejectsOtherServerRequests) {
    transport->deliver("{\"jsonrpc\":\"2.0\",\"id\":\"s1\",\"method\":\"ping\"}");
    transport->deliver("{\"jsonrpc\":\"2.0\",\"id\":\"s2\",\"method\":\"sampling/createMessage\"}");

    nlohmann::json pingReply;
    nlohmann::json otherReply;
    for (const auto& msg : server->all()) {
        if (msg.contains("method")) continue;
        if (msg["id"] == "s1") pingReply = msg;
        if (msg["id"] == "s2") otherReply = msg;
    }
    ASSERT_TRUE(pingReply.is_object());
    EXPECT_TRUE(pingReply["result"].is_object());
    ASSERT_TRUE(otherReply.is_object());
    EXPECT_EQ(otherReply["error"]["code"], -32601);
}

TEST_F(CorrelatorTest, CallWithoutTransportIsConnectionLost) {
    correlator.detach();
    EXPECT_THROW(correlator.call("ping", nullptr, 1s), ConnectionLostError);
    EXPECT_THROW(correlator.notify("notifications/initialized"), ConnectionLostError);
}

TEST_F(CorrelatorTest, BrokenPipeRemovesPendingEntry) {
    transport->stop();
    EXPECT_THROW(correlator.call("ping", nullptr, 1s), BrokenPipeError);
    EXPECT_EQ(correlator.pendingCount(), 0u);
}

TEST_F(CorrelatorTest, NotificationsCarryNoId) {
    correlator.notify("notifications/initialized");
    auto sent = server->requests("notifications/initialized");
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_FALSE(sent[0].contains("id"));
}
