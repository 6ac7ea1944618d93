#include <gtest/gtest.h>
#include "mcp/ResearchClient.h"
#include "FakeTransport.h"
#include <chrono>
#include <future>
#include <thread>

using namespace std::chrono_literals;

namespace {
Config TestConfig() {
    Config cfg;
    cfg.server.command = "fake-server";
    cfg.timeouts.initialize = 500ms;
    cfg.timeouts.listTools = 500ms;
    cfg.timeouts.index = 1s;
    cfg.timeouts.search = 1s;
    cfg.timeouts.codeSearch = 1s;
    cfg.timeouts.readFile = 1s;
    cfg.timeouts.structure = 1s;
    cfg.health.interval = 10s;
    cfg.health.probeTimeout = 100ms;
    cfg.health.maxReconnectAttempts = 2;
    cfg.health.initialBackoff = 500ms;
    cfg.health.maxBackoff = 500ms;
    return cfg;
}
} // namespace

// Tool surface of awslabs.git-repo-research-mcp-server.
class ResearchClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_shared<FakeServer>();
        server->onTool("create_research_repository", "Repository indexed");
        server->onTool("search_research_repository", [](const nlohmann::json& args) {
            return FakeServer::textResult("3 results for " + args.value("query", std::string()));
        });
        server->onTool("search_code", "src/app.py:12: TODO");
        server->onTool("access_file", [](const nlohmann::json& args) {
            return FakeServer::textResult("contents of " + args.value("filepath", std::string()));
        });
        factory = std::make_unique<FakeTransportFactory>(server);
        client = std::make_unique<ResearchClient>(TestConfig(), factory->make());
    }

    void TearDown() override {
        client.reset();
    }

    std::shared_ptr<FakeServer> server;
    std::unique_ptr<FakeTransportFactory> factory;
    std::unique_ptr<ResearchClient> client;
};

TEST_F(ResearchClientTest, OperationsBeforeStartReportNotConnected) {
    auto outcome = client->search("awslabs/mcp", "auth");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.errorKind, ErrorKind::NotConnected);
    EXPECT_TRUE(server->requests("tools/call").empty());
}

TEST_F(ResearchClientTest, IndexRecordsRepository) {
    ASSERT_TRUE(client->start());
    auto outcome = client->index("https://github.com/awslabs/mcp");
    ASSERT_TRUE(outcome.ok) << outcome.message;
    EXPECT_EQ(outcome.toolName, "create_research_repository");
    EXPECT_EQ(outcome.text, "Repository indexed");

    auto calls = server->requests("tools/call");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0]["params"]["arguments"], (nlohmann::json{{"repository_path", "https://github.com/awslabs/mcp"}}));

    EXPECT_TRUE(client->isRepositoryIndexed("awslabs/mcp"));
    EXPECT_TRUE(client->isRepositoryIndexed("https://github.com/awslabs/mcp.git"));
    EXPECT_FALSE(client->isRepositoryIndexed("awslabs/other"));
    EXPECT_EQ(client->indexedRepositories(), (std::vector<std::string>{"awslabs/mcp"}));

    // Indexing twice keeps one entry.
    EXPECT_TRUE(client->index("awslabs/mcp").ok);
    EXPECT_EQ(client->indexedRepositories().size(), 1u);
}

TEST_F(ResearchClientTest, FailedIndexIsNotRecorded) {
    server->on("tools/call", [](const nlohmann::json& req) {
        return FakeServer::reply(req, FakeServer::textResult("clone failed", true));
    });
    ASSERT_TRUE(client->start());
    auto outcome = client->index("awslabs/mcp");
    EXPECT_FALSE(outcome.ok);
    EXPECT_FALSE(client->isRepositoryIndexed("awslabs/mcp"));
}

TEST_F(ResearchClientTest, SearchUsesResearchRepositoryArguments) {
    ASSERT_TRUE(client->start());
    auto outcome = client->search("awslabs/mcp", "auth flow", 5);
    ASSERT_TRUE(outcome.ok) << outcome.message;
    EXPECT_EQ(outcome.text, "3 results for auth flow");

    auto args = server->requests("tools/call").back()["params"]["arguments"];
    EXPECT_EQ(args, (nlohmann::json{{"index_path", "awslabs/mcp"}, {"query", "auth flow"}, {"limit", 5}}));
}

TEST_F(ResearchClientTest, CodeSearchOmitsEmptyFileType) {
    ASSERT_TRUE(client->start());
    EXPECT_TRUE(client->codeSearch("awslabs/mcp", "TODO").ok);
    auto args = server->requests("tools/call").back()["params"]["arguments"];
    EXPECT_EQ(args, (nlohmann::json{{"repository", "awslabs/mcp"}, {"pattern", "TODO"}}));

    EXPECT_TRUE(client->codeSearch("awslabs/mcp", "TODO", "py").ok);
    args = server->requests("tools/call").back()["params"]["arguments"];
    EXPECT_EQ(args["file_type"], "py");
}

TEST_F(ResearchClientTest, ReadFileAndStructureGoThroughAccessFile) {
    ASSERT_TRUE(client->start());
    auto file = client->readFile("awslabs/mcp", "README.md");
    ASSERT_TRUE(file.ok) << file.message;
    EXPECT_EQ(file.toolName, "access_file");
    EXPECT_EQ(file.text, "contents of mcp/repository/README.md");

    auto tree = client->getStructure("https://github.com/awslabs/mcp");
    ASSERT_TRUE(tree.ok) << tree.message;
    EXPECT_EQ(tree.text, "contents of mcp/repository");
}

TEST_F(ResearchClientTest, ToolErrorFlagBecomesRemoteError) {
    server->onTool("search_code", [](const nlohmann::json&) {
        return FakeServer::textResult("repository not indexed", true);
    });
    ASSERT_TRUE(client->start());
    auto outcome = client->codeSearch("awslabs/mcp", "x");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.errorKind, ErrorKind::Remote);
    EXPECT_EQ(outcome.code, -32000);
    EXPECT_EQ(outcome.message, "repository not indexed");
    EXPECT_EQ(outcome.toolName, "search_code");
}

TEST_F(ResearchClientTest, JsonRpcErrorKeepsServerCode) {
    server->on("tools/call", [](const nlohmann::json& req) {
        return FakeServer::error(req, -32602, "Invalid params");
    });
    ASSERT_TRUE(client->start());
    auto outcome = client->search("awslabs/mcp", "q");
    EXPECT_EQ(outcome.errorKind, ErrorKind::Remote);
    EXPECT_EQ(outcome.code, -32602);
    EXPECT_EQ(outcome.toJson()["error"]["kind"], "RemoteError");
}

TEST_F(ResearchClientTest, MissingToolListsAliases) {
    auto bare = std::make_shared<FakeServer>();
    bare->onTool("unrelated", "x");
    FakeTransportFactory bareFactory(bare);
    ResearchClient bareClient(TestConfig(), bareFactory.make());
    ASSERT_TRUE(bareClient.start());

    auto outcome = bareClient.codeSearch("awslabs/mcp", "x");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.errorKind, ErrorKind::ToolNotAvailable);
    EXPECT_EQ(outcome.triedAliases, ToolResolver::defaultAliases(OperationIntent::CodeSearch));
    EXPECT_TRUE(bare->requests("tools/call").empty());
    EXPECT_EQ(outcome.toJson()["error"]["tried"].size(), outcome.triedAliases.size());

    auto indexOutcome = bareClient.index("org/repo");
    EXPECT_EQ(indexOutcome.errorKind, ErrorKind::ToolNotAvailable);
    EXPECT_EQ(indexOutcome.triedAliases, ToolResolver::defaultAliases(OperationIntent::Index));
    EXPECT_FALSE(bareClient.isRepositoryIndexed("org/repo"));
}

TEST_F(ResearchClientTest, ServerExitDuringCallIsConnectionLost) {
    std::promise<void> callArrived;
    server->on("tools/call", [&](const nlohmann::json&) -> nlohmann::json {
        callArrived.set_value();
        return nullptr;
    });
    ASSERT_TRUE(client->start());

    auto pending = std::async(std::launch::async, [&] { return client->search("awslabs/mcp", "auth", 5); });
    ASSERT_EQ(callArrived.get_future().wait_for(2s), std::future_status::ready);
    factory->latest()->simulateExit(1);

    auto outcome = pending.get();
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.errorKind, ErrorKind::ConnectionLost);
    EXPECT_EQ(client->connectionStatus().state, ConnectionState::Degraded);

    // The monitor brings the connection back after the first backoff.
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (!client->connectionStatus().isReady() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(client->connectionStatus().isReady());
    EXPECT_EQ(factory->count(), 2u);
}

TEST_F(ResearchClientTest, StartFailureIsReportedInStatus) {
    server->failLaunches = 1;
    EXPECT_FALSE(client->start());
    auto status = client->connectionStatus();
    EXPECT_EQ(status.state, ConnectionState::Disconnected);
    EXPECT_FALSE(status.isReady());
    EXPECT_NE(status.lastError.find("refused"), std::string::npos);

    // Disconnected reconnect goes through a fresh start.
    EXPECT_TRUE(client->reconnect());
    EXPECT_TRUE(client->connectionStatus().isReady());
}

TEST_F(ResearchClientTest, StatusDescribesConnection) {
    ASSERT_TRUE(client->start());
    ASSERT_TRUE(client->index("awslabs/mcp").ok);

    auto status = client->connectionStatus();
    EXPECT_TRUE(status.isReady());
    EXPECT_EQ(status.serverName, "fake-research");
    EXPECT_EQ(status.serverVersion, "0.1.0");
    EXPECT_EQ(status.protocolVersion, "2024-11-05");
    EXPECT_EQ(status.pid, 4242);
    EXPECT_EQ(status.tools.size(), 4u);
    EXPECT_EQ(status.indexedRepositories, (std::vector<std::string>{"awslabs/mcp"}));

    auto j = status.toJson();
    EXPECT_EQ(j["state"], "Ready");
    EXPECT_EQ(j["server"]["name"], "fake-research");
    EXPECT_EQ(j["pid"], 4242);
}

TEST_F(ResearchClientTest, StopForgetsIndexedRepositories) {
    ASSERT_TRUE(client->start());
    ASSERT_TRUE(client->index("awslabs/mcp").ok);
    client->stop();
    EXPECT_TRUE(client->indexedRepositories().empty());
    EXPECT_EQ(client->connectionStatus().state, ConnectionState::Disconnected);
    EXPECT_EQ(server->alive.load(), 0);
}

TEST(ResearchClientTextTest, ExtractTextJoinsTextItems) {
    nlohmann::json result = {{"content", {
        {{"type", "text"}, {"text", "first"}},
        {{"type", "image"}, {"data", "..."}},
        {{"type", "text"}, {"text", "second"}}
    }}};
    EXPECT_EQ(ResearchClient::extractText(result), "first\nsecond");
}

TEST(ResearchClientTextTest, ExtractTextFallsBackToJson) {
    nlohmann::json result = {{"files", {"a.py"}}};
    EXPECT_EQ(ResearchClient::extractText(result), result.dump());
    EXPECT_EQ(ResearchClient::extractText("plain"), "plain");
}
