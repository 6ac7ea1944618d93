#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "mcp/ConnectionManager.h"
#include "mcp/McpErrors.h"

/**
 * @brief Result of one facade operation. Failures are values, not exceptions.
 */
struct ToolOutcome {
    bool ok = false;
    // Raw tools/call result.
    nlohmann::json payload;
    // Joined text content items, for display.
    std::string text;
    std::string toolName;

    ErrorKind errorKind = ErrorKind::None;
    int code = 0;
    std::string message;
    // Filled for ToolNotAvailable.
    std::vector<std::string> triedAliases;

    static ToolOutcome fromError(const McpError& error);
    nlohmann::json toJson() const;
};

/**
 * @brief Snapshot for a status display.
 */
struct ConnectionStatus {
    ConnectionState state = ConnectionState::Disconnected;
    std::vector<std::string> tools;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
    int pid = -1;
    std::chrono::system_clock::time_point lastActivity;
    std::string lastError;
    std::vector<std::string> indexedRepositories;

    bool isReady() const { return state == ConnectionState::Ready; }
    nlohmann::json toJson() const;
};

/**
 * @brief Entry point for the UI: repository research operations over the
 * managed connection.
 *
 * Every operation checks the connection is Ready, resolves the tool for its
 * intent, calls it with the configured timeout and reports the result as a
 * ToolOutcome. None of them throws.
 */
class ResearchClient {
public:
    explicit ResearchClient(Config config, ConnectionManager::TransportFactory factory = nullptr);
    ~ResearchClient();

    ResearchClient(const ResearchClient&) = delete;
    ResearchClient& operator=(const ResearchClient&) = delete;

    // False if the server could not be brought up; see connectionStatus().lastError.
    bool start();
    void stop();
    bool reconnect();

    ToolOutcome index(const std::string& repository);
    ToolOutcome search(const std::string& repository, const std::string& query, int maxResults = 10);
    ToolOutcome codeSearch(const std::string& repository, const std::string& pattern, const std::string& fileType = "");
    ToolOutcome readFile(const std::string& repository, const std::string& path);
    ToolOutcome getStructure(const std::string& repository);

    ConnectionStatus connectionStatus() const;
    bool isRepositoryIndexed(const std::string& repository) const;
    std::vector<std::string> indexedRepositories() const;

    ConnectionManager& connection() { return manager; }

    /**
     * @brief Concatenates the text of content items of type "text".
     * Falls back to the compact JSON of the result when there are none.
     */
    static std::string extractText(const nlohmann::json& result);

private:
    ConnectionManager manager;

    mutable std::mutex indexedMutex;
    // Normalized names, in indexing order.
    std::vector<std::string> indexed;

    ToolOutcome perform(OperationIntent intent, const nlohmann::json& logicalArgs, std::chrono::milliseconds timeout);
    static std::string repositoryKey(const std::string& repository);
};
