#include "mcp/ResearchClient.h"
#include "utils/RepositoryRef.h"
#include "utils/Logger.h"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
const int kToolErrorCode = -32000;

std::string formatTime(std::chrono::system_clock::time_point tp) {
    if (tp.time_since_epoch().count() == 0) return "";
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tmBuf{};
    localtime_r(&t, &tmBuf);
    std::ostringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
} // namespace

ToolOutcome ToolOutcome::fromError(const McpError& error) {
    ToolOutcome outcome;
    outcome.ok = false;
    outcome.errorKind = error.kind();
    outcome.message = error.what();
    if (auto remote = dynamic_cast<const RemoteError*>(&error)) {
        outcome.code = remote->code();
    } else if (auto exited = dynamic_cast<const ProcessExitedError*>(&error)) {
        outcome.code = exited->code();
    } else if (auto missing = dynamic_cast<const ToolNotAvailableError*>(&error)) {
        outcome.triedAliases = missing->triedAliases();
    }
    return outcome;
}

nlohmann::json ToolOutcome::toJson() const {
    nlohmann::json j = {{"ok", ok}};
    if (!toolName.empty()) j["tool"] = toolName;
    if (ok) {
        j["result"] = payload;
        return j;
    }
    j["error"] = {{"kind", errorKindName(errorKind)}, {"message", message}};
    if (code != 0) j["error"]["code"] = code;
    if (!triedAliases.empty()) j["error"]["tried"] = triedAliases;
    return j;
}

nlohmann::json ConnectionStatus::toJson() const {
    return {
        {"state", connectionStateName(state)},
        {"server", {{"name", serverName}, {"version", serverVersion}, {"protocol", protocolVersion}}},
        {"pid", pid},
        {"tools", tools},
        {"last_activity", formatTime(lastActivity)},
        {"last_error", lastError},
        {"indexed_repositories", indexedRepositories}
    };
}

ResearchClient::ResearchClient(Config config, ConnectionManager::TransportFactory factory)
    : manager(std::move(config), std::move(factory)) {}

ResearchClient::~ResearchClient() {
    stop();
}

bool ResearchClient::start() {
    try {
        manager.start();
        return true;
    } catch (const McpError& e) {
        Logger::getInstance().error(std::string("Could not connect to tool server: ") + e.what());
        return false;
    }
}

void ResearchClient::stop() {
    manager.stop();
    std::lock_guard<std::mutex> lock(indexedMutex);
    indexed.clear();
}

bool ResearchClient::reconnect() {
    auto current = manager.state();
    if (current == ConnectionState::Disconnected) {
        return start();
    }
    return manager.reconnect();
}

ToolOutcome ResearchClient::index(const std::string& repository) {
    Logger::getInstance().info("Indexing repository " + repository);
    auto outcome = perform(OperationIntent::Index, {{"repository", repository}}, manager.config().timeouts.index);
    if (outcome.ok) {
        std::string key = repositoryKey(repository);
        std::lock_guard<std::mutex> lock(indexedMutex);
        if (std::find(indexed.begin(), indexed.end(), key) == indexed.end()) {
            indexed.push_back(key);
        }
    }
    return outcome;
}

ToolOutcome ResearchClient::search(const std::string& repository, const std::string& query, int maxResults) {
    nlohmann::json args = {
        {"repository", repository},
        {"query", query},
        {"max_results", maxResults}
    };
    return perform(OperationIntent::SemanticSearch, args, manager.config().timeouts.search);
}

ToolOutcome ResearchClient::codeSearch(const std::string& repository, const std::string& pattern, const std::string& fileType) {
    nlohmann::json args = {
        {"repository", repository},
        {"pattern", pattern}
    };
    if (!fileType.empty()) {
        args["file_type"] = fileType;
    }
    return perform(OperationIntent::CodeSearch, args, manager.config().timeouts.codeSearch);
}

ToolOutcome ResearchClient::readFile(const std::string& repository, const std::string& path) {
    nlohmann::json args = {
        {"repository", repository},
        {"file_path", path}
    };
    return perform(OperationIntent::ReadFile, args, manager.config().timeouts.readFile);
}

ToolOutcome ResearchClient::getStructure(const std::string& repository) {
    return perform(OperationIntent::GetStructure, {{"repository", repository}}, manager.config().timeouts.structure);
}

ToolOutcome ResearchClient::perform(OperationIntent intent, const nlohmann::json& logicalArgs, std::chrono::milliseconds timeout) {
    std::string toolName;
    try {
        auto current = manager.state();
        if (current != ConnectionState::Ready) {
            throw NotConnectedError("Not connected to the tool server (state: " + connectionStateName(current) + ")");
        }
        auto table = manager.capabilities();
        toolName = manager.resolver().resolveTool(intent, *table);
        auto arguments = manager.resolver().buildArguments(toolName, intent, logicalArgs);
        Logger::getInstance().debug(intentName(intent) + " via " + toolName + " " + arguments.dump());

        auto result = manager.callTool(toolName, arguments, timeout);
        std::string text = extractText(result);
        if (result.is_object() && result.contains("isError") && result["isError"] == true) {
            throw RemoteError(kToolErrorCode, text.empty() ? toolName + " reported an error" : text);
        }

        ToolOutcome outcome;
        outcome.ok = true;
        outcome.payload = std::move(result);
        outcome.text = std::move(text);
        outcome.toolName = toolName;
        return outcome;
    } catch (const McpError& e) {
        Logger::getInstance().error(intentName(intent) + " failed [" + errorKindName(e.kind()) + "]: " + e.what());
        auto outcome = ToolOutcome::fromError(e);
        outcome.toolName = toolName;
        return outcome;
    } catch (const std::exception& e) {
        // Argument shapers and templates come from configuration.
        Logger::getInstance().error(intentName(intent) + " failed: " + e.what());
        ToolOutcome outcome;
        outcome.errorKind = ErrorKind::Remote;
        outcome.message = std::string("Tool execution failed: ") + e.what();
        outcome.toolName = toolName;
        return outcome;
    }
}

ConnectionStatus ResearchClient::connectionStatus() const {
    ConnectionStatus status;
    status.state = manager.state();
    status.tools = manager.capabilities()->names();
    auto session = manager.sessionInfo();
    status.serverName = session.serverName;
    status.serverVersion = session.serverVersion;
    status.protocolVersion = session.protocolVersion;
    status.pid = manager.pid();
    status.lastActivity = manager.lastActivity();
    status.lastError = manager.lastError();
    status.indexedRepositories = indexedRepositories();
    return status;
}

bool ResearchClient::isRepositoryIndexed(const std::string& repository) const {
    std::string key = repositoryKey(repository);
    std::lock_guard<std::mutex> lock(indexedMutex);
    return std::find(indexed.begin(), indexed.end(), key) != indexed.end();
}

std::vector<std::string> ResearchClient::indexedRepositories() const {
    std::lock_guard<std::mutex> lock(indexedMutex);
    return indexed;
}

std::string ResearchClient::extractText(const nlohmann::json& result) {
    if (!result.is_object()) {
        return result.is_string() ? result.get<std::string>() : result.dump();
    }
    std::string text;
    if (result.contains("content") && result["content"].is_array()) {
        for (const auto& item : result["content"]) {
            if (!item.is_object() || !item.contains("type") || item["type"] != "text") continue;
            if (!item.contains("text") || !item["text"].is_string()) continue;
            if (!text.empty()) text += "\n";
            text += item["text"].get<std::string>();
        }
        if (!text.empty()) return text;
    }
    return result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string ResearchClient::repositoryKey(const std::string& repository) {
    auto ref = RepositoryRef::parse(repository);
    return ref.fullName.empty() ? repository : ref.fullName;
}
