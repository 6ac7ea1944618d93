#pragma once
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <nlohmann/json.hpp>
#include "mcp/Transport.h"
#include "mcp/OperationIntent.h"

class ToolResolver;

struct Config {
    // Launch description of the tool server.
    ServerCommand server;

    struct Timeouts {
        std::chrono::milliseconds initialize{30000};
        std::chrono::milliseconds listTools{30000};
        std::chrono::milliseconds index{600000};
        std::chrono::milliseconds search{120000};
        std::chrono::milliseconds codeSearch{60000};
        std::chrono::milliseconds readFile{60000};
        std::chrono::milliseconds structure{60000};
    } timeouts;

    struct Health {
        std::chrono::milliseconds interval{30000};
        std::chrono::milliseconds probeTimeout{10000};
        int maxReconnectAttempts = 3;
        std::chrono::milliseconds initialBackoff{1000};
        std::chrono::milliseconds maxBackoff{30000};
    } health;

    struct Log {
        std::string level = "info";
        std::string file = "openflux.log";
        bool console = true;
    } log;

    struct Resolver {
        // Names tried ahead of the built-in aliases.
        std::map<OperationIntent, std::vector<std::string>> aliases;
        // Tool name → argument template (see ToolResolver::registerTemplate).
        std::map<std::string, nlohmann::json> overrides;
    } resolver;

    /**
     * @brief Reads a JSON config file. Missing keys keep their defaults and
     * the environment overlay is applied afterwards.
     * @throws std::runtime_error if the file cannot be read or parsed, or a
     * value has the wrong type
     */
    static Config load(const std::string& pathStr);

    static Config fromJson(const nlohmann::json& j);

    // uvx awslabs.git-repo-research-mcp-server@latest with the environment overlay.
    static Config defaults();

    /**
     * @brief Fills server.env from GITHUB_TOKEN, AWS_PROFILE, AWS_REGION and
     * FASTMCP_LOG_LEVEL when not set explicitly; LOG_LEVEL overrides log.level.
     */
    void applyEnvironment();

    // Human-readable problems; empty when the config looks usable.
    std::vector<std::string> validate() const;

    void applyLogging() const;
    void configureResolver(ToolResolver& toolResolver) const;
};
