#include "core/ConfigManager.h"
#include "mcp/ToolResolver.h"
#include "utils/Logger.h"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <cmath>
#include <stdexcept>

namespace {
const char* kPlaceholderToken = "your-github-token";
const char* kDefaultCommand = "uvx";
const char* kDefaultPackage = "awslabs.git-repo-research-mcp-server@latest";

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

// Durations are written in seconds (fractions allowed).
void readSeconds(const nlohmann::json& section, const char* key, std::chrono::milliseconds& out) {
    if (!section.contains(key)) return;
    double seconds = section.at(key).get<double>();
    out = std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

void checkPositive(std::vector<std::string>& issues, const std::string& name, std::chrono::milliseconds value) {
    if (value.count() <= 0) {
        issues.push_back(name + " must be positive");
    }
}
} // namespace

Config Config::load(const std::string& pathStr) {
    std::filesystem::path path = std::filesystem::u8path(pathStr);
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + pathStr);
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    f.close();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
    }

    Config cfg;
    try {
        cfg = fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config in " + path.string() + ": " + e.what());
    }
    cfg.applyEnvironment();
    return cfg;
}

Config Config::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }
    Config cfg;
    cfg.server.command = kDefaultCommand;
    cfg.server.args = {kDefaultPackage};

    if (j.contains("server")) {
        const auto& s = j.at("server");
        if (s.contains("command")) cfg.server.command = s.at("command").get<std::string>();
        if (s.contains("args")) cfg.server.args = s.at("args").get<std::vector<std::string>>();
        if (s.contains("env")) {
            for (auto it = s.at("env").begin(); it != s.at("env").end(); ++it) {
                cfg.server.env[it.key()] = it.value().get<std::string>();
            }
        }
        if (s.contains("framing")) {
            std::string name = s.at("framing").get<std::string>();
            if (!MessageFramer::parseFraming(name, cfg.server.framing)) {
                throw std::runtime_error("Unknown framing: " + name);
            }
        }
        readSeconds(s, "startup_grace", cfg.server.startupGrace);
        readSeconds(s, "stop_grace", cfg.server.stopGrace);
    }

    if (j.contains("timeouts")) {
        const auto& t = j.at("timeouts");
        readSeconds(t, "initialize", cfg.timeouts.initialize);
        readSeconds(t, "list_tools", cfg.timeouts.listTools);
        readSeconds(t, "index", cfg.timeouts.index);
        readSeconds(t, "search", cfg.timeouts.search);
        readSeconds(t, "code_search", cfg.timeouts.codeSearch);
        readSeconds(t, "read_file", cfg.timeouts.readFile);
        readSeconds(t, "structure", cfg.timeouts.structure);
    }

    if (j.contains("health")) {
        const auto& h = j.at("health");
        readSeconds(h, "interval", cfg.health.interval);
        readSeconds(h, "probe_timeout", cfg.health.probeTimeout);
        readSeconds(h, "initial_backoff", cfg.health.initialBackoff);
        readSeconds(h, "max_backoff", cfg.health.maxBackoff);
        cfg.health.maxReconnectAttempts = h.value("max_reconnect_attempts", cfg.health.maxReconnectAttempts);
    }

    if (j.contains("log")) {
        const auto& l = j.at("log");
        cfg.log.level = l.value("level", cfg.log.level);
        cfg.log.file = l.value("file", cfg.log.file);
        cfg.log.console = l.value("console", cfg.log.console);
    }

    if (j.contains("resolver")) {
        const auto& r = j.at("resolver");
        if (r.contains("aliases")) {
            for (auto it = r.at("aliases").begin(); it != r.at("aliases").end(); ++it) {
                OperationIntent intent;
                if (!parseIntent(it.key(), intent)) {
                    throw std::runtime_error("Unknown intent in resolver.aliases: " + it.key());
                }
                cfg.resolver.aliases[intent] = it.value().get<std::vector<std::string>>();
            }
        }
        if (r.contains("overrides")) {
            for (auto it = r.at("overrides").begin(); it != r.at("overrides").end(); ++it) {
                if (!it.value().is_object()) {
                    throw std::runtime_error("resolver.overrides." + it.key() + " must be an object");
                }
                cfg.resolver.overrides[it.key()] = it.value();
            }
        }
    }
    return cfg;
}

Config Config::defaults() {
    Config cfg;
    cfg.server.command = kDefaultCommand;
    cfg.server.args = {kDefaultPackage};
    cfg.applyEnvironment();
    return cfg;
}

void Config::applyEnvironment() {
    auto fill = [this](const char* key, const std::string& fallback) {
        if (server.env.count(key)) return;
        std::string value = envOr(key, fallback);
        if (!value.empty()) server.env[key] = value;
    };
    fill("GITHUB_TOKEN", "");
    fill("AWS_PROFILE", "default");
    fill("AWS_REGION", "us-west-2");
    fill("FASTMCP_LOG_LEVEL", "ERROR");

    const char* level = std::getenv("LOG_LEVEL");
    if (level && *level) {
        log.level = level;
    }
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> issues;
    if (server.command.empty()) {
        issues.push_back("server.command is empty");
    }
    auto token = server.env.find("GITHUB_TOKEN");
    if (token == server.env.end() || token->second.empty()) {
        issues.push_back("GITHUB_TOKEN is not set; private repositories and rate limits will fail");
    } else if (token->second == kPlaceholderToken) {
        issues.push_back("GITHUB_TOKEN still holds the placeholder value");
    }

    checkPositive(issues, "timeouts.initialize", timeouts.initialize);
    checkPositive(issues, "timeouts.list_tools", timeouts.listTools);
    checkPositive(issues, "timeouts.index", timeouts.index);
    checkPositive(issues, "timeouts.search", timeouts.search);
    checkPositive(issues, "timeouts.code_search", timeouts.codeSearch);
    checkPositive(issues, "timeouts.read_file", timeouts.readFile);
    checkPositive(issues, "timeouts.structure", timeouts.structure);
    checkPositive(issues, "health.interval", health.interval);
    checkPositive(issues, "health.probe_timeout", health.probeTimeout);
    if (health.maxReconnectAttempts < 0) {
        issues.push_back("health.max_reconnect_attempts must not be negative");
    }
    if (health.maxBackoff < health.initialBackoff) {
        issues.push_back("health.max_backoff is smaller than health.initial_backoff");
    }
    return issues;
}

void Config::applyLogging() const {
    auto& logger = Logger::getInstance();
    logger.setLevel(Logger::parseLevel(log.level));
    logger.setLogFile(log.file);
    logger.setConsoleEnabled(log.console);
}

void Config::configureResolver(ToolResolver& toolResolver) const {
    for (const auto& [intent, names] : resolver.aliases) {
        toolResolver.prependAliases(intent, names);
    }
    for (const auto& [name, templ] : resolver.overrides) {
        toolResolver.registerTemplate(name, templ);
    }
}
