#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <stdexcept>
#include "core/CommandLine.h"
#include "core/ConfigManager.h"
#include "mcp/ResearchClient.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string YELLOW = "\033[38;5;226m";
const std::string GRAY = "\033[38;5;242m";

void printUsage() {
    std::cout << "Usage: openflux [-c config.json] <command> [args...]\n\n"
              << "Commands:\n"
              << "  status                               connection and server details\n"
              << "  tools                                tools advertised by the server\n"
              << "  index <repo>                         index a repository\n"
              << "  search <repo> <query> [max]          semantic search\n"
              << "  code <repo> <pattern> [fileType]     code pattern search\n"
              << "  read <repo> <path>                   file content\n"
              << "  structure <repo>                     repository structure\n";
}

int printOutcome(const ToolOutcome& outcome) {
    if (outcome.ok) {
        std::cout << (outcome.text.empty() ? outcome.payload.dump(2) : outcome.text) << std::endl;
        return 0;
    }
    std::cerr << RED << "✖ " << errorKindName(outcome.errorKind) << ": " << outcome.message << RESET << std::endl;
    if (!outcome.triedAliases.empty()) {
        std::cerr << GRAY << "  tried:";
        for (const auto& name : outcome.triedAliases) std::cerr << " " << name;
        std::cerr << RESET << std::endl;
    }
    return 1;
}

int runStatus(ResearchClient& client, const Config& cfg) {
    auto status = client.connectionStatus();
    std::cout << status.toJson().dump(2) << std::endl;
    for (const auto& issue : cfg.validate()) {
        std::cerr << YELLOW << "⚠ " << issue << RESET << std::endl;
    }
    return status.isReady() ? 0 : 1;
}

int runTools(ResearchClient& client) {
    auto table = client.connection().capabilities();
    if (table->empty()) {
        std::cerr << YELLOW << "⚠ The server advertised no tools" << RESET << std::endl;
        return 1;
    }
    for (const auto& name : table->names()) {
        const auto* tool = table->find(name);
        std::cout << BOLD << name << RESET;
        if (!tool->declaredParameters.empty()) {
            std::cout << GRAY << " (";
            bool first = true;
            for (const auto& param : tool->declaredParameters) {
                std::cout << (first ? "" : ", ") << param << (tool->requiredParameters.count(param) ? "*" : "");
                first = false;
            }
            std::cout << ")" << RESET;
        }
        std::cout << std::endl;
        if (!tool->description.empty()) {
            std::cout << "    " << tool->description << std::endl;
        }
    }
    return 0;
}

int main(int argc, char* argv[]) {
    CommandLine cl;
    try {
        cl = CommandLine::parse(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ " << e.what() << RESET << std::endl;
        printUsage();
        return 2;
    }
    if (cl.help) {
        printUsage();
        return 0;
    }

    Config cfg;
    std::string configPath = cl.configPath;
    try {
        if (configPath.empty() && fs::exists(fs::u8path("config.json"))) {
            configPath = "config.json";
        }
        cfg = configPath.empty() ? Config::defaults() : Config::load(configPath);
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        printUsage();
        return 1;
    }
    cfg.applyLogging();
    if (!configPath.empty()) {
        Logger::getInstance().debug("Loaded configuration from: " + configPath);
    }

    ResearchClient client(cfg);
    if (!client.start() && cl.command != "status") {
        std::cerr << RED << "✖ " << client.connectionStatus().lastError << RESET << std::endl;
        return 1;
    }

    int rc = 0;
    if (cl.command == "status") {
        rc = runStatus(client, cfg);
    } else if (cl.command == "tools") {
        rc = runTools(client);
    } else if (cl.command == "index") {
        rc = printOutcome(client.index(cl.arg(0)));
    } else if (cl.command == "search") {
        rc = printOutcome(client.search(cl.arg(0), cl.arg(1), cl.maxResults));
    } else if (cl.command == "code") {
        rc = printOutcome(client.codeSearch(cl.arg(0), cl.arg(1), cl.optionalArg(2)));
    } else if (cl.command == "read") {
        rc = printOutcome(client.readFile(cl.arg(0), cl.arg(1)));
    } else if (cl.command == "structure") {
        rc = printOutcome(client.getStructure(cl.arg(0)));
    }

    client.stop();
    return rc;
}
