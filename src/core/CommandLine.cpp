#include "core/CommandLine.h"
#include <map>
#include <stdexcept>

int CommandLine::arity(const std::string& command) {
    static const std::map<std::string, int> counts = {
        {"status", 0}, {"tools", 0}, {"index", 1}, {"search", 2},
        {"code", 2}, {"read", 2}, {"structure", 1}
    };
    auto it = counts.find(command);
    return it == counts.end() ? -1 : it->second;
}

CommandLine CommandLine::parse(const std::vector<std::string>& argv) {
    CommandLine cl;
    std::vector<std::string> positional;
    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argv.size()) {
                throw std::runtime_error("'" + arg + "' expects a path");
            }
            cl.configPath = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            cl.help = true;
            return cl;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.empty()) {
        throw std::runtime_error("No command given");
    }

    cl.command = positional.front();
    cl.args.assign(positional.begin() + 1, positional.end());
    int expected = arity(cl.command);
    if (expected < 0) {
        throw std::runtime_error("Unknown command: " + cl.command);
    }
    if (cl.args.size() < static_cast<size_t>(expected)) {
        throw std::runtime_error("'" + cl.command + "' expects " + std::to_string(expected) + " argument(s)");
    }

    if (cl.command == "search" && cl.args.size() > 2) {
        const std::string& text = cl.args[2];
        size_t used = 0;
        try {
            cl.maxResults = std::stoi(text, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == 0 || used != text.size() || cl.maxResults <= 0) {
            throw std::runtime_error("max must be a positive number: " + text);
        }
    }
    return cl;
}
