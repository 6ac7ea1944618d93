#pragma once
#include <string>
#include <vector>

/**
 * @brief Parsed `openflux` invocation.
 *
 * parse() checks the command name, its argument count and the optional
 * search limit, and throws std::runtime_error describing the first problem.
 */
struct CommandLine {
    std::string configPath;
    std::string command;
    std::vector<std::string> args;  // positional arguments after the command
    int maxResults = 10;
    bool help = false;

    static CommandLine parse(const std::vector<std::string>& argv);

    // Minimum positional arguments for a command, -1 if the command is unknown.
    static int arity(const std::string& command);

    const std::string& arg(size_t index) const { return args.at(index); }
    std::string optionalArg(size_t index) const { return index < args.size() ? args[index] : ""; }
};
