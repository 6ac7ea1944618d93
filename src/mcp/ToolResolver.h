#pragma once
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <functional>
#include <nlohmann/json.hpp>
#include "mcp/OperationIntent.h"
#include "mcp/CapabilityTable.h"

/**
 * @brief Maps operation intents onto the tool surface of one server build.
 *
 * Discovery tells us which tools exist, never their parameter contract. The
 * ordered alias lists pick the tool (first match wins); the override table,
 * keyed by exact tool name, reshapes the logical arguments for tools whose
 * parameters differ from the logical names. Tools without an override get
 * the logical arguments unchanged.
 *
 * Logical argument names: repository, query, max_results, pattern,
 * file_type, file_path.
 *
 * Configure before the connection is shared between threads; lookups are
 * read-only afterwards.
 */
class ToolResolver {
public:
    using ArgumentShaper = std::function<nlohmann::json(OperationIntent, const nlohmann::json& logicalArgs)>;

    ToolResolver();

    const std::vector<std::string>& aliases(OperationIntent intent) const;
    void setAliases(OperationIntent intent, std::vector<std::string> names);
    // Puts names ahead of the current list, dropping later duplicates.
    void prependAliases(OperationIntent intent, const std::vector<std::string>& names);

    void registerOverride(const std::string& toolName, ArgumentShaper shaper);

    /**
     * @brief Registers a declarative override.
     *
     * String values may hold ${name} placeholders naming a logical argument
     * or "repository_short". A value that is exactly one placeholder copies
     * the argument's JSON value; keys whose placeholders all fail to resolve
     * are left out.
     * @throws std::invalid_argument if templ is not an object
     */
    void registerTemplate(const std::string& toolName, const nlohmann::json& templ);

    bool hasOverride(const std::string& toolName) const { return overrides.count(toolName) > 0; }

    // Throws ToolNotAvailableError listing the aliases tried.
    std::string resolveTool(OperationIntent intent, const CapabilityTable& table) const;

    nlohmann::json buildArguments(const std::string& toolName, OperationIntent intent, const nlohmann::json& logicalArgs) const;

    static const std::vector<std::string>& defaultAliases(OperationIntent intent);
    static nlohmann::json applyTemplate(const nlohmann::json& templ, const nlohmann::json& logicalArgs);

private:
    std::map<OperationIntent, std::vector<std::string>> aliasTable;
    std::unordered_map<std::string, ArgumentShaper> overrides;

    void registerBuiltinOverrides();
};
