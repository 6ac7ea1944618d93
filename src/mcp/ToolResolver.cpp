#include "mcp/ToolResolver.h"
#include "mcp/McpErrors.h"
#include "utils/RepositoryRef.h"
#include "utils/Logger.h"
#include <algorithm>
#include <stdexcept>

namespace {
// Variables visible to templates: the logical arguments plus derived names.
nlohmann::json templateVariables(const nlohmann::json& logicalArgs) {
    nlohmann::json vars = logicalArgs.is_object() ? logicalArgs : nlohmann::json::object();
    if (vars.contains("repository") && vars["repository"].is_string()) {
        vars["repository_short"] = RepositoryRef::parse(vars["repository"].get<std::string>()).shortName;
    }
    return vars;
}

std::string asText(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

// Expands ${name} placeholders. Returns false when the string had
// placeholders and none of them resolved.
bool expand(const std::string& text, const nlohmann::json& vars, nlohmann::json& out) {
    if (text.size() > 3 && text.compare(0, 2, "${") == 0 && text.back() == '}' &&
        text.find("${", 2) == std::string::npos) {
        std::string name = text.substr(2, text.size() - 3);
        if (!vars.contains(name) || vars[name].is_null()) return false;
        out = vars[name];
        return true;
    }

    std::string result;
    int placeholders = 0;
    int resolved = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto open = text.find("${", pos);
        if (open == std::string::npos) {
            result += text.substr(pos);
            break;
        }
        auto close = text.find('}', open + 2);
        if (close == std::string::npos) {
            result += text.substr(pos);
            break;
        }
        result += text.substr(pos, open - pos);
        std::string name = text.substr(open + 2, close - open - 2);
        ++placeholders;
        if (vars.contains(name) && !vars[name].is_null()) {
            result += asText(vars[name]);
            ++resolved;
        }
        pos = close + 1;
    }
    if (placeholders > 0 && resolved == 0) return false;
    out = result;
    return true;
}

nlohmann::json expandObject(const nlohmann::json& templ, const nlohmann::json& vars) {
    nlohmann::json out = nlohmann::json::object();
    for (auto it = templ.begin(); it != templ.end(); ++it) {
        const auto& value = it.value();
        if (value.is_string()) {
            nlohmann::json expanded;
            if (expand(value.get<std::string>(), vars, expanded)) {
                out[it.key()] = expanded;
            }
        } else if (value.is_object()) {
            out[it.key()] = expandObject(value, vars);
        } else {
            out[it.key()] = value;
        }
    }
    return out;
}

std::string stringArg(const nlohmann::json& args, const char* key) {
    if (args.is_object() && args.contains(key) && args[key].is_string()) {
        return args[key].get<std::string>();
    }
    return "";
}
} // namespace

ToolResolver::ToolResolver() {
    for (auto intent : allIntents()) {
        aliasTable[intent] = defaultAliases(intent);
    }
    registerBuiltinOverrides();
}

const std::vector<std::string>& ToolResolver::defaultAliases(OperationIntent intent) {
    static const std::map<OperationIntent, std::vector<std::string>> defaults = {
        {OperationIntent::Index, {
            "index_repository", "index-repository", "create_research_repository",
            "index_repo", "index-repo", "repository_index", "repo_index",
            "clone_and_index", "clone-and-index"
        }},
        {OperationIntent::SemanticSearch, {
            "semantic_search", "semantic-search", "search_research_repository",
            "search", "search_repository", "search-repository",
            "repo_search", "repo-search", "query", "find"
        }},
        {OperationIntent::CodeSearch, {
            "search_code", "search-code", "code_search", "code-search", "grep",
            "find_code", "find-code", "pattern_search", "pattern-search"
        }},
        {OperationIntent::ReadFile, {
            "get_file_content", "get-file-content", "file_content", "file-content",
            "read_file", "read-file", "get_file", "get-file", "access_file"
        }},
        {OperationIntent::GetStructure, {
            "get_repository_structure", "get-repository-structure",
            "repository_structure", "repository-structure",
            "repo_structure", "repo-structure", "list_files", "list-files",
            "tree", "access_file"
        }}
    };
    return defaults.at(intent);
}

void ToolResolver::registerBuiltinOverrides() {
    // awslabs git-repo-research server
    registerTemplate("create_research_repository", {
        {"repository_path", "${repository}"}
    });
    registerTemplate("search_research_repository", {
        {"index_path", "${repository}"},
        {"query", "${query}"},
        {"limit", "${max_results}"}
    });
    registerOverride("access_file", [](OperationIntent, const nlohmann::json& args) {
        std::string filepath = RepositoryRef::parse(stringArg(args, "repository")).shortName + "/repository";
        std::string path = stringArg(args, "file_path");
        while (!path.empty() && path.front() == '/') path.erase(0, 1);
        if (!path.empty()) filepath += "/" + path;
        return nlohmann::json{{"filepath", filepath}};
    });
}

const std::vector<std::string>& ToolResolver::aliases(OperationIntent intent) const {
    return aliasTable.at(intent);
}

void ToolResolver::setAliases(OperationIntent intent, std::vector<std::string> names) {
    aliasTable[intent] = std::move(names);
}

void ToolResolver::prependAliases(OperationIntent intent, const std::vector<std::string>& names) {
    std::vector<std::string> merged;
    for (const auto& name : names) {
        if (std::find(merged.begin(), merged.end(), name) == merged.end()) merged.push_back(name);
    }
    for (const auto& name : aliasTable[intent]) {
        if (std::find(merged.begin(), merged.end(), name) == merged.end()) merged.push_back(name);
    }
    aliasTable[intent] = std::move(merged);
}

void ToolResolver::registerOverride(const std::string& toolName, ArgumentShaper shaper) {
    if (overrides.count(toolName)) {
        Logger::getInstance().debug("Replacing argument override for " + toolName);
    }
    overrides[toolName] = std::move(shaper);
}

void ToolResolver::registerTemplate(const std::string& toolName, const nlohmann::json& templ) {
    if (!templ.is_object()) {
        throw std::invalid_argument("Argument template for " + toolName + " must be an object");
    }
    registerOverride(toolName, [templ](OperationIntent, const nlohmann::json& args) {
        return applyTemplate(templ, args);
    });
}

std::string ToolResolver::resolveTool(OperationIntent intent, const CapabilityTable& table) const {
    const auto& candidates = aliases(intent);
    for (const auto& name : candidates) {
        if (table.contains(name)) return name;
    }
    throw ToolNotAvailableError(intent, candidates);
}

nlohmann::json ToolResolver::buildArguments(const std::string& toolName, OperationIntent intent, const nlohmann::json& logicalArgs) const {
    auto it = overrides.find(toolName);
    if (it == overrides.end()) {
        return logicalArgs.is_null() ? nlohmann::json::object() : logicalArgs;
    }
    return it->second(intent, logicalArgs);
}

nlohmann::json ToolResolver::applyTemplate(const nlohmann::json& templ, const nlohmann::json& logicalArgs) {
    return expandObject(templ, templateVariables(logicalArgs));
}
