#pragma once
#include <string>
#include <vector>

/**
 * @brief Abstract operations the core asks a tool server to perform,
 * independent of the concrete tool name a server build exposes.
 */
enum class OperationIntent {
    Index,
    SemanticSearch,
    CodeSearch,
    ReadFile,
    GetStructure
};

inline std::string intentName(OperationIntent intent) {
    switch (intent) {
        case OperationIntent::Index: return "Index";
        case OperationIntent::SemanticSearch: return "SemanticSearch";
        case OperationIntent::CodeSearch: return "CodeSearch";
        case OperationIntent::ReadFile: return "ReadFile";
        case OperationIntent::GetStructure: return "GetStructure";
    }
    return "Unknown";
}

/**
 * @brief Maps the configuration key ("index", "semantic_search", "search",
 * "code_search", "read_file", "get_structure"/"structure") to an intent.
 * @return false if the key names no intent.
 */
bool parseIntent(const std::string& key, OperationIntent& out);

inline const std::vector<OperationIntent>& allIntents() {
    static const std::vector<OperationIntent> intents = {
        OperationIntent::Index,
        OperationIntent::SemanticSearch,
        OperationIntent::CodeSearch,
        OperationIntent::ReadFile,
        OperationIntent::GetStructure
    };
    return intents;
}
