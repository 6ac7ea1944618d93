#include "mcp/OperationIntent.h"
#include <cctype>

bool parseIntent(const std::string& key, OperationIntent& out) {
    std::string lower = key;
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c == '-') c = '_';
    }
    if (lower == "index") {
        out = OperationIntent::Index;
    } else if (lower == "semantic_search" || lower == "search" || lower == "semanticsearch") {
        out = OperationIntent::SemanticSearch;
    } else if (lower == "code_search" || lower == "codesearch") {
        out = OperationIntent::CodeSearch;
    } else if (lower == "read_file" || lower == "readfile") {
        out = OperationIntent::ReadFile;
    } else if (lower == "get_structure" || lower == "structure" || lower == "getstructure") {
        out = OperationIntent::GetStructure;
    } else {
        return false;
    }
    return true;
}
