#include "mcp/CapabilityTable.h"
#include <stdexcept>

ToolDescriptor ToolDescriptor::fromJson(const nlohmann::json& tool) {
    if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string()) {
        throw std::invalid_argument("Tool descriptor without a name: " + tool.dump());
    }

    ToolDescriptor td;
    td.name = tool["name"].get<std::string>();
    if (td.name.empty()) {
        throw std::invalid_argument("Tool descriptor with an empty name");
    }
    if (tool.contains("description") && tool["description"].is_string()) {
        td.description = tool["description"].get<std::string>();
    }
    if (tool.contains("inputSchema") && tool["inputSchema"].is_object()) {
        td.inputSchema = tool["inputSchema"];
        const auto& schema = td.inputSchema;
        if (schema.contains("properties") && schema["properties"].is_object()) {
            for (const auto& item : schema["properties"].items()) {
                td.declaredParameters.insert(item.key());
            }
        }
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& param : schema["required"]) {
                if (param.is_string()) td.requiredParameters.insert(param.get<std::string>());
            }
        }
    }
    return td;
}

CapabilityTable CapabilityTable::fromToolsListPages(const std::vector<nlohmann::json>& pages) {
    // Parse everything first; the table is only assembled once all pages are valid.
    std::vector<ToolDescriptor> parsed;
    for (const auto& page : pages) {
        if (!page.is_object() || !page.contains("tools") || !page["tools"].is_array()) {
            throw std::invalid_argument("tools/list result has no tools array");
        }
        for (const auto& tool : page["tools"]) {
            parsed.push_back(ToolDescriptor::fromJson(tool));
        }
    }
    return fromDescriptors(parsed);
}

CapabilityTable CapabilityTable::fromToolsList(const nlohmann::json& result) {
    return fromToolsListPages({result});
}

CapabilityTable CapabilityTable::fromDescriptors(const std::vector<ToolDescriptor>& descriptors) {
    CapabilityTable table;
    for (const auto& td : descriptors) {
        // First declaration wins if a server lists a name twice.
        table.tools.emplace(td.name, td);
    }
    return table;
}

const ToolDescriptor* CapabilityTable::find(const std::string& name) const {
    auto it = tools.find(name);
    return it == tools.end() ? nullptr : &it->second;
}

std::vector<std::string> CapabilityTable::names() const {
    std::vector<std::string> out;
    out.reserve(tools.size());
    for (const auto& [name, _] : tools) out.push_back(name);
    return out;
}
