#pragma once
#include <string>
#include <vector>
#include <set>
#include <map>
#include <nlohmann/json.hpp>

struct ToolDescriptor {
    std::string name;
    std::string description;
    // Property names of inputSchema.
    std::set<std::string> declaredParameters;
    std::set<std::string> requiredParameters;
    nlohmann::json inputSchema = nlohmann::json::object();

    static ToolDescriptor fromJson(const nlohmann::json& tool);
};

/**
 * @brief Immutable snapshot of the tools a server advertised.
 *
 * Built in one piece from a complete discovery; a failed or malformed
 * discovery throws instead of producing a partially filled table.
 */
class CapabilityTable {
public:
    CapabilityTable() = default;

    /**
     * @brief Builds a table from one or more tools/list result pages.
     * @throws std::invalid_argument if any page or entry has an unexpected shape
     */
    static CapabilityTable fromToolsListPages(const std::vector<nlohmann::json>& pages);
    static CapabilityTable fromToolsList(const nlohmann::json& result);
    static CapabilityTable fromDescriptors(const std::vector<ToolDescriptor>& tools);

    bool contains(const std::string& name) const { return tools.count(name) > 0; }
    const ToolDescriptor* find(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const { return tools.size(); }
    bool empty() const { return tools.empty(); }

private:
    std::map<std::string, ToolDescriptor> tools;
};
