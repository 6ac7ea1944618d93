#include "mcp/Session.h"
#include "mcp/McpErrors.h"
#include "utils/Logger.h"
#include <stdexcept>
#include <vector>

Session::Result Session::establish() {
    Result result;
    result.info = initialize();
    result.capabilities = discoverTools();
    return result;
}

SessionInfo Session::initialize() {
    nlohmann::json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {
            {"roots", {{"listChanged", true}}},
            {"sampling", nlohmann::json::object()}
        }},
        {"clientInfo", {{"name", kClientName}, {"version", kClientVersion}}}
    };
    auto res = correlator.call("initialize", params, initializeTimeout);

    SessionInfo info;
    if (res.is_object()) {
        if (res.contains("protocolVersion") && res["protocolVersion"].is_string()) {
            info.protocolVersion = res["protocolVersion"].get<std::string>();
        }
        if (res.contains("serverInfo") && res["serverInfo"].is_object()) {
            const auto& server = res["serverInfo"];
            if (server.contains("name") && server["name"].is_string()) {
                info.serverName = server["name"].get<std::string>();
            }
            if (server.contains("version") && server["version"].is_string()) {
                info.serverVersion = server["version"].get<std::string>();
            }
        }
        if (res.contains("instructions") && res["instructions"].is_string()) {
            info.instructions = res["instructions"].get<std::string>();
        }
    }
    if (info.protocolVersion.empty()) {
        info.protocolVersion = kProtocolVersion;
    } else if (info.protocolVersion != kProtocolVersion) {
        Logger::getInstance().warn("Server negotiated protocol " + info.protocolVersion +
                                   " (requested " + kProtocolVersion + ")");
    }

    correlator.notify("notifications/initialized");
    Logger::getInstance().info("MCP protocol initialized" +
                               (info.serverName.empty() ? std::string() : " with " + info.serverName + " " + info.serverVersion));
    return info;
}

CapabilityTable Session::discoverTools() {
    std::vector<nlohmann::json> pages;
    try {
        nlohmann::json params;
        for (int page = 0; page < kMaxToolPages; ++page) {
            auto res = correlator.call("tools/list", params, listToolsTimeout);
            pages.push_back(res);
            if (!res.is_object() || !res.contains("nextCursor") || !res["nextCursor"].is_string() ||
                res["nextCursor"].get<std::string>().empty()) {
                auto table = CapabilityTable::fromToolsListPages(pages);
                Logger::getInstance().info("Discovered " + std::to_string(table.size()) + " tool(s)");
                return table;
            }
            params = {{"cursor", res["nextCursor"]}};
        }
        Logger::getInstance().warn("tools/list did not finish within " + std::to_string(kMaxToolPages) + " pages");
    } catch (const McpError& e) {
        Logger::getInstance().warn(std::string("Tool discovery failed: ") + e.what());
    } catch (const std::invalid_argument& e) {
        Logger::getInstance().warn(std::string("Tool discovery returned an unexpected shape: ") + e.what());
    }
    return CapabilityTable();
}
