#pragma once
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>
#include "mcp/Correlator.h"
#include "mcp/CapabilityTable.h"

struct SessionInfo {
    std::string protocolVersion;
    std::string serverName;
    std::string serverVersion;
    std::string instructions;
};

/**
 * @brief Brings a freshly started transport to the usable state.
 *
 * initialize → notifications/initialized → tools/list. Only a failed
 * initialize fails the session; a failed discovery yields an empty table.
 */
class Session {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr const char* kClientName = "OpenFlux";
    static constexpr const char* kClientVersion = "1.0.0";
    static constexpr int kMaxToolPages = 32;

    struct Result {
        SessionInfo info;
        CapabilityTable capabilities;
    };

    Session(Correlator& correlator, std::chrono::milliseconds initializeTimeout, std::chrono::milliseconds listToolsTimeout)
        : correlator(correlator), initializeTimeout(initializeTimeout), listToolsTimeout(listToolsTimeout) {}

    // Throws whatever the initialize call throws.
    Result establish();

    SessionInfo initialize();
    CapabilityTable discoverTools();

private:
    Correlator& correlator;
    std::chrono::milliseconds initializeTimeout;
    std::chrono::milliseconds listToolsTimeout;
};
