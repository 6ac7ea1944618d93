#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "mcp/Transport.h"
#include "mcp/Correlator.h"
#include "mcp/Session.h"
#include "mcp/CapabilityTable.h"
#include "mcp/ToolResolver.h"
#include "mcp/HealthMonitor.h"

/**
 * @brief The one connection to the tool server.
 *
 * Owns the transport, the correlator, the capability snapshot and the
 * connection state, and runs the health monitor while started. Reconnects
 * are serialized by connectionMutex; readers of state and capabilities never
 * take it, so a caller only learns that the connection was Ready at the time
 * of the check.
 */
class ConnectionManager : public IMonitoredConnection {
public:
    using TransportFactory = std::function<std::shared_ptr<ITransport>()>;

    // A null factory launches a StdioTransport.
    explicit ConnectionManager(Config config, TransportFactory factory = nullptr);
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Launches the server, runs the handshake and starts monitoring.
     * @throws LaunchError or another McpError; the state is Disconnected then
     */
    void start();

    // Idempotent. Supersedes any reconnect in progress.
    void stop();

    // Overlapping calls are coalesced into the one already running.
    bool reconnect() override;

    ConnectionState state() const override;
    bool probe() override;
    void markDegraded(const std::string& reason) override;
    void markDisconnected(const std::string& reason) override;

    /**
     * @brief tools/call on the current connection.
     * @return the raw tools/call result
     * @throws NotConnectedError unless Ready, otherwise whatever the call throws
     */
    nlohmann::json callTool(const std::string& name, const nlohmann::json& arguments, std::chrono::milliseconds timeout);

    std::shared_ptr<const CapabilityTable> capabilities() const;
    SessionInfo sessionInfo() const;
    int pid() const;
    std::chrono::system_clock::time_point lastActivity() const;
    std::string lastError() const;

    const Config& config() const { return cfg; }
    const ToolResolver& resolver() const { return toolResolver; }
    HealthMonitor& monitor() { return healthMonitor; }

private:
    Config cfg;
    TransportFactory factory;
    ToolResolver toolResolver;
    Correlator correlator;
    HealthMonitor healthMonitor;

    // Serializes start / reconnect / teardown.
    std::mutex connectionMutex;
    std::atomic<uint64_t> reconnectEpoch{0};
    std::atomic<uint64_t> generation{0};
    std::atomic<bool> closing{false};

    mutable std::mutex stateMutex;
    ConnectionState currentState = ConnectionState::Disconnected;
    std::shared_ptr<const CapabilityTable> table;
    SessionInfo info;
    std::string lastErrorText;

    mutable std::mutex transportMutex;
    std::shared_ptr<ITransport> transport;

    void connectLocked();
    void teardownLocked(const std::string& reason);
    void setState(ConnectionState next);
    void recordError(const std::string& message);
    void onTransportExit(uint64_t gen, int code);
    std::shared_ptr<ITransport> activeTransport() const;
};
