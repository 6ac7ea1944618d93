#include "mcp/ConnectionManager.h"
#include "mcp/StdioTransport.h"
#include "mcp/McpErrors.h"
#include "utils/Logger.h"

ConnectionManager::ConnectionManager(Config config, TransportFactory transportFactory)
    : cfg(std::move(config)),
      factory(std::move(transportFactory)),
      healthMonitor(*this, cfg.health) {
    if (!factory) {
        factory = [] { return std::make_shared<StdioTransport>(); };
    }
    cfg.configureResolver(toolResolver);
    table = std::make_shared<const CapabilityTable>();
}

ConnectionManager::~ConnectionManager() {
    stop();
}

void ConnectionManager::start() {
    closing = false;
    {
        std::lock_guard<std::mutex> lock(connectionMutex);
        try {
            connectLocked();
        } catch (const McpError& e) {
            recordError(e.what());
            teardownLocked(std::string("Connection failed: ") + e.what());
            setState(ConnectionState::Disconnected);
            throw;
        }
        ++reconnectEpoch;
    }
    healthMonitor.start();
}

void ConnectionManager::stop() {
    if (closing.exchange(true) && state() == ConnectionState::Disconnected) return;
    setState(ConnectionState::Closing);

    // Abort a handshake that may be holding connectionMutex.
    if (auto link = activeTransport()) {
        link->stop();
    }
    correlator.failAll("Connection closed");

    healthMonitor.stop();

    std::lock_guard<std::mutex> lock(connectionMutex);
    teardownLocked("Connection closed");
    setState(ConnectionState::Disconnected);
}

bool ConnectionManager::reconnect() {
    const uint64_t observed = reconnectEpoch.load();
    std::lock_guard<std::mutex> lock(connectionMutex);
    if (closing) return false;
    if (reconnectEpoch.load() != observed) {
        Logger::getInstance().debug("Reconnect already completed by another caller");
        return state() == ConnectionState::Ready;
    }

    bool ok = false;
    try {
        connectLocked();
        ok = true;
    } catch (const McpError& e) {
        recordError(e.what());
        Logger::getInstance().warn(std::string("Reconnect failed: ") + e.what());
        teardownLocked(std::string("Reconnect failed: ") + e.what());
        if (!closing) setState(ConnectionState::Degraded);
    }
    ++reconnectEpoch;
    return ok;
}

void ConnectionManager::connectLocked() {
    setState(ConnectionState::Connecting);
    teardownLocked("Connection is being re-established");

    const uint64_t gen = ++generation;
    auto link = factory();
    Logger::getInstance().info("Starting tool server: " + cfg.server.command);
    link->start(cfg.server,
                [this, gen](const std::string& line) {
                    if (gen == generation.load()) correlator.handleLine(line);
                },
                [this, gen](int code) { onTransportExit(gen, code); });
    {
        std::lock_guard<std::mutex> lock(transportMutex);
        transport = link;
    }
    if (closing) {
        throw ConnectionLostError("Connection closed during startup");
    }
    correlator.attach(link);

    Session session(correlator, cfg.timeouts.initialize, cfg.timeouts.listTools);
    auto result = session.establish();

    std::lock_guard<std::mutex> lock(stateMutex);
    if (closing) {
        throw ConnectionLostError("Connection closed during handshake");
    }
    // An exit during Connecting is not degraded by onTransportExit; catch it here.
    if (gen != generation.load() || !link->isAlive()) {
        throw ConnectionLostError("Server exited during handshake");
    }
    table = std::make_shared<const CapabilityTable>(std::move(result.capabilities));
    info = result.info;
    lastErrorText.clear();
    currentState = ConnectionState::Ready;
    Logger::getInstance().success("Connected to " + (info.serverName.empty() ? cfg.server.command : info.serverName) +
                                  " (" + std::to_string(table->size()) + " tools)");
}

void ConnectionManager::teardownLocked(const std::string& reason) {
    ++generation;
    correlator.detach();
    correlator.failAll(reason);

    std::shared_ptr<ITransport> old;
    {
        std::lock_guard<std::mutex> lock(transportMutex);
        old.swap(transport);
    }
    if (old) {
        old->stop();
    }
}

void ConnectionManager::markDegraded(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (currentState != ConnectionState::Ready) return;
        currentState = ConnectionState::Degraded;
        lastErrorText = reason;
    }
    Logger::getInstance().warn("Connection degraded: " + reason);
    correlator.failAll(reason);
}

void ConnectionManager::markDisconnected(const std::string& reason) {
    recordError(reason);
    Logger::getInstance().error("Disconnected from tool server: " + reason);
    std::lock_guard<std::mutex> lock(connectionMutex);
    teardownLocked(reason);
    if (!closing) setState(ConnectionState::Disconnected);
}

void ConnectionManager::onTransportExit(uint64_t gen, int code) {
    if (gen != generation.load()) return;
    ProcessExitedError exited(code);
    const std::string reason = exited.what();
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        lastErrorText = reason;
        if (currentState == ConnectionState::Ready) {
            currentState = ConnectionState::Degraded;
        }
    }
    Logger::getInstance().warn(reason);
    correlator.failAll(reason);
    healthMonitor.wake();
}

bool ConnectionManager::probe() {
    auto link = activeTransport();
    if (!link || !link->isAlive()) return false;
    try {
        correlator.call("ping", nlohmann::json(), healthMonitor.probeTimeout());
        return true;
    } catch (const RemoteError& e) {
        Logger::getInstance().debug(std::string("Probe answered with an error: ") + e.what());
        return true;
    } catch (const McpError& e) {
        Logger::getInstance().warn(std::string("Health probe failed: ") + e.what());
        return false;
    }
}

nlohmann::json ConnectionManager::callTool(const std::string& name, const nlohmann::json& arguments, std::chrono::milliseconds timeout) {
    auto current = state();
    if (current != ConnectionState::Ready) {
        throw NotConnectedError("Not connected to the tool server (state: " + connectionStateName(current) + ")");
    }
    nlohmann::json params = {
        {"name", name},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };
    try {
        return correlator.call("tools/call", params, timeout);
    } catch (const BrokenPipeError& e) {
        markDegraded(e.what());
        healthMonitor.wake();
        throw;
    }
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return currentState;
}

std::shared_ptr<const CapabilityTable> ConnectionManager::capabilities() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return table;
}

SessionInfo ConnectionManager::sessionInfo() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return info;
}

int ConnectionManager::pid() const {
    auto link = activeTransport();
    return link ? link->pid() : -1;
}

std::chrono::system_clock::time_point ConnectionManager::lastActivity() const {
    auto link = activeTransport();
    return link ? link->lastActivity() : std::chrono::system_clock::time_point{};
}

std::string ConnectionManager::lastError() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return lastErrorText;
}

void ConnectionManager::setState(ConnectionState next) {
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        previous = currentState;
        currentState = next;
    }
    if (previous != next) {
        Logger::getInstance().debug("Connection state: " + connectionStateName(previous) + " -> " + connectionStateName(next));
    }
}

void ConnectionManager::recordError(const std::string& message) {
    std::lock_guard<std::mutex> lock(stateMutex);
    lastErrorText = message;
}

std::shared_ptr<ITransport> ConnectionManager::activeTransport() const {
    std::lock_guard<std::mutex> lock(transportMutex);
    return transport;
}
