#pragma once
#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <atomic>
#include "core/ConfigManager.h"

enum class ConnectionState {
    Disconnected,
    Connecting,
    Ready,
    Degraded,
    Closing
};

std::string connectionStateName(ConnectionState state);

/**
 * @brief What the monitor needs from a connection.
 */
class IMonitoredConnection {
public:
    virtual ~IMonitoredConnection() = default;

    virtual ConnectionState state() const = 0;
    // True if the server answered (an error reply counts).
    virtual bool probe() = 0;
    virtual void markDegraded(const std::string& reason) = 0;
    // One stop/start/handshake cycle. True if the connection is Ready afterwards.
    virtual bool reconnect() = 0;
    virtual void markDisconnected(const std::string& reason) = 0;
};

/**
 * @brief Background thread that probes a Ready connection every interval and
 * drives recovery once it is Degraded.
 *
 * Recovery makes up to maxReconnectAttempts reconnects, each after a backoff
 * of initialBackoff * 2^(n-1) capped at maxBackoff. If none succeeds the
 * connection is marked Disconnected. stop() interrupts any wait.
 */
class HealthMonitor {
public:
    HealthMonitor(IMonitoredConnection& connection, Config::Health settings);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void start();
    void stop();

    // Runs a check now instead of at the end of the interval. Safe from any thread.
    void wake();

    bool isRunning() const { return running; }

    std::chrono::milliseconds backoffFor(int attempt) const;
    std::chrono::milliseconds probeTimeout() const { return settings.probeTimeout; }

private:
    IMonitoredConnection& connection;
    Config::Health settings;

    std::thread worker;
    std::mutex mtx;
    std::condition_variable cv;
    bool stopping = false;
    bool woken = false;
    std::atomic<bool> running{false};

    void run();
    void check();
    void recover();
    // False if stop() was requested during the wait.
    bool pause(std::chrono::milliseconds delay);
};
