#include "mcp/HealthMonitor.h"
#include "utils/Logger.h"
#include <algorithm>

std::string connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Ready: return "Ready";
        case ConnectionState::Degraded: return "Degraded";
        case ConnectionState::Closing: return "Closing";
    }
    return "Unknown";
}

HealthMonitor::HealthMonitor(IMonitoredConnection& connection, Config::Health settings)
    : connection(connection), settings(settings) {
    const Config::Health defaults;
    if (this->settings.interval.count() <= 0) {
        Logger::getInstance().warn("health.interval must be positive; using " +
                                   std::to_string(defaults.interval.count()) + " ms");
        this->settings.interval = defaults.interval;
    }
    if (this->settings.probeTimeout.count() <= 0) {
        Logger::getInstance().warn("health.probe_timeout must be positive; using " +
                                   std::to_string(defaults.probeTimeout.count()) + " ms");
        this->settings.probeTimeout = defaults.probeTimeout;
    }
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    std::lock_guard<std::mutex> lock(mtx);
    if (worker.joinable()) return;
    stopping = false;
    woken = false;
    running = true;
    worker = std::thread(&HealthMonitor::run, this);
}

void HealthMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopping = true;
    }
    cv.notify_all();
    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
    running = false;
}

void HealthMonitor::wake() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        woken = true;
    }
    cv.notify_all();
}

std::chrono::milliseconds HealthMonitor::backoffFor(int attempt) const {
    auto delay = settings.initialBackoff;
    for (int i = 1; i < attempt && delay < settings.maxBackoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, settings.maxBackoff);
}

void HealthMonitor::run() {
    std::unique_lock<std::mutex> lock(mtx);
    while (!stopping) {
        cv.wait_for(lock, settings.interval, [this] { return stopping || woken; });
        if (stopping) break;
        woken = false;
        lock.unlock();
        check();
        lock.lock();
    }
}

void HealthMonitor::check() {
    auto current = connection.state();
    if (current == ConnectionState::Ready) {
        if (connection.probe()) return;
        connection.markDegraded("Health probe failed");
        current = connection.state();
    }
    if (current == ConnectionState::Degraded) {
        recover();
    }
}

void HealthMonitor::recover() {
    auto& logger = Logger::getInstance();
    for (int attempt = 1; attempt <= settings.maxReconnectAttempts; ++attempt) {
        auto delay = backoffFor(attempt);
        logger.info("Reconnecting in " + std::to_string(delay.count()) + " ms (attempt " +
                    std::to_string(attempt) + "/" + std::to_string(settings.maxReconnectAttempts) + ")");
        if (!pause(delay)) return;
        if (connection.state() != ConnectionState::Degraded) return;

        if (connection.reconnect()) {
            logger.success("Reconnected to tool server");
            return;
        }
    }
    if (connection.state() == ConnectionState::Degraded) {
        connection.markDisconnected("Gave up after " + std::to_string(settings.maxReconnectAttempts) +
                                    " reconnect attempt(s)");
    }
}

bool HealthMonitor::pause(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, delay, [this] { return stopping; });
    return !stopping;
}
