#pragma once
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <functional>
#include "mcp/MessageFramer.h"

/**
 * @brief How to launch the tool server.
 */
struct ServerCommand {
    std::string command;
    std::vector<std::string> args;
    // Merged over the inherited environment.
    std::map<std::string, std::string> env;
    Framing framing = Framing::Line;
    // A child that exits within this window is reported as a LaunchError.
    std::chrono::milliseconds startupGrace{300};
    // SIGTERM → SIGKILL escalation delay on stop().
    std::chrono::milliseconds stopGrace{5000};
};

/**
 * @brief Byte-level link to one tool server process.
 *
 * start() launches the process and begins the receive loop, which hands every
 * decoded message to onLine and, once the stream closes or the process dies,
 * delivers exactly one onExit(code). Both callbacks run on the transport's
 * own thread and must not call stop() on the same transport.
 */
class ITransport {
public:
    using LineHandler = std::function<void(const std::string&)>;
    using ExitHandler = std::function<void(int)>;

    virtual ~ITransport() = default;

    // Throws LaunchError.
    virtual void start(const ServerCommand& command, LineHandler onLine, ExitHandler onExit) = 0;

    // Throws BrokenPipeError once the input stream is closed.
    virtual void send(const std::string& payload) = 0;

    // Idempotent. No onExit is delivered for a requested stop.
    virtual void stop() = 0;

    virtual bool isAlive() const = 0;

    virtual int pid() const { return -1; }

    virtual std::chrono::system_clock::time_point lastActivity() const {
        return std::chrono::system_clock::time_point{};
    }
};
