#pragma once
#include <string>
#include <deque>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include "mcp/Transport.h"
#ifndef _WIN32
#include <sys/types.h>
#endif

/**
 * @brief ITransport over the stdin/stdout pipes of a forked child process.
 *
 * The child runs in its own process group so that stop() also reaches any
 * helper processes it spawned (uvx → python). stderr is drained on a second
 * thread; its tail is kept for launch diagnostics.
 */
class StdioTransport : public ITransport {
public:
    StdioTransport() = default;
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(const ServerCommand& command, LineHandler onLine, ExitHandler onExit) override;
    void send(const std::string& payload) override;
    void stop() override;
    bool isAlive() const override;
    int pid() const override { return childPid; }
    std::chrono::system_clock::time_point lastActivity() const override;

    std::string stderrTail() const;

private:
    ServerCommand command;
    MessageFramer encoder;
    LineHandler onLine;
    ExitHandler onExit;

    pid_t childPid = -1;
    int writeFd = -1;
    int readFd = -1;
    int errFd = -1;

    mutable std::mutex procMutex;
    mutable bool exited = false;
    mutable int exitCode = -1;

    std::mutex writeMutex;
    std::mutex lifecycleMutex;
    bool stopped = false;
    std::atomic<bool> stopRequested{false};
    std::atomic<long long> lastActivityMs{0};

    std::thread readerThread;
    std::thread stderrThread;

    mutable std::mutex stderrMutex;
    std::deque<std::string> stderrLines;

    void receiveLoop();
    void stderrLoop();
    bool reap(bool block) const;
    bool waitForExit(std::chrono::milliseconds timeout) const;
    void signalGroup(int sig) const;
    void drainStderr(std::chrono::milliseconds timeout);
    void closeFds();
    void rememberStderr(const std::string& line);

    static std::string describeLaunchFailure(const std::string& command, int exitCode, const std::string& stderrText);
};
