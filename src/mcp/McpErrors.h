#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "mcp/OperationIntent.h"

/**
 * @brief Failure categories surfaced by the connection layer.
 *
 * Everything below the ResearchClient facade throws one of the McpError
 * subclasses; the facade turns them into a ToolOutcome carrying the kind.
 */
enum class ErrorKind {
    None,
    Launch,
    BrokenPipe,
    ProcessExited,
    Timeout,
    Remote,
    ToolNotAvailable,
    ConnectionLost,
    NotConnected
};

std::string errorKindName(ErrorKind kind);

class McpError : public std::runtime_error {
public:
    McpError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    ErrorKind kind() const { return errorKind; }

private:
    ErrorKind errorKind;
};

// Process could not start. Fatal until the configuration changes.
class LaunchError : public McpError {
public:
    explicit LaunchError(const std::string& message) : McpError(ErrorKind::Launch, message) {}
};

class BrokenPipeError : public McpError {
public:
    explicit BrokenPipeError(const std::string& message) : McpError(ErrorKind::BrokenPipe, message) {}
};

class ProcessExitedError : public McpError {
public:
    explicit ProcessExitedError(int code)
        : McpError(ErrorKind::ProcessExited, "Server process exited with code " + std::to_string(code)),
          exitCode(code) {}

    int code() const { return exitCode; }

private:
    int exitCode;
};

class TimeoutError : public McpError {
public:
    explicit TimeoutError(const std::string& message) : McpError(ErrorKind::Timeout, message) {}
};

/**
 * @brief The server answered with a JSON-RPC error object, or a tool result
 * flagged isError. Never retried automatically.
 */
class RemoteError : public McpError {
public:
    RemoteError(int code, const std::string& message)
        : McpError(ErrorKind::Remote, message), errorCode(code) {}

    int code() const { return errorCode; }

private:
    int errorCode;
};

class ToolNotAvailableError : public McpError {
public:
    ToolNotAvailableError(OperationIntent intent, const std::vector<std::string>& aliases);

    OperationIntent intent() const { return failedIntent; }
    const std::vector<std::string>& triedAliases() const { return aliases; }

private:
    OperationIntent failedIntent;
    std::vector<std::string> aliases;
};

// The connection dropped while the call was in flight.
class ConnectionLostError : public McpError {
public:
    explicit ConnectionLostError(const std::string& message) : McpError(ErrorKind::ConnectionLost, message) {}
};

class NotConnectedError : public McpError {
public:
    explicit NotConnectedError(const std::string& message) : McpError(ErrorKind::NotConnected, message) {}
};
