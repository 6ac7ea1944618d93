#include "mcp/McpErrors.h"

namespace {
std::string joinAliases(const std::vector<std::string>& aliases) {
    std::string out;
    for (const auto& alias : aliases) {
        if (!out.empty()) out += ", ";
        out += alias;
    }
    return out;
}
} // namespace

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Launch: return "LaunchError";
        case ErrorKind::BrokenPipe: return "BrokenPipeError";
        case ErrorKind::ProcessExited: return "ProcessExited";
        case ErrorKind::Timeout: return "TimeoutError";
        case ErrorKind::Remote: return "RemoteError";
        case ErrorKind::ToolNotAvailable: return "ToolNotAvailable";
        case ErrorKind::ConnectionLost: return "ConnectionLostError";
        case ErrorKind::NotConnected: return "NotConnectedError";
    }
    return "Unknown";
}

ToolNotAvailableError::ToolNotAvailableError(OperationIntent intent, const std::vector<std::string>& aliases)
    : McpError(ErrorKind::ToolNotAvailable,
               "No tool available for " + intentName(intent) + " (tried: " + joinAliases(aliases) + ")"),
      failedIntent(intent),
      aliases(aliases) {}
