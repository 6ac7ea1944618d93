#include "mcp/Correlator.h"
#include "mcp/McpErrors.h"
#include "utils/Logger.h"
#include <exception>

namespace {
const std::size_t kLogPreviewChars = 200;

std::string preview(const std::string& text) {
    if (text.size() <= kLogPreviewChars) return text;
    return text.substr(0, kLogPreviewChars) + "...";
}

std::string dumpSafe(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
} // namespace

void Correlator::attach(std::shared_ptr<ITransport> newTransport) {
    std::lock_guard<std::mutex> lock(mtx);
    transport = std::move(newTransport);
}

void Correlator::detach() {
    std::lock_guard<std::mutex> lock(mtx);
    transport.reset();
}

std::shared_ptr<ITransport> Correlator::currentTransport() const {
    std::lock_guard<std::mutex> lock(mtx);
    return transport;
}

std::shared_ptr<Correlator::PendingRequest> Correlator::takePending(int64_t id) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = pending.find(id);
    if (it == pending.end()) return nullptr;
    auto entry = it->second;
    pending.erase(it);
    return entry;
}

nlohmann::json Correlator::call(const std::string& method, const nlohmann::json& params, std::chrono::milliseconds timeout) {
    auto link = currentTransport();
    if (!link) {
        throw ConnectionLostError("No active connection for " + method);
    }

    auto entry = std::make_shared<PendingRequest>();
    entry->id = nextId++;
    entry->method = method;
    entry->issuedAt = std::chrono::steady_clock::now();
    entry->deadline = entry->issuedAt + timeout;
    auto future = entry->resultSlot.get_future();
    const int64_t id = entry->id;
    {
        std::lock_guard<std::mutex> lock(mtx);
        pending[id] = entry;
    }

    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        request["params"] = params;
    }

    Logger::getInstance().debug("-> [" + std::to_string(id) + "] " + method);
    try {
        link->send(dumpSafe(request));
    } catch (const McpError&) {
        takePending(id);
        throw;
    }

    if (future.wait_until(entry->deadline) != std::future_status::ready) {
        if (takePending(id)) {
            throw TimeoutError(method + " timed out after " + std::to_string(timeout.count()) + " ms");
        }
        // Resolved between the wait expiring and the removal; the slot is already written.
    }
    return future.get();
}

void Correlator::notify(const std::string& method, const nlohmann::json& params) {
    auto link = currentTransport();
    if (!link) {
        throw ConnectionLostError("No active connection for " + method);
    }
    nlohmann::json msg = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) {
        msg["params"] = params;
    }
    link->send(dumpSafe(msg));
}

void Correlator::handleLine(const std::string& line) {
    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
        // Servers sometimes print banners or log lines on stdout.
        Logger::getInstance().warn("Dropping non-JSON output from server: " + preview(line));
        return;
    }
    if (!msg.is_object()) {
        Logger::getInstance().warn("Dropping unexpected message from server: " + preview(line));
        return;
    }

    if (msg.contains("method")) {
        if (msg.contains("id")) {
            handleServerRequest(msg);
        } else {
            Logger::getInstance().debug("Server notification: " + msg["method"].dump());
        }
        return;
    }

    int64_t id = 0;
    if (!extractId(msg, id)) {
        Logger::getInstance().warn("Dropping response without usable id: " + preview(line));
        return;
    }

    auto entry = takePending(id);
    if (!entry) {
        Logger::getInstance().warn("Dropping response for unknown request id " + std::to_string(id));
        return;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - entry->issuedAt);
    Logger::getInstance().debug("<- [" + std::to_string(id) + "] " + entry->method + " (" +
                                std::to_string(elapsed.count()) + " ms)");

    if (msg.contains("error") && !msg["error"].is_null()) {
        const auto& err = msg["error"];
        int code = 0;
        std::string message = "Unknown error";
        if (err.is_object()) {
            if (err.contains("code") && err["code"].is_number_integer()) {
                code = err["code"].get<int>();
            }
            if (err.contains("message") && err["message"].is_string()) {
                message = err["message"].get<std::string>();
            }
        } else if (err.is_string()) {
            message = err.get<std::string>();
        } else {
            message = dumpSafe(err);
        }
        entry->resultSlot.set_exception(std::make_exception_ptr(RemoteError(code, message)));
        return;
    }

    entry->resultSlot.set_value(msg.contains("result") ? msg["result"] : nlohmann::json::object());
}

void Correlator::failAll(const std::string& reason) {
    std::unordered_map<int64_t, std::shared_ptr<PendingRequest>> orphaned;
    {
        std::lock_guard<std::mutex> lock(mtx);
        orphaned.swap(pending);
    }
    if (!orphaned.empty()) {
        Logger::getInstance().warn("Failing " + std::to_string(orphaned.size()) + " pending request(s): " + reason);
    }
    for (auto& [id, entry] : orphaned) {
        entry->resultSlot.set_exception(std::make_exception_ptr(ConnectionLostError(reason)));
    }
}

size_t Correlator::pendingCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pending.size();
}

void Correlator::handleServerRequest(const nlohmann::json& msg) {
    std::string method = msg["method"].is_string() ? msg["method"].get<std::string>() : "";
    nlohmann::json reply = {
        {"jsonrpc", "2.0"},
        {"id", msg["id"]}
    };
    if (method == "ping") {
        reply["result"] = nlohmann::json::object();
    } else {
        Logger::getInstance().debug("Rejecting unsupported server request: " + method);
        reply["error"] = {{"code", -32601}, {"message", "Method not found: " + method}};
    }

    auto link = currentTransport();
    if (!link) return;
    try {
        link->send(dumpSafe(reply));
    } catch (const McpError& e) {
        Logger::getInstance().warn(std::string("Failed to answer server request: ") + e.what());
    }
}

bool Correlator::extractId(const nlohmann::json& msg, int64_t& id) {
    if (!msg.contains("id")) return false;
    const auto& raw = msg["id"];
    if (raw.is_number_integer()) {
        id = raw.get<int64_t>();
        return true;
    }
    if (raw.is_string()) {
        try {
            std::size_t used = 0;
            const std::string text = raw.get<std::string>();
            id = std::stoll(text, &used);
            return used == text.size();
        } catch (const std::exception&) {
            return false;
        }
    }
    return false;
}
