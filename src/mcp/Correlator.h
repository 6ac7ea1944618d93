#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <future>
#include <chrono>
#include <atomic>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "mcp/Transport.h"

/**
 * @brief Joins JSON-RPC requests to their responses over a shared stream.
 *
 * call() blocks only the calling thread; handleLine() runs on the
 * transport's receive loop and resolves the matching pending entry. Ids come
 * from one counter that survives reconnects, so a late response from a
 * replaced server can never satisfy a newer request.
 */
class Correlator {
public:
    struct PendingRequest {
        int64_t id = 0;
        std::string method;
        std::chrono::steady_clock::time_point issuedAt;
        std::chrono::steady_clock::time_point deadline;
        std::promise<nlohmann::json> resultSlot;
    };

    Correlator() = default;
    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;

    void attach(std::shared_ptr<ITransport> transport);
    void detach();

    /**
     * @brief Sends a request and waits for its result.
     * @return the response's "result" member
     * @throws RemoteError, TimeoutError, ConnectionLostError, BrokenPipeError
     */
    nlohmann::json call(const std::string& method, const nlohmann::json& params, std::chrono::milliseconds timeout);

    // Notifications carry no id and get no response.
    void notify(const std::string& method, const nlohmann::json& params = nlohmann::json());

    // Entry point for the receive loop.
    void handleLine(const std::string& line);

    // Fails every pending call with ConnectionLostError.
    void failAll(const std::string& reason);

    size_t pendingCount() const;
    int64_t lastIssuedId() const { return nextId.load() - 1; }

private:
    mutable std::mutex mtx;
    std::shared_ptr<ITransport> transport;
    std::unordered_map<int64_t, std::shared_ptr<PendingRequest>> pending;
    std::atomic<int64_t> nextId{1};

    std::shared_ptr<ITransport> currentTransport() const;
    std::shared_ptr<PendingRequest> takePending(int64_t id);
    void handleServerRequest(const nlohmann::json& msg);
    static bool extractId(const nlohmann::json& msg, int64_t& id);
};
