#pragma once
#include <json/json.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include "Logger.hpp"
#include "NotificationBroadcaster.hpp"
#include "RequestDispatcher.hpp"
#include "WorkerPool.hpp"

// One end of a line-delimited JSON-RPC 2.0 connection.
//
// Outbound requests get increasing integer ids and a future that always
// resolves: with the peer's response, or locally with a timeout, cancellation
// or termination error. Responses may arrive in any order. A response whose id
// is not outstanding is logged and dropped.
//
// Inbound requests run on a worker pool so that reading frames never waits on
// a handler. An inbound id that is still being handled is rejected with
// Invalid Request.
class JsonRpcPeer {
public:
    // Writes one serialized frame (without the newline). Calls are serialized
    // by the peer. Returns false when the stream is gone.
    using FrameWriter = std::function<bool(const std::string&)>;
    using RequestHandler = std::function<Json::Value(const Json::Value& request)>;

    struct PendingCall {
        Json::Value id;
        std::future<Json::Value> response;
    };

    JsonRpcPeer(Logger& logger,
                std::string name,
                FrameWriter writer,
                std::chrono::milliseconds defaultTimeout,
                std::size_t workers);
    ~JsonRpcPeer();

    JsonRpcPeer(const JsonRpcPeer&) = delete;
    JsonRpcPeer& operator=(const JsonRpcPeer&) = delete;

    PendingCall sendRequest(const std::string& method,
                            const Json::Value& params,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    bool sendNotification(const std::string& method, const Json::Value& params);

    // Resolves the call with a cancellation error; a later response for it is
    // dropped. Returns false when the id is not outstanding.
    bool cancel(const Json::Value& id);

    // Handler for inbound requests; must return the complete response.
    void setRequestHandler(RequestHandler handler);
    void setDispatcher(const RequestDispatcher& dispatcher);

    int subscribe(NotificationBroadcaster::Listener listener);
    void unsubscribe(int token);

    // Feed one inbound line.
    void handleFrame(const std::string& line);

    // The stream ended: every outstanding call fails with "process
    // terminated" and later requests fail immediately.
    void handleClosed(const std::string& reason);

    bool closed() const { return closed_; }
    std::size_t outstanding() const;

    static Json::Value createResponse(const Json::Value& id, const Json::Value& result);
    static Json::Value createError(const Json::Value& id, int code, const std::string& message);
    static std::string serialize(const Json::Value& message);

private:
    struct Pending {
        std::promise<Json::Value> promise;
        std::chrono::steady_clock::time_point deadline;
        std::string method;
    };

    bool writeFrame(const Json::Value& message);
    void handleResponse(const Json::Value& message);
    void handleRequest(const Json::Value& message);
    void resolveLocally(std::int64_t id, int code, const std::string& message);
    void timerLoop();

    Logger& logger_;
    std::string name_;
    FrameWriter writer_;
    std::chrono::milliseconds defaultTimeout_;

    std::mutex writeMutex_;

    mutable std::mutex mutex_;
    std::condition_variable timerCv_;
    std::map<std::int64_t, Pending> pending_;
    std::set<std::string> inFlight_;
    std::int64_t nextId_ = 1;
    std::atomic<bool> closed_{false};
    bool stopping_ = false;

    RequestHandler handler_;
    NotificationBroadcaster notifications_;
    WorkerPool pool_;
    std::thread timer_;
};
