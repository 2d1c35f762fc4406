#include "JsonRpcPeer.hpp"
#include <algorithm>
#include <memory>
#include <vector>

JsonRpcPeer::JsonRpcPeer(Logger& logger,
                         std::string name,
                         FrameWriter writer,
                         std::chrono::milliseconds defaultTimeout,
                         std::size_t workers)
    : logger_(logger), name_(std::move(name)), writer_(std::move(writer)), defaultTimeout_(defaultTimeout),
      notifications_(logger_, name_), pool_(logger_, name_, workers) {
    timer_ = std::thread(&JsonRpcPeer::timerLoop, this);
}

JsonRpcPeer::~JsonRpcPeer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    timerCv_.notify_all();
    if (timer_.joinable()) timer_.join();
    handleClosed("peer shut down");
    pool_.shutdown();
}

Json::Value JsonRpcPeer::createResponse(const Json::Value& id, const Json::Value& result) {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value JsonRpcPeer::createError(const Json::Value& id, int code, const std::string& message) {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

std::string JsonRpcPeer::serialize(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, message);
}

bool JsonRpcPeer::writeFrame(const Json::Value& message) {
    std::string frame = serialize(message);
    std::lock_guard<std::mutex> lock(writeMutex_);
    try {
        return writer_(frame);
    } catch (const std::exception& e) {
        logger_.error(name_, std::string("Frame write failed: ") + e.what());
        return false;
    }
}

void JsonRpcPeer::setRequestHandler(RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void JsonRpcPeer::setDispatcher(const RequestDispatcher& dispatcher) {
    setRequestHandler([&dispatcher](const Json::Value& request) { return dispatcher.dispatch(request); });
}

int JsonRpcPeer::subscribe(NotificationBroadcaster::Listener listener) {
    return notifications_.subscribe(std::move(listener));
}

void JsonRpcPeer::unsubscribe(int token) {
    notifications_.unsubscribe(token);
}

std::size_t JsonRpcPeer::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

JsonRpcPeer::PendingCall JsonRpcPeer::sendRequest(const std::string& method,
                                                  const Json::Value& params,
                                                  std::optional<std::chrono::milliseconds> timeout) {
    PendingCall call;
    std::int64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextId_++;
        call.id = Json::Value(static_cast<Json::Int64>(id));
        if (closed_) {
            std::promise<Json::Value> failed;
            call.response = failed.get_future();
            failed.set_value(createError(call.id, rpc::kProcessTerminated, "Process terminated"));
            return call;
        }
        Pending& pending = pending_[id];
        pending.deadline = std::chrono::steady_clock::now() + timeout.value_or(defaultTimeout_);
        pending.method = method;
        call.response = pending.promise.get_future();
    }
    timerCv_.notify_all();

    Json::Value request;
    request["jsonrpc"] = "2.0";
    request["id"] = call.id;
    request["method"] = method;
    if (!params.isNull()) {
        request["params"] = params;
    }
    logger_.debug(name_, "-> request " + std::to_string(id) + " " + method);
    if (!writeFrame(request)) {
        resolveLocally(id, rpc::kProcessTerminated, "Process terminated: could not write request");
    }
    return call;
}

bool JsonRpcPeer::sendNotification(const std::string& method, const Json::Value& params) {
    if (closed_) return false;
    Json::Value notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    if (!params.isNull()) {
        notification["params"] = params;
    }
    return writeFrame(notification);
}

void JsonRpcPeer::resolveLocally(std::int64_t id, int code, const std::string& message) {
    std::promise<Json::Value> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return;
        promise = std::move(it->second.promise);
        pending_.erase(it);
    }
    promise.set_value(createError(Json::Value(static_cast<Json::Int64>(id)), code, message));
}

bool JsonRpcPeer::cancel(const Json::Value& id) {
    if (!id.isIntegral()) return false;
    std::int64_t key = id.asInt64();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_.count(key)) return false;
    }
    logger_.debug(name_, "Cancelling request " + std::to_string(key));
    resolveLocally(key, rpc::kCancelled, "Request cancelled");
    return true;
}

void JsonRpcPeer::handleClosed(const std::string& reason) {
    std::map<std::int64_t, Pending> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ && pending_.empty()) return;
        closed_ = true;
        failed.swap(pending_);
    }
    if (!failed.empty()) {
        logger_.warning(name_, "Connection closed (" + reason + "); failing " + std::to_string(failed.size()) + " outstanding requests");
    }
    for (auto& [id, pending] : failed) {
        pending.promise.set_value(createError(Json::Value(static_cast<Json::Int64>(id)), rpc::kProcessTerminated,
                                              "Process terminated: " + reason));
    }
    timerCv_.notify_all();
}

void JsonRpcPeer::handleFrame(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return;
    }
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value message;
    std::string errs;
    if (!reader->parse(line.data(), line.data() + line.size(), &message, &errs) || !message.isObject()) {
        logger_.warning(name_, "Protocol violation: malformed frame discarded: " + line.substr(0, 200));
        return;
    }

    bool hasId = message.isMember("id") && !message["id"].isNull();
    bool hasMethod = message["method"].isString();
    if (hasMethod && hasId) {
        handleRequest(message);
    } else if (hasMethod) {
        notifications_.broadcast(message);
    } else if (hasId) {
        handleResponse(message);
    } else {
        logger_.warning(name_, "Protocol violation: frame is neither request, response nor notification");
    }
}

void JsonRpcPeer::handleResponse(const Json::Value& message) {
    bool hasResult = message.isMember("result");
    bool hasError = message.isMember("error");
    if (hasResult == hasError) {
        logger_.warning(name_, "Protocol violation: response must carry exactly one of result and error");
        return;
    }
    const Json::Value& id = message["id"];
    std::promise<Json::Value> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = id.isIntegral() ? pending_.find(id.asInt64()) : pending_.end();
        if (it == pending_.end()) {
            logger_.warning(name_, "Protocol violation: response for unknown id " + serialize(id) + " discarded");
            return;
        }
        promise = std::move(it->second.promise);
        pending_.erase(it);
    }
    promise.set_value(message);
}

void JsonRpcPeer::handleRequest(const Json::Value& message) {
    const Json::Value id = message["id"];
    std::string key = serialize(id);
    RequestHandler handler;
    bool duplicate = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        duplicate = !inFlight_.insert(key).second;
        handler = handler_;
    }
    if (duplicate) {
        logger_.warning(name_, "Protocol violation: duplicate in-flight request id " + key);
        writeFrame(createError(id, rpc::kInvalidRequest, "Invalid Request: id " + key + " is already in flight"));
        return;
    }

    auto task = [this, message, id, key, handler]() {
        Json::Value response;
        if (!handler) {
            response = createError(id, rpc::kMethodNotFound, "Method not found: " + message["method"].asString());
        } else {
            try {
                response = handler(message);
            } catch (const std::exception& e) {
                response = createError(id, rpc::kInternalError, e.what());
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inFlight_.erase(key);
        }
        writeFrame(response);
    };
    if (!pool_.post(task)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inFlight_.erase(key);
        }
        writeFrame(createError(id, rpc::kInternalError, "Bridge is shutting down"));
    }
}

void JsonRpcPeer::timerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        auto now = std::chrono::steady_clock::now();
        std::vector<std::pair<std::int64_t, Pending>> expired;
        auto next = std::chrono::steady_clock::time_point::max();
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                next = std::min(next, it->second.deadline);
                ++it;
            }
        }
        if (!expired.empty()) {
            lock.unlock();
            for (auto& [id, pending] : expired) {
                logger_.warning(name_, "Request " + std::to_string(id) + " (" + pending.method + ") timed out");
                pending.promise.set_value(createError(Json::Value(static_cast<Json::Int64>(id)), rpc::kTimeout,
                                                      "Request timed out: " + pending.method));
            }
            lock.lock();
            continue;
        }
        if (next == std::chrono::steady_clock::time_point::max()) {
            timerCv_.wait(lock);
        } else {
            timerCv_.wait_until(lock, next);
        }
    }
}
