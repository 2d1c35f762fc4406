#pragma once
#include <json/json.h>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include "Logger.hpp"

// Fans JSON-RPC notifications out to every subscriber. Delivery is
// best-effort; a throwing listener does not stop the others.
class NotificationBroadcaster {
public:
    using Listener = std::function<void(const Json::Value&)>;

    NotificationBroadcaster(Logger& logger, std::string component);

    int subscribe(Listener listener);
    void unsubscribe(int token);
    void broadcast(const Json::Value& notification);

private:
    Logger& logger;
    std::string component;
    std::map<int, Listener> listeners;
    int nextToken = 1;
    std::mutex mtx;
};
