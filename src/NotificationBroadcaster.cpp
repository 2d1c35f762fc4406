#include "NotificationBroadcaster.hpp"
#include <vector>

NotificationBroadcaster::NotificationBroadcaster(Logger& logger, std::string component)
    : logger(logger), component(std::move(component)) {
}

int NotificationBroadcaster::subscribe(Listener listener) {
    std::lock_guard lock(mtx);
    int token = nextToken++;
    listeners[token] = std::move(listener);
    return token;
}

void NotificationBroadcaster::unsubscribe(int token) {
    std::lock_guard lock(mtx);
    listeners.erase(token);
}

void NotificationBroadcaster::broadcast(const Json::Value& notification) {
    std::vector<Listener> targets;
    {
        std::lock_guard lock(mtx);
        for (auto& [token, listener] : listeners) {
            targets.push_back(listener);
        }
    }
    for (auto& listener : targets) {
        try {
            listener(notification);
        } catch (const std::exception& e) {
            logger.warning(component, std::string("Notification listener failed: ") + e.what());
        }
    }
}
