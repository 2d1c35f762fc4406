#include "InstallerConfig.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace {

const char* kComponent = "Config";

std::optional<bool> parseBool(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "1" || text == "yes" || text == "on") return true;
    if (text == "false" || text == "0" || text == "no" || text == "off") return false;
    return std::nullopt;
}

std::optional<int> parsePositive(const std::string& text) {
    try {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used == text.size() && value > 0) return value;
    } catch (const std::exception&) {
    }
    return std::nullopt;
}

void setPositive(int& target, const Json::Value& value, const std::string& key, const std::string& origin, Logger& logger) {
    if (value.isNull()) return;
    if (value.isInt() && value.asInt() > 0) {
        target = value.asInt();
    } else {
        logger.error(kComponent, origin + ": '" + key + "' must be a positive integer; keeping " + std::to_string(target));
    }
}

} // namespace

void InstallerConfig::apply(const Json::Value& document, const std::string& origin, Logger& logger) {
    if (!document.isObject()) {
        logger.error(kComponent, origin + ": configuration must be a JSON object; ignored");
        return;
    }

    const Json::Value& scope = document["default_scope"];
    if (!scope.isNull()) {
        auto parsed = scope.isString() ? parseScope(scope.asString()) : std::nullopt;
        if (parsed) {
            defaultScope = *parsed;
        } else {
            logger.error(kComponent, origin + ": 'default_scope' must be \"global\" or \"project\"");
        }
    }

    setPositive(logLinesDefault, document["log_lines_default"], "log_lines_default", origin, logger);

    const Json::Value& detect = document["auto_detect_main"];
    if (detect.isBool()) {
        autoDetectMain = detect.asBool();
    } else if (!detect.isNull()) {
        logger.error(kComponent, origin + ": 'auto_detect_main' must be a boolean");
    }

    const Json::Value& bridge = document["bridge"];
    if (bridge.isObject()) {
        setPositive(requestTimeoutMs, bridge["request_timeout_ms"], "bridge.request_timeout_ms", origin, logger);
        setPositive(bridgeWorkers, bridge["workers"], "bridge.workers", origin, logger);
    } else if (!bridge.isNull()) {
        logger.error(kComponent, origin + ": 'bridge' must be an object");
    }
}

void InstallerConfig::applyEnvironment(const EnvLookup& lookup, Logger& logger) {
    if (auto value = lookup("ROO_DEFAULT_SCOPE")) {
        if (auto scope = parseScope(*value)) {
            defaultScope = *scope;
        } else {
            logger.error(kComponent, "ROO_DEFAULT_SCOPE='" + *value + "' is not a scope; ignored");
        }
    }
    if (auto value = lookup("ROO_LOG_LINES_DEFAULT")) {
        if (auto lines = parsePositive(*value)) {
            logLinesDefault = *lines;
        } else {
            logger.error(kComponent, "ROO_LOG_LINES_DEFAULT='" + *value + "' is not a positive integer; ignored");
        }
    }
    if (auto value = lookup("ROO_AUTO_DETECT_MAIN")) {
        if (auto flag = parseBool(*value)) {
            autoDetectMain = *flag;
        } else {
            logger.error(kComponent, "ROO_AUTO_DETECT_MAIN='" + *value + "' is not a boolean; ignored");
        }
    }
    if (auto value = lookup("ROO_REQUEST_TIMEOUT_MS")) {
        if (auto timeout = parsePositive(*value)) {
            requestTimeoutMs = *timeout;
        } else {
            logger.error(kComponent, "ROO_REQUEST_TIMEOUT_MS='" + *value + "' is not a positive integer; ignored");
        }
    }
}

InstallerConfig InstallerConfig::load(const ScopePaths& paths, JsonStore& store, Logger& logger, EnvLookup lookup) {
    if (!lookup) {
        lookup = [](const std::string& name) -> std::optional<std::string> {
            const char* value = std::getenv(name.c_str());
            if (!value) return std::nullopt;
            return std::string(value);
        };
    }

    InstallerConfig config;
    for (Scope scope : {Scope::Global, Scope::Project}) {
        if (!paths.available(scope)) continue;
        auto path = paths.configPath(scope);
        try {
            Json::Value document = store.read(path, Json::Value(Json::nullValue));
            if (!document.isNull()) {
                config.apply(document, path.string(), logger);
                logger.debug(kComponent, "Loaded configuration from " + path.string());
            }
        } catch (const CorruptionError& e) {
            logger.warning(kComponent, std::string(e.what()) + "; using remaining layers");
        }
    }
    config.applyEnvironment(lookup, logger);
    return config;
}
