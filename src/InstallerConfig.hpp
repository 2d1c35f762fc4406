#pragma once
#include <json/json.h>
#include <functional>
#include <optional>
#include <string>
#include "JsonStore.hpp"
#include "Logger.hpp"
#include "ScopePaths.hpp"

// Layered settings: built-in defaults, then ~/.roo/config.json, then the
// project's .roo/config.json, then ROO_* environment variables. A value of
// the wrong type is logged and the previous layer's value is kept.
struct InstallerConfig {
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    Scope defaultScope = Scope::Global;
    int logLinesDefault = 50;
    bool autoDetectMain = true;
    int requestTimeoutMs = 30000;
    int bridgeWorkers = 4;

    static InstallerConfig load(const ScopePaths& paths, JsonStore& store, Logger& logger, EnvLookup lookup = EnvLookup());

    void apply(const Json::Value& document, const std::string& origin, Logger& logger);
    void applyEnvironment(const EnvLookup& lookup, Logger& logger);
};
