#include "Manifest.hpp"
#include "ProcessRunner.hpp"
#include <json/json.h>
#include <fstream>

namespace {

const char* kComponent = "Manifest";

std::vector<std::string> parseCommand(const Json::Value& value, const std::string& origin, Logger& logger) {
    std::vector<std::string> argv;
    if (value.isString()) {
        argv = splitCommandLine(value.asString());
    } else if (value.isArray()) {
        for (const auto& part : value) {
            if (!part.isString()) {
                logger.warning(kComponent, origin + ": run.command array holds a non-string element; ignored");
                return {};
            }
            argv.push_back(part.asString());
        }
    } else if (!value.isNull()) {
        logger.warning(kComponent, origin + ": run.command must be a string or an array; ignored");
    }
    return argv;
}

// Reads an optional string member. Present but not a string is invalid.
bool optionalText(const Json::Value& item, const char* key, std::string& out) {
    const Json::Value& value = item[key];
    if (value.isNull()) {
        return true;
    }
    if (!value.isString()) {
        return false;
    }
    out = value.asString();
    return true;
}

} // namespace

Manifest Manifest::fromJson(const Json::Value& root, const std::string& origin, Logger& logger) {
    Manifest manifest;
    if (!root.isObject()) {
        logger.warning(kComponent, origin + ": manifest is not a JSON object");
        return manifest;
    }

    if (root["name"].isString()) {
        manifest.name = root["name"].asString();
    }

    const Json::Value& run = root["run"];
    if (run.isObject()) {
        manifest.runCommand = parseCommand(run["command"], origin, logger);
    } else if (!run.isNull()) {
        logger.warning(kComponent, origin + ": 'run' must be an object; ignored");
    }

    const Json::Value& environment = root["environment"];
    if (environment.isArray()) {
        manifest.declaresEnvironment = true;
        for (const auto& item : environment) {
            if (!item.isObject() || !item["name"].isString() || item["name"].asString().empty()) {
                logger.warning(kComponent, origin + ": environment entry without a name skipped");
                continue;
            }
            EnvVarRequest request;
            request.name = item["name"].asString();
            if (!optionalText(item, "description", request.description) || !optionalText(item, "default", request.defaultValue)) {
                logger.warning(kComponent, origin + ": environment entry '" + request.name + "' has a non-string field; skipped");
                continue;
            }
            request.sensitive = item["secret"].isBool() ? item["secret"].asBool() : isSensitiveName(request.name);
            manifest.environment.push_back(request);
        }
    } else if (!environment.isNull()) {
        logger.warning(kComponent, origin + ": 'environment' must be an array; ignored");
    }

    // Older manifests declare { "env": { "NAME": "default" } }.
    const Json::Value& legacy = root["env"];
    if (!manifest.declaresEnvironment && legacy.isObject()) {
        manifest.declaresEnvironment = true;
        for (const auto& key : legacy.getMemberNames()) {
            EnvVarRequest request;
            request.name = key;
            request.sensitive = isSensitiveName(key);
            if (legacy[key].isString()) {
                request.defaultValue = legacy[key].asString();
            }
            manifest.environment.push_back(request);
        }
    }

    const Json::Value& tools = root["tools"];
    if (tools.isArray()) {
        for (const auto& item : tools) {
            if (!item.isObject() || !item["name"].isString() || item["name"].asString().empty()) {
                logger.warning(kComponent, origin + ": tool entry without a name skipped");
                continue;
            }
            ManifestTool tool{item["name"].asString(), ""};
            if (!optionalText(item, "description", tool.description)) {
                logger.warning(kComponent, origin + ": tool '" + tool.name + "' has a non-string description; skipped");
                continue;
            }
            manifest.tools.push_back(tool);
        }
    }

    const Json::Value& resources = root["resources"];
    if (resources.isArray()) {
        for (const auto& item : resources) {
            if (!item.isObject() || !item["uriTemplate"].isString() || item["uriTemplate"].asString().empty()) {
                logger.warning(kComponent, origin + ": resource entry without a uriTemplate skipped");
                continue;
            }
            ManifestResource resource{item["uriTemplate"].asString(), "", ""};
            if (!optionalText(item, "name", resource.name) || !optionalText(item, "description", resource.description)) {
                logger.warning(kComponent, origin + ": resource '" + resource.uriTemplate + "' has a non-string field; skipped");
                continue;
            }
            manifest.resources.push_back(resource);
        }
    }
    return manifest;
}

std::optional<Manifest> Manifest::load(const std::filesystem::path& dir, Logger& logger) {
    auto path = dir / kFileName;
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        logger.warning(kComponent, "Could not parse " + path.string() + ": " + errs);
        return std::nullopt;
    }
    if (!root.isObject()) {
        logger.warning(kComponent, path.string() + " is not a JSON object; ignored");
        return std::nullopt;
    }
    return fromJson(root, path.string(), logger);
}
