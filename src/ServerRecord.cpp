#include "ServerRecord.hpp"
#include <algorithm>

std::string toString(Scope scope) {
    return scope == Scope::Global ? "global" : "project";
}

std::optional<Scope> parseScope(const std::string& text) {
    if (text == "global") return Scope::Global;
    if (text == "project") return Scope::Project;
    return std::nullopt;
}

std::string toString(ProjectType type) {
    switch (type) {
        case ProjectType::Node: return "node";
        case ProjectType::Python: return "python";
        case ProjectType::Poetry: return "poetry";
        case ProjectType::Go: return "go";
        case ProjectType::Rust: return "rust";
        case ProjectType::Unknown: return "unknown";
    }
    return "unknown";
}

std::optional<ProjectType> parseProjectType(const std::string& text) {
    if (text == "node") return ProjectType::Node;
    if (text == "python") return ProjectType::Python;
    if (text == "poetry") return ProjectType::Poetry;
    if (text == "go") return ProjectType::Go;
    if (text == "rust") return ProjectType::Rust;
    if (text == "unknown") return ProjectType::Unknown;
    return std::nullopt;
}

void appendUnique(std::vector<std::string>& names, const std::string& name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

Json::Value ServerRecord::toJson() const {
    Json::Value value(Json::objectValue);
    value["name"] = name;
    value["source"] = source;
    value["subdir"] = subdir;
    value["scope"] = toString(scope);
    value["installedAt"] = installedAt;
    value["entry"] = entry;
    value["type"] = toString(type);
    value["requiredEnv"] = Json::Value(Json::arrayValue);
    for (const auto& env : requiredEnv) {
        value["requiredEnv"].append(env);
    }
    if (!installedTime.empty()) {
        value["installedTime"] = installedTime;
    }
    return value;
}

std::optional<ServerRecord> ServerRecord::fromJson(const Json::Value& value, std::string& problem) {
    if (!value.isObject()) {
        problem = "record is not an object";
        return std::nullopt;
    }
    for (const char* key : {"name", "source", "scope", "installedAt"}) {
        if (!value[key].isString() || value[key].asString().empty()) {
            problem = std::string("missing or non-string '") + key + "'";
            return std::nullopt;
        }
    }
    for (const char* key : {"subdir", "entry", "type", "installedTime"}) {
        if (value.isMember(key) && !value[key].isString() && !value[key].isNull()) {
            problem = std::string("'") + key + "' must be a string";
            return std::nullopt;
        }
    }

    ServerRecord record;
    record.name = value["name"].asString();
    record.source = value["source"].asString();
    record.subdir = value.get("subdir", "").isString() ? value.get("subdir", "").asString() : "";
    auto scope = parseScope(value["scope"].asString());
    if (!scope) {
        problem = "unknown scope '" + value["scope"].asString() + "'";
        return std::nullopt;
    }
    record.scope = *scope;
    record.installedAt = value["installedAt"].asString();
    record.entry = value.get("entry", "").isString() ? value.get("entry", "").asString() : "";
    auto type = parseProjectType(value.get("type", "unknown").isString() ? value.get("type", "unknown").asString() : "unknown");
    if (!type) {
        problem = "unknown project type '" + value["type"].asString() + "'";
        return std::nullopt;
    }
    record.type = *type;
    if (value.isMember("requiredEnv")) {
        if (!value["requiredEnv"].isArray()) {
            problem = "'requiredEnv' must be an array";
            return std::nullopt;
        }
        for (const auto& env : value["requiredEnv"]) {
            if (!env.isString()) {
                problem = "'requiredEnv' must only contain strings";
                return std::nullopt;
            }
            appendUnique(record.requiredEnv, env.asString());
        }
    }
    record.installedTime = value.get("installedTime", "").isString() ? value.get("installedTime", "").asString() : "";
    return record;
}
