#include "SettingsDocument.hpp"
#include "Errors.hpp"

namespace {

const char* kComponent = "SettingsDocument";
const char* kServersKey = "mcpServers";

bool readStringMap(const Json::Value& value, std::map<std::string, std::string>& out) {
    if (value.isNull()) return true;
    if (!value.isObject()) return false;
    for (const auto& key : value.getMemberNames()) {
        if (!value[key].isString()) return false;
        out[key] = value[key].asString();
    }
    return true;
}

bool readStringList(const Json::Value& value, std::vector<std::string>& out) {
    if (value.isNull()) return true;
    if (!value.isArray()) return false;
    for (const auto& item : value) {
        if (!item.isString()) return false;
        out.push_back(item.asString());
    }
    return true;
}

Json::Value toJsonObject(const std::map<std::string, std::string>& map) {
    Json::Value object(Json::objectValue);
    for (const auto& [key, val] : map) {
        object[key] = val;
    }
    return object;
}

} // namespace

bool LaunchDescriptor::managed() const {
    return metadata.isObject() && metadata["source"].isString() && !metadata["source"].asString().empty();
}

Json::Value LaunchDescriptor::toJson() const {
    Json::Value value(Json::objectValue);
    if (kind == Kind::Local) {
        value["command"] = command;
        value["args"] = Json::Value(Json::arrayValue);
        for (const auto& arg : args) {
            value["args"].append(arg);
        }
        if (!cwd.empty()) {
            value["cwd"] = cwd;
        }
        value["env"] = toJsonObject(env);
    } else {
        value["url"] = url;
        if (!headers.empty()) {
            value["headers"] = toJsonObject(headers);
        }
    }
    value["disabled"] = disabled;
    value["alwaysAllow"] = Json::Value(Json::arrayValue);
    for (const auto& tool : alwaysAllow) {
        value["alwaysAllow"].append(tool);
    }
    if (metadata.isObject()) {
        value["metadata"] = metadata;
    }
    return value;
}

std::optional<LaunchDescriptor> LaunchDescriptor::fromJson(const Json::Value& value, std::string& problem) {
    if (!value.isObject()) {
        problem = "entry is not an object";
        return std::nullopt;
    }
    LaunchDescriptor descriptor;
    if (value.isMember("url")) {
        if (!value["url"].isString()) {
            problem = "'url' must be a string";
            return std::nullopt;
        }
        descriptor.kind = Kind::Remote;
        descriptor.url = value["url"].asString();
        if (!readStringMap(value["headers"], descriptor.headers)) {
            problem = "'headers' must map names to strings";
            return std::nullopt;
        }
    } else if (value.isMember("command")) {
        if (!value["command"].isString()) {
            problem = "'command' must be a string";
            return std::nullopt;
        }
        descriptor.command = value["command"].asString();
        if (!readStringList(value["args"], descriptor.args)) {
            problem = "'args' must be an array of strings";
            return std::nullopt;
        }
        if (!readStringMap(value["env"], descriptor.env)) {
            problem = "'env' must map names to strings";
            return std::nullopt;
        }
        if (value.isMember("cwd") && !value["cwd"].isString()) {
            problem = "'cwd' must be a string";
            return std::nullopt;
        }
        descriptor.cwd = value.get("cwd", "").asString();
    } else {
        problem = "entry has neither 'command' nor 'url'";
        return std::nullopt;
    }
    if (value.isMember("disabled") && !value["disabled"].isBool()) {
        problem = "'disabled' must be a boolean";
        return std::nullopt;
    }
    descriptor.disabled = value.get("disabled", false).asBool();
    if (!readStringList(value["alwaysAllow"], descriptor.alwaysAllow)) {
        problem = "'alwaysAllow' must be an array of strings";
        return std::nullopt;
    }
    if (value["metadata"].isObject()) {
        descriptor.metadata = value["metadata"];
    }
    return descriptor;
}

SettingsDocument::SettingsDocument(JsonStore& store, Logger& logger, std::filesystem::path path)
    : store_(store), logger_(logger), path_(std::move(path)), document_(Json::objectValue) {
}

void SettingsDocument::load() {
    Json::Value fallback(Json::objectValue);
    fallback[kServersKey] = Json::Value(Json::objectValue);
    document_ = store_.read(path_, fallback);
    if (!document_.isObject()) {
        document_ = fallback;
        throw CorruptionError(path_.string(), "settings document is not a JSON object");
    }
    if (!document_[kServersKey].isObject()) {
        if (document_.isMember(kServersKey)) {
            document_ = fallback;
            throw CorruptionError(path_.string(), "'mcpServers' is not an object");
        }
        document_[kServersKey] = Json::Value(Json::objectValue);
    }
}

void SettingsDocument::save() {
    store_.write(path_, document_);
}

std::vector<std::string> SettingsDocument::serverNames() const {
    return document_[kServersKey].getMemberNames();
}

std::optional<LaunchDescriptor> SettingsDocument::entry(const std::string& name) const {
    const Json::Value& servers = document_[kServersKey];
    if (!servers.isMember(name)) {
        return std::nullopt;
    }
    std::string problem;
    auto descriptor = LaunchDescriptor::fromJson(servers[name], problem);
    if (!descriptor) {
        logger_.warning(kComponent, "Ignoring invalid settings entry '" + name + "' in " + path_.string() + ": " + problem);
    }
    return descriptor;
}

std::optional<Json::Value> SettingsDocument::rawEntry(const std::string& name) const {
    const Json::Value& servers = document_[kServersKey];
    if (!servers.isMember(name)) {
        return std::nullopt;
    }
    return servers[name];
}

void SettingsDocument::setEntry(const std::string& name, const LaunchDescriptor& descriptor) {
    document_[kServersKey][name] = descriptor.toJson();
}

void SettingsDocument::restoreEntry(const std::string& name, const std::optional<Json::Value>& raw) {
    if (raw) {
        document_[kServersKey][name] = *raw;
    } else {
        document_[kServersKey].removeMember(name);
    }
}

bool SettingsDocument::removeEntry(const std::string& name) {
    if (!document_[kServersKey].isMember(name)) {
        return false;
    }
    document_[kServersKey].removeMember(name);
    return true;
}
