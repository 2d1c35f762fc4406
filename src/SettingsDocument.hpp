#pragma once
#include <json/json.h>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "JsonStore.hpp"
#include "Logger.hpp"

// Launch descriptor of one entry under "mcpServers".
struct LaunchDescriptor {
    enum class Kind { Local, Remote };

    Kind kind = Kind::Local;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string cwd;
    std::string url;
    std::map<std::string, std::string> headers;
    bool disabled = false;
    std::vector<std::string> alwaysAllow;
    Json::Value metadata;

    // Entries written by this installer carry metadata.source.
    bool managed() const;

    Json::Value toJson() const;
    static std::optional<LaunchDescriptor> fromJson(const Json::Value& value, std::string& problem);
};

// The editor's settings document. Only entries named by the installer are
// touched; every other key of the document is written back as it was read.
class SettingsDocument {
public:
    SettingsDocument(JsonStore& store, Logger& logger, std::filesystem::path path);

    // Throws CorruptionError for unparsable content or a non-object document.
    void load();
    void save();

    std::vector<std::string> serverNames() const;
    std::optional<LaunchDescriptor> entry(const std::string& name) const;
    std::optional<Json::Value> rawEntry(const std::string& name) const;

    void setEntry(const std::string& name, const LaunchDescriptor& descriptor);
    // Puts back a raw entry, or removes the key when `raw` is empty.
    void restoreEntry(const std::string& name, const std::optional<Json::Value>& raw);
    bool removeEntry(const std::string& name);

    const std::filesystem::path& path() const { return path_; }
    const Json::Value& document() const { return document_; }

private:
    JsonStore& store_;
    Logger& logger_;
    std::filesystem::path path_;
    Json::Value document_;
};
