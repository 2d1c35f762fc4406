#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "JsonStore.hpp"
#include "Logger.hpp"
#include "ServerRecord.hpp"

// Install database of one scope: a JSON array of ServerRecord.
class InstallDatabase {
public:
    InstallDatabase(JsonStore& store, Logger& logger, std::filesystem::path path, Scope scope);

    // Throws CorruptionError for unparsable content or a non-array document.
    // Structurally invalid or foreign-scope elements are skipped with a warning.
    void load();
    void save();

    const std::vector<ServerRecord>& records() const { return records_; }
    std::optional<ServerRecord> find(const std::string& name) const;

    // Replaces a record of the same name; returns true when one was replaced.
    bool upsert(const ServerRecord& record);
    bool remove(const std::string& name);

    const std::filesystem::path& path() const { return path_; }
    Scope scope() const { return scope_; }

private:
    JsonStore& store_;
    Logger& logger_;
    std::filesystem::path path_;
    Scope scope_;
    std::vector<ServerRecord> records_;
};
