#pragma once
#include <json/json.h>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include "Logger.hpp"

// Crash-safe reads and writes of the JSON documents this tool owns.
//
// Writes go to a sibling temp file which is fsync'ed and renamed over the
// target, so readers observe either the old or the new document. The first
// write to an existing file in a session copies it to "<file>.bak".
//
// Writers in separate processes are not coordinated: two concurrent
// invocations writing the same document race and the last rename wins.
class JsonStore {
public:
    explicit JsonStore(Logger& logger);

    // Returns `fallback` when the file is missing or blank. Malformed content
    // throws CorruptionError and the file is left untouched.
    Json::Value read(const std::filesystem::path& path, const Json::Value& fallback) const;

    // Throws PersistFailure; the target keeps its previous content on failure.
    void write(const std::filesystem::path& path, const Json::Value& document);

    static std::string serialize(const Json::Value& document);
    static std::filesystem::path backupPath(const std::filesystem::path& path);

    // Invoked with the temp file path after it is flushed and before the
    // rename. Tests use it to interrupt a write at that point.
    void setBeforeRenameHook(std::function<void(const std::filesystem::path&)> hook);

private:
    void backupOnce(const std::filesystem::path& path);

    Logger& logger_;
    std::set<std::string> backedUp_;
    std::function<void(const std::filesystem::path&)> beforeRename_;
};
