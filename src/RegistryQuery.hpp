#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "JsonStore.hpp"
#include "Logger.hpp"
#include "ProjectInspector.hpp"
#include "ScopePaths.hpp"
#include "ServerRecord.hpp"

struct RecordStatus {
    ServerRecord record;
    // The install directory still exists.
    bool live = false;
};

// A directory under mcps/ that looks like a server but has no record.
struct UnregisteredCandidate {
    std::string name;
    std::filesystem::path path;
    ProjectType type = ProjectType::Unknown;
    std::string entry;
};

// The settings document and the install database disagree about a server.
// Reported, never repaired automatically.
struct Inconsistency {
    enum class Kind { MissingSettingsEntry, MissingDatabaseRecord };

    Kind kind;
    std::string name;
    Scope scope;

    std::string describe() const;
};

struct ScopeReport {
    Scope scope;
    std::vector<RecordStatus> servers;
    std::vector<UnregisteredCandidate> unregistered;
    std::vector<Inconsistency> inconsistencies;
    std::vector<std::string> warnings;
};

// Read-only view over a scope's install database, settings document and
// servers directory. Corrupt documents are reported as warnings and read as
// empty so a listing never fails because of them.
class RegistryQuery {
public:
    RegistryQuery(const ScopePaths& paths, JsonStore& store, ProjectInspector& inspector, Logger& logger);

    std::vector<RecordStatus> list(Scope scope) const;
    std::vector<UnregisteredCandidate> scanUnregistered(Scope scope) const;
    std::vector<Inconsistency> inconsistencies(Scope scope) const;

    ScopeReport report(Scope scope) const;

private:
    std::vector<ServerRecord> loadRecords(Scope scope, std::vector<std::string>* warnings) const;
    std::vector<std::string> loadSettingsNames(Scope scope, bool managedOnly, std::vector<std::string>* warnings) const;

    const ScopePaths& paths_;
    JsonStore& store_;
    ProjectInspector& inspector_;
    Logger& logger_;
};
