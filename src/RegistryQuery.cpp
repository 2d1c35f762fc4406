#include "RegistryQuery.hpp"
#include "Errors.hpp"
#include "InstallDatabase.hpp"
#include "Manifest.hpp"
#include "ProcessRunner.hpp"
#include "SettingsDocument.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace {

const char* kComponent = "Registry";

} // namespace

std::string Inconsistency::describe() const {
    if (kind == Kind::MissingSettingsEntry) {
        return "'" + name + "' is in the " + toString(scope) + " install database but has no settings entry";
    }
    return "'" + name + "' has a managed " + toString(scope) + " settings entry but no install database record";
}

RegistryQuery::RegistryQuery(const ScopePaths& paths, JsonStore& store, ProjectInspector& inspector, Logger& logger)
    : paths_(paths), store_(store), inspector_(inspector), logger_(logger) {
}

std::vector<ServerRecord> RegistryQuery::loadRecords(Scope scope, std::vector<std::string>* warnings) const {
    InstallDatabase database(store_, logger_, paths_.databasePath(scope), scope);
    try {
        database.load();
    } catch (const CorruptionError& e) {
        std::string warning = std::string(e.what()) + " (treated as empty)";
        logger_.warning(kComponent, warning);
        if (warnings) warnings->push_back(warning);
        return {};
    }
    return database.records();
}

std::vector<std::string> RegistryQuery::loadSettingsNames(Scope scope, bool managedOnly, std::vector<std::string>* warnings) const {
    SettingsDocument settings(store_, logger_, paths_.settingsPath(scope));
    try {
        settings.load();
    } catch (const CorruptionError& e) {
        std::string warning = std::string(e.what()) + " (treated as empty)";
        logger_.warning(kComponent, warning);
        if (warnings) warnings->push_back(warning);
        return {};
    }
    std::vector<std::string> names;
    for (const auto& name : settings.serverNames()) {
        if (!managedOnly) {
            names.push_back(name);
            continue;
        }
        auto entry = settings.entry(name);
        if (entry && entry->managed()) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<RecordStatus> RegistryQuery::list(Scope scope) const {
    std::vector<RecordStatus> result;
    for (const auto& record : loadRecords(scope, nullptr)) {
        std::error_code ec;
        bool live = fs::is_directory(record.installedAt, ec);
        result.push_back({record, live});
    }
    return result;
}

std::vector<UnregisteredCandidate> RegistryQuery::scanUnregistered(Scope scope) const {
    std::vector<UnregisteredCandidate> result;
    fs::path serversDir = paths_.serversDir(scope);
    std::error_code ec;
    if (!fs::is_directory(serversDir, ec)) {
        return result;
    }

    auto records = loadRecords(scope, nullptr);
    std::vector<std::string> known;
    for (const auto& record : records) {
        known.push_back(record.name);
        // A subdir install registers a directory below mcps/<name>; the clone
        // root is still owned by it.
        fs::path root = paths_.installDir(scope, record.name);
        known.push_back(root.filename().string());
    }

    for (const auto& item : fs::directory_iterator(serversDir, ec)) {
        std::error_code entryEc;
        if (!item.is_directory(entryEc)) continue;
        std::string name = item.path().filename().string();
        if (std::find(known.begin(), known.end(), name) != known.end()) continue;

        // Only a manifest that parses to an object makes a candidate.
        if (!Manifest::load(item.path(), logger_) && !inspector_.readPackageJson(item.path())) continue;

        UnregisteredCandidate candidate;
        candidate.name = name;
        candidate.path = item.path();
        candidate.type = inspector_.detectType(item.path());
        candidate.entry = formatCommand(inspector_.detectRunCommand(item.path(), candidate.type));
        result.push_back(candidate);
    }
    std::sort(result.begin(), result.end(),
              [](const UnregisteredCandidate& a, const UnregisteredCandidate& b) { return a.name < b.name; });
    return result;
}

std::vector<Inconsistency> RegistryQuery::inconsistencies(Scope scope) const {
    std::vector<Inconsistency> result;
    auto records = loadRecords(scope, nullptr);
    auto allEntries = loadSettingsNames(scope, false, nullptr);
    auto managedEntries = loadSettingsNames(scope, true, nullptr);

    for (const auto& record : records) {
        if (std::find(allEntries.begin(), allEntries.end(), record.name) == allEntries.end()) {
            result.push_back({Inconsistency::Kind::MissingSettingsEntry, record.name, scope});
        }
    }
    for (const auto& name : managedEntries) {
        bool recorded = std::any_of(records.begin(), records.end(),
                                    [&](const ServerRecord& record) { return record.name == name; });
        if (!recorded) {
            result.push_back({Inconsistency::Kind::MissingDatabaseRecord, name, scope});
        }
    }
    return result;
}

ScopeReport RegistryQuery::report(Scope scope) const {
    ScopeReport report;
    report.scope = scope;
    if (!paths_.available(scope)) {
        report.warnings.push_back(toString(scope) + " scope is unavailable (no project marker found)");
        return report;
    }
    // Surface corruption once; the per-part queries then see empty documents.
    loadRecords(scope, &report.warnings);
    loadSettingsNames(scope, false, &report.warnings);

    report.servers = list(scope);
    report.unregistered = scanUnregistered(scope);
    report.inconsistencies = inconsistencies(scope);
    for (const auto& status : report.servers) {
        if (!status.live) {
            report.warnings.push_back("Install directory of '" + status.record.name + "' is missing: " + status.record.installedAt);
        }
    }
    return report;
}
