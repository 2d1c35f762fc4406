#pragma once
#include <filesystem>
#include <optional>
#include "ServerRecord.hpp"

// Storage locations of both scopes. A scope root holds "mcps/" with one
// directory per server and the install database "installed.json".
class ScopePaths {
public:
    ScopePaths(std::filesystem::path globalRoot,
               std::optional<std::filesystem::path> projectRoot,
               std::filesystem::path globalSettings);

    // Global root is ~/.roo. The project root is "<marker>/.roo" for the
    // nearest ancestor of `cwd` holding a .roo or .git directory.
    static ScopePaths detect(const std::filesystem::path& home, const std::filesystem::path& cwd);
    static ScopePaths fromEnvironment();

    static std::optional<std::filesystem::path> findProjectMarker(const std::filesystem::path& cwd);
    static std::filesystem::path editorSettingsPath(const std::filesystem::path& home);

    bool available(Scope scope) const;

    // All of these throw ScopeUnavailable for a project scope without marker.
    std::filesystem::path root(Scope scope) const;
    std::filesystem::path serversDir(Scope scope) const;
    std::filesystem::path databasePath(Scope scope) const;
    std::filesystem::path settingsPath(Scope scope) const;
    std::filesystem::path installDir(Scope scope, const std::string& name) const;
    std::filesystem::path configPath(Scope scope) const;

    std::filesystem::path logDir() const;

private:
    std::filesystem::path globalRoot_;
    std::optional<std::filesystem::path> projectRoot_;
    std::filesystem::path globalSettings_;
};
