#include "ScopePaths.hpp"
#include "Errors.hpp"
#include <cstdlib>

namespace {

const char* kExtensionStorage = "rooveterinaryinc.roo-cline";

} // namespace

ScopePaths::ScopePaths(std::filesystem::path globalRoot,
                       std::optional<std::filesystem::path> projectRoot,
                       std::filesystem::path globalSettings)
    : globalRoot_(std::move(globalRoot)),
      projectRoot_(std::move(projectRoot)),
      globalSettings_(std::move(globalSettings)) {
}

std::optional<std::filesystem::path> ScopePaths::findProjectMarker(const std::filesystem::path& cwd) {
    std::error_code ec;
    auto dir = std::filesystem::absolute(cwd, ec);
    if (ec) {
        return std::nullopt;
    }
    while (true) {
        if (std::filesystem::is_directory(dir / ".roo", ec) || std::filesystem::is_directory(dir / ".git", ec)) {
            return dir;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            return std::nullopt;
        }
        dir = dir.parent_path();
    }
}

std::filesystem::path ScopePaths::editorSettingsPath(const std::filesystem::path& home) {
    std::error_code ec;
    auto settingsDir = home / ".config" / "Code" / "User" / "globalStorage" / kExtensionStorage / "settings";
    if (!std::filesystem::is_directory(settingsDir, ec)) {
        settingsDir = home / ".vscode-server" / "data" / "User" / "globalStorage" / kExtensionStorage / "settings";
    }
    if (!std::filesystem::is_directory(settingsDir, ec)) {
        return home / ".roo" / "mcp_settings.json";
    }
    return settingsDir / "mcp_settings.json";
}

ScopePaths ScopePaths::detect(const std::filesystem::path& home, const std::filesystem::path& cwd) {
    std::optional<std::filesystem::path> projectRoot;
    if (auto marker = findProjectMarker(cwd)) {
        projectRoot = *marker / ".roo";
    }
    return ScopePaths(home / ".roo", projectRoot, editorSettingsPath(home));
}

ScopePaths ScopePaths::fromEnvironment() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        throw ConfigurationError("HOME is not set; cannot locate the global scope");
    }
    return detect(home, std::filesystem::current_path());
}

bool ScopePaths::available(Scope scope) const {
    return scope == Scope::Global || projectRoot_.has_value();
}

std::filesystem::path ScopePaths::root(Scope scope) const {
    if (scope == Scope::Global) {
        return globalRoot_;
    }
    if (!projectRoot_) {
        throw ScopeUnavailable("Project scope is unavailable: no .roo or .git directory found above the working directory");
    }
    return *projectRoot_;
}

std::filesystem::path ScopePaths::serversDir(Scope scope) const {
    return root(scope) / "mcps";
}

std::filesystem::path ScopePaths::databasePath(Scope scope) const {
    return root(scope) / "installed.json";
}

std::filesystem::path ScopePaths::settingsPath(Scope scope) const {
    if (scope == Scope::Global) {
        return globalSettings_;
    }
    return root(scope) / "mcp.json";
}

std::filesystem::path ScopePaths::installDir(Scope scope, const std::string& name) const {
    return serversDir(scope) / name;
}

std::filesystem::path ScopePaths::configPath(Scope scope) const {
    return root(scope) / "config.json";
}

std::filesystem::path ScopePaths::logDir() const {
    return globalRoot_ / "logs";
}
