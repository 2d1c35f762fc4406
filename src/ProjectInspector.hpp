#pragma once
#include <json/json.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "Logger.hpp"
#include "Prompter.hpp"
#include "ServerRecord.hpp"

using Command = std::vector<std::string>;

struct EnvDiscovery {
    std::vector<EnvVarRequest> variables;
    // "mcp.json", ".env.example", the README file name, or empty.
    std::string source;
};

// Reads a checked-out server and works out how to install, build and run it.
// Only inspects files; nothing here starts a process.
class ProjectInspector {
public:
    explicit ProjectInspector(Logger& logger);

    ProjectType detectType(const std::filesystem::path& dir) const;

    // Empty when no run command can be determined. With `heuristics` off only
    // the manifest is consulted.
    Command detectRunCommand(const std::filesystem::path& dir, ProjectType type, bool heuristics = true) const;

    // Dependency install commands in order of preference; the first one whose
    // program exists is used.
    std::vector<Command> dependencyCandidates(const std::filesystem::path& dir, ProjectType type) const;

    // Empty when the project needs no build step. `packageManager` is the
    // program that ran the dependency step.
    Command buildCommand(const std::filesystem::path& dir, ProjectType type, const std::string& packageManager) const;

    // Tools invoked by npm lifecycle scripts that must exist before install.
    std::vector<std::string> requiredTools(const std::filesystem::path& dir, ProjectType type) const;

    // Manifest declarations win outright; otherwise .env.example, otherwise
    // the README's JSON examples.
    EnvDiscovery discoverEnvVars(const std::filesystem::path& dir) const;

    // package.json as an object; nullopt when missing or unreadable.
    std::optional<Json::Value> readPackageJson(const std::filesystem::path& dir) const;

    static std::vector<std::string> parseEnvExample(const std::string& content);
    static std::vector<std::string> parseReadmeEnvVars(const std::string& content);

private:

    Logger& logger_;
};
