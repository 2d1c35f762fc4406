#pragma once
#include <json/json.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "Logger.hpp"
#include "Prompter.hpp"

struct ManifestTool {
    std::string name;
    std::string description;
};

struct ManifestResource {
    std::string uriTemplate;
    std::string name;
    std::string description;
};

// A server's own "mcp.json".
struct Manifest {
    std::string name;
    std::vector<std::string> runCommand;
    std::vector<EnvVarRequest> environment;
    bool declaresEnvironment = false;
    std::vector<ManifestTool> tools;
    std::vector<ManifestResource> resources;

    static constexpr const char* kFileName = "mcp.json";

    // nullopt when the file is missing or unparsable (the latter is logged).
    // Individual invalid entries are skipped with a warning.
    static std::optional<Manifest> load(const std::filesystem::path& dir, Logger& logger);
    static Manifest fromJson(const Json::Value& root, const std::string& origin, Logger& logger);
};
