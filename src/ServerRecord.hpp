#pragma once
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

enum class Scope { Global, Project };
enum class ProjectType { Node, Python, Poetry, Go, Rust, Unknown };

std::string toString(Scope scope);
std::optional<Scope> parseScope(const std::string& text);
std::string toString(ProjectType type);
std::optional<ProjectType> parseProjectType(const std::string& text);

// Persisted metadata of one installed server, keyed by name within a scope.
struct ServerRecord {
    std::string name;
    std::string source;
    std::string subdir;
    Scope scope = Scope::Global;
    std::string installedAt;
    std::string entry;
    ProjectType type = ProjectType::Unknown;
    std::vector<std::string> requiredEnv;
    std::string installedTime;

    Json::Value toJson() const;

    // Structural validation of a database element. On failure returns nullopt
    // and describes the problem so the caller can skip it with a warning.
    static std::optional<ServerRecord> fromJson(const Json::Value& value, std::string& problem);
};

// Appends `name` unless already present, keeping first-seen order.
void appendUnique(std::vector<std::string>& names, const std::string& name);
