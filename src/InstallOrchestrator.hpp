#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "JsonStore.hpp"
#include "Logger.hpp"
#include "ProcessRunner.hpp"
#include "ProjectInspector.hpp"
#include "Prompter.hpp"
#include "ScopePaths.hpp"
#include "ServerRecord.hpp"
#include "ToolProber.hpp"

struct InstallRequest {
    std::string repoRef;
    Scope scope = Scope::Global;
    bool skipEnv = false;
    std::string nameOverride;
    bool autoDetectRun = true;
};

enum class InstallStage { Resolve, Prepare, Clone, Inspect, ProbeTools, InstallDeps, Build, CollectEnv, Persist, Done };

std::string toString(InstallStage stage);

struct InstallOutcome {
    ServerRecord record;
    std::vector<std::string> warnings;
    // True when an existing installation of the same name was replaced.
    bool updated = false;
    std::filesystem::path settingsPath;
    std::map<std::string, std::string> env;
};

// Runs one install from repository reference to persisted registration.
//
// Stages run strictly in order and the first fatal error aborts the install.
// A directory created by the failed run is removed on a best-effort basis.
// The settings document is written before the install database, and a failed
// database write puts the previous settings entry back, so the two documents
// never disagree about a server because of this class.
class InstallOrchestrator {
public:
    using StageObserver = std::function<void(InstallStage, const std::string& detail)>;

    InstallOrchestrator(const ScopePaths& paths,
                        JsonStore& store,
                        ProcessRunner& runner,
                        ToolProber& prober,
                        ProjectInspector& inspector,
                        Prompter& prompter,
                        SecretSink& secrets,
                        Logger& logger);

    void setStageObserver(StageObserver observer);

    InstallOutcome install(const InstallRequest& request);

    // Throws ServerNotFound when neither document knows `name`.
    void uninstall(const std::string& name, Scope scope);

private:
    void enter(InstallStage stage, const std::string& detail);
    ProcessResult runStep(const Command& argv, const std::filesystem::path& cwd);
    Command chooseDependencyCommand(const std::filesystem::path& dir, ProjectType type);
    void cleanup(const std::filesystem::path& dir);

    const ScopePaths& paths_;
    JsonStore& store_;
    ProcessRunner& runner_;
    ToolProber& prober_;
    ProjectInspector& inspector_;
    Prompter& prompter_;
    SecretSink& secrets_;
    Logger& logger_;
    StageObserver observer_;
};
