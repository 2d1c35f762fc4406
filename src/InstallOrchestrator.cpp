#include "InstallOrchestrator.hpp"
#include "Errors.hpp"
#include "InstallDatabase.hpp"
#include "RepoResolver.hpp"
#include "SettingsDocument.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace {

const char* kComponent = "Installer";

std::string isoTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

void validateName(const std::string& name, const std::string& input) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        throw InvalidRepoReference(input, "'" + name + "' is not a usable server name");
    }
}

} // namespace

std::string toString(InstallStage stage) {
    switch (stage) {
        case InstallStage::Resolve: return "resolve";
        case InstallStage::Prepare: return "prepare";
        case InstallStage::Clone: return "clone";
        case InstallStage::Inspect: return "inspect";
        case InstallStage::ProbeTools: return "probe-tools";
        case InstallStage::InstallDeps: return "install-deps";
        case InstallStage::Build: return "build";
        case InstallStage::CollectEnv: return "collect-env";
        case InstallStage::Persist: return "persist";
        case InstallStage::Done: return "done";
    }
    return "unknown";
}

InstallOrchestrator::InstallOrchestrator(const ScopePaths& paths,
                                         JsonStore& store,
                                         ProcessRunner& runner,
                                         ToolProber& prober,
                                         ProjectInspector& inspector,
                                         Prompter& prompter,
                                         SecretSink& secrets,
                                         Logger& logger)
    : paths_(paths), store_(store), runner_(runner), prober_(prober), inspector_(inspector),
      prompter_(prompter), secrets_(secrets), logger_(logger) {
}

void InstallOrchestrator::setStageObserver(StageObserver observer) {
    observer_ = std::move(observer);
}

void InstallOrchestrator::enter(InstallStage stage, const std::string& detail) {
    logger_.info(kComponent, "[" + toString(stage) + "] " + detail);
    if (observer_) {
        observer_(stage, detail);
    }
}

ProcessResult InstallOrchestrator::runStep(const Command& argv, const fs::path& cwd) {
    auto command = formatCommand(argv);
    logger_.debug(kComponent, "Running: " + command + " (cwd " + cwd.string() + ")");
    ProcessResult result = runner_.run(argv, cwd);
    if (!result.succeeded()) {
        logger_.error(kComponent, "Command failed: " + command + " (exit " + std::to_string(result.exitCode) + ")");
        if (!result.stdoutText.empty()) logger_.error(kComponent, "stdout: " + result.stdoutText);
        if (!result.stderrText.empty()) logger_.error(kComponent, "stderr: " + result.stderrText);
        throw SubprocessFailure(command, result.exitCode, result.stdoutText, result.stderrText);
    }
    return result;
}

Command InstallOrchestrator::chooseDependencyCommand(const fs::path& dir, ProjectType type) {
    auto candidates = inspector_.dependencyCandidates(dir, type);
    if (candidates.empty()) {
        return {};
    }
    for (const auto& candidate : candidates) {
        if (prober_.exists(candidate.front())) {
            return candidate;
        }
    }
    const std::string& primary = candidates.front().front();
    if (prober_.ensure(primary, prompter_) == ProbeOutcome::Present) {
        return candidates.front();
    }
    throw ToolMissing(primary, "installing dependencies of a " + toString(type) + " project");
}

void InstallOrchestrator::cleanup(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        logger_.error(kComponent, "Cleanup of " + dir.string() + " failed: " + ec.message());
    } else {
        logger_.info(kComponent, "Removed partially installed directory " + dir.string());
    }
}

InstallOutcome InstallOrchestrator::install(const InstallRequest& request) {
    InstallOutcome outcome;

    enter(InstallStage::Resolve, request.repoRef);
    RepoRef ref = RepoResolver::parse(request.repoRef);
    std::string name = request.nameOverride.empty() ? ref.derivedName : request.nameOverride;
    validateName(name, request.repoRef);

    enter(InstallStage::Prepare, name + " (" + toString(request.scope) + " scope)");
    fs::path installDir = paths_.installDir(request.scope, name);
    // Both documents are read before anything is written: a corrupt document
    // stops the install here with the file untouched.
    InstallDatabase database(store_, logger_, paths_.databasePath(request.scope), request.scope);
    database.load();
    SettingsDocument settings(store_, logger_, paths_.settingsPath(request.scope));
    settings.load();
    outcome.settingsPath = settings.path();

    auto existing = database.find(name);
    auto previousRaw = settings.rawEntry(name);
    auto previousEntry = settings.entry(name);
    outcome.updated = existing.has_value();

    if (fs::exists(installDir) || existing) {
        bool sameSource = existing && existing->source == ref.cloneUrl && existing->subdir == ref.subdir;
        if (!sameSource) {
            std::string known = existing ? "'" + existing->source + "'" : "an unknown source";
            bool overwrite = prompter_.confirm("'" + name + "' is already installed from " + known +
                                               ". Replace it with '" + ref.cloneUrl + "'?", false);
            if (!overwrite) {
                throw InstallAborted("Install of '" + request.repoRef + "' aborted: '" + name +
                                     "' already exists from a different source");
            }
        }
        logger_.info(kComponent, "Removing existing directory for re-install: " + installDir.string());
        std::error_code ec;
        fs::remove_all(installDir, ec);
        if (ec) {
            throw PersistFailure("Cannot remove existing directory " + installDir.string() + ": " + ec.message());
        }
    }

    bool created = false;
    try {
        enter(InstallStage::Clone, ref.cloneUrl);
        if (prober_.ensure("git", ToolProber::defaultInstallHint("git"), prompter_) != ProbeOutcome::Present) {
            throw ToolMissing("git", "cloning " + ref.cloneUrl);
        }
        fs::create_directories(installDir.parent_path());
        created = true;
        runStep({"git", "clone", ref.cloneUrl, installDir.string()}, installDir.parent_path());

        fs::path workDir = ref.subdir.empty() ? installDir : installDir / ref.subdir;
        if (!fs::is_directory(workDir)) {
            throw InvalidRepoReference(request.repoRef, "subdirectory '" + ref.subdir + "' does not exist in the repository");
        }

        enter(InstallStage::Inspect, workDir.string());
        ProjectType type = inspector_.detectType(workDir);

        enter(InstallStage::ProbeTools, toString(type));
        for (const auto& tool : inspector_.requiredTools(workDir, type)) {
            if (prober_.ensure(tool, prompter_) != ProbeOutcome::Present) {
                throw ToolMissing(tool, "used by the npm lifecycle scripts of '" + name + "'");
            }
        }

        std::string packageManager;
        Command depCommand = chooseDependencyCommand(workDir, type);
        if (!depCommand.empty()) {
            enter(InstallStage::InstallDeps, formatCommand(depCommand));
            runStep(depCommand, workDir);
            packageManager = depCommand.front();
        }

        Command build = inspector_.buildCommand(workDir, type, packageManager);
        if (!build.empty()) {
            enter(InstallStage::Build, formatCommand(build));
            runStep(build, workDir);
        }
        // Build output such as dist/index.js must be visible to detection.
        Command runCommand = inspector_.detectRunCommand(workDir, type, request.autoDetectRun);
        if (runCommand.empty()) {
            std::string warning = "Could not detect a run command for '" + name +
                                  "'; the settings entry is disabled until a command is set.";
            logger_.warning(kComponent, warning);
            outcome.warnings.push_back(warning);
        }

        enter(InstallStage::CollectEnv, name);
        EnvDiscovery discovery = inspector_.discoverEnvVars(workDir);
        std::map<std::string, std::string> env;
        std::map<std::string, std::string> secrets;
        std::vector<std::string> requiredEnv;
        for (const auto& variable : discovery.variables) {
            appendUnique(requiredEnv, variable.name);
        }
        if (!discovery.source.empty()) {
            logger_.info(kComponent, "Found " + std::to_string(requiredEnv.size()) + " environment variables in " + discovery.source);
        }
        if (previousEntry) {
            for (const auto& [key, value] : previousEntry->env) {
                env[key] = value;
            }
        }
        if (!request.skipEnv) {
            for (const auto& variable : discovery.variables) {
                auto value = prompter_.askValue(variable);
                if (!value || value->empty()) {
                    logger_.info(kComponent, "No value provided for " + variable.name);
                    continue;
                }
                if (variable.sensitive) {
                    secrets[variable.name] = *value;
                    env.erase(variable.name);
                } else {
                    env[variable.name] = *value;
                }
            }
            secrets_.store(name, workDir, secrets);
        }

        enter(InstallStage::Persist, settings.path().string());
        ServerRecord record;
        record.name = name;
        record.source = ref.cloneUrl;
        record.subdir = ref.subdir;
        record.scope = request.scope;
        record.installedAt = workDir.string();
        record.entry = formatCommand(runCommand);
        record.type = type;
        record.requiredEnv = requiredEnv;
        record.installedTime = isoTimestamp();

        LaunchDescriptor descriptor;
        if (!runCommand.empty()) {
            descriptor.command = runCommand.front();
            descriptor.args.assign(runCommand.begin() + 1, runCommand.end());
        }
        descriptor.env = env;
        descriptor.cwd = workDir.string();
        descriptor.disabled = runCommand.empty() || (previousEntry && previousEntry->disabled);
        if (previousEntry) {
            descriptor.alwaysAllow = previousEntry->alwaysAllow;
        }
        descriptor.metadata = Json::Value(Json::objectValue);
        descriptor.metadata["name"] = name;
        descriptor.metadata["type"] = toString(type) + "-stdio";
        descriptor.metadata["source"] = ref.cloneUrl;
        descriptor.metadata["subdir"] = ref.subdir;
        descriptor.metadata["installTime"] = record.installedTime;

        settings.setEntry(name, descriptor);
        settings.save();

        database.upsert(record);
        try {
            database.save();
        } catch (const PersistFailure& e) {
            logger_.error(kComponent, "Database write failed, restoring settings entry for '" + name + "': " + e.what());
            settings.restoreEntry(name, previousRaw);
            try {
                settings.save();
            } catch (const PersistFailure& restoreError) {
                logger_.critical(kComponent, std::string("Could not restore settings entry: ") + restoreError.what());
            }
            throw;
        }

        outcome.record = record;
        outcome.env = env;
    } catch (const std::exception& e) {
        logger_.error(kComponent, "Install of '" + request.repoRef + "' failed: " + e.what());
        if (created) {
            cleanup(installDir);
        }
        throw;
    }

    enter(InstallStage::Done, name);
    return outcome;
}

void InstallOrchestrator::uninstall(const std::string& name, Scope scope) {
    InstallDatabase database(store_, logger_, paths_.databasePath(scope), scope);
    database.load();
    SettingsDocument settings(store_, logger_, paths_.settingsPath(scope));
    settings.load();

    auto record = database.find(name);
    bool hasEntry = settings.rawEntry(name).has_value();
    if (!record && !hasEntry) {
        throw ServerNotFound(name);
    }

    if (hasEntry) {
        settings.removeEntry(name);
        settings.save();
    }
    if (record) {
        database.remove(name);
        database.save();
    }

    fs::path dir = paths_.installDir(scope, name);
    if (fs::exists(dir)) {
        cleanup(dir);
    }
    logger_.info(kComponent, "Uninstalled '" + name + "' from " + toString(scope) + " scope");
}
