#include <boost/program_options.hpp>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <thread>
#include "Errors.hpp"
#include "InstallOrchestrator.hpp"
#include "InstallerConfig.hpp"
#include "JsonStore.hpp"
#include "Logger.hpp"
#include "ProcessRunner.hpp"
#include "ProjectInspector.hpp"
#include "Prompter.hpp"
#include "RegistryQuery.hpp"
#include "ScopePaths.hpp"
#include "ToolProber.hpp"

namespace po = boost::program_options;

namespace {

const char* kComponent = "CLI";

const char* kUsage =
    "Usage: mcp-install [--debug] <command> [options]\n"
    "\n"
    "Commands:\n"
    "  install <repo>     clone, build and register an MCP server\n"
    "                     (URL, owner/repo or owner/repo:subdir)\n"
    "  uninstall <name>   remove a registered server\n"
    "  list               show installed servers of both scopes\n"
    "  logs               show the installer log\n";

Scope scopeOption(const std::string& text, const InstallerConfig& config) {
    if (text.empty()) {
        return config.defaultScope;
    }
    auto scope = parseScope(text);
    if (!scope) {
        throw ConfigurationError("Unknown scope '" + text + "' (expected global or project)");
    }
    return *scope;
}

void parseSubcommand(const po::options_description& options,
                     const po::positional_options_description& positional,
                     const std::vector<std::string>& args,
                     po::variables_map& vm) {
    po::store(po::command_line_parser(args).options(options).positional(positional).run(), vm);
    po::notify(vm);
}

int runInstall(const std::vector<std::string>& args, const ScopePaths& paths, const InstallerConfig& config,
               JsonStore& store, Logger& logger) {
    std::string repo;
    std::string scopeText;
    std::string nameOverride;
    bool skipEnv = false;
    bool assumeYes = false;

    po::options_description options("install options");
    options.add_options()
        ("repo", po::value<std::string>(&repo)->required(), "repository reference")
        ("scope", po::value<std::string>(&scopeText), "global or project")
        ("name", po::value<std::string>(&nameOverride), "register under this name")
        ("skip-env", po::bool_switch(&skipEnv), "do not prompt for environment variables")
        ("yes,y", po::bool_switch(&assumeYes), "answer yes to confirmations");
    po::positional_options_description positional;
    positional.add("repo", 1);
    po::variables_map vm;
    parseSubcommand(options, positional, args, vm);

    SystemProcessRunner runner(logger);
    ToolProber prober(runner, logger);
    ProjectInspector inspector(logger);
    ConsolePrompter prompter(std::cin, std::cout);
    prompter.setAssumeYes(assumeYes);
    DotEnvSecretSink secrets;
    InstallOrchestrator orchestrator(paths, store, runner, prober, inspector, prompter, secrets, logger);
    orchestrator.setStageObserver([](InstallStage stage, const std::string& detail) {
        std::cout << "==> " << std::left << std::setw(12) << toString(stage) << " " << detail << std::endl;
    });

    InstallRequest request;
    request.repoRef = repo;
    request.scope = scopeOption(scopeText, config);
    request.skipEnv = skipEnv;
    request.nameOverride = nameOverride;
    request.autoDetectRun = config.autoDetectMain;

    InstallOutcome outcome = orchestrator.install(request);
    for (const auto& warning : outcome.warnings) {
        std::cout << "Warning: " << warning << std::endl;
    }
    std::cout << (outcome.updated ? "Updated" : "Installed") << " '" << outcome.record.name << "' ("
              << toString(outcome.record.type) << ") in " << outcome.record.installedAt << std::endl;
    std::cout << "Settings: " << outcome.settingsPath.string() << std::endl;
    if (!outcome.record.entry.empty()) {
        std::cout << "Command:  " << outcome.record.entry << std::endl;
    }
    if (skipEnv && !outcome.record.requiredEnv.empty()) {
        std::cout << "Environment variables to configure:";
        for (const auto& name : outcome.record.requiredEnv) std::cout << " " << name;
        std::cout << std::endl;
    }
    return 0;
}

int runUninstall(const std::vector<std::string>& args, const ScopePaths& paths, const InstallerConfig& config,
                 JsonStore& store, Logger& logger) {
    std::string name;
    std::string scopeText;
    po::options_description options("uninstall options");
    options.add_options()
        ("server", po::value<std::string>(&name)->required(), "server name")
        ("scope", po::value<std::string>(&scopeText), "global or project");
    po::positional_options_description positional;
    positional.add("server", 1);
    po::variables_map vm;
    parseSubcommand(options, positional, args, vm);

    SystemProcessRunner runner(logger);
    ToolProber prober(runner, logger);
    ProjectInspector inspector(logger);
    ConsolePrompter prompter(std::cin, std::cout);
    DotEnvSecretSink secrets;
    InstallOrchestrator orchestrator(paths, store, runner, prober, inspector, prompter, secrets, logger);
    Scope scope = scopeOption(scopeText, config);
    orchestrator.uninstall(name, scope);
    std::cout << "Uninstalled '" << name << "' from " << toString(scope) << " scope" << std::endl;
    return 0;
}

void printReport(const ScopeReport& report) {
    std::cout << "[" << toString(report.scope) << "]" << std::endl;
    if (report.servers.empty()) {
        std::cout << "  (no servers installed)" << std::endl;
    }
    for (const auto& status : report.servers) {
        const ServerRecord& record = status.record;
        std::cout << "  " << std::left << std::setw(24) << record.name << std::setw(9) << toString(record.type)
                  << (status.live ? "ok      " : "missing ") << record.source
                  << (record.subdir.empty() ? "" : ":" + record.subdir) << std::endl;
        if (!record.entry.empty()) {
            std::cout << "      " << record.entry << std::endl;
        }
    }
    for (const auto& candidate : report.unregistered) {
        std::cout << "  " << std::left << std::setw(24) << candidate.name << std::setw(9) << toString(candidate.type)
                  << "unregistered " << candidate.path.string() << std::endl;
    }
    for (const auto& inconsistency : report.inconsistencies) {
        std::cout << "  ! " << inconsistency.describe() << std::endl;
    }
    for (const auto& warning : report.warnings) {
        std::cout << "  Warning: " << warning << std::endl;
    }
}

int runList(const ScopePaths& paths, JsonStore& store, Logger& logger) {
    ProjectInspector inspector(logger);
    RegistryQuery registry(paths, store, inspector, logger);
    printReport(registry.report(Scope::Global));
    if (paths.available(Scope::Project)) {
        printReport(registry.report(Scope::Project));
    }
    return 0;
}

int runLogs(const std::vector<std::string>& args, const InstallerConfig& config, Logger& logger) {
    int lines = config.logLinesDefault;
    bool follow = false;
    po::options_description options("logs options");
    options.add_options()
        ("lines,n", po::value<int>(&lines), "number of lines to show")
        ("follow,f", po::bool_switch(&follow), "keep printing new lines");
    po::positional_options_description positional;
    po::variables_map vm;
    parseSubcommand(options, positional, args, vm);

    const auto& path = logger.filePath();
    logger.flush();
    for (const auto& line : Logger::tail(path, lines > 0 ? static_cast<std::size_t>(lines) : 0)) {
        std::cout << line << std::endl;
    }
    if (!follow) {
        return 0;
    }

    std::ifstream in(path);
    in.seekg(0, std::ios::end);
    std::string line;
    while (true) {
        while (std::getline(in, line)) {
            std::cout << line << std::endl;
        }
        in.clear();
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
}

} // namespace

int main(int argc, char** argv) {
    bool debug = false;
    std::string command;
    std::vector<std::string> subargs;

    po::options_description global("Global options");
    global.add_options()
        ("help,h", "show this help")
        ("debug", po::bool_switch(&debug), "verbose logging on the console")
        ("command", po::value<std::string>(&command), "command to run")
        ("subargs", po::value<std::vector<std::string>>(), "arguments for the command");
    po::positional_options_description positional;
    positional.add("command", 1).add("subargs", -1);

    try {
        po::variables_map vm;
        po::parsed_options parsed = po::command_line_parser(argc, argv)
            .options(global)
            .positional(positional)
            .allow_unregistered()
            .run();
        po::store(parsed, vm);
        po::notify(vm);
        if (vm.count("help") || command.empty()) {
            std::cout << kUsage << std::endl << global << std::endl;
            return command.empty() && !vm.count("help") ? 1 : 0;
        }
        subargs = po::collect_unrecognized(parsed.options, po::include_positional);
        if (!subargs.empty() && subargs.front() == command) {
            subargs.erase(subargs.begin());
        }
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl << kUsage;
        return 1;
    }

    Logger logger;
    logger.setConsoleLevel(debug ? LogLevel::Debug : LogLevel::Warning);
    if (debug) {
        logger.setFileLevel(LogLevel::Debug);
    }

    int status = 1;
    try {
        ScopePaths paths = ScopePaths::fromEnvironment();
        if (!logger.openFile(paths.logDir() / "roo.log")) {
            std::cerr << "Warning: cannot open log file in " << paths.logDir().string() << std::endl;
        }
        logger.info(kComponent, "Running command: " + command);
        JsonStore store(logger);
        InstallerConfig config = InstallerConfig::load(paths, store, logger);

        if (command == "install") {
            status = runInstall(subargs, paths, config, store, logger);
        } else if (command == "uninstall") {
            status = runUninstall(subargs, paths, config, store, logger);
        } else if (command == "list") {
            status = runList(paths, store, logger);
        } else if (command == "logs") {
            status = runLogs(subargs, config, logger);
        } else {
            std::cerr << "Unknown command '" << command << "'" << std::endl << kUsage;
        }
    } catch (const SubprocessFailure& e) {
        logger.critical(kComponent, e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        if (!e.diagnosticOutput().empty()) {
            std::cerr << e.diagnosticOutput() << std::endl;
        }
    } catch (const InstallerError& e) {
        logger.critical(kComponent, e.what());
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl << kUsage;
    } catch (const std::exception& e) {
        logger.critical(kComponent, std::string("Unexpected error: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
    }
    logger.flush();
    return status;
}
