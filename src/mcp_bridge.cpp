#include <boost/program_options.hpp>
#include <json/json.h>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include "ChildProcess.hpp"
#include "Errors.hpp"
#include "InstallDatabase.hpp"
#include "InstallerConfig.hpp"
#include "JsonRpcPeer.hpp"
#include "JsonStore.hpp"
#include "Logger.hpp"
#include "Manifest.hpp"
#include "Prompter.hpp"
#include "RequestDispatcher.hpp"
#include "ScopePaths.hpp"
#include "SettingsDocument.hpp"

namespace po = boost::program_options;

namespace {

const char* kComponent = "Bridge";
const char* kProtocolVersion = "2024-11-05";

struct Target {
    Scope scope;
    LaunchDescriptor launch;
};

std::optional<Target> findTarget(const ScopePaths& paths, JsonStore& store, Logger& logger,
                                 const std::string& name, Scope scope) {
    if (!paths.available(scope)) {
        return std::nullopt;
    }
    SettingsDocument settings(store, logger, paths.settingsPath(scope));
    settings.load();
    auto entry = settings.entry(name);
    if (!entry) {
        return std::nullopt;
    }
    return Target{scope, *entry};
}

// Waits for a forwarded call and turns an error response into RpcError.
Json::Value awaitResult(JsonRpcPeer::PendingCall call) {
    Json::Value response = call.response.get();
    if (response.isMember("error")) {
        throw RpcError(response["error"].get("code", rpc::kInternalError).asInt(),
                       response["error"].get("message", "error from server").asString());
    }
    return response["result"];
}

void registerServerTools(RequestDispatcher& dispatcher, JsonRpcPeer& child, const std::optional<Manifest>& manifest, Logger& logger) {
    std::vector<ManifestTool> tools;
    if (manifest) {
        tools = manifest->tools;
    }
    if (tools.empty()) {
        Json::Value response = child.sendRequest("tools/list", Json::Value(Json::objectValue)).response.get();
        for (const auto& tool : response["result"]["tools"]) {
            if (tool["name"].isString()) {
                tools.push_back({tool["name"].asString(), tool.get("description", "").asString()});
            }
        }
        if (response.isMember("error")) {
            logger.warning(kComponent, "tools/list failed: " + response["error"].get("message", "").asString());
        }
    }
    for (const auto& tool : tools) {
        std::string toolName = tool.name;
        dispatcher.registerTool(toolName, tool.description, [&child, toolName](const Json::Value& arguments) {
            Json::Value params;
            params["name"] = toolName;
            params["arguments"] = arguments.isNull() ? Json::Value(Json::objectValue) : arguments;
            return awaitResult(child.sendRequest("tools/call", params));
        });
    }
    logger.info(kComponent, "Registered " + std::to_string(tools.size()) + " tools");

    std::vector<ManifestResource> resources;
    if (manifest) {
        resources = manifest->resources;
    }
    if (resources.empty()) {
        Json::Value listed = child.sendRequest("resources/list", Json::Value(Json::objectValue)).response.get();
        for (const auto& resource : listed["result"]["resources"]) {
            if (resource["uri"].isString()) {
                resources.push_back({resource["uri"].asString(), resource.get("name", "").asString(), ""});
            }
        }
        Json::Value templates = child.sendRequest("resources/templates/list", Json::Value(Json::objectValue)).response.get();
        for (const auto& resource : templates["result"]["resourceTemplates"]) {
            if (resource["uriTemplate"].isString()) {
                resources.push_back({resource["uriTemplate"].asString(), resource.get("name", "").asString(), ""});
            }
        }
    }
    for (const auto& resource : resources) {
        dispatcher.registerResource(resource.uriTemplate, resource.name,
                                    [&child](const std::string& uri, const std::map<std::string, std::string>&) {
            Json::Value params;
            params["uri"] = uri;
            return awaitResult(child.sendRequest("resources/read", params));
        });
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string name;
    std::string scopeText;
    int timeoutMs = 0;
    bool debug = false;

    po::options_description options("Usage: mcp-bridge <name> [options]");
    options.add_options()
        ("help,h", "show this help")
        ("name", po::value<std::string>(&name), "installed server to launch")
        ("scope", po::value<std::string>(&scopeText), "global or project (default: search both)")
        ("timeout-ms", po::value<int>(&timeoutMs), "per-request timeout in milliseconds")
        ("debug", po::bool_switch(&debug), "verbose logging on stderr");
    po::positional_options_description positional;
    positional.add("name", 1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(options).positional(positional).run(), vm);
        po::notify(vm);
        if (vm.count("help") || name.empty()) {
            std::cerr << options << std::endl;
            return vm.count("help") ? 0 : 1;
        }
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << options << std::endl;
        return 1;
    }

    // Writes to an exited child must fail, not raise SIGPIPE.
    std::signal(SIGPIPE, SIG_IGN);
    Logger logger;
    logger.setConsoleLevel(debug ? LogLevel::Debug : LogLevel::Warning);

    try {
        ScopePaths paths = ScopePaths::fromEnvironment();
        logger.openFile(paths.logDir() / "roo.log");
        JsonStore store(logger);
        InstallerConfig config = InstallerConfig::load(paths, store, logger);
        if (timeoutMs > 0) {
            config.requestTimeoutMs = timeoutMs;
        }

        std::vector<Scope> scopes;
        if (!scopeText.empty()) {
            auto scope = parseScope(scopeText);
            if (!scope) {
                throw ConfigurationError("Unknown scope '" + scopeText + "'");
            }
            scopes.push_back(*scope);
        } else {
            scopes = {config.defaultScope, config.defaultScope == Scope::Global ? Scope::Project : Scope::Global};
        }
        std::optional<Target> target;
        for (Scope scope : scopes) {
            target = findTarget(paths, store, logger, name, scope);
            if (target) break;
        }
        if (!target) {
            throw ServerNotFound(name);
        }
        const LaunchDescriptor& launch = target->launch;
        if (launch.kind == LaunchDescriptor::Kind::Remote) {
            throw ConfigurationError("'" + name + "' is a remote server; only local servers can be bridged");
        }
        if (launch.disabled || launch.command.empty()) {
            throw ConfigurationError("'" + name + "' is disabled or has no run command in " + paths.settingsPath(target->scope).string());
        }

        std::map<std::string, std::string> env = DotEnvSecretSink::load(launch.cwd);
        for (const auto& [key, value] : launch.env) {
            env[key] = value;
        }
        std::vector<std::string> command{launch.command};
        command.insert(command.end(), launch.args.begin(), launch.args.end());

        auto timeout = std::chrono::milliseconds(config.requestTimeoutMs);
        std::mutex stdoutMutex;

        ChildProcess child(logger, name);
        JsonRpcPeer childPeer(logger, name, [&child](const std::string& frame) { return child.writeLine(frame); },
                              timeout, 1);
        RequestDispatcher dispatcher;
        JsonRpcPeer hostPeer(logger, "host", [&stdoutMutex](const std::string& frame) {
            std::lock_guard<std::mutex> lock(stdoutMutex);
            std::cout << frame << std::endl;
            return static_cast<bool>(std::cout);
        }, timeout, static_cast<std::size_t>(config.bridgeWorkers));
        // The child's reader threads call into childPeer; stop them first.
        struct StopGuard {
            ChildProcess& child;
            ~StopGuard() { child.stop(); }
        } stopGuard{child};

        child.start(command, launch.cwd, env,
                    [&childPeer](const std::string& line) { childPeer.handleFrame(line); },
                    [&childPeer, &logger](const std::string& reason) {
                        logger.error(kComponent, "Server process ended: " + reason);
                        childPeer.handleClosed(reason);
                    });

        Json::Value init;
        init["protocolVersion"] = kProtocolVersion;
        init["capabilities"] = Json::Value(Json::objectValue);
        init["clientInfo"]["name"] = "mcp-bridge";
        init["clientInfo"]["version"] = "1.0.0";
        Json::Value initResponse = childPeer.sendRequest("initialize", init).response.get();
        if (initResponse.isMember("error")) {
            throw SubprocessFailure(launch.command, -1, "", "initialize failed: " +
                                    initResponse["error"].get("message", "").asString());
        }
        childPeer.sendNotification("notifications/initialized", Json::Value());
        Json::Value serverInfo = initResponse["result"]["serverInfo"];
        logger.info(kComponent, "Connected to '" + name + "' (" + serverInfo.get("name", "unknown").asString() + ")");

        registerServerTools(dispatcher, childPeer, Manifest::load(launch.cwd, logger), logger);

        dispatcher.registerMethod("initialize", [&name, serverInfo](const Json::Value&) {
            Json::Value result;
            result["protocolVersion"] = kProtocolVersion;
            result["capabilities"]["tools"] = Json::objectValue;
            result["capabilities"]["resources"]["subscribe"] = false;
            result["capabilities"]["resources"]["listChanged"] = false;
            result["serverInfo"]["name"] = "mcp-bridge/" + name;
            result["serverInfo"]["version"] = serverInfo.get("version", "1.0.0").asString();
            return result;
        });
        dispatcher.registerMethod("ping", [](const Json::Value&) { return Json::Value(Json::objectValue); });
        dispatcher.registerMethod("tools/list", [&dispatcher](const Json::Value&) { return dispatcher.listTools(); });
        dispatcher.registerMethod("tools/call", [&dispatcher](const Json::Value& params) {
            return dispatcher.callTool(params["name"].asString(), params["arguments"]);
        });
        dispatcher.registerMethod("resources/list", [&dispatcher](const Json::Value&) { return dispatcher.listResources(); });
        dispatcher.registerMethod("resources/read", [&dispatcher](const Json::Value& params) {
            return dispatcher.readResource(params["uri"].asString());
        });
        hostPeer.setDispatcher(dispatcher);

        childPeer.subscribe([&hostPeer](const Json::Value& notification) {
            hostPeer.sendNotification(notification["method"].asString(), notification["params"]);
        });
        hostPeer.subscribe([&logger](const Json::Value& notification) {
            logger.debug(kComponent, "Host notification: " + notification["method"].asString());
        });

        std::string line;
        while (std::getline(std::cin, line)) {
            hostPeer.handleFrame(line);
        }
        logger.info(kComponent, "Host closed stdin; shutting down '" + name + "'");
        hostPeer.handleClosed("host stdin closed");
        child.stop();
        logger.flush();
        return 0;
    } catch (const InstallerError& e) {
        logger.critical(kComponent, e.what());
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        logger.critical(kComponent, std::string("Unexpected error: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
    }
    logger.flush();
    return 1;
}
