#include "ProjectInspector.hpp"
#include "Manifest.hpp"
#include <fstream>
#include <memory>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace {

const char* kComponent = "ProjectInspector";

bool exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool isDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return {};
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool parseJson(const std::string& text, Json::Value& out) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    return reader->parse(text.data(), text.data() + text.size(), &out, &errs);
}

void collectEnvKeys(const Json::Value& value, std::vector<std::string>& keys) {
    if (value.isObject()) {
        const Json::Value& env = value["env"];
        if (env.isObject()) {
            for (const auto& key : env.getMemberNames()) {
                appendUnique(keys, key);
            }
        }
        for (const auto& member : value.getMemberNames()) {
            collectEnvKeys(value[member], keys);
        }
    } else if (value.isArray()) {
        for (const auto& item : value) {
            collectEnvKeys(item, keys);
        }
    }
}

std::vector<EnvVarRequest> toRequests(const std::vector<std::string>& names) {
    std::vector<EnvVarRequest> requests;
    for (const auto& name : names) {
        EnvVarRequest request;
        request.name = name;
        request.sensitive = isSensitiveName(name);
        requests.push_back(request);
    }
    return requests;
}

bool scriptMentions(const std::string& script, const std::string& tool) {
    std::regex word("(^|[^A-Za-z0-9_-])" + tool + "([^A-Za-z0-9_-]|$)");
    return std::regex_search(script, word);
}

} // namespace

ProjectInspector::ProjectInspector(Logger& logger) : logger_(logger) {
}

std::optional<Json::Value> ProjectInspector::readPackageJson(const fs::path& dir) const {
    auto path = dir / "package.json";
    if (!::exists(path)) {
        return std::nullopt;
    }
    Json::Value root;
    if (!parseJson(readFile(path), root) || !root.isObject()) {
        logger_.warning(kComponent, "Error reading or parsing " + path.string());
        return std::nullopt;
    }
    return root;
}

ProjectType ProjectInspector::detectType(const fs::path& dir) const {
    ProjectType type = ProjectType::Unknown;
    if (::exists(dir / "package.json")) {
        type = ProjectType::Node;
    } else if (::exists(dir / "pyproject.toml") && readFile(dir / "pyproject.toml").find("[tool.poetry]") != std::string::npos) {
        type = ProjectType::Poetry;
    } else if (::exists(dir / "requirements.txt") || ::exists(dir / "pyproject.toml")) {
        type = ProjectType::Python;
    } else if (::exists(dir / "go.mod")) {
        type = ProjectType::Go;
    } else if (::exists(dir / "Cargo.toml")) {
        type = ProjectType::Rust;
    }
    logger_.debug(kComponent, "Detected project type '" + toString(type) + "' in " + dir.string());
    return type;
}

Command ProjectInspector::detectRunCommand(const fs::path& dir, ProjectType type, bool heuristics) const {
    if (auto manifest = Manifest::load(dir, logger_)) {
        if (!manifest->runCommand.empty()) {
            logger_.debug(kComponent, "Using run command from " + std::string(Manifest::kFileName));
            return manifest->runCommand;
        }
    }
    if (!heuristics) {
        return {};
    }

    switch (type) {
        case ProjectType::Node: {
            auto package = readPackageJson(dir);
            if (package) {
                const Json::Value& scripts = (*package)["scripts"];
                for (const char* name : {"start:mcp", "start"}) {
                    if (scripts.isObject() && scripts[name].isString() &&
                        scripts[name].asString().find("stdio") != std::string::npos) {
                        logger_.debug(kComponent, std::string("Using npm script '") + name + "'");
                        return {"npm", "run", name};
                    }
                }
                const Json::Value& bin = (*package)["bin"];
                std::vector<std::string> bins;
                if (bin.isString()) {
                    bins.push_back(bin.asString());
                } else if (bin.isObject()) {
                    for (const auto& key : bin.getMemberNames()) {
                        if (bin[key].isString()) bins.push_back(bin[key].asString());
                    }
                }
                for (const auto& script : bins) {
                    if (::exists(dir / script)) {
                        return {"node", script, "stdio"};
                    }
                    logger_.warning(kComponent, "'bin' script '" + script + "' not found.");
                }
                const Json::Value& main = (*package)["main"];
                if (main.isString()) {
                    if (::exists(dir / main.asString())) {
                        return {"node", main.asString(), "stdio"};
                    }
                    logger_.warning(kComponent, "'main' script '" + main.asString() + "' not found.");
                }
            }
            for (const char* file : {"dist/index.js", "index.js"}) {
                if (::exists(dir / file)) {
                    return {"node", file, "stdio"};
                }
            }
            break;
        }
        case ProjectType::Python:
        case ProjectType::Poetry:
            for (const char* file : {"main.py", "app.py", "run.py"}) {
                if (::exists(dir / file)) {
                    return {"python", file, "stdio"};
                }
            }
            break;
        case ProjectType::Go:
            if (::exists(dir / "main.go")) {
                return {"go", "run", ".", "stdio"};
            }
            break;
        case ProjectType::Rust:
            if (::exists(dir / "src" / "main.rs")) {
                return {"cargo", "run", "--", "stdio"};
            }
            break;
        case ProjectType::Unknown:
            break;
    }
    logger_.debug(kComponent, "No run command detected in " + dir.string());
    return {};
}

std::vector<Command> ProjectInspector::dependencyCandidates(const fs::path& dir, ProjectType type) const {
    switch (type) {
        case ProjectType::Node:
            return {{"npm", "install"}, {"yarn", "install"}, {"pnpm", "install"}};
        case ProjectType::Python:
            if (::exists(dir / "requirements.txt")) {
                return {{"pip", "install", "-r", "requirements.txt"}, {"pip3", "install", "-r", "requirements.txt"}};
            }
            return {{"pip", "install", "-e", "."}, {"pip3", "install", "-e", "."}};
        case ProjectType::Poetry:
            return {{"poetry", "install"}, {"pip", "install", "-e", "."}};
        case ProjectType::Go:
            return {{"go", "mod", "download"}};
        case ProjectType::Rust:
            return {{"cargo", "build"}};
        case ProjectType::Unknown:
            break;
    }
    return {};
}

Command ProjectInspector::buildCommand(const fs::path& dir, ProjectType type, const std::string& packageManager) const {
    if (type != ProjectType::Node) {
        return {};
    }
    std::string pm = packageManager.empty() ? "npm" : packageManager;
    auto package = readPackageJson(dir);
    if (package && (*package)["scripts"].isObject() && (*package)["scripts"]["build"].isString()) {
        return {pm, "run", "build"};
    }
    if (!::exists(dir / "dist" / "index.js") && isDirectory(dir / "src")) {
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir / "src", ec)) {
            if (entry.path().extension() == ".ts") {
                return {pm, "run", "build"};
            }
        }
    }
    return {};
}

std::vector<std::string> ProjectInspector::requiredTools(const fs::path& dir, ProjectType type) const {
    std::vector<std::string> tools;
    if (type != ProjectType::Node) {
        return tools;
    }
    auto package = readPackageJson(dir);
    if (!package || !(*package)["scripts"].isObject()) {
        return tools;
    }
    const Json::Value& scripts = (*package)["scripts"];
    for (const char* script : {"prepare", "preinstall", "postinstall", "build"}) {
        if (!scripts[script].isString()) continue;
        for (const char* tool : {"bun", "tsc", "webpack", "node-gyp"}) {
            if (scriptMentions(scripts[script].asString(), tool)) {
                appendUnique(tools, tool);
            }
        }
    }
    return tools;
}

std::vector<std::string> ProjectInspector::parseEnvExample(const std::string& content) {
    static const std::regex assignment(R"(^\s*([a-zA-Z_][a-zA-Z0-9_]*)\s*=)");
    std::vector<std::string> names;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;
        std::smatch match;
        if (std::regex_search(line, match, assignment)) {
            appendUnique(names, match[1].str());
        }
    }
    return names;
}

std::vector<std::string> ProjectInspector::parseReadmeEnvVars(const std::string& content) {
    std::vector<std::string> names;
    const std::string open = "```json";
    const std::string close = "```";
    std::size_t pos = 0;
    while ((pos = content.find(open, pos)) != std::string::npos) {
        std::size_t start = pos + open.size();
        std::size_t end = content.find(close, start);
        if (end == std::string::npos) break;
        Json::Value block;
        if (parseJson(content.substr(start, end - start), block)) {
            collectEnvKeys(block, names);
        }
        pos = end + close.size();
    }
    return names;
}

EnvDiscovery ProjectInspector::discoverEnvVars(const fs::path& dir) const {
    EnvDiscovery result;
    if (auto manifest = Manifest::load(dir, logger_)) {
        if (manifest->declaresEnvironment) {
            result.variables = manifest->environment;
            result.source = Manifest::kFileName;
            return result;
        }
    }
    if (::exists(dir / ".env.example")) {
        result.variables = toRequests(parseEnvExample(readFile(dir / ".env.example")));
        result.source = ".env.example";
        return result;
    }
    for (const char* name : {"README.md", "README.rst", "README"}) {
        if (!::exists(dir / name)) continue;
        auto names = parseReadmeEnvVars(readFile(dir / name));
        logger_.debug(kComponent, "Extracted " + std::to_string(names.size()) + " env vars from " + name);
        if (!names.empty()) {
            result.variables = toRequests(names);
            result.source = name;
        }
        break;
    }
    return result;
}
