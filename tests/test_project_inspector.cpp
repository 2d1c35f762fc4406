#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include "../src/Logger.hpp"
#include "../src/Manifest.hpp"
#include "../src/ProjectInspector.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

namespace fs = std::filesystem;

static void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

static fs::path freshDir(const fs::path& root, const std::string& name) {
    auto dir = root / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

int main() {
    auto root = fs::temp_directory_path() / ("mcp_inspector_test_" + std::to_string(::getpid()));
    fs::remove_all(root);
    try {
        Logger logger;
        logger.setConsoleEnabled(false);
        ProjectInspector inspector(logger);

        // Go: go.mod plus main.go
        auto go = freshDir(root, "go");
        writeFile(go / "go.mod", "module example.com/widgets\n");
        writeFile(go / "main.go", "package main\n");
        ASSERT_TRUE(inspector.detectType(go) == ProjectType::Go);
        ASSERT_TRUE(inspector.detectRunCommand(go, ProjectType::Go) == Command({"go", "run", ".", "stdio"}));
        ASSERT_TRUE(inspector.dependencyCandidates(go, ProjectType::Go) == std::vector<Command>({{"go", "mod", "download"}}));
        ASSERT_TRUE(inspector.buildCommand(go, ProjectType::Go, "go").empty());

        // Rust
        auto rust = freshDir(root, "rust");
        writeFile(rust / "Cargo.toml", "[package]\nname = \"x\"\n");
        ASSERT_TRUE(inspector.detectType(rust) == ProjectType::Rust);
        ASSERT_TRUE(inspector.detectRunCommand(rust, ProjectType::Rust).empty());
        writeFile(rust / "src" / "main.rs", "fn main() {}\n");
        ASSERT_TRUE(inspector.detectRunCommand(rust, ProjectType::Rust) == Command({"cargo", "run", "--", "stdio"}));

        // Python and Poetry
        auto python = freshDir(root, "python");
        writeFile(python / "requirements.txt", "mcp\n");
        writeFile(python / "app.py", "print()\n");
        ASSERT_TRUE(inspector.detectType(python) == ProjectType::Python);
        ASSERT_TRUE(inspector.detectRunCommand(python, ProjectType::Python) == Command({"python", "app.py", "stdio"}));
        auto pythonDeps = inspector.dependencyCandidates(python, ProjectType::Python);
        ASSERT_TRUE(pythonDeps.size() == 2);
        ASSERT_TRUE(pythonDeps[0] == Command({"pip", "install", "-r", "requirements.txt"}));
        ASSERT_TRUE(pythonDeps[1][0] == "pip3");

        auto poetry = freshDir(root, "poetry");
        writeFile(poetry / "pyproject.toml", "[tool.poetry]\nname = \"x\"\n");
        ASSERT_TRUE(inspector.detectType(poetry) == ProjectType::Poetry);
        ASSERT_TRUE(inspector.dependencyCandidates(poetry, ProjectType::Poetry)[0] == Command({"poetry", "install"}));

        auto pep621 = freshDir(root, "pep621");
        writeFile(pep621 / "pyproject.toml", "[project]\nname = \"x\"\n");
        ASSERT_TRUE(inspector.detectType(pep621) == ProjectType::Python);
        ASSERT_TRUE(inspector.dependencyCandidates(pep621, ProjectType::Python)[0] == Command({"pip", "install", "-e", "."}));

        ASSERT_TRUE(inspector.detectType(freshDir(root, "empty")) == ProjectType::Unknown);

        // Node: stdio start script wins over entry files
        auto node = freshDir(root, "node");
        writeFile(node / "package.json", R"({
  "name": "widgets",
  "main": "lib/server.js",
  "scripts": {"start": "node dist/index.js --stdio", "build": "tsc -p .", "prepare": "bun run gen && node-gyp rebuild"}
})");
        writeFile(node / "lib" / "server.js", "");
        ASSERT_TRUE(inspector.detectType(node) == ProjectType::Node);
        ASSERT_TRUE(inspector.detectRunCommand(node, ProjectType::Node) == Command({"npm", "run", "start"}));
        ASSERT_TRUE(inspector.buildCommand(node, ProjectType::Node, "yarn") == Command({"yarn", "run", "build"}));
        auto tools = inspector.requiredTools(node, ProjectType::Node);
        ASSERT_TRUE(tools.size() == 3);
        ASSERT_TRUE(tools[0] == "bun" && tools[1] == "node-gyp" && tools[2] == "tsc");
        ASSERT_TRUE(inspector.dependencyCandidates(node, ProjectType::Node)[0] == Command({"npm", "install"}));

        // Node: bin, then main, then dist/index.js
        auto bin = freshDir(root, "node-bin");
        writeFile(bin / "package.json", R"({"bin": {"widgets": "bin/cli.js"}, "main": "index.js", "scripts": {"start": "node index.js"}})");
        writeFile(bin / "bin" / "cli.js", "");
        writeFile(bin / "index.js", "");
        ASSERT_TRUE(inspector.detectRunCommand(bin, ProjectType::Node) == Command({"node", "bin/cli.js", "stdio"}));

        auto dist = freshDir(root, "node-dist");
        writeFile(dist / "package.json", R"({"main": "missing.js"})");
        writeFile(dist / "src" / "index.ts", "");
        ASSERT_TRUE(inspector.detectRunCommand(dist, ProjectType::Node).empty());
        ASSERT_TRUE(inspector.buildCommand(dist, ProjectType::Node, "npm") == Command({"npm", "run", "build"}));
        writeFile(dist / "dist" / "index.js", "");
        ASSERT_TRUE(inspector.detectRunCommand(dist, ProjectType::Node) == Command({"node", "dist/index.js", "stdio"}));
        ASSERT_TRUE(inspector.buildCommand(dist, ProjectType::Node, "npm").empty());
        ASSERT_TRUE(inspector.requiredTools(dist, ProjectType::Node).empty());

        // Manifest run command overrides detection; heuristics can be disabled
        auto manifested = freshDir(root, "manifest");
        writeFile(manifested / "main.py", "");
        writeFile(manifested / "mcp.json", R"({
  "name": "weather",
  "run": {"command": "uv run server.py --transport stdio"},
  "environment": [
    {"name": "WEATHER_API_KEY", "description": "API key", "secret": true},
    {"name": "UNITS", "description": "metric or imperial", "secret": false, "default": "metric"},
    {"description": "no name"}
  ],
  "tools": [{"name": "forecast", "description": "Get a forecast"}, {"description": "nameless"}],
  "resources": [{"uriTemplate": "weather://{city}/today", "name": "today"}]
})");
        ASSERT_TRUE(inspector.detectRunCommand(manifested, ProjectType::Python) ==
                    Command({"uv", "run", "server.py", "--transport", "stdio"}));
        ASSERT_TRUE(inspector.detectRunCommand(python, ProjectType::Python, false).empty());

        auto manifest = Manifest::load(manifested, logger);
        ASSERT_TRUE(manifest.has_value());
        ASSERT_TRUE(manifest->name == "weather");
        ASSERT_TRUE(manifest->tools.size() == 1 && manifest->tools[0].name == "forecast");
        ASSERT_TRUE(manifest->resources.size() == 1 && manifest->resources[0].uriTemplate == "weather://{city}/today");

        // Manifest environment is exclusive even when other sources exist
        writeFile(manifested / ".env.example", "OTHER=1\n");
        EnvDiscovery declared = inspector.discoverEnvVars(manifested);
        ASSERT_TRUE(declared.source == "mcp.json");
        ASSERT_TRUE(declared.variables.size() == 2);
        ASSERT_TRUE(declared.variables[0].name == "WEATHER_API_KEY" && declared.variables[0].sensitive);
        ASSERT_TRUE(declared.variables[1].name == "UNITS" && !declared.variables[1].sensitive);
        ASSERT_TRUE(declared.variables[1].defaultValue == "metric");

        // Legacy manifest env object
        auto legacy = freshDir(root, "legacy");
        writeFile(legacy / "mcp.json", R"({"env": {"GITHUB_TOKEN": "", "ORG": "acme"}})");
        EnvDiscovery legacyVars = inspector.discoverEnvVars(legacy);
        ASSERT_TRUE(legacyVars.variables.size() == 2);
        ASSERT_TRUE(legacyVars.variables[0].name == "GITHUB_TOKEN" && legacyVars.variables[0].sensitive);
        ASSERT_TRUE(legacyVars.variables[1].defaultValue == "acme");

        // Non-string fields invalidate only their own entry
        auto mistyped = freshDir(root, "mistyped");
        writeFile(mistyped / "mcp.json", R"({
  "environment": [
    {"name": "GOOD", "description": "fine"},
    {"name": "BAD_DESCRIPTION", "description": {"text": "nested"}},
    {"name": "BAD_DEFAULT", "default": 42}
  ],
  "tools": [{"name": "ok", "description": "fine"}, {"name": "odd", "description": ["a"]}],
  "resources": [{"uriTemplate": "x://{id}", "name": {"n": 1}}, {"uriTemplate": "y://{id}", "description": "fine"}]
})");
        auto mistypedManifest = Manifest::load(mistyped, logger);
        ASSERT_TRUE(mistypedManifest.has_value());
        ASSERT_TRUE(mistypedManifest->environment.size() == 1 && mistypedManifest->environment[0].name == "GOOD");
        ASSERT_TRUE(mistypedManifest->tools.size() == 1 && mistypedManifest->tools[0].name == "ok");
        ASSERT_TRUE(mistypedManifest->resources.size() == 1 && mistypedManifest->resources[0].uriTemplate == "y://{id}");
        ASSERT_TRUE(inspector.discoverEnvVars(mistyped).variables.size() == 1);
        ASSERT_TRUE(inspector.detectRunCommand(mistyped, ProjectType::Unknown).empty());

        // A manifest that is not an object is no manifest at all
        auto notObject = freshDir(root, "not-object");
        writeFile(notObject / "mcp.json", R"(["run"])");
        ASSERT_TRUE(!Manifest::load(notObject, logger).has_value());
        writeFile(notObject / "package.json", "{broken");
        ASSERT_TRUE(!inspector.readPackageJson(notObject).has_value());

        // Unreachable paths are reported as absent, not thrown
        auto tooLong = root / std::string(300, 'x');
        ASSERT_TRUE(inspector.detectType(tooLong) == ProjectType::Unknown);
        ASSERT_TRUE(inspector.detectRunCommand(tooLong, ProjectType::Node).empty());
        ASSERT_TRUE(inspector.buildCommand(tooLong, ProjectType::Node, "npm").empty());

        // .env.example
        auto example = freshDir(root, "example");
        writeFile(example / ".env.example", "# comment\n\nAPI_KEY=\n  REGION = us-east-1\nnot a var\nAPI_KEY=dup\n9BAD=1\n");
        EnvDiscovery exampleVars = inspector.discoverEnvVars(example);
        ASSERT_TRUE(exampleVars.source == ".env.example");
        ASSERT_TRUE(exampleVars.variables.size() == 2);
        ASSERT_TRUE(exampleVars.variables[0].name == "API_KEY" && exampleVars.variables[0].sensitive);
        ASSERT_TRUE(exampleVars.variables[1].name == "REGION" && !exampleVars.variables[1].sensitive);

        // README json blocks: nested env objects, bad blocks skipped
        auto readme = freshDir(root, "readme");
        writeFile(readme / "README.md",
                  "# Widgets\n\n```json\n{\"mcpServers\": {\"widgets\": {\"command\": \"npx\", \"env\": {\"WIDGET_TOKEN\": \"<token>\"}}}}\n```\n\n"
                  "```json\n{ this is not json }\n```\n\n"
                  "```json\n[{\"env\": {\"WIDGET_TOKEN\": \"x\", \"WIDGET_HOST\": \"h\"}}]\n```\n");
        EnvDiscovery readmeVars = inspector.discoverEnvVars(readme);
        ASSERT_TRUE(readmeVars.source == "README.md");
        ASSERT_TRUE(readmeVars.variables.size() == 2);
        ASSERT_TRUE(readmeVars.variables[0].name == "WIDGET_TOKEN");
        ASSERT_TRUE(readmeVars.variables[1].name == "WIDGET_HOST");

        EnvDiscovery none = inspector.discoverEnvVars(go);
        ASSERT_TRUE(none.variables.empty() && none.source.empty());

        fs::remove_all(root);
        std::cout << "All ProjectInspector tests passed." << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << std::endl;
        fs::remove_all(root);
        return 1;
    }
    return 0;
}
