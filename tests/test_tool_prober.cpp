#include <iostream>
#include <set>
#include <string>
#include <vector>
#include "../src/Logger.hpp"
#include "../src/ProcessRunner.hpp"
#include "../src/Prompter.hpp"
#include "../src/ToolProber.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

// Installing a tool "puts it on PATH" unless the run is set to fail.
class FakeRunner : public ProcessRunner {
public:
    explicit FakeRunner(std::set<std::string>& path) : path_(path) {}

    ProcessResult run(const std::vector<std::string>& argv,
                      const std::filesystem::path&,
                      const std::map<std::string, std::string>&) override {
        commands.push_back(argv);
        ProcessResult result;
        result.exitCode = exitCode;
        if (exitCode == 0 && !installs.empty()) {
            path_.insert(installs);
        }
        return result;
    }

    std::vector<std::vector<std::string>> commands;
    int exitCode = 0;
    std::string installs;

private:
    std::set<std::string>& path_;
};

int main() {
    try {
        Logger logger;
        logger.setConsoleEnabled(false);
        std::set<std::string> path = {"git", "node"};
        FakeRunner runner(path);
        ToolProber prober(runner, logger, [&path](const std::string& tool) { return path.count(tool) > 0; });

        // Present tools need no prompt
        ScriptedPrompter declining(false);
        ASSERT_TRUE(prober.exists("git"));
        ASSERT_TRUE(prober.ensure("git", declining) == ProbeOutcome::Present);
        ASSERT_TRUE(declining.questions().empty());

        // Declined install runs nothing
        ASSERT_TRUE(prober.ensure("bun", declining) == ProbeOutcome::UserDeclined);
        ASSERT_TRUE(declining.questions().size() == 1);
        ASSERT_TRUE(runner.commands.empty());

        // No known installer
        ASSERT_TRUE(prober.ensure("cargo", declining) == ProbeOutcome::NoInstaller);
        ASSERT_TRUE(ToolProber::defaultInstallHint("git").empty());
        ASSERT_TRUE(ToolProber::defaultInstallHint("webpack") == "npm install -g webpack webpack-cli");
        ASSERT_TRUE(ToolProber::defaultInstallHint("TSC") == "npm install -g typescript");

        // Accepted install that succeeds and makes the tool visible
        ScriptedPrompter accepting(true);
        runner.installs = "bun";
        ASSERT_TRUE(prober.ensure("bun", accepting) == ProbeOutcome::Present);
        ASSERT_TRUE(runner.commands.size() == 1);
        ASSERT_TRUE(runner.commands[0] == std::vector<std::string>({"npm", "install", "-g", "bun"}));

        // Install command fails
        runner.exitCode = 1;
        runner.installs = "tsc";
        ASSERT_TRUE(prober.ensure("tsc", accepting) == ProbeOutcome::InstallFailed);
        ASSERT_TRUE(!prober.exists("tsc"));

        // Install command succeeds but the tool is still missing
        runner.exitCode = 0;
        runner.installs.clear();
        ASSERT_TRUE(prober.ensure("webpack", accepting) == ProbeOutcome::InstallFailed);

        // A failing lookup counts as not found
        ToolProber broken(runner, logger, [](const std::string&) -> bool { throw std::runtime_error("PATH unreadable"); });
        ASSERT_TRUE(!broken.exists("git"));

        // Default lookup searches PATH
        ToolProber real(runner, logger);
        ASSERT_TRUE(real.exists("sh"));
        ASSERT_TRUE(!real.exists("definitely-not-a-real-tool-xyz"));

        ASSERT_TRUE(isSensitiveName("github_token"));
        ASSERT_TRUE(isSensitiveName("DB_PASSWORD"));
        ASSERT_TRUE(!isSensitiveName("REGION"));

        std::cout << "All ToolProber tests passed." << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
