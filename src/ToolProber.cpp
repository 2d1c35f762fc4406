#include "ToolProber.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace {

const char* kComponent = "ToolProber";

} // namespace

std::string toString(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Present: return "present";
        case ProbeOutcome::UserDeclined: return "declined";
        case ProbeOutcome::InstallFailed: return "install failed";
        case ProbeOutcome::NoInstaller: return "no installer";
    }
    return "unknown";
}

ToolProber::ToolProber(ProcessRunner& runner, Logger& logger, Lookup lookup)
    : runner_(runner), logger_(logger), lookup_(std::move(lookup)) {
    if (!lookup_) {
        lookup_ = [](const std::string& tool) { return !findExecutable(tool).empty(); };
    }
}

bool ToolProber::exists(const std::string& tool) const {
    bool found = false;
    try {
        found = lookup_(tool);
    } catch (const std::exception& e) {
        logger_.debug(kComponent, "Lookup of '" + tool + "' failed: " + e.what());
        found = false;
    }
    logger_.debug(kComponent, "Checking command availability: " + tool + " -> " + (found ? "Found" : "Not found"));
    return found;
}

std::string ToolProber::defaultInstallHint(const std::string& tool) {
    static const std::map<std::string, std::string> hints = {
        {"bun", "npm install -g bun"},
        {"npm", "npm install -g npm"},
        {"tsc", "npm install -g typescript"},
        {"webpack", "npm install -g webpack webpack-cli"},
    };
    std::string key = tool;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = hints.find(key);
    return it == hints.end() ? std::string() : it->second;
}

ProbeOutcome ToolProber::ensure(const std::string& tool, Prompter& prompter) {
    return ensure(tool, defaultInstallHint(tool), prompter);
}

ProbeOutcome ToolProber::ensure(const std::string& tool, const std::string& installHint, Prompter& prompter) {
    if (exists(tool)) {
        return ProbeOutcome::Present;
    }
    logger_.warning(kComponent, "Required tool '" + tool + "' not found in PATH.");
    if (installHint.empty()) {
        logger_.warning(kComponent, "Automatic installation not supported for '" + tool + "'.");
        return ProbeOutcome::NoInstaller;
    }

    bool consent = prompter.confirm("Required tool '" + tool + "' seems to be missing. Attempt to install it using '" + installHint + "'?", false);
    logger_.info(kComponent, "User prompt for installing '" + tool + "': " + (consent ? "Yes" : "No"));
    if (!consent) {
        return ProbeOutcome::UserDeclined;
    }

    auto argv = splitCommandLine(installHint);
    logger_.info(kComponent, "Executing installation command: " + installHint);
    ProcessResult result = runner_.run(argv);
    if (!result.succeeded()) {
        logger_.error(kComponent, "Installation of '" + tool + "' failed (exit " + std::to_string(result.exitCode) + "): " +
                                  (result.stderrText.empty() ? result.stdoutText : result.stderrText));
        return ProbeOutcome::InstallFailed;
    }
    if (!exists(tool)) {
        logger_.error(kComponent, "Installation command ran, but '" + tool + "' still not found in PATH.");
        return ProbeOutcome::InstallFailed;
    }
    logger_.info(kComponent, "Successfully installed '" + tool + "'.");
    return ProbeOutcome::Present;
}
