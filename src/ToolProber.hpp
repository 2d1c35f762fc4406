#pragma once
#include <functional>
#include <string>
#include "Logger.hpp"
#include "ProcessRunner.hpp"
#include "Prompter.hpp"

enum class ProbeOutcome { Present, UserDeclined, InstallFailed, NoInstaller };

std::string toString(ProbeOutcome outcome);

// Checks that executables are reachable and, with the user's consent, runs an
// install command for missing ones.
class ToolProber {
public:
    using Lookup = std::function<bool(const std::string&)>;

    // `lookup` defaults to a PATH search.
    ToolProber(ProcessRunner& runner, Logger& logger, Lookup lookup = Lookup());

    // Never throws: lookup errors count as "not found".
    bool exists(const std::string& tool) const;

    ProbeOutcome ensure(const std::string& tool, const std::string& installHint, Prompter& prompter);
    ProbeOutcome ensure(const std::string& tool, Prompter& prompter);

    // Known global install command for a tool, empty when there is none.
    static std::string defaultInstallHint(const std::string& tool);

private:
    ProcessRunner& runner_;
    Logger& logger_;
    Lookup lookup_;
};
