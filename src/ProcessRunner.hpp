#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "Logger.hpp"

struct ProcessResult {
    int exitCode = 0;
    std::string stdoutText;
    std::string stderrText;

    bool succeeded() const { return exitCode == 0; }
};

// Blocking subprocess execution with captured output. The installer only ever
// runs one step at a time.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // A program that cannot be located or started yields exit code 127 with
    // the reason in stderrText rather than an exception.
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              const std::filesystem::path& cwd = {},
                              const std::map<std::string, std::string>& env = {}) = 0;
};

class SystemProcessRunner : public ProcessRunner {
public:
    explicit SystemProcessRunner(Logger& logger);

    ProcessResult run(const std::vector<std::string>& argv,
                      const std::filesystem::path& cwd = {},
                      const std::map<std::string, std::string>& env = {}) override;

private:
    Logger& logger_;
};

// Shell-style rendering of argv for logs and error messages.
std::string formatCommand(const std::vector<std::string>& argv);

// Splits on whitespace, honouring single and double quotes.
std::vector<std::string> splitCommandLine(const std::string& line);

// Empty when `program` cannot be found on PATH.
std::string findExecutable(const std::string& program);
