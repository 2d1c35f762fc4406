#pragma once
#include <stdexcept>
#include <string>
#include <vector>

// Base of every fatal installer condition. Each one aborts only the operation
// that raised it.
class InstallerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidRepoReference : public InstallerError {
public:
    InvalidRepoReference(const std::string& input, const std::string& reason)
        : InstallerError("Invalid repository reference '" + input + "': " + reason), input_(input) {}

    const std::string& input() const { return input_; }

private:
    std::string input_;
};

class ToolMissing : public InstallerError {
public:
    ToolMissing(const std::string& tool, const std::string& context)
        : InstallerError("Required tool '" + tool + "' is missing (" + context + ")"), tool_(tool) {}

    const std::string& tool() const { return tool_; }

private:
    std::string tool_;
};

class SubprocessFailure : public InstallerError {
public:
    SubprocessFailure(const std::string& command, int exitCode, std::string out, std::string err)
        : InstallerError("Command '" + command + "' failed with exit code " + std::to_string(exitCode)),
          command_(command), exitCode_(exitCode), stdout_(std::move(out)), stderr_(std::move(err)) {}

    const std::string& command() const { return command_; }
    int exitCode() const { return exitCode_; }
    const std::string& capturedStdout() const { return stdout_; }
    const std::string& capturedStderr() const { return stderr_; }

    // stderr when the step wrote any, stdout otherwise.
    const std::string& diagnosticOutput() const { return stderr_.empty() ? stdout_ : stderr_; }

private:
    std::string command_;
    int exitCode_;
    std::string stdout_;
    std::string stderr_;
};

class CorruptionError : public InstallerError {
public:
    CorruptionError(const std::string& path, const std::string& detail)
        : InstallerError("Corrupt JSON document " + path + ": " + detail), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class ScopeUnavailable : public InstallerError {
public:
    using InstallerError::InstallerError;
};

class InstallAborted : public InstallerError {
public:
    using InstallerError::InstallerError;
};

class ServerNotFound : public InstallerError {
public:
    explicit ServerNotFound(const std::string& name)
        : InstallerError("No installed MCP server named '" + name + "'") {}
};

class PersistFailure : public InstallerError {
public:
    using InstallerError::InstallerError;
};

class ConfigurationError : public InstallerError {
public:
    using InstallerError::InstallerError;
};
