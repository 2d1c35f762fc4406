#pragma once
#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

// One environment variable the installer needs a value for.
struct EnvVarRequest {
    std::string name;
    std::string description;
    bool sensitive = false;
    std::string defaultValue;
};

// Names containing KEY, SECRET, TOKEN or PASSWORD (any case).
bool isSensitiveName(const std::string& name);

// How questions reach the user. The installer decides what to ask; an
// implementation of this interface decides how.
class Prompter {
public:
    virtual ~Prompter() = default;

    virtual bool confirm(const std::string& question, bool defaultAnswer) = 0;
    // nullopt or an empty string means the variable was skipped.
    virtual std::optional<std::string> askValue(const EnvVarRequest& request) = 0;
};

class ConsolePrompter : public Prompter {
public:
    ConsolePrompter(std::istream& in, std::ostream& out);

    // Answer every confirmation with yes without reading input.
    void setAssumeYes(bool assumeYes) { assumeYes_ = assumeYes; }

    bool confirm(const std::string& question, bool defaultAnswer) override;
    std::optional<std::string> askValue(const EnvVarRequest& request) override;

private:
    std::istream& in_;
    std::ostream& out_;
    bool assumeYes_ = false;
};

// Non-interactive answers for scripted runs and tests. Confirmations return
// `assumeYes`; values come from the preset answers, then the declared default.
class ScriptedPrompter : public Prompter {
public:
    explicit ScriptedPrompter(bool assumeYes = false);

    void setAnswer(const std::string& name, const std::string& value);

    bool confirm(const std::string& question, bool defaultAnswer) override;
    std::optional<std::string> askValue(const EnvVarRequest& request) override;

    const std::vector<std::string>& questions() const { return questions_; }
    const std::vector<EnvVarRequest>& requests() const { return requests_; }

private:
    bool assumeYes_;
    std::map<std::string, std::string> answers_;
    std::vector<std::string> questions_;
    std::vector<EnvVarRequest> requests_;
};

// Destination of sensitive environment values, which never go into the
// settings document.
class SecretSink {
public:
    virtual ~SecretSink() = default;

    virtual void store(const std::string& serverName,
                       const std::filesystem::path& workingDir,
                       const std::map<std::string, std::string>& secrets) = 0;
};

// Writes secrets to "<workingDir>/.env" with owner-only permissions, keeping
// unrelated lines of an existing file.
class DotEnvSecretSink : public SecretSink {
public:
    void store(const std::string& serverName,
               const std::filesystem::path& workingDir,
               const std::map<std::string, std::string>& secrets) override;

    // NAME=value pairs of "<workingDir>/.env"; empty when there is none.
    static std::map<std::string, std::string> load(const std::filesystem::path& workingDir);
};
