#include "Prompter.hpp"
#include "Errors.hpp"
#include <termios.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <set>

namespace {

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// Disables terminal echo for the lifetime of the object when stdin is a tty.
class EchoGuard {
public:
    explicit EchoGuard(bool enable) {
        if (enable && ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &saved_) == 0) {
            termios silent = saved_;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            active_ = ::tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
        }
    }
    ~EchoGuard() {
        if (active_) {
            ::tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
        }
    }
    bool active() const { return active_; }

private:
    termios saved_{};
    bool active_ = false;
};

} // namespace

bool isSensitiveName(const std::string& name) {
    auto text = upper(name);
    for (const char* marker : {"KEY", "SECRET", "TOKEN", "PASSWORD"}) {
        if (text.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

ConsolePrompter::ConsolePrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {
}

bool ConsolePrompter::confirm(const std::string& question, bool defaultAnswer) {
    if (assumeYes_) {
        out_ << "? " << question << " yes" << std::endl;
        return true;
    }
    out_ << "? " << question << (defaultAnswer ? " [Y/n]: " : " [y/N]: ") << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << std::endl;
        return false;
    }
    line = trim(line);
    if (line.empty()) {
        return defaultAnswer;
    }
    char c = static_cast<char>(std::tolower(static_cast<unsigned char>(line[0])));
    return c == 'y';
}

std::optional<std::string> ConsolePrompter::askValue(const EnvVarRequest& request) {
    if (!request.description.empty()) {
        out_ << "  " << request.description << std::endl;
    }
    out_ << "Enter value for " << request.name << (request.sensitive ? "*" : "");
    out_ << " [" << (request.sensitive ? std::string() : request.defaultValue) << "]: " << std::flush;
    std::string line;
    {
        EchoGuard guard(request.sensitive);
        if (!std::getline(in_, line)) {
            out_ << std::endl;
            return std::nullopt;
        }
        if (guard.active()) {
            out_ << std::endl;
        }
    }
    line = trim(line);
    if (line.empty()) {
        if (request.defaultValue.empty()) return std::nullopt;
        return request.defaultValue;
    }
    return line;
}

ScriptedPrompter::ScriptedPrompter(bool assumeYes) : assumeYes_(assumeYes) {
}

void ScriptedPrompter::setAnswer(const std::string& name, const std::string& value) {
    answers_[name] = value;
}

bool ScriptedPrompter::confirm(const std::string& question, bool) {
    questions_.push_back(question);
    return assumeYes_;
}

std::optional<std::string> ScriptedPrompter::askValue(const EnvVarRequest& request) {
    requests_.push_back(request);
    auto it = answers_.find(request.name);
    if (it != answers_.end()) {
        return it->second;
    }
    if (!request.defaultValue.empty()) {
        return request.defaultValue;
    }
    return std::nullopt;
}

void DotEnvSecretSink::store(const std::string& serverName,
                             const std::filesystem::path& workingDir,
                             const std::map<std::string, std::string>& secrets) {
    if (secrets.empty()) {
        return;
    }
    auto path = workingDir / ".env";
    std::vector<std::string> kept;
    {
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) {
            auto eq = line.find('=');
            auto name = trim(eq == std::string::npos ? line : line.substr(0, eq));
            if (eq != std::string::npos && secrets.count(name)) {
                continue;
            }
            kept.push_back(line);
        }
    }

    auto temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            throw PersistFailure("Cannot write secrets for '" + serverName + "' to " + temp.string());
        }
        std::error_code ec;
        std::filesystem::permissions(temp, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        for (const auto& line : kept) {
            out << line << '\n';
        }
        for (const auto& [name, value] : secrets) {
            out << name << '=' << value << '\n';
        }
        out.flush();
        if (!out) {
            throw PersistFailure("Cannot write secrets for '" + serverName + "' to " + temp.string());
        }
    }
    std::filesystem::rename(temp, path);
}

std::map<std::string, std::string> DotEnvSecretSink::load(const std::filesystem::path& workingDir) {
    std::map<std::string, std::string> values;
    std::ifstream in(workingDir / ".env");
    std::string line;
    while (std::getline(in, line)) {
        auto text = trim(line);
        if (text.empty() || text[0] == '#') continue;
        auto eq = text.find('=');
        if (eq == std::string::npos) continue;
        auto name = trim(text.substr(0, eq));
        if (!name.empty()) values[name] = trim(text.substr(eq + 1));
    }
    return values;
}
