#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel { Debug = 0, Info, Warning, Error, Critical };

std::string toString(LogLevel level);

// Process-wide log sink. Created by the executable's main() and passed by
// reference to every component; nothing reaches it through global state.
class Logger {
public:
    using Observer = std::function<void(LogLevel, const std::string& component, const std::string& message)>;

    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Rotating file sink: once the file exceeds maxBytes it is renamed to
    // <file>.1 (shifting older backups up to <file>.<backups>).
    bool openFile(const std::filesystem::path& path,
                  std::uintmax_t maxBytes = 10 * 1024 * 1024,
                  int backups = 5);

    void setConsoleLevel(LogLevel level);
    void setFileLevel(LogLevel level);
    void setConsoleEnabled(bool enabled);
    void addObserver(Observer observer);

    void log(LogLevel level, const std::string& component, const std::string& message);
    void debug(const std::string& component, const std::string& message) { log(LogLevel::Debug, component, message); }
    void info(const std::string& component, const std::string& message) { log(LogLevel::Info, component, message); }
    void warning(const std::string& component, const std::string& message) { log(LogLevel::Warning, component, message); }
    void error(const std::string& component, const std::string& message) { log(LogLevel::Error, component, message); }
    void critical(const std::string& component, const std::string& message) { log(LogLevel::Critical, component, message); }

    void flush();

    const std::filesystem::path& filePath() const { return filePath_; }

    // Last `count` lines of a log file; empty when the file cannot be read.
    static std::vector<std::string> tail(const std::filesystem::path& file, std::size_t count);

private:
    void rotateIfNeeded();

    std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path filePath_;
    std::uintmax_t maxBytes_ = 0;
    int backups_ = 0;
    LogLevel consoleLevel_ = LogLevel::Warning;
    LogLevel fileLevel_ = LogLevel::Info;
    bool consoleEnabled_ = true;
    std::vector<Observer> observers_;
};
