#pragma once
#include <boost/process.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "Logger.hpp"

// A long-running server process spoken to over its stdin/stdout. Each stdout
// line is handed to `onLine` from a reader thread; stderr lines go to the log.
class ChildProcess {
public:
    using LineHandler = std::function<void(const std::string&)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    ChildProcess(Logger& logger, std::string name);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Throws SubprocessFailure when the program cannot be started.
    void start(const std::vector<std::string>& argv,
               const std::filesystem::path& cwd,
               const std::map<std::string, std::string>& env,
               LineHandler onLine,
               CloseHandler onClosed);

    // Writes `line` plus a newline. Thread-safe; false once stdin is closed.
    bool writeLine(const std::string& line);

    // Closes stdin, waits up to `grace` for exit, then terminates.
    void stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    bool running();
    std::optional<int> exitCode() const { return exitCode_; }

private:
    void readStdout();
    void readStderr();

    Logger& logger_;
    std::string name_;
    boost::process::opstream stdin_;
    boost::process::ipstream stdout_;
    boost::process::ipstream stderr_;
    boost::process::child child_;
    std::thread stdoutReader_;
    std::thread stderrReader_;
    std::mutex writeMutex_;
    bool stdinOpen_ = false;
    std::atomic<bool> closedReported_{false};
    std::optional<int> exitCode_;
    LineHandler onLine_;
    CloseHandler onClosed_;
};
