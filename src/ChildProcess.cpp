#include "ChildProcess.hpp"
#include "Errors.hpp"
#include "ProcessRunner.hpp"

namespace bp = boost::process;

ChildProcess::ChildProcess(Logger& logger, std::string name) : logger_(logger), name_(std::move(name)) {
}

ChildProcess::~ChildProcess() {
    stop();
}

void ChildProcess::start(const std::vector<std::string>& argv,
                         const std::filesystem::path& cwd,
                         const std::map<std::string, std::string>& env,
                         LineHandler onLine,
                         CloseHandler onClosed) {
    const std::string display = formatCommand(argv);
    std::string exe = argv.empty() ? std::string() : findExecutable(argv[0]);
    if (exe.empty()) {
        throw SubprocessFailure(display, 127, "", (argv.empty() ? std::string("empty command") : argv[0]) + ": command not found");
    }
    onLine_ = std::move(onLine);
    onClosed_ = std::move(onClosed);

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    bp::environment childEnv = boost::this_process::environment();
    for (const auto& [key, value] : env) {
        childEnv[key] = value;
    }
    std::string workDir = cwd.empty() ? std::filesystem::current_path().string() : cwd.string();

    try {
        child_ = bp::child(bp::exe = exe, bp::args = args, childEnv, bp::start_dir = workDir,
                           bp::std_in < stdin_, bp::std_out > stdout_, bp::std_err > stderr_);
    } catch (const std::exception& e) {
        throw SubprocessFailure(display, 127, "", e.what());
    }
    stdinOpen_ = true;
    logger_.info(name_, "Started " + display + " (pid " + std::to_string(child_.id()) + ")");

    stdoutReader_ = std::thread(&ChildProcess::readStdout, this);
    stderrReader_ = std::thread(&ChildProcess::readStderr, this);
}

void ChildProcess::readStdout() {
    std::string line;
    while (std::getline(stdout_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (onLine_) onLine_(line);
    }
    if (!closedReported_.exchange(true) && onClosed_) {
        onClosed_("child stdout closed");
    }
}

void ChildProcess::readStderr() {
    std::string line;
    while (std::getline(stderr_, line)) {
        logger_.info(name_, "[stderr] " + line);
    }
}

bool ChildProcess::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (!stdinOpen_) {
        return false;
    }
    stdin_ << line << '\n';
    stdin_.flush();
    if (!stdin_) {
        logger_.warning(name_, "Write to child stdin failed");
        stdinOpen_ = false;
        return false;
    }
    return true;
}

bool ChildProcess::running() {
    std::error_code ec;
    return child_.valid() && child_.running(ec);
}

void ChildProcess::stop(std::chrono::milliseconds grace) {
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (stdinOpen_) {
            stdin_.close();
            stdin_.pipe().close();
            stdinOpen_ = false;
        }
    }
    if (child_.valid()) {
        std::error_code ec;
        if (child_.running(ec) && !child_.wait_for(grace, ec)) {
            logger_.warning(name_, "Child did not exit within grace period; terminating");
            child_.terminate(ec);
        }
        if (!child_.running(ec)) {
            child_.wait(ec);
            exitCode_ = child_.exit_code();
        }
    }
    if (stdoutReader_.joinable()) stdoutReader_.join();
    if (stderrReader_.joinable()) stderrReader_.join();
}
