#include "ProcessRunner.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <future>

namespace bp = boost::process;

namespace {

const char* kComponent = "ProcessRunner";

} // namespace

std::string formatCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'\\$") != std::string::npos) {
            out += '\'';
            for (char c : arg) {
                if (c == '\'') out += "'\\''";
                else out += c;
            }
            out += '\'';
        } else {
            out += arg;
        }
    }
    return out;
}

std::vector<std::string> splitCommandLine(const std::string& line) {
    std::vector<std::string> parts;
    std::string current;
    bool inToken = false;
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < line.size()) {
                current += line[++i];
            } else {
                current += c;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
            inToken = true;
        } else if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (inToken) {
                parts.push_back(current);
                current.clear();
                inToken = false;
            }
        } else {
            current += c;
            inToken = true;
        }
    }
    if (inToken) {
        parts.push_back(current);
    }
    return parts;
}

std::string findExecutable(const std::string& program) {
    if (program.empty()) {
        return {};
    }
    try {
        if (program.find('/') != std::string::npos) {
            std::error_code ec;
            return std::filesystem::exists(program, ec) ? program : std::string();
        }
        return bp::search_path(program).string();
    } catch (const std::exception&) {
        return {};
    }
}

SystemProcessRunner::SystemProcessRunner(Logger& logger) : logger_(logger) {
}

ProcessResult SystemProcessRunner::run(const std::vector<std::string>& argv,
                                       const std::filesystem::path& cwd,
                                       const std::map<std::string, std::string>& env) {
    ProcessResult result;
    if (argv.empty()) {
        result.exitCode = 127;
        result.stderrText = "empty command";
        return result;
    }
    const std::string display = formatCommand(argv);
    std::string exe = findExecutable(argv[0]);
    if (exe.empty()) {
        logger_.warning(kComponent, "Executable not found: " + argv[0]);
        result.exitCode = 127;
        result.stderrText = argv[0] + ": command not found";
        return result;
    }

    logger_.debug(kComponent, "Executing " + display + " in " + (cwd.empty() ? std::string("current directory") : cwd.string()));
    std::vector<std::string> args(argv.begin() + 1, argv.end());
    bp::environment childEnv = boost::this_process::environment();
    for (const auto& [key, value] : env) {
        childEnv[key] = value;
    }

    try {
        boost::asio::io_context ios;
        std::future<std::string> outData;
        std::future<std::string> errData;
        std::string workDir = cwd.empty() ? std::filesystem::current_path().string() : cwd.string();
        bp::child child(bp::exe = exe, bp::args = args, childEnv, bp::start_dir = workDir,
                        bp::std_in.close(), bp::std_out > outData, bp::std_err > errData, ios);
        ios.run();
        child.wait();
        result.exitCode = child.exit_code();
        result.stdoutText = outData.get();
        result.stderrText = errData.get();
    } catch (const std::exception& e) {
        logger_.error(kComponent, "Failed to run " + display + ": " + e.what());
        result.exitCode = 127;
        result.stderrText = e.what();
        return result;
    }

    if (!result.stdoutText.empty()) {
        logger_.debug(kComponent, "Command stdout:\n" + result.stdoutText);
    }
    if (!result.stderrText.empty()) {
        logger_.log(result.succeeded() ? LogLevel::Debug : LogLevel::Warning, kComponent, "Command stderr:\n" + result.stderrText);
    }
    if (!result.succeeded()) {
        logger_.error(kComponent, "Command '" + display + "' failed with exit code " + std::to_string(result.exitCode));
    }
    return result;
}
