#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "INFO";
}

Logger::Logger() {
}

Logger::~Logger() {
    flush();
}

bool Logger::openFile(const std::filesystem::path& path, std::uintmax_t maxBytes, int backups) {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        std::cerr << "Failed to create log directory " << path.parent_path() << ": " << ec.message() << std::endl;
        return false;
    }
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(path, std::ios::app);
    if (!file_) {
        std::cerr << "Failed to open log file " << path << std::endl;
        return false;
    }
    filePath_ = path;
    maxBytes_ = maxBytes;
    backups_ = backups;
    return true;
}

void Logger::setConsoleLevel(LogLevel level) {
    std::lock_guard lock(mutex_);
    consoleLevel_ = level;
}

void Logger::setFileLevel(LogLevel level) {
    std::lock_guard lock(mutex_);
    fileLevel_ = level;
}

void Logger::setConsoleEnabled(bool enabled) {
    std::lock_guard lock(mutex_);
    consoleEnabled_ = enabled;
}

void Logger::addObserver(Observer observer) {
    std::lock_guard lock(mutex_);
    observers_.push_back(std::move(observer));
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard lock(mutex_);
    try {
        if (file_.is_open() && level >= fileLevel_) {
            rotateIfNeeded();
            file_ << timestamp() << " - " << toString(level) << " - " << component << " - " << message << '\n';
            if (level >= LogLevel::Error) {
                file_.flush();
            }
        }
        if (consoleEnabled_ && level >= consoleLevel_) {
            std::cerr << "[" << toString(level) << "] " << message << std::endl;
        }
        for (auto& observer : observers_) {
            observer(level, component, message);
        }
    } catch (const std::exception& e) {
        std::cerr << "CRITICAL LOGGING ERROR: " << e.what() << " | Original message: " << message << std::endl;
    }
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
    std::cerr.flush();
}

void Logger::rotateIfNeeded() {
    if (maxBytes_ == 0 || filePath_.empty()) {
        return;
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(filePath_, ec);
    if (ec || size < maxBytes_) {
        return;
    }
    file_.close();
    for (int i = backups_ - 1; i >= 1; --i) {
        auto from = filePath_.string() + "." + std::to_string(i);
        auto to = filePath_.string() + "." + std::to_string(i + 1);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, to, ec);
        }
    }
    if (backups_ > 0) {
        std::filesystem::rename(filePath_, filePath_.string() + ".1", ec);
    } else {
        std::filesystem::remove(filePath_, ec);
    }
    file_.open(filePath_, std::ios::app);
}

std::vector<std::string> Logger::tail(const std::filesystem::path& file, std::size_t count) {
    std::ifstream in(file);
    std::deque<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
        if (lines.size() > count) {
            lines.pop_front();
        }
    }
    return std::vector<std::string>(lines.begin(), lines.end());
}
