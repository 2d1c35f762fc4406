#include "JsonStore.hpp"
#include "Errors.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace {

const char* kComponent = "JsonStore";

bool isBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

void writeAll(int fd, const std::string& data, const std::filesystem::path& temp) {
    const char* ptr = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, ptr, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw PersistFailure("Failed to write " + temp.string() + ": " + std::strerror(errno));
        }
        ptr += written;
        remaining -= static_cast<size_t>(written);
    }
}

} // namespace

JsonStore::JsonStore(Logger& logger) : logger_(logger) {
}

Json::Value JsonStore::read(const std::filesystem::path& path, const Json::Value& fallback) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        logger_.debug(kComponent, "Document " + path.string() + " not found, using default");
        return fallback;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw CorruptionError(path.string(), "cannot be opened for reading");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string content = buffer.str();
    if (isBlank(content)) {
        logger_.debug(kComponent, "Document " + path.string() + " is empty, using default");
        return fallback;
    }

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    Json::Value document;
    std::string errs;
    std::istringstream iss(content);
    if (!Json::parseFromStream(builder, iss, &document, &errs)) {
        logger_.error(kComponent, "Cannot parse " + path.string() + ", leaving it for manual recovery: " + errs);
        throw CorruptionError(path.string(), errs);
    }
    return document;
}

std::string JsonStore::serialize(const Json::Value& document) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, document) + "\n";
}

std::filesystem::path JsonStore::backupPath(const std::filesystem::path& path) {
    return std::filesystem::path(path.string() + ".bak");
}

void JsonStore::setBeforeRenameHook(std::function<void(const std::filesystem::path&)> hook) {
    beforeRename_ = std::move(hook);
}

void JsonStore::backupOnce(const std::filesystem::path& path) {
    std::error_code ec;
    auto key = std::filesystem::absolute(path, ec).string();
    if (backedUp_.count(key) || !std::filesystem::exists(path, ec)) {
        return;
    }
    std::filesystem::copy_file(path, backupPath(path), std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw PersistFailure("Failed to back up " + path.string() + ": " + ec.message());
    }
    backedUp_.insert(key);
    logger_.debug(kComponent, "Backed up " + path.string() + " to " + backupPath(path).string());
}

void JsonStore::write(const std::filesystem::path& path, const Json::Value& document) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw PersistFailure("Failed to create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }
    backupOnce(path);

    auto temp = path;
    temp += ".tmp-" + std::to_string(::getpid());
    const std::string data = serialize(document);

    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw PersistFailure("Failed to create " + temp.string() + ": " + std::strerror(errno));
    }
    try {
        writeAll(fd, data, temp);
        if (::fsync(fd) != 0) {
            throw PersistFailure("Failed to flush " + temp.string() + ": " + std::strerror(errno));
        }
        ::close(fd);
        fd = -1;
        if (beforeRename_) {
            beforeRename_(temp);
        }
        std::filesystem::rename(temp, path);
    } catch (const std::exception& e) {
        if (fd >= 0) {
            ::close(fd);
        }
        std::filesystem::remove(temp, ec);
        logger_.error(kComponent, "Write of " + path.string() + " failed: " + e.what());
        if (dynamic_cast<const PersistFailure*>(&e)) {
            throw;
        }
        throw PersistFailure("Failed to write " + path.string() + ": " + e.what());
    }
    logger_.debug(kComponent, "Wrote " + path.string());
}
