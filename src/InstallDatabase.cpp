#include "InstallDatabase.hpp"
#include "Errors.hpp"
#include <algorithm>

namespace {

const char* kComponent = "InstallDatabase";

} // namespace

InstallDatabase::InstallDatabase(JsonStore& store, Logger& logger, std::filesystem::path path, Scope scope)
    : store_(store), logger_(logger), path_(std::move(path)), scope_(scope) {
}

void InstallDatabase::load() {
    records_.clear();
    Json::Value document = store_.read(path_, Json::Value(Json::arrayValue));
    if (!document.isArray()) {
        logger_.error(kComponent, "Install database " + path_.string() + " is not a JSON array");
        throw CorruptionError(path_.string(), "expected a top-level array of server records");
    }
    for (Json::ArrayIndex i = 0; i < document.size(); ++i) {
        std::string problem;
        auto record = ServerRecord::fromJson(document[i], problem);
        if (!record) {
            logger_.warning(kComponent, "Skipping record #" + std::to_string(i) + " in " + path_.string() + ": " + problem);
            continue;
        }
        if (record->scope != scope_) {
            logger_.warning(kComponent, "Skipping record '" + record->name + "' in " + path_.string() +
                                        ": it belongs to the " + toString(record->scope) + " scope");
            continue;
        }
        if (find(record->name)) {
            logger_.warning(kComponent, "Skipping duplicate record '" + record->name + "' in " + path_.string());
            continue;
        }
        records_.push_back(std::move(*record));
    }
}

void InstallDatabase::save() {
    Json::Value document(Json::arrayValue);
    for (const auto& record : records_) {
        document.append(record.toJson());
    }
    store_.write(path_, document);
}

std::optional<ServerRecord> InstallDatabase::find(const std::string& name) const {
    auto it = std::find_if(records_.begin(), records_.end(), [&](const ServerRecord& r) { return r.name == name; });
    if (it == records_.end()) {
        return std::nullopt;
    }
    return *it;
}

bool InstallDatabase::upsert(const ServerRecord& record) {
    if (record.scope != scope_) {
        throw PersistFailure("Refusing to store " + toString(record.scope) + " record '" + record.name +
                             "' in the " + toString(scope_) + " database");
    }
    for (auto& existing : records_) {
        if (existing.name == record.name) {
            existing = record;
            return true;
        }
    }
    records_.push_back(record);
    return false;
}

bool InstallDatabase::remove(const std::string& name) {
    auto it = std::remove_if(records_.begin(), records_.end(), [&](const ServerRecord& r) { return r.name == name; });
    if (it == records_.end()) {
        return false;
    }
    records_.erase(it, records_.end());
    return true;
}
