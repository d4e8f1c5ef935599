#include "state/StateStore.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace fdrop::state;
using namespace fdrop::logging;

namespace {

nlohmann::json readRecord(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return nlohmann::json::object();

    std::ifstream in(path);
    if (!in) {
        LogRegistry::config()->warn("[StateStore] Unable to open {}, using defaults", path.string());
        return nlohmann::json::object();
    }

    auto j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        LogRegistry::config()->warn("[StateStore] {} is corrupted, using defaults", path.string());
        return nlohmann::json::object();
    }
    return j;
}

}

JsonFileStateStore::JsonFileStateStore(std::filesystem::path path) : path_(std::move(path)) {}

PersistedState JsonFileStateStore::load() const {
    std::scoped_lock lock(mutex_);
    return state_from_json(readRecord(path_));
}

void JsonFileStateStore::update(const std::function<void(PersistedState&)>& mutate) {
    std::scoped_lock lock(mutex_);

    auto record = readRecord(path_);
    auto state = state_from_json(record);
    mutate(state);
    merge_into(record, state);

    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());

    const auto tmp = path_.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error(fmt::format("Failed to open {} for writing", tmp));
        out << record.dump(2);
        if (!out) throw std::runtime_error(fmt::format("Failed to write {}", tmp));
    }
    std::filesystem::rename(tmp, path_);
}
