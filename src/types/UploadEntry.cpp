#include "types/UploadEntry.hpp"

#include <boost/uuid/uuid_io.hpp>
#include <filesystem>
#include <nlohmann/json.hpp>

using namespace fdrop::types;

std::string fdrop::types::to_string(const UploadState state) {
    switch (state) {
        case UploadState::Idle: return "idle";
        case UploadState::Uploading: return "uploading";
        case UploadState::Success: return "success";
        case UploadState::Error: return "error";
    }
    return "unknown";
}

std::string fdrop::types::displayNameFor(const std::string& path) {
    auto name = std::filesystem::path(path).filename().string();
    return name.empty() ? path : name;
}

std::string fdrop::types::to_string(const EntryId& id) { return boost::uuids::to_string(id); }

UploadEntry::UploadEntry(const EntryId& id, std::string path)
    : id(id), path(std::move(path)) {
    displayName = displayNameFor(this->path);
}

void fdrop::types::to_json(nlohmann::json& j, const UploadEntry& e) {
    j = {
        {"id", fdrop::types::to_string(e.id)},
        {"path", e.path},
        {"name", e.displayName},
        {"state", to_string(e.state)},
        {"progress", e.progress}
    };

    if (e.provider) j["provider"] = to_string(*e.provider);
    if (e.resultUrl) j["url"] = *e.resultUrl;
    if (e.errorMessage) j["error"] = *e.errorMessage;
}

UploadOutcome UploadOutcome::success(std::string url) {
    UploadOutcome o;
    o.ok = true;
    o.url = std::move(url);
    return o;
}

UploadOutcome UploadOutcome::failure(const UploadError::Kind kind, std::string message) {
    UploadOutcome o;
    o.errorKind = kind;
    o.message = std::move(message);
    return o;
}
