#pragma once

#include "types/ProviderKind.hpp"
#include "types/UploadError.hpp"

#include <boost/uuid/uuid.hpp>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace fdrop::types {

using EntryId = boost::uuids::uuid;

enum class UploadState { Idle, Uploading, Success, Error };

std::string to_string(UploadState state);

struct UploadEntry {
    EntryId id{};
    std::string path;
    std::string displayName;
    UploadState state{UploadState::Idle};
    unsigned int progress{0};
    std::optional<std::string> resultUrl;     // Success only
    std::optional<std::string> errorMessage;  // Error only
    std::optional<ProviderKind> provider;     // set once the upload began

    UploadEntry() = default;
    UploadEntry(const EntryId& id, std::string path);

    [[nodiscard]] bool isTerminal() const {
        return state == UploadState::Success || state == UploadState::Error;
    }
};

// Final path segment, or the whole path when it has none.
std::string displayNameFor(const std::string& path);

std::string to_string(const EntryId& id);

void to_json(nlohmann::json& j, const UploadEntry& e);

// Result handed back to whoever called beginUpload().
struct UploadOutcome {
    bool ok{false};
    std::string url;
    std::optional<UploadError::Kind> errorKind;
    std::string message;

    static UploadOutcome success(std::string url);
    static UploadOutcome failure(UploadError::Kind kind, std::string message);
};

}
