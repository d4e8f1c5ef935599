#include "types/UploadError.hpp"

#include <fmt/format.h>

using namespace fdrop::types;

UploadError::UploadError(const Kind kind, const std::string& detail)
    : std::runtime_error(detail), kind_(kind) {}

std::string UploadError::describe() const { return fdrop::types::describe(kind_, what()); }

std::string fdrop::types::to_string(const UploadError::Kind kind) {
    switch (kind) {
        case UploadError::Kind::Configuration: return "Configuration";
        case UploadError::Kind::Network: return "Network";
        case UploadError::Kind::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string fdrop::types::describe(const UploadError::Kind kind, const std::string& detail) {
    return fmt::format("{} error: {}", to_string(kind), detail);
}
