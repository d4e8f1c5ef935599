#include "types/ProviderKind.hpp"

#include <stdexcept>
#include <unordered_map>

using namespace fdrop::types;

std::string fdrop::types::to_string(const ProviderKind kind) {
    switch (kind) {
        case ProviderKind::AnonymousHost: return "anonymous";
        case ProviderKind::CredentialedCloudStore: return "cloud";
        default: throw std::invalid_argument("Unknown ProviderKind enum value");
    }
}

ProviderKind fdrop::types::provider_kind_from_string(const std::string& str) {
    static const std::unordered_map<std::string, ProviderKind> mapping = {
        {"anonymous", ProviderKind::AnonymousHost},
        {"0x0", ProviderKind::AnonymousHost},
        {"cloud", ProviderKind::CredentialedCloudStore},
        {"googledrive", ProviderKind::CredentialedCloudStore}
    };
    const auto it = mapping.find(str);
    if (it != mapping.end()) return it->second;
    throw std::invalid_argument("Invalid provider: " + str);
}
