#pragma once

#include <string>

namespace fdrop::types {

enum class ProviderKind { AnonymousHost, CredentialedCloudStore };

std::string to_string(ProviderKind kind);

// Accepts the config/CLI spellings: "anonymous", "0x0", "cloud", "googledrive".
ProviderKind provider_kind_from_string(const std::string& str);

}
