#pragma once

#include "types/Credentials.hpp"
#include "types/ProviderKind.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>

namespace fdrop::state {

// The single settings record shared by the credential store and the preferences.
struct PersistedState {
    std::optional<types::Credentials> googleCredentials;
    bool autoStart = false;
    bool autoCopy = false;
    std::optional<types::ProviderKind> provider;
};

// Overlays the known keys onto j, leaving any other keys untouched. A known
// key whose stored value was rejected on load is kept unless s sets it.
void merge_into(nlohmann::json& j, const PersistedState& s);

// Lenient: wrong types or incomplete credentials fall back to defaults.
PersistedState state_from_json(const nlohmann::json& j);

}
