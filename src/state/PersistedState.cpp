#include "state/PersistedState.hpp"

#include <nlohmann/json.hpp>

namespace fdrop::state {

void merge_into(nlohmann::json& j, const PersistedState& s) {
    if (!j.is_object()) j = nlohmann::json::object();

    // A key is only dropped when it held a value we understood; rejected
    // values stay in the record as written.
    const auto before = state_from_json(j);

    if (s.googleCredentials) j["googleCredentials"] = *s.googleCredentials;
    else if (before.googleCredentials) j.erase("googleCredentials");

    j["autoStart"] = s.autoStart;
    j["autoCopy"] = s.autoCopy;

    if (s.provider) j["provider"] = types::to_string(*s.provider);
    else if (before.provider) j.erase("provider");
}

PersistedState state_from_json(const nlohmann::json& j) {
    PersistedState s;
    if (!j.is_object()) return s;

    if (const auto it = j.find("googleCredentials"); it != j.end() && it->is_object()) {
        try {
            auto c = it->get<types::Credentials>();
            if (c.complete()) s.googleCredentials = std::move(c);
        } catch (const nlohmann::json::exception&) {
            s.googleCredentials.reset();
        }
    }

    if (const auto it = j.find("autoStart"); it != j.end() && it->is_boolean()) s.autoStart = it->get<bool>();
    if (const auto it = j.find("autoCopy"); it != j.end() && it->is_boolean()) s.autoCopy = it->get<bool>();

    if (const auto it = j.find("provider"); it != j.end() && it->is_string()) {
        try { s.provider = types::provider_kind_from_string(it->get<std::string>()); }
        catch (const std::invalid_argument&) { s.provider.reset(); }
    }

    return s;
}

}
