#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>

namespace fdrop::types {

struct Credentials {
    std::string clientId;
    std::string clientSecret;

    [[nodiscard]] bool complete() const { return !clientId.empty() && !clientSecret.empty(); }

    bool operator==(const Credentials&) const = default;
};

void to_json(nlohmann::json& j, const Credentials& c);
void from_json(const nlohmann::json& j, Credentials& c);

}
