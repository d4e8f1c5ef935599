#include "types/Credentials.hpp"

#include <nlohmann/json.hpp>

namespace fdrop::types {

void to_json(nlohmann::json& j, const Credentials& c) {
    j = {
        {"clientId", c.clientId},
        {"clientSecret", c.clientSecret}
    };
}

void from_json(const nlohmann::json& j, Credentials& c) {
    c.clientId = j.at("clientId").get<std::string>();
    c.clientSecret = j.at("clientSecret").get<std::string>();
}

}
