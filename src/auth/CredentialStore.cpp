#include "auth/CredentialStore.hpp"
#include "state/StateStore.hpp"
#include "logging/LogRegistry.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <cstdlib>
#include <stdexcept>

using namespace fdrop::auth;
using namespace fdrop::types;
using namespace fdrop::logging;

CredentialStore::CredentialStore(std::shared_ptr<state::StateStore> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("CredentialStore requires a state store");
}

void CredentialStore::save(const Credentials& credentials) const {
    Credentials trimmed{boost::algorithm::trim_copy(credentials.clientId),
                        boost::algorithm::trim_copy(credentials.clientSecret)};
    if (!trimmed.complete())
        throw std::invalid_argument("Both client id and client secret are required");

    store_->update([&](state::PersistedState& s) { s.googleCredentials = trimmed; });
    LogRegistry::credentials()->info("[CredentialStore] Saved cloud store credentials");
}

std::optional<Credentials> CredentialStore::get() const {
    return store_->load().googleCredentials;
}

std::optional<Credentials> CredentialStore::resolve() const {
    if (auto persisted = get()) return persisted;

    if (auto env = fromEnvironment()) {
        LogRegistry::credentials()->debug("[CredentialStore] Using credentials from {}/{}",
                                          CLIENT_ID_ENV, CLIENT_SECRET_ENV);
        return env;
    }

    LogRegistry::credentials()->warn("[CredentialStore] No cloud store credentials configured");
    return std::nullopt;
}

std::optional<Credentials> CredentialStore::fromEnvironment() {
    const char* id = std::getenv(CLIENT_ID_ENV);
    const char* secret = std::getenv(CLIENT_SECRET_ENV);

    Credentials c{id ? id : "", secret ? secret : ""};
    if (!c.complete()) return std::nullopt;
    return c;
}
