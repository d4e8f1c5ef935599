#pragma once

#include "types/Credentials.hpp"

#include <memory>
#include <optional>

namespace fdrop::state { class StateStore; }

namespace fdrop::auth {

// Sole reader/writer of the cloud store credentials.
class CredentialStore {
public:
    static constexpr const auto* CLIENT_ID_ENV = "GOOGLE_CLIENT_ID";
    static constexpr const auto* CLIENT_SECRET_ENV = "GOOGLE_CLIENT_SECRET";

    explicit CredentialStore(std::shared_ptr<state::StateStore> store);

    // Trims both fields; throws std::invalid_argument if either ends up empty.
    void save(const types::Credentials& credentials) const;

    // Persisted credentials only.
    [[nodiscard]] std::optional<types::Credentials> get() const;

    // Persisted credentials first, then the process environment.
    [[nodiscard]] std::optional<types::Credentials> resolve() const;

private:
    std::shared_ptr<state::StateStore> store_;

    static std::optional<types::Credentials> fromEnvironment();
};

}
