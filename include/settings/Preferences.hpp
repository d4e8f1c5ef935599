#pragma once

#include "types/ProviderKind.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace fdrop::state { class StateStore; }

namespace fdrop::settings {

// Process-wide flags, read from the persisted record at every decision point.
// The persisted record is the only source of truth; setters return false when
// the write fails instead of throwing.
class Preferences {
public:
    Preferences(std::shared_ptr<state::StateStore> store, types::ProviderKind defaultProvider);

    [[nodiscard]] bool autoCopy() const;
    bool setAutoCopy(bool enabled);

    [[nodiscard]] bool autoStart() const;
    bool setAutoStart(bool enabled);

    [[nodiscard]] types::ProviderKind selectedProvider() const;
    bool setSelectedProvider(types::ProviderKind kind);

    // Session-only provider choice (e.g. a CLI flag); wins over the persisted one.
    void overrideProvider(types::ProviderKind kind);

private:
    std::shared_ptr<state::StateStore> store_;
    types::ProviderKind defaultProvider_;

    mutable std::mutex mutex_;
    std::optional<types::ProviderKind> sessionProvider_;
};

}
