#include "settings/Preferences.hpp"
#include "state/StateStore.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace fdrop::settings;
using namespace fdrop::types;
using namespace fdrop::logging;

Preferences::Preferences(std::shared_ptr<state::StateStore> store, const ProviderKind defaultProvider)
    : store_(std::move(store)), defaultProvider_(defaultProvider) {
    if (!store_) throw std::invalid_argument("Preferences requires a state store");
}

bool Preferences::autoCopy() const { return store_->load().autoCopy; }

bool Preferences::setAutoCopy(const bool enabled) {
    try {
        store_->update([&](state::PersistedState& s) { s.autoCopy = enabled; });
        return true;
    } catch (const std::exception& e) {
        LogRegistry::config()->error("[Preferences] Failed to set auto-copy: {}", e.what());
        return false;
    }
}

bool Preferences::autoStart() const { return store_->load().autoStart; }

bool Preferences::setAutoStart(const bool enabled) {
    try {
        store_->update([&](state::PersistedState& s) { s.autoStart = enabled; });
        return true;
    } catch (const std::exception& e) {
        LogRegistry::config()->error("[Preferences] Failed to set auto-start: {}", e.what());
        return false;
    }
}

ProviderKind Preferences::selectedProvider() const {
    {
        std::scoped_lock lock(mutex_);
        if (sessionProvider_) return *sessionProvider_;
    }
    return store_->load().provider.value_or(defaultProvider_);
}

bool Preferences::setSelectedProvider(const ProviderKind kind) {
    try {
        store_->update([&](state::PersistedState& s) { s.provider = kind; });
        return true;
    } catch (const std::exception& e) {
        LogRegistry::config()->error("[Preferences] Failed to set provider: {}", e.what());
        return false;
    }
}

void Preferences::overrideProvider(const ProviderKind kind) {
    std::scoped_lock lock(mutex_);
    sessionProvider_ = kind;
}
