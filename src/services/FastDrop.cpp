#include "services/FastDrop.hpp"
#include "auth/CredentialStore.hpp"
#include "cloud/ProviderFactory.hpp"
#include "http/CurlHttpClient.hpp"
#include "notify/Dispatcher.hpp"
#include "notify/Sinks.hpp"
#include "settings/Preferences.hpp"
#include "state/StateStore.hpp"
#include "upload/Orchestrator.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

#ifndef FASTDROP_VERSION
#define FASTDROP_VERSION "0.0.0"
#endif

using namespace fdrop::services;
using namespace fdrop::types;
using namespace fdrop::logging;

FastDrop::FastDrop(const config::Config& cfg, Deps deps) {
    if (!deps.state) throw std::invalid_argument("FastDrop requires a state store");
    if (!deps.providers && !deps.http) throw std::invalid_argument("FastDrop requires an HTTP client or a provider factory");

    registry_ = std::make_shared<upload::Registry>();
    credentials_ = std::make_shared<auth::CredentialStore>(deps.state);
    preferences_ = std::make_shared<settings::Preferences>(deps.state, cfg.uploads.default_provider);
    dispatcher_ = std::make_shared<notify::Dispatcher>(std::move(deps.clipboard), std::move(deps.notifier), preferences_);

    providers_ = deps.providers
        ? std::move(deps.providers)
        : std::make_shared<cloud::DefaultProviderFactory>(std::move(deps.http), credentials_,
                                                          cfg.anonymous_host, cfg.cloud_store);

    orchestrator_ = std::make_unique<upload::Orchestrator>(registry_, providers_, preferences_, dispatcher_,
                                                           upload::ProgressSettings::from(cfg.uploads));

    LogRegistry::fastdrop()->debug("[FastDrop] Engine ready (default provider: {})",
                                   to_string(cfg.uploads.default_provider));
}

FastDrop::~FastDrop() = default;

std::unique_ptr<FastDrop> FastDrop::createDefault(const config::Config& cfg, const bool notifications) {
    Deps deps;
    deps.http = std::make_shared<http::CurlHttpClient>();
    deps.state = std::make_shared<state::JsonFileStateStore>(cfg.statePath());
    deps.clipboard = std::make_shared<notify::CommandClipboard>();
    if (notifications) deps.notifier = std::make_shared<notify::NotifySendNotifier>();
    return std::make_unique<FastDrop>(cfg, std::move(deps));
}

UploadEntry FastDrop::submitPath(const std::string& path) {
    const auto id = registry_->add(path);
    const auto snapshot = registry_->get(id);
    if (!snapshot) throw std::logic_error("Entry for " + path + " vanished right after submission");
    return *snapshot;
}

std::shared_future<UploadOutcome> FastDrop::beginUpload(const EntryId& id) { return orchestrator_->begin(id); }

bool FastDrop::removeEntry(const EntryId& id) { return registry_->remove(id); }

std::vector<UploadEntry> FastDrop::entries() const { return registry_->list(); }

std::optional<UploadEntry> FastDrop::entry(const EntryId& id) const { return registry_->get(id); }

void FastDrop::subscribe(upload::Registry::Listener listener) const { registry_->subscribe(std::move(listener)); }

void FastDrop::waitAll() const { orchestrator_->waitAll(); }

void FastDrop::saveCredentials(const std::string& clientId, const std::string& clientSecret) const {
    credentials_->save({clientId, clientSecret});
}

std::optional<Credentials> FastDrop::getCredentials() const { return credentials_->get(); }

bool FastDrop::setAutoCopy(const bool enabled) const { return preferences_->setAutoCopy(enabled); }

bool FastDrop::getAutoCopy() const { return preferences_->autoCopy(); }

bool FastDrop::setAutoStart(const bool enabled) const { return preferences_->setAutoStart(enabled); }

bool FastDrop::getAutoStart() const { return preferences_->autoStart(); }

bool FastDrop::setSelectedProvider(const ProviderKind kind) const { return preferences_->setSelectedProvider(kind); }

ProviderKind FastDrop::getSelectedProvider() const { return preferences_->selectedProvider(); }

void FastDrop::overrideProvider(const ProviderKind kind) const { preferences_->overrideProvider(kind); }

bool FastDrop::notify(const std::string& title, const std::string& body,
                      const std::optional<std::string>& url) const {
    return dispatcher_->notify({title, body, url});
}

std::string FastDrop::version() { return FASTDROP_VERSION; }
