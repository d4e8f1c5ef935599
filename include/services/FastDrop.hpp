#pragma once

#include "config/Config.hpp"
#include "types/Credentials.hpp"
#include "types/UploadEntry.hpp"
#include "upload/Registry.hpp"

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fdrop::http { class HttpClient; }
namespace fdrop::state { class StateStore; }
namespace fdrop::auth { class CredentialStore; }
namespace fdrop::settings { class Preferences; }
namespace fdrop::cloud { class ProviderFactory; }
namespace fdrop::notify { class Clipboard; class Notifier; class Dispatcher; }
namespace fdrop::upload { class Orchestrator; }

namespace fdrop::services {

// Engine facade: the only surface a front end talks to.
class FastDrop {
public:
    struct Deps {
        std::shared_ptr<http::HttpClient> http;
        std::shared_ptr<state::StateStore> state;
        std::shared_ptr<notify::Clipboard> clipboard;
        std::shared_ptr<notify::Notifier> notifier;
        std::shared_ptr<cloud::ProviderFactory> providers;   // null: real providers over `http`
    };

    FastDrop(const config::Config& cfg, Deps deps);
    ~FastDrop();

    FastDrop(const FastDrop&) = delete;
    FastDrop& operator=(const FastDrop&) = delete;

    // curl transport, JSON state file, command-line clipboard and notify-send
    // (left out when notifications is false).
    static std::unique_ptr<FastDrop> createDefault(const config::Config& cfg, bool notifications = true);

    types::UploadEntry submitPath(const std::string& path);
    std::shared_future<types::UploadOutcome> beginUpload(const types::EntryId& id);
    bool removeEntry(const types::EntryId& id);

    [[nodiscard]] std::vector<types::UploadEntry> entries() const;
    [[nodiscard]] std::optional<types::UploadEntry> entry(const types::EntryId& id) const;

    void subscribe(upload::Registry::Listener listener) const;

    // Blocks until every upload started so far has finished.
    void waitAll() const;

    void saveCredentials(const std::string& clientId, const std::string& clientSecret) const;
    [[nodiscard]] std::optional<types::Credentials> getCredentials() const;

    bool setAutoCopy(bool enabled) const;
    [[nodiscard]] bool getAutoCopy() const;

    bool setAutoStart(bool enabled) const;
    [[nodiscard]] bool getAutoStart() const;

    bool setSelectedProvider(types::ProviderKind kind) const;
    [[nodiscard]] types::ProviderKind getSelectedProvider() const;

    // Session-only provider choice, not persisted.
    void overrideProvider(types::ProviderKind kind) const;

    bool notify(const std::string& title, const std::string& body,
                const std::optional<std::string>& url = std::nullopt) const;

    [[nodiscard]] static std::string version();

private:
    std::shared_ptr<upload::Registry> registry_;
    std::shared_ptr<auth::CredentialStore> credentials_;
    std::shared_ptr<settings::Preferences> preferences_;
    std::shared_ptr<notify::Dispatcher> dispatcher_;
    std::shared_ptr<cloud::ProviderFactory> providers_;
    std::unique_ptr<upload::Orchestrator> orchestrator_;
};

}
