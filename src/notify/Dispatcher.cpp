#include "notify/Dispatcher.hpp"
#include "settings/Preferences.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace fdrop::notify;
using namespace fdrop::logging;

Dispatcher::Dispatcher(std::shared_ptr<Clipboard> clipboard,
                       std::shared_ptr<Notifier> notifier,
                       std::shared_ptr<settings::Preferences> preferences)
    : clipboard_(std::move(clipboard)), notifier_(std::move(notifier)), preferences_(std::move(preferences)) {
    if (!preferences_) throw std::invalid_argument("Dispatcher requires preferences");
}

void Dispatcher::onSuccess(const std::string& displayName, const std::string& url) const {
    bool autoCopy = false;
    try {
        autoCopy = preferences_->autoCopy();
    } catch (const std::exception& e) {
        LogRegistry::notify()->warn("[Dispatcher] Could not read auto-copy flag: {}", e.what());
    }

    if (autoCopy) {
        try {
            if (!clipboard_) throw std::runtime_error("no clipboard available");
            clipboard_->copy(url);
        } catch (const std::exception& e) {
            LogRegistry::notify()->warn("[Dispatcher] Failed to copy link for {}: {}", displayName, e.what());
        }
    }

    const auto body = autoCopy
        ? fmt::format("{} uploaded successfully! Link copied to clipboard.", displayName)
        : fmt::format("{} uploaded successfully! Click to view in app.", displayName);

    notify({UPLOAD_COMPLETE_TITLE, body, url});
}

bool Dispatcher::notify(const Notification& notification) const {
    if (!notifier_ || !notifier_->isSupported()) {
        LogRegistry::notify()->info("[Dispatcher] Notifications not supported");
        return false;
    }

    try {
        notifier_->show(notification);
        return true;
    } catch (const std::exception& e) {
        LogRegistry::notify()->error("[Dispatcher] Failed to show notification: {}", e.what());
        return false;
    }
}
