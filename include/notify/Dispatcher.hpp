#pragma once

#include "notify/Sinks.hpp"

#include <memory>

namespace fdrop::settings { class Preferences; }

namespace fdrop::notify {

// Side effects of a successful upload. Nothing here ever throws back into
// the upload: failures are logged and dropped.
class Dispatcher {
public:
    static constexpr const auto* UPLOAD_COMPLETE_TITLE = "FastDrop - Upload Complete";

    Dispatcher(std::shared_ptr<Clipboard> clipboard,
               std::shared_ptr<Notifier> notifier,
               std::shared_ptr<settings::Preferences> preferences);

    // Clipboard first (when auto-copy is on), then the notification.
    void onSuccess(const std::string& displayName, const std::string& url) const;

    bool notify(const Notification& notification) const;

private:
    std::shared_ptr<Clipboard> clipboard_;
    std::shared_ptr<Notifier> notifier_;
    std::shared_ptr<settings::Preferences> preferences_;
};

}
