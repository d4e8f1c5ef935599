#include "notify/Sinks.hpp"
#include "util/process.hpp"
#include "logging/LogRegistry.hpp"

#include <cstdlib>
#include <fmt/format.h>
#include <stdexcept>
#include <vector>

using namespace fdrop::notify;
using namespace fdrop::logging;

void CommandClipboard::copy(const std::string& text) {
    std::vector<std::vector<std::string>> candidates;
    if (std::getenv("WAYLAND_DISPLAY")) candidates.push_back({"wl-copy"});
    candidates.push_back({"xclip", "-selection", "clipboard"});
    candidates.push_back({"xsel", "--clipboard", "--input"});

    for (const auto& argv : candidates) {
        if (!util::findExecutable(argv.front())) continue;

        const int rc = util::runWithInput(argv, text);
        if (rc == 0) {
            LogRegistry::notify()->debug("[CommandClipboard] Copied {} bytes via {}", text.size(), argv.front());
            return;
        }
        LogRegistry::notify()->warn("[CommandClipboard] {} exited with status {}", argv.front(), rc);
    }

    throw std::runtime_error("No working clipboard command found (tried wl-copy, xclip, xsel)");
}

bool NotifySendNotifier::isSupported() const { return util::findExecutable("notify-send").has_value(); }

void NotifySendNotifier::show(const Notification& notification) {
    std::vector<std::string> argv{"notify-send", "--app-name=" + appName_, notification.title, notification.body};
    if (notification.url) argv.insert(argv.begin() + 1, "--hint=string:x-fastdrop-url:" + *notification.url);

    const int rc = util::runWithInput(argv);
    if (rc != 0) throw std::runtime_error(fmt::format("notify-send exited with status {}", rc));
}
