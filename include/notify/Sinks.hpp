#pragma once

#include <optional>
#include <string>

namespace fdrop::notify {

struct Notification {
    std::string title;
    std::string body;
    std::optional<std::string> url;
};

class Clipboard {
public:
    virtual ~Clipboard() = default;

    // Throws std::runtime_error when the text could not be placed on the clipboard.
    virtual void copy(const std::string& text) = 0;
};

class Notifier {
public:
    virtual ~Notifier() = default;

    [[nodiscard]] virtual bool isSupported() const = 0;

    // Throws std::runtime_error when the notification could not be shown.
    virtual void show(const Notification& notification) = 0;
};

// Pipes the text into wl-copy, xclip or xsel, whichever is found first on PATH.
class CommandClipboard final : public Clipboard {
public:
    void copy(const std::string& text) override;
};

// Desktop notifications through notify-send.
class NotifySendNotifier final : public Notifier {
public:
    explicit NotifySendNotifier(std::string appName = "FastDrop") : appName_(std::move(appName)) {}

    [[nodiscard]] bool isSupported() const override;
    void show(const Notification& notification) override;

private:
    std::string appName_;
};

}
