// Engine
#include "services/FastDrop.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "util/paths.hpp"

// Libraries
#include <csignal>
#include <cstdlib>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace fdrop::config;
using namespace fdrop::services;
using namespace fdrop::types;
using namespace fdrop::logging;

namespace {

constexpr int EXIT_USAGE = 2;

struct Options {
    std::optional<std::string> configPath;
    std::optional<ProviderKind> provider;
    bool notify = true;
    bool json = false;
    bool version = false;
    std::vector<std::string> args;
};

void printUsage() {
    fmt::print(stderr,
        "usage: fastdrop [--config PATH] [--provider anonymous|cloud] [--no-notify] [--json] FILE...\n"
        "       fastdrop credentials set <client-id> <client-secret>\n"
        "       fastdrop credentials show\n"
        "       fastdrop autocopy [on|off]\n"
        "       fastdrop autostart [on|off]\n"
        "       fastdrop provider [anonymous|cloud]\n"
        "       fastdrop notify <title> <body> [url]\n"
        "       fastdrop --version\n");
}

// Option values may be glued ("--config=PATH") or separate ("--config PATH").
std::optional<std::string> takeValue(std::string_view flag, const std::string& arg, int& i, const int argc, char** argv) {
    const std::string glued = std::string(flag) + "=";
    if (arg.starts_with(glued)) return arg.substr(glued.size());
    if (arg != flag) return std::nullopt;
    if (i + 1 >= argc) throw std::invalid_argument(fmt::format("{} requires a value", flag));
    return std::string(argv[++i]);
}

Options parseArgs(const int argc, char** argv) {
    Options opts;
    bool endOfOptions = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (endOfOptions || arg.empty() || arg[0] != '-' || arg == "-") {
            opts.args.push_back(arg);
            continue;
        }

        if (arg == "--") { endOfOptions = true; continue; }
        if (arg == "--version" || arg == "-V") { opts.version = true; continue; }
        if (arg == "--no-notify") { opts.notify = false; continue; }
        if (arg == "--json") { opts.json = true; continue; }

        if (auto v = takeValue("--config", arg, i, argc, argv)) { opts.configPath = *v; continue; }
        if (auto v = takeValue("--provider", arg, i, argc, argv)) {
            opts.provider = provider_kind_from_string(*v);
            continue;
        }

        throw std::invalid_argument("unknown option: " + arg);
    }

    return opts;
}

std::optional<bool> parseSwitch(const std::string& s) {
    if (s == "on" || s == "true" || s == "1" || s == "yes") return true;
    if (s == "off" || s == "false" || s == "0" || s == "no") return false;
    return std::nullopt;
}

// Shared shape of autocopy/autostart: no argument prints, on|off writes.
int runToggle(const std::vector<std::string>& args, const char* name,
              const std::function<bool()>& get, const std::function<bool(bool)>& set) {
    if (args.size() == 1) {
        fmt::print("{}: {}\n", name, get() ? "on" : "off");
        return EXIT_SUCCESS;
    }

    const auto value = args.size() == 2 ? parseSwitch(args[1]) : std::nullopt;
    if (!value) {
        printUsage();
        return EXIT_USAGE;
    }

    if (!set(*value)) {
        fmt::print(stderr, "fastdrop: failed to save {} setting\n", name);
        return EXIT_FAILURE;
    }
    fmt::print("{}: {}\n", name, *value ? "on" : "off");
    return EXIT_SUCCESS;
}

int runCredentials(FastDrop& engine, const std::vector<std::string>& args) {
    if (args.size() == 4 && args[1] == "set") {
        engine.saveCredentials(args[2], args[3]);
        fmt::print("credentials saved\n");
        return EXIT_SUCCESS;
    }

    if (args.size() == 2 && args[1] == "show") {
        const auto creds = engine.getCredentials();
        if (!creds) {
            fmt::print("no credentials configured\n");
            return EXIT_FAILURE;
        }
        // The secret never leaves the state file in full.
        const auto& s = creds->clientSecret;
        fmt::print("clientId: {}\nclientSecret: {}\n", creds->clientId,
                   s.size() > 4 ? std::string(s.size() - 4, '*') + s.substr(s.size() - 4) : std::string(s.size(), '*'));
        return EXIT_SUCCESS;
    }

    printUsage();
    return EXIT_USAGE;
}

int runProvider(FastDrop& engine, const std::vector<std::string>& args) {
    if (args.size() == 1) {
        fmt::print("provider: {}\n", to_string(engine.getSelectedProvider()));
        return EXIT_SUCCESS;
    }
    if (args.size() != 2) {
        printUsage();
        return EXIT_USAGE;
    }

    const auto kind = provider_kind_from_string(args[1]);
    if (!engine.setSelectedProvider(kind)) {
        fmt::print(stderr, "fastdrop: failed to save provider setting\n");
        return EXIT_FAILURE;
    }
    fmt::print("provider: {}\n", to_string(kind));
    return EXIT_SUCCESS;
}

int runNotify(const FastDrop& engine, const std::vector<std::string>& args) {
    if (args.size() < 3 || args.size() > 4) {
        printUsage();
        return EXIT_USAGE;
    }

    const std::optional<std::string> url = args.size() == 4 ? std::optional(args[3]) : std::nullopt;
    return engine.notify(args[1], args[2], url) ? EXIT_SUCCESS : EXIT_FAILURE;
}

int runUploads(FastDrop& engine, const Options& opts) {
    std::mutex outMutex;

    if (!opts.json) {
        engine.subscribe([&outMutex](const fdrop::upload::EntryEvent event, const UploadEntry& e) {
            if (event != fdrop::upload::EntryEvent::Updated || e.state != UploadState::Uploading) return;
            std::scoped_lock lock(outMutex);
            fmt::print(stderr, "{}: {}%\n", e.displayName, e.progress);
        });
    }

    std::vector<std::pair<EntryId, std::shared_future<UploadOutcome>>> started;
    for (const auto& path : opts.args) {
        const auto entry = engine.submitPath(path);
        try {
            started.emplace_back(entry.id, engine.beginUpload(entry.id));
        } catch (const std::logic_error& e) {
            // Same path given twice; the first begin() already owns the entry.
            LogRegistry::fastdrop()->debug("[cli] Skipping {}: {}", path, e.what());
        }
    }

    int failures = 0;
    nlohmann::json report = nlohmann::json::array();

    for (const auto& [id, future] : started) {
        const auto outcome = future.get();
        if (!outcome.ok) ++failures;

        const auto entry = engine.entry(id);
        if (!entry) continue;

        if (opts.json) {
            report.push_back(nlohmann::json(*entry));
            continue;
        }

        std::scoped_lock lock(outMutex);
        if (outcome.ok) fmt::print("{}: {}\n", entry->displayName, outcome.url);
        else fmt::print(stderr, "{}: {}\n", entry->displayName, outcome.message);
    }

    engine.waitAll();

    if (opts.json) fmt::print("{}\n", report.dump(2));

    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int dispatch(FastDrop& engine, const Options& opts) {
    const auto& args = opts.args;
    const auto& cmd = args.front();

    if (cmd == "credentials") return runCredentials(engine, args);
    if (cmd == "autocopy")
        return runToggle(args, "autocopy",
                         [&] { return engine.getAutoCopy(); },
                         [&](const bool v) { return engine.setAutoCopy(v); });
    if (cmd == "autostart")
        return runToggle(args, "autostart",
                         [&] { return engine.getAutoStart(); },
                         [&](const bool v) { return engine.setAutoStart(v); });
    if (cmd == "provider") return runProvider(engine, args);
    if (cmd == "notify") return runNotify(engine, args);

    return runUploads(engine, opts);
}

}

int main(const int argc, char** argv) {
    Options opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        fmt::print(stderr, "fastdrop: {}\n", e.what());
        printUsage();
        return EXIT_USAGE;
    }

    if (opts.version) {
        fmt::print("fastdrop {}\n", FastDrop::version());
        return EXIT_SUCCESS;
    }

    if (opts.args.empty()) {
        printUsage();
        return EXIT_USAGE;
    }

    try {
        ConfigRegistry::init(loadConfig(opts.configPath ? std::filesystem::path(*opts.configPath)
                                                        : fdrop::paths::getConfigPath()));
        LogRegistry::init(ConfigRegistry::get().logDir());
    } catch (const std::exception& e) {
        fmt::print(stderr, "fastdrop: failed to initialize: {}\n", e.what());
        return EXIT_FAILURE;
    }

    // Helper processes (clipboard, notify-send) may exit before reading their input.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        const auto engine = FastDrop::createDefault(ConfigRegistry::get(), opts.notify);
        if (opts.provider) engine->overrideProvider(*opts.provider);

        LogRegistry::fastdrop()->info("[*] FastDrop {} starting ({})", FastDrop::version(), opts.args.front());
        const int rc = dispatch(*engine, opts);
        LogRegistry::fastdrop()->info("[✓] FastDrop exiting with status {}", rc);
        return rc;
    } catch (const std::exception& e) {
        LogRegistry::fastdrop()->error("[-] {}", e.what());
        fmt::print(stderr, "fastdrop: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
