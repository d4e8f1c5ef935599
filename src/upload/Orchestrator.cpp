#include "upload/Orchestrator.hpp"
#include "upload/Registry.hpp"
#include "upload/UploadTask.hpp"
#include "settings/Preferences.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>
#include <system_error>

using namespace fdrop::upload;
using namespace fdrop::types;
using namespace fdrop::logging;

Orchestrator::Orchestrator(std::shared_ptr<Registry> registry,
                           std::shared_ptr<cloud::ProviderFactory> providers,
                           std::shared_ptr<settings::Preferences> preferences,
                           std::shared_ptr<notify::Dispatcher> dispatcher,
                           const ProgressSettings progress)
    : registry_(std::move(registry)),
      providers_(std::move(providers)),
      preferences_(std::move(preferences)),
      dispatcher_(std::move(dispatcher)),
      progress_(progress) {
    if (!registry_) throw std::invalid_argument("Orchestrator requires a registry");
    if (!providers_) throw std::invalid_argument("Orchestrator requires a provider factory");
    if (!preferences_) throw std::invalid_argument("Orchestrator requires preferences");
}

Orchestrator::~Orchestrator() { waitAll(); }

std::shared_future<UploadOutcome> Orchestrator::begin(const EntryId& id) {
    const auto kind = preferences_->selectedProvider();
    auto entry = registry_->begin(id, kind);

    LogRegistry::upload()->info("[Orchestrator] Uploading {} to {}", entry.displayName, to_string(kind));

    const auto task = std::make_shared<UploadTask>(registry_, providers_, dispatcher_, std::move(entry), progress_);
    auto future = task->future();

    const auto done = std::make_shared<std::atomic<bool>>(false);

    std::thread worker;
    try {
        worker = launch([task, done] {
            (*task)();
            done->store(true);
        });
    } catch (const std::system_error& e) {
        LogRegistry::upload()->error("[Orchestrator] Could not start upload of {}: {}", task->entry.displayName, e.what());
        task->abandon(fmt::format("Could not start upload worker: {}", e.what()));
        return future;
    }

    std::scoped_lock lock(mutex_);
    reapFinished();
    workers_.push_back({std::move(worker), done});

    return future;
}

std::thread Orchestrator::launch(std::function<void()> work) { return std::thread(std::move(work)); }

void Orchestrator::waitAll() {
    for (;;) {
        std::vector<Worker> pending;
        {
            std::scoped_lock lock(mutex_);
            pending.swap(workers_);
        }
        if (pending.empty()) return;

        for (auto& w : pending)
            if (w.thread.joinable()) w.thread.join();
    }
}

size_t Orchestrator::inFlight() const {
    std::scoped_lock lock(mutex_);
    return static_cast<size_t>(std::ranges::count_if(workers_, [](const Worker& w) { return !w.done->load(); }));
}

void Orchestrator::reapFinished() {
    std::erase_if(workers_, [](Worker& w) {
        if (!w.done->load()) return false;
        if (w.thread.joinable()) w.thread.join();
        return true;
    });
}
