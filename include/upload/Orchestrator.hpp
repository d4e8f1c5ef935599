#pragma once

#include "types/UploadEntry.hpp"
#include "upload/ProgressEstimator.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace fdrop::cloud { class ProviderFactory; }
namespace fdrop::notify { class Dispatcher; }
namespace fdrop::settings { class Preferences; }

namespace fdrop::upload {

class Registry;

// Drives entries through Idle -> Uploading -> {Success | Error}.
//
// Every begin() gets its own worker thread; there is no concurrency limit and
// no ordering between uploads. Uploads cannot be cancelled, so destruction
// waits for the ones still in flight.
class Orchestrator {
public:
    Orchestrator(std::shared_ptr<Registry> registry,
                 std::shared_ptr<cloud::ProviderFactory> providers,
                 std::shared_ptr<settings::Preferences> preferences,
                 std::shared_ptr<notify::Dispatcher> dispatcher,
                 ProgressSettings progress = {});

    virtual ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Throws std::out_of_range for an unknown id, std::logic_error unless the entry is Idle.
    // When no worker can be started the entry ends in Error and the future is already set.
    std::shared_future<types::UploadOutcome> begin(const types::EntryId& id);

    void waitAll();

    [[nodiscard]] size_t inFlight() const;

protected:
    // Starts the worker thread for one upload.
    virtual std::thread launch(std::function<void()> work);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::shared_ptr<Registry> registry_;
    std::shared_ptr<cloud::ProviderFactory> providers_;
    std::shared_ptr<settings::Preferences> preferences_;
    std::shared_ptr<notify::Dispatcher> dispatcher_;
    ProgressSettings progress_;

    mutable std::mutex mutex_;
    std::vector<Worker> workers_;

    void reapFinished();
};

}
