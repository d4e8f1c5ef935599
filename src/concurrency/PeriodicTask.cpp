#include "concurrency/PeriodicTask.hpp"
#include "logging/LogRegistry.hpp"

using namespace fdrop::concurrency;
using namespace fdrop::logging;

PeriodicTask::PeriodicTask(std::string name, const std::chrono::milliseconds interval, std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {}

PeriodicTask::~PeriodicTask() {
    stop(); // ensure cleanup
}

void PeriodicTask::start() {
    if (isRunning()) return;

    {
        std::scoped_lock lock(mutex_);
        stopRequested_ = false;
    }
    running_.store(true);
    worker_ = std::thread([this] { runLoop(); });
}

void PeriodicTask::stop() {
    {
        std::scoped_lock lock(mutex_);
        stopRequested_ = true;
    }
    cv_.notify_all();

    // Only join if we're not calling stop() from the tick itself
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false);
}

void PeriodicTask::runLoop() {
    std::unique_lock lock(mutex_);
    while (!stopRequested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stopRequested_; })) break;

        lock.unlock();
        try {
            fn_();
        } catch (const std::exception& e) {
            LogRegistry::upload()->error("[{}] Tick failed: {}", name_, e.what());
        }
        lock.lock();
    }
}
