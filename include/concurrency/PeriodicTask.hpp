#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace fdrop::concurrency {

// Runs fn every interval on its own thread until stopped.
// Once stop() returns no further invocation of fn can happen.
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn);

    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();

    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

private:
    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> fn_;

    std::atomic<bool> running_{false};
    bool stopRequested_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;

    void runLoop();
};

}
