#pragma once

#include <future>

namespace fdrop::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Task that reports its result through a promise; future() may be shared by any number of waiters.
template <typename T>
struct PromisedTask : Task {
    std::promise<T> promise;

    PromisedTask() : future_(promise.get_future().share()) {}

    [[nodiscard]] std::shared_future<T> future() const { return future_; }

private:
    std::shared_future<T> future_;
};

}
