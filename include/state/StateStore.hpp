#pragma once

#include "state/PersistedState.hpp"

#include <filesystem>
#include <functional>
#include <mutex>

namespace fdrop::state {

class StateStore {
public:
    virtual ~StateStore() = default;

    // Never throws for missing or corrupted state; returns defaults instead.
    [[nodiscard]] virtual PersistedState load() const = 0;

    // Read-modify-write of the whole record. Throws when the write fails.
    virtual void update(const std::function<void(PersistedState&)>& mutate) = 0;
};

class JsonFileStateStore final : public StateStore {
public:
    explicit JsonFileStateStore(std::filesystem::path path);

    [[nodiscard]] PersistedState load() const override;
    void update(const std::function<void(PersistedState&)>& mutate) override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

}
