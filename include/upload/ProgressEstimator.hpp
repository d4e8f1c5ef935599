#pragma once

#include "concurrency/PeriodicTask.hpp"
#include "config/Config.hpp"
#include "types/UploadEntry.hpp"

#include <chrono>
#include <memory>

namespace fdrop::upload {

class Registry;

struct ProgressSettings {
    std::chrono::milliseconds interval{200};
    unsigned int step = 10;
    unsigned int cap = 90;

    static ProgressSettings from(const config::UploadsConfig& cfg);
};

// Synthetic progress for one Uploading entry. Ticking starts on construction
// and stops for good on stop() or destruction, whichever comes first.
class ProgressEstimator {
public:
    ProgressEstimator(std::shared_ptr<Registry> registry, const types::EntryId& id, const ProgressSettings& settings);
    ~ProgressEstimator();

    ProgressEstimator(const ProgressEstimator&) = delete;
    ProgressEstimator& operator=(const ProgressEstimator&) = delete;

    void stop();

private:
    concurrency::PeriodicTask ticker_;
};

}
