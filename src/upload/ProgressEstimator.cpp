#include "upload/ProgressEstimator.hpp"
#include "upload/Registry.hpp"

using namespace fdrop::upload;
using namespace fdrop::types;

ProgressSettings ProgressSettings::from(const config::UploadsConfig& cfg) {
    return {cfg.progress_interval, cfg.progress_step, cfg.progress_cap};
}

ProgressEstimator::ProgressEstimator(std::shared_ptr<Registry> registry, const EntryId& id, const ProgressSettings& settings)
    : ticker_("ProgressEstimator " + fdrop::types::to_string(id), settings.interval,
              [registry = std::move(registry), id, step = settings.step, cap = settings.cap] {
                  registry->advance(id, step, cap);
              }) {
    ticker_.start();
}

ProgressEstimator::~ProgressEstimator() { stop(); }

void ProgressEstimator::stop() { ticker_.stop(); }
