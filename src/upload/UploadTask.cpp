#include "upload/UploadTask.hpp"
#include "upload/Registry.hpp"
#include "cloud/Provider.hpp"
#include "cloud/ProviderFactory.hpp"
#include "notify/Dispatcher.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <fstream>
#include <iterator>

using namespace fdrop::upload;
using namespace fdrop::types;
using namespace fdrop::logging;

namespace {

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw UploadError(UploadError::Kind::Unknown, "Failed to open file for upload: " + path);

    std::vector<uint8_t> buf(std::istreambuf_iterator<char>(in), {});
    if (in.bad()) throw UploadError(UploadError::Kind::Unknown, "Failed to read file for upload: " + path);
    return buf;
}

}

UploadTask::UploadTask(std::shared_ptr<Registry> registry,
                       std::shared_ptr<cloud::ProviderFactory> providers,
                       std::shared_ptr<notify::Dispatcher> dispatcher,
                       UploadEntry entry,
                       const ProgressSettings progress)
    : registry(std::move(registry)),
      providers(std::move(providers)),
      dispatcher(std::move(dispatcher)),
      entry(std::move(entry)),
      progress(progress) {}

void UploadTask::operator()() { complete(run()); }

void UploadTask::abandon(const std::string& reason) {
    complete(UploadOutcome::failure(UploadError::Kind::Unknown, describe(UploadError::Kind::Unknown, reason)));
}

void UploadTask::complete(const UploadOutcome& outcome) {
    try {
        finish(outcome);
    } catch (const std::exception& e) {
        LogRegistry::upload()->error("[UploadTask] Failed to record result for {}: {}", entry.displayName, e.what());
    }

    promise.set_value(outcome);
}

UploadOutcome UploadTask::run() const {
    try {
        std::string url;
        {
            ProgressEstimator estimator(registry, entry.id, progress);
            const auto bytes = readFile(entry.path);
            const auto provider = providers->create(entry.provider.value_or(ProviderKind::AnonymousHost));
            url = provider->upload(bytes, entry.displayName);
        }
        return UploadOutcome::success(url);
    } catch (const UploadError& e) {
        return UploadOutcome::failure(e.kind(), e.describe());
    } catch (const std::exception& e) {
        return UploadOutcome::failure(UploadError::Kind::Unknown,
                                      describe(UploadError::Kind::Unknown, fmt::format("Upload failed: {}", e.what())));
    }
}

void UploadTask::finish(const UploadOutcome& outcome) const {
    if (outcome.ok) {
        if (!registry->succeed(entry.id, outcome.url)) {
            LogRegistry::upload()->info("[UploadTask] {} finished after its entry was removed, dropping result",
                                        entry.displayName);
            return;
        }
        LogRegistry::upload()->info("[UploadTask] {} uploaded: {}", entry.displayName, outcome.url);
        if (dispatcher) dispatcher->onSuccess(entry.displayName, outcome.url);
        return;
    }

    if (!registry->fail(entry.id, outcome.message)) {
        LogRegistry::upload()->info("[UploadTask] {} failed after its entry was removed: {}",
                                    entry.displayName, outcome.message);
        return;
    }
    LogRegistry::upload()->warn("[UploadTask] {} failed: {}", entry.displayName, outcome.message);
}
