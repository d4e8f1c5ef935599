#pragma once

#include "concurrency/Task.hpp"
#include "types/UploadEntry.hpp"
#include "upload/ProgressEstimator.hpp"

#include <memory>
#include <string>

namespace fdrop::cloud { class ProviderFactory; }
namespace fdrop::notify { class Dispatcher; }

namespace fdrop::upload {

class Registry;

// One upload, from reading the file to the terminal transition.
struct UploadTask final : concurrency::PromisedTask<types::UploadOutcome> {
    std::shared_ptr<Registry> registry;
    std::shared_ptr<cloud::ProviderFactory> providers;
    std::shared_ptr<notify::Dispatcher> dispatcher;
    types::UploadEntry entry;       // snapshot taken when the entry entered Uploading
    ProgressSettings progress;

    UploadTask(std::shared_ptr<Registry> registry,
               std::shared_ptr<cloud::ProviderFactory> providers,
               std::shared_ptr<notify::Dispatcher> dispatcher,
               types::UploadEntry entry,
               ProgressSettings progress);

    void operator()() override;

    // Ends the upload as an Unknown error without running it.
    void abandon(const std::string& reason);

private:
    [[nodiscard]] types::UploadOutcome run() const;
    void complete(const types::UploadOutcome& outcome);
    void finish(const types::UploadOutcome& outcome) const;
};

}
