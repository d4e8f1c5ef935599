#pragma once

#include "types/UploadEntry.hpp"

#include <boost/uuid/random_generator.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace fdrop::upload {

enum class EntryEvent { Added, Updated, Removed };

// Owns every upload entry of the session.
//
// All mutations are serialised under one lock. The transitions used by the
// orchestrator (advance, succeed, fail) look the entry up by id and return
// false when it has been removed in the meantime, which makes a late
// completion a no-op.
//
// Listeners receive events in the order the mutations happened: a mutation
// and the delivery of its event form one step under the event lock. Listeners
// may call back into the registry from the delivering thread.
class Registry {
public:
    using Listener = std::function<void(EntryEvent, const types::UploadEntry&)>;

    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Idempotent: returns the existing id when the path is already tracked.
    // Paths are keyed by their absolute, lexically normalised form.
    // Throws std::invalid_argument for an empty path.
    types::EntryId add(const std::string& path);

    bool remove(const types::EntryId& id);

    // Snapshots in insertion order.
    [[nodiscard]] std::vector<types::UploadEntry> list() const;

    [[nodiscard]] std::optional<types::UploadEntry> get(const types::EntryId& id) const;
    [[nodiscard]] size_t size() const;

    // Idle -> Uploading. Throws std::out_of_range for an unknown id and
    // std::logic_error when the entry already left Idle.
    types::UploadEntry begin(const types::EntryId& id, types::ProviderKind provider);

    // Adds step while Uploading, never past cap and never backwards.
    bool advance(const types::EntryId& id, unsigned int step, unsigned int cap);

    // Uploading -> Success with progress 100.
    bool succeed(const types::EntryId& id, const std::string& url);

    // Uploading -> Error with progress 0.
    bool fail(const types::EntryId& id, const std::string& message);

    void subscribe(Listener listener);

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<types::UploadEntry>> entries_;
    std::map<types::EntryId, std::shared_ptr<types::UploadEntry>> byId_;
    std::unordered_map<std::string, types::EntryId> byPath_;
    boost::uuids::random_generator idGen_;

    std::recursive_mutex eventMutex_;

    mutable std::mutex listenersMutex_;
    std::vector<Listener> listeners_;

    std::shared_ptr<types::UploadEntry> lookup(const types::EntryId& id) const;

    void publish(EntryEvent event, const types::UploadEntry& snapshot) const;
};

}
