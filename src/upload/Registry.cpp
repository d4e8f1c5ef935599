#include "upload/Registry.hpp"
#include "util/paths.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

using namespace fdrop::upload;
using namespace fdrop::types;
using namespace fdrop::logging;

EntryId Registry::add(const std::string& path) {
    if (path.empty()) throw std::invalid_argument("Cannot add an upload entry for an empty path");
    const auto key = paths::absoluteNormal(path).string();

    std::scoped_lock order(eventMutex_);
    UploadEntry snapshot;
    {
        std::scoped_lock lock(mutex_);
        if (const auto it = byPath_.find(key); it != byPath_.end()) return it->second;

        auto entry = std::make_shared<UploadEntry>(idGen_(), key);
        entries_.push_back(entry);
        byId_.emplace(entry->id, entry);
        byPath_.emplace(key, entry->id);
        snapshot = *entry;
    }

    LogRegistry::upload()->debug("[Registry] Added {} ({})", snapshot.displayName, fdrop::types::to_string(snapshot.id));
    publish(EntryEvent::Added, snapshot);
    return snapshot.id;
}

bool Registry::remove(const EntryId& id) {
    std::scoped_lock order(eventMutex_);
    UploadEntry snapshot;
    {
        std::scoped_lock lock(mutex_);
        const auto it = byId_.find(id);
        if (it == byId_.end()) return false;

        snapshot = *it->second;
        byPath_.erase(it->second->path);
        std::erase(entries_, it->second);
        byId_.erase(it);
    }

    if (snapshot.state == UploadState::Uploading)
        LogRegistry::upload()->info("[Registry] Removed {} while its upload is still in flight", snapshot.displayName);
    publish(EntryEvent::Removed, snapshot);
    return true;
}

std::vector<UploadEntry> Registry::list() const {
    std::scoped_lock lock(mutex_);
    std::vector<UploadEntry> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(*e);
    return out;
}

std::optional<UploadEntry> Registry::get(const EntryId& id) const {
    std::scoped_lock lock(mutex_);
    if (const auto e = lookup(id)) return *e;
    return std::nullopt;
}

size_t Registry::size() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

UploadEntry Registry::begin(const EntryId& id, const ProviderKind provider) {
    std::scoped_lock order(eventMutex_);
    UploadEntry snapshot;
    {
        std::scoped_lock lock(mutex_);
        const auto e = lookup(id);
        if (!e) throw std::out_of_range(fmt::format("No upload entry with id {}", fdrop::types::to_string(id)));
        if (e->state != UploadState::Idle)
            throw std::logic_error(fmt::format("Upload of {} cannot begin from state {}", e->displayName, to_string(e->state)));

        e->state = UploadState::Uploading;
        e->progress = 0;
        e->provider = provider;
        snapshot = *e;
    }

    publish(EntryEvent::Updated, snapshot);
    return snapshot;
}

bool Registry::advance(const EntryId& id, const unsigned int step, const unsigned int cap) {
    std::scoped_lock order(eventMutex_);
    UploadEntry snapshot;
    {
        std::scoped_lock lock(mutex_);
        const auto e = lookup(id);
        if (!e || e->state != UploadState::Uploading) return false;
        if (e->progress >= cap) return true;

        e->progress = std::min(e->progress + step, cap);
        snapshot = *e;
    }

    publish(EntryEvent::Updated, snapshot);
    return true;
}

bool Registry::succeed(const EntryId& id, const std::string& url) {
    std::scoped_lock order(eventMutex_);
    UploadEntry snapshot;
    {
        std::scoped_lock lock(mutex_);
        const auto e = lookup(id);
        if (!e || e->state != UploadState::Uploading) return false;

        e->state = UploadState::Success;
        e->progress = 100;
        e->resultUrl = url;
        e->errorMessage.reset();
        snapshot = *e;
    }

    publish(EntryEvent::Updated, snapshot);
    return true;
}

bool Registry::fail(const EntryId& id, const std::string& message) {
    std::scoped_lock order(eventMutex_);
    UploadEntry snapshot;
    {
        std::scoped_lock lock(mutex_);
        const auto e = lookup(id);
        if (!e || e->state != UploadState::Uploading) return false;

        e->state = UploadState::Error;
        e->progress = 0;
        e->errorMessage = message;
        e->resultUrl.reset();
        snapshot = *e;
    }

    publish(EntryEvent::Updated, snapshot);
    return true;
}

void Registry::subscribe(Listener listener) {
    std::scoped_lock lock(listenersMutex_);
    listeners_.push_back(std::move(listener));
}

std::shared_ptr<UploadEntry> Registry::lookup(const EntryId& id) const {
    const auto it = byId_.find(id);
    return it == byId_.end() ? nullptr : it->second;
}

void Registry::publish(const EntryEvent event, const UploadEntry& snapshot) const {
    std::vector<Listener> listeners;
    {
        std::scoped_lock lock(listenersMutex_);
        listeners = listeners_;
    }

    for (const auto& listener : listeners) {
        try {
            listener(event, snapshot);
        } catch (const std::exception& e) {
            LogRegistry::upload()->error("[Registry] Listener failed for {}: {}", snapshot.displayName, e.what());
        }
    }
}
