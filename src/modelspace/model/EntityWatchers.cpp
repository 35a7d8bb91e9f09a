#include <modelspace/model/Entity.hpp>
#include <modelspace/model/EntityRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <vector>

namespace MS {

auto Entity::when(WatchPredicate predicate, WatchCallback onTrue, WatchCallback onFalseAfterTrue) -> WatcherHandle {
    WatcherHandle handle = 0;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        handle = nextWatcher_++;
        watchers_.emplace(handle, WatcherRecord{std::move(predicate), std::move(onTrue), std::move(onFalseAfterTrue), {}});
    }
    ms_log("Entity " + std::to_string(id_) + " registered watcher " + std::to_string(handle), "Watcher");

    if (this->isAggregate()) {
        // The aggregate lock is released here: each pass locks the entity first.
        for (auto* entity : registry_.snapshot()) {
            entity->processWatchers(nullptr);
        }
    } else {
        this->processWatchers(nullptr);
    }
    return handle;
}

auto Entity::removeWatcher(WatcherHandle handle) -> bool {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return watchers_.erase(handle) > 0;
}

auto Entity::watcherCount() const -> std::size_t {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return watchers_.size();
}

auto Entity::processWatchers(Payload const& payload) -> void {
    if (this->isAggregate()) {
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    this->runWatchers(*this, payload);
    registry_.aggregate().runWatchers(*this, payload);
}

auto Entity::runWatchers(Entity& subject, Payload const& payload) -> void {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    // Callbacks may add or remove watchers, so walk a copy of the handles.
    std::vector<WatcherHandle> handles;
    handles.reserve(watchers_.size());
    for (auto const& [handle, record] : watchers_) {
        handles.push_back(handle);
    }

    for (auto handle : handles) {
        auto it = watchers_.find(handle);
        if (it == watchers_.end() || !it->second.predicate) {
            continue;
        }
        bool const holds = it->second.predicate(subject);
        it               = watchers_.find(handle);
        if (it == watchers_.end()) {
            continue;
        }
        auto& record  = it->second;
        bool  latched = record.matched.contains(subject.id());
        if (holds && !latched) {
            record.matched.insert(subject.id());
            ms_log("Watcher " + std::to_string(handle) + " became true for " + std::to_string(subject.id()), "Watcher");
            if (auto callback = record.onTrue) {
                callback(subject, payload);
            }
        } else if (!holds && latched) {
            record.matched.erase(subject.id());
            ms_log("Watcher " + std::to_string(handle) + " became false for " + std::to_string(subject.id()), "Watcher");
            if (auto callback = record.onFalseAfterTrue) {
                callback(subject, payload);
            }
        }
    }
}

} // namespace MS
