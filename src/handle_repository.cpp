#include "assetcdn/handle_repository.hpp"
#include "assetcdn/log.hpp"

namespace assetcdn {

HandleRepository::HandleRepository(Releaser releaser) : releaser_(std::move(releaser)) {}

HandleRepository::~HandleRepository() {
    clear_all_handles();
}

void HandleRepository::release(const ResourceHandle& handle) const {
    if (handle && releaser_) releaser_(handle);
}

bool HandleRepository::add_handle(const std::string& key, ResourceHandle handle, bool auto_unload) {
    if (key.empty()) {
        log_error("add_handle: empty key rejected");
        return false;
    }

    ResourceHandle previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = entries_[key];
        if (entry.handle != handle) {
            previous = std::move(entry.handle);
            entry.handle = std::move(handle);
        }
        entry.auto_unload = auto_unload;
    }
    // Release outside the lock; the releaser may call back into the engine
    if (previous) {
        log_debug("Replacing handle for %s", key.c_str());
        release(previous);
    }
    return true;
}

bool HandleRepository::remove_handle(const std::string& key) {
    if (key.empty()) {
        log_error("remove_handle: empty key rejected");
        return false;
    }

    ResourceHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return false;
        handle = std::move(it->second.handle);
        entries_.erase(it);
    }
    release(handle);
    return true;
}

bool HandleRepository::try_get_handle(const std::string& key, ResourceHandle& out) const {
    if (key.empty()) {
        log_error("try_get_handle: empty key rejected");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    out = it->second.handle;
    return true;
}

bool HandleRepository::contains_key(const std::string& key) const {
    if (key.empty()) {
        log_error("contains_key: empty key rejected");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) != 0;
}

bool HandleRepository::is_operation_in_progress(const std::string& key) const {
    if (key.empty()) {
        log_error("is_operation_in_progress: empty key rejected");
        return false;
    }
    const OperationTracker* tracker = tracker_.load();
    return tracker && tracker->is_active(key);
}

std::vector<std::string> HandleRepository::get_auto_unload_keys() const {
    std::vector<std::string> keys;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, entry] : entries_) {
        if (entry.auto_unload) keys.push_back(key);
    }
    return keys;
}

bool HandleRepository::update_auto_unload_flag(const std::string& key, bool auto_unload) {
    if (key.empty()) {
        log_error("update_auto_unload_flag: empty key rejected");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    it->second.auto_unload = auto_unload;
    return true;
}

size_t HandleRepository::unload_auto_unload_handles() {
    std::vector<ResourceHandle> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.auto_unload) {
                released.push_back(std::move(it->second.handle));
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& handle : released) {
        release(handle);
    }
    if (!released.empty()) {
        log_debug("Unloaded %zu auto-unload handles", released.size());
    }
    return released.size();
}

void HandleRepository::clear_all_handles() {
    std::unordered_map<std::string, Entry> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(entries_);
    }
    for (const auto& [key, entry] : drained) {
        release(entry.handle);
    }
}

size_t HandleRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void HandleRepository::attach_tracker(const OperationTracker* tracker) {
    tracker_.store(tracker);
}

}  // namespace assetcdn
