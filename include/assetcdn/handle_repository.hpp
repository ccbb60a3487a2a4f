#pragma once

#include "assetcdn/storage_engine.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace assetcdn {

/// Answers whether an operation is currently active for a key.
/// Implemented by the download orchestrator, which owns that registry.
class OperationTracker {
public:
    virtual ~OperationTracker() = default;
    virtual bool is_active(const std::string& key) const = 0;
};

/// Tracks live resource handles per key and whether each should be released
/// automatically by the next sweep.
///
/// Absence is never an error: operations on a missing or empty key return
/// false or an empty result.
class HandleRepository {
public:
    using Releaser = std::function<void(const ResourceHandle&)>;

    explicit HandleRepository(Releaser releaser);
    ~HandleRepository();

    HandleRepository(const HandleRepository&) = delete;
    HandleRepository& operator=(const HandleRepository&) = delete;

    /// Insert or replace. A different previous handle for `key` is released.
    bool add_handle(const std::string& key, ResourceHandle handle, bool auto_unload);

    /// Release and remove. Returns whether an entry existed.
    bool remove_handle(const std::string& key);

    bool try_get_handle(const std::string& key, ResourceHandle& out) const;
    bool contains_key(const std::string& key) const;

    /// True iff the attached tracker reports an active operation for `key`.
    bool is_operation_in_progress(const std::string& key) const;

    /// Snapshot of keys flagged for automatic release.
    std::vector<std::string> get_auto_unload_keys() const;

    bool update_auto_unload_flag(const std::string& key, bool auto_unload);

    /// Release and remove every auto-unload entry. Returns the number released.
    size_t unload_auto_unload_handles();

    void clear_all_handles();

    size_t size() const;

    void attach_tracker(const OperationTracker* tracker);

private:
    struct Entry {
        ResourceHandle handle;
        bool auto_unload = false;
    };

    void release(const ResourceHandle& handle) const;

    Releaser releaser_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::atomic<const OperationTracker*> tracker_{nullptr};
};

}  // namespace assetcdn
