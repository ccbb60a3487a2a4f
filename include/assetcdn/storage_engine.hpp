#pragma once

#include "assetcdn/cancellation.hpp"
#include "assetcdn/error.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace assetcdn {

/// Scheduling priority. Higher values are serviced first.
enum class DownloadPriority {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3,
};

constexpr size_t kPriorityLevels = 4;

const char* to_string(DownloadPriority priority);

/// Case-insensitive parse. Returns false on an unrecognised name.
bool parse_priority(const std::string& name, DownloadPriority& out);

enum class FetchStatus {
    Succeeded,
    Failed,
    Cancelled,
};

struct FetchOutcome {
    FetchStatus status = FetchStatus::Failed;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    uint64_t bytes = 0;

    static FetchOutcome ok(uint64_t bytes) { return {FetchStatus::Succeeded, ErrorKind::None, {}, bytes}; }
    static FetchOutcome cancelled() { return {FetchStatus::Cancelled, ErrorKind::Cancelled, "Cancelled", 0}; }
    static FetchOutcome failed(ErrorKind kind, std::string message) {
        return {FetchStatus::Failed, kind, std::move(message), 0};
    }
};

/// Receives fractional progress in [0,1]. May be called from worker threads.
using ProgressSink = std::function<void(double)>;

/// An in-memory resource produced by StorageEngine::load.
class LoadedResource {
public:
    virtual ~LoadedResource() = default;
    virtual const std::string& key() const = 0;
    virtual uint64_t size_bytes() const = 0;
};

using ResourceHandle = std::shared_ptr<LoadedResource>;

struct LoadResult {
    bool success = false;
    ResourceHandle handle;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};

/// The component that resolves a key to bytes on local storage and turns
/// cached bytes into loaded resources. The download orchestrator drives it.
///
/// fetch_and_cache must observe `token` at its suspension points and return
/// FetchStatus::Cancelled promptly once it fires. All methods must be safe
/// to call concurrently for different keys.
class StorageEngine {
public:
    virtual ~StorageEngine() = default;

    virtual bool is_known(const std::string& key) const = 0;
    virtual bool is_cached(const std::string& key) const = 0;

    /// Bytes still to transfer for `key`. 0 when cached or unknown.
    virtual uint64_t download_size(const std::string& key) const = 0;

    virtual FetchOutcome fetch_and_cache(const std::string& key, DownloadPriority priority,
                                         const CancellationToken& token,
                                         const ProgressSink& progress) = 0;

    virtual LoadResult load(const std::string& key) = 0;
    virtual void release(const ResourceHandle& handle) = 0;
};

}  // namespace assetcdn
