#pragma once

#include "assetcdn/cancellation.hpp"
#include "assetcdn/constants.hpp"
#include "assetcdn/handle_repository.hpp"
#include "assetcdn/storage_engine.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meridian {
class ThreadPool;
}  // namespace meridian

namespace assetcdn {

class MetricsExporter;

/// Published outcome of one download job. Every caller joined to the job
/// observes the same value.
struct DownloadResult {
    bool success = false;
    bool cancelled = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    uint64_t bytes = 0;
};

/// Consistent snapshot for one key. `exists` is false only for keys the
/// storage engine does not know, in which case progress and size are 0.
struct AssetInfo {
    bool exists = false;
    double progress = 0.0;
    uint64_t size_bytes = 0;
    bool in_progress = false;
};

struct QueueStatus {
    size_t active = 0;
    size_t queued = 0;
};

/// Schedules fetches through a StorageEngine with per-key coalescing,
/// per-priority concurrency caps and cooperative cancellation.
///
/// A key has at most one job at a time, from acceptance until its result is
/// published. Callers requesting a key that already has a job join it and
/// receive the same shared future; the job runs at the highest priority any
/// caller asked for.
///
/// The orchestrator attaches itself to the handle repository as its
/// OperationTracker, so both answer "in progress" from the same registry.
class DownloadOrchestrator : public OperationTracker {
public:
    using CompletionCallback = std::function<void(const DownloadResult&)>;
    using CompletionListener = std::function<void(const std::string& key, const DownloadResult&)>;
    using KeyProgress = std::function<void(const std::string& key, double progress)>;

    struct Options {
        std::array<size_t, kPriorityLevels> caps{
            constants::DEFAULT_CAP_LOW, constants::DEFAULT_CAP_NORMAL,
            constants::DEFAULT_CAP_HIGH, constants::DEFAULT_CAP_CRITICAL};
        size_t worker_threads = 0;  // 0 = sum of caps
    };

    DownloadOrchestrator(StorageEngine& engine, HandleRepository& repository,
                         MetricsExporter* metrics = nullptr);
    DownloadOrchestrator(StorageEngine& engine, HandleRepository& repository,
                         const Options& options, MetricsExporter* metrics = nullptr);
    ~DownloadOrchestrator() override;

    DownloadOrchestrator(const DownloadOrchestrator&) = delete;
    DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;

    /// Request a fetch. Returns immediately. Cached keys and unknown keys
    /// resolve without creating a job. `caller` is linked into the job's
    /// cancellation when this call creates the job.
    std::shared_future<DownloadResult> queue_download(const std::string& key,
                                                      DownloadPriority priority,
                                                      const CancellationToken& caller = {},
                                                      ProgressSink progress = {},
                                                      CompletionCallback on_complete = {});

    /// Fetch into the cache without loading. Blocks until the outcome is known.
    bool pre_download_asset(const std::string& key, DownloadPriority priority,
                            ProgressSink progress = {}, const CancellationToken& caller = {});

    /// Fan out pre_download_asset for every key. Failures are independent.
    /// Returns true only if every key succeeded.
    bool pre_download_assets(const std::vector<std::string>& keys, DownloadPriority priority,
                             KeyProgress progress = {}, const CancellationToken& caller = {});

    /// Fetch, load and register the handle. Blocks until done.
    LoadResult queue_download_to_load(const std::string& key, DownloadPriority priority,
                                      bool auto_unload = true,
                                      const CancellationToken& caller = {});

    bool unload_handle(const std::string& key);
    size_t unload_auto_unload_handles();

    /// 1.0 when cached, live progress while a job exists, 0 otherwise.
    double get_download_status(const std::string& key) const;

    /// Total bytes still to fetch. Transfers are not resumed, so this is the
    /// full bundle size until cached. 0 for cached or unknown keys.
    uint64_t get_download_size(const std::string& key) const;

    AssetInfo get_asset_info(const std::string& key) const;
    QueueStatus get_queue_status() const;

    /// Signal cancellation for the key's job. A queued job is removed and
    /// resolved as cancelled at once. Returns false if no job exists.
    bool cancel_download(const std::string& key);

    /// Returns the number of jobs signalled.
    size_t cancel_all_downloads();

    void set_concurrency(DownloadPriority priority, size_t max_concurrent);

    /// Called once per job after it leaves the registry.
    void add_completion_listener(CompletionListener listener);

    // OperationTracker
    bool is_active(const std::string& key) const override;

    /// Cancel everything, wait for running jobs to unwind and detach from
    /// the repository. Idempotent.
    void stop();

    struct Stats {
        uint64_t requests = 0;
        uint64_t coalesced = 0;
        uint64_t cache_hits = 0;
        uint64_t not_found = 0;
        uint64_t fetches_started = 0;
        uint64_t fetches_succeeded = 0;
        uint64_t fetches_failed = 0;
        uint64_t fetches_cancelled = 0;
        uint64_t loads = 0;
        uint64_t load_failures = 0;
    };
    Stats get_stats() const;

private:
    struct Job {
        std::string key;
        DownloadPriority priority = DownloadPriority::Normal;
        DownloadPriority dispatched = DownloadPriority::Normal;
        bool running = false;
        bool completed = false;  // Guarded by the orchestrator mutex; set once
        CancellationSource cancel;
        std::atomic<double> progress{0.0};

        std::promise<DownloadResult> promise;
        std::shared_future<DownloadResult> future;

        // Guarded by the orchestrator mutex
        std::vector<CompletionCallback> callbacks;

        // Sinks are invoked serially under sink_mutex
        std::mutex sink_mutex;
        std::vector<ProgressSink> sinks;

        explicit Job(const CancellationToken& caller) : cancel(caller) {}
    };
    using JobPtr = std::shared_ptr<Job>;

    static std::shared_future<DownloadResult> resolved(const DownloadResult& result);

    std::shared_future<DownloadResult> finish_without_job(const std::string& key,
                                                          const DownloadResult& result,
                                                          const ProgressSink& progress,
                                                          const CompletionCallback& on_complete);

    void pump_locked(std::vector<JobPtr>& to_start);
    void dispatch(std::vector<JobPtr>& to_start);
    void run_job(const JobPtr& job);
    void report_progress(const JobPtr& job, double value);
    void complete(const JobPtr& job, DownloadResult result);
    void escalate_locked(const JobPtr& job, DownloadPriority priority,
                         std::vector<JobPtr>& to_start);
    bool remove_queued_locked(const JobPtr& job);

    StorageEngine& engine_;
    HandleRepository& repository_;
    MetricsExporter* metrics_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, JobPtr> jobs_;
    std::array<std::deque<JobPtr>, kPriorityLevels> queues_;
    std::array<size_t, kPriorityLevels> caps_;
    std::array<size_t, kPriorityLevels> running_{};
    std::vector<CompletionListener> listeners_;
    Stats stats_;

    std::mutex load_mutex_;
    std::atomic<bool> stopping_{false};
    std::unique_ptr<meridian::ThreadPool> pool_;
};

}  // namespace assetcdn
