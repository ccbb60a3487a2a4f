#include "assetcdn/download_orchestrator.hpp"
#include "assetcdn/log.hpp"
#include "assetcdn/metrics.hpp"

#include <meridian/core/thread_pool.hpp>

#include <algorithm>
#include <numeric>
#include <optional>

namespace assetcdn {

namespace {

double clamp_progress(double value) {
    if (!(value >= 0.0)) return 0.0;  // also catches NaN
    return value > 1.0 ? 1.0 : value;
}

size_t slot(DownloadPriority p) {
    return static_cast<size_t>(p);
}

}  // namespace

DownloadOrchestrator::DownloadOrchestrator(StorageEngine& engine, HandleRepository& repository,
                                           MetricsExporter* metrics)
    : DownloadOrchestrator(engine, repository, Options{}, metrics) {}

DownloadOrchestrator::DownloadOrchestrator(StorageEngine& engine, HandleRepository& repository,
                                           const Options& options, MetricsExporter* metrics)
    : engine_(engine)
    , repository_(repository)
    , metrics_(metrics)
    , caps_(options.caps) {
    size_t threads = options.worker_threads;
    if (threads == 0) {
        threads = std::accumulate(caps_.begin(), caps_.end(), size_t{0});
    }
    pool_ = std::make_unique<meridian::ThreadPool>(std::max<size_t>(threads, 1));
    repository_.attach_tracker(this);
}

DownloadOrchestrator::~DownloadOrchestrator() {
    stop();
}

std::shared_future<DownloadResult> DownloadOrchestrator::resolved(const DownloadResult& result) {
    std::promise<DownloadResult> promise;
    promise.set_value(result);
    return promise.get_future().share();
}

std::shared_future<DownloadResult> DownloadOrchestrator::finish_without_job(
        const std::string& key, const DownloadResult& result,
        const ProgressSink& progress, const CompletionCallback& on_complete) {
    if (result.success && progress) progress(1.0);
    if (on_complete) on_complete(result);
    log_debug("Download %s resolved without a job (%s)", key.c_str(),
              result.success ? "cached" : to_string(result.error));
    return resolved(result);
}

std::shared_future<DownloadResult> DownloadOrchestrator::queue_download(
        const std::string& key, DownloadPriority priority, const CancellationToken& caller,
        ProgressSink progress, CompletionCallback on_complete) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.requests++;
    }

    if (key.empty()) {
        log_error("queue_download: empty key rejected");
        DownloadResult r;
        r.error = ErrorKind::NotFound;
        r.error_message = "Empty key";
        return finish_without_job(key, r, progress, on_complete);
    }

    if (stopping_) {
        DownloadResult r;
        r.cancelled = true;
        r.error = ErrorKind::Cancelled;
        r.error_message = "Orchestrator stopped";
        return finish_without_job(key, r, progress, on_complete);
    }

    std::vector<JobPtr> to_start;
    std::shared_future<DownloadResult> future;
    bool joined = false;
    JobPtr job;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(key);
        if (it != jobs_.end()) {
            job = it->second;
            joined = true;
            stats_.coalesced++;

            escalate_locked(job, priority, to_start);
            if (on_complete) job->callbacks.push_back(std::move(on_complete));
            future = job->future;
        }
    }

    if (joined) {
        if (metrics_) metrics_->requests_coalesced().Increment();
        if (progress) {
            std::lock_guard<std::mutex> sink_lock(job->sink_mutex);
            progress(job->progress.load());
            job->sinks.push_back(std::move(progress));
        }
        dispatch(to_start);
        return future;
    }

    // Engine lookups happen outside the orchestrator lock
    if (engine_.is_cached(key)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.cache_hits++;
        }
        if (metrics_) metrics_->cache_hits().Increment();
        DownloadResult r;
        r.success = true;
        return finish_without_job(key, r, progress, on_complete);
    }

    if (!engine_.is_known(key)) {
        log_error("Unknown content key: %s", key.c_str());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.not_found++;
        }
        DownloadResult r;
        r.error = ErrorKind::NotFound;
        r.error_message = "Unknown key: " + key;
        return finish_without_job(key, r, progress, on_complete);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(key);
        if (it != jobs_.end()) {
            // Another caller created the job while we consulted the engine
            job = it->second;
            stats_.coalesced++;
            joined = true;
            escalate_locked(job, priority, to_start);
        } else {
            job = std::make_shared<Job>(caller);
            job->key = key;
            job->priority = priority;
            job->future = job->promise.get_future().share();
            jobs_.emplace(key, job);
            queues_[slot(priority)].push_back(job);
            pump_locked(to_start);
        }
        if (on_complete) job->callbacks.push_back(std::move(on_complete));
        future = job->future;
    }

    if (joined && metrics_) metrics_->requests_coalesced().Increment();
    if (progress) {
        std::lock_guard<std::mutex> sink_lock(job->sink_mutex);
        if (joined) progress(job->progress.load());
        job->sinks.push_back(std::move(progress));
    }

    if (!joined) {
        log_debug("Queued %s at %s priority", key.c_str(), to_string(priority));
    }
    dispatch(to_start);
    return future;
}

void DownloadOrchestrator::escalate_locked(const JobPtr& job, DownloadPriority priority,
                                           std::vector<JobPtr>& to_start) {
    if (priority <= job->priority) return;
    log_debug("Escalating %s from %s to %s", job->key.c_str(),
              to_string(job->priority), to_string(priority));
    if (job->running) {
        // Running jobs keep their slot; only the label changes
        job->priority = priority;
        return;
    }
    // A cancelled job may already be out of its queue and about to complete
    if (job->completed || job->cancel.is_cancelled() || !remove_queued_locked(job)) return;
    job->priority = priority;
    queues_[slot(priority)].push_back(job);
    pump_locked(to_start);
}

bool DownloadOrchestrator::remove_queued_locked(const JobPtr& job) {
    auto& queue = queues_[slot(job->priority)];
    auto it = std::find(queue.begin(), queue.end(), job);
    if (it == queue.end()) return false;
    queue.erase(it);
    return true;
}

void DownloadOrchestrator::pump_locked(std::vector<JobPtr>& to_start) {
    if (stopping_) return;
    for (size_t p = kPriorityLevels; p-- > 0;) {
        auto& queue = queues_[p];
        while (!queue.empty() && running_[p] < caps_[p]) {
            auto job = queue.front();
            queue.pop_front();
            job->running = true;
            job->dispatched = job->priority;
            running_[p]++;
            stats_.fetches_started++;
            to_start.push_back(std::move(job));
        }
    }
}

void DownloadOrchestrator::dispatch(std::vector<JobPtr>& to_start) {
    for (auto& job : to_start) {
        if (pool_->is_stopping()) {
            DownloadResult r;
            r.cancelled = true;
            r.error = ErrorKind::Cancelled;
            r.error_message = "Orchestrator stopped";
            complete(job, std::move(r));
            continue;
        }
        pool_->execute([this, job] { run_job(job); });
    }
    to_start.clear();
}

void DownloadOrchestrator::report_progress(const JobPtr& job, double value) {
    value = clamp_progress(value);

    // Monotonic: only ever move forward
    double current = job->progress.load();
    while (value > current && !job->progress.compare_exchange_weak(current, value)) {
    }
    if (value < current) return;

    std::lock_guard<std::mutex> sink_lock(job->sink_mutex);
    for (auto& sink : job->sinks) {
        sink(value);
    }
}

void DownloadOrchestrator::run_job(const JobPtr& job) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->fetch_duration());

    DownloadPriority priority;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        priority = job->priority;
    }

    log_debug("Fetching %s (%s)", job->key.c_str(), to_string(priority));

    FetchOutcome outcome;
    try {
        outcome = engine_.fetch_and_cache(job->key, priority, job->cancel.token(),
                                          [this, &job](double value) { report_progress(job, value); });
    } catch (const std::exception& e) {
        log_error("Storage engine threw while fetching %s: %s", job->key.c_str(), e.what());
        outcome = FetchOutcome::failed(ErrorKind::Backend, e.what());
    }

    if (outcome.status == FetchStatus::Failed && job->cancel.is_cancelled()) {
        outcome = FetchOutcome::cancelled();
    }

    DownloadResult result;
    result.bytes = outcome.bytes;
    switch (outcome.status) {
    case FetchStatus::Succeeded:
        result.success = true;
        break;
    case FetchStatus::Cancelled:
        result.cancelled = true;
        result.error = ErrorKind::Cancelled;
        result.error_message = outcome.error_message.empty() ? "Cancelled" : outcome.error_message;
        break;
    case FetchStatus::Failed:
        result.error = outcome.error == ErrorKind::None ? ErrorKind::Backend : outcome.error;
        result.error_message = outcome.error_message;
        break;
    }

    complete(job, std::move(result));
}

void DownloadOrchestrator::complete(const JobPtr& job, DownloadResult result) {
    std::vector<JobPtr> to_start;
    std::vector<CompletionCallback> callbacks;
    std::vector<CompletionListener> listeners;
    bool duplicate = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job->running) {
            running_[slot(job->dispatched)]--;
            job->running = false;
        }
        if (job->completed) {
            // A cancel and a worker can both finish the same job; first one wins
            duplicate = true;
        } else {
            job->completed = true;
            auto it = jobs_.find(job->key);
            if (it != jobs_.end() && it->second == job) {
                jobs_.erase(it);
            }
            if (result.success) {
                stats_.fetches_succeeded++;
            } else if (result.cancelled) {
                stats_.fetches_cancelled++;
            } else {
                stats_.fetches_failed++;
            }
            callbacks.swap(job->callbacks);
            listeners = listeners_;
        }
        pump_locked(to_start);
    }
    dispatch(to_start);
    if (duplicate) return;

    if (result.success) {
        report_progress(job, 1.0);
        log_debug("Downloaded %s (%llu bytes)", job->key.c_str(),
                  static_cast<unsigned long long>(result.bytes));
        if (metrics_) metrics_->downloads_success().Increment();
    } else if (result.cancelled) {
        log_info("Download cancelled: %s", job->key.c_str());
        if (metrics_) metrics_->downloads_cancelled().Increment();
    } else {
        log_error("Download failed: %s (%s: %s)", job->key.c_str(),
                  to_string(result.error), result.error_message.c_str());
        if (metrics_) metrics_->downloads_failure().Increment();
    }

    job->promise.set_value(result);

    for (auto& cb : callbacks) {
        cb(result);
    }
    for (auto& listener : listeners) {
        listener(job->key, result);
    }
}

bool DownloadOrchestrator::pre_download_asset(const std::string& key, DownloadPriority priority,
                                              ProgressSink progress,
                                              const CancellationToken& caller) {
    return queue_download(key, priority, caller, std::move(progress)).get().success;
}

bool DownloadOrchestrator::pre_download_assets(const std::vector<std::string>& keys,
                                               DownloadPriority priority, KeyProgress progress,
                                               const CancellationToken& caller) {
    std::vector<std::shared_future<DownloadResult>> futures;
    futures.reserve(keys.size());
    for (const auto& key : keys) {
        ProgressSink sink;
        if (progress) {
            sink = [progress, key](double value) { progress(key, value); };
        }
        futures.push_back(queue_download(key, priority, caller, std::move(sink)));
    }

    bool all_ok = true;
    for (auto& f : futures) {
        if (!f.get().success) all_ok = false;
    }
    return all_ok;
}

LoadResult DownloadOrchestrator::queue_download_to_load(const std::string& key,
                                                        DownloadPriority priority,
                                                        bool auto_unload,
                                                        const CancellationToken& caller) {
    LoadResult lr;
    // A fetch of another key can evict this bundle between download and
    // load, so a NotFound load gets one more download.
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto downloaded = queue_download(key, priority, caller).get();
        if (!downloaded.success) {
            lr = LoadResult{};
            lr.error = downloaded.error;
            lr.error_message = downloaded.error_message;
            return lr;
        }

        std::lock_guard<std::mutex> load_lock(load_mutex_);
        ResourceHandle existing;
        if (repository_.try_get_handle(key, existing)) {
            lr = LoadResult{};
            lr.success = true;
            lr.handle = existing;
            return lr;
        }

        try {
            lr = engine_.load(key);
        } catch (const std::exception& e) {
            log_error("Storage engine threw while loading %s: %s", key.c_str(), e.what());
            lr = LoadResult{};
            lr.error = ErrorKind::Backend;
            lr.error_message = e.what();
        }
        if (!lr.handle) lr.success = false;
        if (lr.success) {
            repository_.add_handle(key, lr.handle, auto_unload);
            break;
        }
        if (lr.error != ErrorKind::NotFound || caller.is_cancelled()) break;
        log_warn("%s was evicted before it could be loaded, downloading again", key.c_str());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lr.success) {
            stats_.loads++;
        } else {
            stats_.load_failures++;
        }
    }
    if (!lr.success) {
        log_error("Load failed for %s: %s", key.c_str(), lr.error_message.c_str());
    }
    return lr;
}

bool DownloadOrchestrator::unload_handle(const std::string& key) {
    return repository_.remove_handle(key);
}

size_t DownloadOrchestrator::unload_auto_unload_handles() {
    return repository_.unload_auto_unload_handles();
}

double DownloadOrchestrator::get_download_status(const std::string& key) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(key);
        if (it != jobs_.end()) return it->second->progress.load();
    }
    return engine_.is_cached(key) ? 1.0 : 0.0;
}

uint64_t DownloadOrchestrator::get_download_size(const std::string& key) const {
    return engine_.download_size(key);
}

AssetInfo DownloadOrchestrator::get_asset_info(const std::string& key) const {
    AssetInfo info;
    if (!engine_.is_known(key)) return info;
    info.exists = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(key);
        if (it != jobs_.end()) {
            info.in_progress = true;
            info.progress = it->second->progress.load();
        }
    }

    if (engine_.is_cached(key)) {
        info.progress = 1.0;
        info.size_bytes = 0;
    } else {
        info.size_bytes = engine_.download_size(key);
    }
    return info;
}

QueueStatus DownloadOrchestrator::get_queue_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueStatus s;
    for (size_t p = 0; p < kPriorityLevels; ++p) {
        s.active += running_[p];
        s.queued += queues_[p].size();
    }
    return s;
}

bool DownloadOrchestrator::cancel_download(const std::string& key) {
    JobPtr queued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(key);
        if (it == jobs_.end()) return false;
        auto job = it->second;
        job->cancel.cancel();
        if (!job->running && remove_queued_locked(job)) {
            queued = job;
        }
    }

    log_info("Cancel requested for %s", key.c_str());
    if (queued) {
        DownloadResult r;
        r.cancelled = true;
        r.error = ErrorKind::Cancelled;
        r.error_message = "Cancelled before start";
        complete(queued, std::move(r));
    }
    return true;
}

size_t DownloadOrchestrator::cancel_all_downloads() {
    std::vector<JobPtr> queued;
    size_t signalled = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, job] : jobs_) {
            job->cancel.cancel();
            signalled++;
        }
        for (auto& queue : queues_) {
            for (auto& job : queue) queued.push_back(job);
            queue.clear();
        }
    }

    if (signalled > 0) {
        log_info("Cancelling %zu download(s)", signalled);
    }
    for (auto& job : queued) {
        DownloadResult r;
        r.cancelled = true;
        r.error = ErrorKind::Cancelled;
        r.error_message = "Cancelled before start";
        complete(job, std::move(r));
    }
    return signalled;
}

void DownloadOrchestrator::set_concurrency(DownloadPriority priority, size_t max_concurrent) {
    std::vector<JobPtr> to_start;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        caps_[slot(priority)] = max_concurrent;
        pump_locked(to_start);
    }
    dispatch(to_start);
}

void DownloadOrchestrator::add_completion_listener(CompletionListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

bool DownloadOrchestrator::is_active(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.count(key) > 0;
}

void DownloadOrchestrator::stop() {
    {
        // Under the lock so no pump can hand out work after this point
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }

    cancel_all_downloads();
    pool_->shutdown(true);

    // Anything dispatched after the pool stopped accepting work
    std::vector<JobPtr> leftover;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, job] : jobs_) leftover.push_back(job);
    }
    for (auto& job : leftover) {
        DownloadResult r;
        r.cancelled = true;
        r.error = ErrorKind::Cancelled;
        r.error_message = "Orchestrator stopped";
        complete(job, std::move(r));
    }

    repository_.attach_tracker(nullptr);
}

DownloadOrchestrator::Stats DownloadOrchestrator::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace assetcdn
