#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace assetcdn {

class BundleCache;
class DownloadOrchestrator;
class HandleRepository;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports assetcdn metrics to a Prometheus textfile for node_exporter pickup.
///
/// A background writer thread periodically serializes the registry to a
/// .prom file using temp+rename.
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Sources for gauge snapshots (not owned, may be null).
    void set_orchestrator(const DownloadOrchestrator* orchestrator) { orchestrator_ = orchestrator; }
    void set_repository(const HandleRepository* repository) { repository_ = repository; }
    void set_cache(const BundleCache* cache) { cache_ = cache; }

    void start();

    /// Stop the writer thread and write one final snapshot.
    void stop();

    /// Serialize and write the registry now.
    bool write_file();

    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& downloads_cancelled() { return *downloads_cancelled_; }
    prometheus::Counter& requests_coalesced() { return *requests_coalesced_; }
    prometheus::Counter& cache_hits() { return *cache_hits_; }
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& objects_deleted() { return *objects_deleted_; }
    prometheus::Counter& multipart_aborted() { return *multipart_aborted_; }

    prometheus::Histogram& fetch_duration() { return *fetch_duration_; }
    prometheus::Histogram& upload_duration() { return *upload_duration_; }

private:
    void writer_loop();
    void update_gauges();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    const DownloadOrchestrator* orchestrator_ = nullptr;
    const HandleRepository* repository_ = nullptr;
    const BundleCache* cache_ = nullptr;

    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* downloads_cancelled_;
    prometheus::Counter* requests_coalesced_;
    prometheus::Counter* cache_hits_;
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* objects_deleted_;
    prometheus::Counter* multipart_aborted_;

    prometheus::Gauge* downloads_active_;
    prometheus::Gauge* downloads_queued_;
    prometheus::Gauge* handles_loaded_;
    prometheus::Gauge* cache_bytes_;

    prometheus::Histogram* fetch_duration_;
    prometheus::Histogram* upload_duration_;

    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    std::mutex write_mutex_;
};

}  // namespace assetcdn
