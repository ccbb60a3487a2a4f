#include "assetcdn/metrics.hpp"
#include "assetcdn/bundle_cache.hpp"
#include "assetcdn/download_orchestrator.hpp"
#include "assetcdn/handle_repository.hpp"
#include "assetcdn/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace assetcdn {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    auto& downloads_family = prometheus::BuildCounter()
        .Name("assetcdn_downloads_total")
        .Help("Download jobs finished, by result")
        .Labels(labels)
        .Register(*registry_);
    downloads_success_ = &downloads_family.Add({{"result", "success"}});
    downloads_failure_ = &downloads_family.Add({{"result", "failure"}});
    downloads_cancelled_ = &downloads_family.Add({{"result", "cancelled"}});

    auto& requests_family = prometheus::BuildCounter()
        .Name("assetcdn_download_requests_total")
        .Help("Download requests served without a new fetch")
        .Labels(labels)
        .Register(*registry_);
    requests_coalesced_ = &requests_family.Add({{"type", "coalesced"}});
    cache_hits_ = &requests_family.Add({{"type", "cache_hit"}});

    auto& uploads_family = prometheus::BuildCounter()
        .Name("assetcdn_uploads_total")
        .Help("Files uploaded, by result")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("assetcdn_upload_bytes_total")
        .Help("Total bytes uploaded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    objects_deleted_ = &prometheus::BuildCounter()
        .Name("assetcdn_objects_deleted_total")
        .Help("Objects deleted from buckets")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    multipart_aborted_ = &prometheus::BuildCounter()
        .Name("assetcdn_multipart_uploads_aborted_total")
        .Help("Incomplete multipart uploads aborted by cleanup")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    downloads_active_ = &gauge_reg("assetcdn_downloads_active", "Download jobs running");
    downloads_queued_ = &gauge_reg("assetcdn_downloads_queued", "Download jobs waiting for capacity");
    handles_loaded_ = &gauge_reg("assetcdn_handles_loaded", "Live resource handles");
    cache_bytes_ = &gauge_reg("assetcdn_cache_bytes", "Bytes held in the local bundle cache");

    fetch_duration_ = &prometheus::BuildHistogram()
        .Name("assetcdn_fetch_duration_seconds")
        .Help("Bundle fetch duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120});

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("assetcdn_upload_duration_seconds")
        .Help("Per-file upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    if (orchestrator_) {
        auto queue = orchestrator_->get_queue_status();
        downloads_active_->Set(static_cast<double>(queue.active));
        downloads_queued_->Set(static_cast<double>(queue.queued));
    }
    if (repository_) {
        handles_loaded_->Set(static_cast<double>(repository_->size()));
    }
    if (cache_) {
        cache_bytes_->Set(static_cast<double>(cache_->total_cache_bytes()));
    }
}

bool MetricsExporter::write_file() {
    std::lock_guard lock(write_mutex_);
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot rename metrics file into place: %s", ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace assetcdn
