#include "assetcdn/content_deployment.hpp"
#include "assetcdn/log.hpp"
#include "assetcdn/metrics.hpp"

#include <meridian/core/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace assetcdn {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim_slashes(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    while (!s.empty() && s.front() == '/') s.erase(s.begin());
    return s;
}

bool expired(std::chrono::steady_clock::time_point deadline) {
    return std::chrono::steady_clock::now() >= deadline;
}

std::string fmt_count(const char* verb, size_t done, size_t total, const char* noun) {
    return std::string(verb) + " " + std::to_string(done) + " of " + std::to_string(total) + " " + noun;
}

// Serialised, monotonic progress over a fixed number of files.
// Fraction = (completed files + partial progress of in-flight files) / total.
class UploadProgress {
public:
    UploadProgress(const DeployProgress& sink, size_t total) : sink_(sink), total_(total) {}

    void update(size_t index, double fraction, const std::string& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        partial_[index] = std::clamp(fraction, 0.0, 1.0);
        emit_locked(item);
    }

    void finish(size_t index, const std::string& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        partial_.erase(index);
        completed_++;
        emit_locked(item);
    }

    void drop(size_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        partial_.erase(index);
    }

private:
    void emit_locked(const std::string& item) {
        if (!sink_ || total_ == 0) return;
        double sum = static_cast<double>(completed_);
        for (auto& [i, f] : partial_) sum += f;
        double fraction = std::min(1.0, sum / static_cast<double>(total_));
        if (fraction < last_) fraction = last_;
        last_ = fraction;
        sink_(fraction, item);
    }

    const DeployProgress& sink_;
    size_t total_;
    std::mutex mutex_;
    std::map<size_t, double> partial_;
    size_t completed_ = 0;
    double last_ = 0.0;
};

struct FileTask {
    std::filesystem::path path;
    std::string relative;
    std::string key;
};

bool is_digits(const std::string& s, size_t pos, size_t len) {
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

int field(const std::string& s, size_t pos, size_t len) {
    return std::stoi(s.substr(pos, len));
}

}  // namespace

ContentDeploymentService::ContentDeploymentService(ObjectStore& store,
                                                   const DeploymentOptions& options,
                                                   MetricsExporter* metrics)
    : store_(store)
    , options_(options)
    , metrics_(metrics) {
    if (options_.upload_concurrency == 0) options_.upload_concurrency = 1;
}

// --- Helpers ---

std::string ContentDeploymentService::content_type_for(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> types = {
        {".json", "application/json"},
        {".bundle", "application/octet-stream"},
        {".hash", "text/plain"},
        {".manifest", "text/plain"},
        {".txt", "text/plain"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".html", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
    };
    auto it = types.find(to_lower(path.extension().string()));
    return it != types.end() ? it->second : "application/octet-stream";
}

std::string ContentDeploymentService::make_object_key(const std::string& prefix,
                                                      const std::string& relative_path) {
    std::string rel = relative_path;
    std::replace(rel.begin(), rel.end(), '\\', '/');
    while (!rel.empty() && rel.front() == '/') rel.erase(rel.begin());

    std::string p = prefix;
    std::replace(p.begin(), p.end(), '\\', '/');
    while (!p.empty() && p.back() == '/') p.pop_back();

    if (p.empty()) return rel;
    return p + "/" + rel;
}

bool ContentDeploymentService::is_version_name(const std::string& name) {
    // v yyyyMMdd _ HHmmss
    if (name.size() != 16 || name[0] != 'v' || name[9] != '_') return false;
    if (!is_digits(name, 1, 8) || !is_digits(name, 10, 6)) return false;

    int month = field(name, 5, 2);
    int day = field(name, 7, 2);
    int hour = field(name, 10, 2);
    int minute = field(name, 12, 2);
    int second = field(name, 14, 2);
    return month >= 1 && month <= 12 && day >= 1 && day <= 31 &&
           hour < 24 && minute < 60 && second < 60;
}

bool ContentDeploymentService::list_all(const std::string& bucket, const std::string& prefix,
                                        std::vector<std::string>& keys, ErrorKind& error,
                                        std::string& message, const CancellationToken& cancel) {
    ListOptions opts;
    opts.prefix = prefix;
    do {
        if (cancel.is_cancelled()) {
            error = ErrorKind::Cancelled;
            message = "Cancelled while listing";
            return false;
        }
        auto page = store_.list_objects(bucket, opts);
        if (!page.success) {
            error = page.error;
            message = page.error_message;
            return false;
        }
        for (auto& e : page.entries) keys.push_back(std::move(e.key));
        opts.continuation_token = page.truncated ? page.continuation_token : std::string{};
    } while (!opts.continuation_token.empty());
    return true;
}

// --- UploadDirectory ---

UploadReport ContentDeploymentService::upload_directory(const std::filesystem::path& local_path,
                                                        const std::string& bucket,
                                                        const std::string& remote_prefix,
                                                        const DeployProgress& progress,
                                                        const CancellationToken& cancel) {
    UploadReport report;

    if (bucket.empty()) {
        report.error = ErrorKind::Config;
        report.error_message = "Bucket name is not configured";
        return report;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(local_path, ec)) {
        report.error = ErrorKind::Config;
        report.error_message = "Local path is missing or not a directory: " + local_path.string();
        return report;
    }

    std::vector<FileTask> files;
    try {
        for (auto& entry : std::filesystem::recursive_directory_iterator(local_path)) {
            if (!entry.is_regular_file()) continue;
            FileTask t;
            t.path = entry.path();
            t.relative = std::filesystem::relative(entry.path(), local_path).generic_string();
            t.key = make_object_key(remote_prefix, t.relative);
            files.push_back(std::move(t));
        }
    } catch (const std::filesystem::filesystem_error& e) {
        report.error = ErrorKind::Config;
        report.error_message = std::string("Cannot enumerate ") + local_path.string() + ": " + e.what();
        return report;
    }
    std::sort(files.begin(), files.end(),
              [](const FileTask& a, const FileTask& b) { return a.relative < b.relative; });

    report.total_files = files.size();
    if (files.empty()) {
        log_warn("No files to upload in %s", local_path.c_str());
        if (progress) progress(1.0, "Complete");
        report.success = true;
        return report;
    }

    log_info("Uploading %zu files from %s to %s/%s", files.size(), local_path.c_str(),
             bucket.c_str(), remote_prefix.c_str());

    auto deadline = std::chrono::steady_clock::now() + options_.upload_timeout;
    CancellationSource op(cancel);
    std::atomic<bool> stop_scheduling{false};
    UploadProgress tracker(progress, files.size());

    std::mutex report_mutex;
    std::vector<char> uploaded(files.size(), 0);
    std::vector<std::optional<std::pair<ErrorKind, std::string>>> failures(files.size());

    {
        meridian::ThreadPool pool(std::min(options_.upload_concurrency, files.size()));

        for (size_t i = 0; i < files.size(); ++i) {
            pool.execute([&, i] {
                const auto& file = files[i];
                if (stop_scheduling.load() || op.is_cancelled() || expired(deadline)) return;

                std::optional<ScopedTimer> timer;
                if (metrics_) timer.emplace(metrics_->upload_duration());

                PutOptions opts;
                opts.content_type = content_type_for(file.path);
                opts.cancel = op.token();
                opts.deadline = deadline;
                opts.progress = [&tracker, i, &file](uint64_t done, uint64_t total) {
                    if (total > 0) {
                        tracker.update(i, static_cast<double>(done) / static_cast<double>(total),
                                       file.relative);
                    }
                };

                PutResult result;
                try {
                    result = store_.put_file(bucket, file.key, file.path, opts);
                } catch (const std::exception& e) {
                    result.success = false;
                    result.error = ErrorKind::Backend;
                    result.error_message = e.what();
                }

                if (result.success) {
                    {
                        std::lock_guard<std::mutex> lock(report_mutex);
                        uploaded[i] = 1;
                        report.bytes_uploaded += result.bytes;
                    }
                    if (metrics_) {
                        metrics_->uploads_success().Increment();
                        metrics_->upload_bytes_total().Increment(static_cast<double>(result.bytes));
                    }
                    log_debug("Uploaded %s (%llu bytes)", file.key.c_str(),
                              static_cast<unsigned long long>(result.bytes));
                    tracker.finish(i, file.relative);
                    return;
                }

                tracker.drop(i);
                if (result.error == ErrorKind::Cancelled || result.error == ErrorKind::Timeout) {
                    // Interrupted: remote state unknown, reported via `unknown`
                    return;
                }

                log_error("Upload failed: %s (%s: %s)", file.key.c_str(),
                          to_string(result.error), result.error_message.c_str());
                if (metrics_) metrics_->uploads_failure().Increment();
                {
                    std::lock_guard<std::mutex> lock(report_mutex);
                    failures[i] = std::make_pair(result.error, result.error_message);
                }
                stop_scheduling = true;
            });
        }

        pool.wait_all();
        pool.shutdown(true);
    }

    ErrorKind first_failure = ErrorKind::None;
    std::string first_message;
    for (size_t i = 0; i < files.size(); ++i) {
        if (uploaded[i]) {
            report.uploaded.push_back(files[i].key);
        } else if (failures[i]) {
            if (first_failure == ErrorKind::None) {
                first_failure = failures[i]->first;
                first_message = failures[i]->second;
            }
            report.failed.emplace_back(files[i].key, failures[i]->second);
        } else {
            report.unknown.push_back(files[i].key);
        }
    }

    if (report.uploaded.size() == files.size()) {
        report.success = true;
        if (progress) progress(1.0, "Complete");
        log_info("Upload complete: %zu files, %llu bytes", files.size(),
                 static_cast<unsigned long long>(report.bytes_uploaded));
        return report;
    }

    if (cancel.is_cancelled()) {
        report.error = ErrorKind::Cancelled;
        report.error_message = "Upload cancelled";
        log_info("Upload cancelled after %zu of %zu files", report.uploaded.size(), files.size());
    } else if (expired(deadline)) {
        report.error = ErrorKind::Timeout;
        report.error_message = "Upload timed out after " +
                               std::to_string(options_.upload_timeout.count()) + " minutes";
        log_error("%s; %zu of %zu files uploaded", report.error_message.c_str(),
                  report.uploaded.size(), files.size());
    } else if (!report.uploaded.empty()) {
        report.error = ErrorKind::Partial;
        report.error_message = "Uploaded " + std::to_string(report.uploaded.size()) + " of " +
                               std::to_string(files.size()) + " files; first failure: " +
                               first_message;
        log_error("%s", report.error_message.c_str());
    } else {
        report.error = first_failure == ErrorKind::None ? ErrorKind::Backend : first_failure;
        report.error_message = first_message.empty() ? "No files uploaded" : first_message;
        log_error("Upload failed: %s", report.error_message.c_str());
    }
    return report;
}

// --- DeleteAllBucketContents ---

DeleteReport ContentDeploymentService::delete_all_bucket_contents(const std::string& bucket,
                                                                  const std::string& prefix,
                                                                  const DeployProgress& progress,
                                                                  const CancellationToken& cancel) {
    DeleteReport report;
    if (bucket.empty()) {
        report.error = ErrorKind::Config;
        report.error_message = "Bucket name is not configured";
        return report;
    }

    std::vector<std::string> keys;
    if (!list_all(bucket, prefix, keys, report.error, report.error_message, cancel)) {
        log_error("Cannot list %s/%s: %s", bucket.c_str(), prefix.c_str(),
                  report.error_message.c_str());
        return report;
    }

    report.total = keys.size();
    if (keys.empty()) {
        log_info("No objects to delete in %s/%s", bucket.c_str(), prefix.c_str());
        if (progress) progress(1.0, "No objects to delete");
        report.success = true;
        return report;
    }

    log_info("Deleting %zu objects from %s/%s", keys.size(), bucket.c_str(), prefix.c_str());

    for (size_t start = 0; start < keys.size(); start += constants::MAX_DELETE_BATCH) {
        if (cancel.is_cancelled()) {
            report.error = ErrorKind::Cancelled;
            report.error_message = "Delete cancelled after " + std::to_string(report.deleted) +
                                   " of " + std::to_string(report.total) + " objects";
            log_info("%s", report.error_message.c_str());
            return report;
        }

        size_t end = std::min(keys.size(), start + constants::MAX_DELETE_BATCH);
        std::vector<std::string> batch(keys.begin() + static_cast<std::ptrdiff_t>(start),
                                       keys.begin() + static_cast<std::ptrdiff_t>(end));
        auto result = store_.delete_objects(bucket, batch);

        report.deleted += result.deleted.size();
        if (metrics_) metrics_->objects_deleted().Increment(static_cast<double>(result.deleted.size()));
        for (auto& f : result.failed) report.failed.push_back(f);
        if (!result.success && result.deleted.empty() && result.failed.empty()) {
            // Whole request failed
            for (auto& k : batch) report.failed.emplace_back(k, result.error_message);
            log_error("Delete batch failed: %s", result.error_message.c_str());
        }

        if (progress) {
            progress(static_cast<double>(report.deleted) / static_cast<double>(report.total),
                     fmt_count("Deleted", report.deleted, report.total, "objects"));
        }
    }

    if (!report.failed.empty()) {
        report.error = ErrorKind::Partial;
        report.error_message = "Deleted " + std::to_string(report.deleted) + " of " +
                               std::to_string(report.total) + " objects; " +
                               std::to_string(report.failed.size()) + " failed";
        log_error("%s", report.error_message.c_str());
        return report;
    }

    log_info("Deleted %zu objects", report.deleted);
    report.success = true;
    return report;
}

// --- CleanupMultipartUploads ---

CleanupReport ContentDeploymentService::cleanup_multipart_uploads(const std::string& bucket,
                                                                  const std::string& prefix,
                                                                  const DeployProgress& progress,
                                                                  const CancellationToken& cancel) {
    CleanupReport report;
    if (bucket.empty()) {
        report.error = ErrorKind::Config;
        report.error_message = "Bucket name is not configured";
        return report;
    }

    // Collect first: aborting while paginating would shift the markers
    std::vector<MultipartUploadEntry> uploads;
    std::string key_marker;
    std::string upload_id_marker;
    while (true) {
        if (cancel.is_cancelled()) {
            report.error = ErrorKind::Cancelled;
            report.error_message = "Cleanup cancelled while listing";
            return report;
        }
        auto page = store_.list_multipart_uploads(bucket, prefix, key_marker, upload_id_marker);
        if (!page.success) {
            report.error = page.error;
            report.error_message = page.error_message;
            log_error("Cannot list multipart uploads in %s: %s", bucket.c_str(),
                      page.error_message.c_str());
            return report;
        }
        for (auto& u : page.uploads) uploads.push_back(std::move(u));
        if (!page.truncated) break;
        if (page.next_key_marker == key_marker && page.next_upload_id_marker == upload_id_marker) {
            log_warn("Multipart listing did not advance; stopping pagination");
            break;
        }
        key_marker = page.next_key_marker;
        upload_id_marker = page.next_upload_id_marker;
    }

    report.found = uploads.size();
    if (uploads.empty()) {
        log_info("No multipart uploads to clean up in %s", bucket.c_str());
        if (progress) progress(1.0, "No multipart uploads to clean up");
        report.success = true;
        return report;
    }

    log_info("Aborting %zu incomplete multipart uploads in %s", uploads.size(), bucket.c_str());

    size_t processed = 0;
    for (auto& u : uploads) {
        if (cancel.is_cancelled()) {
            report.error = ErrorKind::Cancelled;
            report.error_message = "Cleanup cancelled after " + std::to_string(processed) +
                                   " of " + std::to_string(uploads.size()) + " uploads";
            log_info("%s", report.error_message.c_str());
            return report;
        }

        auto result = store_.abort_multipart_upload(bucket, u.key, u.upload_id);
        if (result.success) {
            report.aborted++;
            if (metrics_) metrics_->multipart_aborted().Increment();
            log_debug("Aborted multipart upload %s (%s)", u.key.c_str(), u.upload_id.c_str());
        } else if (result.error == ErrorKind::NotFound) {
            report.already_gone++;
        } else {
            log_error("Cannot abort multipart upload %s (%s): %s", u.key.c_str(),
                      u.upload_id.c_str(), result.error_message.c_str());
            report.failed.emplace_back(u.key + " (" + u.upload_id + ")", result.error_message);
        }

        processed++;
        if (progress) {
            progress(static_cast<double>(processed) / static_cast<double>(uploads.size()),
                     fmt_count("Aborted", processed, uploads.size(), "multipart uploads"));
        }
    }

    if (!report.failed.empty()) {
        report.error = ErrorKind::Partial;
        report.error_message = std::to_string(report.failed.size()) + " of " +
                               std::to_string(uploads.size()) +
                               " multipart uploads could not be aborted";
        return report;
    }

    log_info("Multipart cleanup complete: %zu aborted, %zu already gone",
             report.aborted, report.already_gone);
    report.success = true;
    return report;
}

// --- TestConnection ---

ConnectionReport ContentDeploymentService::test_connection(const std::string& bucket) {
    ConnectionReport report;
    if (bucket.empty()) {
        report.error = ErrorKind::Config;
        report.error_message = "Bucket name is not configured";
        return report;
    }

    auto buckets = store_.list_buckets();
    if (buckets.success) {
        report.buckets = buckets.buckets;
        report.bucket_visible =
            std::find(report.buckets.begin(), report.buckets.end(), bucket) != report.buckets.end();
    } else if (buckets.error != ErrorKind::Auth) {
        report.error = buckets.error;
        report.error_message = buckets.error_message;
        return report;
    }

    if (!report.bucket_visible) {
        // Credentials scoped to one bucket often cannot list buckets
        ListOptions first_page;
        first_page.max_keys = 1;
        auto listed = store_.list_objects(bucket, first_page);
        if (listed.success) {
            report.bucket_visible = true;
        } else {
            report.error = listed.error;
            report.error_message = "Bucket " + bucket + " is not accessible: " + listed.error_message;
            return report;
        }
    }

    log_info("Connection OK: %s (%s), %zu buckets listed", bucket.c_str(),
             store_.type_name().c_str(), report.buckets.size());
    report.success = true;
    return report;
}

// --- LatestVersion ---

VersionResult ContentDeploymentService::latest_version(const std::string& bucket,
                                                       const std::string& parent_prefix) {
    VersionResult result;
    if (bucket.empty()) {
        result.error = ErrorKind::Config;
        result.error_message = "Bucket name is not configured";
        return result;
    }

    std::string parent = trim_slashes(parent_prefix);
    if (!parent.empty()) parent += "/";

    ListOptions opts;
    opts.prefix = parent;
    opts.delimiter = "/";
    do {
        auto page = store_.list_objects(bucket, opts);
        if (!page.success) {
            result.error = page.error;
            result.error_message = page.error_message;
            return result;
        }
        for (auto& cp : page.common_prefixes) {
            auto name = trim_slashes(cp.substr(std::min(parent.size(), cp.size())));
            // Fixed-width timestamps order lexicographically
            if (is_version_name(name) && name > result.version) result.version = name;
        }
        opts.continuation_token = page.truncated ? page.continuation_token : std::string{};
    } while (!opts.continuation_token.empty());

    result.success = true;
    return result;
}

// --- CopyObjects ---

CopyReport ContentDeploymentService::copy_objects(const std::string& bucket,
                                                  const std::string& source_prefix,
                                                  const std::string& target_prefix,
                                                  const DeployProgress& progress,
                                                  const CancellationToken& cancel) {
    CopyReport report;
    auto source = trim_slashes(source_prefix);
    auto target = trim_slashes(target_prefix);
    if (bucket.empty()) {
        report.error = ErrorKind::Config;
        report.error_message = "Bucket name is not configured";
        return report;
    }
    if (source.empty() || target.empty() || source == target) {
        report.error = ErrorKind::Config;
        report.error_message = "Source and target prefixes must be non-empty and different";
        return report;
    }

    std::vector<std::string> keys;
    if (!list_all(bucket, source + "/", keys, report.error, report.error_message, cancel)) {
        return report;
    }

    report.total = keys.size();
    if (keys.empty()) {
        log_warn("No objects under %s/%s to copy", bucket.c_str(), source.c_str());
        if (progress) progress(1.0, "No objects to copy");
        report.success = true;
        return report;
    }

    log_info("Copying %zu objects from %s/ to %s/", keys.size(), source.c_str(), target.c_str());

    size_t processed = 0;
    for (auto& key : keys) {
        if (cancel.is_cancelled()) {
            report.error = ErrorKind::Cancelled;
            report.error_message = "Copy cancelled after " + std::to_string(report.copied) +
                                   " of " + std::to_string(report.total) + " objects";
            return report;
        }

        auto dest = make_object_key(target, key.substr(source.size() + 1));
        auto result = store_.copy_object(bucket, key, dest);
        if (result.success) {
            report.copied++;
        } else {
            log_error("Copy failed: %s -> %s: %s", key.c_str(), dest.c_str(),
                      result.error_message.c_str());
            report.failed.emplace_back(key, result.error_message);
        }

        processed++;
        if (progress) {
            progress(static_cast<double>(processed) / static_cast<double>(report.total),
                     fmt_count("Copied", report.copied, report.total, "objects"));
        }
    }

    if (!report.failed.empty()) {
        report.error = ErrorKind::Partial;
        report.error_message = std::to_string(report.failed.size()) + " of " +
                               std::to_string(report.total) + " objects failed to copy";
        return report;
    }

    report.success = true;
    return report;
}

}  // namespace assetcdn
