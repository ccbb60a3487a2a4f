#include "assetcdn/content_deployment.hpp"
#include "assetcdn/deploy_config.hpp"
#include "assetcdn/log.hpp"
#include "assetcdn/metrics.hpp"
#include "assetcdn/object_store.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <cstdio>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

/// Prints progress lines, skipping repeats of the same whole percent.
class ProgressPrinter {
public:
    explicit ProgressPrinter(const char* label) : label_(label) {}

    void operator()(double fraction, const std::string& item) {
        int percent = static_cast<int>(fraction * 100.0);
        if (percent == last_percent_ && fraction < 1.0) return;
        last_percent_ = percent;
        assetcdn::log_info("[%s] %3d%% %s", label_, percent, item.c_str());
    }

private:
    const char* label_;
    int last_percent_ = -1;
};

template <typename Report>
void log_failures(const Report& report) {
    for (auto& [key, reason] : report.failed) {
        assetcdn::log_error("  %s: %s", key.c_str(), reason.c_str());
    }
}

int run_upload(assetcdn::ContentDeploymentService& service, const assetcdn::DeployConfig& config,
               const std::string& bucket, const assetcdn::CancellationToken& cancel) {
    using namespace assetcdn;

    ProgressPrinter printer("upload");
    auto report = service.upload_directory(config.build_path, bucket, config.release_version,
                                           std::ref(printer), cancel);

    log_info("Uploaded %zu of %zu files (%llu bytes)", report.uploaded.size(), report.total_files,
             static_cast<unsigned long long>(report.bytes_uploaded));
    if (!report.success) {
        log_failures(report);
        if (!report.unknown.empty()) {
            log_warn("%zu files in unknown state", report.unknown.size());
        }
        if (report.error == ErrorKind::Cancelled) {
            log_info("Upload cancelled");
        } else {
            log_error("Upload failed (%s): %s", to_string(report.error), report.error_message.c_str());
        }
    }

    // Reclaim abandoned multipart remnants whatever the upload outcome, but
    // only let the upload decide the exit code.
    if (config.cleanup_multipart_uploads && report.error != ErrorKind::Cancelled) {
        ProgressPrinter cleanup_printer("cleanup");
        auto cleanup = service.cleanup_multipart_uploads(bucket, config.release_version,
                                                         std::ref(cleanup_printer), cancel);
        if (!cleanup.success) {
            log_warn("Multipart cleanup incomplete (%s): %s", to_string(cleanup.error),
                     cleanup.error_message.c_str());
        } else if (cleanup.found > 0) {
            log_info("Aborted %zu incomplete multipart uploads", cleanup.aborted + cleanup.already_gone);
        }
    }

    if (!report.success) return 1;

    auto profile = config.profile();
    log_info("Release %s deployed to %s/%s", config.release_version.c_str(), bucket.c_str(),
             config.release_version.c_str());
    if (!profile.cdn_url().empty()) {
        log_info("CDN: %s/%s", profile.cdn_url().c_str(),
                 profile.remote_path(config.release_version).c_str());
    }
    return 0;
}

int run_delete(assetcdn::ContentDeploymentService& service, const assetcdn::DeployConfig& config,
               const std::string& bucket, const assetcdn::CancellationToken& cancel) {
    using namespace assetcdn;

    ProgressPrinter printer("delete");
    auto report = service.delete_all_bucket_contents(bucket, config.prefix, std::ref(printer), cancel);
    log_info("Deleted %zu of %zu objects", report.deleted, report.total);
    if (report.success) return 0;

    log_failures(report);
    if (report.error == ErrorKind::Cancelled) {
        log_info("Delete cancelled");
    } else {
        log_error("Delete failed (%s): %s", to_string(report.error), report.error_message.c_str());
    }
    return 1;
}

int run_cleanup(assetcdn::ContentDeploymentService& service, const assetcdn::DeployConfig& config,
                const std::string& bucket, const assetcdn::CancellationToken& cancel) {
    using namespace assetcdn;

    ProgressPrinter printer("cleanup");
    auto report = service.cleanup_multipart_uploads(bucket, config.prefix, std::ref(printer), cancel);
    log_info("Found %zu incomplete multipart uploads, aborted %zu, already gone %zu", report.found,
             report.aborted, report.already_gone);
    if (report.success) return 0;

    log_failures(report);
    if (report.error == ErrorKind::Cancelled) {
        log_info("Cleanup cancelled");
    } else {
        log_error("Cleanup failed (%s): %s", to_string(report.error), report.error_message.c_str());
    }
    return 1;
}

int run_test_connection(assetcdn::ContentDeploymentService& service, const std::string& bucket) {
    using namespace assetcdn;

    auto report = service.test_connection(bucket);
    for (auto& name : report.buckets) {
        log_debug("  bucket: %s", name.c_str());
    }
    if (!report.success) {
        log_error("Connection test failed (%s): %s", to_string(report.error),
                  report.error_message.c_str());
        return 1;
    }
    log_info("Connection OK, bucket %s is visible", bucket.c_str());
    return 0;
}

int run_latest_version(assetcdn::ContentDeploymentService& service,
                       const assetcdn::DeployConfig& config, const std::string& bucket) {
    using namespace assetcdn;

    auto result = service.latest_version(bucket, config.prefix);
    if (!result.success) {
        log_error("Version lookup failed (%s): %s", to_string(result.error),
                  result.error_message.c_str());
        return 1;
    }
    if (result.version.empty()) {
        log_warn("No version prefixes found in %s", bucket.c_str());
        return 1;
    }
    // The bare version on stdout so scripts can capture it.
    std::cout << result.version << std::endl;
    return 0;
}

int run_copy(assetcdn::ContentDeploymentService& service, const assetcdn::DeployConfig& config,
             const std::string& bucket, const assetcdn::CancellationToken& cancel) {
    using namespace assetcdn;

    ProgressPrinter printer("copy");
    auto report = service.copy_objects(bucket, config.source_prefix, config.target_prefix,
                                       std::ref(printer), cancel);
    log_info("Copied %zu of %zu objects", report.copied, report.total);
    if (report.success) return 0;

    log_failures(report);
    if (report.error == ErrorKind::Cancelled) {
        log_info("Copy cancelled");
    } else {
        log_error("Copy failed (%s): %s", to_string(report.error), report.error_message.c_str());
    }
    return 1;
}
}  // namespace

int main(int argc, char* argv[]) {
    using namespace assetcdn;

    auto config_opt = DeployConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Cannot open log file: " << config.log_file << "\n";
            return 1;
        }
        dup2(fileno(log), STDOUT_FILENO);
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    set_verbose(config.verbose);

    auto bucket = config.resolved_bucket();
    auto profile = config.profile();

    std::cout << "assetcdn-deploy starting..." << std::endl;
    std::cout << "  operation: " << to_string(config.operation) << std::endl;
    std::cout << "  target-device: " << to_string(config.target_device) << std::endl;
    std::cout << "  environment: " << to_string(config.environment) << std::endl;
    std::cout << "  bucket: " << bucket << std::endl;
    if (!config.release_version.empty()) {
        std::cout << "  release-version: " << config.release_version << std::endl;
        std::cout << "  remote-path: " << profile.remote_path(config.release_version) << std::endl;
    }
    if (!config.prefix.empty()) {
        std::cout << "  prefix: " << config.prefix << std::endl;
    }
    std::cout << "  context: " << (config.interactive ? "interactive" : "batch") << std::endl;
    std::cout << "  request-timeout: " << config.request_timeout_minutes << " min" << std::endl;
    std::cout << "  max-error-retry: " << config.max_error_retry << std::endl;
    std::cout << "  backend-type: " << config.backend.type << std::endl;
    for (auto& [k, v] : config.backend.params) {
        std::cout << "  backend-" << k << ": " << (is_secret_param(k) ? "****" : v) << std::endl;
    }
    if (config.operation == Operation::Upload) {
        std::cout << "  build-path: " << config.build_path.string() << std::endl;
        std::cout << "  upload-concurrency: " << config.upload_concurrency << std::endl;
        std::cout << "  upload-timeout: " << config.upload_timeout_minutes << " min" << std::endl;
        std::cout << "  cleanup-multipart-uploads: "
                  << (config.cleanup_multipart_uploads ? "yes" : "no") << std::endl;
    }

    std::unique_ptr<ObjectStore> store;
    try {
        store = ObjectStoreFactory::create(config.backend.type, config.backend.params);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create object store: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"operation", to_string(config.operation)},
                                               {"bucket", bucket}});
        metrics->start();
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Turn the signal flag into cancellation outside signal context.
    CancellationSource cancel_source;
    std::atomic<bool> done{false};
    std::thread signal_watcher([&] {
        while (!done.load()) {
            if (g_shutdown_requested) {
                log_info("Shutdown requested, cancelling %s", to_string(config.operation));
                cancel_source.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    DeploymentOptions options;
    options.upload_concurrency = config.upload_concurrency;
    options.upload_timeout = std::chrono::minutes(config.upload_timeout_minutes);
    ContentDeploymentService service(*store, options, metrics.get());

    auto cancel = cancel_source.token();
    int rc = 1;
    switch (config.operation) {
    case Operation::Upload:
        rc = run_upload(service, config, bucket, cancel);
        break;
    case Operation::Delete:
        rc = run_delete(service, config, bucket, cancel);
        break;
    case Operation::CleanupMultipart:
        rc = run_cleanup(service, config, bucket, cancel);
        break;
    case Operation::TestConnection:
        rc = run_test_connection(service, bucket);
        break;
    case Operation::LatestVersion:
        rc = run_latest_version(service, config, bucket);
        break;
    case Operation::Copy:
        rc = run_copy(service, config, bucket, cancel);
        break;
    }

    done.store(true);
    signal_watcher.join();

    if (metrics) metrics->stop();

    std::cout << "assetcdn-deploy finished: " << (rc == 0 ? "success" : "failure") << std::endl;
    return rc;
}
