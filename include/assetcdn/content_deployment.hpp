#pragma once

#include "assetcdn/cancellation.hpp"
#include "assetcdn/constants.hpp"
#include "assetcdn/error.hpp"
#include "assetcdn/object_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace assetcdn {

class MetricsExporter;

/// (fraction in [0,1], item or status text). Calls are serialised and the
/// fraction never decreases within one operation.
using DeployProgress = std::function<void(double fraction, const std::string& item)>;

struct UploadReport {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    size_t total_files = 0;
    std::vector<std::string> uploaded;                        // known-good keys
    std::vector<std::pair<std::string, std::string>> failed;  // key, reason
    std::vector<std::string> unknown;                         // not attempted or interrupted
    uint64_t bytes_uploaded = 0;
};

struct DeleteReport {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    size_t total = 0;  // snapshot taken at list time
    size_t deleted = 0;
    std::vector<std::pair<std::string, std::string>> failed;
};

struct CleanupReport {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    size_t found = 0;
    size_t aborted = 0;
    size_t already_gone = 0;
    std::vector<std::pair<std::string, std::string>> failed;  // "key (upload id)", reason
};

struct ConnectionReport {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    std::vector<std::string> buckets;
    bool bucket_visible = false;
};

struct VersionResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    std::string version;  // empty when no version prefix exists
};

struct CopyReport {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    size_t total = 0;
    size_t copied = 0;
    std::vector<std::pair<std::string, std::string>> failed;
};

struct DeploymentOptions {
    size_t upload_concurrency = constants::DEFAULT_UPLOAD_CONCURRENCY;
    std::chrono::minutes upload_timeout{constants::DEFAULT_UPLOAD_TIMEOUT_MINUTES};
};

/// Bulk operations against one object store: directory upload, prefix
/// deletion, incomplete multipart sweep, and release housekeeping.
///
/// Every operation validates its arguments before touching the network and
/// returns a report. Cancellation and timeout are outcomes, never exceptions.
class ContentDeploymentService {
public:
    ContentDeploymentService(ObjectStore& store, const DeploymentOptions& options = {},
                             MetricsExporter* metrics = nullptr);

    /// Upload every file under `local_path` to `<remote_prefix>/<relative path>`.
    ///
    /// The first failed file stops further files from starting; files already
    /// in flight finish. A cancelled or expired upload leaves its multipart
    /// remnant for cleanup_multipart_uploads.
    UploadReport upload_directory(const std::filesystem::path& local_path,
                                  const std::string& bucket, const std::string& remote_prefix,
                                  const DeployProgress& progress = {},
                                  const CancellationToken& cancel = {});

    /// Delete every object under `prefix` (whole bucket when empty).
    DeleteReport delete_all_bucket_contents(const std::string& bucket, const std::string& prefix,
                                            const DeployProgress& progress = {},
                                            const CancellationToken& cancel = {});

    /// Abort every incomplete multipart upload under `prefix`. Uploads that
    /// are already gone count as cleaned.
    CleanupReport cleanup_multipart_uploads(const std::string& bucket, const std::string& prefix,
                                            const DeployProgress& progress = {},
                                            const CancellationToken& cancel = {});

    ConnectionReport test_connection(const std::string& bucket);

    /// Newest `v<yyyyMMdd_HHmmss>` prefix directly under `parent_prefix`.
    VersionResult latest_version(const std::string& bucket, const std::string& parent_prefix = {});

    /// Copy every object under `source_prefix` to the same relative key
    /// under `target_prefix`.
    CopyReport copy_objects(const std::string& bucket, const std::string& source_prefix,
                            const std::string& target_prefix,
                            const DeployProgress& progress = {},
                            const CancellationToken& cancel = {});

    static std::string content_type_for(const std::filesystem::path& path);
    static std::string make_object_key(const std::string& prefix, const std::string& relative_path);

    /// True for `v` + 8 date digits + `_` + 6 time digits with sane ranges.
    static bool is_version_name(const std::string& name);

    const DeploymentOptions& options() const { return options_; }

private:
    /// List every key under `prefix`, following continuation tokens.
    bool list_all(const std::string& bucket, const std::string& prefix,
                  std::vector<std::string>& keys, ErrorKind& error, std::string& message,
                  const CancellationToken& cancel);

    ObjectStore& store_;
    DeploymentOptions options_;
    MetricsExporter* metrics_;
};

}  // namespace assetcdn
