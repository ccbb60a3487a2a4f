#pragma once

#include "assetcdn/constants.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace assetcdn {

enum class TargetDevice { Quest, Mobile_Android, Mobile_iOS, PC };
enum class Environment { Development, Staging, Production };

enum class Operation {
    Upload,
    Delete,
    CleanupMultipart,
    TestConnection,
    LatestVersion,
    Copy,
};

const char* to_string(TargetDevice device);
const char* to_string(Environment environment);
const char* to_string(Operation operation);

// Case-insensitive. Return false on an unrecognised value.
bool parse_target_device(const std::string& value, TargetDevice& out);
bool parse_environment(const std::string& value, Environment& out);
bool parse_operation(const std::string& value, Operation& out);
bool parse_bool_value(const std::string& value, bool& out);

/// True for parameter names that hold credentials (masked when echoed).
bool is_secret_param(const std::string& name);

/// Configuration for the object store backend (S3, R2 or local).
struct BackendConfig {
    std::string type = "r2";  // "s3", "r2", "local"
    std::map<std::string, std::string> params;  // Passed to ObjectStoreFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Bucket naming and remote layout for one device/environment pair.
struct CdnProfile {
    TargetDevice device = TargetDevice::Quest;
    Environment environment = Environment::Development;
    std::string platform_name = constants::DEFAULT_PLATFORM_NAME;
    std::string product_name = constants::DEFAULT_PRODUCT_NAME;
    std::array<std::string, 3> cdn_urls;  // indexed by Environment

    /// "quest", "pc", "mobile_android", "mobile_ios"
    std::string device_string() const;

    /// {device}-{platform}-{product}-{environment}, lower case.
    /// Mobile devices use mobile-android-{product}-{environment} and
    /// mobile-ios-{product}-{environment}.
    std::string bucket_name() const;

    /// ServerData/{device}/{Environment}/{version}
    std::string remote_path(const std::string& version) const;

    /// Empty when no URL is configured for the environment.
    const std::string& cdn_url() const { return cdn_urls[static_cast<size_t>(environment)]; }
};

/// Configuration for the assetcdn-deploy batch driver.
struct DeployConfig {
    Operation operation = Operation::Upload;

    // Release parameters
    std::string release_version;
    TargetDevice target_device = TargetDevice::Quest;
    Environment environment = Environment::Development;
    std::string prefix;  // scopes delete / cleanup-multipart / latest-version
    bool cleanup_multipart_uploads = true;
    std::filesystem::path build_path;
    std::string bucket;  // overrides the profile-derived name
    std::string source_prefix;
    std::string target_prefix;

    // Profile
    std::string platform_name = constants::DEFAULT_PLATFORM_NAME;
    std::string product_name = constants::DEFAULT_PRODUCT_NAME;
    std::array<std::string, 3> cdn_urls;

    // Upload
    size_t upload_concurrency = constants::DEFAULT_UPLOAD_CONCURRENCY;
    uint32_t upload_timeout_minutes = constants::DEFAULT_UPLOAD_TIMEOUT_MINUTES;

    // Execution context: batch (unattended) or interactive.
    // request_timeout_minutes == 0 means "derive from the context".
    bool interactive = false;
    uint32_t request_timeout_minutes = 0;
    uint32_t max_error_retry = constants::DEFAULT_MAX_ERROR_RETRY;

    BackendConfig backend;

    // Observability
    bool verbose = false;
    std::filesystem::path log_file;
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Accepts --kebab-case flags and the single-dash camelCase form
    /// (-releaseVersion 1.2.3), case-insensitively.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<DeployConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Derive the request timeout from the execution context and push
    /// timeouts and retry counts into the backend parameters.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    CdnProfile profile() const;

    /// --bucket if given, otherwise the profile's bucket name.
    std::string resolved_bucket() const;
};

}  // namespace assetcdn
