// Test suite for assetcdn.
//
// Tests:
//   1. Error classification, URL encoding, SigV4 signing, retry backoff
//   2. BackendConfig validation
//   3. DeployConfig CLI parsing (long and camelCase forms)
//   4. DeployConfig JSON loading
//   5. DeployConfig defaults, execution context and validation
//   6. CDN profile naming
//   7. Content types, object keys and version names
//   8. Local object store: staging, listing, deletes, factory
//   9. Handle repository
//  10. Download orchestrator against an in-test storage engine
//      - Coalescing, registry agreement, cancellation
//      - Asset info, idempotent pre-download, fan-out
//      - Priority caps and escalation, cancel racing escalation, stop
//      - Re-download of a bundle evicted before load
//  11. Content deployment against the local store
//  12. Bundle cache: manifest persistence, eviction, clearing
//  13. Metrics textfile export

#include "assetcdn/bundle_cache.hpp"
#include "assetcdn/content_deployment.hpp"
#include "assetcdn/deploy_config.hpp"
#include "assetcdn/download_orchestrator.hpp"
#include "assetcdn/error.hpp"
#include "assetcdn/handle_repository.hpp"
#include "assetcdn/http.hpp"
#include "assetcdn/metrics.hpp"
#include "assetcdn/object_store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace assetcdn;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Wait for a condition with timeout (milliseconds). Returns true if met.
static bool wait_for(std::function<bool()> cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return cond();
}

static std::span<const uint8_t> bytes_of(const std::string& s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

/// List every key under `prefix` in one call (test buckets are small).
static std::vector<std::string> list_keys(ObjectStore& store, const std::string& bucket,
                                          const std::string& prefix = {}) {
    ListOptions opts;
    opts.prefix = prefix;
    auto result = store.list_objects(bucket, opts);
    std::vector<std::string> keys;
    for (auto& e : result.entries) keys.push_back(e.key);
    return keys;
}

static bool is_non_decreasing(const std::vector<double>& values) {
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i] < values[i - 1]) return false;
    }
    return true;
}

/// A resource produced by FakeEngine::load.
class FakeResource : public LoadedResource {
public:
    FakeResource(std::string key, uint64_t size) : key_(std::move(key)), size_(size) {}
    const std::string& key() const override { return key_; }
    uint64_t size_bytes() const override { return size_; }

private:
    std::string key_;
    uint64_t size_;
};

/// In-memory storage engine. While holding, fetches block until their key is
/// released or their token fires.
class FakeEngine : public StorageEngine {
public:
    void add(const std::string& key, uint64_t size = 100) {
        std::lock_guard<std::mutex> lock(mutex_);
        sizes_[key] = size;
    }
    void set_cached(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        cached_.insert(key);
    }
    void fail(const std::string& key, ErrorKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[key] = kind;
    }
    void throw_on(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        throws_.insert(key);
    }
    void hold(bool on) {
        std::lock_guard<std::mutex> lock(mutex_);
        holding_ = on;
    }
    void release_key(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        released_.insert(key);
    }
    void release_all() { hold(false); }
    /// The next load of `key` finds it evicted from the cache.
    void evict_before_load(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        evict_on_load_.insert(key);
    }

    int fetch_count(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = fetch_counts_.find(key);
        return it == fetch_counts_.end() ? 0 : it->second;
    }
    std::vector<std::string> started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }
    int in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_;
    }
    int loads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return loads_;
    }
    int releases() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return releases_;
    }

    bool is_known(const std::string& key) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return sizes_.count(key) > 0;
    }
    bool is_cached(const std::string& key) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return cached_.count(key) > 0;
    }
    uint64_t download_size(const std::string& key) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sizes_.find(key);
        if (it == sizes_.end() || cached_.count(key)) return 0;
        return it->second;
    }

    FetchOutcome fetch_and_cache(const std::string& key, DownloadPriority,
                                 const CancellationToken& token,
                                 const ProgressSink& progress) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fetch_counts_[key]++;
            started_.push_back(key);
            if (throws_.count(key)) throw std::runtime_error("engine exploded");
        }
        if (progress) progress(0.25);

        std::unique_lock<std::mutex> lock(mutex_);
        in_flight_++;
        while (holding_ && !released_.count(key) && !token.is_cancelled()) {
            lock.unlock();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            lock.lock();
        }
        in_flight_--;
        if (token.is_cancelled()) return FetchOutcome::cancelled();
        auto f = failures_.find(key);
        if (f != failures_.end()) return FetchOutcome::failed(f->second, "injected failure");
        uint64_t size = sizes_[key];
        lock.unlock();

        if (progress) progress(0.75);

        lock.lock();
        cached_.insert(key);
        return FetchOutcome::ok(size);
    }

    LoadResult load(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        LoadResult result;
        if (evict_on_load_.erase(key)) cached_.erase(key);
        if (!cached_.count(key)) {
            result.error = ErrorKind::NotFound;
            result.error_message = "not cached";
            return result;
        }
        loads_++;
        result.success = true;
        result.handle = std::make_shared<FakeResource>(key, sizes_[key]);
        return result;
    }

    void release(const ResourceHandle& handle) override {
        if (!handle) return;
        std::lock_guard<std::mutex> lock(mutex_);
        releases_++;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> sizes_;
    std::set<std::string> cached_;
    std::unordered_map<std::string, ErrorKind> failures_;
    std::set<std::string> throws_;
    std::set<std::string> released_;
    std::set<std::string> evict_on_load_;
    bool holding_ = false;

    std::unordered_map<std::string, int> fetch_counts_;
    std::vector<std::string> started_;
    int in_flight_ = 0;
    int loads_ = 0;
    int releases_ = 0;
};

/// Records (fraction, item) pairs from a DeployProgress callback.
struct ProgressLog {
    std::mutex mutex;
    std::vector<double> fractions;
    std::vector<std::string> items;

    DeployProgress sink() {
        return [this](double fraction, const std::string& item) {
            std::lock_guard<std::mutex> lock(mutex);
            fractions.push_back(fraction);
            items.push_back(item);
        };
    }
};

// ---------------------------------------------------------------------------
// 1. Error classification
// ---------------------------------------------------------------------------

static void test_error_classification() {
    std::cout << "\n=== Error classification ===" << std::endl;

    {
        TEST(http_status_mapping);
        ASSERT_TRUE(classify_http(200, false) == ErrorKind::None, "200 is none");
        ASSERT_TRUE(classify_http(0, true) == ErrorKind::Network, "transport failure is network");
        ASSERT_TRUE(classify_http(401, false) == ErrorKind::Auth, "401 is auth");
        ASSERT_TRUE(classify_http(403, false) == ErrorKind::Auth, "403 is auth");
        ASSERT_TRUE(classify_http(404, false) == ErrorKind::NotFound, "404 is not found");
        ASSERT_TRUE(classify_http(429, false) == ErrorKind::Throttled, "429 is throttled");
        ASSERT_TRUE(classify_http(503, false, "<Error><Code>SlowDown</Code></Error>") ==
                        ErrorKind::Throttled, "503 SlowDown is throttled");
        ASSERT_TRUE(classify_http(503, false, "<Error><Code>InternalError</Code></Error>") ==
                        ErrorKind::Backend, "plain 503 is backend");
        ASSERT_TRUE(classify_http(400, false) == ErrorKind::Backend, "400 is backend");
        PASS();
    }
    {
        TEST(retryable_kinds);
        ASSERT_TRUE(is_retryable(ErrorKind::Network), "network retries");
        ASSERT_TRUE(is_retryable(ErrorKind::Throttled), "throttled retries");
        ASSERT_TRUE(is_retryable(ErrorKind::Backend, 500), "5xx retries");
        ASSERT_TRUE(!is_retryable(ErrorKind::Backend, 400), "4xx does not retry");
        ASSERT_TRUE(!is_retryable(ErrorKind::Auth, 403), "auth does not retry");
        ASSERT_TRUE(!is_retryable(ErrorKind::Config), "config does not retry");
        ASSERT_TRUE(!is_retryable(ErrorKind::Cancelled), "cancelled does not retry");
        PASS();
    }
    {
        TEST(kind_names);
        ASSERT_EQ(std::string(to_string(ErrorKind::Timeout)), "timeout", "timeout name");
        ASSERT_EQ(std::string(to_string(ErrorKind::Partial)), "partial", "partial name");
        PASS();
    }
}

static void test_http_signing() {
    std::cout << "\n=== URL encoding and request signing ===" << std::endl;

    {
        TEST(url_encoding);
        ASSERT_EQ(net::url_encode("a b/c+d~e"), "a%20b%2Fc%2Bd~e", "query encoding");
        ASSERT_EQ(net::url_encode_path("Android/bundle 1.bundle"), "Android/bundle%201.bundle",
                  "path encoding keeps slashes");
        ASSERT_EQ(net::url_encode_path("caf\xc3\xa9.png"), "caf%C3%A9.png", "utf-8 bytes escaped");
        PASS();
    }
    {
        TEST(sigv4_headers);
        net::AwsSigV4Signer signer("AKIDEXAMPLE", "secret", "auto", "s3");
        auto request = net::HttpRequest::get("https://acct.r2.cloudflarestorage.com:8443/mybucket/k.txt?list-type=2");
        signer.sign(request);

        ASSERT_EQ(request.headers.get("Host").value_or(""), "acct.r2.cloudflarestorage.com:8443",
                  "host keeps port");
        ASSERT_EQ(request.headers.get("x-amz-content-sha256").value_or(""),
                  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                  "empty body hash");
        auto date = request.headers.get("X-Amz-Date").value_or("");
        ASSERT_EQ(date.size(), static_cast<size_t>(16), "basic ISO8601 timestamp");

        auto auth = request.headers.get("Authorization").value_or("");
        std::string prefix = "AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/" + date.substr(0, 8) +
                             "/auto/s3/aws4_request, SignedHeaders=host;x-amz-content-sha256;x-amz-date, Signature=";
        ASSERT_TRUE(auth.rfind(prefix, 0) == 0, "authorization layout: " + auth);
        ASSERT_EQ(auth.size() - prefix.size(), static_cast<size_t>(64), "hex signature length");
        PASS();
    }
    {
        TEST(sigv4_keeps_unsigned_payload_and_token);
        net::AwsSigV4Signer signer("AKIDEXAMPLE", "secret", "us-east-1", "s3");
        auto request = net::HttpRequest::put("https://s3.amazonaws.com/b/k", {'x'});
        request.headers.set("x-amz-content-sha256", "UNSIGNED-PAYLOAD");
        signer.sign_with_token(request, "session");

        ASSERT_EQ(request.headers.get("x-amz-content-sha256").value_or(""), "UNSIGNED-PAYLOAD",
                  "preset payload hash kept");
        ASSERT_EQ(request.headers.get("x-amz-security-token").value_or(""), "session", "token header");
        auto auth = request.headers.get("authorization").value_or("");
        ASSERT_TRUE(auth.find("x-amz-date;x-amz-security-token") != std::string::npos,
                    "token is signed: " + auth);
        PASS();
    }
    {
        TEST(backoff_sleep_wakes_on_cancel);
        CancellationSource source;
        std::thread canceller([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            source.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        bool slept = sleep_unless_cancelled(std::chrono::seconds(10), source.token());
        auto waited = std::chrono::steady_clock::now() - start;
        canceller.join();

        ASSERT_TRUE(!slept, "interrupted sleep reports false");
        ASSERT_TRUE(waited < std::chrono::seconds(2), "woke shortly after cancel");
        ASSERT_TRUE(sleep_unless_cancelled(std::chrono::milliseconds(20), CancellationToken{}),
                    "uncancelled sleep completes");
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(30);
        ASSERT_TRUE(!sleep_unless_cancelled(std::chrono::seconds(10), CancellationToken{}, deadline),
                    "sleep capped by deadline reports false");
        ASSERT_TRUE(std::chrono::steady_clock::now() < deadline + std::chrono::seconds(1),
                    "deadline cut the sleep short");
        PASS();
    }
    {
        TEST(s3_retry_backoff_honours_cancel);
        // Nothing listens on port 1: every attempt is a fast, retryable
        // connection failure, so the store spends its time in backoff.
        auto store = ObjectStoreFactory::create("s3", {
            {"access_key", "AKIDEXAMPLE"}, {"secret_key", "secret"},
            {"endpoint", "http://127.0.0.1:1"}, {"use_path_style", "true"},
            {"connect_timeout", "1"}, {"max_retries", "10"}});
        auto dir = make_temp_dir("assetcdn-backoff");

        CancellationSource source;
        GetOptions opts;
        opts.cancel = source.token();
        std::atomic<int64_t> cancelled_at_ms{0};
        auto start = std::chrono::steady_clock::now();
        std::thread canceller([&] {
            // Lands inside the 800ms backoff that follows the fourth attempt
            std::this_thread::sleep_for(std::chrono::milliseconds(900));
            cancelled_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            source.cancel();
        });
        auto result = store->get_object("bucket", "k.bin", dir / "k.bin", opts);
        auto returned_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        canceller.join();
        bool partial_left = fs::exists(dir / "k.bin.part");
        fs::remove_all(dir);

        ASSERT_TRUE(!result.success, "get fails");
        ASSERT_EQ(std::string(to_string(result.error)), std::string(to_string(ErrorKind::Cancelled)),
                  "reported as cancelled");
        ASSERT_TRUE(returned_ms - cancelled_at_ms.load() < 300,
                    "returned " + std::to_string(returned_ms - cancelled_at_ms.load()) +
                    "ms after cancel");
        ASSERT_TRUE(!partial_left, "no partial file left");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. BackendConfig validation
// ---------------------------------------------------------------------------

static void test_backend_config_validation() {
    std::cout << "\n=== BackendConfig validation ===" << std::endl;

    {
        TEST(empty_type_fails);
        BackendConfig bc;
        bc.type = "";
        auto err = bc.validate();
        ASSERT_NOT_EMPTY(err, "empty type should fail");
        PASS();
    }
    {
        TEST(unknown_type_fails);
        BackendConfig bc;
        bc.type = "ftp";
        auto err = bc.validate();
        ASSERT_TRUE(err.find("unknown") != std::string::npos, "should say unknown");
        PASS();
    }
    {
        TEST(s3_requires_credentials);
        BackendConfig bc;
        bc.type = "s3";
        auto err = bc.validate();
        ASSERT_TRUE(err.find("credentials") != std::string::npos, "s3 needs credentials");
        bc.params["access_key"] = "AKIA";
        bc.params["secret_key"] = "secret";
        err = bc.validate();
        ASSERT_EMPTY(err, "s3 with credentials should pass");
        PASS();
    }
    {
        TEST(r2_requires_account_id);
        BackendConfig bc;
        bc.type = "r2";
        bc.params["access_key"] = "AKIA";
        bc.params["secret_key"] = "secret";
        auto err = bc.validate();
        ASSERT_TRUE(err.find("account_id") != std::string::npos, "r2 needs account_id");
        bc.params["account_id"] = "abc123";
        err = bc.validate();
        ASSERT_EMPTY(err, "r2 with account_id should pass");
        PASS();
    }
    {
        TEST(local_requires_root);
        BackendConfig bc;
        bc.type = "local";
        auto err = bc.validate();
        ASSERT_TRUE(err.find("root") != std::string::npos, "local needs root");
        bc.params["root"] = "/tmp";
        err = bc.validate();
        ASSERT_EMPTY(err, "local with root should pass");
        PASS();
    }
    {
        TEST(secret_param_names);
        ASSERT_TRUE(is_secret_param("access_key"), "access_key is secret");
        ASSERT_TRUE(is_secret_param("secret_key"), "secret_key is secret");
        ASSERT_TRUE(is_secret_param("session_token"), "session_token is secret");
        ASSERT_TRUE(!is_secret_param("region"), "region is not secret");
        ASSERT_TRUE(!is_secret_param("endpoint"), "endpoint is not secret");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. DeployConfig CLI parsing
// ---------------------------------------------------------------------------

static void test_config_cli_parsing() {
    std::cout << "\n=== DeployConfig CLI parsing ===" << std::endl;

    // Keep the environment from leaking credentials into the parsed config
    unsetenv("AWS_ACCESS_KEY_ID");
    unsetenv("AWS_SECRET_ACCESS_KEY");
    unsetenv("AWS_SESSION_TOKEN");

    {
        TEST(long_form_args);
        const char* args[] = {
            "assetcdn-deploy",
            "--operation", "upload",
            "--release-version", "1.2.3",
            "--target-device", "PC",
            "--environment", "Staging",
            "--build-path", "/tmp",
            "--backend-type", "r2",
            "--backend-account-id", "acct",
            "--backend-access-key", "AK",
            "--backend-secret-key", "SK",
            "--upload-concurrency", "8",
        };
        auto cfg = DeployConfig::from_args(static_cast<int>(std::size(args)), const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_TRUE(cfg->operation == Operation::Upload, "operation");
        ASSERT_EQ(cfg->release_version, "1.2.3", "release_version");
        ASSERT_TRUE(cfg->target_device == TargetDevice::PC, "target_device");
        ASSERT_TRUE(cfg->environment == Environment::Staging, "environment");
        ASSERT_EQ(cfg->build_path.string(), "/tmp", "build_path");
        ASSERT_EQ(cfg->backend.type, "r2", "backend type");
        ASSERT_EQ(cfg->backend.params["account_id"], "acct", "account_id");
        ASSERT_EQ(cfg->backend.params["access_key"], "AK", "access_key");
        ASSERT_EQ(cfg->backend.params["secret_key"], "SK", "secret_key");
        ASSERT_EQ(cfg->upload_concurrency, (size_t)8, "upload_concurrency");
        ASSERT_TRUE(cfg->cleanup_multipart_uploads, "cleanup defaults to true");
        PASS();
    }
    {
        TEST(camel_case_single_dash);
        const char* args[] = {
            "assetcdn-deploy",
            "-releaseVersion", "2.0.0",
            "-targetDevice", "mobile_ios",
            "-environment", "PRODUCTION",
            "-cleanupMultipartUploads", "False",
            "-Prefix", "old/",
        };
        auto cfg = DeployConfig::from_args(static_cast<int>(std::size(args)), const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->release_version, "2.0.0", "release_version");
        ASSERT_TRUE(cfg->target_device == TargetDevice::Mobile_iOS, "target_device");
        ASSERT_TRUE(cfg->environment == Environment::Production, "environment");
        ASSERT_TRUE(!cfg->cleanup_multipart_uploads, "cleanup disabled");
        ASSERT_EQ(cfg->prefix, "old/", "prefix");
        PASS();
    }
    {
        TEST(backend_bool_flags);
        const char* args[] = {
            "assetcdn-deploy",
            "--backend-type", "s3",
            "--backend-path-style",
            "--backend-no-verify-ssl",
        };
        auto cfg = DeployConfig::from_args(static_cast<int>(std::size(args)), const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->backend.params["use_path_style"], "true", "path style");
        ASSERT_EQ(cfg->backend.params["verify_ssl"], "false", "verify_ssl");
        PASS();
    }
    {
        TEST(cdn_urls_per_environment);
        const char* args[] = {
            "assetcdn-deploy",
            "--cdn-url-development", "https://dev.example.com",
            "--cdn-url-production", "https://cdn.example.com",
            "--environment", "production",
        };
        auto cfg = DeployConfig::from_args(static_cast<int>(std::size(args)), const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->profile().cdn_url(), "https://cdn.example.com", "production url");
        PASS();
    }
    {
        TEST(operations_parse);
        const char* args[] = {"assetcdn-deploy", "--operation", "Cleanup-Multipart"};
        auto cfg = DeployConfig::from_args(3, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_TRUE(cfg->operation == Operation::CleanupMultipart, "cleanup-multipart");
        PASS();
    }
    {
        TEST(unknown_device_rejected);
        const char* args[] = {"assetcdn-deploy", "--target-device", "Switch"};
        auto cfg = DeployConfig::from_args(3, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "unknown device should fail");
        PASS();
    }
    {
        TEST(bad_bool_rejected);
        const char* args[] = {"assetcdn-deploy", "--cleanup-multipart-uploads", "maybe"};
        auto cfg = DeployConfig::from_args(3, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "bad bool should fail");
        PASS();
    }
    {
        TEST(bad_number_rejected);
        const char* args[] = {"assetcdn-deploy", "--upload-concurrency", "four"};
        auto cfg = DeployConfig::from_args(3, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "non-numeric should fail");
        PASS();
    }
    {
        TEST(missing_value_rejected);
        const char* args[] = {"assetcdn-deploy", "--release-version"};
        auto cfg = DeployConfig::from_args(2, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "missing value should fail");
        PASS();
    }
    {
        TEST(unknown_option_rejected);
        const char* args[] = {"assetcdn-deploy", "--frobnicate"};
        auto cfg = DeployConfig::from_args(2, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "unknown option should fail");
        PASS();
    }
    {
        TEST(help_returns_nullopt);
        const char* args[] = {"assetcdn-deploy", "--help"};
        auto cfg = DeployConfig::from_args(2, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "help should return nullopt");
        PASS();
    }
    {
        TEST(env_credentials_fallback);
        setenv("AWS_ACCESS_KEY_ID", "ENVKEY", 1);
        setenv("AWS_SECRET_ACCESS_KEY", "ENVSECRET", 1);
        const char* args[] = {"assetcdn-deploy", "--backend-type", "s3"};
        auto cfg = DeployConfig::from_args(3, const_cast<char**>(args));
        unsetenv("AWS_ACCESS_KEY_ID");
        unsetenv("AWS_SECRET_ACCESS_KEY");
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->backend.params["access_key"], "ENVKEY", "access_key from env");
        ASSERT_EQ(cfg->backend.params["secret_key"], "ENVSECRET", "secret_key from env");
        PASS();
    }
    {
        TEST(cli_overrides_env_credentials);
        setenv("AWS_ACCESS_KEY_ID", "ENVKEY", 1);
        const char* args[] = {"assetcdn-deploy", "--backend-type", "s3",
                              "--backend-access-key", "CLIKEY"};
        auto cfg = DeployConfig::from_args(5, const_cast<char**>(args));
        unsetenv("AWS_ACCESS_KEY_ID");
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->backend.params["access_key"], "CLIKEY", "CLI wins");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. DeployConfig JSON loading
// ---------------------------------------------------------------------------

static void test_config_json() {
    std::cout << "\n=== DeployConfig JSON loading ===" << std::endl;

    auto tmpdir = make_temp_dir("assetcdn-json");
    auto json_path = tmpdir / "config.json";

    {
        TEST(basic_json_loading);
        write_file(json_path,
            R"({
                "operation": "delete",
                "release_version": "3.1.0",
                "target_device": "Mobile_Android",
                "environment": "staging",
                "prefix": "3.0.0",
                "cleanup_multipart_uploads": false,
                "product_name": "Arcade",
                "upload_concurrency": 6,
                "interactive": true,
                "max_error_retry": 2,
                "verbose": true,
                "cdn_urls": {"staging": "https://stage.example.com"},
                "backend": {
                    "type": "local",
                    "root": "/tmp/store",
                    "multipart_threshold": 1048576
                }
            })");

        DeployConfig cfg;
        ASSERT_TRUE(cfg.load_json(json_path), "load_json should succeed");
        ASSERT_TRUE(cfg.operation == Operation::Delete, "operation");
        ASSERT_EQ(cfg.release_version, "3.1.0", "release_version");
        ASSERT_TRUE(cfg.target_device == TargetDevice::Mobile_Android, "target_device");
        ASSERT_TRUE(cfg.environment == Environment::Staging, "environment");
        ASSERT_EQ(cfg.prefix, "3.0.0", "prefix");
        ASSERT_TRUE(!cfg.cleanup_multipart_uploads, "cleanup");
        ASSERT_EQ(cfg.product_name, "Arcade", "product_name");
        ASSERT_EQ(cfg.upload_concurrency, (size_t)6, "upload_concurrency");
        ASSERT_TRUE(cfg.interactive, "interactive");
        ASSERT_EQ(cfg.max_error_retry, 2u, "max_error_retry");
        ASSERT_TRUE(cfg.verbose, "verbose");
        ASSERT_EQ(cfg.profile().cdn_url(), "https://stage.example.com", "cdn url");
        ASSERT_EQ(cfg.backend.type, "local", "backend type");
        ASSERT_EQ(cfg.backend.params["root"], "/tmp/store", "root");
        ASSERT_EQ(cfg.backend.params["multipart_threshold"], "1048576", "numeric param as string");
        PASS();
    }
    {
        TEST(cli_after_config_overrides);
        write_file(json_path, R"({"release_version": "from-json", "environment": "Staging"})");
        std::string path = json_path.string();
        const char* args[] = {"assetcdn-deploy", "--config", path.c_str(),
                              "--release-version", "from-cli"};
        auto cfg = DeployConfig::from_args(5, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->release_version, "from-cli", "CLI after --config wins");
        ASSERT_TRUE(cfg->environment == Environment::Staging, "JSON value kept");
        PASS();
    }
    {
        TEST(invalid_enum_rejected);
        write_file(json_path, R"({"environment": "qa"})");
        DeployConfig cfg;
        ASSERT_TRUE(!cfg.load_json(json_path), "unknown environment should fail");
        PASS();
    }
    {
        TEST(invalid_json_rejected);
        write_file(json_path, "{ not json");
        DeployConfig cfg;
        ASSERT_TRUE(!cfg.load_json(json_path), "malformed JSON should fail");
        PASS();
    }
    {
        TEST(missing_file_rejected);
        DeployConfig cfg;
        ASSERT_TRUE(!cfg.load_json(tmpdir / "nope.json"), "missing file should fail");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 5. DeployConfig defaults and validation
// ---------------------------------------------------------------------------

static void test_config_defaults_and_validation() {
    std::cout << "\n=== DeployConfig defaults and validation ===" << std::endl;

    auto tmpdir = make_temp_dir("assetcdn-validate");

    {
        TEST(batch_context_defaults);
        DeployConfig cfg;
        cfg.backend.type = "s3";
        cfg.apply_defaults();
        ASSERT_EQ(cfg.request_timeout_minutes, 30u, "batch request timeout");
        ASSERT_EQ(cfg.max_error_retry, 5u, "max_error_retry");
        ASSERT_EQ(cfg.backend.params["request_timeout_minutes"], "30", "pushed to backend");
        ASSERT_EQ(cfg.backend.params["max_retries"], "5", "retries pushed to backend");
        PASS();
    }
    {
        TEST(interactive_context_defaults);
        const char* args[] = {"assetcdn-deploy", "--interactive", "--backend-type", "s3"};
        auto cfg = DeployConfig::from_args(4, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->request_timeout_minutes, 10u, "interactive request timeout");
        ASSERT_EQ(cfg->backend.params["request_timeout_minutes"], "10", "pushed to backend");
        PASS();
    }
    {
        TEST(explicit_timeout_wins);
        const char* args[] = {"assetcdn-deploy", "--interactive",
                              "--request-timeout-minutes", "45", "--max-error-retry", "1"};
        auto cfg = DeployConfig::from_args(6, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->request_timeout_minutes, 45u, "explicit timeout");
        ASSERT_EQ(cfg->max_error_retry, 1u, "explicit retry");
        PASS();
    }
    {
        TEST(upload_requires_release_version);
        DeployConfig cfg;
        cfg.backend.type = "local";
        cfg.backend.params["root"] = tmpdir.string();
        cfg.build_path = tmpdir;
        auto err = cfg.validate();
        ASSERT_TRUE(err.find("release_version") != std::string::npos, "needs release_version");
        cfg.release_version = "1.0.0";
        err = cfg.validate();
        ASSERT_EMPTY(err, "complete upload config should pass");
        PASS();
    }
    {
        TEST(upload_requires_directory);
        DeployConfig cfg;
        cfg.backend.type = "local";
        cfg.backend.params["root"] = tmpdir.string();
        cfg.release_version = "1.0.0";
        cfg.build_path = tmpdir / "missing";
        auto err = cfg.validate();
        ASSERT_TRUE(err.find("not a directory") != std::string::npos, "missing build path");
        PASS();
    }
    {
        TEST(copy_requires_prefixes);
        DeployConfig cfg;
        cfg.operation = Operation::Copy;
        cfg.backend.type = "local";
        cfg.backend.params["root"] = tmpdir.string();
        auto err = cfg.validate();
        ASSERT_TRUE(err.find("source-prefix") != std::string::npos, "copy needs prefixes");
        cfg.source_prefix = "a";
        cfg.target_prefix = "b";
        err = cfg.validate();
        ASSERT_EMPTY(err, "copy with prefixes should pass");
        PASS();
    }
    {
        TEST(missing_credentials_fail_validation);
        DeployConfig cfg;
        cfg.operation = Operation::TestConnection;
        cfg.backend.type = "r2";
        auto err = cfg.validate();
        ASSERT_TRUE(err.find("backend") != std::string::npos, "backend error surfaced");
        PASS();
    }
    {
        TEST(bucket_override);
        DeployConfig cfg;
        ASSERT_EQ(cfg.resolved_bucket(), "quest-android-product-development", "derived bucket");
        cfg.bucket = "custom";
        ASSERT_EQ(cfg.resolved_bucket(), "custom", "override");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 6. CDN profile
// ---------------------------------------------------------------------------

static void test_cdn_profile() {
    std::cout << "\n=== CDN profile ===" << std::endl;

    {
        TEST(quest_bucket_and_path);
        CdnProfile p;
        p.device = TargetDevice::Quest;
        p.environment = Environment::Production;
        p.platform_name = "Android";
        p.product_name = "MyGame";
        ASSERT_EQ(p.device_string(), "quest", "device string");
        ASSERT_EQ(p.bucket_name(), "quest-android-mygame-production", "bucket");
        ASSERT_EQ(p.remote_path("1.4.0"), "ServerData/quest/Production/1.4.0", "remote path");
        PASS();
    }
    {
        TEST(pc_bucket);
        CdnProfile p;
        p.device = TargetDevice::PC;
        p.environment = Environment::Staging;
        ASSERT_EQ(p.bucket_name(), "pc-android-product-staging", "bucket");
        PASS();
    }
    {
        TEST(mobile_buckets_skip_platform);
        CdnProfile p;
        p.product_name = "MyGame";
        p.environment = Environment::Development;
        p.device = TargetDevice::Mobile_Android;
        ASSERT_EQ(p.bucket_name(), "mobile-android-mygame-development", "android bucket");
        p.device = TargetDevice::Mobile_iOS;
        ASSERT_EQ(p.bucket_name(), "mobile-ios-mygame-development", "ios bucket");
        PASS();
    }
    {
        TEST(mobile_device_string_keeps_underscore);
        CdnProfile p;
        p.device = TargetDevice::Mobile_iOS;
        ASSERT_EQ(p.device_string(), "mobile_ios", "device string");
        ASSERT_EQ(p.remote_path("2.0"), "ServerData/mobile_ios/Development/2.0", "remote path");
        PASS();
    }
    {
        TEST(cdn_url_empty_when_unset);
        CdnProfile p;
        ASSERT_TRUE(p.cdn_url().empty(), "no url configured");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. Content types, keys and version names
// ---------------------------------------------------------------------------

static void test_deployment_helpers() {
    std::cout << "\n=== Content types and keys ===" << std::endl;

    {
        TEST(content_types);
        using S = ContentDeploymentService;
        ASSERT_EQ(S::content_type_for("catalog.json"), "application/json", ".json");
        ASSERT_EQ(S::content_type_for("a/b.bundle"), "application/octet-stream", ".bundle");
        ASSERT_EQ(S::content_type_for("catalog.hash"), "text/plain", ".hash");
        ASSERT_EQ(S::content_type_for("x.manifest"), "text/plain", ".manifest");
        ASSERT_EQ(S::content_type_for("readme.TXT"), "text/plain", "case-insensitive");
        ASSERT_EQ(S::content_type_for("icon.png"), "image/png", ".png");
        ASSERT_EQ(S::content_type_for("photo.jpeg"), "image/jpeg", ".jpeg");
        ASSERT_EQ(S::content_type_for("index.html"), "text/html", ".html");
        ASSERT_EQ(S::content_type_for("site.css"), "text/css", ".css");
        ASSERT_EQ(S::content_type_for("app.js"), "application/javascript", ".js");
        ASSERT_EQ(S::content_type_for("noext"), "application/octet-stream", "fallback");
        PASS();
    }
    {
        TEST(object_keys);
        using S = ContentDeploymentService;
        ASSERT_EQ(S::make_object_key("v1.2.3", "a/b.bundle"), "v1.2.3/a/b.bundle", "joined");
        ASSERT_EQ(S::make_object_key("v1.2.3/", "a\\b.bundle"), "v1.2.3/a/b.bundle", "normalised");
        ASSERT_EQ(S::make_object_key("", "a/b.bundle"), "a/b.bundle", "empty prefix");
        PASS();
    }
    {
        TEST(version_names);
        using S = ContentDeploymentService;
        ASSERT_TRUE(S::is_version_name("v20250131_235959"), "valid");
        ASSERT_TRUE(!S::is_version_name("v20251301_000000"), "month 13");
        ASSERT_TRUE(!S::is_version_name("v20250100_000000"), "day 0");
        ASSERT_TRUE(!S::is_version_name("v20250101_240000"), "hour 24");
        ASSERT_TRUE(!S::is_version_name("20250101_000000"), "no v");
        ASSERT_TRUE(!S::is_version_name("v2025010_1000000"), "misplaced underscore");
        ASSERT_TRUE(!S::is_version_name("v20250101_00000a"), "non-digit");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 8. Local object store
// ---------------------------------------------------------------------------

static void test_local_object_store() {
    std::cout << "\n=== Local object store ===" << std::endl;

    auto tmpdir = make_temp_dir("assetcdn-store");
    auto store = ObjectStoreFactory::create_local(tmpdir / "root", 64, 32);

    {
        TEST(put_get_round_trip);
        auto put = store->put_object("b", "dir/obj.txt", bytes_of("hello"));
        ASSERT_TRUE(put.success, "put should succeed");
        auto dest = tmpdir / "out.txt";
        auto get = store->get_object("b", "dir/obj.txt", dest);
        ASSERT_TRUE(get.success, "get should succeed");
        ASSERT_EQ(read_file(dest), "hello", "content");
        ASSERT_EQ(get.bytes, 5u, "bytes");
        PASS();
    }
    {
        TEST(get_missing_is_not_found);
        auto get = store->get_object("b", "nope", tmpdir / "nope");
        ASSERT_TRUE(!get.success, "should fail");
        ASSERT_TRUE(get.error == ErrorKind::NotFound, "not found");
        ASSERT_TRUE(!fs::exists(tmpdir / "nope"), "no file left");
        PASS();
    }
    {
        TEST(multipart_file_assembled);
        std::string big(200, 'x');
        for (size_t i = 0; i < big.size(); ++i) big[i] = static_cast<char>('a' + i % 26);
        write_file(tmpdir / "big.bin", big);
        std::vector<uint64_t> progress;
        PutOptions opts;
        opts.progress = [&progress](uint64_t done, uint64_t) { progress.push_back(done); };
        auto put = store->put_file("b", "big.bin", tmpdir / "big.bin", opts);
        ASSERT_TRUE(put.success, "multipart put should succeed");
        ASSERT_EQ(put.bytes, 200u, "bytes");
        ASSERT_EQ(progress.size(), (size_t)7, "one progress call per 32-byte part");
        ASSERT_EQ(read_file(tmpdir / "root" / "b" / "big.bin"), big, "assembled content");
        auto uploads = store->list_multipart_uploads("b", "");
        ASSERT_TRUE(uploads.success && uploads.uploads.empty(), "staging cleared on completion");
        PASS();
    }
    {
        TEST(cancelled_multipart_left_staged);
        CancellationSource cancel;
        PutOptions opts;
        opts.cancel = cancel.token();
        opts.progress = [&cancel](uint64_t done, uint64_t) {
            if (done >= 64) cancel.cancel();
        };
        auto put = store->put_file("b", "staged.bin", tmpdir / "big.bin", opts);
        ASSERT_TRUE(!put.success, "should not succeed");
        ASSERT_TRUE(put.error == ErrorKind::Cancelled, "cancelled");
        auto uploads = store->list_multipart_uploads("b", "staged");
        ASSERT_EQ(uploads.uploads.size(), (size_t)1, "one incomplete upload");
        ASSERT_EQ(uploads.uploads[0].key, "staged.bin", "upload key");

        auto keys = list_keys(*store, "b");
        ASSERT_TRUE(std::find(keys.begin(), keys.end(), "staged.bin") == keys.end(),
                    "abandoned upload is not an object");

        auto abort = store->abort_multipart_upload("b", "staged.bin", uploads.uploads[0].upload_id);
        ASSERT_TRUE(abort.success, "abort should succeed");
        auto again = store->abort_multipart_upload("b", "staged.bin", uploads.uploads[0].upload_id);
        ASSERT_TRUE(again.error == ErrorKind::NotFound, "second abort is not found");
        PASS();
    }
    {
        TEST(expired_deadline_is_timeout);
        PutOptions opts;
        opts.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);
        auto put = store->put_object("b", "late.txt", bytes_of("x"), opts);
        ASSERT_TRUE(put.error == ErrorKind::Timeout, "timeout");
        PASS();
    }
    {
        TEST(list_pagination_and_delimiter);
        for (int i = 0; i < 5; ++i) {
            store->put_object("pages", "p/" + std::to_string(i), bytes_of("d"));
        }
        store->put_object("pages", "q/x/1", bytes_of("d"));
        store->put_object("pages", "q/y/1", bytes_of("d"));

        ListOptions opts;
        opts.prefix = "p/";
        opts.max_keys = 2;
        std::vector<std::string> seen;
        int pages = 0;
        do {
            auto page = store->list_objects("pages", opts);
            ASSERT_TRUE(page.success, "list should succeed");
            for (auto& e : page.entries) seen.push_back(e.key);
            opts.continuation_token = page.truncated ? page.continuation_token : "";
            pages++;
        } while (!opts.continuation_token.empty() && pages < 10);
        ASSERT_EQ(seen.size(), (size_t)5, "all keys across pages");
        ASSERT_EQ(pages, 3, "three pages of two");

        ListOptions delim;
        delim.prefix = "q/";
        delim.delimiter = "/";
        auto page = store->list_objects("pages", delim);
        ASSERT_EQ(page.common_prefixes.size(), (size_t)2, "two common prefixes");
        ASSERT_EQ(page.common_prefixes[0], "q/x/", "first prefix");
        ASSERT_TRUE(page.entries.empty(), "no direct entries");
        PASS();
    }
    {
        TEST(missing_bucket_is_not_found);
        auto page = store->list_objects("ghost");
        ASSERT_TRUE(page.error == ErrorKind::NotFound, "not found");
        PASS();
    }
    {
        TEST(delete_batch_limit);
        std::vector<std::string> keys(constants::MAX_DELETE_BATCH + 1, "k");
        auto result = store->delete_objects("b", keys);
        ASSERT_TRUE(!result.success, "over-limit batch rejected");
        ASSERT_TRUE(result.error == ErrorKind::Config, "config error");
        PASS();
    }
    {
        TEST(factory_rejects_bad_configuration);
        bool threw = false;
        try {
            ObjectStoreFactory::create("ftp", {});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "unknown type throws");

        threw = false;
        try {
            ObjectStoreFactory::create("s3", {{"region", "us-east-1"}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "s3 without credentials throws");

        threw = false;
        try {
            ObjectStoreFactory::create("r2", {{"access_key", "a"}, {"secret_key", "s"}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "r2 without account throws");

        threw = false;
        try {
            ObjectStoreFactory::create("local", {});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "local without root throws");

        auto local = ObjectStoreFactory::create("local", {{"root", (tmpdir / "f").string()}});
        ASSERT_EQ(local->type_name(), "local", "local store created");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 9. Handle repository
// ---------------------------------------------------------------------------

static void test_handle_repository() {
    std::cout << "\n=== Handle repository ===" << std::endl;

    {
        TEST(add_get_contains);
        int released = 0;
        HandleRepository repo([&released](const ResourceHandle&) { released++; });
        auto h = std::make_shared<FakeResource>("k", 1);
        ASSERT_TRUE(repo.add_handle("k", h, false), "add");
        ResourceHandle out;
        ASSERT_TRUE(repo.try_get_handle("k", out), "found");
        ASSERT_TRUE(out == h, "same handle");
        ASSERT_TRUE(repo.contains_key("k"), "contains");
        ASSERT_TRUE(!repo.contains_key("other"), "absent key");
        ASSERT_TRUE(!repo.try_get_handle("other", out), "absent lookup");
        ASSERT_EQ(repo.size(), (size_t)1, "size");
        ASSERT_EQ(released, 0, "nothing released");
        PASS();
    }
    {
        TEST(replace_releases_previous);
        int released = 0;
        HandleRepository repo([&released](const ResourceHandle&) { released++; });
        auto h1 = std::make_shared<FakeResource>("k", 1);
        auto h2 = std::make_shared<FakeResource>("k", 2);
        repo.add_handle("k", h1, false);
        repo.add_handle("k", h1, true);
        ASSERT_EQ(released, 0, "re-adding the same handle does not release");
        ASSERT_EQ(repo.get_auto_unload_keys().size(), (size_t)1, "flag updated");
        repo.add_handle("k", h2, false);
        ASSERT_EQ(released, 1, "previous handle released");
        ASSERT_EQ(repo.size(), (size_t)1, "still one entry");
        PASS();
    }
    {
        TEST(auto_unload_round_trip);
        int released = 0;
        HandleRepository repo([&released](const ResourceHandle&) { released++; });
        repo.add_handle("a", std::make_shared<FakeResource>("a", 1), true);
        repo.add_handle("b", std::make_shared<FakeResource>("b", 1), false);
        auto keys = repo.get_auto_unload_keys();
        ASSERT_EQ(keys.size(), (size_t)1, "one auto key");
        ASSERT_EQ(keys[0], "a", "auto key");
        ASSERT_EQ(repo.unload_auto_unload_handles(), (size_t)1, "one unloaded");
        ASSERT_EQ(released, 1, "released");
        ASSERT_TRUE(!repo.contains_key("a"), "removed from map");
        ASSERT_TRUE(repo.get_auto_unload_keys().empty(), "removed from auto set");
        ASSERT_TRUE(repo.contains_key("b"), "manual handle kept");
        PASS();
    }
    {
        TEST(update_flag_and_remove);
        int released = 0;
        HandleRepository repo([&released](const ResourceHandle&) { released++; });
        ASSERT_TRUE(!repo.update_auto_unload_flag("k", true), "absent key");
        repo.add_handle("k", std::make_shared<FakeResource>("k", 1), false);
        ASSERT_TRUE(repo.update_auto_unload_flag("k", true), "flag updated");
        ASSERT_EQ(repo.get_auto_unload_keys().size(), (size_t)1, "now auto");
        ASSERT_TRUE(repo.remove_handle("k"), "removed");
        ASSERT_TRUE(!repo.remove_handle("k"), "second remove is a no-op");
        ASSERT_EQ(released, 1, "released once");
        PASS();
    }
    {
        TEST(empty_key_rejected);
        HandleRepository repo([](const ResourceHandle&) {});
        ASSERT_TRUE(!repo.add_handle("", std::make_shared<FakeResource>("", 1), true), "add");
        ASSERT_TRUE(!repo.contains_key(""), "contains");
        ASSERT_TRUE(!repo.remove_handle(""), "remove");
        ASSERT_TRUE(!repo.is_operation_in_progress(""), "in progress");
        ASSERT_EQ(repo.size(), (size_t)0, "nothing stored");
        PASS();
    }
    {
        TEST(clear_all_releases_everything);
        int released = 0;
        {
            HandleRepository repo([&released](const ResourceHandle&) { released++; });
            repo.add_handle("a", std::make_shared<FakeResource>("a", 1), true);
            repo.add_handle("b", std::make_shared<FakeResource>("b", 1), false);
            repo.clear_all_handles();
            ASSERT_EQ(released, 2, "both released");
            ASSERT_EQ(repo.size(), (size_t)0, "empty");
            repo.add_handle("c", std::make_shared<FakeResource>("c", 1), false);
        }
        ASSERT_EQ(released, 3, "destructor releases the rest");
        PASS();
    }
    {
        TEST(no_tracker_means_not_in_progress);
        HandleRepository repo([](const ResourceHandle&) {});
        ASSERT_TRUE(!repo.is_operation_in_progress("k"), "no tracker attached");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 10. Download orchestrator
// ---------------------------------------------------------------------------

static void test_orchestrator() {
    std::cout << "\n=== Download orchestrator ===" << std::endl;

    {
        TEST(concurrent_requests_coalesce);
        FakeEngine engine;
        engine.add("k");
        engine.hold(true);
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        const int n = 8;
        std::vector<LoadResult> results(n);
        std::vector<std::thread> threads;
        for (int i = 0; i < n; ++i) {
            threads.emplace_back([&, i] {
                results[i] = orch.queue_download_to_load("k", static_cast<DownloadPriority>(i % 4));
            });
        }
        bool all_requested = wait_for([&] { return orch.get_stats().requests == (uint64_t)n; });
        engine.release_all();
        for (auto& t : threads) t.join();

        ASSERT_TRUE(all_requested, "every caller should reach the orchestrator");
        ASSERT_EQ(engine.fetch_count("k"), 1, "exactly one fetch");
        for (int i = 0; i < n; ++i) {
            ASSERT_TRUE(results[i].success, "every caller succeeds");
            ASSERT_TRUE(results[i].handle == results[0].handle, "every caller gets the same handle");
        }
        ASSERT_EQ(engine.loads(), 1, "loaded once");
        ASSERT_EQ(repo.size(), (size_t)1, "one handle registered");
        auto stats = orch.get_stats();
        ASSERT_EQ(stats.coalesced + stats.cache_hits, (uint64_t)(n - 1), "others joined or hit cache");
        PASS();
    }
    {
        TEST(registry_agrees_with_repository);
        FakeEngine engine;
        engine.add("k");
        engine.hold(true);
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        std::atomic<int> listener_calls{0};
        std::atomic<bool> active_at_notify{true};
        orch.add_completion_listener([&](const std::string& key, const DownloadResult&) {
            active_at_notify = repo.is_operation_in_progress(key);
            listener_calls++;
        });

        ASSERT_TRUE(!repo.is_operation_in_progress("k"), "idle before request");
        auto future = orch.queue_download("k", DownloadPriority::Normal);
        bool running = wait_for([&] { return engine.in_flight() == 1; });
        bool in_progress = repo.is_operation_in_progress("k");
        bool active = orch.is_active("k");
        auto qs = orch.get_queue_status();
        double progress = orch.get_download_status("k");
        engine.release_all();
        auto result = future.get();

        ASSERT_TRUE(running, "fetch should start");
        ASSERT_TRUE(in_progress && active, "both views report in progress");
        ASSERT_EQ(qs.active, (size_t)1, "one active");
        ASSERT_EQ(qs.queued, (size_t)0, "none queued");
        ASSERT_EQ(progress, 0.25, "live progress");
        ASSERT_TRUE(result.success, "succeeds");
        ASSERT_TRUE(wait_for([&] { return listener_calls.load() == 1; }), "listener called once");
        ASSERT_TRUE(!active_at_notify.load(), "status removed before listeners run");
        ASSERT_TRUE(!repo.is_operation_in_progress("k"), "idle after completion");
        ASSERT_EQ(orch.get_download_status("k"), 1.0, "cached reports 1.0");
        PASS();
    }
    {
        TEST(cancel_download_semantics);
        FakeEngine engine;
        engine.add("k");
        engine.hold(true);
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        ASSERT_TRUE(!orch.cancel_download("k"), "nothing active to cancel");

        LoadResult load;
        std::thread caller([&] { load = orch.queue_download_to_load("k", DownloadPriority::High); });
        bool running = wait_for([&] { return engine.in_flight() == 1; });
        bool cancelled = orch.cancel_download("k");
        caller.join();

        ASSERT_TRUE(running, "fetch should start");
        ASSERT_TRUE(cancelled, "cancel signalled");
        ASSERT_TRUE(!load.success, "no handle produced");
        ASSERT_TRUE(load.error == ErrorKind::Cancelled, "cancellation outcome");
        ASSERT_EQ(repo.size(), (size_t)0, "nothing registered");
        ASSERT_TRUE(!engine.is_cached("k"), "nothing cached");
        ASSERT_EQ(orch.get_stats().fetches_cancelled, 1u, "counted as cancelled");
        PASS();
    }
    {
        TEST(caller_token_cancels_job);
        FakeEngine engine;
        engine.add("k");
        engine.hold(true);
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        CancellationSource caller;
        auto future = orch.queue_download("k", DownloadPriority::Normal, caller.token());
        bool running = wait_for([&] { return engine.in_flight() == 1; });
        caller.cancel();
        auto result = future.get();
        ASSERT_TRUE(running, "fetch should start");
        ASSERT_TRUE(result.cancelled && !result.success, "cancelled");
        PASS();
    }
    {
        TEST(cancel_queued_job);
        FakeEngine engine;
        engine.add("a");
        engine.add("b");
        engine.hold(true);
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);  // Low cap is 1

        auto fa = orch.queue_download("a", DownloadPriority::Low);
        auto fb = orch.queue_download("b", DownloadPriority::Low);
        bool running = wait_for([&] { return engine.in_flight() == 1; });
        auto before = orch.get_queue_status();
        bool cancelled = orch.cancel_download("b");
        bool ready = fb.wait_for(std::chrono::seconds(1)) == std::future_status::ready;
        auto after = orch.get_queue_status();
        engine.release_all();
        fa.get();

        ASSERT_TRUE(running, "a should start");
        ASSERT_EQ(before.queued, (size_t)1, "b queued behind the cap");
        ASSERT_TRUE(cancelled, "queued job cancelled");
        ASSERT_TRUE(ready, "queued cancel resolves at once");
        ASSERT_TRUE(fb.get().cancelled, "cancelled outcome");
        ASSERT_EQ(after.queued, (size_t)0, "removed from queue");
        ASSERT_EQ(engine.fetch_count("b"), 0, "b never fetched");
        PASS();
    }
    {
        TEST(asset_info_is_consistent);
        FakeEngine engine;
        engine.add("fresh", 500);
        engine.add("cached", 300);
        engine.set_cached("cached");
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        auto unknown = orch.get_asset_info("nope");
        ASSERT_TRUE(!unknown.exists, "unknown does not exist");
        ASSERT_EQ(unknown.progress, 0.0, "unknown has no progress");
        ASSERT_EQ(unknown.size_bytes, 0u, "unknown has no size");

        auto fresh = orch.get_asset_info("fresh");
        ASSERT_TRUE(fresh.exists, "known key exists");
        ASSERT_EQ(fresh.progress, 0.0, "no history, no progress");
        ASSERT_EQ(fresh.size_bytes, 500u, "full size to fetch");
        ASSERT_EQ(orch.get_download_size("fresh"), 500u, "download size");

        auto cached = orch.get_asset_info("cached");
        ASSERT_TRUE(cached.exists, "cached exists");
        ASSERT_EQ(cached.progress, 1.0, "cached is complete");
        ASSERT_EQ(cached.size_bytes, 0u, "nothing to fetch");
        ASSERT_EQ(orch.get_download_size("cached"), 0u, "cached download size");
        ASSERT_EQ(orch.get_download_size("nope"), 0u, "unknown download size");
        ASSERT_EQ(orch.get_download_status("nope"), 0.0, "unknown status");
        PASS();
    }
    {
        TEST(pre_download_is_idempotent);
        FakeEngine engine;
        engine.add("k");
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        std::mutex m;
        std::vector<double> values;
        auto sink = [&](double v) {
            std::lock_guard<std::mutex> lock(m);
            values.push_back(v);
        };
        ASSERT_TRUE(orch.pre_download_asset("k", DownloadPriority::Normal, sink), "first succeeds");
        ASSERT_TRUE(orch.pre_download_asset("k", DownloadPriority::Normal, sink), "second succeeds");
        ASSERT_EQ(engine.fetch_count("k"), 1, "no second fetch");
        ASSERT_EQ(orch.get_stats().cache_hits, 1u, "second call is a cache hit");
        std::lock_guard<std::mutex> lock(m);
        ASSERT_TRUE(!values.empty(), "progress reported");
        ASSERT_TRUE(is_non_decreasing(values), "progress is monotonic");
        ASSERT_EQ(values.back(), 1.0, "progress ends at 1.0");
        for (double v : values) ASSERT_TRUE(v >= 0.0 && v <= 1.0, "progress within [0,1]");
        PASS();
    }
    {
        TEST(pre_download_assets_independent);
        FakeEngine engine;
        engine.add("a");
        engine.add("b");
        engine.add("c");
        engine.fail("b", ErrorKind::Network);
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        std::atomic<int> completions{0};
        orch.add_completion_listener([&](const std::string&, const DownloadResult&) { completions++; });

        bool ok = orch.pre_download_assets({"a", "b", "c", "unknown"}, DownloadPriority::High);
        ASSERT_TRUE(!ok, "overall result is the AND");
        ASSERT_TRUE(engine.is_cached("a") && engine.is_cached("c"), "siblings still succeed");
        ASSERT_TRUE(!engine.is_cached("b"), "failed key not cached");
        ASSERT_TRUE(wait_for([&] { return completions.load() == 3; }), "one completion per job");
        ASSERT_TRUE(orch.pre_download_assets({"a", "c"}, DownloadPriority::High), "cached keys succeed");
        ASSERT_EQ(orch.get_stats().not_found, 1u, "unknown key counted");
        PASS();
    }
    {
        TEST(failed_fetch_registers_nothing);
        FakeEngine engine;
        engine.add("k");
        engine.fail("k", ErrorKind::Backend);
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        auto load = orch.queue_download_to_load("k", DownloadPriority::Normal);
        ASSERT_TRUE(!load.success, "fails");
        ASSERT_TRUE(load.error == ErrorKind::Backend, "backend error");
        ASSERT_EQ(repo.size(), (size_t)0, "no handle");
        ASSERT_TRUE(!repo.is_operation_in_progress("k"), "status removed");
        PASS();
    }
    {
        TEST(engine_exception_becomes_failure);
        FakeEngine engine;
        engine.add("boom");
        engine.add("fine");
        engine.throw_on("boom");
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        auto result = orch.queue_download("boom", DownloadPriority::Normal).get();
        ASSERT_TRUE(!result.success && !result.cancelled, "failed, not cancelled");
        ASSERT_TRUE(result.error == ErrorKind::Backend, "backend error");
        ASSERT_TRUE(orch.pre_download_asset("fine", DownloadPriority::Normal), "others unaffected");
        PASS();
    }
    {
        TEST(priority_levels_cover_every_priority);
        static_assert(kPriorityLevels == 4, "one slot per DownloadPriority");
        DownloadOrchestrator::Options options;
        ASSERT_EQ(options.caps.size(), kPriorityLevels, "one cap per priority");
        ASSERT_EQ(static_cast<size_t>(DownloadPriority::Critical) + 1, kPriorityLevels,
                  "Critical is the last slot");
        PASS();
    }
    {
        TEST(caps_and_escalation);
        FakeEngine engine;
        engine.add("a");
        engine.add("b");
        engine.add("c");
        engine.hold(true);
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);  // Low cap is 1

        auto fa = orch.queue_download("a", DownloadPriority::Low);
        auto fb = orch.queue_download("b", DownloadPriority::Low);
        auto fc = orch.queue_download("c", DownloadPriority::Low);
        bool a_running = wait_for([&] { return engine.in_flight() == 1; });
        auto before = orch.get_queue_status();

        // A higher-priority request for a queued key moves it ahead
        auto fc2 = orch.queue_download("c", DownloadPriority::High);
        bool c_running = wait_for([&] { return engine.in_flight() == 2; });
        auto after = orch.get_queue_status();

        // FIFO within a priority: b starts when a finishes
        engine.release_key("a");
        bool b_running = wait_for([&] { return engine.fetch_count("b") == 1; });
        auto order = engine.started();
        engine.release_all();
        fa.get();
        fb.get();
        auto rc = fc.get();
        auto rc2 = fc2.get();

        ASSERT_TRUE(a_running, "a should start");
        ASSERT_EQ(before.active, (size_t)1, "one active under the Low cap");
        ASSERT_EQ(before.queued, (size_t)2, "two queued");
        ASSERT_TRUE(c_running, "escalated c should start");
        ASSERT_EQ(after.active, (size_t)2, "two active");
        ASSERT_EQ(after.queued, (size_t)1, "b still queued");
        ASSERT_TRUE(b_running, "b starts after a");
        ASSERT_EQ(order.size(), (size_t)3, "three fetches");
        ASSERT_EQ(order[0], "a", "a first");
        ASSERT_EQ(order[1], "c", "escalated c second");
        ASSERT_EQ(order[2], "b", "b last");
        ASSERT_TRUE(rc.success && rc2.success, "joined callers share the outcome");
        ASSERT_EQ(engine.fetch_count("c"), 1, "c fetched once");
        PASS();
    }
    {
        TEST(set_concurrency_releases_queue);
        FakeEngine engine;
        engine.add("a");
        engine.add("b");
        engine.hold(true);
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        auto fa = orch.queue_download("a", DownloadPriority::Low);
        auto fb = orch.queue_download("b", DownloadPriority::Low);
        bool one = wait_for([&] { return engine.in_flight() == 1; });
        orch.set_concurrency(DownloadPriority::Low, 2);
        bool two = wait_for([&] { return engine.in_flight() == 2; });
        engine.release_all();
        fa.get();
        fb.get();
        ASSERT_TRUE(one, "one under cap 1");
        ASSERT_TRUE(two, "two after raising the cap");
        PASS();
    }
    {
        TEST(cancel_racing_escalation_completes_once);
        FakeEngine engine;
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator::Options options;
        options.caps = {0, 0, 0, 4};  // Low jobs stay queued until escalated
        DownloadOrchestrator orch(engine, repo, options);

        const int rounds = 2000;
        int resolved = 0;
        for (int i = 0; i < rounds; ++i) {
            std::string key = "race-" + std::to_string(i);
            engine.add(key);
            auto queued = orch.queue_download(key, DownloadPriority::Low);

            std::atomic<bool> go{false};
            std::shared_future<DownloadResult> escalated;
            std::thread canceller([&] {
                while (!go.load()) {}
                orch.cancel_download(key);
            });
            std::thread joiner([&] {
                while (!go.load()) {}
                escalated = orch.queue_download(key, DownloadPriority::Critical);
            });
            go.store(true);
            canceller.join();
            joiner.join();

            auto first = queued.get();
            auto second = escalated.get();
            if ((first.success || first.cancelled) && (second.success || second.cancelled)) {
                resolved++;
            }
        }
        bool drained = wait_for([&] {
            auto q = orch.get_queue_status();
            return q.active == 0 && q.queued == 0;
        });
        auto stats = orch.get_stats();

        ASSERT_EQ(resolved, rounds, "every caller resolved as success or cancelled");
        ASSERT_TRUE(drained, "no job left running or queued");
        ASSERT_EQ(orch.get_queue_status().active, (size_t)0, "running count did not wrap");
        ASSERT_EQ(stats.fetches_succeeded + stats.fetches_cancelled + stats.fetches_failed,
                  static_cast<uint64_t>(stats.requests - stats.coalesced),
                  "each job completed exactly once");
        PASS();
    }
    {
        TEST(evicted_before_load_downloads_again);
        FakeEngine engine;
        engine.add("k");
        engine.evict_before_load("k");
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        auto load = orch.queue_download_to_load("k", DownloadPriority::Normal);
        ASSERT_TRUE(load.success, "load succeeds after a second download: " + load.error_message);
        ASSERT_EQ(engine.fetch_count("k"), 2, "fetched again after eviction");
        ASSERT_EQ(engine.loads(), 1, "one successful load");
        ASSERT_TRUE(repo.contains_key("k"), "handle registered");
        PASS();
    }
    {
        TEST(load_and_unload_handles);
        FakeEngine engine;
        engine.add("auto");
        engine.add("manual");
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        auto a = orch.queue_download_to_load("auto", DownloadPriority::Normal, true);
        auto m = orch.queue_download_to_load("manual", DownloadPriority::Normal, false);
        ASSERT_TRUE(a.success && m.success, "both load");
        auto again = orch.queue_download_to_load("auto", DownloadPriority::Normal, true);
        ASSERT_TRUE(again.handle == a.handle, "existing handle reused");
        ASSERT_EQ(engine.loads(), 2, "no second load");
        ASSERT_EQ(orch.unload_auto_unload_handles(), (size_t)1, "auto handle unloaded");
        ASSERT_TRUE(orch.unload_handle("manual"), "manual handle unloaded");
        ASSERT_TRUE(!orch.unload_handle("manual"), "already gone");
        ASSERT_EQ(engine.releases(), 2, "both released through the engine");
        PASS();
    }
    {
        TEST(stop_cancels_everything);
        FakeEngine engine;
        engine.add("a");
        engine.add("b");
        engine.hold(true);
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        auto fa = orch.queue_download("a", DownloadPriority::Low);
        auto fb = orch.queue_download("b", DownloadPriority::Low);
        bool running = wait_for([&] { return engine.in_flight() == 1; });
        orch.stop();
        auto ra = fa.get();
        auto rb = fb.get();
        auto late = orch.queue_download("a", DownloadPriority::Critical).get();

        ASSERT_TRUE(running, "a should start");
        ASSERT_TRUE(ra.cancelled, "running job cancelled");
        ASSERT_TRUE(rb.cancelled, "queued job cancelled");
        ASSERT_TRUE(late.cancelled, "requests after stop are cancelled");
        ASSERT_TRUE(!repo.is_operation_in_progress("a"), "detached and idle");
        ASSERT_EQ(orch.get_queue_status().active, (size_t)0, "nothing active");
        orch.stop();  // idempotent
        PASS();
    }
    {
        TEST(completion_callback_once_per_caller);
        FakeEngine engine;
        engine.add("k");
        engine.hold(true);
        HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
        DownloadOrchestrator orch(engine, repo);

        std::atomic<int> calls{0};
        auto f1 = orch.queue_download("k", DownloadPriority::Normal, {}, {},
                                      [&calls](const DownloadResult&) { calls++; });
        auto f2 = orch.queue_download("k", DownloadPriority::Normal, {}, {},
                                      [&calls](const DownloadResult&) { calls++; });
        engine.release_all();
        f1.get();
        f2.get();
        ASSERT_TRUE(wait_for([&] { return calls.load() == 2; }), "each caller notified");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ASSERT_EQ(calls.load(), 2, "exactly once each");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 11. Content deployment
// ---------------------------------------------------------------------------

static void test_content_deployment() {
    std::cout << "\n=== Content deployment ===" << std::endl;

    auto tmpdir = make_temp_dir("assetcdn-deploy");
    auto build = tmpdir / "build";
    write_file(build / "catalog.json", R"({"bundles":[]})");
    write_file(build / "sub" / "b.bundle", std::string(100, 'b'));
    write_file(build / "sub" / "c.txt", "ccc");

    // 64-byte threshold so b.bundle goes through multipart staging
    auto store = ObjectStoreFactory::create_local(tmpdir / "root", 64, 32);
    ContentDeploymentService service(*store);

    {
        TEST(upload_three_files);
        ProgressLog log;
        auto report = service.upload_directory(build, "mybucket", "v1.2.3", log.sink());
        ASSERT_TRUE(report.success, "upload succeeds");
        ASSERT_EQ(report.total_files, (size_t)3, "three files");
        ASSERT_EQ(report.uploaded.size(), (size_t)3, "three uploaded");
        ASSERT_TRUE(report.failed.empty() && report.unknown.empty(), "nothing failed");
        ASSERT_EQ(report.bytes_uploaded, 117u, "bytes uploaded");
        ASSERT_TRUE(log.fractions.size() >= 3, "at least one callback per file");
        ASSERT_TRUE(is_non_decreasing(log.fractions), "progress is monotonic");
        ASSERT_EQ(log.fractions.back(), 1.0, "ends at 1.0");
        ASSERT_EQ(log.items.back(), "Complete", "final item");

        auto keys = list_keys(*store, "mybucket", "v1.2.3/");
        ASSERT_EQ(keys.size(), (size_t)3, "exactly three objects");
        ASSERT_EQ(keys[0], "v1.2.3/catalog.json", "first key");
        ASSERT_EQ(keys[1], "v1.2.3/sub/b.bundle", "second key");
        ASSERT_EQ(read_file(tmpdir / "root" / "mybucket" / "v1.2.3" / "sub" / "b.bundle"),
                  std::string(100, 'b'), "multipart content assembled");
        PASS();
    }
    {
        TEST(delete_prefix_leaves_others);
        store->put_object("mybucket", "v9.9.9/keep.txt", bytes_of("keep"));
        ProgressLog log;
        auto report = service.delete_all_bucket_contents("mybucket", "v1.2.3/", log.sink());
        ASSERT_TRUE(report.success, "delete succeeds");
        ASSERT_EQ(report.total, (size_t)3, "snapshot total");
        ASSERT_EQ(report.deleted, (size_t)3, "all deleted");
        ASSERT_EQ(log.items.back(), "Deleted 3 of 3 objects", "progress message");
        ASSERT_EQ(log.fractions.back(), 1.0, "progress complete");
        ASSERT_TRUE(list_keys(*store, "mybucket", "v1.2.3/").empty(), "prefix empty");
        ASSERT_EQ(list_keys(*store, "mybucket", "v9.9.9/").size(), (size_t)1, "other prefix kept");
        PASS();
    }
    {
        TEST(delete_nothing);
        ProgressLog log;
        auto report = service.delete_all_bucket_contents("mybucket", "absent/", log.sink());
        ASSERT_TRUE(report.success, "succeeds");
        ASSERT_EQ(log.items.size(), (size_t)1, "one callback");
        ASSERT_EQ(log.items[0], "No objects to delete", "message");
        ASSERT_EQ(log.fractions[0], 1.0, "complete");
        PASS();
    }
    {
        TEST(cleanup_with_nothing_is_idempotent);
        for (int round = 0; round < 2; ++round) {
            ProgressLog log;
            auto report = service.cleanup_multipart_uploads("mybucket", "", log.sink());
            ASSERT_TRUE(report.success, "cleanup succeeds");
            ASSERT_EQ(report.found, (size_t)0, "nothing found");
            ASSERT_EQ(log.fractions.size(), (size_t)1, "one callback");
            ASSERT_EQ(log.fractions[0], 1.0, "100% immediately");
            ASSERT_EQ(log.items[0], "No multipart uploads to clean up", "message");
        }
        PASS();
    }
    {
        TEST(cancel_after_first_file_then_cleanup);
        DeploymentOptions options;
        options.upload_concurrency = 1;
        ContentDeploymentService serial(*store, options);

        auto src = tmpdir / "cancel-src";
        write_file(src / "a.txt", "first");
        write_file(src / "b.bin", std::string(200, 'x'));
        write_file(src / "c.txt", "third");

        CancellationSource cancel;
        DeployProgress sink = [&cancel](double, const std::string& item) {
            // Fires on b.bin's first part, after a.txt completed
            if (item == "b.bin") cancel.cancel();
        };
        auto report = serial.upload_directory(src, "mybucket", "rel", sink, cancel.token());
        ASSERT_TRUE(!report.success, "not success");
        ASSERT_TRUE(report.error == ErrorKind::Cancelled, "distinct cancellation outcome");
        ASSERT_EQ(report.uploaded.size(), (size_t)1, "file 1 known-good");
        ASSERT_EQ(report.uploaded[0], "rel/a.txt", "a uploaded");
        ASSERT_TRUE(report.failed.empty(), "nothing reported as failed");
        ASSERT_EQ(report.unknown.size(), (size_t)2, "files 2 and 3 unknown");

        auto pending = store->list_multipart_uploads("mybucket", "rel/");
        ASSERT_EQ(pending.uploads.size(), (size_t)1, "file 2 left a remnant");

        auto cleanup = service.cleanup_multipart_uploads("mybucket", "");
        ASSERT_TRUE(cleanup.success, "cleanup succeeds");
        ASSERT_EQ(cleanup.found, (size_t)1, "one found");
        ASSERT_EQ(cleanup.aborted, (size_t)1, "one aborted");
        ASSERT_TRUE(store->list_multipart_uploads("mybucket", "").uploads.empty(), "remnant removed");
        PASS();
    }
    {
        TEST(expired_upload_is_timeout);
        DeploymentOptions options;
        options.upload_timeout = std::chrono::minutes(0);
        ContentDeploymentService hasty(*store, options);
        auto report = hasty.upload_directory(build, "mybucket", "late");
        ASSERT_TRUE(!report.success, "not success");
        ASSERT_TRUE(report.error == ErrorKind::Timeout, "timeout outcome");
        ASSERT_EQ(report.unknown.size(), (size_t)3, "state unknown for every file");
        PASS();
    }
    {
        TEST(partial_upload_reports_sets);
        DeploymentOptions options;
        options.upload_concurrency = 1;
        ContentDeploymentService serial(*store, options);

        // ".multipart" is reserved by the local store, so that key is rejected
        auto src = tmpdir / "partial-src";
        write_file(src / "a.txt", "ok");
        write_file(src / "z" / ".multipart" / "x.txt", "rejected");
        auto report = serial.upload_directory(src, "mybucket", "partial");
        ASSERT_TRUE(!report.success, "not success");
        ASSERT_TRUE(report.error == ErrorKind::Partial, "partial outcome");
        ASSERT_EQ(report.uploaded.size(), (size_t)1, "one known-good");
        ASSERT_EQ(report.failed.size(), (size_t)1, "one failed");
        PASS();
    }
    {
        TEST(fail_fast_on_configuration);
        auto r1 = service.upload_directory(build, "", "v1");
        ASSERT_TRUE(r1.error == ErrorKind::Config, "empty bucket");
        auto r2 = service.upload_directory(tmpdir / "missing", "mybucket", "v1");
        ASSERT_TRUE(r2.error == ErrorKind::Config, "missing directory");
        auto r3 = service.delete_all_bucket_contents("", "");
        ASSERT_TRUE(r3.error == ErrorKind::Config, "delete without bucket");
        auto r4 = service.cleanup_multipart_uploads("", "");
        ASSERT_TRUE(r4.error == ErrorKind::Config, "cleanup without bucket");
        PASS();
    }
    {
        TEST(empty_directory_completes);
        fs::create_directories(tmpdir / "empty");
        ProgressLog log;
        auto report = service.upload_directory(tmpdir / "empty", "mybucket", "v0", log.sink());
        ASSERT_TRUE(report.success, "empty upload succeeds");
        ASSERT_EQ(log.items.size(), (size_t)1, "one callback");
        ASSERT_EQ(log.items[0], "Complete", "complete");
        PASS();
    }
    {
        TEST(test_connection);
        auto ok = service.test_connection("mybucket");
        ASSERT_TRUE(ok.success, "existing bucket");
        ASSERT_TRUE(ok.bucket_visible, "visible");
        auto missing = service.test_connection("ghost");
        ASSERT_TRUE(!missing.success, "missing bucket fails");
        ASSERT_TRUE(missing.error == ErrorKind::NotFound, "not found");
        PASS();
    }
    {
        TEST(latest_version);
        store->put_object("versions", "v20240101_120000/a", bytes_of("1"));
        store->put_object("versions", "v20250102_000000/a", bytes_of("2"));
        store->put_object("versions", "v20251399_000000/a", bytes_of("bad month"));
        store->put_object("versions", "vbogus/a", bytes_of("bad"));
        store->put_object("versions", "top.txt", bytes_of("file"));
        auto result = service.latest_version("versions");
        ASSERT_TRUE(result.success, "succeeds");
        ASSERT_EQ(result.version, "v20250102_000000", "newest well-formed version");

        store->put_object("versions", "nested/v20260101_000000/a", bytes_of("n"));
        auto nested = service.latest_version("versions", "nested");
        ASSERT_EQ(nested.version, "v20260101_000000", "under a parent prefix");
        PASS();
    }
    {
        TEST(copy_objects);
        store->put_object("copies", "src/a.txt", bytes_of("a"));
        store->put_object("copies", "src/d/b.txt", bytes_of("b"));
        ProgressLog log;
        auto report = service.copy_objects("copies", "src", "dst/", log.sink());
        ASSERT_TRUE(report.success, "copy succeeds");
        ASSERT_EQ(report.copied, (size_t)2, "two copied");
        auto keys = list_keys(*store, "copies", "dst/");
        ASSERT_EQ(keys.size(), (size_t)2, "two under target");
        ASSERT_EQ(keys[1], "dst/d/b.txt", "relative key kept");
        ASSERT_EQ(log.fractions.back(), 1.0, "progress complete");

        auto same = service.copy_objects("copies", "src", "src");
        ASSERT_TRUE(same.error == ErrorKind::Config, "same prefix rejected");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 12. Bundle cache
// ---------------------------------------------------------------------------

static void test_bundle_cache() {
    std::cout << "\n=== Bundle cache ===" << std::endl;

    auto tmpdir = make_temp_dir("assetcdn-bundles");
    auto store = ObjectStoreFactory::create_local(tmpdir / "store");
    for (const char* name : {"a", "b", "c"}) {
        store->put_object("cdn", std::string("bundles/") + name, bytes_of(std::string(100, name[0])));
    }

    BundleCacheConfig config;
    config.cache_dir = tmpdir / "cache";

    {
        TEST(fetch_and_load);
        BundleCache cache(config, make_store_source(*store, "cdn", "bundles"));
        auto start_err = cache.start();
        ASSERT_EMPTY(start_err, "start");
        cache.register_bundle("a", "a", 100);
        ASSERT_TRUE(cache.is_known("a") && !cache.is_known("zzz"), "catalog lookup");
        ASSERT_EQ(cache.download_size("a"), 100u, "size before fetch");

        std::vector<double> progress;
        auto outcome = cache.fetch_and_cache("a", DownloadPriority::Normal, {},
                                             [&progress](double v) { progress.push_back(v); });
        ASSERT_TRUE(outcome.status == FetchStatus::Succeeded, "fetch succeeds");
        ASSERT_TRUE(cache.is_cached("a"), "cached");
        ASSERT_EQ(cache.download_size("a"), 0u, "nothing left to fetch");
        ASSERT_EQ(cache.total_cache_bytes(), 100u, "bytes tracked");
        ASSERT_TRUE(!progress.empty() && progress.back() == 1.0, "progress completes");

        auto load = cache.load("a");
        ASSERT_TRUE(load.success, "load succeeds");
        auto bundle = std::dynamic_pointer_cast<BundleResource>(load.handle);
        ASSERT_TRUE(bundle != nullptr, "bundle resource");
        ASSERT_EQ(bundle->data().size(), (size_t)100, "bundle bytes");
        ASSERT_EQ(static_cast<char>(bundle->data()[0]), 'a', "bundle content");
        cache.release(load.handle);

        auto unknown = cache.fetch_and_cache("zzz", DownloadPriority::Normal, {}, {});
        ASSERT_TRUE(unknown.error == ErrorKind::NotFound, "unknown key");
        PASS();
    }
    {
        TEST(manifest_persists_across_restart);
        BundleCache cache(config, make_store_source(*store, "cdn", "bundles"));
        auto start_err = cache.start();
        ASSERT_EMPTY(start_err, "start");
        ASSERT_TRUE(cache.is_cached("a"), "still cached after restart");
        ASSERT_EQ(cache.total_cache_bytes(), 100u, "bytes restored");
        auto stats = cache.get_stats();
        ASSERT_EQ(stats.entries, 1u, "one entry");
        PASS();
    }
    {
        TEST(missing_file_dropped_on_start);
        for (auto& entry : fs::directory_iterator(config.cache_dir / "bundles")) {
            fs::remove(entry.path());
        }
        write_file(config.cache_dir / "bundles" / "orphan.bundle.fetch", "partial");
        BundleCache cache(config, make_store_source(*store, "cdn", "bundles"));
        auto start_err = cache.start();
        ASSERT_EMPTY(start_err, "start");
        ASSERT_TRUE(!cache.is_cached("a"), "stale entry dropped");
        ASSERT_EQ(cache.total_cache_bytes(), 0u, "no bytes");
        ASSERT_TRUE(!fs::exists(config.cache_dir / "bundles" / "orphan.bundle.fetch"),
                    "orphan removed");
        PASS();
    }
    {
        TEST(cancelled_fetch_leaves_nothing);
        BundleCache cache(config, make_store_source(*store, "cdn", "bundles"));
        auto start_err = cache.start();
        ASSERT_EMPTY(start_err, "start");
        cache.register_bundle("a", "a", 100);
        CancellationSource cancel;
        cancel.cancel();
        auto outcome = cache.fetch_and_cache("a", DownloadPriority::Normal, cancel.token(), {});
        ASSERT_TRUE(outcome.status == FetchStatus::Cancelled, "cancelled");
        ASSERT_TRUE(!cache.is_cached("a"), "not cached");
        ASSERT_TRUE(fs::is_empty(config.cache_dir / "bundles"), "no partial file");
        PASS();
    }
    {
        TEST(eviction_skips_loaded_bundles);
        BundleCacheConfig small = config;
        small.max_cache_bytes = 250;
        BundleCache cache(small, make_store_source(*store, "cdn", "bundles"));
        auto start_err = cache.start();
        ASSERT_EMPTY(start_err, "start");
        cache.register_bundle("a", "a", 100);
        cache.register_bundle("b", "b", 100);
        cache.register_bundle("c", "c", 100);

        cache.fetch_and_cache("a", DownloadPriority::Normal, {}, {});
        cache.fetch_and_cache("b", DownloadPriority::Normal, {}, {});
        auto pinned = cache.load("a");
        ASSERT_TRUE(pinned.success, "a loaded");
        cache.fetch_and_cache("c", DownloadPriority::Normal, {}, {});

        ASSERT_TRUE(cache.is_cached("a"), "loaded bundle kept");
        ASSERT_TRUE(!cache.is_cached("b"), "unpinned bundle evicted");
        ASSERT_TRUE(cache.is_cached("c"), "just-fetched bundle kept");
        ASSERT_TRUE(cache.total_cache_bytes() <= 250u, "under the limit");
        ASSERT_EQ(cache.get_stats().evictions, 1u, "one eviction");

        ASSERT_TRUE(!cache.clear_bundle("a"), "loaded bundle cannot be cleared");
        cache.release(pinned.handle);
        ASSERT_TRUE(cache.clear_bundle("a"), "released bundle cleared");
        ASSERT_TRUE(!cache.clear_bundle("a"), "second clear is a no-op");
        ASSERT_EQ(cache.clear_all(), (size_t)1, "c cleared");
        ASSERT_EQ(cache.total_cache_bytes(), 0u, "empty");
        PASS();
    }
    {
        TEST(catalog_json);
        write_file(tmpdir / "catalog.json",
            R"({"bundles":[{"key":"a","path":"a","size":100},{"key":"x"}]})");
        BundleCache cache(config, make_store_source(*store, "cdn", "bundles"));
        auto start_err = cache.start();
        ASSERT_EMPTY(start_err, "start");
        auto catalog_err = cache.load_catalog(tmpdir / "catalog.json");
        ASSERT_EMPTY(catalog_err, "catalog loads");
        ASSERT_EQ(cache.catalog_size(), (size_t)2, "two entries");
        ASSERT_TRUE(cache.is_known("x"), "path defaults to key");

        write_file(tmpdir / "bad.json", R"({"items":[]})");
        ASSERT_NOT_EMPTY(cache.load_catalog(tmpdir / "bad.json"), "missing bundles array");
        PASS();
    }
    {
        TEST(orchestrated_bundle_load);
        BundleCache cache(config, make_store_source(*store, "cdn", "bundles"));
        auto start_err = cache.start();
        ASSERT_EMPTY(start_err, "start");
        cache.register_bundle("b", "b", 100);
        HandleRepository repo([&cache](const ResourceHandle& h) { cache.release(h); });
        DownloadOrchestrator orch(cache, repo);

        auto load = orch.queue_download_to_load("b", DownloadPriority::Critical);
        ASSERT_TRUE(load.success, "download and load");
        ASSERT_EQ(load.handle->size_bytes(), 100u, "handle size");
        ASSERT_TRUE(!cache.clear_bundle("b"), "registered handle pins the bundle");
        ASSERT_TRUE(orch.unload_handle("b"), "unloaded");
        ASSERT_TRUE(cache.clear_bundle("b"), "clearable after unload");
        orch.stop();
        PASS();
    }
    {
        TEST(no_source_serves_cache_only);
        BundleCache cache(config, nullptr);
        auto start_err = cache.start();
        ASSERT_EMPTY(start_err, "start without a source");
        cache.register_bundle("c", "c", 100);
        auto outcome = cache.fetch_and_cache("c", DownloadPriority::Normal, {}, {});
        ASSERT_TRUE(outcome.error == ErrorKind::Config, "fetch needs a source");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 13. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto tmpdir = make_temp_dir("assetcdn-metrics");
    auto prom_path = tmpdir / "test.prom";

    {
        TEST(creates_prom_file);
        std::map<std::string, std::string> labels = {{"operation", "upload"}};
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), labels);
        exporter.start();

        bool created = wait_for([&]{ return fs::exists(prom_path); }, 5000);
        exporter.stop();

        ASSERT_TRUE(created, ".prom file should be created");
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("assetcdn_uploads_total") != std::string::npos,
                    "should contain assetcdn_uploads_total");
        ASSERT_TRUE(content.find("assetcdn_downloads_active") != std::string::npos,
                    "should contain assetcdn_downloads_active");
        ASSERT_TRUE(content.find("assetcdn_fetch_duration_seconds") != std::string::npos,
                    "should contain assetcdn_fetch_duration_seconds");
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(counter_increments_appear);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        exporter.uploads_success().Increment();
        exporter.uploads_success().Increment();
        exporter.upload_bytes_total().Increment(12345);
        exporter.multipart_aborted().Increment();
        exporter.stop();

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("assetcdn_uploads_total{result=\"success\"} 2") != std::string::npos,
                    "success counter is 2");
        ASSERT_TRUE(content.find("assetcdn_upload_bytes_total 12345") != std::string::npos,
                    "bytes counter");
        ASSERT_TRUE(content.find("assetcdn_multipart_uploads_aborted_total 1") != std::string::npos,
                    "aborted counter");
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(scoped_timer_records_duration);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        {
            ScopedTimer timer(exporter.upload_duration());
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        exporter.stop();

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("assetcdn_upload_duration_seconds_count 1") != std::string::npos,
                    "histogram count should be 1");
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(orchestrator_feeds_metrics);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        {
            FakeEngine engine;
            engine.add("k");
            engine.add("cached");
            engine.set_cached("cached");
            HandleRepository repo([&engine](const ResourceHandle& h) { engine.release(h); });
            DownloadOrchestrator orch(engine, repo, &exporter);
            exporter.set_orchestrator(&orch);
            exporter.set_repository(&repo);

            orch.queue_download_to_load("k", DownloadPriority::Normal);
            orch.pre_download_asset("cached", DownloadPriority::Normal);
            exporter.write_file();
            exporter.stop();

            exporter.set_orchestrator(nullptr);
            exporter.set_repository(nullptr);
        }

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("assetcdn_downloads_total{result=\"success\"} 1") != std::string::npos,
                    "one successful download");
        ASSERT_TRUE(content.find("assetcdn_download_requests_total{type=\"cache_hit\"} 1") != std::string::npos,
                    "one cache hit");
        ASSERT_TRUE(content.find("assetcdn_handles_loaded 1") != std::string::npos,
                    "one handle loaded");
        PASS();
    }

    {
        TEST(atomic_rename_no_tmp_left);
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), {});
        exporter.start();
        bool created = wait_for([&]{ return fs::exists(prom_path); }, 5000);
        exporter.stop();
        ASSERT_TRUE(created, "file should exist");
        auto tmp_path = prom_path;
        tmp_path += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp_path), ".tmp file should not persist");
        PASS();
    }

    {
        TEST(constant_labels_present);
        fs::remove(prom_path);
        std::map<std::string, std::string> labels = {
            {"operation", "delete"},
            {"bucket", "quest-android-product-staging"},
        };
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), labels);
        exporter.stop();

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("operation=\"delete\"") != std::string::npos,
                    "should contain operation label");
        ASSERT_TRUE(content.find("bucket=\"quest-android-product-staging\"") != std::string::npos,
                    "should contain bucket label");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "assetcdn test suite" << std::endl;
    std::cout << "===================" << std::endl;

    test_error_classification();
    test_http_signing();
    test_backend_config_validation();
    test_config_cli_parsing();
    test_config_json();
    test_config_defaults_and_validation();
    test_cdn_profile();
    test_deployment_helpers();
    test_local_object_store();
    test_handle_repository();
    test_orchestrator();
    test_content_deployment();
    test_bundle_cache();
    test_metrics();

    std::cout << "\n===================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
