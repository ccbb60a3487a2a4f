#include "assetcdn/bundle_cache.hpp"
#include "assetcdn/log.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>
#include <unordered_set>

namespace assetcdn {

namespace {

constexpr const char* MANIFEST_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS bundles (
    key TEXT PRIMARY KEY,
    file TEXT NOT NULL,
    size INTEGER NOT NULL,
    last_access INTEGER NOT NULL,
    created_at INTEGER NOT NULL
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_lru ON bundles(last_access);
)";

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

void prepare(sqlite3* db, const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db, sql, -1, stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Cannot prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// --- Sources ---

class HttpBundleSource : public BundleSource {
public:
    HttpBundleSource(std::string base_url, const net::HttpClientConfig& config)
        : base_url_(std::move(base_url))
        , client_(config) {
        while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    }

    std::string describe() const override { return base_url_; }

    FetchOutcome fetch(const std::string& remote_path, const std::filesystem::path& dest,
                       const CancellationToken& token,
                       const TransferProgress& progress) override {
        auto url = base_url_ + "/" + net::url_encode_path(remote_path);
        net::HttpRequest request = net::HttpRequest::get(url);
        request.output_path = dest.string();
        request.progress_callback = [&token, &progress](const net::HttpProgress& p) {
            if (token.is_cancelled()) return false;
            if (progress && p.download_total > 0) progress(p.download_now, p.download_total);
            return true;
        };

        for (uint32_t attempt = 0;; ++attempt) {
            auto response = client_.execute(request);
            if (response.aborted || token.is_cancelled()) return FetchOutcome::cancelled();
            if (response.ok() && response.error.empty()) {
                return FetchOutcome::ok(response.bytes_received);
            }
            if (!response.is_network_error && !response.error.empty()) {
                return FetchOutcome::failed(ErrorKind::Backend, response.error);
            }

            auto kind = classify_http(response.status_code, response.is_network_error,
                                      response.body_string());
            std::string msg = response.is_network_error
                ? response.error
                : "HTTP " + std::to_string(response.status_code) + " for " + url;
            if (!is_retryable(kind, response.status_code) ||
                attempt >= constants::DEFAULT_MAX_ERROR_RETRY) {
                return FetchOutcome::failed(kind, msg);
            }
            log_debug("GET %s: %s, retrying (%u/%u)", url.c_str(), msg.c_str(), attempt + 1,
                      constants::DEFAULT_MAX_ERROR_RETRY);
            auto backoff = std::chrono::milliseconds(250 * (1 << std::min(attempt, 6u)));
            if (!sleep_unless_cancelled(backoff, token)) return FetchOutcome::cancelled();
        }
    }

private:
    std::string base_url_;
    net::HttpClient client_;
};

class StoreBundleSource : public BundleSource {
public:
    StoreBundleSource(ObjectStore& store, std::string bucket, std::string prefix)
        : store_(store)
        , bucket_(std::move(bucket))
        , prefix_(std::move(prefix)) {
        while (!prefix_.empty() && prefix_.back() == '/') prefix_.pop_back();
    }

    std::string describe() const override {
        return store_.type_name() + "://" + bucket_ + (prefix_.empty() ? "" : "/" + prefix_);
    }

    FetchOutcome fetch(const std::string& remote_path, const std::filesystem::path& dest,
                       const CancellationToken& token,
                       const TransferProgress& progress) override {
        GetOptions opts;
        opts.cancel = token;
        opts.progress = progress;
        auto key = prefix_.empty() ? remote_path : prefix_ + "/" + remote_path;
        auto result = store_.get_object(bucket_, key, dest, opts);
        if (result.success) return FetchOutcome::ok(result.bytes);
        if (result.error == ErrorKind::Cancelled) return FetchOutcome::cancelled();
        return FetchOutcome::failed(result.error, result.error_message);
    }

private:
    ObjectStore& store_;
    std::string bucket_;
    std::string prefix_;
};

}  // namespace

std::unique_ptr<BundleSource> make_http_source(const std::string& base_url,
                                               net::HttpClientConfig config) {
    return std::make_unique<HttpBundleSource>(base_url, config);
}

std::unique_ptr<BundleSource> make_store_source(ObjectStore& store, const std::string& bucket,
                                                const std::string& prefix) {
    return std::make_unique<StoreBundleSource>(store, bucket, prefix);
}

// --- BundleCache ---

BundleCache::BundleCache(const BundleCacheConfig& config, std::unique_ptr<BundleSource> source)
    : config_(config)
    , source_(std::move(source)) {}

BundleCache::~BundleCache() {
    if (stmt_insert_) sqlite3_finalize(stmt_insert_);
    if (stmt_get_entry_) sqlite3_finalize(stmt_get_entry_);
    if (stmt_delete_) sqlite3_finalize(stmt_delete_);
    if (stmt_update_access_) sqlite3_finalize(stmt_update_access_);
    if (stmt_get_evict_candidates_) sqlite3_finalize(stmt_get_evict_candidates_);
    if (stmt_count_) sqlite3_finalize(stmt_count_);

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

std::string BundleCache::start() {
    if (config_.cache_dir.empty()) return "cache_dir is required";

    std::error_code ec;
    std::filesystem::create_directories(bundles_dir(), ec);
    if (ec) return "Cannot create " + bundles_dir().string() + ": " + ec.message();

    try {
        init_manifest();
        verify_entries();
    } catch (const std::exception& e) {
        return e.what();
    }

    log_info("Bundle cache ready: %s (%llu bytes cached, source %s)",
             config_.cache_dir.c_str(),
             static_cast<unsigned long long>(cache_bytes_.load()),
             source_ ? source_->describe().c_str() : "none");
    evict_to_limit();
    return {};
}

void BundleCache::init_manifest() {
    auto db_path = config_.cache_dir / "manifest.db";
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Cannot open manifest: " + std::string(sqlite3_errmsg(db_)));
    }

    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, MANIFEST_SCHEMA)) {
        throw std::runtime_error("Cannot create manifest schema in " + db_path.string());
    }

    prepare(db_,
        "INSERT OR REPLACE INTO bundles (key, file, size, last_access, created_at) "
        "VALUES (?1, ?2, ?3, ?4, ?4)",
        &stmt_insert_);
    prepare(db_, "SELECT key, file, size FROM bundles WHERE key = ?1", &stmt_get_entry_);
    prepare(db_, "DELETE FROM bundles WHERE key = ?1", &stmt_delete_);
    prepare(db_, "UPDATE bundles SET last_access = ?2 WHERE key = ?1", &stmt_update_access_);
    prepare(db_, "SELECT key, file, size FROM bundles ORDER BY last_access ASC",
            &stmt_get_evict_candidates_);
    prepare(db_, "SELECT COUNT(*), COALESCE(SUM(size), 0) FROM bundles", &stmt_count_);
}

void BundleCache::verify_entries() {
    std::vector<ManifestRow> rows;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        sqlite3_reset(stmt_get_evict_candidates_);
        while (sql_step_retry(stmt_get_evict_candidates_) == SQLITE_ROW) {
            ManifestRow row;
            row.key = column_text(stmt_get_evict_candidates_, 0);
            row.file = column_text(stmt_get_evict_candidates_, 1);
            row.size = static_cast<uint64_t>(sqlite3_column_int64(stmt_get_evict_candidates_, 2));
            rows.push_back(std::move(row));
        }
        sqlite3_reset(stmt_get_evict_candidates_);
    }

    uint64_t total = 0;
    size_t dropped = 0;
    std::unordered_set<std::string> known_files;
    for (auto& row : rows) {
        std::error_code ec;
        auto path = bundles_dir() / row.file;
        auto size = std::filesystem::file_size(path, ec);
        if (ec || size != row.size) {
            delete_row(row.key);
            std::filesystem::remove(path, ec);
            dropped++;
            continue;
        }
        known_files.insert(row.file);
        total += row.size;
    }

    // Leftovers from interrupted fetches and files the manifest lost
    size_t orphans = 0;
    for (auto& entry : std::filesystem::directory_iterator(bundles_dir())) {
        if (!entry.is_regular_file()) continue;
        auto name = entry.path().filename().string();
        if (known_files.count(name)) continue;
        std::error_code ec;
        std::filesystem::remove(entry.path(), ec);
        orphans++;
    }

    cache_bytes_ = total;
    if (dropped > 0 || orphans > 0) {
        log_info("Manifest verify: dropped %zu stale entries, removed %zu orphan files",
                 dropped, orphans);
    }
}

std::string BundleCache::file_name_for(const std::string& key) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_Digest(key.data(), key.size(), digest, &len, EVP_sha256(), nullptr);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str() + ".bundle";
}

// --- Catalog ---

void BundleCache::register_bundle(const std::string& key, const std::string& remote_path,
                                  uint64_t size) {
    std::unique_lock lock(catalog_mutex_);
    catalog_[key] = CatalogEntry{key, remote_path.empty() ? key : remote_path, size};
}

std::string BundleCache::load_catalog(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) return "Cannot open catalog: " + path.string();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::parse_error& e) {
        return "Catalog parse error: " + std::string(e.what());
    }

    if (!j.contains("bundles") || !j["bundles"].is_array()) {
        return "Catalog has no \"bundles\" array: " + path.string();
    }

    size_t added = 0;
    try {
        for (const auto& b : j["bundles"]) {
            auto key = b.at("key").get<std::string>();
            if (key.empty()) return "Catalog entry with empty key";
            auto remote = b.value("path", key);
            auto size = b.value("size", uint64_t{0});
            register_bundle(key, remote, size);
            added++;
        }
    } catch (const nlohmann::json::exception& e) {
        return "Invalid catalog entry: " + std::string(e.what());
    }

    log_info("Loaded %zu bundles from catalog %s", added, path.c_str());
    return {};
}

size_t BundleCache::catalog_size() const {
    std::shared_lock lock(catalog_mutex_);
    return catalog_.size();
}

// --- Manifest lookups ---

bool BundleCache::lookup_row(const std::string& key, ManifestRow& out) const {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    if (!db_) return false;
    sqlite3_reset(stmt_get_entry_);
    sqlite3_bind_text(stmt_get_entry_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    bool found = false;
    if (sql_step_retry(stmt_get_entry_) == SQLITE_ROW) {
        out.key = column_text(stmt_get_entry_, 0);
        out.file = column_text(stmt_get_entry_, 1);
        out.size = static_cast<uint64_t>(sqlite3_column_int64(stmt_get_entry_, 2));
        found = true;
    }
    sqlite3_reset(stmt_get_entry_);
    return found;
}

bool BundleCache::delete_row(const std::string& key) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_delete_);
    sqlite3_bind_text(stmt_delete_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_delete_);
    sqlite3_reset(stmt_delete_);
    if (rc != SQLITE_DONE) {
        log_error("Cannot delete manifest row for %s: %s", key.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool BundleCache::is_known(const std::string& key) const {
    std::shared_lock lock(catalog_mutex_);
    return catalog_.count(key) > 0;
}

bool BundleCache::is_cached(const std::string& key) const {
    ManifestRow row;
    return lookup_row(key, row);
}

uint64_t BundleCache::download_size(const std::string& key) const {
    uint64_t size = 0;
    {
        std::shared_lock lock(catalog_mutex_);
        auto it = catalog_.find(key);
        if (it == catalog_.end()) return 0;
        size = it->second.size;
    }
    return is_cached(key) ? 0 : size;
}

// --- Fetch ---

FetchOutcome BundleCache::fetch_and_cache(const std::string& key, DownloadPriority priority,
                                          const CancellationToken& token,
                                          const ProgressSink& progress) {
    CatalogEntry entry;
    {
        std::shared_lock lock(catalog_mutex_);
        auto it = catalog_.find(key);
        if (it == catalog_.end()) {
            return FetchOutcome::failed(ErrorKind::NotFound, "Unknown bundle: " + key);
        }
        entry = it->second;
    }

    ManifestRow existing;
    if (lookup_row(key, existing)) {
        if (progress) progress(1.0);
        return FetchOutcome::ok(existing.size);
    }

    if (token.is_cancelled()) return FetchOutcome::cancelled();
    if (!source_) {
        return FetchOutcome::failed(ErrorKind::Config, "No bundle source configured for " + key);
    }

    auto file = file_name_for(key);
    auto dest = bundles_dir() / file;
    auto part = dest;
    part += ".fetch";

    log_debug("Fetching bundle %s from %s (%s priority)", key.c_str(),
              entry.remote_path.c_str(), to_string(priority));

    uint64_t expected = entry.size;
    auto outcome = source_->fetch(entry.remote_path, part, token,
        [&progress, expected](uint64_t done, uint64_t total) {
            if (!progress) return;
            uint64_t denom = total > 0 ? total : expected;
            if (denom > 0) progress(static_cast<double>(done) / static_cast<double>(denom));
        });

    std::error_code ec;
    if (outcome.status != FetchStatus::Succeeded || token.is_cancelled()) {
        std::filesystem::remove(part, ec);
        std::lock_guard lock(stats_mutex_);
        if (outcome.status == FetchStatus::Succeeded || outcome.status == FetchStatus::Cancelled) {
            stats_.fetches_cancelled++;
            return FetchOutcome::cancelled();
        }
        stats_.fetches_failed++;
        return outcome;
    }

    std::filesystem::rename(part, dest, ec);
    if (ec) {
        std::filesystem::remove(part, ec);
        std::lock_guard lock(stats_mutex_);
        stats_.fetches_failed++;
        return FetchOutcome::failed(ErrorKind::Backend, "Cannot move bundle into cache: " + key);
    }

    auto size = std::filesystem::file_size(dest, ec);
    if (ec) size = outcome.bytes;

    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        sqlite3_reset(stmt_insert_);
        sqlite3_bind_text(stmt_insert_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, 2, file.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_insert_, 3, static_cast<int64_t>(size));
        sqlite3_bind_int64(stmt_insert_, 4, now_epoch());
        int rc = sql_step_retry(stmt_insert_);
        sqlite3_reset(stmt_insert_);
        if (rc != SQLITE_DONE) {
            std::string err = sqlite3_errmsg(db_);
            std::filesystem::remove(dest, ec);
            std::lock_guard lock(stats_mutex_);
            stats_.fetches_failed++;
            return FetchOutcome::failed(ErrorKind::Backend, "Manifest insert failed: " + err);
        }
    }

    cache_bytes_ += size;
    {
        std::lock_guard lock(stats_mutex_);
        stats_.fetches_completed++;
    }
    if (progress) progress(1.0);

    evict_to_limit(key);
    return FetchOutcome::ok(size);
}

// --- Load ---

LoadResult BundleCache::load(const std::string& key) {
    LoadResult result;
    ManifestRow row;
    if (!lookup_row(key, row)) {
        result.error = ErrorKind::NotFound;
        result.error_message = "Bundle not cached: " + key;
        return result;
    }
    if (row.size > config_.max_bundle_bytes) {
        result.error = ErrorKind::Backend;
        result.error_message = "Bundle too large to load: " + key;
        return result;
    }

    // Pin before reading so eviction cannot remove the file underneath us
    {
        std::lock_guard lock(loaded_mutex_);
        loaded_[key]++;
    }

    auto path = bundles_dir() / row.file;
    std::vector<uint8_t> data(row.size);
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs || !ifs.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()))) {
        {
            std::lock_guard lock(loaded_mutex_);
            if (--loaded_[key] == 0) loaded_.erase(key);
        }
        result.error = ErrorKind::Backend;
        result.error_message = "Cannot read cached bundle " + path.string();
        return result;
    }

    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        sqlite3_reset(stmt_update_access_);
        sqlite3_bind_text(stmt_update_access_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_update_access_, 2, now_epoch());
        sql_step_retry(stmt_update_access_);
        sqlite3_reset(stmt_update_access_);
    }
    {
        std::lock_guard lock(stats_mutex_);
        stats_.loads++;
    }

    result.success = true;
    result.handle = std::make_shared<BundleResource>(key, std::move(data));
    return result;
}

void BundleCache::release(const ResourceHandle& handle) {
    if (!handle) return;
    std::lock_guard lock(loaded_mutex_);
    auto it = loaded_.find(handle->key());
    if (it == loaded_.end()) return;
    if (--it->second == 0) loaded_.erase(it);
}

bool BundleCache::is_loaded(const std::string& key) const {
    std::lock_guard lock(loaded_mutex_);
    return loaded_.count(key) > 0;
}

// --- Maintenance ---

bool BundleCache::remove_cached(const ManifestRow& row) {
    if (!delete_row(row.key)) return false;
    std::error_code ec;
    std::filesystem::remove(bundles_dir() / row.file, ec);
    if (ec) {
        log_warn("Cannot remove %s: %s", row.file.c_str(), ec.message().c_str());
    }
    cache_bytes_ -= std::min<uint64_t>(row.size, cache_bytes_.load());
    return true;
}

bool BundleCache::clear_bundle(const std::string& key) {
    ManifestRow row;
    if (!lookup_row(key, row)) return false;
    if (is_loaded(key)) {
        log_warn("Bundle %s is loaded, not clearing", key.c_str());
        return false;
    }
    return remove_cached(row);
}

size_t BundleCache::clear_all() {
    std::vector<ManifestRow> rows;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        if (!db_) return 0;
        sqlite3_reset(stmt_get_evict_candidates_);
        while (sql_step_retry(stmt_get_evict_candidates_) == SQLITE_ROW) {
            ManifestRow row;
            row.key = column_text(stmt_get_evict_candidates_, 0);
            row.file = column_text(stmt_get_evict_candidates_, 1);
            row.size = static_cast<uint64_t>(sqlite3_column_int64(stmt_get_evict_candidates_, 2));
            rows.push_back(std::move(row));
        }
        sqlite3_reset(stmt_get_evict_candidates_);
    }

    size_t removed = 0;
    size_t skipped = 0;
    for (auto& row : rows) {
        if (is_loaded(row.key)) {
            skipped++;
            continue;
        }
        if (remove_cached(row)) removed++;
    }
    log_info("Cleared %zu bundles (%zu loaded bundles kept)", removed, skipped);
    return removed;
}

void BundleCache::evict_to_limit(const std::string& keep) {
    std::lock_guard<std::mutex> eviction_lock(eviction_mutex_);
    if (cache_bytes_.load() <= config_.max_cache_bytes) return;

    log_info("Eviction started: cache=%llu bytes, limit=%llu bytes",
             static_cast<unsigned long long>(cache_bytes_.load()),
             static_cast<unsigned long long>(config_.max_cache_bytes));

    std::vector<ManifestRow> candidates;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        sqlite3_reset(stmt_get_evict_candidates_);
        while (sql_step_retry(stmt_get_evict_candidates_) == SQLITE_ROW) {
            ManifestRow c;
            c.key = column_text(stmt_get_evict_candidates_, 0);
            c.file = column_text(stmt_get_evict_candidates_, 1);
            c.size = static_cast<uint64_t>(sqlite3_column_int64(stmt_get_evict_candidates_, 2));
            candidates.push_back(std::move(c));
        }
        sqlite3_reset(stmt_get_evict_candidates_);
    }

    for (auto& c : candidates) {
        if (cache_bytes_.load() <= config_.max_cache_bytes) break;
        if (c.key == keep || is_loaded(c.key)) continue;
        if (remove_cached(c)) {
            std::lock_guard lock(stats_mutex_);
            stats_.evictions++;
            log_debug("Evicted: %s (%llu bytes)", c.key.c_str(),
                      static_cast<unsigned long long>(c.size));
        }
    }

    if (cache_bytes_.load() > config_.max_cache_bytes) {
        log_warn("Cache still over limit after eviction (loaded bundles are pinned)");
    } else {
        log_info("Eviction complete: cache=%llu bytes",
                 static_cast<unsigned long long>(cache_bytes_.load()));
    }
}

BundleCache::Stats BundleCache::get_stats() const {
    Stats s;
    {
        std::lock_guard lock(stats_mutex_);
        s = stats_;
    }
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    if (db_) {
        sqlite3_reset(stmt_count_);
        if (sql_step_retry(stmt_count_) == SQLITE_ROW) {
            s.entries = static_cast<uint64_t>(sqlite3_column_int64(stmt_count_, 0));
            s.cache_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt_count_, 1));
        }
        sqlite3_reset(stmt_count_);
    }
    return s;
}

}  // namespace assetcdn
