#pragma once

#include "assetcdn/constants.hpp"
#include "assetcdn/http.hpp"
#include "assetcdn/object_store.hpp"
#include "assetcdn/storage_engine.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace assetcdn {

/// Where bundle bytes come from.
class BundleSource {
public:
    virtual ~BundleSource() = default;

    virtual std::string describe() const = 0;

    /// Fetch `remote_path` into `dest`. Must observe `token` while
    /// transferring and leave no file at `dest` unless it succeeds.
    virtual FetchOutcome fetch(const std::string& remote_path, const std::filesystem::path& dest,
                               const CancellationToken& token,
                               const TransferProgress& progress) = 0;
};

/// HTTP GET from `<base_url>/<remote_path>`.
std::unique_ptr<BundleSource> make_http_source(const std::string& base_url,
                                               net::HttpClientConfig config = {});

/// Read objects from `bucket` under `prefix`. `store` must outlive the source.
std::unique_ptr<BundleSource> make_store_source(ObjectStore& store, const std::string& bucket,
                                                const std::string& prefix = {});

struct CatalogEntry {
    std::string key;
    std::string remote_path;
    uint64_t size = 0;
};

/// A loaded bundle: the cached file's bytes held in memory.
class BundleResource : public LoadedResource {
public:
    BundleResource(std::string key, std::vector<uint8_t> data)
        : key_(std::move(key)), data_(std::move(data)) {}

    const std::string& key() const override { return key_; }
    uint64_t size_bytes() const override { return data_.size(); }
    const std::vector<uint8_t>& data() const { return data_; }

private:
    std::string key_;
    std::vector<uint8_t> data_;
};

struct BundleCacheConfig {
    std::filesystem::path cache_dir;
    uint64_t max_cache_bytes = constants::DEFAULT_MAX_CACHE_BYTES;
    size_t max_bundle_bytes = constants::DEFAULT_MAX_BUNDLE_BYTES;
};

/// Disk cache of bundles, tracked in a SQLite manifest.
///
/// Layout under cache_dir:
///   manifest.db   SQLite (WAL) with one row per cached bundle
///   bundles/      bundle files, named by the SHA-256 of the key
///
/// Entries are verified against disk at start(). Eviction removes the least
/// recently accessed bundles until the cache fits max_cache_bytes, skipping
/// any bundle that currently has a loaded handle.
class BundleCache : public StorageEngine {
public:
    /// `source` may be null for offline use: fetches then fail with Config.
    BundleCache(const BundleCacheConfig& config, std::unique_ptr<BundleSource> source);
    ~BundleCache() override;

    BundleCache(const BundleCache&) = delete;
    BundleCache& operator=(const BundleCache&) = delete;

    /// Open the manifest and reconcile it with disk.
    /// Returns error message on failure, empty string on success.
    std::string start();

    // --- Catalog ---

    void register_bundle(const std::string& key, const std::string& remote_path, uint64_t size);

    /// Load `{"bundles":[{"key":..,"path":..,"size":..}]}`.
    /// Returns error message on failure, empty string on success.
    std::string load_catalog(const std::filesystem::path& path);

    size_t catalog_size() const;

    // --- StorageEngine ---

    bool is_known(const std::string& key) const override;
    bool is_cached(const std::string& key) const override;
    uint64_t download_size(const std::string& key) const override;

    FetchOutcome fetch_and_cache(const std::string& key, DownloadPriority priority,
                                 const CancellationToken& token,
                                 const ProgressSink& progress) override;

    LoadResult load(const std::string& key) override;
    void release(const ResourceHandle& handle) override;

    // --- Maintenance ---

    /// Remove one cached bundle. False if it is not cached or is loaded.
    bool clear_bundle(const std::string& key);

    /// Remove every cached bundle that is not loaded. Returns the count.
    size_t clear_all();

    /// Evict least-recently-accessed bundles until under max_cache_bytes.
    /// `keep` is never evicted.
    void evict_to_limit(const std::string& keep = {});

    uint64_t total_cache_bytes() const { return cache_bytes_.load(); }

    struct Stats {
        uint64_t entries = 0;
        uint64_t cache_bytes = 0;
        uint64_t fetches_completed = 0;
        uint64_t fetches_failed = 0;
        uint64_t fetches_cancelled = 0;
        uint64_t evictions = 0;
        uint64_t loads = 0;
    };
    Stats get_stats() const;

private:
    struct ManifestRow {
        std::string key;
        std::string file;
        uint64_t size = 0;
    };

    void init_manifest();
    void verify_entries();
    bool lookup_row(const std::string& key, ManifestRow& out) const;
    bool delete_row(const std::string& key);
    bool is_loaded(const std::string& key) const;
    bool remove_cached(const ManifestRow& row);

    static std::string file_name_for(const std::string& key);
    std::filesystem::path bundles_dir() const { return config_.cache_dir / "bundles"; }

    BundleCacheConfig config_;
    std::unique_ptr<BundleSource> source_;

    // Catalog
    mutable std::shared_mutex catalog_mutex_;
    std::unordered_map<std::string, CatalogEntry> catalog_;

    // SQLite manifest
    mutable std::mutex db_mutex_;  // Protects prepared statement usage
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_get_entry_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
    sqlite3_stmt* stmt_update_access_ = nullptr;
    sqlite3_stmt* stmt_get_evict_candidates_ = nullptr;
    sqlite3_stmt* stmt_count_ = nullptr;

    // Loaded handles per key
    mutable std::mutex loaded_mutex_;
    std::unordered_map<std::string, size_t> loaded_;

    std::mutex eviction_mutex_;
    std::atomic<uint64_t> cache_bytes_{0};

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace assetcdn
