#pragma once

#include "assetcdn/cancellation.hpp"
#include "assetcdn/constants.hpp"
#include "assetcdn/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace assetcdn {

struct ObjectEntry {
    std::string key;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string etag;
};

// An incomplete multipart upload as reported by the backend
struct MultipartUploadEntry {
    std::string key;
    std::string upload_id;
    std::chrono::system_clock::time_point initiated;
};

using TransferProgress = std::function<void(uint64_t bytes_done, uint64_t bytes_total)>;

struct PutOptions {
    std::string content_type = "application/octet-stream";
    std::map<std::string, std::string> metadata;
    CancellationToken cancel;
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    TransferProgress progress;
};

struct GetOptions {
    CancellationToken cancel;
    TransferProgress progress;
};

struct ListOptions {
    std::string prefix;
    std::string delimiter;
    uint32_t max_keys = constants::DEFAULT_LIST_PAGE_SIZE;
    std::string continuation_token;
};

struct PutResult {
    bool success = false;
    std::string etag;
    uint64_t bytes = 0;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};

struct GetResult {
    bool success = false;
    uint64_t bytes = 0;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};

struct ListResult {
    bool success = false;
    std::vector<ObjectEntry> entries;
    std::vector<std::string> common_prefixes;
    bool truncated = false;
    std::string continuation_token;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};

struct DeleteResult {
    bool success = false;
    std::vector<std::string> deleted;
    std::vector<std::pair<std::string, std::string>> failed;  // key, reason
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};

struct MultipartListResult {
    bool success = false;
    std::vector<MultipartUploadEntry> uploads;
    bool truncated = false;
    std::string next_key_marker;
    std::string next_upload_id_marker;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};

struct BucketListResult {
    bool success = false;
    std::vector<std::string> buckets;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};

/// Bucket-addressed blob store. Implementations must be safe for concurrent
/// use from several upload workers.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual std::string type_name() const = 0;

    virtual PutResult put_object(const std::string& bucket, const std::string& key,
                                 std::span<const uint8_t> data,
                                 const PutOptions& options = {}) = 0;

    /// Upload a local file. Files above the multipart threshold are sent in
    /// parts. A cancelled or expired upload is abandoned, not aborted, and is
    /// left for cleanup_multipart_uploads to reclaim.
    virtual PutResult put_file(const std::string& bucket, const std::string& key,
                               const std::filesystem::path& path,
                               const PutOptions& options = {}) = 0;

    /// Stream an object into `dest`. The destination is replaced atomically.
    virtual GetResult get_object(const std::string& bucket, const std::string& key,
                                 const std::filesystem::path& dest,
                                 const GetOptions& options = {}) = 0;

    virtual ListResult list_objects(const std::string& bucket,
                                    const ListOptions& options = {}) = 0;

    /// Delete up to MAX_DELETE_BATCH keys in one request.
    virtual DeleteResult delete_objects(const std::string& bucket,
                                        const std::vector<std::string>& keys) = 0;

    virtual MultipartListResult list_multipart_uploads(const std::string& bucket,
                                                       const std::string& prefix,
                                                       const std::string& key_marker = {},
                                                       const std::string& upload_id_marker = {}) = 0;

    /// NotFound when the upload id is unknown (already aborted or completed).
    virtual OpResult abort_multipart_upload(const std::string& bucket,
                                            const std::string& key,
                                            const std::string& upload_id) = 0;

    virtual OpResult copy_object(const std::string& bucket, const std::string& source_key,
                                 const std::string& dest_key) = 0;

    virtual BucketListResult list_buckets() = 0;
};

class ObjectStoreFactory {
public:
    /// Types: "s3", "r2", "local". Throws std::runtime_error on an unknown
    /// type or missing required parameters.
    static std::unique_ptr<ObjectStore> create(const std::string& type,
                                               const std::map<std::string, std::string>& params);

    static std::unique_ptr<ObjectStore> create_local(
        const std::filesystem::path& root,
        uint64_t multipart_threshold = constants::DEFAULT_MULTIPART_THRESHOLD,
        uint64_t multipart_chunk_size = constants::DEFAULT_MULTIPART_CHUNK_SIZE);
};

}  // namespace assetcdn
