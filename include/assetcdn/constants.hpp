#pragma once

#include <cstddef>
#include <cstdint>

namespace assetcdn::constants {

// Object store defaults
constexpr uint64_t DEFAULT_MULTIPART_THRESHOLD = 5 * 1024 * 1024;   // 5MB
constexpr uint64_t DEFAULT_MULTIPART_CHUNK_SIZE = 5 * 1024 * 1024;  // 5MB (S3 minimum part size)
constexpr size_t DEFAULT_PART_CONCURRENCY = 4;
constexpr size_t MAX_DELETE_BATCH = 1000;                           // S3 DeleteObjects limit
constexpr uint32_t DEFAULT_LIST_PAGE_SIZE = 1000;
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_SECS = 10;

// Execution context policy
constexpr uint32_t BATCH_REQUEST_TIMEOUT_MINUTES = 30;
constexpr uint32_t INTERACTIVE_REQUEST_TIMEOUT_MINUTES = 10;
constexpr uint32_t DEFAULT_MAX_ERROR_RETRY = 5;

// Content deployment
constexpr size_t DEFAULT_UPLOAD_CONCURRENCY = 4;
constexpr uint32_t DEFAULT_UPLOAD_TIMEOUT_MINUTES = 30;

// Download orchestration: per-priority concurrency caps
constexpr size_t DEFAULT_CAP_CRITICAL = 5;
constexpr size_t DEFAULT_CAP_HIGH = 4;
constexpr size_t DEFAULT_CAP_NORMAL = 3;
constexpr size_t DEFAULT_CAP_LOW = 1;

// Bundle cache
constexpr uint64_t DEFAULT_MAX_CACHE_BYTES = 4ULL * 1024 * 1024 * 1024;  // 4 GB
constexpr size_t DEFAULT_MAX_BUNDLE_BYTES = 512 * 1024 * 1024;          // 512MB per bundle

// CDN profile
constexpr const char* DEFAULT_PLATFORM_NAME = "android";
constexpr const char* DEFAULT_PRODUCT_NAME = "product";
constexpr const char* DEFAULT_REMOTE_PATH_FORMAT = "ServerData/{device}/{environment}/{version}";
constexpr const char* R2_ENDPOINT_FORMAT = "https://{account}.r2.cloudflarestorage.com";

}  // namespace assetcdn::constants
