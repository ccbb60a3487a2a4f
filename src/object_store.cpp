#include "assetcdn/object_store.hpp"
#include "assetcdn/http.hpp"
#include "assetcdn/log.hpp"

#include <meridian/core/thread_pool.hpp>
#include <openssl/evp.h>

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <future>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <tuple>

namespace assetcdn {

// ============================================================================
// XML helpers for S3 responses
// ============================================================================

namespace xml {

// Value between <tag>value</tag>, empty if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";
    return xml.substr(start, end - start);
}

// Contents of every <tag>...</tag> block, in document order
std::vector<std::string> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<std::string> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;
        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;
        results.push_back(xml.substr(content_start, end - content_start));
        pos = end + close_tag.length();
    }
    return results;
}

std::string decode_entities(const std::string& s) {
    static const std::pair<const char*, char> entities[] = {
        {"&lt;", '<'}, {"&gt;", '>'}, {"&amp;", '&'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string result;
    result.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        bool matched = false;
        if (s[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                size_t len = std::strlen(entity);
                if (s.compare(i, len, entity) == 0) {
                    result += ch;
                    i += len;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) result += s[i++];
    }
    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

}  // namespace xml

namespace {

// ISO 8601 as returned by S3 (2024-05-01T12:30:00.000Z)
std::chrono::system_clock::time_point parse_iso8601(const std::string& s) {
    std::tm tm = {};
    int year = 0, month = 0, day = 0, hour = 0, min = 0, sec = 0;
    if (std::sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d", &year, &month, &day, &hour, &min, &sec) != 6) {
        return {};
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    time_t tt = timegm(&tm);
    if (tt == -1) return {};
    return std::chrono::system_clock::from_time_t(tt);
}

std::string content_md5_base64(const std::string& body) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_Digest(body.data(), body.size(), digest, &digest_len, EVP_md5(), nullptr);

    unsigned char encoded[4 * ((EVP_MAX_MD_SIZE + 2) / 3) + 1];
    int n = EVP_EncodeBlock(encoded, digest, static_cast<int>(digest_len));
    return std::string(reinterpret_cast<char*>(encoded), static_cast<size_t>(n));
}

// Ensure ETag has surrounding quotes (required for CompleteMultipartUpload)
std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

bool parse_bool(const std::string& v) {
    return v == "true" || v == "1" || v == "yes";
}

uint64_t parse_u64(const std::string& name, const std::string& v) {
    try {
        size_t idx = 0;
        uint64_t n = std::stoull(v, &idx);
        if (idx != v.size()) throw std::invalid_argument(v);
        return n;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid numeric value for '" + name + "': " + v);
    }
}

bool expired(std::chrono::steady_clock::time_point deadline) {
    return deadline != std::chrono::steady_clock::time_point::max() &&
           std::chrono::steady_clock::now() >= deadline;
}

struct PartRange {
    int number = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
};

std::vector<PartRange> split_parts(uint64_t total, uint64_t chunk) {
    std::vector<PartRange> parts;
    uint64_t off = 0;
    int pn = 1;
    while (off < total) {
        uint64_t size = std::min(chunk, total - off);
        parts.push_back({pn++, off, size});
        off += size;
    }
    return parts;
}

bool read_range(const std::filesystem::path& path, uint64_t offset, uint64_t size,
                std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    file.seekg(static_cast<std::streamoff>(offset));
    out.resize(size);
    file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
    return static_cast<uint64_t>(file.gcount()) == size;
}

}  // namespace

// ============================================================================
// SecureString - zeroes credential memory on destruction
// ============================================================================

class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string s) : data_(std::move(s)) {}

    SecureString(const SecureString& other) : data_(other.data_) {}
    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            secure_clear();
            data_ = other.data_;
        }
        return *this;
    }

    ~SecureString() { secure_clear(); }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    void secure_clear() {
        if (data_.empty()) return;
        volatile char* p = const_cast<volatile char*>(data_.data());
        for (size_t i = 0; i < data_.size(); ++i) p[i] = 0;
        data_.clear();
    }

    std::string data_;
};

// ============================================================================
// S3ObjectStore - S3-compatible store (AWS, R2, MinIO)
// ============================================================================

class S3ObjectStore : public ObjectStore {
public:
    struct Config {
        std::string type = "s3";
        std::string region = "us-east-1";
        std::string endpoint;  // Empty for AWS
        SecureString access_key;
        SecureString secret_key;
        std::string session_token;
        bool use_path_style = false;
        bool verify_ssl = true;
        std::string ca_bundle;
        bool unsigned_payload = false;
        uint64_t multipart_threshold = constants::DEFAULT_MULTIPART_THRESHOLD;
        uint64_t multipart_chunk_size = constants::DEFAULT_MULTIPART_CHUNK_SIZE;
        size_t part_concurrency = constants::DEFAULT_PART_CONCURRENCY;
        uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECS;
        uint32_t request_timeout_minutes = constants::BATCH_REQUEST_TIMEOUT_MINUTES;
        uint32_t max_retries = constants::DEFAULT_MAX_ERROR_RETRY;
    };

    explicit S3ObjectStore(const Config& config)
        : config_(config)
        , signer_(config.access_key.str(), config.secret_key.str(), config.region, "s3")
        , part_pool_(std::make_unique<meridian::ThreadPool>(std::max<size_t>(1, config.part_concurrency))) {
        net::HttpClientConfig http_config;
        http_config.user_agent = "assetcdn-s3/1.0";
        http_config.verify_ssl = config_.verify_ssl;
        http_config.ca_bundle = config_.ca_bundle;
        http_config.max_idle_handles = std::max<size_t>(16, config_.part_concurrency);
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    ~S3ObjectStore() override {
        part_pool_->shutdown(true);
    }

    std::string type_name() const override { return config_.type; }

    PutResult put_object(const std::string& bucket, const std::string& key,
                         std::span<const uint8_t> data,
                         const PutOptions& options) override {
        PutResult result;
        net::HttpRequest request = net::HttpRequest::put(
            build_url(bucket, key), std::vector<uint8_t>(data.begin(), data.end()));
        apply_put_headers(request, options);
        request.progress_callback = make_upload_progress(options, data.size());

        auto response = send(request, options.cancel, options.deadline);
        if (!response.ok) {
            result.error = response.error;
            result.error_message = response.message;
            return result;
        }

        result.success = true;
        result.bytes = data.size();
        result.etag = response.http.headers.get("ETag").value_or("");
        return result;
    }

    PutResult put_file(const std::string& bucket, const std::string& key,
                       const std::filesystem::path& path,
                       const PutOptions& options) override {
        std::error_code ec;
        uint64_t size = std::filesystem::file_size(path, ec);
        if (ec) {
            PutResult result;
            result.error = ErrorKind::NotFound;
            result.error_message = "Cannot stat " + path.string() + ": " + ec.message();
            return result;
        }

        if (size > config_.multipart_threshold) {
            return put_multipart_file(bucket, key, path, size, options);
        }

        std::vector<uint8_t> data;
        if (size > 0 && !read_range(path, 0, size, data)) {
            PutResult result;
            result.error = ErrorKind::Backend;
            result.error_message = "Failed to read " + path.string();
            return result;
        }
        return put_object(bucket, key, data, options);
    }

    GetResult get_object(const std::string& bucket, const std::string& key,
                         const std::filesystem::path& dest,
                         const GetOptions& options) override {
        GetResult result;
        auto tmp = dest;
        tmp += ".part";

        net::HttpRequest request = net::HttpRequest::get(build_url(bucket, key));
        request.output_path = tmp.string();

        CancellationToken token = options.cancel;
        TransferProgress progress = options.progress;
        request.progress_callback = [token, progress](const net::HttpProgress& p) {
            if (token.is_cancelled()) return false;
            if (progress && p.download_total > 0) progress(p.download_now, p.download_total);
            return true;
        };

        auto response = send(request, options.cancel, std::chrono::steady_clock::time_point::max());
        if (!response.ok) {
            result.error = response.error;
            result.error_message = response.message;
            return result;
        }

        std::error_code ec;
        std::filesystem::rename(tmp, dest, ec);
        if (ec) {
            std::filesystem::remove(tmp, ec);
            result.error = ErrorKind::Backend;
            result.error_message = "Failed to move " + tmp.string() + " into place";
            return result;
        }

        result.success = true;
        result.bytes = response.http.bytes_received;
        return result;
    }

    ListResult list_objects(const std::string& bucket, const ListOptions& options) override {
        ListResult result;

        std::string url = build_url(bucket, "") + "?list-type=2";
        if (!options.prefix.empty()) {
            url += "&prefix=" + net::url_encode(options.prefix);
        }
        if (!options.delimiter.empty()) {
            url += "&delimiter=" + net::url_encode(options.delimiter);
        }
        url += "&max-keys=" + std::to_string(options.max_keys);
        if (!options.continuation_token.empty()) {
            url += "&continuation-token=" + net::url_encode(options.continuation_token);
        }

        auto response = send(net::HttpRequest::get(url), {}, std::chrono::steady_clock::time_point::max());
        if (!response.ok) {
            result.error = response.error;
            result.error_message = response.message;
            return result;
        }

        std::string body = response.http.body_string();
        result.success = true;
        result.truncated = xml::get_element(body, "IsTruncated") == "true";
        result.continuation_token = xml::decode_entities(xml::get_element(body, "NextContinuationToken"));

        for (const auto& content : xml::find_elements(body, "Contents")) {
            ObjectEntry entry;
            entry.key = xml::decode_entities(xml::get_element(content, "Key"));
            std::string size_str = xml::get_element(content, "Size");
            if (!size_str.empty()) {
                entry.size = std::strtoull(size_str.c_str(), nullptr, 10);
            }
            entry.last_modified = parse_iso8601(xml::get_element(content, "LastModified"));
            entry.etag = xml::decode_entities(xml::get_element(content, "ETag"));
            result.entries.push_back(std::move(entry));
        }
        for (const auto& content : xml::find_elements(body, "CommonPrefixes")) {
            result.common_prefixes.push_back(xml::decode_entities(xml::get_element(content, "Prefix")));
        }
        return result;
    }

    DeleteResult delete_objects(const std::string& bucket,
                                const std::vector<std::string>& keys) override {
        DeleteResult result;
        if (keys.empty()) {
            result.success = true;
            return result;
        }
        if (keys.size() > constants::MAX_DELETE_BATCH) {
            result.error = ErrorKind::Config;
            result.error_message = "Too many keys for one delete request: " + std::to_string(keys.size());
            return result;
        }

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<Delete xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        body << "  <Quiet>true</Quiet>\n";
        for (const auto& key : keys) {
            body << "  <Object><Key>" << xml::escape(key) << "</Key></Object>\n";
        }
        body << "</Delete>";

        net::HttpRequest request = net::HttpRequest::post(build_url(bucket, "") + "?delete", body.str());
        request.headers.set_content_type("application/xml");
        request.headers.set("Content-MD5", content_md5_base64(body.str()));

        auto response = send(request, {}, std::chrono::steady_clock::time_point::max());
        if (!response.ok) {
            result.error = response.error;
            result.error_message = response.message;
            return result;
        }

        // Quiet mode: only failures are listed
        std::string response_body = response.http.body_string();
        std::vector<std::string> failed_keys;
        for (const auto& error_block : xml::find_elements(response_body, "Error")) {
            std::string key = xml::decode_entities(xml::get_element(error_block, "Key"));
            if (key.empty()) continue;
            std::string reason = xml::get_element(error_block, "Code");
            std::string message = xml::get_element(error_block, "Message");
            if (!message.empty()) reason += ": " + message;
            result.failed.emplace_back(key, reason);
            failed_keys.push_back(key);
        }
        for (const auto& key : keys) {
            if (std::find(failed_keys.begin(), failed_keys.end(), key) == failed_keys.end()) {
                result.deleted.push_back(key);
            }
        }

        result.success = result.failed.empty();
        if (!result.success) {
            result.error = ErrorKind::Partial;
            result.error_message = std::to_string(result.failed.size()) + " keys failed to delete";
        }
        return result;
    }

    MultipartListResult list_multipart_uploads(const std::string& bucket,
                                               const std::string& prefix,
                                               const std::string& key_marker,
                                               const std::string& upload_id_marker) override {
        MultipartListResult result;

        std::string url = build_url(bucket, "") + "?uploads&max-uploads=1000";
        if (!prefix.empty()) url += "&prefix=" + net::url_encode(prefix);
        if (!key_marker.empty()) url += "&key-marker=" + net::url_encode(key_marker);
        if (!upload_id_marker.empty()) url += "&upload-id-marker=" + net::url_encode(upload_id_marker);

        auto response = send(net::HttpRequest::get(url), {}, std::chrono::steady_clock::time_point::max());
        if (!response.ok) {
            result.error = response.error;
            result.error_message = response.message;
            return result;
        }

        std::string body = response.http.body_string();
        result.success = true;
        result.truncated = xml::get_element(body, "IsTruncated") == "true";
        result.next_key_marker = xml::decode_entities(xml::get_element(body, "NextKeyMarker"));
        result.next_upload_id_marker = xml::get_element(body, "NextUploadIdMarker");

        for (const auto& upload : xml::find_elements(body, "Upload")) {
            MultipartUploadEntry entry;
            entry.key = xml::decode_entities(xml::get_element(upload, "Key"));
            entry.upload_id = xml::get_element(upload, "UploadId");
            entry.initiated = parse_iso8601(xml::get_element(upload, "Initiated"));
            result.uploads.push_back(std::move(entry));
        }
        return result;
    }

    OpResult abort_multipart_upload(const std::string& bucket, const std::string& key,
                                    const std::string& upload_id) override {
        std::string url = build_url(bucket, key) + "?uploadId=" + net::url_encode(upload_id);
        auto response = send(net::HttpRequest::del(url), {}, std::chrono::steady_clock::time_point::max());
        if (!response.ok) {
            return OpResult::fail(response.error, response.message);
        }
        return OpResult::ok();
    }

    OpResult copy_object(const std::string& bucket, const std::string& source_key,
                         const std::string& dest_key) override {
        net::HttpRequest request = net::HttpRequest::put(build_url(bucket, dest_key), {});
        request.headers.set("x-amz-copy-source", "/" + bucket + "/" + net::url_encode_path(source_key));

        auto response = send(request, {}, std::chrono::steady_clock::time_point::max());
        if (!response.ok) {
            return OpResult::fail(response.error, response.message);
        }
        // CopyObject can report failure inside a 200 response
        std::string body = response.http.body_string();
        if (body.find("<Error>") != std::string::npos) {
            return OpResult::fail(ErrorKind::Backend, "Copy failed: " + xml::get_element(body, "Code"));
        }
        return OpResult::ok();
    }

    BucketListResult list_buckets() override {
        BucketListResult result;
        std::string url = service_root() + "/";
        auto response = send(net::HttpRequest::get(url), {}, std::chrono::steady_clock::time_point::max());
        if (!response.ok) {
            result.error = response.error;
            result.error_message = response.message;
            return result;
        }

        std::string body = response.http.body_string();
        for (const auto& bucket : xml::find_elements(body, "Bucket")) {
            result.buckets.push_back(xml::decode_entities(xml::get_element(bucket, "Name")));
        }
        result.success = true;
        return result;
    }

private:
    struct SendResult {
        bool ok = false;
        ErrorKind error = ErrorKind::None;
        std::string message;
        net::HttpResponse http;
    };

    std::string service_root() const {
        if (!config_.endpoint.empty()) {
            std::string root = config_.endpoint;
            while (!root.empty() && root.back() == '/') root.pop_back();
            return root;
        }
        return "https://s3." + config_.region + ".amazonaws.com";
    }

    std::string build_url(const std::string& bucket, const std::string& key) const {
        std::string url;
        if (config_.use_path_style || !config_.endpoint.empty()) {
            url = service_root() + "/" + bucket;
        } else {
            url = "https://" + bucket + ".s3." + config_.region + ".amazonaws.com";
        }
        if (!key.empty()) {
            url += "/" + net::url_encode_path(key);
        }
        return url;
    }

    void sign_request(net::HttpRequest& request) const {
        if (!config_.session_token.empty()) {
            signer_.sign_with_token(request, config_.session_token);
        } else {
            signer_.sign(request);
        }
    }

    void apply_put_headers(net::HttpRequest& request, const PutOptions& options) const {
        request.headers.set_content_type(options.content_type.empty() ? "application/octet-stream"
                                                                      : options.content_type);
        for (const auto& [k, v] : options.metadata) {
            request.headers.set("x-amz-meta-" + k, v);
        }
        if (config_.unsigned_payload) {
            request.headers.set("x-amz-content-sha256", "UNSIGNED-PAYLOAD");
        }
    }

    net::HttpProgressCallback make_upload_progress(const PutOptions& options, uint64_t total) const {
        CancellationToken token = options.cancel;
        auto deadline = options.deadline;
        TransferProgress progress = options.progress;
        return [token, deadline, progress, total](const net::HttpProgress& p) {
            if (token.is_cancelled() || expired(deadline)) return false;
            if (progress) progress(std::min<uint64_t>(p.upload_now, total), total);
            return true;
        };
    }

    // Sign and send with retry on transient errors. Re-signed per attempt so
    // long backoffs never present a stale X-Amz-Date.
    SendResult send(const net::HttpRequest& unsigned_request, const CancellationToken& token,
                    std::chrono::steady_clock::time_point deadline) const {
        SendResult result;
        for (uint32_t attempt = 0;; ++attempt) {
            if (token.is_cancelled()) {
                result.error = ErrorKind::Cancelled;
                result.message = "Cancelled";
                return result;
            }
            if (expired(deadline)) {
                result.error = ErrorKind::Timeout;
                result.message = "Deadline expired";
                return result;
            }

            net::HttpRequest request = unsigned_request;
            request.connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
            request.total_timeout = std::chrono::minutes(config_.request_timeout_minutes);
            if (deadline != std::chrono::steady_clock::time_point::max()) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                request.total_timeout = std::max(std::chrono::milliseconds(1),
                                                 std::min(request.total_timeout, remaining));
            }
            if (!config_.ca_bundle.empty()) request.ca_bundle_path = config_.ca_bundle;
            sign_request(request);

            result.http = http_client_->execute(request);
            if (result.http.aborted) {
                result.error = token.is_cancelled() ? ErrorKind::Cancelled : ErrorKind::Timeout;
                result.message = token.is_cancelled() ? "Cancelled" : "Deadline expired";
                return result;
            }
            if (!result.http.is_network_error && !result.http.error.empty()) {
                // Local failure (output file, body limit): retrying will not help
                result.error = ErrorKind::Backend;
                result.message = result.http.error;
                return result;
            }

            std::string body = result.http.body_string();
            result.error = classify_http(result.http.status_code, result.http.is_network_error, body);
            if (result.error == ErrorKind::None) {
                result.ok = true;
                return result;
            }

            if (result.http.is_network_error) {
                result.message = result.http.error;
            } else {
                std::string code = xml::get_element(body, "Code");
                result.message = "HTTP " + std::to_string(result.http.status_code) +
                                 (code.empty() ? "" : " " + code);
            }

            if (!is_retryable(result.error, result.http.status_code) || attempt >= config_.max_retries) {
                return result;
            }
            log_debug("%s %s: %s, retrying (%u/%u)",
                      net::http_method_to_string(request.method), unsigned_request.url.c_str(),
                      result.message.c_str(), attempt + 1, config_.max_retries);
            auto backoff = std::chrono::milliseconds(100 * (1 << std::min(attempt, 8u)));
            if (!sleep_unless_cancelled(backoff, token, deadline)) {
                result.ok = false;
                result.error = token.is_cancelled() ? ErrorKind::Cancelled : ErrorKind::Timeout;
                result.message = token.is_cancelled() ? "Cancelled" : "Deadline expired";
                return result;
            }
        }
    }

    std::string initiate_multipart_upload(const std::string& bucket, const std::string& key,
                                          const PutOptions& options, SendResult& out) {
        net::HttpRequest request = net::HttpRequest::post(build_url(bucket, key) + "?uploads", "");
        apply_put_headers(request, options);
        request.headers.remove("x-amz-content-sha256");

        out = send(request, options.cancel, options.deadline);
        if (!out.ok) return "";
        std::string upload_id = xml::get_element(out.http.body_string(), "UploadId");
        if (upload_id.empty()) {
            out.ok = false;
            out.error = ErrorKind::Backend;
            out.message = "No UploadId in response";
        }
        return upload_id;
    }

    SendResult complete_multipart_upload(const std::string& bucket, const std::string& key,
                                         const std::string& upload_id,
                                         const std::vector<std::string>& part_etags,
                                         const PutOptions& options) {
        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        for (size_t i = 0; i < part_etags.size(); ++i) {
            body << "  <Part><PartNumber>" << (i + 1) << "</PartNumber><ETag>"
                 << xml::escape(part_etags[i]) << "</ETag></Part>\n";
        }
        body << "</CompleteMultipartUpload>";

        net::HttpRequest request = net::HttpRequest::post(
            build_url(bucket, key) + "?uploadId=" + net::url_encode(upload_id), body.str());
        request.headers.set_content_type("application/xml");

        auto result = send(request, options.cancel, options.deadline);
        // CompleteMultipartUpload can report failure inside a 200 response
        if (result.ok && result.http.body_string().find("<Error>") != std::string::npos) {
            result.ok = false;
            result.error = ErrorKind::Backend;
            result.message = "Complete failed: " + xml::get_element(result.http.body_string(), "Code");
        }
        return result;
    }

    PutResult put_multipart_file(const std::string& bucket, const std::string& key,
                                 const std::filesystem::path& path, uint64_t file_size,
                                 const PutOptions& options) {
        PutResult result;

        SendResult init;
        std::string upload_id = initiate_multipart_upload(bucket, key, options, init);
        if (upload_id.empty()) {
            result.error = init.error;
            result.error_message = "Failed to initiate multipart upload: " + init.message;
            return result;
        }
        log_debug("Multipart upload %s started for %s (%llu bytes)", upload_id.c_str(), key.c_str(),
                  static_cast<unsigned long long>(file_size));

        auto parts = split_parts(file_size, config_.multipart_chunk_size);
        std::vector<std::string> part_etags(parts.size());
        std::vector<uint64_t> part_progress(parts.size(), 0);

        std::mutex state_mutex;
        bool failed = false;
        ErrorKind first_error = ErrorKind::None;
        std::string first_message;

        auto report = [&](size_t index, uint64_t done) {
            std::lock_guard<std::mutex> lock(state_mutex);
            part_progress[index] = done;
            if (options.progress) {
                uint64_t sum = 0;
                for (auto v : part_progress) sum += v;
                options.progress(sum, file_size);
            }
        };

        std::vector<std::future<void>> futures;
        futures.reserve(parts.size());
        for (size_t i = 0; i < parts.size(); ++i) {
            futures.push_back(part_pool_->submit([&, i]() {
                {
                    std::lock_guard<std::mutex> lock(state_mutex);
                    if (failed) return;
                }
                const auto& part = parts[i];
                std::vector<uint8_t> chunk;
                SendResult sent;
                if (!read_range(path, part.offset, part.size, chunk)) {
                    sent.error = ErrorKind::Backend;
                    sent.message = "Failed to read part " + std::to_string(part.number);
                } else {
                    net::HttpRequest request = net::HttpRequest::put(
                        build_url(bucket, key) + "?partNumber=" + std::to_string(part.number) +
                            "&uploadId=" + net::url_encode(upload_id),
                        std::move(chunk));
                    if (config_.unsigned_payload) {
                        request.headers.set("x-amz-content-sha256", "UNSIGNED-PAYLOAD");
                    }
                    CancellationToken token = options.cancel;
                    auto deadline = options.deadline;
                    request.progress_callback = [&, i, token, deadline](const net::HttpProgress& p) {
                        if (token.is_cancelled() || expired(deadline)) return false;
                        report(i, std::min<uint64_t>(p.upload_now, parts[i].size));
                        return true;
                    };
                    sent = send(request, options.cancel, options.deadline);
                }

                if (sent.ok) {
                    part_etags[i] = ensure_etag_quotes(sent.http.headers.get("ETag").value_or(""));
                    report(i, part.size);
                    return;
                }
                std::lock_guard<std::mutex> lock(state_mutex);
                if (!failed) {
                    failed = true;
                    first_error = sent.error;
                    first_message = "Part " + std::to_string(part.number) + ": " + sent.message;
                }
            }));
        }
        for (auto& f : futures) {
            f.get();
        }

        if (options.cancel.is_cancelled() || expired(options.deadline)) {
            // Abandon: the upload stays listed until a cleanup sweep aborts it
            result.error = options.cancel.is_cancelled() ? ErrorKind::Cancelled : ErrorKind::Timeout;
            result.error_message = "Multipart upload " + upload_id + " abandoned";
            return result;
        }

        if (failed) {
            abort_after_failure(bucket, key, upload_id);
            result.error = first_error;
            result.error_message = first_message;
            return result;
        }

        auto completed = complete_multipart_upload(bucket, key, upload_id, part_etags, options);
        if (!completed.ok) {
            if (completed.error != ErrorKind::Cancelled && completed.error != ErrorKind::Timeout) {
                abort_after_failure(bucket, key, upload_id);
            }
            result.error = completed.error;
            result.error_message = "Failed to complete multipart upload: " + completed.message;
            return result;
        }

        result.success = true;
        result.bytes = file_size;
        result.etag = ensure_etag_quotes(
            xml::decode_entities(xml::get_element(completed.http.body_string(), "ETag")));
        return result;
    }

    void abort_after_failure(const std::string& bucket, const std::string& key,
                             const std::string& upload_id) {
        auto aborted = abort_multipart_upload(bucket, key, upload_id);
        if (!aborted.success && aborted.error != ErrorKind::NotFound) {
            log_warn("Could not abort multipart upload %s for %s: %s", upload_id.c_str(),
                     key.c_str(), aborted.error_message.c_str());
        }
    }

    Config config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;
    std::unique_ptr<meridian::ThreadPool> part_pool_;
};

// ============================================================================
// LocalObjectStore - directory-backed store, one subdirectory per bucket
// ============================================================================

class LocalObjectStore : public ObjectStore {
public:
    LocalObjectStore(const std::filesystem::path& root, uint64_t multipart_threshold,
                     uint64_t multipart_chunk_size)
        : root_(std::filesystem::absolute(root))
        , multipart_threshold_(multipart_threshold)
        , multipart_chunk_size_(std::max<uint64_t>(1, multipart_chunk_size)) {
        std::filesystem::create_directories(root_);
    }

    std::string type_name() const override { return "local"; }

    PutResult put_object(const std::string& bucket, const std::string& key,
                         std::span<const uint8_t> data,
                         const PutOptions& options) override {
        PutResult result;
        if (auto err = precheck(bucket, key, options.cancel, options.deadline); !err.success) {
            result.error = err.error;
            result.error_message = err.error_message;
            return result;
        }

        auto path = object_path(bucket, key);
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);

        auto temp_path = path;
        temp_path += ".tmp." + random_suffix();
        {
            std::ofstream file(temp_path, std::ios::binary);
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file) {
                std::filesystem::remove(temp_path, ec);
                result.error = ErrorKind::Backend;
                result.error_message = "Failed to write " + temp_path.string();
                return result;
            }
        }
        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            std::filesystem::remove(temp_path, ec);
            result.error = ErrorKind::Backend;
            result.error_message = "Failed to rename into place: " + ec.message();
            return result;
        }

        if (options.progress) options.progress(data.size(), data.size());
        result.success = true;
        result.bytes = data.size();
        return result;
    }

    PutResult put_file(const std::string& bucket, const std::string& key,
                       const std::filesystem::path& path,
                       const PutOptions& options) override {
        std::error_code ec;
        uint64_t size = std::filesystem::file_size(path, ec);
        if (ec) {
            PutResult result;
            result.error = ErrorKind::NotFound;
            result.error_message = "Cannot stat " + path.string() + ": " + ec.message();
            return result;
        }

        if (size > multipart_threshold_) {
            return put_multipart_file(bucket, key, path, size, options);
        }

        std::vector<uint8_t> data;
        if (size > 0 && !read_range(path, 0, size, data)) {
            PutResult result;
            result.error = ErrorKind::Backend;
            result.error_message = "Failed to read " + path.string();
            return result;
        }
        return put_object(bucket, key, data, options);
    }

    GetResult get_object(const std::string& bucket, const std::string& key,
                         const std::filesystem::path& dest,
                         const GetOptions& options) override {
        GetResult result;
        if (auto err = precheck(bucket, key, options.cancel, std::chrono::steady_clock::time_point::max());
            !err.success) {
            result.error = err.error;
            result.error_message = err.error_message;
            return result;
        }

        auto src = object_path(bucket, key);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(src, ec)) {
            result.error = ErrorKind::NotFound;
            result.error_message = "No such key: " + key;
            return result;
        }

        auto tmp = dest;
        tmp += ".part";
        std::filesystem::copy_file(src, tmp, std::filesystem::copy_options::overwrite_existing, ec);
        if (!ec && options.cancel.is_cancelled()) {
            std::filesystem::remove(tmp, ec);
            result.error = ErrorKind::Cancelled;
            result.error_message = "Cancelled";
            return result;
        }
        if (!ec) std::filesystem::rename(tmp, dest, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            result.error = ErrorKind::Backend;
            result.error_message = "Failed to copy " + key + ": " + ec.message();
            return result;
        }

        result.bytes = std::filesystem::file_size(dest, ec);
        if (options.progress) options.progress(result.bytes, result.bytes);
        result.success = true;
        return result;
    }

    ListResult list_objects(const std::string& bucket, const ListOptions& options) override {
        ListResult result;
        auto bucket_dir = root_ / bucket;
        std::error_code ec;
        if (bucket.empty() || !std::filesystem::is_directory(bucket_dir, ec)) {
            result.error = ErrorKind::NotFound;
            result.error_message = "NoSuchBucket: " + bucket;
            return result;
        }

        std::vector<ObjectEntry> all;
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = std::filesystem::recursive_directory_iterator(bucket_dir);
            for (auto end = std::filesystem::recursive_directory_iterator(); it != end; ++it) {
                if (it->is_directory() && it->path().filename() == kStagingDir) {
                    it.disable_recursion_pending();
                    continue;
                }
                if (!it->is_regular_file()) continue;

                std::string key = it->path().lexically_relative(bucket_dir).generic_string();
                if (key.find(".tmp.") != std::string::npos) continue;
                if (key.compare(0, options.prefix.size(), options.prefix) != 0) continue;

                ObjectEntry entry;
                entry.key = std::move(key);
                entry.size = it->file_size();
                entry.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    std::chrono::file_clock::to_sys(it->last_write_time()));
                all.push_back(std::move(entry));
            }
        } catch (const std::exception& e) {
            result.error = ErrorKind::Backend;
            result.error_message = e.what();
            return result;
        }

        std::sort(all.begin(), all.end(),
                  [](const ObjectEntry& a, const ObjectEntry& b) { return a.key < b.key; });

        std::string last_prefix;
        for (auto& entry : all) {
            if (!options.continuation_token.empty() && entry.key <= options.continuation_token) {
                continue;
            }
            if (result.entries.size() + result.common_prefixes.size() >= options.max_keys) {
                result.truncated = true;
                break;
            }
            if (!options.delimiter.empty()) {
                size_t pos = entry.key.find(options.delimiter, options.prefix.size());
                if (pos != std::string::npos) {
                    std::string common = entry.key.substr(0, pos + options.delimiter.size());
                    if (common != last_prefix) {
                        result.common_prefixes.push_back(common);
                        last_prefix = common;
                    }
                    result.continuation_token = entry.key;
                    continue;
                }
            }
            result.continuation_token = entry.key;
            result.entries.push_back(std::move(entry));
        }
        if (!result.truncated) result.continuation_token.clear();

        result.success = true;
        return result;
    }

    DeleteResult delete_objects(const std::string& bucket,
                                const std::vector<std::string>& keys) override {
        DeleteResult result;
        if (keys.size() > constants::MAX_DELETE_BATCH) {
            result.error = ErrorKind::Config;
            result.error_message = "Too many keys for one delete request: " + std::to_string(keys.size());
            return result;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& key : keys) {
            if (!valid_key(key)) {
                result.failed.emplace_back(key, "InvalidKey");
                continue;
            }
            auto path = object_path(bucket, key);
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec) {
                result.failed.emplace_back(key, ec.message());
                continue;
            }
            prune_empty_dirs(path.parent_path(), root_ / bucket);
            // Deleting a missing key succeeds, as on S3
            result.deleted.push_back(key);
        }

        result.success = result.failed.empty();
        if (!result.success) {
            result.error = ErrorKind::Partial;
            result.error_message = std::to_string(result.failed.size()) + " keys failed to delete";
        }
        return result;
    }

    MultipartListResult list_multipart_uploads(const std::string& bucket,
                                               const std::string& prefix,
                                               const std::string& key_marker,
                                               const std::string& upload_id_marker) override {
        MultipartListResult result;
        std::error_code ec;
        if (bucket.empty() || !std::filesystem::is_directory(root_ / bucket, ec)) {
            result.error = ErrorKind::NotFound;
            result.error_message = "NoSuchBucket: " + bucket;
            return result;
        }

        std::vector<MultipartUploadEntry> all;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto staging = root_ / bucket / kStagingDir;
            if (std::filesystem::is_directory(staging, ec)) {
                for (const auto& dir : std::filesystem::directory_iterator(staging, ec)) {
                    std::ifstream key_file(dir.path() / "key");
                    std::string key;
                    if (!key_file || !std::getline(key_file, key)) continue;
                    if (key.compare(0, prefix.size(), prefix) != 0) continue;

                    MultipartUploadEntry entry;
                    entry.key = key;
                    entry.upload_id = dir.path().filename().string();
                    std::error_code tec;
                    auto ftime = std::filesystem::last_write_time(dir.path() / "key", tec);
                    if (!tec) {
                        entry.initiated = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                            std::chrono::file_clock::to_sys(ftime));
                    }
                    all.push_back(std::move(entry));
                }
            }
        }

        std::sort(all.begin(), all.end(), [](const auto& a, const auto& b) {
            return std::tie(a.key, a.upload_id) < std::tie(b.key, b.upload_id);
        });

        for (auto& entry : all) {
            if (!key_marker.empty() &&
                std::tie(entry.key, entry.upload_id) <= std::tie(key_marker, upload_id_marker)) {
                continue;
            }
            if (result.uploads.size() >= constants::DEFAULT_LIST_PAGE_SIZE) {
                result.truncated = true;
                break;
            }
            result.next_key_marker = entry.key;
            result.next_upload_id_marker = entry.upload_id;
            result.uploads.push_back(std::move(entry));
        }

        result.success = true;
        return result;
    }

    OpResult abort_multipart_upload(const std::string& bucket, const std::string& key,
                                    const std::string& upload_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dir = root_ / bucket / kStagingDir / upload_id;
        std::error_code ec;
        if (upload_id.empty() || upload_id.find('/') != std::string::npos ||
            !std::filesystem::is_directory(dir, ec)) {
            return OpResult::fail(ErrorKind::NotFound, "NoSuchUpload: " + upload_id);
        }

        std::ifstream key_file(dir / "key");
        std::string recorded;
        std::getline(key_file, recorded);
        if (recorded != key) {
            return OpResult::fail(ErrorKind::NotFound, "NoSuchUpload: " + upload_id + " for " + key);
        }
        key_file.close();

        std::filesystem::remove_all(dir, ec);
        if (ec) {
            return OpResult::fail(ErrorKind::Backend, "Failed to remove " + dir.string() + ": " + ec.message());
        }
        return OpResult::ok();
    }

    OpResult copy_object(const std::string& bucket, const std::string& source_key,
                         const std::string& dest_key) override {
        if (!valid_key(source_key) || !valid_key(dest_key)) {
            return OpResult::fail(ErrorKind::Config, "Invalid object key");
        }
        auto src = object_path(bucket, source_key);
        auto dst = object_path(bucket, dest_key);

        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(src, ec)) {
            return OpResult::fail(ErrorKind::NotFound, "No such key: " + source_key);
        }
        std::filesystem::create_directories(dst.parent_path(), ec);
        std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            return OpResult::fail(ErrorKind::Backend, "Copy failed: " + ec.message());
        }
        return OpResult::ok();
    }

    BucketListResult list_buckets() override {
        BucketListResult result;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
            if (entry.is_directory()) {
                result.buckets.push_back(entry.path().filename().string());
            }
        }
        if (ec) {
            result.error = ErrorKind::Backend;
            result.error_message = ec.message();
            return result;
        }
        std::sort(result.buckets.begin(), result.buckets.end());
        result.success = true;
        return result;
    }

private:
    static constexpr const char* kStagingDir = ".multipart";

    static bool valid_key(const std::string& key) {
        if (key.empty() || key.front() == '/') return false;
        for (const auto& part : std::filesystem::path(key)) {
            if (part == ".." || part == kStagingDir) return false;
        }
        return true;
    }

    static std::string random_suffix() {
        static std::mutex rng_mutex;
        static std::mt19937_64 rng{std::random_device{}()};
        std::lock_guard<std::mutex> lock(rng_mutex);
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
        return buf;
    }

    std::filesystem::path object_path(const std::string& bucket, const std::string& key) const {
        return root_ / bucket / key;
    }

    OpResult precheck(const std::string& bucket, const std::string& key,
                      const CancellationToken& token,
                      std::chrono::steady_clock::time_point deadline) const {
        if (bucket.empty() || bucket.find('/') != std::string::npos) {
            return OpResult::fail(ErrorKind::Config, "Invalid bucket name: '" + bucket + "'");
        }
        if (!valid_key(key)) {
            return OpResult::fail(ErrorKind::Config, "Invalid object key: '" + key + "'");
        }
        if (token.is_cancelled()) return OpResult::fail(ErrorKind::Cancelled, "Cancelled");
        if (expired(deadline)) return OpResult::fail(ErrorKind::Timeout, "Deadline expired");
        return OpResult::ok();
    }

    void prune_empty_dirs(std::filesystem::path dir, const std::filesystem::path& stop) {
        std::error_code ec;
        while (dir != stop && dir.string().size() > stop.string().size() &&
               std::filesystem::is_empty(dir, ec) && !ec) {
            std::filesystem::remove(dir, ec);
            dir = dir.parent_path();
        }
    }

    // Parts are staged under <bucket>/.multipart/<upload-id>/ and assembled
    // on completion. Cancellation between parts leaves the staging directory
    // behind, exactly like an abandoned remote multipart upload.
    PutResult put_multipart_file(const std::string& bucket, const std::string& key,
                                 const std::filesystem::path& path, uint64_t file_size,
                                 const PutOptions& options) {
        PutResult result;
        if (auto err = precheck(bucket, key, options.cancel, options.deadline); !err.success) {
            result.error = err.error;
            result.error_message = err.error_message;
            return result;
        }

        std::string upload_id = random_suffix();
        auto staging = root_ / bucket / kStagingDir / upload_id;
        std::error_code ec;
        std::filesystem::create_directories(staging, ec);
        {
            std::ofstream key_file(staging / "key");
            key_file << key << "\n";
            if (ec || !key_file) {
                result.error = ErrorKind::Backend;
                result.error_message = "Failed to stage multipart upload for " + key;
                return result;
            }
        }

        auto parts = split_parts(file_size, multipart_chunk_size_);
        uint64_t done = 0;
        for (const auto& part : parts) {
            if (options.cancel.is_cancelled() || expired(options.deadline)) {
                result.error = options.cancel.is_cancelled() ? ErrorKind::Cancelled : ErrorKind::Timeout;
                result.error_message = "Multipart upload " + upload_id + " abandoned";
                return result;
            }

            std::vector<uint8_t> chunk;
            char name[32];
            std::snprintf(name, sizeof(name), "part-%05d", part.number);
            std::ofstream out(staging / name, std::ios::binary);
            if (!read_range(path, part.offset, part.size, chunk) ||
                !out.write(reinterpret_cast<const char*>(chunk.data()),
                           static_cast<std::streamsize>(chunk.size()))) {
                out.close();
                abort_multipart_upload(bucket, key, upload_id);
                result.error = ErrorKind::Backend;
                result.error_message = "Failed to stage part " + std::to_string(part.number);
                return result;
            }
            done += part.size;
            if (options.progress) options.progress(done, file_size);
        }

        if (options.cancel.is_cancelled() || expired(options.deadline)) {
            result.error = options.cancel.is_cancelled() ? ErrorKind::Cancelled : ErrorKind::Timeout;
            result.error_message = "Multipart upload " + upload_id + " abandoned";
            return result;
        }

        // Complete: concatenate parts into the object and drop the staging dir
        auto dest = object_path(bucket, key);
        std::filesystem::create_directories(dest.parent_path(), ec);
        auto temp_path = dest;
        temp_path += ".tmp." + upload_id;
        {
            std::ofstream out(temp_path, std::ios::binary);
            for (const auto& part : parts) {
                char name[32];
                std::snprintf(name, sizeof(name), "part-%05d", part.number);
                std::ifstream in(staging / name, std::ios::binary);
                out << in.rdbuf();
            }
            if (!out) {
                std::filesystem::remove(temp_path, ec);
                abort_multipart_upload(bucket, key, upload_id);
                result.error = ErrorKind::Backend;
                result.error_message = "Failed to assemble " + key;
                return result;
            }
        }
        std::filesystem::rename(temp_path, dest, ec);
        if (ec) {
            std::filesystem::remove(temp_path, ec);
            abort_multipart_upload(bucket, key, upload_id);
            result.error = ErrorKind::Backend;
            result.error_message = "Failed to rename into place: " + ec.message();
            return result;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::filesystem::remove_all(staging, ec);
        }

        result.success = true;
        result.bytes = file_size;
        result.etag = "\"" + upload_id + "-" + std::to_string(parts.size()) + "\"";
        return result;
    }

    std::filesystem::path root_;
    uint64_t multipart_threshold_;
    uint64_t multipart_chunk_size_;
    std::mutex mutex_;  // Guards listing and deletion against staging changes
};

// ============================================================================
// ObjectStoreFactory
// ============================================================================

std::unique_ptr<ObjectStore> ObjectStoreFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& params) {

    auto get = [&](const std::string& name) -> std::string {
        auto it = params.find(name);
        return it == params.end() ? std::string() : it->second;
    };

    if (type == "local") {
        std::string root = get("root");
        if (root.empty()) {
            throw std::runtime_error("Local object store requires 'root' parameter");
        }
        uint64_t threshold = constants::DEFAULT_MULTIPART_THRESHOLD;
        uint64_t chunk = constants::DEFAULT_MULTIPART_CHUNK_SIZE;
        if (!get("multipart_threshold").empty()) threshold = parse_u64("multipart_threshold", get("multipart_threshold"));
        if (!get("multipart_chunk_size").empty()) chunk = parse_u64("multipart_chunk_size", get("multipart_chunk_size"));
        return std::make_unique<LocalObjectStore>(root, threshold, chunk);
    }

    if (type != "s3" && type != "r2") {
        throw std::runtime_error("Unknown object store type: " + type);
    }

    S3ObjectStore::Config config;
    config.type = type;
    if (get("access_key").empty() || get("secret_key").empty()) {
        throw std::runtime_error(type + " object store requires 'access_key' and 'secret_key'");
    }
    config.access_key = SecureString(get("access_key"));
    config.secret_key = SecureString(get("secret_key"));
    config.session_token = get("session_token");

    if (type == "r2") {
        std::string account = get("account_id");
        if (account.empty()) {
            throw std::runtime_error("r2 object store requires 'account_id'");
        }
        std::string endpoint = constants::R2_ENDPOINT_FORMAT;
        endpoint.replace(endpoint.find("{account}"), 9, account);
        config.endpoint = get("endpoint").empty() ? endpoint : get("endpoint");
        config.region = "auto";
        config.use_path_style = true;
    } else {
        if (!get("region").empty()) config.region = get("region");
        config.endpoint = get("endpoint");
        if (!get("use_path_style").empty()) config.use_path_style = parse_bool(get("use_path_style"));
    }

    if (!get("verify_ssl").empty()) config.verify_ssl = parse_bool(get("verify_ssl"));
    config.ca_bundle = get("ca_bundle");
    if (!get("unsigned_payload").empty()) config.unsigned_payload = parse_bool(get("unsigned_payload"));
    if (!get("multipart_threshold").empty()) {
        config.multipart_threshold = parse_u64("multipart_threshold", get("multipart_threshold"));
    }
    if (!get("multipart_chunk_size").empty()) {
        config.multipart_chunk_size = parse_u64("multipart_chunk_size", get("multipart_chunk_size"));
        if (config.multipart_chunk_size < constants::DEFAULT_MULTIPART_CHUNK_SIZE) {
            throw std::runtime_error("multipart_chunk_size must be at least 5MB");
        }
    }
    if (!get("part_concurrency").empty()) {
        config.part_concurrency = static_cast<size_t>(parse_u64("part_concurrency", get("part_concurrency")));
    }
    if (!get("connect_timeout").empty()) {
        config.connect_timeout_secs = static_cast<uint32_t>(parse_u64("connect_timeout", get("connect_timeout")));
    }
    if (!get("request_timeout_minutes").empty()) {
        config.request_timeout_minutes =
            static_cast<uint32_t>(parse_u64("request_timeout_minutes", get("request_timeout_minutes")));
    }
    if (!get("max_retries").empty()) {
        config.max_retries = static_cast<uint32_t>(parse_u64("max_retries", get("max_retries")));
    }

    return std::make_unique<S3ObjectStore>(config);
}

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_local(
    const std::filesystem::path& root,
    uint64_t multipart_threshold,
    uint64_t multipart_chunk_size) {
    return std::make_unique<LocalObjectStore>(root, multipart_threshold, multipart_chunk_size);
}

}  // namespace assetcdn
