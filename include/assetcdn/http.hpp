#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace assetcdn::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

/// Header map keyed by lowercased name. Iteration order is sorted, which
/// the SigV4 canonical request relies on.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type) { set("content-type", content_type); }

private:
    std::map<std::string, std::vector<std::string>> values_;
};

struct HttpProgress {
    uint64_t download_total = 0;
    uint64_t download_now = 0;
    uint64_t upload_total = 0;
    uint64_t upload_now = 0;
};

using HttpProgressCallback = std::function<bool(const HttpProgress&)>;  // false aborts

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    /// When set, a 2xx response body is written to this file instead of
    /// HttpResponse::body. Error bodies are always kept in memory.
    std::string output_path;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{600000};

    HttpProgressCallback progress_callback;
    std::string ca_bundle_path;  // Empty = client default

    static HttpRequest get(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    uint64_t bytes_received = 0;  // Body bytes, including those streamed to output_path

    bool ok() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const { return std::string(body.begin(), body.end()); }

    std::string error;
    bool is_network_error = false;  // Transport failure, not an HTTP status
    bool aborted = false;           // Progress callback asked to stop
};

struct HttpClientConfig {
    size_t max_idle_handles = 16;

    // In-memory body limit (0 = unlimited). Streamed bodies are not limited.
    size_t max_response_size = 64 * 1024 * 1024;

    bool verify_ssl = true;
    std::string ca_bundle;

    std::string user_agent = "assetcdn/1.0";
    std::chrono::seconds tcp_keepalive_idle{60};
};

/// Blocking HTTP client. Easy handles are recycled so connections to the
/// same bucket or CDN edge stay warm across requests.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    const HttpClientConfig& config() const { return config_; }

private:
    HttpClientConfig config_;
    struct HandlePool;
    std::unique_ptr<HandlePool> pool_;
};

/// AWS SigV4 signing for S3 and S3-compatible stores (R2, MinIO).
class AwsSigV4Signer {
public:
    AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                   std::string region, std::string service);

    /// Sets Host, X-Amz-Date, X-Amz-Content-Sha256 and Authorization. A
    /// payload hash already present on the request is signed as given.
    void sign(HttpRequest& request) const;
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

private:
    std::string scope(const std::string& date) const;
    std::vector<uint8_t> signing_key(const std::string& date) const;

    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

std::string url_encode(const std::string& str);

/// Encode an object key for use in a URL path: like url_encode but keeps '/'.
std::string url_encode_path(const std::string& key);

}  // namespace assetcdn::net
