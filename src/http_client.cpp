#include "assetcdn/http.hpp"
#include "assetcdn/log.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace assetcdn::net {

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

namespace {

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

void append_escaped(std::string& out, unsigned char c) {
    static const char hex[] = "0123456789ABCDEF";
    out += '%';
    out += hex[c >> 4];
    out += hex[c & 0x0f];
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

std::string url_encode(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (is_unreserved(c)) out += static_cast<char>(c);
        else append_escaped(out, c);
    }
    return out;
}

std::string url_encode_path(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        if (is_unreserved(c) || c == '/') out += static_cast<char>(c);
        else append_escaped(out, c);
    }
    return out;
}

// --- HttpHeaders ---

void HttpHeaders::set(const std::string& name, const std::string& value) {
    values_[lowercase(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    values_[lowercase(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    values_.erase(lowercase(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = values_.find(lowercase(name));
    if (it == values_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

bool HttpHeaders::has(const std::string& name) const {
    return values_.count(lowercase(name)) > 0;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> out;
    for (const auto& [name, list] : values_) {
        for (const auto& value : list) out.emplace_back(name, value);
    }
    return out;
}

// --- HttpRequest ---

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body.assign(body.begin(), body.end());
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body = std::move(body);
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::DELETE;
    req.url = url;
    return req;
}

// --- Transfer state ---

namespace {

// Per-transfer state shared by the curl callbacks. Each "HTTP/" status line
// starts a new response, so redirect hops never leak headers or bodies into
// the final one.
struct Transfer {
    CURL* curl = nullptr;
    const HttpRequest* request = nullptr;
    HttpResponse* response = nullptr;
    size_t max_memory_body = 0;

    std::ofstream file;
    bool file_error = false;
    bool size_exceeded = false;
    bool aborted = false;

    const uint8_t* upload_data = nullptr;
    size_t upload_size = 0;
    size_t upload_pos = 0;

    bool streaming_to_file() const {
        if (request->output_path.empty()) return false;
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        return status >= 200 && status < 300;
    }
};

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    if (line.rfind("HTTP/", 0) == 0) {
        t->response->headers = HttpHeaders{};
        t->response->body.clear();
        t->response->bytes_received = 0;
        return bytes;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        auto value_start = line.find_first_not_of(" \t", colon + 1);
        t->response->headers.add(line.substr(0, colon),
                                 value_start == std::string::npos ? "" : line.substr(value_start));
    }
    return bytes;
}

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t bytes = size * nmemb;

    if (t->streaming_to_file()) {
        if (!t->file.is_open()) {
            t->file.open(t->request->output_path, std::ios::binary | std::ios::trunc);
        }
        t->file.write(ptr, static_cast<std::streamsize>(bytes));
        if (!t->file) {
            t->file_error = true;
            return 0;
        }
    } else {
        auto& body = t->response->body;
        if (t->max_memory_body > 0 && body.size() + bytes > t->max_memory_body) {
            t->size_exceeded = true;
            return 0;
        }
        body.insert(body.end(), ptr, ptr + bytes);
    }
    t->response->bytes_received += bytes;
    return bytes;
}

size_t on_upload(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t n = std::min(size * nitems, t->upload_size - t->upload_pos);
    if (n > 0) {
        std::memcpy(buffer, t->upload_data + t->upload_pos, n);
        t->upload_pos += n;
    }
    return n;
}

int on_progress(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                curl_off_t ultotal, curl_off_t ulnow) {
    auto* t = static_cast<Transfer*>(clientp);
    HttpProgress p;
    p.download_total = static_cast<uint64_t>(dltotal);
    p.download_now = static_cast<uint64_t>(dlnow);
    p.upload_total = static_cast<uint64_t>(ultotal);
    p.upload_now = static_cast<uint64_t>(ulnow);
    if (!t->request->progress_callback(p)) {
        t->aborted = true;
        return 1;
    }
    return 0;
}

}  // namespace

// --- HttpClient ---

struct HttpClient::HandlePool {
    std::mutex mutex;
    std::vector<CURL*> idle;

    ~HandlePool() {
        for (CURL* h : idle) curl_easy_cleanup(h);
    }
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : config_(config)
    , pool_(std::make_unique<HandlePool>()) {
    static std::once_flag curl_init;
    std::call_once(curl_init, [] { curl_global_init(CURL_GLOBAL_ALL); });

    if (!config_.verify_ssl) {
        log_warn("TLS certificate verification disabled for %s", config_.user_agent.c_str());
    }
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    HttpResponse response;

    CURL* curl = nullptr;
    {
        std::lock_guard<std::mutex> lock(pool_->mutex);
        if (!pool_->idle.empty()) {
            curl = pool_->idle.back();
            pool_->idle.pop_back();
        }
    }
    if (!curl) curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        response.is_network_error = true;
        return response;
    }

    Transfer t;
    t.curl = curl;
    t.request = &request;
    t.response = &response;
    t.max_memory_body = config_.max_response_size;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            // Never NULL: curl would fall back to reading the body from stdin
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                             request.body.empty() ? "" : reinterpret_cast<const char*>(request.body.data()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            break;
        case HttpMethod::PUT:
            // Explicit length: R2 and MinIO answer 411 to a chunked empty PUT
            t.upload_data = request.body.data();
            t.upload_size = request.body.size();
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_upload);
            curl_easy_setopt(curl, CURLOPT_READDATA, &t);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            break;
        case HttpMethod::DELETE:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
        case HttpMethod::HEAD:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
    }

    curl_slist* header_list = nullptr;
    for (const auto& [name, value] : request.headers.all()) {
        header_list = curl_slist_append(header_list, (name + ": " + value).c_str());
    }
    if (header_list) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &t);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &t);
    if (request.progress_callback) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, on_progress);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &t);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.total_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, static_cast<long>(config_.tcp_keepalive_idle.count()));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);
    const std::string& ca = request.ca_bundle_path.empty() ? config_.ca_bundle : request.ca_bundle_path;
    if (!ca.empty()) curl_easy_setopt(curl, CURLOPT_CAINFO, ca.c_str());

    CURLcode rc = curl_easy_perform(curl);

    if (t.file.is_open()) t.file.close();
    if (t.file_error) {
        response.error = "Cannot write " + request.output_path;
    } else if (t.size_exceeded) {
        response.error = "Response body exceeds " + std::to_string(config_.max_response_size) + " bytes";
    } else if (rc == CURLE_ABORTED_BY_CALLBACK || t.aborted) {
        response.error = "Transfer aborted";
        response.aborted = true;
    } else if (rc != CURLE_OK) {
        response.error = curl_easy_strerror(rc);
        response.is_network_error = true;
    } else {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);
    }

    // output_path only ever holds a complete 2xx body
    if (!request.output_path.empty() && !(response.ok() && response.error.empty())) {
        std::error_code ec;
        std::filesystem::remove(request.output_path, ec);
    }

    if (header_list) curl_slist_free_all(header_list);
    curl_easy_reset(curl);
    {
        std::lock_guard<std::mutex> lock(pool_->mutex);
        if (pool_->idle.size() < config_.max_idle_handles) {
            pool_->idle.push_back(curl);
            curl = nullptr;
        }
    }
    if (curl) curl_easy_cleanup(curl);
    return response;
}

// --- AwsSigV4Signer ---

namespace {

std::string hex_encode(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

std::string sha256_hex(const void* data, size_t len) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_Digest(data, len, digest, &digest_len, EVP_sha256(), nullptr);
    return hex_encode(digest, digest_len);
}

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& msg) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(msg.data()), msg.size(), mac, &mac_len);
    return std::vector<uint8_t>(mac, mac + mac_len);
}

struct UrlParts {
    std::string authority;  // host[:port]
    std::string path;
    std::string query;
};

std::optional<UrlParts> split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;
    auto host_start = scheme_end + 3;
    auto host_end = url.find_first_of("/?#", host_start);
    if (host_end == std::string::npos) host_end = url.size();

    UrlParts parts;
    parts.authority = url.substr(host_start, host_end - host_start);
    if (parts.authority.empty()) return std::nullopt;

    auto fragment = url.find('#', host_end);
    auto rest = url.substr(host_end, fragment == std::string::npos ? std::string::npos
                                                                    : fragment - host_end);
    auto q = rest.find('?');
    parts.path = rest.substr(0, q);
    if (parts.path.empty()) parts.path = "/";
    if (q != std::string::npos) parts.query = rest.substr(q + 1);
    return parts;
}

// Parameters arrive already encoded; SigV4 wants them sorted by name and a
// bare flag ("uploads", "delete") signed as "flag=".
std::string canonical_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        auto param = query.substr(pos, amp - pos);
        if (!param.empty()) {
            auto eq = param.find('=');
            if (eq == std::string::npos) params[param] = "";
            else params[param.substr(0, eq)] = param.substr(eq + 1);
        }
        pos = amp + 1;
    }
    std::string out;
    for (const auto& [name, value] : params) {
        if (!out.empty()) out += '&';
        out += name + "=" + value;
    }
    return out;
}

std::string amz_datetime() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[17];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

}  // namespace

AwsSigV4Signer::AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                               std::string region, std::string service)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(std::move(secret_access_key))
    , region_(std::move(region))
    , service_(std::move(service)) {}

std::string AwsSigV4Signer::scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::vector<uint8_t> AwsSigV4Signer::signing_key(const std::string& date) const {
    std::string seed = "AWS4" + secret_access_key_;
    auto key = hmac_sha256(std::vector<uint8_t>(seed.begin(), seed.end()), date);
    key = hmac_sha256(key, region_);
    key = hmac_sha256(key, service_);
    return hmac_sha256(key, "aws4_request");
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    auto url = split_url(request.url);
    if (!url) {
        log_warn("Cannot sign malformed URL %s", request.url.c_str());
        return;
    }

    const std::string datetime = amz_datetime();
    const std::string date = datetime.substr(0, 8);

    request.headers.set("host", url->authority);
    request.headers.set("x-amz-date", datetime);
    std::string payload_hash = request.headers.get("x-amz-content-sha256").value_or("");
    if (payload_hash.empty()) {
        payload_hash = sha256_hex(request.body.data(), request.body.size());
        request.headers.set("x-amz-content-sha256", payload_hash);
    }

    // Every header is signed; all() yields lowercase names in sorted order
    std::string canonical_headers;
    std::string signed_headers;
    std::string last_name;
    for (const auto& [name, value] : request.headers.all()) {
        canonical_headers += name + ":" + value + "\n";
        if (name == last_name) continue;
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
        last_name = name;
    }

    std::string canonical_request =
        std::string(http_method_to_string(request.method)) + "\n" +
        url->path + "\n" +
        canonical_query(url->query) + "\n" +
        canonical_headers + "\n" +
        signed_headers + "\n" +
        payload_hash;

    std::string string_to_sign =
        "AWS4-HMAC-SHA256\n" + datetime + "\n" + scope(date) + "\n" +
        sha256_hex(canonical_request.data(), canonical_request.size());

    auto sig = hmac_sha256(signing_key(date), string_to_sign);
    request.headers.set("authorization",
        "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" + scope(date) +
        ", SignedHeaders=" + signed_headers +
        ", Signature=" + hex_encode(sig.data(), sig.size()));
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request, const std::string& session_token) const {
    request.headers.set("x-amz-security-token", session_token);
    sign(request);
}

}  // namespace assetcdn::net
