#include "s3pipe/net/http.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <set>
#include <sstream>

namespace s3pipe::net {

// ============================================================================
// Utility functions
// ============================================================================

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

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode_path(const std::string& str) {
    std::string result;
    size_t pos = 0;
    while (true) {
        size_t slash = str.find('/', pos);
        if (slash == std::string::npos) {
            result += url_encode(str.substr(pos));
            break;
        }
        result += url_encode(str.substr(pos, slash - pos));
        result += '/';
        pos = slash + 1;
    }
    return result;
}

static const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const uint8_t* data, size_t size) {
    std::string result;
    result.reserve((size + 2) / 3 * 4);

    for (size_t i = 0; i < size; i += 3) {
        size_t remaining = size - i;
        uint32_t octet_a = data[i];
        uint32_t octet_b = remaining > 1 ? data[i + 1] : 0;
        uint32_t octet_c = remaining > 2 ? data[i + 2] : 0;

        uint32_t triple = (octet_a << 16) + (octet_b << 8) + octet_c;

        result += base64_chars[(triple >> 18) & 0x3F];
        result += base64_chars[(triple >> 12) & 0x3F];
        result += remaining > 1 ? base64_chars[(triple >> 6) & 0x3F] : '=';
        result += remaining > 2 ? base64_chars[triple & 0x3F] : '=';
    }

    return result;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::head(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::HEAD;
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

HttpRequest HttpRequest::put(const std::string& url, std::span<const uint8_t> body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.borrowed_body = body;
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::DELETE;
    req.url = url;
    return req;
}

std::span<const uint8_t> HttpRequest::payload() const {
    if (borrowed_body.data() != nullptr) return borrowed_body;
    return std::span<const uint8_t>(body.data(), body.size());
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    size_t pos = scheme_end + 3;

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }

    size_t colon_pos = host_port.rfind(':');
    if (host_port.front() == '[') {
        // IPv6 literal
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) {
            return std::nullopt;
        }
        result.host = host_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else if (colon_pos != std::string::npos) {
        result.host = host_port.substr(0, colon_pos);
        try {
            result.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }

    pos = host_end;

    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
    }

    return result;
}

std::string ParsedUrl::host_header() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = port == 0 ||
        (scheme == "https" && port == 443) ||
        (scheme == "http" && port == 80);
    if (!default_port) {
        h += ":" + std::to_string(port);
    }
    return h;
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

// Context for bounded response accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

struct ReadCallbackContext {
    const uint8_t* data;
    size_t size;
    size_t pos;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a new header block (redirects, 100-continue)
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }
    if (line.empty()) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = (start != std::string::npos) ? value.substr(start) : "";

        headers->add(name, value);
    }

    return bytes;
}

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadCallbackContext*>(userdata);
    size_t max_bytes = size * nitems;
    size_t remaining = rd->size - rd->pos;
    size_t to_copy = std::min(max_bytes, remaining);

    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }

    return to_copy;
}

}  // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create curl handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        // Never let curl fall back to reading request bodies from stdin:
        // stdin carries the stream being uploaded.
        const auto payload = request.payload();
        ReadCallbackContext read_data{payload.data(), payload.size(), 0};

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(payload.size()));
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                                 payload.empty() ? ""
                                     : reinterpret_cast<const char*>(payload.data()));
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, &read_data);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(payload.size()));
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // Large part bodies: skip the 100-continue round trip
        headers_list = curl_slist_append(headers_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.total_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

        bool ssl_verify = request.verify_ssl && config_.verify_ssl_by_default;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, ssl_verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, ssl_verify ? 2L : 0L);

        if (!request.ca_bundle_path.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, request.ca_bundle_path.c_str());
        } else if (!config_.default_ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.default_ca_bundle.c_str());
        }

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
        } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        curl_slist_free_all(headers_list);
        release_handle(curl);

        return response;
    }

private:
    CURL* acquire_handle() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_handles_.empty()) {
                CURL* handle = idle_handles_.back();
                idle_handles_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        curl_easy_reset(handle);

        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;

    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

static std::string to_hex(const unsigned char* data, size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

static std::string sha256_hex(const uint8_t* data, size_t size) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, size, hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

static std::string sha256_hex(const std::string& data) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key,
                                        const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

static std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

static std::string format_utc_now(const char* fmt) {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

// Query params are already URL-encoded in the URL, so we only sort them and
// give value-less params (e.g. "uploads") the "key=" form.
static std::string build_canonical_query_string(const std::string& query) {
    if (query.empty()) {
        return "";
    }

    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        size_t eq = param.find('=');
        if (eq != std::string::npos) {
            params[param.substr(0, eq)] = param.substr(eq + 1);
        } else {
            params[param] = "";
        }
        pos = amp + 1;
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

std::string AwsSigV4Signer::get_canonical_request(const HttpRequest& request,
                                                  const std::string& signed_headers,
                                                  const std::string& payload_hash) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return "";

    std::ostringstream oss;
    oss << http_method_to_string(request.method) << "\n";
    oss << (url->path.empty() ? "/" : url->path) << "\n";
    oss << build_canonical_query_string(url->query) << "\n";

    // HttpHeaders keeps names lowercase and sorted
    for (const auto& [name, value] : request.headers.all()) {
        oss << name << ":" << value << "\n";
    }
    oss << "\n";

    oss << signed_headers << "\n";
    oss << payload_hash;

    return oss.str();
}

std::string AwsSigV4Signer::get_string_to_sign(const std::string& datetime,
                                               const std::string& date,
                                               const std::string& canonical_request) const {
    std::ostringstream oss;
    oss << "AWS4-HMAC-SHA256\n";
    oss << datetime << "\n";
    oss << date << "/" << region_ << "/" << service_ << "/aws4_request\n";
    oss << sha256_hex(canonical_request);
    return oss.str();
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                const std::string& string_to_sign) const {
    auto k_date = hmac_sha256("AWS4" + secret_access_key_, date);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");

    auto signature = hmac_sha256(k_signing, string_to_sign);
    return to_hex(signature.data(), signature.size());
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    std::string datetime = format_utc_now("%Y%m%dT%H%M%SZ");
    std::string date = datetime.substr(0, 8);

    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    request.headers.set("Host", url->host_header());
    request.headers.set("X-Amz-Date", datetime);

    // Reuse a pre-set payload hash (e.g. UNSIGNED-PAYLOAD) or compute it
    std::string payload_hash;
    if (auto existing = request.headers.get("X-Amz-Content-Sha256"); existing && !existing->empty()) {
        payload_hash = *existing;
    } else {
        const auto payload = request.payload();
        payload_hash = sha256_hex(payload.data(), payload.size());
    }
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    std::set<std::string> header_names;
    for (const auto& [name, value] : request.headers.all()) {
        header_names.insert(name);
    }

    std::string signed_headers;
    for (const auto& name : header_names) {
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    std::string canonical_request = get_canonical_request(request, signed_headers, payload_hash);
    std::string string_to_sign = get_string_to_sign(datetime, date, canonical_request);
    std::string signature = calculate_signature(date, string_to_sign);

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 ";
    auth << "Credential=" << access_key_id_ << "/" << date << "/" << region_ << "/"
         << service_ << "/aws4_request, ";
    auth << "SignedHeaders=" << signed_headers << ", ";
    auth << "Signature=" << signature;

    request.headers.set("Authorization", auth.str());
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request);
}

} // namespace s3pipe::net
