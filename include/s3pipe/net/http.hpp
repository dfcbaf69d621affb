#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace s3pipe::net {

// HTTP methods used by the S3 client
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

std::string url_encode(const std::string& str);

// Like url_encode, but keeps '/' so object keys stay hierarchical in paths
std::string url_encode_path(const std::string& str);

std::string base64_encode(const uint8_t* data, size_t size);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Bytes owned by the caller, sent instead of `body` when set. They must
    // outlive execute().
    std::span<const uint8_t> borrowed_body;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{300000};

    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = system default

    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::span<const uint8_t> body);
    static HttpRequest del(const std::string& url);

    std::span<const uint8_t> payload() const;
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

struct HttpClientConfig {
    // Idle easy handles kept for reuse between requests
    size_t max_idle_handles = 16;

    std::chrono::milliseconds default_connect_timeout{10000};
    std::chrono::milliseconds default_total_timeout{300000};

    // Response size limit (0 = unlimited); S3 control responses are small
    size_t max_response_size = 16 * 1024 * 1024;

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    std::string user_agent = "s3pipe/1.0";

    // curl verbose output (for --debug)
    bool verbose = false;
};

// Blocking HTTP client over libcurl easy handles, safe to share between
// upload workers.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS SigV4 signing helper (used for S3)
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service);

    void sign(HttpRequest& request) const;

    // Sign with session token (for STS credentials)
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;

    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;

    static std::optional<ParsedUrl> parse(const std::string& url);

    // Host header value: host plus port when it is not the scheme default
    std::string host_header() const;
};

} // namespace s3pipe::net
