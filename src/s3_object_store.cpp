#include "s3pipe/storage/s3_requests.hpp"

#include <sstream>
#include <utility>

namespace s3pipe {

// ============================================================================
// XML parsing helpers for S3 responses (avoids regex for better reliability)
// ============================================================================

namespace {

namespace xml {

// Find the value between <tag>value</tag>, returns empty string if not found
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

// Decode XML entities (basic set used by S3)
std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
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

} // namespace xml

// ============================================================================
// SecureString - A string class that zeros memory on destruction
// Prevents credentials from remaining in memory after use
// ============================================================================

class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string s) : data_(std::move(s)) {}

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    ~SecureString() {
        if (!data_.empty()) {
            volatile char* p = const_cast<volatile char*>(data_.data());
            size_t len = data_.size();
            while (len--) {
                *p++ = 0;
            }
        }
    }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    std::string data_;
};

// Ensure ETag has surrounding quotes (required for S3 CompleteMultipartUpload)
std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

std::string describe_error_body(const std::string& body) {
    std::string code = xml::get_element(body, "Code");
    std::string message = xml::decode_entities(xml::get_element(body, "Message"));
    if (code.empty() && message.empty()) return "";
    if (message.empty()) return code;
    if (code.empty()) return message;
    return code + ": " + message;
}

net::HttpRequest with_limits(const S3StoreConfig& config, net::HttpRequest request) {
    request.connect_timeout = std::chrono::seconds(config.connect_timeout_secs);
    request.total_timeout = std::chrono::seconds(config.request_timeout_secs);
    request.verify_ssl = config.verify_ssl;
    return request;
}

std::string upload_query(const SessionHandle& session) {
    return "uploadId=" + net::url_encode(session.upload_id);
}

}  // namespace

// ============================================================================
// Wire format
// ============================================================================

namespace s3 {

std::string object_url(const S3StoreConfig& config,
                       const std::string& bucket,
                       const std::string& key) {
    std::string url;
    if (!config.endpoint.empty()) {
        url = config.endpoint;
        while (!url.empty() && url.back() == '/') url.pop_back();
        if (config.use_path_style) {
            url += "/" + bucket;
        } else {
            // Virtual-host style on a custom endpoint: prepend bucket to the host
            size_t scheme_end = url.find("://");
            if (scheme_end != std::string::npos) {
                url.insert(scheme_end + 3, bucket + ".");
            }
        }
    } else if (config.use_path_style) {
        url = "https://s3." + config.region + ".amazonaws.com/" + bucket;
    } else {
        url = "https://" + bucket + ".s3." + config.region + ".amazonaws.com";
    }

    url += "/" + net::url_encode_path(key);
    return url;
}

net::HttpRequest create_multipart_request(const S3StoreConfig& config,
                                          const std::string& bucket,
                                          const std::string& key) {
    auto request = with_limits(config,
        net::HttpRequest::post(object_url(config, bucket, key) + "?uploads", ""));
    request.headers.set_content_type("application/octet-stream");
    return request;
}

net::HttpRequest upload_part_request(const S3StoreConfig& config,
                                     const SessionHandle& session,
                                     int part_number,
                                     std::span<const uint8_t> data,
                                     const std::string& content_md5) {
    std::string url = object_url(config, session.bucket, session.key) +
        "?partNumber=" + std::to_string(part_number) + "&" + upload_query(session);

    auto request = with_limits(config, net::HttpRequest::put(url, data));
    // The server rejects the part (BadDigest) if the received bytes do not hash to this
    request.headers.set("Content-MD5", content_md5);
    return request;
}

net::HttpRequest complete_multipart_request(const S3StoreConfig& config,
                                            const SessionHandle& session,
                                            const std::vector<CompletedPart>& parts) {
    std::string url = object_url(config, session.bucket, session.key) + "?" + upload_query(session);
    auto request = with_limits(config,
        net::HttpRequest::post(url, complete_multipart_body(parts)));
    request.headers.set_content_type("application/xml");
    return request;
}

net::HttpRequest abort_multipart_request(const S3StoreConfig& config,
                                         const SessionHandle& session) {
    std::string url = object_url(config, session.bucket, session.key) + "?" + upload_query(session);
    return with_limits(config, net::HttpRequest::del(url));
}

std::string complete_multipart_body(const std::vector<CompletedPart>& parts) {
    std::ostringstream body;
    body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
    for (const auto& part : parts) {
        body << "  <Part>\n";
        body << "    <PartNumber>" << part.part_number << "</PartNumber>\n";
        body << "    <ETag>" << xml::escape(ensure_etag_quotes(part.etag)) << "</ETag>\n";
        body << "  </Part>\n";
    }
    body << "</CompleteMultipartUpload>";
    return body.str();
}

StoreResult to_result(const net::HttpResponse& response) {
    StoreResult result;
    result.status_code = response.status_code;
    if (response.ok()) {
        result.success = true;
        return result;
    }

    if (!response.error.empty()) {
        result.error_message = response.error;
    } else {
        result.error_message = "HTTP " + std::to_string(response.status_code);
        std::string detail = describe_error_body(response.body_string());
        if (!detail.empty()) {
            result.error_message += " " + detail;
        }
    }
    return result;
}

StoreResult parse_create_response(const net::HttpResponse& response) {
    StoreResult result = to_result(response);
    if (!result.success) return result;

    std::string upload_id = xml::get_element(response.body_string(), "UploadId");
    if (upload_id.empty()) {
        result.success = false;
        result.error_message = "response carries no UploadId";
        return result;
    }
    result.value = xml::decode_entities(upload_id);
    return result;
}

StoreResult parse_upload_part_response(const net::HttpResponse& response) {
    StoreResult result = to_result(response);
    if (!result.success) return result;

    auto etag = response.headers.get("ETag");
    if (!etag || etag->empty()) {
        result.success = false;
        result.error_message = "response carries no ETag";
        return result;
    }
    result.value = *etag;
    return result;
}

StoreResult parse_complete_response(const net::HttpResponse& response) {
    StoreResult result = to_result(response);
    if (!result.success) return result;

    // S3 can report a failed completion inside a 200 response
    std::string body = response.body_string();
    if (body.find("<Error>") != std::string::npos) {
        result.success = false;
        result.error_message = describe_error_body(body);
        return result;
    }

    std::string etag = xml::get_element(body, "ETag");
    if (etag.empty()) {
        result.success = false;
        result.error_message = "response carries no ETag";
        return result;
    }
    result.value = xml::decode_entities(etag);
    return result;
}

StoreResult parse_head_response(const net::HttpResponse& response) {
    StoreResult result = to_result(response);
    if (!result.success) return result;

    auto etag = response.headers.get("ETag");
    if (!etag || etag->empty()) {
        result.success = false;
        result.error_message = "HEAD response carries no ETag";
        return result;
    }
    result.value = *etag;
    return result;
}

} // namespace s3

// ============================================================================
// S3ObjectStore - S3-compatible multipart implementation
// ============================================================================

class S3ObjectStore : public ObjectStore {
public:
    explicit S3ObjectStore(const S3StoreConfig& config)
        : config_(config)
        , secret_key_(config.secret_key)
        , session_token_(config.session_token)
        , signer_(config.access_key, secret_key_.str(), config.region, "s3") {
        // Keep only the SecureString copies of the secrets
        config_.secret_key.clear();
        config_.session_token.clear();

        net::HttpClientConfig http_config;
        http_config.verify_ssl_by_default = config_.verify_ssl;
        http_config.default_ca_bundle = config_.ca_cert_path;
        http_config.default_connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
        http_config.default_total_timeout = std::chrono::seconds(config_.request_timeout_secs);
        http_config.verbose = config_.verbose;
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "s3"; }

    bool bucket_exists(const std::string& bucket) const override {
        auto request = with_limits(config_, net::HttpRequest::head(s3::object_url(config_, bucket, "")));
        return execute(request).ok();
    }

    bool object_exists(const std::string& bucket, const std::string& key) const override {
        auto request = with_limits(config_, net::HttpRequest::head(s3::object_url(config_, bucket, key)));
        return execute(request).ok();
    }

    StoreResult create_multipart_upload(const std::string& bucket,
                                        const std::string& key) override {
        auto request = s3::create_multipart_request(config_, bucket, key);
        return s3::parse_create_response(execute(request));
    }

    StoreResult upload_part(const SessionHandle& session,
                            int part_number,
                            std::span<const uint8_t> data,
                            const std::string& content_md5) override {
        auto request = s3::upload_part_request(config_, session, part_number, data, content_md5);
        return s3::parse_upload_part_response(execute(request));
    }

    StoreResult complete_multipart_upload(const SessionHandle& session,
                                          const std::vector<CompletedPart>& parts) override {
        auto request = s3::complete_multipart_request(config_, session, parts);
        return s3::parse_complete_response(execute(request));
    }

    StoreResult abort_multipart_upload(const SessionHandle& session) override {
        auto request = s3::abort_multipart_request(config_, session);
        return s3::to_result(execute(request));
    }

    StoreResult get_object_digest(const std::string& bucket,
                                  const std::string& key) const override {
        auto request = with_limits(config_, net::HttpRequest::head(s3::object_url(config_, bucket, key)));
        return s3::parse_head_response(execute(request));
    }

private:
    net::HttpResponse execute(net::HttpRequest& request) const {
        sign_request(request);
        return http_client_->execute(request);
    }

    void sign_request(net::HttpRequest& request) const {
        if (!session_token_.empty()) {
            signer_.sign_with_token(request, session_token_.str());
        } else {
            signer_.sign(request);
        }
    }

    S3StoreConfig config_;
    SecureString secret_key_;
    SecureString session_token_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;
};

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_s3(const S3StoreConfig& config) {
    return std::make_unique<S3ObjectStore>(config);
}

} // namespace s3pipe
