#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace s3pipe {

// Identifies one server-side multipart upload
struct SessionHandle {
    std::string bucket;
    std::string key;
    std::string upload_id;
};

// Entry of the completion manifest
struct CompletedPart {
    int part_number = 0;
    std::string etag;
};

// Result of a store operation.
// `value` carries the upload id, part ETag or object ETag, depending on the call.
struct StoreResult {
    bool success = false;
    std::string value;
    int status_code = 0;          // HTTP status; 0 for transport-level failures
    std::string error_message;
};

// Abstract interface for multipart-capable object stores.
// Implementations must allow concurrent upload_part() calls.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Get the store type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    virtual bool bucket_exists(const std::string& bucket) const = 0;

    virtual bool object_exists(const std::string& bucket, const std::string& key) const = 0;

    // Start a multipart upload; value = upload id
    virtual StoreResult create_multipart_upload(const std::string& bucket,
                                                const std::string& key) = 0;

    // Upload one part with a base64 Content-MD5; value = part ETag
    virtual StoreResult upload_part(const SessionHandle& session,
                                    int part_number,
                                    std::span<const uint8_t> data,
                                    const std::string& content_md5) = 0;

    // Assemble the parts; value = object ETag
    virtual StoreResult complete_multipart_upload(const SessionHandle& session,
                                                  const std::vector<CompletedPart>& parts) = 0;

    virtual StoreResult abort_multipart_upload(const SessionHandle& session) = 0;

    // Digest the store reports for a finalized object; value = ETag
    virtual StoreResult get_object_digest(const std::string& bucket,
                                          const std::string& key) const = 0;
};

// Connection settings for S3-compatible endpoints
struct S3StoreConfig {
    std::string region = "us-east-1";
    std::string endpoint;          // Empty for AWS, custom for MinIO/etc
    std::string access_key;
    std::string secret_key;
    std::string session_token;     // STS/temporary credentials
    bool use_path_style = false;   // For MinIO compatibility
    bool verify_ssl = true;
    std::string ca_cert_path;
    uint32_t connect_timeout_secs = 10;
    uint32_t request_timeout_secs = 300;
    bool verbose = false;          // curl wire logging
};

// Factory for creating object stores
class ObjectStoreFactory {
public:
    static std::unique_ptr<ObjectStore> create_s3(const S3StoreConfig& config);

    // Filesystem emulation: buckets are directories under root_path
    static std::unique_ptr<ObjectStore> create_local(const std::filesystem::path& root_path);
};

} // namespace s3pipe
