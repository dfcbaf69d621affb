#pragma once

#include "s3pipe/core/constants.hpp"
#include "s3pipe/storage/object_store.hpp"
#include "s3pipe/stream_uploader.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace s3pipe {

/// Configuration for one s3pipe run.
struct UploadConfig {
    // Input: file path or "-" for stdin
    std::string infile = "-";

    // Target object
    std::string bucket;
    std::string key;

    // Chunking and retry
    uint64_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
    int retry_limit = constants::DEFAULT_RETRY_LIMIT;
    int retry_interval_secs = constants::DEFAULT_RETRY_INTERVAL_SECONDS;
    size_t workers = constants::DEFAULT_UPLOAD_WORKERS;
    bool skip_preflight = false;

    // Object store: "s3" or "local"
    std::string store_type = "s3";
    std::filesystem::path store_path;     // Root directory for the local store

    // S3 connection
    std::string region = constants::DEFAULT_REGION;
    std::string endpoint;
    bool path_style = false;
    bool verify_ssl = true;
    std::string ca_cert_path;

    // Credentials: keyfile, else AWS_* environment
    std::filesystem::path keyfile;
    std::string access_key;
    std::string secret_key;
    std::string session_token;

    // Logging
    bool debug = false;
    bool verbose = false;                 // curl wire logging
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<UploadConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill credentials from the keyfile if one is set, else from the
    /// environment. Returns error message or empty string.
    std::string resolve_credentials();

    /// Validate required fields and limits. Returns error message or empty string.
    std::string validate() const;

    S3StoreConfig s3_config() const;
    UploaderOptions uploader_options() const;
};

/// Parse a keyfile holding "<ACCESS_KEY_ID>:<SECRET_KEY>".
/// Returns error message or empty string.
std::string parse_keyfile(const std::filesystem::path& path,
                          std::string& access_key, std::string& secret_key);

}  // namespace s3pipe
