#pragma once

#include <cstddef>
#include <cstdint>

namespace s3pipe::constants {

// Multipart limits imposed by S3
constexpr size_t MIN_PART_SIZE = 5 * 1024 * 1024;                  // 5 MiB, all parts but the last
constexpr size_t MAX_PART_SIZE = 5ULL * 1024 * 1024 * 1024;       // 5 GiB
constexpr int MAX_PART_COUNT = 10000;

// Upload defaults
constexpr size_t DEFAULT_CHUNK_SIZE = 8 * 1024 * 1024;             // 8 MiB
constexpr int DEFAULT_RETRY_LIMIT = 5;
constexpr int DEFAULT_RETRY_INTERVAL_SECONDS = 5;
constexpr size_t DEFAULT_UPLOAD_WORKERS = 1;
constexpr size_t MAX_UPLOAD_WORKERS = 64;

// S3 defaults
constexpr const char* DEFAULT_REGION = "us-east-1";
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_SECONDS = 10;
constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_SECONDS = 300;

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

// Content digest width (MD5)
constexpr size_t DIGEST_SIZE = 16;

} // namespace s3pipe::constants
