#pragma once

#include "s3pipe/cancellation.hpp"
#include "s3pipe/chunk_source.hpp"
#include "s3pipe/integrity_verifier.hpp"
#include "s3pipe/part_uploader.hpp"
#include "s3pipe/storage/object_store.hpp"
#include "s3pipe/upload_error.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace s3pipe {

class MetricsExporter;
class UploadSession;

struct UploaderOptions {
    std::string bucket;
    std::string key;
    RetryPolicy retry;
    int workers = 1;               // Max parts in flight; 1 = sequential
    bool preflight = true;         // Check bucket exists and key is free
};

struct UploadResult {
    std::string key;
    std::string bucket;
    uint64_t total_bytes = 0;
    int part_count = 0;
    std::string composite_digest;  // Expected, computed locally
    std::string remote_digest;     // Observed, reported by the store
    std::string stream_md5;        // MD5 of the whole input
    IntegrityStatus status = IntegrityStatus::IntegrityMismatch;
};

/// Terminal outcome of a run. On integrity mismatch both fields are set:
/// the object exists, but its digest disagrees with the local one.
struct UploadOutcome {
    std::optional<UploadResult> result;
    std::optional<UploadError> error;

    bool ok() const { return result && !error; }
};

/// Streams a ChunkSource into one multipart object:
/// read -> upload + verify each part -> complete -> verify the whole object.
///
/// With workers > 1, up to that many parts are uploaded concurrently. The
/// reading thread assigns part numbers and blocks while the window is full.
/// The first fatal error cancels all outstanding work and aborts the session
/// once every worker has returned.
class StreamUploader {
public:
    StreamUploader(ObjectStore& store, UploaderOptions options,
                   MetricsExporter* metrics = nullptr);

    StreamUploader(const StreamUploader&) = delete;
    StreamUploader& operator=(const StreamUploader&) = delete;

    /// Replace the retry wait (tests use this to skip real sleeps).
    void set_wait_function(PartUploader::WaitFunction wait) { wait_ = std::move(wait); }

    /// Bucket must exist and the object must not.
    std::optional<UploadError> preflight() const;

    UploadOutcome run(ChunkSource& source);

    /// Stop a running upload; outstanding retries end at their next wait.
    void cancel() { cancel_.cancel(); }

private:
    std::optional<UploadError> upload_parts(ChunkSource& source, UploadSession& session,
                                            const PartUploader& uploader);
    void record_failure(UploadError error);

    ObjectStore& store_;
    UploaderOptions options_;
    MetricsExporter* metrics_;
    PartUploader::WaitFunction wait_;
    CancellationToken cancel_;

    std::mutex error_mutex_;
    std::optional<UploadError> first_error_;
};

} // namespace s3pipe
