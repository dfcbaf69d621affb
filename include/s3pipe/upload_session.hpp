#pragma once

#include "s3pipe/part_uploader.hpp"
#include "s3pipe/storage/object_store.hpp"
#include "s3pipe/upload_error.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace s3pipe {

class MetricsExporter;

enum class SessionState {
    Idle,          // start() not called yet
    Open,
    Completing,
    Completed,
    Aborted,
};

const char* session_state_name(SessionState state);

/// Lifecycle of one server-side multipart upload and the parts verified so far.
///
/// Part numbers are handed out at read time and recorded once Verified.
/// next_part_number() and record_part() are safe to call from several
/// workers; start/complete/abort are driven by a single orchestrating thread.
class UploadSession {
public:
    UploadSession(ObjectStore& store, std::string bucket, std::string key,
                  MetricsExporter* metrics = nullptr);
    ~UploadSession() = default;

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    /// Create the multipart upload. SessionStartError on any store failure.
    std::optional<UploadError> start();

    /// 1, 2, 3, ... in call order.
    int next_part_number() { return ++last_part_number_; }

    /// Store a Verified part. Returns false for a duplicate part number,
    /// a part that is not Verified, or a session that is not Open.
    bool record_part(const Part& part);

    /// Send the manifest of parts {1..expected_parts} and finalize the object.
    /// SessionCompleteError if parts are missing or the store rejects it.
    std::optional<UploadError> complete(int expected_parts);

    /// Best-effort abort. Failures are logged; repeated calls and calls
    /// after completion do nothing.
    void abort();

    /// Part digests in ascending part order.
    std::vector<ContentDigest> part_digests() const;

    SessionState state() const;
    const SessionHandle& handle() const { return handle_; }
    size_t recorded_parts() const;

private:
    ObjectStore& store_;
    SessionHandle handle_;
    MetricsExporter* metrics_;

    std::atomic<int> last_part_number_{0};

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Idle;
    std::map<int, Part> parts_;
};

} // namespace s3pipe
