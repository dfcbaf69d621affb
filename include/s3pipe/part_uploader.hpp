#pragma once

#include "s3pipe/cancellation.hpp"
#include "s3pipe/digest.hpp"
#include "s3pipe/storage/object_store.hpp"
#include "s3pipe/upload_error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace s3pipe {

class MetricsExporter;

/// Verification state of one part.
enum class PartState {
    Pending,
    Uploading,
    Verifying,
    Verified,
    Retrying,
    Failed,
};

const char* part_state_name(PartState state);

/// Bookkeeping for one multipart part. The bytes themselves are not kept
/// here; they live in PartUploader::upload() until a terminal state.
struct Part {
    int number = 0;
    uint64_t size = 0;
    ContentDigest digest{};
    std::string etag;          // Normalized ETag of the verified attempt
    PartState state = PartState::Pending;
    int attempts = 0;
};

struct RetryPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds interval{5000};
};

/// Terminal result of one part: Verified, or Failed with the fatal error.
struct PartOutcome {
    Part part;
    std::optional<UploadError> error;

    bool verified() const { return part.state == PartState::Verified; }
};

/// Drives one part through upload, ETag verification and retry.
///
///   Pending -> Uploading -> Verifying -> Verified
///                  ^            |
///                  +- Retrying <+--> Failed (attempt limit reached)
///
/// A part is Verified only when the ETag returned for that attempt equals
/// the local MD5. Transport failures and digest mismatches are both retried
/// with the same cached bytes until the policy's attempt limit.
///
/// upload() is const and keeps no per-part state in the object, so one
/// uploader serves all workers of a session concurrently.
class PartUploader {
public:
    /// Blocks for the given duration between attempts. Returns false to stop
    /// retrying (the upload was cancelled).
    using WaitFunction = std::function<bool(std::chrono::milliseconds)>;

    /// Observes each state transition (used by tests and debug logging).
    using TransitionObserver = std::function<void(const Part&)>;

    PartUploader(ObjectStore& store,
                 SessionHandle session,
                 RetryPolicy policy,
                 const CancellationToken* cancel = nullptr,
                 MetricsExporter* metrics = nullptr);

    void set_wait_function(WaitFunction wait) { wait_ = std::move(wait); }
    void set_transition_observer(TransitionObserver observer) { observer_ = std::move(observer); }

    const RetryPolicy& policy() const { return policy_; }

    /// Upload one part. Takes ownership of the bytes and releases them
    /// before returning, whatever the outcome.
    PartOutcome upload(int part_number, std::vector<uint8_t> bytes) const;

private:
    void transition(Part& part, PartState state) const;
    bool wait_before_retry() const;

    ObjectStore& store_;
    SessionHandle session_;
    RetryPolicy policy_;
    const CancellationToken* cancel_;
    MetricsExporter* metrics_;
    WaitFunction wait_;
    TransitionObserver observer_;
};

/// Human-readable part size as printed on progress lines ("8192 KiB", "12 B").
std::string format_part_size(uint64_t bytes);

} // namespace s3pipe
