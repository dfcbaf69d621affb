#include "s3pipe/upload_session.hpp"
#include "s3pipe/log.hpp"
#include "s3pipe/metrics.hpp"

namespace s3pipe {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle:       return "Idle";
        case SessionState::Open:       return "Open";
        case SessionState::Completing: return "Completing";
        case SessionState::Completed:  return "Completed";
        case SessionState::Aborted:    return "Aborted";
    }
    return "Unknown";
}

UploadSession::UploadSession(ObjectStore& store, std::string bucket, std::string key,
                             MetricsExporter* metrics)
    : store_(store)
    , metrics_(metrics) {
    handle_.bucket = std::move(bucket);
    handle_.key = std::move(key);
}

std::optional<UploadError> UploadSession::start() {
    std::lock_guard lock(mutex_);
    if (state_ != SessionState::Idle) {
        return UploadError::make(ErrorKind::SessionStartError,
            std::string("session already ") + session_state_name(state_));
    }

    auto result = store_.create_multipart_upload(handle_.bucket, handle_.key);
    if (!result.success) {
        return UploadError::make(ErrorKind::SessionStartError,
            "multipart upload could not be initiated: " + result.error_message);
    }

    handle_.upload_id = result.value;
    state_ = SessionState::Open;
    log_debug("Started multipart upload %s for s3://%s/%s",
              handle_.upload_id.c_str(), handle_.bucket.c_str(), handle_.key.c_str());
    return std::nullopt;
}

bool UploadSession::record_part(const Part& part) {
    if (part.state != PartState::Verified || part.number < 1) return false;

    std::lock_guard lock(mutex_);
    if (state_ != SessionState::Open) return false;
    return parts_.emplace(part.number, part).second;
}

std::optional<UploadError> UploadSession::complete(int expected_parts) {
    std::vector<CompletedPart> manifest;
    {
        std::lock_guard lock(mutex_);
        if (state_ != SessionState::Open) {
            return UploadError::make(ErrorKind::SessionCompleteError,
                std::string("cannot complete a session that is ") + session_state_name(state_));
        }

        // Recorded part numbers must be exactly {1..N}
        int expected = 1;
        for (const auto& [number, part] : parts_) {
            if (number != expected) break;
            ++expected;
        }
        if (expected_parts < 1 || parts_.size() != static_cast<size_t>(expected_parts) ||
            expected != expected_parts + 1) {
            UploadError error = UploadError::make(ErrorKind::SessionCompleteError,
                "recorded parts do not cover 1.." + std::to_string(expected_parts) +
                " (" + std::to_string(parts_.size()) + " recorded)");
            error.part_number = expected <= expected_parts ? expected : 0;
            return error;
        }

        manifest.reserve(parts_.size());
        for (const auto& [number, part] : parts_) {
            manifest.push_back(CompletedPart{number, part.etag});
        }
        state_ = SessionState::Completing;
    }

    auto result = store_.complete_multipart_upload(handle_, manifest);

    std::lock_guard lock(mutex_);
    if (!result.success) {
        // Back to Open so the caller's abort() cleans up the staged parts
        state_ = SessionState::Open;
        return UploadError::make(ErrorKind::SessionCompleteError,
            "error while completing upload: " + result.error_message);
    }

    state_ = SessionState::Completed;
    if (metrics_) metrics_->sessions_completed().Increment();
    log_info("Completed uploading %d parts and verified the reported checksums", expected_parts);
    return std::nullopt;
}

void UploadSession::abort() {
    {
        std::lock_guard lock(mutex_);
        if (state_ != SessionState::Open && state_ != SessionState::Completing) return;
        state_ = SessionState::Aborted;
    }

    if (metrics_) metrics_->sessions_aborted().Increment();

    auto result = store_.abort_multipart_upload(handle_);
    if (result.success) {
        log_info("Aborted multipart upload");
    } else {
        log_error("Failed to abort multipart upload %s: %s",
                  handle_.upload_id.c_str(), result.error_message.c_str());
    }
}

std::vector<ContentDigest> UploadSession::part_digests() const {
    std::lock_guard lock(mutex_);
    std::vector<ContentDigest> digests;
    digests.reserve(parts_.size());
    for (const auto& [number, part] : parts_) {
        digests.push_back(part.digest);
    }
    return digests;
}

SessionState UploadSession::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

size_t UploadSession::recorded_parts() const {
    std::lock_guard lock(mutex_);
    return parts_.size();
}

} // namespace s3pipe
