#include "s3pipe/part_uploader.hpp"
#include "s3pipe/log.hpp"
#include "s3pipe/metrics.hpp"

#include <optional>
#include <thread>

namespace s3pipe {

namespace {

// Keeps the in-flight gauge balanced on every exit path of upload()
class InFlightGuard {
public:
    explicit InFlightGuard(MetricsExporter* metrics) : metrics_(metrics) {
        if (metrics_) metrics_->parts_in_flight().Increment();
    }
    ~InFlightGuard() {
        if (metrics_) metrics_->parts_in_flight().Decrement();
    }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    MetricsExporter* metrics_;
};

void release(std::vector<uint8_t>& bytes) {
    std::vector<uint8_t>().swap(bytes);
}

}  // namespace

const char* part_state_name(PartState state) {
    switch (state) {
        case PartState::Pending:   return "Pending";
        case PartState::Uploading: return "Uploading";
        case PartState::Verifying: return "Verifying";
        case PartState::Verified:  return "Verified";
        case PartState::Retrying:  return "Retrying";
        case PartState::Failed:    return "Failed";
    }
    return "Unknown";
}

std::string format_part_size(uint64_t bytes) {
    if (bytes > 1024) {
        return std::to_string(bytes / 1024) + " KiB";
    }
    return std::to_string(bytes) + " B";
}

PartUploader::PartUploader(ObjectStore& store,
                           SessionHandle session,
                           RetryPolicy policy,
                           const CancellationToken* cancel,
                           MetricsExporter* metrics)
    : store_(store)
    , session_(std::move(session))
    , policy_(policy)
    , cancel_(cancel)
    , metrics_(metrics) {
    if (policy_.max_attempts < 1) policy_.max_attempts = 1;
}

void PartUploader::transition(Part& part, PartState state) const {
    part.state = state;
    log_debug("part %d -> %s (attempt %d)", part.number, part_state_name(state), part.attempts);
    if (observer_) observer_(part);
}

bool PartUploader::wait_before_retry() const {
    if (wait_) return wait_(policy_.interval);
    if (cancel_) return cancel_->wait_for(policy_.interval);
    std::this_thread::sleep_for(policy_.interval);
    return true;
}

PartOutcome PartUploader::upload(int part_number, std::vector<uint8_t> bytes) const {
    InFlightGuard in_flight(metrics_);

    PartOutcome outcome;
    Part& part = outcome.part;
    part.number = part_number;
    part.size = bytes.size();
    part.digest = md5(bytes);

    const std::string expected = to_hex(part.digest);
    const std::string content_md5 = to_base64(part.digest);

    auto fail = [&](UploadError error) {
        release(bytes);
        transition(part, PartState::Failed);
        if (metrics_) metrics_->parts_failed().Increment();
        outcome.error = std::move(error);
        return outcome;
    };

    auto cancelled = [&] {
        UploadError error = UploadError::make(ErrorKind::Cancelled,
            "upload cancelled before part " + std::to_string(part_number) + " was verified");
        error.part_number = part_number;
        error.attempts = part.attempts;
        error.expected = expected;
        return fail(std::move(error));
    };

    while (true) {
        if (cancel_ && cancel_->cancelled()) {
            return cancelled();
        }

        ++part.attempts;
        transition(part, PartState::Uploading);
        if (metrics_) metrics_->part_attempts().Increment();

        StoreResult result;
        {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->part_upload_duration());
            result = store_.upload_part(session_, part_number, bytes, content_md5);
        }

        UploadError last;
        last.part_number = part_number;
        last.attempts = part.attempts;
        last.expected = expected;

        if (result.success) {
            transition(part, PartState::Verifying);
            std::string observed = normalize_etag(result.value);
            if (observed == expected) {
                part.etag = observed;
                release(bytes);
                transition(part, PartState::Verified);
                if (metrics_) {
                    metrics_->parts_verified().Increment();
                    metrics_->upload_bytes_total().Increment(static_cast<double>(part.size));
                }
                log_info("Upload part %10d - %s - %s - Try %d",
                         part_number, format_part_size(part.size).c_str(),
                         expected.c_str(), part.attempts);
                return outcome;
            }
            log_info("ETag of part %d mismatches MD5...", part_number);
            last.kind = ErrorKind::PartIntegrityMismatch;
            last.observed = observed;
            last.message = "returned ETag does not match the local MD5";
            if (metrics_) metrics_->retries_mismatch().Increment();
        } else {
            last.kind = ErrorKind::PartUploadError;
            last.message = result.error_message;
            if (metrics_) metrics_->retries_transport().Increment();
        }

        if (part.attempts >= policy_.max_attempts) {
            UploadError error = last;
            error.kind = ErrorKind::RetryExhausted;
            error.message = std::string("last error ") + error_kind_name(last.kind) +
                ": " + last.message;
            log_error("%s", error.describe().c_str());
            return fail(std::move(error));
        }

        transition(part, PartState::Retrying);
        auto secs = std::chrono::duration<double>(policy_.interval).count();
        log_info("Error uploading part %d. Trying again in %g seconds...", part_number, secs);
        log_debug("%s", last.describe().c_str());

        if (!wait_before_retry()) {
            return cancelled();
        }
    }
}

} // namespace s3pipe
