#include "s3pipe/stream_uploader.hpp"
#include "s3pipe/core/constants.hpp"
#include "s3pipe/log.hpp"
#include "s3pipe/upload_session.hpp"

#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <vector>

namespace s3pipe {

StreamUploader::StreamUploader(ObjectStore& store, UploaderOptions options,
                               MetricsExporter* metrics)
    : store_(store)
    , options_(std::move(options))
    , metrics_(metrics) {
    if (options_.workers < 1) options_.workers = 1;
}

std::optional<UploadError> StreamUploader::preflight() const {
    if (!store_.bucket_exists(options_.bucket)) {
        return UploadError::make(ErrorKind::BucketUnavailable,
            "Bucket " + options_.bucket + " is not available.");
    }
    if (store_.object_exists(options_.bucket, options_.key)) {
        return UploadError::make(ErrorKind::ObjectExists,
            "Object " + options_.key + " exists in bucket " + options_.bucket);
    }
    return std::nullopt;
}

namespace {

// Releases one slot of the upload window when a worker finishes, however it finishes
class WindowSlot {
public:
    WindowSlot(std::mutex& mutex, std::condition_variable& cv, int& in_flight)
        : mutex_(mutex), cv_(cv), in_flight_(in_flight) {}

    ~WindowSlot() {
        {
            std::lock_guard lock(mutex_);
            --in_flight_;
        }
        cv_.notify_all();
    }

    WindowSlot(const WindowSlot&) = delete;
    WindowSlot& operator=(const WindowSlot&) = delete;

private:
    std::mutex& mutex_;
    std::condition_variable& cv_;
    int& in_flight_;
};

} // namespace

void StreamUploader::record_failure(UploadError error) {
    {
        std::lock_guard lock(error_mutex_);
        // First fatal error wins; cancellations are consequences, not causes
        if (!first_error_ ||
            (first_error_->kind == ErrorKind::Cancelled && error.kind != ErrorKind::Cancelled)) {
            first_error_ = std::move(error);
        }
    }
    cancel_.cancel();
}

std::optional<UploadError> StreamUploader::upload_parts(ChunkSource& source,
                                                        UploadSession& session,
                                                        const PartUploader& uploader) {
    auto handle_outcome = [this, &session](PartOutcome outcome) {
        if (!outcome.verified()) {
            record_failure(outcome.error.value_or(
                UploadError::make(ErrorKind::RetryExhausted, "part failed")));
            return;
        }
        if (!session.record_part(outcome.part)) {
            UploadError error = UploadError::make(ErrorKind::SessionCompleteError,
                "part could not be recorded in the session");
            error.part_number = outcome.part.number;
            record_failure(std::move(error));
        }
    };

    // Exceptions from hashing or the store stop the whole upload
    auto run_part = [this, &uploader, &handle_outcome](int part_number,
                                                      std::vector<uint8_t> data) {
        try {
            handle_outcome(uploader.upload(part_number, std::move(data)));
        } catch (const std::exception& e) {
            UploadError error = UploadError::make(ErrorKind::Cancelled,
                std::string("upload stopped by internal error: ") + e.what());
            error.part_number = part_number;
            record_failure(std::move(error));
        }
    };

    const bool concurrent = options_.workers > 1;

    std::mutex window_mutex;
    std::condition_variable window_cv;
    int in_flight = 0;
    std::vector<std::future<void>> workers;

    while (!cancel_.cancelled()) {
        if (concurrent) {
            std::unique_lock lock(window_mutex);
            window_cv.wait(lock, [&] {
                return in_flight < options_.workers || cancel_.cancelled();
            });
            if (cancel_.cancelled()) break;
        }

        auto chunk = source.next();
        if (!chunk) break;

        int part_number = session.next_part_number();
        if (part_number > constants::MAX_PART_COUNT) {
            UploadError error = UploadError::make(ErrorKind::InputError,
                "input needs more than " + std::to_string(constants::MAX_PART_COUNT) +
                " parts; use a larger chunk size");
            error.part_number = part_number;
            record_failure(std::move(error));
            break;
        }

        if (!concurrent) {
            run_part(part_number, std::move(chunk->data));
            continue;
        }

        {
            std::lock_guard lock(window_mutex);
            ++in_flight;
        }
        workers.push_back(std::async(std::launch::async,
            [&, part_number, data = std::move(chunk->data)]() mutable {
                WindowSlot slot(window_mutex, window_cv, in_flight);
                run_part(part_number, std::move(data));
            }));

        // Drop finished workers so the list tracks the window, not the stream
        std::erase_if(workers, [](std::future<void>& f) {
            if (f.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return false;
            f.get();
            return true;
        });
    }

    if (source.error()) {
        record_failure(*source.error());
    }

    // Join all outstanding parts before anything touches the session again
    for (auto& worker : workers) {
        worker.get();
    }

    std::lock_guard lock(error_mutex_);
    if (!first_error_ && cancel_.cancelled()) {
        first_error_ = UploadError::make(ErrorKind::Cancelled,
            "upload cancelled after " + std::to_string(source.chunks_read()) + " parts were read");
    }
    return first_error_;
}

UploadOutcome StreamUploader::run(ChunkSource& source) {
    UploadOutcome outcome;

    if (options_.preflight) {
        if (auto error = preflight()) {
            log_error("%s", error->message.c_str());
            outcome.error = std::move(error);
            return outcome;
        }
    }

    UploadSession session(store_, options_.bucket, options_.key, metrics_);
    if (auto error = session.start()) {
        log_error("%s", error->describe().c_str());
        outcome.error = std::move(error);
        return outcome;
    }

    PartUploader uploader(store_, session.handle(), options_.retry, &cancel_, metrics_);
    if (wait_) uploader.set_wait_function(wait_);

    std::optional<UploadError> upload_error;
    try {
        upload_error = upload_parts(source, session, uploader);
    } catch (const std::exception& e) {
        cancel_.cancel();
        upload_error = UploadError::make(ErrorKind::Cancelled,
            std::string("upload stopped by internal error: ") + e.what());
    }
    if (auto error = std::move(upload_error)) {
        log_error("%s", error->describe().c_str());
        session.abort();
        outcome.error = std::move(error);
        return outcome;
    }
    log_info("All data read, %zu parts verified", session.recorded_parts());

    const int part_count = source.chunks_read();
    if (auto error = session.complete(part_count)) {
        log_error("%s", error->describe().c_str());
        session.abort();
        outcome.error = std::move(error);
        return outcome;
    }

    IntegrityVerifier verifier(store_, metrics_);
    auto report = verifier.verify(options_.bucket, options_.key, session.part_digests());

    UploadResult result;
    result.key = options_.key;
    result.bucket = options_.bucket;
    result.total_bytes = source.bytes_read();
    result.part_count = part_count;
    result.composite_digest = report.expected;
    result.remote_digest = report.observed;
    result.stream_md5 = source.stream_md5_hex();
    result.status = report.status;
    outcome.result = result;

    if (!report.object_found) {
        UploadError error = UploadError::make(ErrorKind::ObjectNotCreated,
            "Object was not created (" + report.message + ")");
        error.expected = report.expected;
        log_error("%s", error.describe().c_str());
        outcome.error = std::move(error);
    } else if (!report.verified()) {
        UploadError error = UploadError::make(ErrorKind::ObjectIntegrityMismatch,
            report.message.empty() ? "Mismatching etags" : report.message);
        error.expected = report.expected;
        error.observed = report.observed;
        log_error("%s", error.describe().c_str());
        outcome.error = std::move(error);
    }
    return outcome;
}

} // namespace s3pipe
