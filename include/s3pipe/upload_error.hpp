#pragma once

#include <string>
#include <utility>

namespace s3pipe {

/// Failure kinds of an upload. PartUploadError and PartIntegrityMismatch are
/// transient and stay inside the part retry loop; every other kind is fatal.
enum class ErrorKind {
    ConfigError,
    InputError,
    CredentialsError,
    BucketUnavailable,
    ObjectExists,
    ReadError,
    PartUploadError,
    PartIntegrityMismatch,
    RetryExhausted,
    SessionStartError,
    SessionCompleteError,
    ObjectIntegrityMismatch,
    ObjectNotCreated,
    Cancelled,
};

const char* error_kind_name(ErrorKind kind);

struct UploadError {
    ErrorKind kind = ErrorKind::ConfigError;
    int part_number = 0;      // 0 when not tied to a part
    int attempts = 0;
    std::string expected;     // Local digest / ETag
    std::string observed;     // Storage-reported digest / ETag
    std::string message;

    bool retryable() const {
        return kind == ErrorKind::PartUploadError ||
               kind == ErrorKind::PartIntegrityMismatch;
    }

    /// One-line operator-facing description with all diagnostic context.
    std::string describe() const;

    static UploadError make(ErrorKind kind, std::string message) {
        UploadError e;
        e.kind = kind;
        e.message = std::move(message);
        return e;
    }
};

/// Process exit status for a fatal error.
int exit_code_for(const UploadError& error);

} // namespace s3pipe
