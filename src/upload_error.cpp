#include "s3pipe/upload_error.hpp"

#include <sstream>

namespace s3pipe {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigError: return "ConfigError";
        case ErrorKind::InputError: return "InputError";
        case ErrorKind::CredentialsError: return "CredentialsError";
        case ErrorKind::BucketUnavailable: return "BucketUnavailable";
        case ErrorKind::ObjectExists: return "ObjectExists";
        case ErrorKind::ReadError: return "ReadError";
        case ErrorKind::PartUploadError: return "PartUploadError";
        case ErrorKind::PartIntegrityMismatch: return "PartIntegrityMismatch";
        case ErrorKind::RetryExhausted: return "RetryExhaustedError";
        case ErrorKind::SessionStartError: return "SessionStartError";
        case ErrorKind::SessionCompleteError: return "SessionCompleteError";
        case ErrorKind::ObjectIntegrityMismatch: return "ObjectIntegrityMismatch";
        case ErrorKind::ObjectNotCreated: return "ObjectNotCreated";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string UploadError::describe() const {
    std::ostringstream oss;
    oss << error_kind_name(kind);
    if (part_number > 0) oss << " (part " << part_number << ")";
    if (!message.empty()) oss << ": " << message;
    if (attempts > 0) oss << " after " << attempts << " attempt" << (attempts == 1 ? "" : "s");
    if (!expected.empty() || !observed.empty()) {
        oss << " [expected " << (expected.empty() ? "-" : expected)
            << ", observed " << (observed.empty() ? "-" : observed) << "]";
    }
    return oss.str();
}

int exit_code_for(const UploadError& error) {
    switch (error.kind) {
        case ErrorKind::ConfigError:
        case ErrorKind::InputError:
        case ErrorKind::ReadError:
        case ErrorKind::ObjectIntegrityMismatch:
            return 1;
        case ErrorKind::CredentialsError:
            return 2;
        case ErrorKind::BucketUnavailable:
            return 5;
        case ErrorKind::ObjectExists:
            return 6;
        case ErrorKind::SessionStartError:
            return 7;
        case ErrorKind::PartUploadError:
        case ErrorKind::PartIntegrityMismatch:
        case ErrorKind::RetryExhausted:
        case ErrorKind::SessionCompleteError:
        case ErrorKind::ObjectNotCreated:
        case ErrorKind::Cancelled:
            return 8;
    }
    return 1;
}

} // namespace s3pipe
