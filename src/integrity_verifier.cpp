#include "s3pipe/integrity_verifier.hpp"
#include "s3pipe/log.hpp"
#include "s3pipe/metrics.hpp"

namespace s3pipe {

IntegrityReport IntegrityVerifier::verify(const std::string& bucket, const std::string& key,
                                          const std::vector<ContentDigest>& part_digests) const {
    IntegrityReport report;
    report.expected = expected_digest(part_digests);

    auto result = store_.get_object_digest(bucket, key);
    if (!result.success) {
        report.status = IntegrityStatus::IntegrityMismatch;
        report.object_found = false;
        report.message = "object digest unavailable: " + result.error_message;
    } else {
        report.observed = normalize_etag(result.value);
        report.status = report.observed == report.expected
            ? IntegrityStatus::Verified
            : IntegrityStatus::IntegrityMismatch;
    }

    log_debug("Local  etag: %s", report.expected.c_str());
    log_debug("Remote etag: %s", report.observed.empty() ? "-" : report.observed.c_str());

    if (metrics_) {
        if (report.verified()) {
            metrics_->verifications_verified().Increment();
        } else {
            metrics_->verifications_mismatch().Increment();
        }
    }
    return report;
}

} // namespace s3pipe
