#pragma once

#include "s3pipe/digest.hpp"
#include "s3pipe/storage/object_store.hpp"

#include <string>
#include <vector>

namespace s3pipe {

class MetricsExporter;

enum class IntegrityStatus {
    Verified,
    IntegrityMismatch,
};

struct IntegrityReport {
    IntegrityStatus status = IntegrityStatus::IntegrityMismatch;
    std::string expected;     // Local composite digest
    std::string observed;     // Digest reported by the store (normalized)
    std::string message;      // Lookup failure, if any
    bool object_found = true; // False when the store could not report a digest

    bool verified() const { return status == IntegrityStatus::Verified; }
};

/// Reconciles the local composite digest of all parts with the digest the
/// store reports for the finalized object. Read-only; safe to repeat.
class IntegrityVerifier {
public:
    explicit IntegrityVerifier(const ObjectStore& store, MetricsExporter* metrics = nullptr)
        : store_(store), metrics_(metrics) {}

    /// hex(MD5(d1 || ... || dN)) + "-N"
    static std::string expected_digest(const std::vector<ContentDigest>& part_digests) {
        return composite_digest(part_digests);
    }

    IntegrityReport verify(const std::string& bucket, const std::string& key,
                           const std::vector<ContentDigest>& part_digests) const;

private:
    const ObjectStore& store_;
    MetricsExporter* metrics_;
};

} // namespace s3pipe
