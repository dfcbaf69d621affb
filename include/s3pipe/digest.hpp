#pragma once

#include "s3pipe/core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

// Forward declaration
struct evp_md_ctx_st;

namespace s3pipe {

/// Binary MD5 of a byte range.
using ContentDigest = std::array<uint8_t, constants::DIGEST_SIZE>;

/// One-shot MD5 over a byte range.
ContentDigest md5(std::span<const uint8_t> data);

/// Lowercase hex encoding ("d41d8cd98f00b204e9800998ecf8427e").
std::string to_hex(const ContentDigest& digest);

/// Base64 encoding, the form S3 expects in the Content-MD5 header.
std::string to_base64(const ContentDigest& digest);

/// S3-style multipart ETag: hex(MD5(d1 || d2 || ... || dN)) + "-N".
/// Order-sensitive; the digests must be in ascending part-number order.
std::string composite_digest(const std::vector<ContentDigest>& part_digests);

/// Strip surrounding quotes and whitespace from an ETag and lowercase it,
/// so it can be compared with to_hex()/composite_digest() output.
std::string normalize_etag(const std::string& etag);

/// Incremental MD5 for data seen in pieces (the whole input stream).
class Md5Hasher {
public:
    Md5Hasher();
    ~Md5Hasher();

    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;

    void update(std::span<const uint8_t> data);

    /// Digest of everything fed so far. Does not reset the hasher.
    ContentDigest digest() const;

private:
    evp_md_ctx_st* ctx_ = nullptr;
};

} // namespace s3pipe
