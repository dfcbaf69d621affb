#include "s3pipe/digest.hpp"
#include "s3pipe/net/http.hpp"

#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace s3pipe {

ContentDigest md5(std::span<const uint8_t> data) {
    ContentDigest out{};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_md5(), nullptr) != 1 ||
        len != out.size()) {
        throw std::runtime_error("EVP_Digest(MD5) failed");
    }
    return out;
}

std::string to_hex(const ContentDigest& digest) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : digest) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::string to_base64(const ContentDigest& digest) {
    return net::base64_encode(digest.data(), digest.size());
}

std::string composite_digest(const std::vector<ContentDigest>& part_digests) {
    std::vector<uint8_t> concatenated;
    concatenated.reserve(part_digests.size() * constants::DIGEST_SIZE);
    for (const auto& d : part_digests) {
        concatenated.insert(concatenated.end(), d.begin(), d.end());
    }
    return to_hex(md5(concatenated)) + "-" + std::to_string(part_digests.size());
}

std::string normalize_etag(const std::string& etag) {
    size_t start = etag.find_first_not_of(" \t\"");
    if (start == std::string::npos) return "";
    size_t end = etag.find_last_not_of(" \t\"");

    std::string result = etag.substr(start, end - start + 1);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

// --- Md5Hasher ---

Md5Hasher::Md5Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("failed to initialize MD5 context");
    }
}

Md5Hasher::~Md5Hasher() {
    EVP_MD_CTX_free(ctx_);
}

void Md5Hasher::update(std::span<const uint8_t> data) {
    if (data.empty()) return;
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate(MD5) failed");
    }
}

ContentDigest Md5Hasher::digest() const {
    // Finalize a copy so the running context stays usable
    EVP_MD_CTX* copy = EVP_MD_CTX_new();
    if (!copy || EVP_MD_CTX_copy_ex(copy, ctx_) != 1) {
        EVP_MD_CTX_free(copy);
        throw std::runtime_error("failed to copy MD5 context");
    }
    ContentDigest out{};
    unsigned int len = 0;
    int rc = EVP_DigestFinal_ex(copy, out.data(), &len);
    EVP_MD_CTX_free(copy);
    if (rc != 1 || len != out.size()) {
        throw std::runtime_error("EVP_DigestFinal_ex(MD5) failed");
    }
    return out;
}

} // namespace s3pipe
