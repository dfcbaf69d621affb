#include "s3pipe/storage/object_store.hpp"
#include "s3pipe/digest.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>

namespace s3pipe {

namespace fs = std::filesystem;

// ============================================================================
// LocalObjectStore - File system emulation of S3 multipart semantics
//
// Layout under the root:
//   <bucket>/<key>                                   assembled objects
//   <bucket>/.multipart/<upload_id>/<part>           staged part data
//   <bucket>/.multipart/<upload_id>/<part>.etag      staged part ETag
//   <bucket>/.etags/<key>                            object ETag sidecar
// ============================================================================

namespace {

constexpr const char* STAGING_DIR = ".multipart";
constexpr const char* ETAG_DIR = ".etags";

StoreResult fail(int status, std::string message) {
    StoreResult result;
    result.status_code = status;
    result.error_message = std::move(message);
    return result;
}

StoreResult succeed(std::string value) {
    StoreResult result;
    result.success = true;
    result.status_code = 200;
    result.value = std::move(value);
    return result;
}

bool write_file_atomic(const fs::path& path, const char* data, size_t size) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) return false;

    auto temp_path = path.string() + ".tmp." +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) return false;
        file.write(data, static_cast<std::streamsize>(size));
        if (!file) {
            file.close();
            fs::remove(temp_path, ec);
            return false;
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        return false;
    }
    return true;
}

bool write_text_atomic(const fs::path& path, const std::string& text) {
    return write_file_atomic(path, text.data(), text.size());
}

std::optional<std::string> read_text(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

// Keys must stay inside the bucket directory and out of the bookkeeping dirs
bool is_safe_key(const std::string& key) {
    if (key.empty() || key.front() == '/') return false;
    fs::path p(key);
    for (const auto& part : p) {
        if (part == ".." || part == ".") return false;
    }
    auto first = *p.begin();
    return first != STAGING_DIR && first != ETAG_DIR;
}

}  // namespace

class LocalObjectStore : public ObjectStore {
public:
    explicit LocalObjectStore(const fs::path& root)
        : root_(fs::absolute(root)) {
        fs::create_directories(root_);
    }

    std::string type_name() const override { return "local"; }

    bool bucket_exists(const std::string& bucket) const override {
        return !bucket.empty() && fs::is_directory(root_ / bucket);
    }

    bool object_exists(const std::string& bucket, const std::string& key) const override {
        return is_safe_key(key) && fs::is_regular_file(root_ / bucket / key);
    }

    StoreResult create_multipart_upload(const std::string& bucket,
                                        const std::string& key) override {
        if (!bucket_exists(bucket)) {
            return fail(404, "NoSuchBucket: " + bucket);
        }
        if (!is_safe_key(key)) {
            return fail(400, "InvalidArgument: bad object key: " + key);
        }

        std::string upload_id = generate_upload_id();
        std::error_code ec;
        fs::create_directories(upload_dir(bucket, upload_id), ec);
        if (ec) {
            return fail(500, "cannot create staging directory: " + ec.message());
        }
        return succeed(upload_id);
    }

    StoreResult upload_part(const SessionHandle& session,
                            int part_number,
                            std::span<const uint8_t> data,
                            const std::string& content_md5) override {
        auto dir = upload_dir(session.bucket, session.upload_id);
        if (!fs::is_directory(dir)) {
            return fail(404, "NoSuchUpload: " + session.upload_id);
        }
        if (part_number < 1 || part_number > constants::MAX_PART_COUNT) {
            return fail(400, "InvalidArgument: part number " + std::to_string(part_number));
        }

        auto digest = md5(data);
        if (!content_md5.empty() && content_md5 != to_base64(digest)) {
            return fail(400, "BadDigest: Content-MD5 does not match the received bytes");
        }

        auto part_path = dir / std::to_string(part_number);
        std::string etag = "\"" + to_hex(digest) + "\"";
        if (!write_file_atomic(part_path, reinterpret_cast<const char*>(data.data()), data.size()) ||
            !write_text_atomic(part_path.string() + ".etag", etag)) {
            return fail(500, "cannot stage part " + std::to_string(part_number));
        }
        return succeed(etag);
    }

    StoreResult complete_multipart_upload(const SessionHandle& session,
                                          const std::vector<CompletedPart>& parts) override {
        std::lock_guard lock(complete_mutex_);

        auto dir = upload_dir(session.bucket, session.upload_id);
        if (!fs::is_directory(dir)) {
            return fail(404, "NoSuchUpload: " + session.upload_id);
        }
        if (parts.empty()) {
            return fail(400, "MalformedXML: no parts");
        }

        // Validate the manifest against the staged parts before assembling
        int previous = 0;
        for (const auto& part : parts) {
            if (part.part_number <= previous) {
                return fail(400, "InvalidPartOrder");
            }
            previous = part.part_number;

            auto staged_etag = read_text(dir / (std::to_string(part.part_number) + ".etag"));
            if (!staged_etag) {
                return fail(400, "InvalidPart: part " + std::to_string(part.part_number) + " not found");
            }
            if (normalize_etag(*staged_etag) != normalize_etag(part.etag)) {
                return fail(400, "InvalidPart: ETag mismatch for part " +
                                 std::to_string(part.part_number));
            }
        }

        auto object_path = root_ / session.bucket / session.key;
        std::error_code ec;
        fs::create_directories(object_path.parent_path(), ec);
        auto temp_path = object_path.string() + ".tmp." + session.upload_id;

        std::vector<ContentDigest> digests;
        digests.reserve(parts.size());
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out) {
                return fail(500, "cannot create object file");
            }
            for (const auto& part : parts) {
                std::ifstream in(dir / std::to_string(part.part_number), std::ios::binary);
                std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                                          std::istreambuf_iterator<char>());
                if (in.bad()) {
                    out.close();
                    fs::remove(temp_path, ec);
                    return fail(500, "cannot read staged part " + std::to_string(part.part_number));
                }
                digests.push_back(md5(data));
                out.write(reinterpret_cast<const char*>(data.data()),
                          static_cast<std::streamsize>(data.size()));
            }
            if (!out) {
                out.close();
                fs::remove(temp_path, ec);
                return fail(500, "cannot write object file");
            }
        }

        fs::rename(temp_path, object_path, ec);
        if (ec) {
            fs::remove(temp_path, ec);
            return fail(500, "cannot publish object: " + ec.message());
        }

        std::string etag = "\"" + composite_digest(digests) + "\"";
        if (!write_text_atomic(etag_path(session.bucket, session.key), etag)) {
            return fail(500, "cannot record object ETag");
        }

        fs::remove_all(dir, ec);
        return succeed(etag);
    }

    StoreResult abort_multipart_upload(const SessionHandle& session) override {
        auto dir = upload_dir(session.bucket, session.upload_id);
        if (!fs::is_directory(dir)) {
            return fail(404, "NoSuchUpload: " + session.upload_id);
        }
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            return fail(500, "cannot remove staging directory: " + ec.message());
        }
        return succeed("");
    }

    StoreResult get_object_digest(const std::string& bucket,
                                  const std::string& key) const override {
        if (!object_exists(bucket, key)) {
            return fail(404, "NoSuchKey: " + key);
        }
        auto etag = read_text(etag_path(bucket, key));
        if (!etag) {
            return fail(500, "object has no recorded ETag: " + key);
        }
        return succeed(*etag);
    }

private:
    fs::path upload_dir(const std::string& bucket, const std::string& upload_id) const {
        return root_ / bucket / STAGING_DIR / upload_id;
    }

    fs::path etag_path(const std::string& bucket, const std::string& key) const {
        return root_ / bucket / ETAG_DIR / key;
    }

    std::string generate_upload_id() {
        static std::atomic<uint64_t> counter{0};
        std::random_device rd;
        std::ostringstream oss;
        oss << std::hex << std::setfill('0')
            << std::setw(8) << rd() << std::setw(8) << rd()
            << "-" << counter.fetch_add(1, std::memory_order_relaxed);
        return oss.str();
    }

    fs::path root_;
    std::mutex complete_mutex_;
};

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_local(const std::filesystem::path& root_path) {
    return std::make_unique<LocalObjectStore>(root_path);
}

} // namespace s3pipe
