#pragma once

#include "s3pipe/digest.hpp"
#include "s3pipe/upload_error.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace s3pipe {

/// One chunk of the input stream; becomes one multipart part.
struct Chunk {
    std::vector<uint8_t> data;
};

/// Splits a file descriptor into chunks of at most `chunk_size` bytes.
///
/// The sequence is lazy and non-restartable: bytes are read only when
/// next() is called and are never re-read. An empty stream yields exactly
/// one empty chunk. A read failure ends the sequence and leaves a
/// ReadError in error().
class ChunkSource {
public:
    /// @param fd        Descriptor to read from (not owned unless owns_fd).
    /// @param chunk_size Maximum chunk size in bytes, > 0.
    ChunkSource(int fd, size_t chunk_size, bool owns_fd = false);
    ~ChunkSource();

    ChunkSource(const ChunkSource&) = delete;
    ChunkSource& operator=(const ChunkSource&) = delete;

    /// Open a file for reading. Returns nullptr and sets `error` on failure.
    static std::unique_ptr<ChunkSource> open_file(const std::filesystem::path& path,
                                                  size_t chunk_size,
                                                  std::string& error);

    /// Next chunk, or nullopt at end of stream or after a read failure.
    std::optional<Chunk> next();

    /// Set once a read failed; the sequence is over.
    const std::optional<UploadError>& error() const { return error_; }

    size_t chunk_size() const { return chunk_size_; }
    uint64_t bytes_read() const { return bytes_read_; }
    int chunks_read() const { return chunks_read_; }

    /// MD5 over every byte read so far.
    std::string stream_md5_hex() const { return to_hex(stream_md5_.digest()); }

private:
    int fd_;
    size_t chunk_size_;
    bool owns_fd_;
    bool eof_ = false;
    uint64_t bytes_read_ = 0;
    int chunks_read_ = 0;
    Md5Hasher stream_md5_;
    std::optional<UploadError> error_;
};

} // namespace s3pipe
