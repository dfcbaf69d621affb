#include "s3pipe/chunk_source.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

namespace s3pipe {

ChunkSource::ChunkSource(int fd, size_t chunk_size, bool owns_fd)
    : fd_(fd), chunk_size_(chunk_size), owns_fd_(owns_fd) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
}

ChunkSource::~ChunkSource() {
    if (owns_fd_ && fd_ >= 0) {
        close(fd_);
    }
}

std::unique_ptr<ChunkSource> ChunkSource::open_file(const std::filesystem::path& path,
                                                    size_t chunk_size,
                                                    std::string& error) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        error = "cannot open " + path.string() + ": " + std::strerror(errno);
        return nullptr;
    }
    return std::make_unique<ChunkSource>(fd, chunk_size, true);
}

std::optional<Chunk> ChunkSource::next() {
    if (eof_ || error_) {
        return std::nullopt;
    }

    Chunk chunk;
    chunk.data.resize(chunk_size_);
    size_t filled = 0;

    // Pipes deliver short reads; keep reading until the chunk is full or EOF
    while (filled < chunk_size_) {
        ssize_t n = ::read(fd_, chunk.data.data() + filled, chunk_size_ - filled);
        if (n < 0) {
            if (errno == EINTR) continue;
            UploadError err = UploadError::make(ErrorKind::ReadError,
                std::string("read failed after ") + std::to_string(bytes_read_ + filled) +
                " bytes: " + std::strerror(errno));
            err.part_number = chunks_read_ + 1;
            error_ = std::move(err);
            return std::nullopt;
        }
        if (n == 0) {
            eof_ = true;
            break;
        }
        filled += static_cast<size_t>(n);
    }

    // A stream ending exactly on a chunk boundary has no trailing empty chunk,
    // except for a stream with no bytes at all.
    if (filled == 0 && chunks_read_ > 0) {
        return std::nullopt;
    }

    chunk.data.resize(filled);
    stream_md5_.update(chunk.data);
    bytes_read_ += filled;
    ++chunks_read_;
    return chunk;
}

} // namespace s3pipe
