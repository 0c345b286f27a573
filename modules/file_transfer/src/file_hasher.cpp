#include "file_hasher.h"
#include "transfer_errors.h"
#include "logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>
#include <vector>

namespace {
void ensure_sodium() {
    static const int rc = sodium_init();
    if (rc < 0) {
        nativeLog("Libsodium initialization failed!");
        throw std::runtime_error("Libsodium init failed");
    }
}

std::string to_hex(const unsigned char* digest, size_t len) {
    std::string hex(len * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), digest, len);
    hex.resize(len * 2);
    return hex;
}
} // namespace

FileHasher::FileHasher() {
    ensure_sodium();
    crypto_hash_sha256_init(&m_state);
}

void FileHasher::update(const void* data, size_t len) {
    if (m_finished) {
        throw std::logic_error("FileHasher::update after finish");
    }
    crypto_hash_sha256_update(&m_state, static_cast<const unsigned char*>(data), len);
}

std::string FileHasher::finish() {
    if (m_finished) {
        throw std::logic_error("FileHasher::finish called twice");
    }
    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256_final(&m_state, digest);
    m_finished = true;
    return to_hex(digest, sizeof(digest));
}

std::string FileHasher::hash_bytes(const void* data, size_t len) {
    FileHasher hasher;
    hasher.update(data, len);
    return hasher.finish();
}

std::string FileHasher::hash_file(const std::string& path,
                                  size_t chunk_size,
                                  const std::atomic<bool>* cancel) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw TransferIoError("open " + path + ": " + strerror(errno));
    }
    posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);

    FileHasher hasher;
    std::vector<unsigned char> buf(chunk_size > 0 ? chunk_size : 64 * 1024);
    for (;;) {
        if (cancel && cancel->load()) {
            ::close(fd);
            throw TransferCancelled("hashing cancelled");
        }
        ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            throw TransferIoError("read " + path + ": " + strerror(err));
        }
        if (n == 0) break;
        hasher.update(buf.data(), static_cast<size_t>(n));
    }
    ::close(fd);
    return hasher.finish();
}
