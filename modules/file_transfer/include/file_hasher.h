#ifndef FILE_HASHER_H
#define FILE_HASHER_H

#include <sodium.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

// Streaming SHA-256 over libsodium. Digests are lowercase hex.
class FileHasher {
public:
    FileHasher();

    void update(const void* data, size_t len);
    std::string finish();

    static std::string hash_bytes(const void* data, size_t len);

    // Reads the file in chunk_size pieces. Throws TransferIoError on read
    // failure and TransferCancelled when *cancel becomes true.
    static std::string hash_file(const std::string& path,
                                 size_t chunk_size,
                                 const std::atomic<bool>* cancel = nullptr);

private:
    crypto_hash_sha256_state m_state;
    bool m_finished = false;
};

#endif // FILE_HASHER_H
