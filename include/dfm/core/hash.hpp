#pragma once

#include "dfm/core/error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

// Forward declaration keeps <openssl/evp.h> out of public headers
struct evp_md_ctx_st;

namespace dfm::hash {

/// 128-bit window fingerprint (MD5 over raw bytes, used only for equality)
using ChunkDigest = std::array<std::uint8_t, 16>;

struct ChunkDigestHash {
    std::size_t operator()(const ChunkDigest& digest) const noexcept {
        std::size_t value = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < digest.size(); ++i) {
            value = (value << 8) | digest[i];
        }
        return value;
    }
};

ChunkDigest digest_window(const std::uint8_t* data, std::size_t size);

std::string to_hex(const std::uint8_t* data, std::size_t size);

inline std::string to_hex(const ChunkDigest& digest) {
    return to_hex(digest.data(), digest.size());
}

/**
 * @brief Incremental SHA-256 over the EVP interface
 *
 * Used for the whole-file checksum recorded in every TransferOutcome.
 */
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    void update(const std::uint8_t* data, std::size_t size);

    /// Finalizes the digest; the hasher cannot be updated afterwards
    std::string hex_digest();

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
    bool finalized_ = false;
};

dfm::Result<std::string, SyncError> sha256_file(const std::filesystem::path& path);

} // namespace dfm::hash
