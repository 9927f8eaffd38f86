#include "dfm/core/hash.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <stdexcept>
#include <vector>

namespace dfm::hash {

ChunkDigest digest_window(const std::uint8_t* data, std::size_t size) {
    ChunkDigest digest{};
    unsigned int length = 0;
    if (EVP_Digest(data, size, digest.data(), &length, EVP_md5(), nullptr) != 1 ||
        length != digest.size()) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }
    return digest;
}

std::string to_hex(const std::uint8_t* data, std::size_t size) {
    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        result += hex[(data[i] >> 4) & 0xF];
        result += hex[data[i] & 0xF];
    }
    return result;
}

void Sha256Hasher::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::update(const std::uint8_t* data, std::size_t size) {
    if (finalized_) {
        throw std::logic_error("Sha256Hasher updated after finalization");
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Sha256Hasher::hex_digest() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finalized_ = true;
    return to_hex(digest, length);
}

dfm::Result<std::string, SyncError> sha256_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail<std::string>(ErrorKind::LocalIo, "Failed to open file for checksum: " + path.string());
    }

    Sha256Hasher hasher;
    std::vector<char> buffer(64 * 1024);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        hasher.update(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                      static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return Fail<std::string>(ErrorKind::LocalIo, "Read error while hashing: " + path.string());
    }
    return dfm::Ok(hasher.hex_digest());
}

} // namespace dfm::hash
