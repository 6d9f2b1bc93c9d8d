#include "svgdump/Digest.h"
#include <openssl/evp.h>
#include <stdexcept>

namespace svgdump {
namespace utils {

Sha256::Sha256() : ctx(EVP_MD_CTX_new()) {
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    try {
        reset();
    } catch (const std::runtime_error&) {
        EVP_MD_CTX_free(ctx);
        throw;
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx);
}

void Sha256::reset() {
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

void Sha256::update(const uint8_t* data, size_t size) {
    if (size == 0) return;
    if (EVP_DigestUpdate(ctx, data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::vector<uint8_t> Sha256::finalizeReset() {
    std::vector<uint8_t> digest(kDigestLength, 0);
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1 || length != kDigestLength) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    reset();
    return digest;
}

std::string toHexLower(const unsigned char* bytes, size_t size) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(size * 2);
    for (size_t i = 0; i < size; ++i) {
        unsigned char value = bytes[i];
        out[i * 2] = kHex[(value >> 4) & 0x0F];
        out[i * 2 + 1] = kHex[value & 0x0F];
    }
    return out;
}

std::string toHexLower(const std::vector<uint8_t>& bytes) {
    return toHexLower(bytes.data(), bytes.size());
}

std::string sha256Hex(const ByteSpan& data) {
    Sha256 hasher;
    hasher.update(data);
    return toHexLower(hasher.finalizeReset());
}

} // namespace utils
} // namespace svgdump
