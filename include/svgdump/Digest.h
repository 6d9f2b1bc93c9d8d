#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "svgdump/TTFUtils.h"

struct evp_md_ctx_st;

namespace svgdump {
namespace utils {

/**
 * SHA-256 на OpenSSL EVP. finalizeReset() возвращает дайджест
 * и сразу готовит контекст к следующему сообщению.
 */
class Sha256 {
public:
    static constexpr size_t kDigestLength = 32;

    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const uint8_t* data, size_t size);
    void update(const ByteSpan& data) { update(data.data, data.size); }
    std::vector<uint8_t> finalizeReset();

private:
    evp_md_ctx_st* ctx;

    void reset();
};

std::string toHexLower(const unsigned char* bytes, size_t size);
std::string toHexLower(const std::vector<uint8_t>& bytes);

std::string sha256Hex(const ByteSpan& data);

}
}
