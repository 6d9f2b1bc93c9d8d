#include "svgdump/Inflate.h"
#include "svgdump/Exceptions.h"
#include <zlib.h>
#include <limits>
#include <string>

namespace svgdump {
namespace utils {

namespace {
constexpr size_t kChunkSize = 16384;
}

std::vector<uint8_t> inflateBytes(const ByteSpan& input, InflateWrapper wrapper, size_t sizeHint) {
    if (input.size > std::numeric_limits<uInt>::max()) {
        throw DecompressException("input too large");
    }

    z_stream stream = {};
    // 16 + MAX_WBITS: zlib ожидает заголовок и трейлер gzip и проверяет CRC
    int windowBits = wrapper == InflateWrapper::GZIP ? 16 + MAX_WBITS : MAX_WBITS;
    if (inflateInit2(&stream, windowBits) != Z_OK) {
        throw DecompressException("cannot initialise zlib stream");
    }

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data));
    stream.avail_in = static_cast<uInt>(input.size);

    std::vector<uint8_t> output;
    output.reserve(sizeHint);
    uint8_t chunk[kChunkSize];

    for (;;) {
        stream.next_out = chunk;
        stream.avail_out = static_cast<uInt>(kChunkSize);

        int ret = inflate(&stream, Z_NO_FLUSH);
        output.insert(output.end(), chunk, chunk + (kChunkSize - stream.avail_out));

        if (ret == Z_STREAM_END) {
            break;
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            std::string reason = stream.msg ? stream.msg : "corrupt deflate data";
            if (ret == Z_NEED_DICT) reason = "preset dictionary required";
            inflateEnd(&stream);
            throw DecompressException(reason);
        }
        // Вход закончился раньше конца потока
        if (stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            throw DecompressException("unexpected end of compressed stream");
        }
    }

    inflateEnd(&stream);
    return output;
}

} // namespace utils
} // namespace svgdump
