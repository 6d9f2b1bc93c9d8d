#include "svgdump/SVGDocument.h"
#include "svgdump/Exceptions.h"
#include "svgdump/Inflate.h"
#include "svgdump/Log.h"
#include <cstring>

namespace svgdump {

bool looksLikeGzip(const utils::ByteSpan& data) {
    return data.size >= sizeof(kGzipMagic) &&
           memcmp(data.data, kGzipMagic, sizeof(kGzipMagic)) == 0;
}

bool isValidUtf8(const uint8_t* data, size_t size, size_t* errorOffset) {
    size_t pos = 0;
    while (pos < size) {
        uint8_t lead = data[pos];

        // ASCII - самый частый случай
        if (lead < 0x80) {
            ++pos;
            continue;
        }

        size_t length;
        uint32_t codePoint;
        uint32_t minCodePoint;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            codePoint = lead & 0x1F;
            minCodePoint = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            codePoint = lead & 0x0F;
            minCodePoint = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            codePoint = lead & 0x07;
            minCodePoint = 0x10000;
        } else {
            if (errorOffset) *errorOffset = pos;
            return false;
        }

        if (size - pos < length) {
            if (errorOffset) *errorOffset = pos;
            return false;
        }

        for (size_t i = 1; i < length; ++i) {
            uint8_t trail = data[pos + i];
            if ((trail & 0xC0) != 0x80) {
                if (errorOffset) *errorOffset = pos;
                return false;
            }
            codePoint = (codePoint << 6) | (trail & 0x3F);
        }

        if (codePoint < minCodePoint || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            if (errorOffset) *errorOffset = pos;
            return false;
        }

        pos += length;
    }
    return true;
}

std::vector<uint8_t> gunzip(const utils::ByteSpan& data) {
    // Размер входа - только начальная ёмкость, распакованный текст обычно больше
    return utils::inflateBytes(data, utils::InflateWrapper::GZIP, data.size);
}

std::string expandDocument(const utils::ByteSpan& data) {
    std::vector<uint8_t> document;
    if (looksLikeGzip(data)) {
        document = gunzip(data);
        log() << "Document: gzip " << data.size << " -> " << document.size() << " bytes" << std::endl;
    } else {
        document.assign(data.data, data.data + data.size);
        log() << "Document: " << data.size << " bytes" << std::endl;
    }

    size_t errorOffset = 0;
    if (!isValidUtf8(document.data(), document.size(), &errorOffset)) {
        throw EncodingException("invalid byte sequence at offset " + std::to_string(errorOffset));
    }

    return std::string(document.begin(), document.end());
}

} // namespace svgdump
