#pragma once
#include <vector>
#include <cstdint>

#include "svgdump/TTFUtils.h"

namespace svgdump {
namespace utils {

enum class InflateWrapper {
    ZLIB,  // RFC 1950, таблицы WOFF
    GZIP   // RFC 1952, документы SVG
};

/**
 * Распаковка всего потока через zlib. sizeHint - начальная ёмкость
 * буфера, результат может быть больше. Обрезанный или повреждённый
 * поток -> DecompressException. Данные после конца потока игнорируются.
 */
std::vector<uint8_t> inflateBytes(const ByteSpan& input, InflateWrapper wrapper, size_t sizeHint);

}
}
