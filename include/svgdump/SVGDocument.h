#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "svgdump/TTFUtils.h"

namespace svgdump {

// ID1, ID2 и CM=deflate из заголовка gzip
constexpr uint8_t kGzipMagic[3] = {0x1F, 0x8B, 0x08};

/**
 * Проверка только префикса, без разбора остального заголовка gzip.
 */
bool looksLikeGzip(const utils::ByteSpan& data);

/**
 * Строгая проверка UTF-8: без overlong-последовательностей, суррогатов
 * и кодов выше U+10FFFF. При ошибке в errorOffset пишется позиция
 * первого неверного байта.
 */
bool isValidUtf8(const uint8_t* data, size_t size, size_t* errorOffset = nullptr);

std::vector<uint8_t> gunzip(const utils::ByteSpan& data);

/**
 * Текст документа SVG: gzip распаковывается, результат проверяется
 * как UTF-8. Ошибки - DecompressException и EncodingException.
 */
std::string expandDocument(const utils::ByteSpan& data);

} // namespace svgdump
