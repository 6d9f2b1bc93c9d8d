#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

#include "svgdump/Exceptions.h"
#include "svgdump/TTFUtils.h"

namespace svgdump {

enum class ContainerFormat {
    UNKNOWN,
    OPENTYPE,             // TrueType / OpenType (sfnt)
    TRUETYPE_COLLECTION,  // ttcf
    WOFF                  // WOFF 1.0
};

std::string formatName(ContainerFormat format);

/**
 * Доступ к таблицам одного начертания по тегу.
 * Возвращаемые срезы живут не дольше самого провайдера
 * и буфера файла, из которого он открыт.
 */
class FontTableProvider {
public:
    virtual ~FontTableProvider() = default;

    virtual ContainerFormat getFormat() const = 0;
    virtual bool hasTable(const std::string& tag) const = 0;

    // Точные границы таблицы из каталога; нет таблицы -> ContainerParseException
    virtual utils::ByteSpan readTableData(const std::string& tag) = 0;
};

class ContainerHandler {
public:
    virtual ~ContainerHandler() = default;
    virtual bool canHandle(const utils::ByteSpan& fontData) const = 0;
    virtual std::unique_ptr<FontTableProvider> open(const utils::ByteSpan& fontData,
                                                    uint32_t faceIndex) const = 0;
    virtual ContainerFormat getFormat() const = 0;
};

} // namespace svgdump
