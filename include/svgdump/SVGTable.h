#pragma once

#include <cstdint>
#include <vector>
#include <string>

#include "svgdump/TTFUtils.h"

namespace svgdump {

constexpr char kSVGTableTag[] = "SVG ";

/**
 * Запись SVG Document Index: закрытый диапазон глифов и документ.
 * Документ хранится как смещение и длина от начала таблицы SVG,
 * байты получаются через SvgTable::documentData().
 */
struct DocumentRecord {
    uint16_t startGlyphID = 0;
    uint16_t endGlyphID = 0;
    uint32_t documentOffset = 0;
    uint32_t documentLength = 0;

    bool covers(uint16_t glyphID) const {
        return glyphID >= startGlyphID && glyphID <= endGlyphID;
    }
};

/**
 * Разобранная таблица 'SVG '. Заголовок проверяется в конструкторе,
 * записи читаются лениво и в порядке хранения, без сортировки по глифам.
 * Таблица не владеет байтами.
 */
class SvgTable {
public:
    static constexpr size_t kHeaderSize = 10;
    static constexpr size_t kRecordSize = 12;

    explicit SvgTable(const utils::ByteSpan& tableData);

    uint16_t getVersion() const { return version; }
    uint32_t getDocumentListOffset() const { return documentListOffset; }

    size_t numRecords() const { return numEntries; }

    /**
     * Запись с номером index. Диапазон документа проверяется здесь:
     * выход за пределы таблицы -> TableParseException.
     */
    DocumentRecord getRecord(size_t index) const;

    std::vector<DocumentRecord> records() const;

    utils::ByteSpan documentData(const DocumentRecord& record) const;

private:
    utils::ByteSpan data;
    uint16_t version;
    uint32_t documentListOffset;
    uint16_t numEntries;
};

} // namespace svgdump
