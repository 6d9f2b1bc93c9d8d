#include "svgdump/TTFUtils.h"
#include <algorithm>

namespace svgdump {
namespace utils {

std::vector<TableRecord> parseTTFTables(const ByteSpan& fontData, size_t directoryOffset) {
    std::vector<TableRecord> tables;

    TTFReader reader(fontData);
    reader.seek(directoryOffset);

    if (reader.remaining() < kTTFHeaderSize) {
        throw std::out_of_range("Font data too small for TTF header");
    }

    TTFHeader header;
    header.sfntVersion = reader.readUInt32();
    header.numTables = reader.readUInt16();
    header.searchRange = reader.readUInt16();
    header.entrySelector = reader.readUInt16();
    header.rangeShift = reader.readUInt16();

    if (reader.remaining() < static_cast<size_t>(header.numTables) * kTableRecordSize) {
        throw std::out_of_range("Font data too small for table records");
    }

    tables.reserve(header.numTables);
    for (uint16_t i = 0; i < header.numTables; ++i) {
        TableRecord record;
        std::string tag = reader.readTag();
        memcpy(record.tag, tag.data(), 4);
        record.checksum = reader.readUInt32();
        record.offset = reader.readUInt32();
        record.length = reader.readUInt32();
        tables.push_back(record);
    }

    return tables;
}

bool hasTable(const std::vector<TableRecord>& tables, const std::string& tableTag) {
    return findTable(tables, tableTag) != nullptr;
}

const TableRecord* findTable(const std::vector<TableRecord>& tables, const std::string& tableTag) {
    if (tableTag.size() != 4) return nullptr;
    for (const auto& table : tables) {
        if (memcmp(table.tag, tableTag.c_str(), 4) == 0) {
            return &table;
        }
    }
    return nullptr;
}

} // namespace utils
} // namespace svgdump
