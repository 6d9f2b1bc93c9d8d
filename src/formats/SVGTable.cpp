#include "svgdump/SVGTable.h"
#include "svgdump/Exceptions.h"
#include "svgdump/Log.h"
#include <string>

namespace svgdump {

SvgTable::SvgTable(const utils::ByteSpan& tableData)
    : data(tableData), version(0), documentListOffset(0), numEntries(0) {
    if (data.size < kHeaderSize) {
        throw TableParseException(kSVGTableTag, "header truncated, table is only " +
                                  std::to_string(data.size) + " bytes");
    }

    utils::TTFReader reader(data);
    version = reader.readUInt16();
    documentListOffset = reader.readUInt32();
    reader.skip(4);  // reserved

    if (version != 0) {
        throw TableParseException(kSVGTableTag, "unsupported version " + std::to_string(version));
    }

    // numEntries (uint16) должен поместиться после смещения
    if (static_cast<uint64_t>(documentListOffset) + 2 > data.size) {
        throw TableParseException(kSVGTableTag, "document list offset " +
                                  std::to_string(documentListOffset) +
                                  " is beyond the end of the table (" +
                                  std::to_string(data.size) + " bytes)");
    }

    reader.seek(documentListOffset);
    numEntries = reader.readUInt16();

    if (reader.remaining() / kRecordSize < numEntries) {
        throw TableParseException(kSVGTableTag, "document index declares " +
                                  std::to_string(numEntries) +
                                  " records but the record array is truncated");
    }

    log() << "SVG table: version " << version << ", document list at "
          << documentListOffset << ", " << numEntries << " records" << std::endl;
}

DocumentRecord SvgTable::getRecord(size_t index) const {
    if (index >= numEntries) {
        throw std::out_of_range("SVG document record index out of range");
    }

    utils::TTFReader reader(data);
    reader.seek(documentListOffset + 2 + index * kRecordSize);

    DocumentRecord record;
    record.startGlyphID = reader.readUInt16();
    record.endGlyphID = reader.readUInt16();
    uint32_t svgDocOffset = reader.readUInt32();
    record.documentLength = reader.readUInt32();

    if (record.endGlyphID < record.startGlyphID) {
        throw TableParseException(kSVGTableTag, "record " + std::to_string(index) +
                                  " has end glyph " + std::to_string(record.endGlyphID) +
                                  " before start glyph " + std::to_string(record.startGlyphID));
    }

    // Смещение документа отсчитывается от начала списка документов
    uint64_t start = static_cast<uint64_t>(documentListOffset) + svgDocOffset;
    if (start + record.documentLength > data.size) {
        throw TableParseException(kSVGTableTag, "record " + std::to_string(index) +
                                  " document (offset " + std::to_string(svgDocOffset) +
                                  ", length " + std::to_string(record.documentLength) +
                                  ") extends past the end of the table");
    }
    record.documentOffset = static_cast<uint32_t>(start);

    return record;
}

std::vector<DocumentRecord> SvgTable::records() const {
    std::vector<DocumentRecord> result;
    result.reserve(numEntries);
    for (size_t i = 0; i < numEntries; ++i) {
        result.push_back(getRecord(i));
    }
    return result;
}

utils::ByteSpan SvgTable::documentData(const DocumentRecord& record) const {
    try {
        return data.subspan(record.documentOffset, record.documentLength);
    } catch (const std::out_of_range&) {
        throw TableParseException(kSVGTableTag, "document range outside of the table");
    }
}

} // namespace svgdump
