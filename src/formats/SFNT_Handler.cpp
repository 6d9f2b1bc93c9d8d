#include "svgdump/ContainerHandlers.h"
#include "svgdump/Log.h"
#include <string>

namespace svgdump {

SFNT_TableProvider::SFNT_TableProvider(const utils::ByteSpan& data, size_t directoryOffset,
                                       ContainerFormat containerFormat)
    : fontData(data), format(containerFormat) {
    try {
        tables = utils::parseTTFTables(fontData, directoryOffset);
    } catch (const std::out_of_range& e) {
        throw ContainerParseException(std::string("truncated table directory (") + e.what() + ")");
    }
    log() << "Table directory at offset " << directoryOffset << ": "
          << tables.size() << " tables" << std::endl;
}

bool SFNT_TableProvider::hasTable(const std::string& tag) const {
    return utils::hasTable(tables, tag);
}

utils::ByteSpan SFNT_TableProvider::readTableData(const std::string& tag) {
    const utils::TableRecord* record = utils::findTable(tables, tag);
    if (!record) {
        throw ContainerParseException("font does not contain a '" + tag + "' table");
    }

    // Границы таблицы проверяются при обращении, а не при разборе каталога
    uint64_t end = static_cast<uint64_t>(record->offset) + record->length;
    if (end > fontData.size) {
        throw ContainerParseException("table '" + tag + "' at offset " +
                                      std::to_string(record->offset) + " with length " +
                                      std::to_string(record->length) +
                                      " extends past the end of the file");
    }

    log() << "Found '" << tag << "' table: offset=" << record->offset
          << " length=" << record->length << std::endl;
    return fontData.subspan(record->offset, record->length);
}

bool SFNT_Handler::canHandle(const utils::ByteSpan& fontData) const {
    utils::TTFReader reader(fontData);
    if (reader.remaining() < 4) return false;

    uint32_t version = reader.readUInt32();
    return version == 0x00010000 ||
           version == utils::makeTag("OTTO") ||
           version == utils::makeTag("true") ||
           version == utils::makeTag("typ1");
}

std::unique_ptr<FontTableProvider> SFNT_Handler::open(const utils::ByteSpan& fontData,
                                                      uint32_t faceIndex) const {
    if (faceIndex != 0) {
        throw ContainerParseException("face index " + std::to_string(faceIndex) +
                                      " requested but the font is not a collection");
    }
    return std::make_unique<SFNT_TableProvider>(fontData, 0, ContainerFormat::OPENTYPE);
}

} // namespace svgdump
