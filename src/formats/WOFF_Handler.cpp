#include "svgdump/ContainerHandlers.h"
#include "svgdump/Inflate.h"
#include "svgdump/Log.h"
#include <cstring>
#include <string>

namespace svgdump {

WOFF_TableProvider::WOFF_TableProvider(const utils::ByteSpan& data)
    : fontData(data), flavor(0) {
    try {
        utils::TTFReader reader(fontData);
        if (reader.remaining() < WOFF_Handler::kHeaderSize) {
            throw ContainerParseException("file too small for WOFF header");
        }

        reader.skip(4);  // wOFF
        flavor = reader.readUInt32();
        uint32_t length = reader.readUInt32();
        uint16_t numTables = reader.readUInt16();
        reader.skip(2);  // reserved
        reader.skip(4);  // totalSfntSize
        reader.skip(4);  // majorVersion, minorVersion
        reader.skip(20); // metadata и private блоки не нужны

        if (length != fontData.size) {
            log() << "WOFF header length " << length << " differs from file size "
                  << fontData.size << std::endl;
        }

        if (reader.remaining() / WOFF_Handler::kEntrySize < numTables) {
            throw ContainerParseException("truncated WOFF table directory");
        }

        entries.reserve(numTables);
        for (uint16_t i = 0; i < numTables; ++i) {
            WOFFTableEntry entry;
            std::string tag = reader.readTag();
            memcpy(entry.tag, tag.data(), 4);
            entry.offset = reader.readUInt32();
            entry.compLength = reader.readUInt32();
            entry.origLength = reader.readUInt32();
            entry.origChecksum = reader.readUInt32();
            entries.push_back(entry);
        }
    } catch (const std::out_of_range& e) {
        throw ContainerParseException(std::string("truncated WOFF header (") + e.what() + ")");
    }

    log() << "WOFF flavor 0x" << std::hex << flavor << std::dec << ": "
          << entries.size() << " tables" << std::endl;
}

const WOFFTableEntry* WOFF_TableProvider::findEntry(const std::string& tag) const {
    if (tag.size() != 4) return nullptr;
    for (const auto& entry : entries) {
        if (memcmp(entry.tag, tag.c_str(), 4) == 0) {
            return &entry;
        }
    }
    return nullptr;
}

bool WOFF_TableProvider::hasTable(const std::string& tag) const {
    return findEntry(tag) != nullptr;
}

utils::ByteSpan WOFF_TableProvider::readTableData(const std::string& tag) {
    const WOFFTableEntry* entry = findEntry(tag);
    if (!entry) {
        throw ContainerParseException("font does not contain a '" + tag + "' table");
    }

    uint64_t end = static_cast<uint64_t>(entry->offset) + entry->compLength;
    if (end > fontData.size) {
        throw ContainerParseException("table '" + tag + "' extends past the end of the file");
    }
    utils::ByteSpan stored = fontData.subspan(entry->offset, entry->compLength);

    if (entry->compLength == entry->origLength) {
        log() << "Found '" << tag << "' table (stored): length=" << entry->origLength << std::endl;
        return stored;
    }
    if (entry->compLength > entry->origLength) {
        throw ContainerParseException("table '" + tag + "' compressed length " +
                                      std::to_string(entry->compLength) +
                                      " exceeds its original length " +
                                      std::to_string(entry->origLength));
    }

    auto cached = inflatedTables.find(tag);
    if (cached != inflatedTables.end()) {
        return utils::ByteSpan(cached->second);
    }

    std::vector<uint8_t> table;
    try {
        table = utils::inflateBytes(stored, utils::InflateWrapper::ZLIB, entry->origLength);
    } catch (const DecompressException& e) {
        throw ContainerParseException("table '" + tag + "': " + e.what());
    }
    if (table.size() != entry->origLength) {
        throw ContainerParseException("table '" + tag + "' inflated to " +
                                      std::to_string(table.size()) + " bytes, expected " +
                                      std::to_string(entry->origLength));
    }

    log() << "Found '" << tag << "' table (zlib): " << entry->compLength
          << " -> " << entry->origLength << " bytes" << std::endl;

    auto inserted = inflatedTables.emplace(tag, std::move(table));
    return utils::ByteSpan(inserted.first->second);
}

bool WOFF_Handler::canHandle(const utils::ByteSpan& fontData) const {
    return utils::TTFReader(fontData).checkTag("wOFF");
}

std::unique_ptr<FontTableProvider> WOFF_Handler::open(const utils::ByteSpan& fontData,
                                                      uint32_t faceIndex) const {
    if (faceIndex != 0) {
        throw ContainerParseException("face index " + std::to_string(faceIndex) +
                                      " requested but WOFF holds a single font");
    }
    return std::make_unique<WOFF_TableProvider>(fontData);
}

} // namespace svgdump
