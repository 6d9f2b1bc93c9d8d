#include "svgdump/ContainerHandlers.h"
#include "svgdump/Log.h"
#include <string>

namespace svgdump {

bool TTC_Handler::canHandle(const utils::ByteSpan& fontData) const {
    return utils::TTFReader(fontData).checkTag("ttcf");
}

std::vector<uint32_t> TTC_Handler::readFaceOffsets(const utils::ByteSpan& fontData) {
    std::vector<uint32_t> offsets;
    try {
        utils::TTFReader reader(fontData);
        reader.skip(4);  // ttcf
        uint16_t majorVersion = reader.readUInt16();
        uint16_t minorVersion = reader.readUInt16();
        uint32_t numFonts = reader.readUInt32();

        if (reader.remaining() / 4 < numFonts) {
            throw ContainerParseException("collection declares " + std::to_string(numFonts) +
                                          " fonts but the offset table is truncated");
        }

        log() << "TrueType collection " << majorVersion << "." << minorVersion
              << ": " << numFonts << " fonts" << std::endl;

        offsets.reserve(numFonts);
        for (uint32_t i = 0; i < numFonts; ++i) {
            offsets.push_back(reader.readUInt32());
        }
    } catch (const std::out_of_range& e) {
        throw ContainerParseException(std::string("truncated collection header (") + e.what() + ")");
    }
    return offsets;
}

std::unique_ptr<FontTableProvider> TTC_Handler::open(const utils::ByteSpan& fontData,
                                                     uint32_t faceIndex) const {
    std::vector<uint32_t> offsets = readFaceOffsets(fontData);
    if (faceIndex >= offsets.size()) {
        throw ContainerParseException("face index " + std::to_string(faceIndex) +
                                      " out of range, collection has " +
                                      std::to_string(offsets.size()) + " fonts");
    }
    return std::make_unique<SFNT_TableProvider>(fontData, offsets[faceIndex],
                                                ContainerFormat::TRUETYPE_COLLECTION);
}

} // namespace svgdump
