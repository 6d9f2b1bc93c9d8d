#include "svgdump/ContainerRegistry.h"
#include "svgdump/ContainerHandlers.h"
#include "svgdump/Log.h"

namespace svgdump {

std::string formatName(ContainerFormat format) {
    switch (format) {
        case ContainerFormat::OPENTYPE: return "OpenType";
        case ContainerFormat::TRUETYPE_COLLECTION: return "TrueType Collection";
        case ContainerFormat::WOFF: return "WOFF";
        default: return "Unknown";
    }
}

ContainerRegistry::ContainerRegistry() {
    // Встроенные обработчики
    registerHandler(std::make_unique<SFNT_Handler>());
    registerHandler(std::make_unique<TTC_Handler>());
    registerHandler(std::make_unique<WOFF_Handler>());
}

ContainerRegistry& ContainerRegistry::instance() {
    static ContainerRegistry instance;
    return instance;
}

void ContainerRegistry::registerHandler(std::unique_ptr<ContainerHandler> handler) {
    handlers.push_back(std::move(handler));
}

std::unique_ptr<FontTableProvider> ContainerRegistry::open(const utils::ByteSpan& fontData,
                                                           uint32_t faceIndex) const {
    for (const auto& handler : handlers) {
        if (handler->canHandle(fontData)) {
            log() << "Opening font as " << formatName(handler->getFormat())
                  << ", face " << faceIndex << std::endl;
            return handler->open(fontData, faceIndex);
        }
    }
    throw ContainerParseException("unknown font container format");
}

ContainerFormat ContainerRegistry::detectFormat(const utils::ByteSpan& fontData) const {
    for (const auto& handler : handlers) {
        if (handler->canHandle(fontData)) {
            return handler->getFormat();
        }
    }
    return ContainerFormat::UNKNOWN;
}

std::vector<ContainerFormat> ContainerRegistry::getSupportedFormats() const {
    std::vector<ContainerFormat> formats;
    for (const auto& handler : handlers) {
        formats.push_back(handler->getFormat());
    }
    return formats;
}

} // namespace svgdump
