#include "svgdump/FontFile.h"
#include "svgdump/ContainerRegistry.h"
#include "svgdump/Log.h"
#include <fstream>

namespace svgdump {

FontFile::FontFile(const std::string& path) : filepath(path) {
    loadFontData();
}

FontFile::FontFile(std::vector<uint8_t> data, const std::string& name)
    : filepath(name), fontData(std::move(data)) {}

void FontFile::loadFontData() {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw FontLoadException(filepath, "Cannot open file");
    }

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size < 0) {
        throw FontLoadException(filepath, "Cannot determine file size");
    }

    fontData.resize(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(fontData.data()), size)) {
        throw FontLoadException(filepath, "Cannot read file data");
    }

    log() << "Loaded " << filepath << ": " << fontData.size() << " bytes" << std::endl;
}

ContainerFormat FontFile::getFormat() const {
    return ContainerRegistry::instance().detectFormat(fontData);
}

std::unique_ptr<FontTableProvider> FontFile::tableProvider(uint32_t faceIndex) const {
    return ContainerRegistry::instance().open(fontData, faceIndex);
}

} // namespace svgdump
