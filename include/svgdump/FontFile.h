#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

#include "svgdump/SvgDump.h"

namespace svgdump {

/**
 * Файл шрифта целиком в памяти. Буфер не меняется после загрузки;
 * провайдеры таблиц и SvgTable ссылаются на него, поэтому FontFile
 * не копируется и должен пережить их.
 */
class FontFile {
public:
    explicit FontFile(const std::string& path);
    FontFile(std::vector<uint8_t> data, const std::string& name);

    FontFile(const FontFile&) = delete;
    FontFile& operator=(const FontFile&) = delete;

    ContainerFormat getFormat() const;
    std::unique_ptr<FontTableProvider> tableProvider(uint32_t faceIndex) const;

    const std::vector<uint8_t>& data() const { return fontData; }
    const std::string& getPath() const { return filepath; }

private:
    std::string filepath;
    std::vector<uint8_t> fontData;

    void loadFontData();
};

} // namespace svgdump
