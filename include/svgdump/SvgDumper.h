#pragma once
#include <string>
#include <vector>
#include <memory>
#include <ostream>
#include <cstdint>

#include "svgdump/FontFile.h"
#include "svgdump/SVGTable.h"

namespace svgdump {

/**
 * Какие документы выводить: все или первый, покрывающий glyphID.
 */
struct GlyphSelection {
    bool all = false;
    uint16_t glyphID = 0;

    // "all" или десятичное число 0..65535, иначе InputException
    static GlyphSelection parse(const std::string& argument);
};

// Десятичное беззнаковое число не больше maxValue: цифры с необязательным ведущим '+'
bool parseUnsigned(const std::string& text, uint32_t maxValue, uint32_t& value);

class SvgDumper {
public:
    explicit SvgDumper(const std::string& fontPath, uint32_t faceIndex = 0);
    SvgDumper(std::vector<uint8_t> fontData, uint32_t faceIndex = 0);

    // Строка "<start> → <end>: <sha256>" на каждую запись, по сырым байтам документа
    void printHashes(std::ostream& out) const;

    void dumpGlyph(const GlyphSelection& selection, std::ostream& out) const;

private:
    FontFile font;
    std::unique_ptr<FontTableProvider> provider;
    SvgTable svg;

    static utils::ByteSpan locateSvgTable(FontTableProvider& provider);
};

} // namespace svgdump
