#include "svgdump/SvgDumper.h"
#include "svgdump/Digest.h"
#include "svgdump/SVGDocument.h"
#include "svgdump/Log.h"

namespace svgdump {

namespace {
// U+2192 RIGHTWARDS ARROW
const char kArrow[] = " \xE2\x86\x92 ";
}

bool parseUnsigned(const std::string& text, uint32_t maxValue, uint32_t& value) {
    // Допускается один ведущий '+', как в "+1"
    size_t start = (!text.empty() && text[0] == '+') ? 1 : 0;
    if (start == text.size()) return false;

    uint64_t result = 0;
    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9') return false;
        result = result * 10 + static_cast<uint64_t>(c - '0');
        if (result > maxValue) return false;
    }
    value = static_cast<uint32_t>(result);
    return true;
}

GlyphSelection GlyphSelection::parse(const std::string& argument) {
    GlyphSelection selection;
    if (argument == "all") {
        selection.all = true;
        return selection;
    }

    uint32_t value = 0;
    if (!parseUnsigned(argument, 0xFFFF, value)) {
        throw InputException(argument, "glyph id must be 'all' or an integer in 0..65535");
    }
    selection.glyphID = static_cast<uint16_t>(value);
    return selection;
}

SvgDumper::SvgDumper(const std::string& fontPath, uint32_t faceIndex)
    : font(fontPath),
      provider(font.tableProvider(faceIndex)),
      svg(locateSvgTable(*provider)) {}

SvgDumper::SvgDumper(std::vector<uint8_t> fontData, uint32_t faceIndex)
    : font(std::move(fontData), "<memory>"),
      provider(font.tableProvider(faceIndex)),
      svg(locateSvgTable(*provider)) {}

utils::ByteSpan SvgDumper::locateSvgTable(FontTableProvider& provider) {
    return provider.readTableData(kSVGTableTag);
}

void SvgDumper::printHashes(std::ostream& out) const {
    utils::Sha256 hasher;
    for (size_t i = 0; i < svg.numRecords(); ++i) {
        DocumentRecord record = svg.getRecord(i);
        hasher.update(svg.documentData(record));
        out << record.startGlyphID << kArrow << record.endGlyphID << ": "
            << utils::toHexLower(hasher.finalizeReset()) << std::endl;
    }
}

void SvgDumper::dumpGlyph(const GlyphSelection& selection, std::ostream& out) const {
    for (size_t i = 0; i < svg.numRecords(); ++i) {
        DocumentRecord record = svg.getRecord(i);
        if (selection.all) {
            out << expandDocument(svg.documentData(record)) << std::endl;
        } else if (record.covers(selection.glyphID)) {
            log() << "Glyph " << selection.glyphID << " found in record " << i
                  << " (" << record.startGlyphID << ".." << record.endGlyphID << ")" << std::endl;
            out << expandDocument(svg.documentData(record)) << std::endl;
            return;
        }
    }

    if (!selection.all) {
        log() << "Glyph " << selection.glyphID << " has no SVG document" << std::endl;
    }
}

} // namespace svgdump
