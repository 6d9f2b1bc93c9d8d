#include "svgdump/CommandProcessor.h"
#include "svgdump/SvgDumper.h"
#include "svgdump/Log.h"
#include <vector>

namespace svgdump {

void CommandProcessor::printUsage(std::ostream& os) {
    os << "Usage: svg-dump [options] path/to/SVGinOT.ttf [glyph id | all]" << std::endl;
    os << std::endl;
    os << "Without a glyph id prints the SHA-256 of every SVG document:" << std::endl;
    os << "  <start glyph> \xE2\x86\x92 <end glyph>: <sha256>" << std::endl;
    os << "With a glyph id prints the SVG document covering that glyph," << std::endl;
    os << "with 'all' prints every document." << std::endl;
    os << std::endl;
    os << "Options:" << std::endl;
    os << "  -i, --index <n>    Font index inside a collection (default 0)" << std::endl;
    os << "  -v, --verbose      Print diagnostics to stderr" << std::endl;
    os << "  -h, --help         Show this help" << std::endl;
    os << std::endl;
    os << "Supported containers: OpenType/TrueType, TrueType Collection, WOFF" << std::endl;
}

bool CommandProcessor::parseArguments(int argc, char* argv[], DumpOptions& options, std::ostream& err) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-i" || arg == "--index") {
            if (i + 1 >= argc) {
                err << "Option " << arg << " requires a value" << std::endl;
                return false;
            }
            std::string value = argv[++i];
            if (!parseUnsigned(value, 0xFFFFFFFFu, options.faceIndex)) {
                throw InputException(value, "font index must be a non-negative integer");
            }
        } else {
            positional.push_back(arg);
        }
    }

    if (options.showHelp) {
        return true;
    }

    // Аргументы после идентификатора глифа игнорируются
    if (positional.empty()) {
        return false;
    }

    options.fontPath = positional[0];
    if (positional.size() == 2) {
        options.glyphArgument = positional[1];
        options.hasGlyphArgument = true;
    }
    return true;
}

int CommandProcessor::run(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    try {
        DumpOptions options;
        if (!parseArguments(argc, argv, options, err)) {
            printUsage(err);
            return kExitUsage;
        }

        if (options.showHelp) {
            printUsage(out);
            return kExitSuccess;
        }

        setVerbose(options.verbose);

        if (options.hasGlyphArgument) {
            // Аргумент проверяется до чтения шрифта
            GlyphSelection selection = GlyphSelection::parse(options.glyphArgument);
            SvgDumper dumper(options.fontPath, options.faceIndex);
            dumper.dumpGlyph(selection, out);
        } else {
            SvgDumper dumper(options.fontPath, options.faceIndex);
            dumper.printHashes(out);
        }

        return kExitSuccess;
    } catch (const std::exception& e) {
        // Любая ошибка - одна строка "Error: ..."
        err << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}

} // namespace svgdump
