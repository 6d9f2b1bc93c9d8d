#pragma once
#include <string>
#include <ostream>
#include <cstdint>

namespace svgdump {

struct DumpOptions {
    std::string fontPath;
    std::string glyphArgument;
    bool hasGlyphArgument = false;
    uint32_t faceIndex = 0;
    bool verbose = false;
    bool showHelp = false;
};

class CommandProcessor {
public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitUsage = 2;

    static int run(int argc, char* argv[], std::ostream& out, std::ostream& err);
    static void printUsage(std::ostream& os);

private:
    // false - командная строка непригодна (код выхода 2)
    static bool parseArguments(int argc, char* argv[], DumpOptions& options, std::ostream& err);
};

} // namespace svgdump
