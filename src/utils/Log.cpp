#include "svgdump/Log.h"
#include <iostream>
#include <streambuf>

namespace svgdump {

namespace {

class NullBuffer : public std::streambuf {
protected:
    int overflow(int c) override { return traits_type::not_eof(c); }
};

bool verboseEnabled = false;

std::ostream& nullStream() {
    static NullBuffer buffer;
    static std::ostream stream(&buffer);
    return stream;
}

} // namespace

void setVerbose(bool enabled) {
    verboseEnabled = enabled;
}

bool isVerbose() {
    return verboseEnabled;
}

std::ostream& log() {
    if (verboseEnabled) {
        return std::clog;
    }
    return nullStream();
}

} // namespace svgdump
