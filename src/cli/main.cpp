#include "svgdump/CommandProcessor.h"
#include <iostream>

int main(int argc, char* argv[]) {
    return svgdump::CommandProcessor::run(argc, argv, std::cout, std::cerr);
}
