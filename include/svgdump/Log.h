#pragma once
#include <ostream>

namespace svgdump {

// Диагностика пишется в std::clog только в режиме --verbose,
// stdout остаётся только для результата.
void setVerbose(bool enabled);
bool isVerbose();
std::ostream& log();

} // namespace svgdump
