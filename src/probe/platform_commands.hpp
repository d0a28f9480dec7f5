#pragma once

#include <QString>
#include <QStringList>

#include "common/enums.hpp"

namespace hostprobe {

struct PlatformCommand {
    QString program;
    QStringList arguments;
};

// Fixed per-family commands; the parsers are written against their output.
PlatformCommand cpuCommandFor(OsFamily family);
PlatformCommand memoryCommandFor(OsFamily family);

} // namespace hostprobe
