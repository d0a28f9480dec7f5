#include "probe/platform_commands.hpp"

namespace hostprobe {

PlatformCommand cpuCommandFor(OsFamily family)
{
    switch (family) {
    case OsFamily::Windows:
        return {QStringLiteral("WMIC"),
                {QStringLiteral("CPU"), QStringLiteral("GET"), QStringLiteral("NAME")}};
    case OsFamily::MacOS:
        return {QStringLiteral("sysctl"),
                {QStringLiteral("-n"), QStringLiteral("machdep.cpu.brand_string")}};
    case OsFamily::FreeBSD:
        return {QStringLiteral("sysctl"),
                {QStringLiteral("-n"), QStringLiteral("hw.model")}};
    case OsFamily::Linux:
        break;
    }
    return {QStringLiteral("cat"), {QStringLiteral("/proc/cpuinfo")}};
}

PlatformCommand memoryCommandFor(OsFamily family)
{
    switch (family) {
    case OsFamily::Windows:
        return {QStringLiteral("WMIC"),
                {QStringLiteral("COMPUTERSYSTEM"), QStringLiteral("GET"),
                 QStringLiteral("TOTALPHYSICALMEMORY")}};
    case OsFamily::MacOS:
        return {QStringLiteral("sysctl"),
                {QStringLiteral("-n"), QStringLiteral("hw.memsize")}};
    case OsFamily::FreeBSD:
        return {QStringLiteral("sysctl"),
                {QStringLiteral("-n"), QStringLiteral("hw.physmem")}};
    case OsFamily::Linux:
        break;
    }
    return {QStringLiteral("cat"), {QStringLiteral("/proc/meminfo")}};
}

} // namespace hostprobe
