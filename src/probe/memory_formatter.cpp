#include "probe/memory_formatter.hpp"

#include <cmath>

#include <QString>

namespace hostprobe {

namespace {

constexpr double kUnitStep = 1024.0;

int unitIndex(MemoryUnit unit)
{
    return static_cast<int>(unit);
}

} // namespace

double convertMemory(double value, MemoryUnit from, MemoryUnit to)
{
    return value * std::pow(kUnitStep, unitIndex(from) - unitIndex(to));
}

MemoryUnit bestMemoryUnit(std::uint64_t bytes)
{
    static const MemoryUnit units[] = {
        MemoryUnit::Terabyte,
        MemoryUnit::Gigabyte,
        MemoryUnit::Megabyte,
        MemoryUnit::Kilobyte,
    };

    for (const MemoryUnit unit : units) {
        const std::uint64_t unitBytes = std::uint64_t{1} << (10 * unitIndex(unit));
        if (bytes >= unitBytes) {
            return unit;
        }
    }
    return MemoryUnit::Byte;
}

std::string memoryUnitLabel(MemoryUnit unit)
{
    switch (unit) {
    case MemoryUnit::Byte:
        return "B";
    case MemoryUnit::Kilobyte:
        return "KB";
    case MemoryUnit::Megabyte:
        return "MB";
    case MemoryUnit::Gigabyte:
        return "GB";
    case MemoryUnit::Terabyte:
        return "TB";
    }
    return "B";
}

std::string formatMemory(std::uint64_t bytes)
{
    MemoryUnit unit = bestMemoryUnit(bytes);
    double mantissa = convertMemory(static_cast<double>(bytes), MemoryUnit::Byte, unit);

    // 1023.999 KB prints as 1024, which belongs to the next unit.
    if (std::round(mantissa * 100.0) / 100.0 >= kUnitStep && unit != MemoryUnit::Terabyte) {
        unit = static_cast<MemoryUnit>(unitIndex(unit) + 1);
        mantissa = convertMemory(static_cast<double>(bytes), MemoryUnit::Byte, unit);
    }

    QString number = QString::number(mantissa, 'f', 2);
    while (number.endsWith(QLatin1Char('0'))) {
        number.chop(1);
    }
    if (number.endsWith(QLatin1Char('.'))) {
        number.chop(1);
    }

    return number.toStdString() + " " + memoryUnitLabel(unit);
}

} // namespace hostprobe
