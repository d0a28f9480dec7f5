#pragma once

#include <cstdint>
#include <string>

namespace hostprobe {

// Units step by 1024.
enum class MemoryUnit {
    Byte,
    Kilobyte,
    Megabyte,
    Gigabyte,
    Terabyte
};

double convertMemory(double value, MemoryUnit from, MemoryUnit to);

// Largest unit in which the value is still at least 1; Byte for 0.
MemoryUnit bestMemoryUnit(std::uint64_t bytes);

std::string memoryUnitLabel(MemoryUnit unit);

/**
 * Render a byte count in its best unit: at most two decimals with trailing
 * zeros dropped, a space, then the label. 1024 -> "1 KB", 1536 -> "1.5 KB".
 */
std::string formatMemory(std::uint64_t bytes);

} // namespace hostprobe
