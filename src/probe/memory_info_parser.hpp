#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "common/enums.hpp"

namespace hostprobe {

/**
 * Extract total physical memory in bytes from the output of the family's
 * memory command (see memoryCommandFor()).
 *
 * - Windows: first run of digits (bytes).
 * - macOS / FreeBSD: leading integer of the trimmed output (bytes).
 * - Linux: the "MemTotal: <n> kB" line of /proc/meminfo, converted to bytes.
 *
 * Returns std::nullopt for "N/A" or output without a usable number.
 */
std::optional<std::uint64_t> parseMemoryBytes(OsFamily family,
                                              const std::string &rawOutput);

// parseMemoryBytes() rendered with formatMemory(); "N/A" when it has no value.
std::string parseAvailableMemory(OsFamily family, const std::string &rawOutput);

} // namespace hostprobe
