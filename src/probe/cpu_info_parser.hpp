#pragma once

#include <string>

#include "common/enums.hpp"

namespace hostprobe {

/**
 * Extract a human-readable CPU model from the output of the family's CPU
 * command (see cpuCommandFor()).
 *
 * - "N/A" passes through for every family.
 * - Windows: the leading "Name" column header is removed.
 * - macOS / FreeBSD: the output already is the model string.
 * - Linux: the first "model name" field of /proc/cpuinfo, or
 *   "Unrecognized processor" if there is none.
 */
std::string parseCpuModel(OsFamily family, const std::string &rawOutput);

} // namespace hostprobe
