#pragma once

#include <string>

#include <QString>

namespace hostprobe {

// HOSTPROBE_PLATFORM_VERSION_FILE if set, else the kernel release file on
// Linux. Empty on other hosts, where the kernel version is read directly.
QString defaultPlatformVersionFile();

// Version of the Qt runtime the process is running against.
std::string runtimeVersion();

/**
 * Read the precise platform version from a version file (kernel release on
 * Linux). An empty path means no version file: the full kernel version is
 * returned as is. If the file is missing, unreadable or empty, a warning is
 * logged and the major.minor of the kernel version is returned instead.
 */
std::string readPlatformVersion(const QString &versionFile);
std::string readPlatformVersion(const QString &versionFile, const QString &kernelVersion);

// Coarser identifier used when the version file cannot be read.
std::string coarsePlatformVersion(const QString &kernelVersion);

} // namespace hostprobe
