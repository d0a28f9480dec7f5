#pragma once

#include <string>

#include "common/enums.hpp"

namespace hostprobe {

// Sentinels used in place of errors; callers never branch on failure.
inline constexpr const char *kNotAvailable = "N/A";
inline constexpr const char *kUnrecognizedProcessor = "Unrecognized processor";

struct SystemSnapshot {
    std::string runtimeVersion;
    std::string platformVersion;
    int coreCount = 1;
    OsFamily osFamily = OsFamily::Linux;
    std::string cpuModel;
    std::string availableMemory;
};

} // namespace hostprobe
