#pragma once

#include <QString>

#include "common/enums.hpp"

namespace hostprobe {

// Map a kernel type tag (QSysInfo::kernelType() style) to an OS family.
// Unrecognized tags map to OsFamily::Linux.
OsFamily osFamilyForTag(const QString &tag);

// Detect the family of the running host.
OsFamily detectOsFamily();

} // namespace hostprobe
