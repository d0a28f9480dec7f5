#include "probe/os_detector.hpp"

#include <QSysInfo>

namespace hostprobe {

OsFamily osFamilyForTag(const QString &tag)
{
    const QString normalized = tag.trimmed().toLower();
    if (normalized == QStringLiteral("darwin")) {
        return OsFamily::MacOS;
    }
    if (normalized == QStringLiteral("nt") || normalized == QStringLiteral("winnt")) {
        return OsFamily::Windows;
    }
    if (normalized == QStringLiteral("freebsd")) {
        return OsFamily::FreeBSD;
    }
    return OsFamily::Linux;
}

OsFamily detectOsFamily()
{
    return osFamilyForTag(QSysInfo::kernelType());
}

} // namespace hostprobe
