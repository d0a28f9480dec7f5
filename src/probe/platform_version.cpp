#include "probe/platform_version.hpp"

#include <QFile>
#include <QSysInfo>
#include <QVersionNumber>
#include <QtGlobal>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/models.hpp"

namespace hostprobe {

QString defaultPlatformVersionFile()
{
    const QString fromEnv = qEnvironmentVariable("HOSTPROBE_PLATFORM_VERSION_FILE");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
#ifdef Q_OS_LINUX
    return QStringLiteral("/proc/sys/kernel/osrelease");
#else
    return QString();
#endif
}

std::string runtimeVersion()
{
    return std::string(qVersion());
}

std::string coarsePlatformVersion(const QString &kernelVersion)
{
    const QString trimmed = kernelVersion.trimmed();
    if (trimmed.isEmpty()) {
        return kNotAvailable;
    }

    const QVersionNumber version = QVersionNumber::fromString(trimmed);
    if (version.isNull()) {
        return trimmed.toStdString();
    }
    if (version.segmentCount() < 2) {
        return QString::number(version.majorVersion()).toStdString();
    }
    return QVersionNumber(version.majorVersion(), version.minorVersion())
        .toString()
        .toStdString();
}

std::string readPlatformVersion(const QString &versionFile)
{
    return readPlatformVersion(versionFile, QSysInfo::kernelVersion());
}

std::string readPlatformVersion(const QString &versionFile, const QString &kernelVersion)
{
    QString error;
    if (versionFile.isEmpty()) {
        const QString version = kernelVersion.trimmed();
        if (!version.isEmpty()) {
            return version.toStdString();
        }
        error = QStringLiteral("empty kernel version");
    } else {
        QFile file(versionFile);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            error = file.errorString();
        } else {
            const QString version = QString::fromUtf8(file.readAll()).trimmed();
            if (!version.isEmpty()) {
                return version.toStdString();
            }
            error = QStringLiteral("empty version file");
        }
    }

    const std::string fallback = coarsePlatformVersion(kernelVersion);
    HLOG_WARN(QStringLiteral("PlatformVersion"),
              QStringLiteral("readPlatformVersion"),
              QStringLiteral("platform_version_fallback"),
              (nlohmann::json{{"path", versionFile.toStdString()},
                              {"error", error.toStdString()},
                              {"fallback", fallback}}));
    return fallback;
}

} // namespace hostprobe
