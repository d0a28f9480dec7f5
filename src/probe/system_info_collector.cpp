#include "probe/system_info_collector.hpp"

#include <utility>

#include <QThread>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "probe/cpu_info_parser.hpp"
#include "probe/memory_info_parser.hpp"
#include "probe/os_detector.hpp"
#include "probe/platform_commands.hpp"
#include "probe/platform_version.hpp"

namespace hostprobe {

CollectorOptions defaultCollectorOptions()
{
    CollectorOptions options;
    options.platformVersionFile = defaultPlatformVersionFile();
    return options;
}

SystemInfoCollector::SystemInfoCollector()
    : SystemInfoCollector(CommandRunner(), defaultCollectorOptions())
{
}

SystemInfoCollector::SystemInfoCollector(CommandRunner runner,
                                         CollectorOptions options,
                                         FamilyDetector detector)
    : m_runner(std::move(runner))
    , m_options(std::move(options))
    , m_detector(detector ? std::move(detector) : FamilyDetector(&detectOsFamily))
{
}

SystemSnapshot SystemInfoCollector::collect() const
{
    SystemSnapshot snapshot;
    snapshot.runtimeVersion = runtimeVersion();
    snapshot.platformVersion = readPlatformVersion(m_options.platformVersionFile);
    snapshot.coreCount = qMax(1, QThread::idealThreadCount());
    snapshot.osFamily = m_detector();

    const PlatformCommand cpuCommand = cpuCommandFor(snapshot.osFamily);
    snapshot.cpuModel = parseCpuModel(
        snapshot.osFamily, m_runner.run(cpuCommand.program, cpuCommand.arguments));

    const PlatformCommand memoryCommand = memoryCommandFor(snapshot.osFamily);
    snapshot.availableMemory = parseAvailableMemory(
        snapshot.osFamily,
        m_runner.run(memoryCommand.program, memoryCommand.arguments));

    HLOG_INFO(QStringLiteral("SystemInfoCollector"),
              QStringLiteral("collect"),
              QStringLiteral("system_info_collected"),
              nlohmann::json(snapshot));
    return snapshot;
}

} // namespace hostprobe
