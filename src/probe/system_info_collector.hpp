#pragma once

#include <functional>

#include <QString>

#include "common/models.hpp"
#include "probe/command_runner.hpp"

namespace hostprobe {

struct CollectorOptions {
    QString platformVersionFile;
};

CollectorOptions defaultCollectorOptions();

/**
 * Builds a SystemSnapshot of the current host.
 *
 * The OS family is detected once per collect() and selects both the CPU and
 * the memory command. Every field degrades to a sentinel on failure, so
 * collect() always returns a complete snapshot.
 */
class SystemInfoCollector
{
public:
    using FamilyDetector = std::function<OsFamily()>;

    SystemInfoCollector();
    SystemInfoCollector(CommandRunner runner,
                        CollectorOptions options,
                        FamilyDetector detector = {});

    SystemSnapshot collect() const;

private:
    CommandRunner m_runner;
    CollectorOptions m_options;
    FamilyDetector m_detector;
};

} // namespace hostprobe
