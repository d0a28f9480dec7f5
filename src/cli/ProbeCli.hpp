#pragma once

#include <memory>

#include <QStringList>

#include "probe/command_runner.hpp"

namespace hostprobe {

class ProbeCli
{
public:
    ProbeCli();
    // Executor used for the CPU and memory commands.
    explicit ProbeCli(std::shared_ptr<CommandExecutor> executor);

    // Collects a snapshot and renders it; returns the exit code.
    int run(int argc, char *argv[]);

private:
    int runReport(const QStringList &args);

    std::shared_ptr<CommandExecutor> m_executor;
};

} // namespace hostprobe
