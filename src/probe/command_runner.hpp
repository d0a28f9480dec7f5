#pragma once

#include <memory>
#include <string>

#include <QString>
#include <QStringList>

namespace hostprobe {

struct CommandResult {
    std::string output;
    std::string errorOutput;
    int exitCode = -1;
    // False when the program could not be launched or did not exit normally.
    bool started = false;
};

/**
 * Strategy for running an external program. The real implementation spawns a
 * process; tests substitute a fixture-backed fake.
 */
class CommandExecutor
{
public:
    virtual ~CommandExecutor() = default;

    virtual CommandResult execute(const QString &program,
                                  const QStringList &arguments) = 0;
};

// Runs the program with QProcess and blocks until it exits.
class QProcessExecutor : public CommandExecutor
{
public:
    CommandResult execute(const QString &program,
                          const QStringList &arguments) override;
};

class CommandRunner
{
public:
    // Uses a QProcessExecutor.
    CommandRunner();
    explicit CommandRunner(std::shared_ptr<CommandExecutor> executor);

    /**
     * Run the program and return its stdout unmodified.
     *
     * If the program cannot be started, crashes or exits with a non-zero
     * status, a warning with the captured output is logged and "N/A" is
     * returned instead. Never throws.
     */
    std::string run(const QString &program, const QStringList &arguments) const;

private:
    std::shared_ptr<CommandExecutor> m_executor;
};

} // namespace hostprobe
