#include "probe/command_runner.hpp"

#include <exception>
#include <utility>

#include <QProcess>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/models.hpp"

namespace hostprobe {

namespace {

nlohmann::json argumentsToJson(const QStringList &arguments)
{
    nlohmann::json list = nlohmann::json::array();
    for (const QString &arg : arguments) {
        list.push_back(arg.toStdString());
    }
    return list;
}

} // namespace

CommandResult QProcessExecutor::execute(const QString &program,
                                        const QStringList &arguments)
{
    CommandResult result;

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        result.errorOutput = process.errorString().toStdString();
        return result;
    }

    process.closeWriteChannel();

    // No timeout: a hung command blocks the collection.
    if (!process.waitForFinished(-1)) {
        result.errorOutput = process.errorString().toStdString();
        return result;
    }

    result.output = process.readAllStandardOutput().toStdString();
    result.errorOutput = process.readAllStandardError().toStdString();
    result.exitCode = process.exitCode();
    result.started = process.exitStatus() == QProcess::NormalExit;
    return result;
}

CommandRunner::CommandRunner()
    : m_executor(std::make_shared<QProcessExecutor>())
{
}

CommandRunner::CommandRunner(std::shared_ptr<CommandExecutor> executor)
    : m_executor(std::move(executor))
{
}

std::string CommandRunner::run(const QString &program,
                               const QStringList &arguments) const
{
    HLOG_DEBUG(QStringLiteral("CommandRunner"),
               QStringLiteral("run"),
               QStringLiteral("run_command"),
               (nlohmann::json{{"program", program.toStdString()},
                               {"args", argumentsToJson(arguments)}}));

    CommandResult result;
    if (m_executor) {
        try {
            result = m_executor->execute(program, arguments);
        } catch (const std::exception &ex) {
            result = CommandResult{};
            result.errorOutput = ex.what();
        }
    } else {
        result.errorOutput = "no command executor";
    }

    if (!result.started || result.exitCode != 0) {
        HLOG_WARN(QStringLiteral("CommandRunner"),
                  QStringLiteral("run"),
                  QStringLiteral("system_info_command_failed"),
                  (nlohmann::json{{"program", program.toStdString()},
                                  {"args", argumentsToJson(arguments)},
                                  {"exitCode", result.exitCode},
                                  {"started", result.started},
                                  {"output", result.output},
                                  {"stderr", result.errorOutput}}));
        return kNotAvailable;
    }

    return result.output;
}

} // namespace hostprobe
