#include <QCoreApplication>

#include "cli/ProbeCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("hostprobe"));

    const bool trace = qEnvironmentVariableIntValue("HOSTPROBE_TRACE") == 1;
    hostprobe::logging::initLogging(QStringLiteral("hostprobe"), trace);
    HLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("hostprobe_start"),
              (nlohmann::json{{"args", argc - 1}}));

    hostprobe::ProbeCli cli;
    return cli.run(argc, argv);
}
