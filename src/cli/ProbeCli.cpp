#include "cli/ProbeCli.hpp"

#include <iostream>
#include <utility>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "probe/system_info_collector.hpp"

namespace hostprobe {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  hostprobe [--format markdown|json] [--out PATH]\n"
        "            [--version-file PATH] [--trace] [--verbose]\n");
}

bool isKnownFlag(const QString &arg)
{
    return arg == QStringLiteral("--trace") || arg == QStringLiteral("--verbose")
        || arg == QStringLiteral("--help");
}

bool isKnownOption(const QString &arg)
{
    return arg == QStringLiteral("--format") || arg == QStringLiteral("--out")
        || arg == QStringLiteral("--version-file");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool writeJsonFile(const QString &path, const nlohmann::json &payload)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(
        payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    if (file.write(data) != data.size()) {
        return false;
    }
    return true;
}

void renderSnapshotMarkdown(const SystemSnapshot &snapshot)
{
    std::cout << "# Host System Report\n\n";
    std::cout << "- Runtime version: " << snapshot.runtimeVersion << "\n";
    std::cout << "- Platform version: " << snapshot.platformVersion << "\n";
    std::cout << "- Operating system: " << toOsFamilyString(snapshot.osFamily) << "\n";
    std::cout << "- Available cores: " << snapshot.coreCount << "\n";
    std::cout << "- CPU: " << snapshot.cpuModel << "\n";
    std::cout << "- Available memory: " << snapshot.availableMemory << "\n";
}

void renderSnapshotJson(const SystemSnapshot &snapshot)
{
    const nlohmann::json payload = snapshot;
    std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

} // namespace

ProbeCli::ProbeCli()
    : m_executor(std::make_shared<QProcessExecutor>())
{
}

ProbeCli::ProbeCli(std::shared_ptr<CommandExecutor> executor)
    : m_executor(std::move(executor))
{
}

int ProbeCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (isKnownFlag(arg)) {
            continue;
        }
        if (isKnownOption(arg) && i + 1 < args.size()) {
            ++i;
            continue;
        }
        std::cerr << "Unknown or incomplete option: " << arg.toStdString() << "\n";
        std::cerr << usageText().toStdString();
        return 1;
    }

    if (args.contains(QStringLiteral("--help"))) {
        std::cout << usageText().toStdString();
        return 0;
    }

    return runReport(args);
}

int ProbeCli::runReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    if (args.contains(QStringLiteral("--trace"))) {
        logging::initLogging(logging::defaultProcessName(), true);
    }
    if (args.contains(QStringLiteral("--verbose"))) {
        logging::setStderrEcho(true);
    }

    CollectorOptions options = defaultCollectorOptions();
    const QString versionFile = getArgValue(args, QStringLiteral("--version-file"));
    if (!versionFile.isEmpty()) {
        options.platformVersionFile = versionFile;
    }

    const SystemInfoCollector collector(CommandRunner(m_executor), options);
    const SystemSnapshot snapshot = collector.collect();

    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    HLOG_INFO(QStringLiteral("ProbeCli"),
              QStringLiteral("runReport"),
              QStringLiteral("report_snapshot"),
              (nlohmann::json{{"format", format.toStdString()},
                              {"out", outPath.toStdString()}}));

    if (!outPath.isEmpty()) {
        if (!writeJsonFile(outPath, nlohmann::json(snapshot))) {
            std::cerr << "Failed to write " << outPath.toStdString() << std::endl;
            return 1;
        }
        return 0;
    }

    if (format == QStringLiteral("json")) {
        renderSnapshotJson(snapshot);
    } else {
        renderSnapshotMarkdown(snapshot);
    }
    return 0;
}

} // namespace hostprobe
