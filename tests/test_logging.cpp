#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>
#include <QThread>

#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugRequiresTrace();
    void testConcurrentLoggingAndInit();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QList<QByteArray> readLines(const QString &path) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QList<QByteArray> LoggingTests::readLines(const QString &path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    QList<QByteArray> lines;
    for (const QByteArray &line : file.readAll().split('\n')) {
        if (!line.trimmed().isEmpty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

void LoggingTests::testLogEventWrites()
{
    hostprobe::logging::initLogging(QStringLiteral("hostprobe-test"), false);
    const QString logPath = m_tempDir.path() + "/.local/share/hostprobe/logs/hostprobe-test.log";
    QCOMPARE(hostprobe::logging::logFilePath(QStringLiteral("hostprobe-test")), logPath);

    HLOG_INFO(QStringLiteral("Test"),
              QStringLiteral("testLogEventWrites"),
              QStringLiteral("test_log"),
              (nlohmann::json{{"key", "value"}}));

    const QList<QByteArray> lines = readLines(logPath);
    QCOMPARE(lines.size(), 1);

    const auto parsed = nlohmann::json::parse(lines.front().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed.value("process", "")),
             QStringLiteral("hostprobe-test"));
    QCOMPARE(QString::fromStdString(parsed.at("context").value("key", "")),
             QStringLiteral("value"));
}

void LoggingTests::testDebugRequiresTrace()
{
    hostprobe::logging::initLogging(QStringLiteral("hostprobe-trace"), false);
    const QString logPath = hostprobe::logging::logFilePath(QStringLiteral("hostprobe-trace"));

    HLOG_DEBUG(QStringLiteral("Test"),
               QStringLiteral("testDebugRequiresTrace"),
               QStringLiteral("hidden"),
               nlohmann::json::object());
    QCOMPARE(readLines(logPath).size(), 0);

    hostprobe::logging::initLogging(QStringLiteral("hostprobe-trace"), true);
    QVERIFY(hostprobe::logging::isTraceEnabled());
    HLOG_DEBUG(QStringLiteral("Test"),
               QStringLiteral("testDebugRequiresTrace"),
               QStringLiteral("visible"),
               (nlohmann::json{{"output", std::string("bad \xff byte")}}));

    const QList<QByteArray> lines = readLines(logPath);
    QCOMPARE(lines.size(), 1);
    QVERIFY(lines.front().contains("visible"));
}

void LoggingTests::testConcurrentLoggingAndInit()
{
    const QString process = QStringLiteral("hostprobe-concurrent");
    hostprobe::logging::initLogging(process, false);
    const QString logPath = hostprobe::logging::logFilePath(process);

    constexpr int kThreads = 4;
    constexpr int kLinesPerThread = 50;
    std::vector<std::unique_ptr<QThread>> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back(QThread::create([t]() {
            for (int i = 0; i < kLinesPerThread; ++i) {
                HLOG_INFO(QStringLiteral("Test"),
                          QStringLiteral("testConcurrentLoggingAndInit"),
                          QStringLiteral("concurrent_line"),
                          (nlohmann::json{{"thread", t}, {"index", i}}));
            }
        }));
        threads.back()->start();
    }

    for (int i = 0; i < 200; ++i) {
        hostprobe::logging::initLogging(process, i % 2 == 0);
        QCOMPARE(hostprobe::logging::isTraceEnabled(), i % 2 == 0);
        QCOMPARE(hostprobe::logging::defaultProcessName(), process);
    }

    for (const auto &thread : threads) {
        QVERIFY(thread->wait(30000));
    }
    hostprobe::logging::initLogging(process, false);

    const QList<QByteArray> lines = readLines(logPath);
    QCOMPARE(lines.size(), kThreads * kLinesPerThread);
    for (const QByteArray &line : lines) {
        const auto parsed = nlohmann::json::parse(line.toStdString());
        QCOMPARE(QString::fromStdString(parsed.value("process", "")), process);
    }
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
