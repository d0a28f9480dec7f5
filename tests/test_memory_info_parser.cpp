#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <cstdint>
#include <string>

#include "common/models.hpp"
#include "probe/memory_info_parser.hpp"

using hostprobe::OsFamily;

namespace {

const char *kLinuxMemInfo =
    "MemTotal:       16304428 kB\n"
    "MemFree:         1207544 kB\n"
    "MemAvailable:    9458704 kB\n"
    "Buffers:          570452 kB\n";

} // namespace

class MemoryInfoParserTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testSentinelPassthrough();
    void testLinuxBytes();
    void testLinuxFormatted();
    void testLinuxMissingMemTotal();
    void testLinuxMemTotalTooLarge();
    void testMacOS();
    void testFreeBSD();
    void testWindows();
    void testUnparseableOutput();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void MemoryInfoParserTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void MemoryInfoParserTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void MemoryInfoParserTests::testSentinelPassthrough()
{
    for (OsFamily family : {OsFamily::MacOS, OsFamily::Windows,
                            OsFamily::FreeBSD, OsFamily::Linux}) {
        QCOMPARE(QString::fromStdString(hostprobe::parseAvailableMemory(family, "N/A")),
                 QStringLiteral("N/A"));
        QVERIFY(!hostprobe::parseMemoryBytes(family, "N/A").has_value());
    }
}

void MemoryInfoParserTests::testLinuxBytes()
{
    const auto bytes = hostprobe::parseMemoryBytes(OsFamily::Linux,
                                                   "MemTotal: 16384000 kB");
    QVERIFY(bytes.has_value());
    QCOMPARE(*bytes, static_cast<std::uint64_t>(16384000) * 1024);

    const auto fromFile = hostprobe::parseMemoryBytes(OsFamily::Linux, kLinuxMemInfo);
    QVERIFY(fromFile.has_value());
    QCOMPARE(*fromFile, static_cast<std::uint64_t>(16304428) * 1024);
}

void MemoryInfoParserTests::testLinuxFormatted()
{
    QCOMPARE(QString::fromStdString(
                 hostprobe::parseAvailableMemory(OsFamily::Linux, kLinuxMemInfo)),
             QStringLiteral("15.55 GB"));
}

void MemoryInfoParserTests::testLinuxMissingMemTotal()
{
    QVERIFY(!hostprobe::parseMemoryBytes(OsFamily::Linux,
                                         "MemFree: 1207544 kB\n").has_value());
    QCOMPARE(QString::fromStdString(
                 hostprobe::parseAvailableMemory(OsFamily::Linux, "MemFree: 1207544 kB\n")),
             QStringLiteral("N/A"));
}

void MemoryInfoParserTests::testLinuxMemTotalTooLarge()
{
    const std::string raw = "MemTotal:       18014398509481984 kB\n";
    QVERIFY(!hostprobe::parseMemoryBytes(OsFamily::Linux, raw).has_value());
    QCOMPARE(QString::fromStdString(hostprobe::parseAvailableMemory(OsFamily::Linux, raw)),
             QStringLiteral("N/A"));

    const auto largest = hostprobe::parseMemoryBytes(OsFamily::Linux,
                                                     "MemTotal: 18014398509481983 kB");
    QVERIFY(largest.has_value());
    QCOMPARE(*largest, static_cast<std::uint64_t>(18014398509481983ULL) * 1024);
}

void MemoryInfoParserTests::testMacOS()
{
    const auto bytes = hostprobe::parseMemoryBytes(OsFamily::MacOS, "17179869184\n");
    QVERIFY(bytes.has_value());
    QCOMPARE(*bytes, static_cast<std::uint64_t>(17179869184ULL));
    QCOMPARE(QString::fromStdString(
                 hostprobe::parseAvailableMemory(OsFamily::MacOS, "17179869184\n")),
             QStringLiteral("16 GB"));
}

void MemoryInfoParserTests::testFreeBSD()
{
    QCOMPARE(QString::fromStdString(
                 hostprobe::parseAvailableMemory(OsFamily::FreeBSD, " 8544354304\n")),
             QStringLiteral("7.96 GB"));
}

void MemoryInfoParserTests::testWindows()
{
    const std::string raw =
        "TotalPhysicalMemory  \r\r\n34255630336          \r\r\n\r\r\n";
    const auto bytes = hostprobe::parseMemoryBytes(OsFamily::Windows, raw);
    QVERIFY(bytes.has_value());
    QCOMPARE(*bytes, static_cast<std::uint64_t>(34255630336ULL));
    QCOMPARE(QString::fromStdString(
                 hostprobe::parseAvailableMemory(OsFamily::Windows, raw)),
             QStringLiteral("31.9 GB"));
}

void MemoryInfoParserTests::testUnparseableOutput()
{
    QCOMPARE(QString::fromStdString(
                 hostprobe::parseAvailableMemory(OsFamily::Windows, "TotalPhysicalMemory\r\n")),
             QStringLiteral("N/A"));
    QCOMPARE(QString::fromStdString(
                 hostprobe::parseAvailableMemory(OsFamily::MacOS, "unknown oid\n")),
             QStringLiteral("N/A"));
    QCOMPARE(QString::fromStdString(
                 hostprobe::parseAvailableMemory(OsFamily::FreeBSD, "")),
             QStringLiteral("N/A"));
}

QTEST_MAIN(MemoryInfoParserTests)
#include "test_memory_info_parser.moc"
