#include <QtTest/QtTest>

#include <limits>

#include "collector/field_parsers.hpp"

class FieldParsersTests : public QObject
{
    Q_OBJECT
private slots:
    void testFormatUptime_data();
    void testFormatUptime();
    void testFormatMemory();
    void testFormatDisk();
    void testFormatTemperature();
    void testOsReleasePrettyName();
    void testCpuModelName();
    void testPciDisplayController();
    void testBootTime();
    void testMemInfo();

private:
    static QString q(const std::string &value) { return QString::fromStdString(value); }
};

void FieldParsersTests::testFormatUptime_data()
{
    QTest::addColumn<qint64>("seconds");
    QTest::addColumn<QString>("expected");

    QTest::newRow("zero") << qint64(0) << QStringLiteral("0h 0m 0s");
    QTest::newRow("one hour one minute one second") << qint64(3661)
                                                     << QStringLiteral("1h 1m 1s");
    QTest::newRow("just below a day") << qint64(86399) << QStringLiteral("23h 59m 59s");
    QTest::newRow("exactly a day") << qint64(86400) << QStringLiteral("1d 0h 0m 0s");
    QTest::newRow("one of each") << qint64(90061) << QStringLiteral("1d 1h 1m 1s");
    QTest::newRow("many days") << qint64(40 * 86400 + 7200 + 5)
                               << QStringLiteral("40d 2h 0m 5s");
}

void FieldParsersTests::testFormatUptime()
{
    QFETCH(qint64, seconds);
    QFETCH(QString, expected);
    QCOMPARE(q(mountfetch::formatUptime(seconds)), expected);
}

void FieldParsersTests::testFormatMemory()
{
    mountfetch::MemoryReading reading;
    reading.usedBytes = 2ULL * 1024 * 1024 * 1024;
    reading.totalBytes = 8ULL * 1024 * 1024 * 1024;
    reading.percent = 25.0;

    QCOMPARE(q(mountfetch::formatMemory(reading, false)), QStringLiteral("2.00/8.00 Go"));
    QCOMPARE(q(mountfetch::formatMemory(reading, true)), QStringLiteral("25.0%"));

    // The reported percent is printed as-is, not derived from used/total.
    reading.percent = 61.3;
    QCOMPARE(q(mountfetch::formatMemory(reading, true)), QStringLiteral("61.3%"));

    reading.usedBytes = 1536ULL * 1024 * 1024;
    QCOMPARE(q(mountfetch::formatMemory(reading, false)), QStringLiteral("1.50/8.00 Go"));
}

void FieldParsersTests::testFormatDisk()
{
    mountfetch::DiskReading reading;
    reading.usedBytes = 100ULL * 1024 * 1024 * 1024;
    reading.totalBytes = 400ULL * 1024 * 1024 * 1024;
    reading.percent = 26.3;

    QCOMPARE(q(mountfetch::formatDisk(reading)), QStringLiteral("100.00/400.00 Go (26.3%)"));
}

void FieldParsersTests::testFormatTemperature()
{
    QCOMPARE(q(mountfetch::formatTemperature(45000)), QStringLiteral("45.0°C"));
    QCOMPARE(q(mountfetch::formatTemperature(45500)), QStringLiteral("45.5°C"));
    QCOMPARE(q(mountfetch::formatTemperature(38125)), QStringLiteral("38.125°C"));
    QCOMPARE(q(mountfetch::formatTemperature(-5000)), QStringLiteral("-5.0°C"));
    QCOMPARE(q(mountfetch::formatTemperature(std::numeric_limits<std::int64_t>::min())),
             QStringLiteral("-9223372036854775.808°C"));
}

void FieldParsersTests::testOsReleasePrettyName()
{
    const std::string text =
        "NAME=\"Arch Linux\"\n"
        "ID=arch\n"
        "PRETTY_NAME=\"Arch Linux\"\n"
        "BUILD_ID=rolling\n";
    const auto name = mountfetch::parseOsReleasePrettyName(text);
    QVERIFY(name.has_value());
    QCOMPARE(q(*name), QStringLiteral("Arch Linux"));

    const auto single = mountfetch::parseOsReleasePrettyName("PRETTY_NAME='Debian 12'\n");
    QVERIFY(single.has_value());
    QCOMPARE(q(*single), QStringLiteral("Debian 12"));

    const auto bare = mountfetch::parseOsReleasePrettyName("PRETTY_NAME=Alpine\n");
    QVERIFY(bare.has_value());
    QCOMPARE(q(*bare), QStringLiteral("Alpine"));

    QVERIFY(!mountfetch::parseOsReleasePrettyName("NAME=Foo\nID=foo\n").has_value());
    QVERIFY(!mountfetch::parseOsReleasePrettyName("").has_value());
}

void FieldParsersTests::testCpuModelName()
{
    const std::string text =
        "processor\t: 0\n"
        "vendor_id\t: GenuineIntel\n"
        "model name\t: Intel(R) Core(TM) i7-8550U CPU @ 1.80GHz  \n"
        "processor\t: 1\n"
        "model name\t: Some Other Core\n";
    const auto model = mountfetch::parseCpuModelName(text);
    QVERIFY(model.has_value());
    QCOMPARE(q(*model), QStringLiteral("Intel(R) Core(TM) i7-8550U CPU @ 1.80GHz"));

    QVERIFY(!mountfetch::parseCpuModelName("processor\t: 0\nHardware\t: BCM2835\n")
                 .has_value());
}

void FieldParsersTests::testPciDisplayController()
{
    const std::string text =
        "00:00.0 Host bridge: Intel Corporation Xeon E3-1200 v6/7th Gen Host Bridge\n"
        "00:02.0 VGA compatible controller: Intel Corporation UHD Graphics 620 (rev 07)\n"
        "01:00.0 3D controller: NVIDIA Corporation GP108M [GeForce MX150] (rev a1)\n";
    QCOMPARE(q(mountfetch::parsePciDisplayController(text)),
             QStringLiteral("Intel Corporation UHD Graphics 620 (rev 07)"));

    QCOMPARE(q(mountfetch::parsePciDisplayController(
                 "01:00.0 3D controller: NVIDIA Corporation GA107M\n")),
             QStringLiteral("NVIDIA Corporation GA107M"));

    // Only the third colon-separated segment is kept.
    QCOMPARE(q(mountfetch::parsePciDisplayController(
                 "00:02.0 VGA compatible controller: Vendor: Model\n")),
             QStringLiteral("Vendor"));

    // A controller line with nothing after the class yields an empty name.
    QCOMPARE(q(mountfetch::parsePciDisplayController(
                 "00:02.0 VGA compatible controller:\n"
                 "01:00.0 3D controller: NVIDIA Corporation GA107M\n")),
             QString());

    QCOMPARE(q(mountfetch::parsePciDisplayController(
                 "00:1f.3 Audio device: Intel Corporation Sunrise Point-LP HD Audio\n")),
             QStringLiteral("N/A"));
    QCOMPARE(q(mountfetch::parsePciDisplayController("")), QStringLiteral("N/A"));
}

void FieldParsersTests::testBootTime()
{
    const auto btime = mountfetch::parseBootTime(
        "cpu  1 2 3 4\nintr 5\nctxt 6\nbtime 1700000000\nprocesses 7\n");
    QVERIFY(btime.has_value());
    QCOMPARE(static_cast<qint64>(*btime), qint64(1700000000));

    QVERIFY(!mountfetch::parseBootTime("cpu 1 2 3\n").has_value());
    QVERIFY(!mountfetch::parseBootTime("btime garbage\n").has_value());
}

void FieldParsersTests::testMemInfo()
{
    const std::string text =
        "MemTotal:        8000000 kB\n"
        "MemFree:         1000000 kB\n"
        "MemAvailable:    6000000 kB\n"
        "Buffers:          500000 kB\n"
        "Cached:          1400000 kB\n"
        "SwapCached:            0 kB\n"
        "SReclaimable:     100000 kB\n";
    const auto reading = mountfetch::parseMemInfo(text);
    QVERIFY(reading.has_value());
    QCOMPARE(quint64(reading->totalBytes), quint64(8000000ULL * 1024));
    QCOMPARE(quint64(reading->usedBytes), quint64(5000000ULL * 1024));
    QCOMPARE(reading->percent, 25.0);

    QVERIFY(!mountfetch::parseMemInfo("MemFree: 10 kB\n").has_value());
}

QTEST_MAIN(FieldParsersTests)
#include "test_field_parsers.moc"
