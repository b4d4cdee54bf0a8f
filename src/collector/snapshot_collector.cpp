#include "collector/snapshot_collector.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSysInfo>

#include <sys/statvfs.h>
#include <sys/sysinfo.h>
#include <sys/utsname.h>

#include <utility>

#include <nlohmann/json.hpp>

#include "collector/field_parsers.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace mountfetch {

namespace {

const QString kComponent = QStringLiteral("SnapshotCollector");
const char *const kTemperatureUnsupported = "Unsupported on this system.";

std::optional<std::string> readTextFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return std::nullopt;
    }
    return file.readAll().toStdString();
}

std::string unameSysname()
{
    struct utsname uts {};
    if (uname(&uts) != 0) {
        return "Linux";
    }
    return uts.sysname;
}

} // namespace

SnapshotCollector::SnapshotCollector(CollectorSources sources)
    : m_sources(std::move(sources))
{
}

SystemSnapshot SnapshotCollector::collect(const ReportOptions &options) const
{
    SystemSnapshot snapshot;
    snapshot.osName = collectOsName();
    snapshot.kernel = collectKernel();
    snapshot.hostname = collectHostname();
    snapshot.uptime = collectUptime();
    snapshot.ramInfo = collectMemory(options.ramPercent);
    snapshot.diskInfo = collectDisk(options.includeDisk);
    snapshot.temperature = collectTemperature(options.includeTemperature);
    snapshot.cpuName = collectCpuName();

    const GpuProbe gpu = probeGpu();
    snapshot.gpuName = gpu.value;
    snapshot.gpuPresent = gpu.present;

    MFLOG_DEBUG(kComponent,
                QStringLiteral("collect"),
                QStringLiteral("snapshot_collected"),
                QStringLiteral("user_invocation"),
                (nlohmann::json{{"ramPercent", options.ramPercent},
                                {"disk", options.includeDisk},
                                {"temperature", options.includeTemperature},
                                {"gpuPresent", snapshot.gpuPresent}}));
    return snapshot;
}

std::string SnapshotCollector::collectOsName() const
{
    const auto text = readTextFile(m_sources.osReleasePath);
    if (text.has_value()) {
        const auto prettyName = parseOsReleasePrettyName(*text);
        if (prettyName.has_value()) {
            return *prettyName;
        }
    }

    MFLOG_DEBUG(kComponent,
                QStringLiteral("collectOsName"),
                QStringLiteral("os_release_fallback"),
                text.has_value() ? QStringLiteral("pretty_name_missing")
                                 : QStringLiteral("os_release_unreadable"),
                (nlohmann::json{{"path", m_sources.osReleasePath.toStdString()}}));
    return unameSysname();
}

std::string SnapshotCollector::collectKernel() const
{
    return QSysInfo::kernelVersion().toStdString();
}

std::string SnapshotCollector::collectHostname() const
{
    return QSysInfo::machineHostName().toStdString();
}

std::string SnapshotCollector::collectUptime() const
{
    const auto text = readTextFile(m_sources.statPath);
    const auto bootTime = text.has_value() ? parseBootTime(*text) : std::nullopt;
    if (bootTime.has_value()) {
        return formatUptime(QDateTime::currentSecsSinceEpoch() - *bootTime);
    }

    MFLOG_DEBUG(kComponent,
                QStringLiteral("collectUptime"),
                QStringLiteral("boot_time_fallback"),
                QStringLiteral("btime_unavailable"),
                (nlohmann::json{{"path", m_sources.statPath.toStdString()}}));

    struct sysinfo info {};
    if (sysinfo(&info) != 0) {
        return formatUptime(0);
    }
    return formatUptime(static_cast<std::int64_t>(info.uptime));
}

std::string SnapshotCollector::collectCpuName() const
{
    const auto text = readTextFile(m_sources.cpuInfoPath);
    if (!text.has_value()) {
        MFLOG_DEBUG(kComponent,
                    QStringLiteral("collectCpuName"),
                    QStringLiteral("cpuinfo_unreadable"),
                    QStringLiteral("open_failed"),
                    (nlohmann::json{{"path", m_sources.cpuInfoPath.toStdString()}}));
        return "Unknown";
    }
    return parseCpuModelName(*text).value_or("Unknown");
}

GpuProbe SnapshotCollector::probeGpu() const
{
    GpuProbe probe;

    const CommandResult result =
        runCommand(m_sources.pciProgram, {}, m_sources.pciTimeoutMs);
    if (!result.completed || result.exitCode != 0) {
        MFLOG_WARN(kComponent,
                   QStringLiteral("probeGpu"),
                   QStringLiteral("gpu_probe_failed"),
                   result.completed ? QStringLiteral("non_zero_exit") : result.error,
                   (nlohmann::json{{"program", m_sources.pciProgram.toStdString()},
                                   {"exitCode", result.exitCode}}));
        return probe;
    }

    probe.value = parsePciDisplayController(result.output.toStdString());
    probe.present = true;
    return probe;
}

std::string SnapshotCollector::collectMemory(bool percentMode) const
{
    const auto text = readTextFile(m_sources.memInfoPath);
    auto reading = text.has_value() ? parseMemInfo(*text) : std::nullopt;

    if (!reading.has_value()) {
        MFLOG_DEBUG(kComponent,
                    QStringLiteral("collectMemory"),
                    QStringLiteral("meminfo_fallback"),
                    QStringLiteral("meminfo_unavailable"),
                    (nlohmann::json{{"path", m_sources.memInfoPath.toStdString()}}));

        struct sysinfo info {};
        MemoryReading fallback;
        if (sysinfo(&info) == 0 && info.totalram > 0) {
            const std::uint64_t unit = info.mem_unit;
            fallback.totalBytes = static_cast<std::uint64_t>(info.totalram) * unit;
            fallback.usedBytes = static_cast<std::uint64_t>(
                                     info.totalram - info.freeram - info.bufferram)
                * unit;
            fallback.percent = roundToOneDecimal(
                static_cast<double>(fallback.usedBytes)
                / static_cast<double>(fallback.totalBytes) * 100.0);
        }
        reading = fallback;
    }

    return formatMemory(*reading, percentMode);
}

std::string SnapshotCollector::collectDisk(bool enabled) const
{
    if (!enabled) {
        return "N/A";
    }

    struct statvfs stat {};
    const QByteArray mountPoint = QFile::encodeName(m_sources.diskMountPoint);
    if (statvfs(mountPoint.constData(), &stat) != 0) {
        MFLOG_WARN(kComponent,
                   QStringLiteral("collectDisk"),
                   QStringLiteral("statvfs_failed"),
                   QStringLiteral("mount_point_unreadable"),
                   (nlohmann::json{{"mountPoint", mountPoint.toStdString()}}));
        return "N/A";
    }

    const std::uint64_t blockSize = stat.f_frsize;
    const std::uint64_t total = static_cast<std::uint64_t>(stat.f_blocks) * blockSize;
    const std::uint64_t used =
        static_cast<std::uint64_t>(stat.f_blocks - stat.f_bfree) * blockSize;
    const std::uint64_t available = static_cast<std::uint64_t>(stat.f_bavail) * blockSize;

    // Reserved blocks count neither as used nor as available.
    DiskReading reading;
    reading.totalBytes = total;
    reading.usedBytes = used;
    if (used + available > 0) {
        reading.percent = roundToOneDecimal(
            static_cast<double>(used) / static_cast<double>(used + available) * 100.0);
    }
    return formatDisk(reading);
}

std::string SnapshotCollector::collectTemperature(bool enabled) const
{
    if (!enabled) {
        return "N/A";
    }

    if (!QFileInfo(m_sources.hwmonRoot).isDir()) {
        MFLOG_DEBUG(kComponent,
                    QStringLiteral("collectTemperature"),
                    QStringLiteral("sensors_unsupported"),
                    QStringLiteral("hwmon_missing"),
                    (nlohmann::json{{"path", m_sources.hwmonRoot.toStdString()}}));
        return kTemperatureUnsupported;
    }

    const auto milliCelsius = readCoreTempMilliCelsius();
    if (!milliCelsius.has_value()) {
        MFLOG_DEBUG(kComponent,
                    QStringLiteral("collectTemperature"),
                    QStringLiteral("coretemp_missing"),
                    QStringLiteral("no_coretemp_reading"),
                    nlohmann::json::object());
        return "N/A";
    }
    return formatTemperature(*milliCelsius);
}

std::optional<std::int64_t> SnapshotCollector::readCoreTempMilliCelsius() const
{
    const QDir root(m_sources.hwmonRoot);
    const QStringList chips =
        root.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);

    for (const QString &chip : chips) {
        const QDir chipDir(root.filePath(chip));
        const auto name = readTextFile(chipDir.filePath(QStringLiteral("name")));
        if (!name.has_value()
            || QString::fromStdString(*name).trimmed() != QStringLiteral("coretemp")) {
            continue;
        }

        // Plain name order: temp10_input comes before temp2_input.
        const QStringList inputs = chipDir.entryList(
            {QStringLiteral("temp*_input")}, QDir::Files | QDir::System, QDir::Name);
        for (const QString &input : inputs) {
            const auto raw = readTextFile(chipDir.filePath(input));
            if (!raw.has_value()) {
                continue;
            }
            bool ok = false;
            const qlonglong value = QString::fromStdString(*raw).trimmed().toLongLong(&ok);
            if (ok) {
                return static_cast<std::int64_t>(value);
            }
        }
    }

    return std::nullopt;
}

} // namespace mountfetch
