#pragma once

#include <cstdint>
#include <string>

#include <QString>

namespace mountfetch {

struct ReportOptions {
    bool ramPercent = false;
    bool includeDisk = false;
    bool includeTemperature = false;
    QString exportPath;
};

// Outcome of the PCI display controller probe. A failed probe keeps the
// default value but is not shown on the console.
struct GpuProbe {
    std::string value = "N/A";
    bool present = false;
};

struct MemoryReading {
    std::uint64_t totalBytes = 0;
    std::uint64_t usedBytes = 0;
    double percent = 0.0;
};

struct DiskReading {
    std::uint64_t totalBytes = 0;
    std::uint64_t usedBytes = 0;
    double percent = 0.0;
};

struct SystemSnapshot {
    std::string osName;
    std::string kernel;
    std::string hostname;
    std::string uptime;
    std::string ramInfo;
    std::string cpuName = "Unknown";
    std::string gpuName = "N/A";
    bool gpuPresent = false;
    std::string diskInfo = "N/A";
    std::string temperature = "N/A";
};

// Locations of every OS facility read by SnapshotCollector.
struct CollectorSources {
    QString osReleasePath = QStringLiteral("/etc/os-release");
    QString cpuInfoPath = QStringLiteral("/proc/cpuinfo");
    QString memInfoPath = QStringLiteral("/proc/meminfo");
    QString statPath = QStringLiteral("/proc/stat");
    QString hwmonRoot = QStringLiteral("/sys/class/hwmon");
    QString pciProgram = QStringLiteral("lspci");
    QString diskMountPoint = QStringLiteral("/");
    int pciTimeoutMs = 10000;
};

} // namespace mountfetch
