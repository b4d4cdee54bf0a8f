#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace mountfetch {

/**
 * Reads the local system and maps every facility to a display string.
 *
 * Each collect* method is independent and never throws: missing data is
 * mapped to the documented fallback ("Unknown", "N/A", the kernel name,
 * "Unsupported on this system."). Sources default to the standard Linux
 * locations and can be redirected for tests.
 */
class SnapshotCollector
{
public:
    SnapshotCollector() = default;
    explicit SnapshotCollector(CollectorSources sources);

    SystemSnapshot collect(const ReportOptions &options) const;

    std::string collectOsName() const;
    std::string collectKernel() const;
    std::string collectHostname() const;
    std::string collectUptime() const;
    std::string collectCpuName() const;
    GpuProbe probeGpu() const;
    std::string collectMemory(bool percentMode) const;
    std::string collectDisk(bool enabled) const;
    std::string collectTemperature(bool enabled) const;

private:
    std::optional<std::int64_t> readCoreTempMilliCelsius() const;

    CollectorSources m_sources;
};

} // namespace mountfetch
