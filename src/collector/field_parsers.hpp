#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace mountfetch {

/**
 * Text parsers for the kernel and userland descriptors read by the
 * collector. They take file or command output as-is and never throw.
 */

// PRETTY_NAME value of an os-release file, quotes stripped.
std::optional<std::string> parseOsReleasePrettyName(const std::string &text);

// Value of the first "model name" line of /proc/cpuinfo.
std::optional<std::string> parseCpuModelName(const std::string &text);

/**
 * Scan lspci output for the first display controller line
 * ("VGA compatible controller" or "3D controller") and return the third
 * colon-separated segment, e.g.
 *   00:02.0 VGA compatible controller: Intel Corporation UHD Graphics 620
 * yields "Intel Corporation UHD Graphics 620".
 *
 * Returns "N/A" when no line matches.
 */
std::string parsePciDisplayController(const std::string &text);

// Boot timestamp (seconds since epoch) from the btime line of /proc/stat.
std::optional<std::int64_t> parseBootTime(const std::string &text);

/**
 * Parse /proc/meminfo. Used memory follows the procps definition
 * (total - free - buffers - cached - sreclaimable); the percent is derived
 * from MemAvailable and rounded to one decimal.
 */
std::optional<MemoryReading> parseMemInfo(const std::string &text);

// "{d}d {h}h {m}m {s}s", the day part only when at least one day elapsed.
std::string formatUptime(std::int64_t seconds);

std::string formatMemory(const MemoryReading &reading, bool percentMode);
std::string formatDisk(const DiskReading &reading);
std::string formatTemperature(std::int64_t milliCelsius);

// Percent with a single decimal, as reported by the OS readers.
std::string formatPercent(double percent);

double roundToOneDecimal(double value);

} // namespace mountfetch
