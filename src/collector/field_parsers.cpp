#include "collector/field_parsers.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include <vector>

namespace mountfetch {

namespace {

constexpr double kBytesPerGiB = 1024.0 * 1024.0 * 1024.0;
constexpr std::int64_t kSecondsPerDay = 86400;
constexpr std::int64_t kSecondsPerHour = 3600;
constexpr std::int64_t kSecondsPerMinute = 60;

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::vector<std::string> splitLines(const std::string &text)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string stripQuotes(const std::string &value)
{
    if (value.size() >= 2) {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' || first == '\'') && first == last) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

std::string toGiB(std::uint64_t bytes)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(2)
        << static_cast<double>(bytes) / kBytesPerGiB;
    return out.str();
}

} // namespace

double roundToOneDecimal(double value)
{
    return std::round(value * 10.0) / 10.0;
}

std::optional<std::string> parseOsReleasePrettyName(const std::string &text)
{
    for (const std::string &line : splitLines(text)) {
        const std::string cleaned = trim(line);
        const auto pos = cleaned.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        if (cleaned.substr(0, pos) != "PRETTY_NAME") {
            continue;
        }
        return stripQuotes(trim(cleaned.substr(pos + 1)));
    }
    return std::nullopt;
}

std::optional<std::string> parseCpuModelName(const std::string &text)
{
    for (const std::string &line : splitLines(text)) {
        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        if (trim(line.substr(0, pos)) == "model name") {
            return trim(line.substr(pos + 1));
        }
    }
    return std::nullopt;
}

std::string parsePciDisplayController(const std::string &text)
{
    for (const std::string &line : splitLines(text)) {
        if (line.find("VGA compatible controller") == std::string::npos
            && line.find("3D controller") == std::string::npos) {
            continue;
        }

        // Segment 0 is the bus, segment 1 slot and class, segment 2 the device.
        // An empty trailing segment is kept, so "...controller:" yields "".
        std::vector<std::string> segments;
        std::string::size_type start = 0;
        while (true) {
            const auto colon = line.find(':', start);
            segments.push_back(line.substr(start, colon - start));
            if (colon == std::string::npos) {
                break;
            }
            start = colon + 1;
        }
        if (segments.size() < 3) {
            continue;
        }
        return trim(segments[2]);
    }
    return "N/A";
}

std::optional<std::int64_t> parseBootTime(const std::string &text)
{
    for (const std::string &line : splitLines(text)) {
        if (line.rfind("btime", 0) != 0) {
            continue;
        }
        try {
            return static_cast<std::int64_t>(std::stoll(trim(line.substr(5))));
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<MemoryReading> parseMemInfo(const std::string &text)
{
    std::map<std::string, std::uint64_t> fieldsKb;
    for (const std::string &line : splitLines(text)) {
        std::istringstream stream(line);
        std::string key;
        std::uint64_t value = 0;
        if (!(stream >> key >> value)) {
            continue;
        }
        if (!key.empty() && key.back() == ':') {
            key.pop_back();
        }
        fieldsKb[key] = value;
    }

    const auto totalIt = fieldsKb.find("MemTotal");
    if (totalIt == fieldsKb.end() || totalIt->second == 0) {
        return std::nullopt;
    }

    auto field = [&fieldsKb](const char *name) -> std::int64_t {
        const auto it = fieldsKb.find(name);
        return it == fieldsKb.end() ? 0 : static_cast<std::int64_t>(it->second);
    };

    const std::int64_t total = field("MemTotal");
    const std::int64_t free = field("MemFree");
    const std::int64_t cached = field("Cached") + field("SReclaimable");
    std::int64_t used = total - free - field("Buffers") - cached;
    if (used < 0) {
        used = total - free;
    }

    // Kernels before 3.14 have no MemAvailable; approximate it.
    const std::int64_t available = fieldsKb.count("MemAvailable") != 0
        ? field("MemAvailable")
        : free + field("Buffers") + cached;

    MemoryReading reading;
    reading.totalBytes = static_cast<std::uint64_t>(total) * 1024ULL;
    reading.usedBytes = static_cast<std::uint64_t>(used) * 1024ULL;
    reading.percent = roundToOneDecimal(
        static_cast<double>(total - available) / static_cast<double>(total) * 100.0);
    return reading;
}

std::string formatUptime(std::int64_t seconds)
{
    if (seconds < 0) {
        seconds = 0;
    }
    const std::int64_t days = seconds / kSecondsPerDay;
    seconds %= kSecondsPerDay;
    const std::int64_t hours = seconds / kSecondsPerHour;
    seconds %= kSecondsPerHour;
    const std::int64_t minutes = seconds / kSecondsPerMinute;
    seconds %= kSecondsPerMinute;

    std::ostringstream out;
    if (days > 0) {
        out << days << "d ";
    }
    out << hours << "h " << minutes << "m " << seconds << "s";
    return out.str();
}

std::string formatPercent(double percent)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << roundToOneDecimal(percent);
    return out.str();
}

std::string formatMemory(const MemoryReading &reading, bool percentMode)
{
    if (percentMode) {
        return formatPercent(reading.percent) + "%";
    }
    return toGiB(reading.usedBytes) + "/" + toGiB(reading.totalBytes) + " Go";
}

std::string formatDisk(const DiskReading &reading)
{
    return toGiB(reading.usedBytes) + "/" + toGiB(reading.totalBytes) + " Go ("
        + formatPercent(reading.percent) + "%)";
}

std::string formatTemperature(std::int64_t milliCelsius)
{
    const bool negative = milliCelsius < 0;
    const std::uint64_t magnitude = negative
        ? 0 - static_cast<std::uint64_t>(milliCelsius)
        : static_cast<std::uint64_t>(milliCelsius);

    std::string fraction = std::to_string(magnitude % 1000);
    fraction.insert(0, 3 - fraction.size(), '0');
    while (fraction.size() > 1 && fraction.back() == '0') {
        fraction.pop_back();
    }

    return (negative ? "-" : "") + std::to_string(magnitude / 1000) + "."
        + fraction + "°C";
}

} // namespace mountfetch
