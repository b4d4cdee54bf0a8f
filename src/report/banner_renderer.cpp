#include "report/banner_renderer.hpp"

#include <algorithm>
#include <sstream>

namespace mountfetch {

const std::array<const char *, 7> kBannerArt = {
    "        ▲          ",
    "       ╱ ╲         ",
    "      ╱   ╲        ",
    "     ╱ ╱╲  ╲       ",
    "    ╱ ╱  ╲  ╲      ",
    "   ╱ ╱    ╲  ╲     ",
    "  ╱▁▁▁▁▁▁▁▁▁▁▁╲    ",
};

namespace {

std::string field(const char *label, const std::string &value)
{
    return std::string(label) + ": " + value;
}

} // namespace

std::vector<std::string> buildDisplayLines(const SystemSnapshot &snapshot)
{
    std::vector<std::string> lines;
    lines.reserve(11);

    lines.push_back(field("OS", snapshot.osName));
    lines.push_back(field("Kernel", snapshot.kernel));
    lines.push_back(field("Hostname", snapshot.hostname));
    lines.push_back(field("Uptime", snapshot.uptime));
    lines.push_back(field("RAM", snapshot.ramInfo));
    lines.push_back(field("CPU", snapshot.cpuName));

    if (snapshot.gpuPresent) {
        lines.push_back(field("GPU", snapshot.gpuName));
    }

    lines.push_back(field("Disk", snapshot.diskInfo));
    lines.push_back(field("Temp", snapshot.temperature));
    lines.emplace_back();
    lines.emplace_back();
    return lines;
}

std::string renderBanner(const std::vector<std::string> &lines)
{
    std::ostringstream out;
    out << '\n';

    const size_t rows = std::max(kBannerArt.size(), lines.size());
    for (size_t i = 0; i < rows; ++i) {
        if (i < kBannerArt.size()) {
            out << kBannerArt[i];
        }
        if (i < lines.size()) {
            out << lines[i];
        }
        out << '\n';
    }

    out << '\n';
    return out.str();
}

std::string renderReport(const SystemSnapshot &snapshot)
{
    return renderBanner(buildDisplayLines(snapshot));
}

} // namespace mountfetch
