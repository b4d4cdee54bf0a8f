#pragma once

#include <array>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace mountfetch {

// Mountain glyph printed to the left of the report, one entry per row.
extern const std::array<const char *, 7> kBannerArt;

/**
 * Build the report rows in display order:
 * OS, Kernel, Hostname, Uptime, RAM, CPU, [GPU], Disk, Temp, "", "".
 * The GPU row is only emitted when the probe succeeded.
 */
std::vector<std::string> buildDisplayLines(const SystemSnapshot &snapshot);

/**
 * Pair rows with banner lines by index. Banner lines without a row are
 * printed alone, rows past the end of the banner are printed without art.
 * The result starts and ends with an empty line.
 */
std::string renderBanner(const std::vector<std::string> &lines);

std::string renderReport(const SystemSnapshot &snapshot);

} // namespace mountfetch
