#pragma once

#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace mountfetch {

// Export payload with the keys OS, Kernel, Hostname, Uptime, CPU, RAM, GPU,
// Disk and Temp. GPU is written even when the probe failed.
nlohmann::ordered_json snapshotToExportJson(const SystemSnapshot &snapshot);

// Write the export payload to path, replacing any existing file.
// On failure returns false and fills errorMessage.
bool exportSnapshot(const SystemSnapshot &snapshot,
                    const QString &path,
                    QString *errorMessage);

} // namespace mountfetch
