#pragma once

#include <QString>
#include <QStringList>

#include "collector/snapshot_collector.hpp"
#include "common/models.hpp"

namespace mountfetch {

class FetchCli
{
public:
    FetchCli() = default;
    explicit FetchCli(CollectorSources sources);

    // Parse flags, collect, print the report and export when asked.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    bool parseOptions(const QStringList &args, ReportOptions *options, int *exitCode);
    int exportReport(const SystemSnapshot &snapshot, const QString &path);

    SnapshotCollector m_collector;
};

} // namespace mountfetch
