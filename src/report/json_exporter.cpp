#include "report/json_exporter.hpp"

#include <QFile>

#include "common/logging.hpp"

namespace mountfetch {

nlohmann::ordered_json snapshotToExportJson(const SystemSnapshot &snapshot)
{
    return nlohmann::ordered_json{
        {"OS", snapshot.osName},
        {"Kernel", snapshot.kernel},
        {"Hostname", snapshot.hostname},
        {"Uptime", snapshot.uptime},
        {"CPU", snapshot.cpuName},
        {"RAM", snapshot.ramInfo},
        {"GPU", snapshot.gpuName},
        {"Disk", snapshot.diskInfo},
        {"Temp", snapshot.temperature}
    };
}

bool exportSnapshot(const SystemSnapshot &snapshot,
                    const QString &path,
                    QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot write %1: %2")
                                .arg(path, file.errorString());
        }
        MFLOG_ERROR(QStringLiteral("JsonExporter"),
                    QStringLiteral("exportSnapshot"),
                    QStringLiteral("export_open_failed"),
                    file.errorString(),
                    (nlohmann::json{{"path", path.toStdString()}}));
        return false;
    }

    // dump() rejects invalid UTF-8 by default; values come from arbitrary files.
    const std::string text = snapshotToExportJson(snapshot).dump(
        2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    const QByteArray data = QByteArray::fromStdString(text);
    if (file.write(data) != data.size()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("short write to %1: %2")
                                .arg(path, file.errorString());
        }
        MFLOG_ERROR(QStringLiteral("JsonExporter"),
                    QStringLiteral("exportSnapshot"),
                    QStringLiteral("export_write_failed"),
                    file.errorString(),
                    (nlohmann::json{{"path", path.toStdString()}}));
        return false;
    }

    MFLOG_INFO(QStringLiteral("JsonExporter"),
               QStringLiteral("exportSnapshot"),
               QStringLiteral("export_written"),
               QStringLiteral("export_requested"),
               (nlohmann::json{{"path", path.toStdString()},
                               {"bytes", data.size()}}));
    return true;
}

} // namespace mountfetch
