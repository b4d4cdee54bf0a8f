#include "common/process_utils.hpp"

#include <QProcess>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace mountfetch {

CommandResult runCommand(const QString &program,
                         const QStringList &arguments,
                         int timeoutMs)
{
    CommandResult result;

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted(timeoutMs)) {
        result.error = process.errorString();
        MFLOG_DEBUG(QStringLiteral("ProcessUtils"),
                    QStringLiteral("runCommand"),
                    QStringLiteral("process_start_failed"),
                    result.error,
                    (nlohmann::json{{"program", program.toStdString()}}));
        return result;
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        result.error = process.errorString();
        process.kill();
        process.waitForFinished();
        MFLOG_DEBUG(QStringLiteral("ProcessUtils"),
                    QStringLiteral("runCommand"),
                    QStringLiteral("process_timeout"),
                    result.error,
                    (nlohmann::json{{"program", program.toStdString()},
                                    {"timeoutMs", timeoutMs}}));
        return result;
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        result.error = process.errorString();
        return result;
    }

    result.completed = true;
    result.exitCode = process.exitCode();
    result.output = QString::fromUtf8(process.readAllStandardOutput());
    return result;
}

} // namespace mountfetch
