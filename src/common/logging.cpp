#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <iostream>

namespace mountfetch::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

bool g_traceEnabled = false;
QString g_processName;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeLine(const QString &path, const QByteArray &line)
{
    QDir().mkpath(logsDirPath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::cerr << line.constData() << std::endl;
        return;
    }

    file.write(line);
    file.write("\n");
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    g_processName = processName;
    g_traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/mountfetch/logs");
    }
    return home + QStringLiteral("/.local/share/mountfetch/logs");
}

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("mountfetch")
        : processName;
    return logsDirPath() + QDir::separator() + base + suffix;
}

QString defaultProcessName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("mountfetch");
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !g_traceEnabled) {
        return;
    }

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", process.toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"context", context}
    };

    const QByteArray line = QByteArray::fromStdString(payload.dump());
    writeLine(logFilePath(process, QStringLiteral(".log")), line);

    if (g_traceEnabled) {
        writeLine(logFilePath(process, QStringLiteral("-trace.log")), line);
    }
}

} // namespace mountfetch::logging
