#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace mountfetch::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

QString logsDirPath();
QString logFilePath(const QString &processName, const QString &suffix);

// Structured log event, written as one JSON object per line.
// "what" is a short snake_case tag, "why" the condition that caused it.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();

} // namespace mountfetch::logging

#define MFLOG_DEBUG(component, where, what, why, ctxJson) \
    ::mountfetch::logging::logEvent(::mountfetch::logging::LogLevel::Debug, \
                                    ::mountfetch::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (ctxJson))

#define MFLOG_INFO(component, where, what, why, ctxJson) \
    ::mountfetch::logging::logEvent(::mountfetch::logging::LogLevel::Info, \
                                    ::mountfetch::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (ctxJson))

#define MFLOG_WARN(component, where, what, why, ctxJson) \
    ::mountfetch::logging::logEvent(::mountfetch::logging::LogLevel::Warn, \
                                    ::mountfetch::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (ctxJson))

#define MFLOG_ERROR(component, where, what, why, ctxJson) \
    ::mountfetch::logging::logEvent(::mountfetch::logging::LogLevel::Error, \
                                    ::mountfetch::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (ctxJson))
