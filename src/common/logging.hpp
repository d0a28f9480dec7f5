#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace hostprobe::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Mirror Warn/Error lines to stderr in addition to the log file.
void setStderrEcho(bool enabled);

// Structured log event, one JSON object per line.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString logsDirPath();
QString logFilePath(const QString &processName);

} // namespace hostprobe::logging

#define HLOG_DEBUG(component, where, what, ctxJson) \
    ::hostprobe::logging::logEvent(::hostprobe::logging::LogLevel::Debug, \
                                   (component), (where), (what), (ctxJson))

#define HLOG_INFO(component, where, what, ctxJson) \
    ::hostprobe::logging::logEvent(::hostprobe::logging::LogLevel::Info, \
                                   (component), (where), (what), (ctxJson))

#define HLOG_WARN(component, where, what, ctxJson) \
    ::hostprobe::logging::logEvent(::hostprobe::logging::LogLevel::Warn, \
                                   (component), (where), (what), (ctxJson))

#define HLOG_ERROR(component, where, what, ctxJson) \
    ::hostprobe::logging::logEvent(::hostprobe::logging::LogLevel::Error, \
                                   (component), (where), (what), (ctxJson))
