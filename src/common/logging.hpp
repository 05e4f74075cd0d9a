#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace jobhist::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// $JOBHIST_LOG_DIR, or ~/.local/share/jobhist/logs.
QString logsDirPath();

// Structured log event, one JSON object per line. Debug events are only
// written when trace is enabled.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();

} // namespace jobhist::logging

#define JLOG_DEBUG(component, where, what, why, ctxJson) \
    ::jobhist::logging::logEvent(::jobhist::logging::LogLevel::Debug, \
                                 ::jobhist::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (ctxJson))

#define JLOG_INFO(component, where, what, why, ctxJson) \
    ::jobhist::logging::logEvent(::jobhist::logging::LogLevel::Info, \
                                 ::jobhist::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (ctxJson))

#define JLOG_WARN(component, where, what, why, ctxJson) \
    ::jobhist::logging::logEvent(::jobhist::logging::LogLevel::Warn, \
                                 ::jobhist::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (ctxJson))

#define JLOG_ERROR(component, where, what, why, ctxJson) \
    ::jobhist::logging::logEvent(::jobhist::logging::LogLevel::Error, \
                                 ::jobhist::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (ctxJson))
