#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace fleetsync::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Lines below this level are dropped. Debug lines additionally need trace.
void setMinimumLevel(LogLevel level);
LogLevel minimumLevel();

// Mirror every written line to stderr (foreground daemon mode).
void setStderrEcho(bool enabled);

LogLevel parseLogLevel(const QString &value, LogLevel fallback);

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId(const QString &prefix);

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString logsDirPath();
QString defaultProcessName();
QString defaultWho();

} // namespace fleetsync::logging

#define FSLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::fleetsync::logging::logEvent(::fleetsync::logging::LogLevel::Debug, \
                                   ::fleetsync::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define FSLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::fleetsync::logging::logEvent(::fleetsync::logging::LogLevel::Info, \
                                   ::fleetsync::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define FSLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::fleetsync::logging::logEvent(::fleetsync::logging::LogLevel::Warn, \
                                   ::fleetsync::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define FSLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::fleetsync::logging::logEvent(::fleetsync::logging::LogLevel::Error, \
                                   ::fleetsync::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
