#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace engage::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory the log files are written to ($HOME/.local/share/engage/logs).
QString logsDirPath();

// Thread-local correlation support for linking the log events of one sync attempt.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

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

QString defaultProcessName();
QString defaultWho();

} // namespace engage::logging

#define ELOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::engage::logging::logEvent(::engage::logging::LogLevel::Debug, \
                                ::engage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ELOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::engage::logging::logEvent(::engage::logging::LogLevel::Info, \
                                ::engage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ELOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::engage::logging::logEvent(::engage::logging::LogLevel::Warn, \
                                ::engage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ELOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::engage::logging::logEvent(::engage::logging::LogLevel::Error, \
                                ::engage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
