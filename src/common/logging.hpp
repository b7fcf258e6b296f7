#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace tongchi::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Trace mode enables DEBUG lines and the parallel <process>-trace.log;
// otherwise TONGCHI_LOG_LEVEL may raise the threshold above INFO.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

LogLevel parseLogLevel(const QString &text, LogLevel fallback);
void setMinimumLevel(LogLevel level);
LogLevel minimumLevel();

// Thread-local correlation support for linking the log lines of one load,
// task run or process execution.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId(const QString &prefix);

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

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
// $TONGCHI_LOG_DIR, else $HOME/.local/share/tongchi/logs.
QString logsDirPath();

} // namespace tongchi::logging

#define TLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::tongchi::logging::logEvent(::tongchi::logging::LogLevel::Debug, \
                                 ::tongchi::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::tongchi::logging::logEvent(::tongchi::logging::LogLevel::Info, \
                                 ::tongchi::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::tongchi::logging::logEvent(::tongchi::logging::LogLevel::Warn, \
                                 ::tongchi::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::tongchi::logging::logEvent(::tongchi::logging::LogLevel::Error, \
                                 ::tongchi::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
