#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace tongchi::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kKeptRotations = 3;

struct LoggerState {
    std::mutex mutex;
    QString processName;
    bool trace = false;
    LogLevel minimum = LogLevel::Info;
    bool mirrorToStderr = false;
    QString who;
};

LoggerState &state()
{
    static LoggerState instance;
    return instance;
}

thread_local QString t_corrId;

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

// .log -> .log.1 -> .log.2 ...; the oldest rotation is dropped.
void rotateIfNeeded(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    QFile::remove(path + QStringLiteral(".%1").arg(kKeptRotations));
    for (int i = kKeptRotations - 1; i >= 1; --i) {
        const QString from = path + QStringLiteral(".%1").arg(i);
        if (QFile::exists(from)) {
            QFile::rename(from, path + QStringLiteral(".%1").arg(i + 1));
        }
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

bool appendLine(const QString &path, const QByteArray &line)
{
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    file.write(line);
    file.write("\n");
    return true;
}

// Pool workers are unnamed; fall back to the native id.
QString threadLabel()
{
    QThread *thread = QThread::currentThread();
    if (thread && !thread->objectName().isEmpty()) {
        return thread->objectName();
    }
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

QString hostWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

} // namespace

LogLevel parseLogLevel(const QString &text, LogLevel fallback)
{
    const QString level = text.trimmed().toLower();
    if (level == QLatin1String("debug")) {
        return LogLevel::Debug;
    }
    if (level == QLatin1String("info")) {
        return LogLevel::Info;
    }
    if (level == QLatin1String("warn") || level == QLatin1String("warning")) {
        return LogLevel::Warn;
    }
    if (level == QLatin1String("error")) {
        return LogLevel::Error;
    }
    return fallback;
}

QString logsDirPath()
{
    const QString overridden = qEnvironmentVariable("TONGCHI_LOG_DIR");
    if (!overridden.isEmpty()) {
        return overridden;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/tongchi/logs");
    }
    return home + QStringLiteral("/.local/share/tongchi/logs");
}

void initLogging(const QString &processName, bool traceEnabled)
{
    LoggerState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.processName = processName;
    s.trace = traceEnabled;
    s.minimum = traceEnabled
        ? LogLevel::Debug
        : parseLogLevel(qEnvironmentVariable("TONGCHI_LOG_LEVEL"), LogLevel::Info);
    s.mirrorToStderr = qEnvironmentVariableIntValue("TONGCHI_LOG_STDERR") == 1;
}

bool isTraceEnabled()
{
    LoggerState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.trace;
}

void setMinimumLevel(LogLevel level)
{
    LoggerState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.minimum = level;
}

LogLevel minimumLevel()
{
    LoggerState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.minimum;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

QString newCorrelationId(const QString &prefix)
{
    return prefix + QLatin1Char('-')
        + QUuid::createUuid().toString(QUuid::WithoutBraces).left(8);
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        LoggerState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.processName.isEmpty()) {
            return s.processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("tongchi");
}

QString defaultWho()
{
    LoggerState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.who.isEmpty()) {
        s.who = hostWho();
    }
    return s.who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    LoggerState &s = state();
    bool trace = false;
    bool mirror = false;
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if ((level == LogLevel::Debug && !s.trace) || level < s.minimum) {
            return;
        }
        trace = s.trace;
        mirror = s.mirrorToStderr;
    }

    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", process.toStdString()},
        {"thread", threadLabel().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString dir = logsDirPath();
    const QString base = dir + QDir::separator() + process;

    std::lock_guard<std::mutex> lock(s.mutex);
    QDir().mkpath(dir);
    const bool written = appendLine(base + QStringLiteral(".log"), line);
    if (trace) {
        appendLine(base + QStringLiteral("-trace.log"), line);
    }
    if (!written || (mirror && level >= LogLevel::Warn)) {
        std::fprintf(stderr, "%s\n", line.constData());
    }
}

} // namespace tongchi::logging
