#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>

namespace engage::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;
constexpr const char *kRedacted = "[redacted]";

// Context keys whose values never reach a log file.
constexpr const char *kSensitiveKeys[] = {"authtoken", "authorization", "token", "password"};

std::atomic<bool> g_traceEnabled{false};
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

bool isSensitiveKey(std::string key)
{
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return std::any_of(std::begin(kSensitiveKeys), std::end(kSensitiveKeys),
                       [&key](const char *sensitive) { return key == sensitive; });
}

nlohmann::json redacted(const nlohmann::json &value)
{
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = isSensitiveKey(it.key()) ? nlohmann::json(kRedacted)
                                                     : redacted(it.value());
        }
        return out;
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto &item : value) {
            out.push_back(redacted(item));
        }
        return out;
    }
    return value;
}

// Open append handles per log file. Files are rotated in place
// (x.log -> x.log.1 -> ... -> x.log.N) once they pass the size limit.
class LogSink {
public:
    void reset(const QString &processName)
    {
        m_files.clear();
        m_processName = processName;
    }

    QString processName() const
    {
        return m_processName;
    }

    void write(const QString &path, const QByteArray &line)
    {
        QFile *file = fileFor(path);
        if (!file) {
            fprintf(stderr, "%s\n", line.constData());
            return;
        }
        file->write(line);
        file->write("\n");
        file->flush();
    }

private:
    QFile *fileFor(const QString &path)
    {
        auto it = m_files.find(path);
        if (it != m_files.end()) {
            // Reopen when the file was rotated or removed underneath us.
            if (!QFileInfo::exists(path)) {
                m_files.erase(it);
                it = m_files.end();
            } else if (it->second->size() >= kMaxLogSizeBytes) {
                m_files.erase(it);
                rotate(path);
                it = m_files.end();
            }
        }
        if (it != m_files.end()) {
            return it->second.get();
        }

        QDir().mkpath(logsDirPath());
        if (QFileInfo(path).size() >= kMaxLogSizeBytes) {
            rotate(path);
        }

        auto file = std::make_unique<QFile>(path);
        if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return nullptr;
        }
        QFile *raw = file.get();
        m_files.emplace(path, std::move(file));
        return raw;
    }

    static void rotate(const QString &path)
    {
        QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
        for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
            const QString from = path + QStringLiteral(".%1").arg(generation);
            if (QFile::exists(from)) {
                QFile::rename(from, path + QStringLiteral(".%1").arg(generation + 1));
            }
        }
        QFile::rename(path, path + QStringLiteral(".1"));
    }

    std::map<QString, std::unique_ptr<QFile>> m_files;
    QString m_processName;
};

std::mutex g_sinkMutex;

LogSink &sink()
{
    static LogSink instance;
    return instance;
}

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("engage")
        : processName;
    return logsDirPath() + QDir::separator() + base + suffix;
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/engage/logs");
    }
    return home + QStringLiteral("/.local/share/engage/logs");
}

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    sink().reset(processName);
    g_traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
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
        std::lock_guard<std::mutex> lock(g_sinkMutex);
        const QString name = sink().processName();
        if (!name.isEmpty()) {
            return name;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("engage");
}

QString defaultWho()
{
    // Worker threads log on every attempt; resolve the host once.
    static const QString who = []() {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname)) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return who;
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
    const bool trace = g_traceEnabled;
    if (level == LogLevel::Debug && !trace) {
        return;
    }

    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", redacted(context)}
    };

    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;

    std::lock_guard<std::mutex> lock(g_sinkMutex);
    sink().write(logFilePath(process, QStringLiteral(".log")), line);
    if (trace) {
        sink().write(logFilePath(process, QStringLiteral("-trace.log")), line);
    }
}

} // namespace engage::logging
