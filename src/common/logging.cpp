#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

#include <iostream>

#include "common/paths.hpp"

namespace tally::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

bool g_traceEnabled = false;
QString g_processName;

// One CLI invocation at a time; the clock's timers run on the same thread.
QString g_command;
QString g_runId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString processName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("tally");
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

} // namespace

void initLogging(const QString &name, bool traceEnabled)
{
    g_processName = name;
    g_traceEnabled = traceEnabled;
}

QString logFilePath()
{
    return dataDirPath() + QStringLiteral("/logs/") + processName() + QStringLiteral(".log");
}

CommandScope::CommandScope(const QString &command)
    : m_runId(QUuid::createUuid().toString(QUuid::WithoutBraces))
    , m_prevCommand(g_command)
    , m_prevRunId(g_runId)
{
    g_command = command;
    g_runId = m_runId;
}

CommandScope::~CommandScope()
{
    g_command = m_prevCommand;
    g_runId = m_prevRunId;
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !g_traceEnabled) {
        return;
    }

    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()}
    };
    if (!g_command.isEmpty()) {
        payload["command"] = g_command.toStdString();
        payload["run"] = g_runId.toStdString();
    }
    payload["context"] = context;

    if (g_traceEnabled) {
        std::cerr << "[trace] " << levelName(level) << ' ' << component.toStdString()
                  << "::" << where.toStdString() << ' ' << what.toStdString() << ' '
                  << context.dump() << std::endl;
    }

    const QString path = logFilePath();
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        // Unwritable log directory: fall back to stderr.
        std::cerr << payload.dump() << std::endl;
        return;
    }
    file.write(QByteArray::fromStdString(payload.dump()));
    file.write("\n");
}

} // namespace tally::logging
