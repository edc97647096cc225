#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace tally::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Call once from main(). Trace mode keeps debug events and echoes every
// event to stderr.
void initLogging(const QString &processName, bool traceEnabled);

// $HOME/.local/share/tally/logs/<process>.log
QString logFilePath();

// Tags every event logged while it is alive with the command name and a
// fresh run id, so one invocation can be picked out of the shared log.
class CommandScope {
public:
    explicit CommandScope(const QString &command);
    ~CommandScope();

    CommandScope(const CommandScope &) = delete;
    CommandScope &operator=(const CommandScope &) = delete;

    const QString &runId() const { return m_runId; }

private:
    QString m_runId;
    QString m_prevCommand;
    QString m_prevRunId;
};

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const nlohmann::json &context = nlohmann::json::object());

} // namespace tally::logging

#define TLOG_DEBUG(component, where, what, ctxJson) \
    ::tally::logging::logEvent(::tally::logging::LogLevel::Debug, \
                               (component), (where), (what), (ctxJson))

#define TLOG_INFO(component, where, what, ctxJson) \
    ::tally::logging::logEvent(::tally::logging::LogLevel::Info, \
                               (component), (where), (what), (ctxJson))

#define TLOG_WARN(component, where, what, ctxJson) \
    ::tally::logging::logEvent(::tally::logging::LogLevel::Warn, \
                               (component), (where), (what), (ctxJson))

#define TLOG_ERROR(component, where, what, ctxJson) \
    ::tally::logging::logEvent(::tally::logging::LogLevel::Error, \
                               (component), (where), (what), (ctxJson))
