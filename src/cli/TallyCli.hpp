#pragma once

#include <optional>

#include <QDate>
#include <QString>
#include <QStringList>

namespace tally {

class TallyCli
{
public:
    // CLI dispatcher for tracking and reporting commands.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Each subcommand samples the clock once and works on one ledger snapshot.
    int runStart(const QStringList &args);
    int runStop(const QStringList &args);
    int runLog(const QStringList &args);
    int runReport(const QStringList &args);
    int runClear(const QStringList &args);

    int dispatch(const QString &command, const QStringList &args);

    std::optional<QDate> parseMonth(const QString &value) const;
};

} // namespace tally
