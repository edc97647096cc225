#include "common/paths.hpp"

#include <QDir>

namespace tally {

namespace {

constexpr const char *kLedgerFileEnv = "TALLY_FILE";
constexpr const char *kExportDirEnv = "TALLY_EXPORT_DIR";
constexpr const char *kTraceEnv = "TALLY_TRACE";

} // namespace

QString homeDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".");
    }
    return home;
}

QString dataDirPath()
{
    return homeDirPath() + QStringLiteral("/.local/share/tally");
}

QString expandHome(const QString &path)
{
    if (path == QStringLiteral("~")) {
        return homeDirPath();
    }
    if (path.startsWith(QStringLiteral("~/"))) {
        return homeDirPath() + path.mid(1);
    }
    return path;
}

QString ledgerFilePath()
{
    const QString override = qEnvironmentVariable(kLedgerFileEnv);
    if (!override.isEmpty()) {
        return QDir::cleanPath(expandHome(override));
    }
    return homeDirPath() + QStringLiteral("/.timelog.json");
}

QString exportBaseDirPath()
{
    const QString override = qEnvironmentVariable(kExportDirEnv);
    if (!override.isEmpty()) {
        return QDir::cleanPath(expandHome(override));
    }
    return homeDirPath() + QStringLiteral("/Documents/Time Sheet Reports");
}

bool traceRequestedByEnvironment()
{
    return qEnvironmentVariableIntValue(kTraceEnv) == 1;
}

} // namespace tally
