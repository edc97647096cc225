#pragma once

#include <QString>

namespace tally {

// Environment-driven locations. Each override variable wins over the default.
//   TALLY_FILE        ledger file (default $HOME/.timelog.json)
//   TALLY_EXPORT_DIR  CSV export base (default $HOME/Documents/Time Sheet Reports)
//   TALLY_TRACE=1     trace logging
QString homeDirPath();
QString dataDirPath();
QString ledgerFilePath();
QString exportBaseDirPath();
bool traceRequestedByEnvironment();

QString expandHome(const QString &path);

} // namespace tally
