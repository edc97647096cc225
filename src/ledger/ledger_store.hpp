#pragma once

#include <vector>

#include <QString>

#include "common/models.hpp"

namespace tally {

// LedgerStore owns the JSON ledger file: a flat array of interval records
// replaced as a whole on every save.
class LedgerStore {
public:
    // Uses ledgerFilePath() (TALLY_FILE override, then $HOME/.timelog.json).
    LedgerStore();
    explicit LedgerStore(const QString &path);

    const QString &path() const;

    // Missing file: empty ledger. Corrupt file: moved to <path>.bak, empty ledger.
    std::vector<LedgerEntry> load() const;

    // Atomic replace of the whole file. Throws std::runtime_error on failure.
    void save(const std::vector<LedgerEntry> &entries) const;

    // Deletes the ledger file; false when there was nothing to delete.
    bool clear() const;

private:
    void moveAside(const QString &reason) const;

    QString m_path;
};

} // namespace tally
