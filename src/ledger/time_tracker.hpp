#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common/models.hpp"
#include "ledger/ledger_store.hpp"

namespace tally {

struct StartResult {
    bool started = false;
    // The newly opened entry, or the one already running when started is false.
    LedgerEntry entry;
};

/**
 * State transitions over the ledger. Each call loads a fresh snapshot,
 * applies one change and saves it back. At most one entry (the most recent)
 * is open at any time.
 */
class TimeTracker {
public:
    explicit TimeTracker(const LedgerStore &store);

    std::optional<LedgerEntry> activeEntry() const;

    StartResult start(const std::string &project, TimePoint now);

    // Closes the open entry. Returns std::nullopt when nothing is running,
    // so every termination path may call it.
    std::optional<LedgerEntry> stop(TimePoint now);

    LedgerEntry log(const std::string &project,
                    std::chrono::seconds duration,
                    TimePoint now);

private:
    const LedgerStore &m_store;
};

// Sets end, duration_seconds and duration on an open entry.
void closeEntry(LedgerEntry &entry, TimePoint end);

} // namespace tally
