#pragma once

#include <cstddef>
#include <vector>

#include "common/models.hpp"

namespace tally {

/**
 * Fold intervals into per-day-per-project and per-project totals for the
 * window. Intervals that do not overlap the window contribute nothing; the
 * result does not depend on input order.
 */
Aggregates aggregate(const std::vector<Interval> &intervals,
                     const ReportWindow &window,
                     TimePoint now);

struct CollectedIntervals {
    std::vector<Interval> intervals;
    std::size_t skipped = 0;
};

// Converts ledger records into intervals. Records with a missing or
// unparsable timestamp are skipped and counted, never raised.
CollectedIntervals collectIntervals(const std::vector<LedgerEntry> &entries);

} // namespace tally
