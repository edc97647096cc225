#pragma once

#include <string>
#include <vector>

#include <QDate>

#include "common/models.hpp"

namespace tally {

// [first instant of the month containing `reference`, first instant of the
// following month).
ReportWindow monthWindow(const QDate &reference);

// Display order for project names: case-insensitive, exact name as tiebreak.
bool projectNameLess(const std::string &lhs, const std::string &rhs);

/**
 * Build the report for an arbitrary window. `now` closes ongoing intervals
 * and must be sampled once by the caller.
 */
ReportModel buildReport(const std::vector<Interval> &intervals,
                        const ReportWindow &window,
                        TimePoint now);

ReportModel buildMonthlyReport(const std::vector<Interval> &intervals,
                               const QDate &referenceDate,
                               TimePoint now);

} // namespace tally
