#pragma once

#include <vector>

#include <QDate>

#include "common/models.hpp"

namespace tally {

IsoWeekKey isoWeekOf(const QDate &day);

// Every calendar day of the window, ascending.
std::vector<QDate> daysInWindow(const ReportWindow &window);

/**
 * Groups the window's days into ISO-8601 weeks. Buckets appear in the order
 * their first day occurs and hold only days inside the window.
 */
std::vector<WeekBucket> groupByIsoWeek(const ReportWindow &window);

} // namespace tally
