#include "engine/calendar_grouper.hpp"

#include "common/json_utils.hpp"

namespace tally {

IsoWeekKey isoWeekOf(const QDate &day)
{
    IsoWeekKey key;
    key.week = day.weekNumber(&key.year);
    return key;
}

std::vector<QDate> daysInWindow(const ReportWindow &window)
{
    std::vector<QDate> days;
    if (window.end <= window.start) {
        return days;
    }
    for (QDate day = localDate(window.start); startOfDay(day) < window.end;
         day = day.addDays(1)) {
        days.push_back(day);
    }
    return days;
}

std::vector<WeekBucket> groupByIsoWeek(const ReportWindow &window)
{
    std::vector<WeekBucket> buckets;
    for (const QDate &day : daysInWindow(window)) {
        const IsoWeekKey key = isoWeekOf(day);
        // ISO weeks are contiguous runs of days, so a new key always opens a
        // new bucket.
        if (buckets.empty() || buckets.back().key != key) {
            buckets.push_back(WeekBucket{key, {}});
        }
        buckets.back().days.push_back(day);
    }
    return buckets;
}

} // namespace tally
