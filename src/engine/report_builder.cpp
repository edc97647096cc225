#include "engine/report_builder.hpp"

#include <algorithm>
#include <utility>

#include <QString>

#include "common/json_utils.hpp"
#include "engine/aggregator.hpp"
#include "engine/calendar_grouper.hpp"
#include "engine/duration.hpp"

namespace tally {

namespace {

std::vector<ReportProject> sortedProjects(const std::map<std::string, Duration> &totals)
{
    std::vector<std::pair<std::string, Duration>> ordered(totals.begin(), totals.end());
    std::sort(ordered.begin(), ordered.end(), [](const auto &lhs, const auto &rhs) {
        return projectNameLess(lhs.first, rhs.first);
    });

    std::vector<ReportProject> projects;
    projects.reserve(ordered.size());
    for (const auto &item : ordered) {
        projects.push_back(ReportProject{item.first, makeFormattedDuration(item.second)});
    }
    return projects;
}

Duration sumOf(const std::map<std::string, Duration> &totals)
{
    Duration sum{0};
    for (const auto &item : totals) {
        sum += item.second;
    }
    return sum;
}

} // namespace

ReportWindow monthWindow(const QDate &reference)
{
    const QDate first(reference.year(), reference.month(), 1);
    return ReportWindow{startOfDay(first), startOfDay(first.addMonths(1))};
}

bool projectNameLess(const std::string &lhs, const std::string &rhs)
{
    const int folded = QString::fromStdString(lhs).toLower().compare(
        QString::fromStdString(rhs).toLower());
    if (folded != 0) {
        return folded < 0;
    }
    return lhs < rhs;
}

ReportModel buildReport(const std::vector<Interval> &intervals,
                        const ReportWindow &window,
                        TimePoint now)
{
    const Aggregates totals = aggregate(intervals, window, now);

    ReportModel report;
    report.window = window;

    for (const WeekBucket &bucket : groupByIsoWeek(window)) {
        ReportWeek week;
        week.key = bucket.key;
        week.firstDay = bucket.days.front();
        week.lastDay = bucket.days.back();

        for (const QDate &day : bucket.days) {
            const auto it = totals.perDayTotals.find(day);
            if (it == totals.perDayTotals.end()) {
                continue;
            }
            ReportDay reportDay;
            reportDay.date = day;
            reportDay.total = makeFormattedDuration(sumOf(it->second));
            reportDay.projects = sortedProjects(it->second);
            week.days.push_back(std::move(reportDay));
        }
        week.noTime = week.days.empty();

        if (!report.firstDay.isValid()) {
            report.firstDay = week.firstDay;
        }
        report.lastDay = week.lastDay;
        report.weeks.push_back(std::move(week));
    }

    report.monthlyTotals = sortedProjects(totals.monthlyProjectTotals);
    report.overallTotal = makeFormattedDuration(sumOf(totals.monthlyProjectTotals));
    return report;
}

ReportModel buildMonthlyReport(const std::vector<Interval> &intervals,
                               const QDate &referenceDate,
                               TimePoint now)
{
    return buildReport(intervals, monthWindow(referenceDate), now);
}

} // namespace tally
