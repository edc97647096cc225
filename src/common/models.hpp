#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <QDate>

#include <nlohmann/json.hpp>

namespace tally {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

// One raw ledger record as stored on disk. Timestamps are kept as text so a
// corrupt record can be carried through load/save untouched.
struct LedgerEntry {
    std::string project;
    std::string start;
    std::optional<std::string> end;
    std::optional<std::int64_t> durationSeconds;
    std::optional<std::string> duration;
    bool manual = false;

    // Fields this version does not know about; preserved on save.
    nlohmann::ordered_json extra = nlohmann::ordered_json::object();
};

// A tracked work session. An absent end means the session is still running.
struct Interval {
    std::string project;
    TimePoint start;
    std::optional<TimePoint> end;
};

// Half-open [start, end).
struct ReportWindow {
    TimePoint start;
    TimePoint end;
};

struct DaySegment {
    QDate day;
    TimePoint start;
    TimePoint end;
};

struct Aggregates {
    std::map<QDate, std::map<std::string, Duration>> perDayTotals;
    std::map<std::string, Duration> monthlyProjectTotals;
};

struct IsoWeekKey {
    int year = 0;
    int week = 0;

    bool operator==(const IsoWeekKey &other) const
    {
        return year == other.year && week == other.week;
    }
    bool operator!=(const IsoWeekKey &other) const
    {
        return !(*this == other);
    }
};

struct WeekBucket {
    IsoWeekKey key;
    std::vector<QDate> days;
};

// Durations handed to presentation carry the raw value and both renderings.
struct FormattedDuration {
    std::int64_t seconds = 0;
    std::string human;
    std::string clock;
};

struct ReportProject {
    std::string name;
    FormattedDuration duration;
};

struct ReportDay {
    QDate date;
    FormattedDuration total;
    std::vector<ReportProject> projects;
};

struct ReportWeek {
    IsoWeekKey key;
    QDate firstDay;
    QDate lastDay;
    std::vector<ReportDay> days;
    bool noTime = true;
};

struct ReportModel {
    ReportWindow window;
    QDate firstDay;
    QDate lastDay;
    std::vector<ReportWeek> weeks;
    std::vector<ReportProject> monthlyTotals;
    FormattedDuration overallTotal;
};

} // namespace tally
