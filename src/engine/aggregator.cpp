#include "engine/aggregator.hpp"

#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/window_clamp.hpp"

namespace tally {

namespace {

constexpr const char *kUnknownProject = "(unknown)";

std::optional<Interval> toInterval(const LedgerEntry &entry)
{
    if (entry.start.empty()) {
        return std::nullopt;
    }
    const auto start = fromLocalIso8601(entry.start);
    if (!start.has_value()) {
        return std::nullopt;
    }

    Interval interval;
    interval.project = entry.project.empty() ? kUnknownProject : entry.project;
    interval.start = *start;
    if (entry.end.has_value()) {
        const auto end = fromLocalIso8601(*entry.end);
        if (!end.has_value()) {
            return std::nullopt;
        }
        interval.end = *end;
    }
    return interval;
}

} // namespace

Aggregates aggregate(const std::vector<Interval> &intervals,
                     const ReportWindow &window,
                     TimePoint now)
{
    Aggregates result;
    for (const auto &interval : intervals) {
        const auto clamped = clampToWindow(interval, window, now);
        if (!clamped.has_value()) {
            continue;
        }
        for (const DaySegment &segment : DaySplitter(*clamped)) {
            const Duration length = segment.end - segment.start;
            result.perDayTotals[segment.day][interval.project] += length;
            result.monthlyProjectTotals[interval.project] += length;
        }
    }
    return result;
}

CollectedIntervals collectIntervals(const std::vector<LedgerEntry> &entries)
{
    CollectedIntervals collected;
    collected.intervals.reserve(entries.size());

    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto interval = toInterval(entries[i]);
        if (!interval.has_value()) {
            ++collected.skipped;
            TLOG_DEBUG(QStringLiteral("Aggregator"),
                       QStringLiteral("collectIntervals"),
                       QStringLiteral("malformed_record_skipped"),
                       (nlohmann::json{{"index", i},
                                       {"start", entries[i].start},
                                       {"end", entries[i].end.value_or("")}}));
            continue;
        }
        collected.intervals.push_back(std::move(*interval));
    }

    if (collected.skipped > 0) {
        TLOG_WARN(QStringLiteral("Aggregator"),
                  QStringLiteral("collectIntervals"),
                  QStringLiteral("malformed_records"),
                  (nlohmann::json{{"skipped", collected.skipped},
                                  {"total", entries.size()}}));
    }
    return collected;
}

} // namespace tally
