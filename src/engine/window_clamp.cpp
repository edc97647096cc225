#include "engine/window_clamp.hpp"

#include <algorithm>

#include <QDateTime>

#include "common/json_utils.hpp"

namespace tally {

std::optional<ClampedRange> clampToWindow(TimePoint start,
                                          const std::optional<TimePoint> &end,
                                          const ReportWindow &window,
                                          TimePoint now)
{
    const TimePoint effectiveEnd = end.value_or(now);
    const TimePoint clampedStart = std::max(start, window.start);
    const TimePoint clampedEnd = std::min(effectiveEnd, window.end);
    if (clampedEnd <= clampedStart) {
        return std::nullopt;
    }
    return ClampedRange{clampedStart, clampedEnd};
}

std::optional<ClampedRange> clampToWindow(const Interval &interval,
                                          const ReportWindow &window,
                                          TimePoint now)
{
    return clampToWindow(interval.start, interval.end, window, now);
}

TimePoint nextLocalMidnight(TimePoint timestamp)
{
    const QDate nextDay = localDate(timestamp).addDays(1);
    TimePoint midnight = startOfDay(nextDay);
    // A zone that skips midnight can map the next day's start onto or before
    // the current instant; keep moving forward so the splitter always advances.
    int guard = 0;
    while (midnight <= timestamp && guard < 2) {
        midnight = startOfDay(nextDay.addDays(++guard));
    }
    return midnight;
}

DaySplitter::iterator::iterator(TimePoint cursor, TimePoint end)
    : m_cursor(cursor)
    , m_end(end)
    , m_done(cursor >= end)
{
    load();
}

void DaySplitter::iterator::load()
{
    if (m_done) {
        return;
    }
    m_segment.day = localDate(m_cursor);
    m_segment.start = m_cursor;
    m_segment.end = std::min(m_end, nextLocalMidnight(m_cursor));
}

DaySplitter::iterator &DaySplitter::iterator::operator++()
{
    if (m_done) {
        return *this;
    }
    m_cursor = m_segment.end;
    m_done = m_cursor >= m_end;
    load();
    return *this;
}

DaySplitter::iterator DaySplitter::iterator::operator++(int)
{
    iterator previous = *this;
    ++(*this);
    return previous;
}

bool DaySplitter::iterator::operator==(const iterator &other) const
{
    if (m_done || other.m_done) {
        return m_done == other.m_done;
    }
    return m_cursor == other.m_cursor && m_end == other.m_end;
}

DaySplitter::DaySplitter(const ClampedRange &range)
    : m_range(range)
{
}

DaySplitter::iterator DaySplitter::begin() const
{
    return iterator(m_range.start, m_range.end);
}

DaySplitter::iterator DaySplitter::end() const
{
    return iterator();
}

} // namespace tally
