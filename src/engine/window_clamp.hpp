#pragma once

#include <cstddef>
#include <iterator>
#include <optional>

#include "common/models.hpp"

namespace tally {

struct ClampedRange {
    TimePoint start;
    TimePoint end;
};

/**
 * Overlap of [start, end) with the window. An open interval (no end) runs
 * until `now`. Returns std::nullopt when the overlap is empty.
 */
std::optional<ClampedRange> clampToWindow(TimePoint start,
                                          const std::optional<TimePoint> &end,
                                          const ReportWindow &window,
                                          TimePoint now);

std::optional<ClampedRange> clampToWindow(const Interval &interval,
                                          const ReportWindow &window,
                                          TimePoint now);

// First local midnight strictly after `timestamp`.
TimePoint nextLocalMidnight(TimePoint timestamp);

/**
 * Splits a clamped range at every local midnight. Iteration is lazy and may
 * be repeated; each pass yields the same chronological segments, one per
 * calendar day touched, each left-closed and right-open.
 */
class DaySplitter {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = DaySegment;
        using difference_type = std::ptrdiff_t;
        using pointer = const DaySegment *;
        using reference = const DaySegment &;

        iterator() = default;

        reference operator*() const { return m_segment; }
        pointer operator->() const { return &m_segment; }
        iterator &operator++();
        iterator operator++(int);

        bool operator==(const iterator &other) const;
        bool operator!=(const iterator &other) const { return !(*this == other); }

    private:
        friend class DaySplitter;
        iterator(TimePoint cursor, TimePoint end);
        void load();

        TimePoint m_cursor;
        TimePoint m_end;
        bool m_done = true;
        DaySegment m_segment;
    };

    explicit DaySplitter(const ClampedRange &range);

    iterator begin() const;
    iterator end() const;

private:
    ClampedRange m_range;
};

} // namespace tally
