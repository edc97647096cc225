#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include "common/models.hpp"

namespace tally {

// Raised for malformed or non-positive duration input.
class InvalidDuration : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * Parse a compound duration token such as "1h30m", "45m", "2h" or "90".
 *
 * - Digit runs are each followed by 'h' or 'm'; units may repeat.
 * - A trailing digit run without a unit counts as minutes, but only when no
 *   unit appeared anywhere in the string ("90" is 90 minutes, the "90" in
 *   "1h90" is dropped).
 * - ':' is skipped without numeric meaning.
 *
 * Throws InvalidDuration on a unit without digits, any other character, or a
 * non-positive total.
 */
std::chrono::minutes parseDuration(const std::string &text);

/**
 * Manual log syntax: a plain decimal number is hours ("3", "3.5"); anything
 * else goes through parseDuration().
 */
std::chrono::seconds parseHoursOrDuration(const std::string &text);

// "2h05m", "45m", "-1h00m". Seconds are truncated.
std::string formatHuman(Duration duration);

// Zero-padded "HH:MM:SS"; negative values clamp to zero.
std::string formatClock(Duration duration);

// Zero-padded "HH:MM" used by the CSV export.
std::string formatHoursMinutes(Duration duration);

FormattedDuration makeFormattedDuration(Duration duration);

} // namespace tally
