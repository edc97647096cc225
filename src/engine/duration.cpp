#include "engine/duration.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

#include <QString>

namespace tally {

namespace {

constexpr std::int64_t kMaxMinutes = std::numeric_limits<std::int32_t>::max();

QString normalized(const std::string &text)
{
    return QString::fromStdString(text).trimmed().toLower();
}

std::int64_t digitsToNumber(const QString &digits)
{
    std::int64_t value = 0;
    for (const QChar ch : digits) {
        value = value * 10 + ch.digitValue();
        if (value > kMaxMinutes) {
            throw InvalidDuration("Duration is too large");
        }
    }
    return value;
}

// Digits with at most one '.', and at least one digit.
bool isPlainDecimal(const QString &text)
{
    bool seenDot = false;
    bool seenDigit = false;
    for (const QChar ch : text) {
        if (ch >= QLatin1Char('0') && ch <= QLatin1Char('9')) {
            seenDigit = true;
        } else if (ch == QLatin1Char('.') && !seenDot) {
            seenDot = true;
        } else {
            return false;
        }
    }
    return seenDigit;
}

std::int64_t wholeSeconds(Duration duration)
{
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

} // namespace

std::chrono::minutes parseDuration(const std::string &text)
{
    const QString input = normalized(text);

    std::int64_t total = 0;
    QString digits;
    bool hadUnit = false;

    for (const QChar ch : input) {
        if (ch >= QLatin1Char('0') && ch <= QLatin1Char('9')) {
            digits += ch;
        } else if (ch == QLatin1Char('h') || ch == QLatin1Char('m')) {
            if (digits.isEmpty()) {
                throw InvalidDuration("Missing number before unit");
            }
            const std::int64_t value = digitsToNumber(digits);
            total += ch == QLatin1Char('h') ? value * 60 : value;
            if (total > kMaxMinutes) {
                throw InvalidDuration("Duration is too large");
            }
            digits.clear();
            hadUnit = true;
        } else if (ch == QLatin1Char(':')) {
            continue;
        } else {
            throw InvalidDuration("Unsupported character in duration: "
                                  + QString(ch).toStdString());
        }
    }

    if (!digits.isEmpty() && !hadUnit) {
        total += digitsToNumber(digits);
    }
    if (total <= 0) {
        throw InvalidDuration("Duration must be > 0");
    }
    return std::chrono::minutes{total};
}

std::chrono::seconds parseHoursOrDuration(const std::string &text)
{
    const QString input = normalized(text);
    if (!isPlainDecimal(input)) {
        return parseDuration(text);
    }
    const double hours = input.toDouble();
    if (!(hours > 0.0)) {
        throw InvalidDuration("Duration must be > 0");
    }
    if (hours > static_cast<double>(kMaxMinutes) / 60.0) {
        throw InvalidDuration("Duration is too large");
    }
    return std::chrono::seconds{std::llround(hours * 3600.0)};
}

std::string formatHuman(Duration duration)
{
    std::int64_t total = wholeSeconds(duration);
    const bool negative = total < 0;
    total = std::llabs(total);
    const std::int64_t hours = total / 3600;
    const std::int64_t minutes = (total % 3600) / 60;

    const QString sign = negative ? QStringLiteral("-") : QString();
    if (hours > 0) {
        return QStringLiteral("%1%2h%3m")
            .arg(sign)
            .arg(hours)
            .arg(minutes, 2, 10, QLatin1Char('0'))
            .toStdString();
    }
    return QStringLiteral("%1%2m").arg(sign).arg(minutes).toStdString();
}

std::string formatClock(Duration duration)
{
    std::int64_t total = wholeSeconds(duration);
    if (total < 0) {
        total = 0;
    }
    return QStringLiteral("%1:%2:%3")
        .arg(total / 3600, 2, 10, QLatin1Char('0'))
        .arg((total % 3600) / 60, 2, 10, QLatin1Char('0'))
        .arg(total % 60, 2, 10, QLatin1Char('0'))
        .toStdString();
}

std::string formatHoursMinutes(Duration duration)
{
    std::int64_t total = wholeSeconds(duration);
    if (total < 0) {
        total = 0;
    }
    return QStringLiteral("%1:%2")
        .arg(total / 3600, 2, 10, QLatin1Char('0'))
        .arg((total % 3600) / 60, 2, 10, QLatin1Char('0'))
        .toStdString();
}

FormattedDuration makeFormattedDuration(Duration duration)
{
    FormattedDuration formatted;
    formatted.seconds = wholeSeconds(duration);
    formatted.human = formatHuman(duration);
    formatted.clock = formatClock(duration);
    return formatted;
}

} // namespace tally
