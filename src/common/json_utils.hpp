#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <QDateTime>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tally {

inline QDateTime toLocalDateTime(TimePoint timestamp)
{
    return QDateTime::fromMSecsSinceEpoch(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch())
            .count());
}

inline TimePoint fromDateTime(const QDateTime &dateTime)
{
    return TimePoint{std::chrono::duration_cast<Duration>(
        std::chrono::milliseconds{dateTime.toMSecsSinceEpoch()})};
}

inline TimePoint startOfDay(const QDate &day)
{
    return fromDateTime(QDateTime(day, QTime(0, 0)));
}

inline QDate localDate(TimePoint timestamp)
{
    return toLocalDateTime(timestamp).date();
}

// Ledger timestamps are local wall-clock time without an offset,
// e.g. 2024-03-01T09:00:00 or 2024-03-01T09:00:00.250.
inline std::string toLocalIso8601(TimePoint timestamp)
{
    const QDateTime dt = toLocalDateTime(timestamp);
    if (dt.time().msec() == 0) {
        return dt.toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss")).toStdString();
    }
    return dt.toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss.zzz")).toStdString();
}

inline std::optional<TimePoint> fromLocalIso8601(const std::string &value)
{
    QString normalized = QString::fromStdString(value).trimmed();
    if (normalized.size() > 10 && normalized.at(10) == QLatin1Char(' ')) {
        normalized[10] = QLatin1Char('T');
    }
    const QDateTime dt = QDateTime::fromString(normalized, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        return std::nullopt;
    }
    return fromDateTime(dt);
}

namespace detail {

inline std::optional<std::string> textField(const nlohmann::ordered_json &j,
                                            const char *key)
{
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    // Wrong type: keep the raw text so the record reads as malformed later.
    return it->dump();
}

} // namespace detail

inline void to_json(nlohmann::ordered_json &j, const LedgerEntry &entry)
{
    j = nlohmann::ordered_json::object();
    j["project"] = entry.project;
    j["start"] = entry.start;
    if (entry.end.has_value()) {
        j["end"] = *entry.end;
    } else {
        j["end"] = nullptr;
    }
    if (entry.durationSeconds.has_value()) {
        j["duration_seconds"] = *entry.durationSeconds;
    }
    if (entry.duration.has_value()) {
        j["duration"] = *entry.duration;
    }
    if (entry.manual) {
        j["manual"] = true;
    }
    for (const auto &item : entry.extra.items()) {
        if (!j.contains(item.key())) {
            j[item.key()] = item.value();
        }
    }
}

inline void from_json(const nlohmann::ordered_json &j, LedgerEntry &entry)
{
    entry.project = detail::textField(j, "project").value_or("");
    entry.start = detail::textField(j, "start").value_or("");
    entry.end = detail::textField(j, "end");

    entry.durationSeconds.reset();
    if (j.contains("duration_seconds") && j.at("duration_seconds").is_number_integer()) {
        entry.durationSeconds = j.at("duration_seconds").get<std::int64_t>();
    }
    entry.duration.reset();
    if (j.contains("duration") && j.at("duration").is_string()) {
        entry.duration = j.at("duration").get<std::string>();
    }
    entry.manual = j.contains("manual") && j.at("manual").is_boolean()
        && j.at("manual").get<bool>();

    entry.extra = nlohmann::ordered_json::object();
    for (const auto &item : j.items()) {
        const std::string &key = item.key();
        if (key == "project" || key == "start" || key == "end"
            || key == "duration_seconds" || key == "duration" || key == "manual") {
            continue;
        }
        entry.extra[key] = item.value();
    }
}

inline std::string isoWeekLabel(const IsoWeekKey &key)
{
    return QStringLiteral("%1-W%2")
        .arg(key.year)
        .arg(key.week, 2, 10, QLatin1Char('0'))
        .toStdString();
}

inline void to_json(nlohmann::ordered_json &j, const FormattedDuration &duration)
{
    j = nlohmann::ordered_json{
        {"seconds", duration.seconds},
        {"human", duration.human},
        {"clock", duration.clock}
    };
}

inline void to_json(nlohmann::ordered_json &j, const ReportProject &project)
{
    j = nlohmann::ordered_json{{"name", project.name}, {"duration", project.duration}};
}

inline void to_json(nlohmann::ordered_json &j, const ReportDay &day)
{
    j = nlohmann::ordered_json{
        {"date", day.date.toString(Qt::ISODate).toStdString()},
        {"total", day.total},
        {"projects", day.projects}
    };
}

inline void to_json(nlohmann::ordered_json &j, const ReportWeek &week)
{
    j = nlohmann::ordered_json{
        {"week_key", isoWeekLabel(week.key)},
        {"first_day", week.firstDay.toString(Qt::ISODate).toStdString()},
        {"last_day", week.lastDay.toString(Qt::ISODate).toStdString()},
        {"no_time", week.noTime},
        {"days", week.days}
    };
}

inline void to_json(nlohmann::ordered_json &j, const ReportModel &report)
{
    nlohmann::ordered_json totals = nlohmann::ordered_json::array();
    for (const auto &project : report.monthlyTotals) {
        totals.push_back({{"project", project.name}, {"duration", project.duration}});
    }

    j = nlohmann::ordered_json{
        {"window_start", toLocalIso8601(report.window.start)},
        {"window_end", toLocalIso8601(report.window.end)},
        {"first_day", report.firstDay.toString(Qt::ISODate).toStdString()},
        {"last_day", report.lastDay.toString(Qt::ISODate).toStdString()},
        {"weeks", report.weeks},
        {"monthly_totals", totals},
        {"overall_total", report.overallTotal}
    };
}

} // namespace tally
