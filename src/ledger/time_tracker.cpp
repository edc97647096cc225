#include "ledger/time_tracker.hpp"

#include <cstddef>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/duration.hpp"

namespace tally {

namespace {

std::optional<std::size_t> openIndex(const std::vector<LedgerEntry> &entries)
{
    if (entries.empty() || entries.back().end.has_value()) {
        return std::nullopt;
    }
    return entries.size() - 1;
}

} // namespace

void closeEntry(LedgerEntry &entry, TimePoint end)
{
    entry.end = toLocalIso8601(end);
    // A start that cannot be parsed still gets closed; only the derived
    // duration fields are left out.
    const auto start = fromLocalIso8601(entry.start);
    if (!start.has_value()) {
        return;
    }
    const Duration elapsed = end - *start;
    entry.durationSeconds =
        std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    entry.duration = formatClock(elapsed);
}

TimeTracker::TimeTracker(const LedgerStore &store)
    : m_store(store)
{
}

std::optional<LedgerEntry> TimeTracker::activeEntry() const
{
    const auto entries = m_store.load();
    const auto index = openIndex(entries);
    if (!index.has_value()) {
        return std::nullopt;
    }
    return entries[*index];
}

StartResult TimeTracker::start(const std::string &project, TimePoint now)
{
    auto entries = m_store.load();
    StartResult result;

    if (const auto index = openIndex(entries)) {
        result.entry = entries[*index];
        TLOG_INFO(QStringLiteral("TimeTracker"),
                  QStringLiteral("start"),
                  QStringLiteral("start_refused"),
                  (nlohmann::json{{"active", result.entry.project},
                                  {"requested", project}}));
        return result;
    }

    LedgerEntry entry;
    entry.project = project;
    entry.start = toLocalIso8601(now);
    entries.push_back(entry);
    m_store.save(entries);

    result.started = true;
    result.entry = entry;
    TLOG_INFO(QStringLiteral("TimeTracker"),
              QStringLiteral("start"),
              QStringLiteral("interval_started"),
              (nlohmann::json{{"project", project}, {"start", entry.start}}));
    return result;
}

std::optional<LedgerEntry> TimeTracker::stop(TimePoint now)
{
    auto entries = m_store.load();
    const auto index = openIndex(entries);
    if (!index.has_value()) {
        return std::nullopt;
    }

    LedgerEntry &entry = entries[*index];
    closeEntry(entry, now);
    m_store.save(entries);

    TLOG_INFO(QStringLiteral("TimeTracker"),
              QStringLiteral("stop"),
              QStringLiteral("interval_stopped"),
              (nlohmann::json{{"project", entry.project},
                              {"end", entry.end.value_or("")},
                              {"durationSeconds", entry.durationSeconds.value_or(0)}}));
    return entry;
}

LedgerEntry TimeTracker::log(const std::string &project,
                             std::chrono::seconds duration,
                             TimePoint now)
{
    auto entries = m_store.load();

    LedgerEntry entry;
    entry.project = project;
    entry.start = toLocalIso8601(now - duration);
    entry.end = toLocalIso8601(now);
    entry.durationSeconds = duration.count();
    entry.duration = formatClock(duration);
    entry.manual = true;
    entries.push_back(entry);
    m_store.save(entries);

    TLOG_INFO(QStringLiteral("TimeTracker"),
              QStringLiteral("log"),
              QStringLiteral("interval_logged"),
              (nlohmann::json{{"project", project},
                              {"durationSeconds", duration.count()}}));
    return entry;
}

} // namespace tally
