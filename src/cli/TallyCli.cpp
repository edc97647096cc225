#include "cli/TallyCli.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <string>

#include <QDir>
#include <QFileInfo>
#include <QUrl>

#include <nlohmann/json.hpp>

#include "cli/clock_display.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"
#include "engine/aggregator.hpp"
#include "engine/duration.hpp"
#include "engine/report_builder.hpp"
#include "ledger/ledger_store.hpp"
#include "ledger/time_tracker.hpp"
#include "report/report_renderer.hpp"

namespace tally {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  tally start PROJECT... [--no-clock]\n"
        "  tally stop\n"
        "  tally log PROJECT DURATION      (hours like 3 or 3.5, or 1h30m, 45m, 90)\n"
        "  tally report [--month YYYY-MM] [--format text|json] [--no-export]\n"
        "  tally clear\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("text");
    }
    return value.toLower();
}

// Arguments after the subcommand that are neither flags nor flag values.
QStringList positionalArgs(const QStringList &args)
{
    static const QStringList valueFlags = {QStringLiteral("--month"),
                                           QStringLiteral("--format")};
    QStringList positional;
    for (int i = 2; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (valueFlags.contains(arg)) {
            ++i;
            continue;
        }
        if (arg.startsWith(QStringLiteral("--"))) {
            continue;
        }
        positional.push_back(arg);
    }
    return positional;
}

std::string formatStartedAt(const std::string &start)
{
    const auto parsed = fromLocalIso8601(start);
    if (!parsed.has_value()) {
        return start;
    }
    return toLocalDateTime(*parsed).toString(QStringLiteral("yyyy-MM-dd HH:mm")).toStdString();
}

} // namespace

int TallyCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to the command handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    logging::CommandScope scope(command);
    TLOG_INFO(QStringLiteral("TallyCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              (nlohmann::json{{"args", args.mid(2).join(QLatin1Char(' ')).toStdString()}}));

    try {
        return dispatch(command, args);
    } catch (const std::exception &ex) {
        TLOG_ERROR(QStringLiteral("TallyCli"),
                   QStringLiteral("run"),
                   QStringLiteral("cli_command_failed"),
                   (nlohmann::json{{"error", ex.what()}}));
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}

int TallyCli::dispatch(const QString &command, const QStringList &args)
{
    if (command == QStringLiteral("start")) {
        return runStart(args);
    }
    if (command == QStringLiteral("stop")) {
        return runStop(args);
    }
    if (command == QStringLiteral("log")) {
        return runLog(args);
    }
    if (command == QStringLiteral("report")) {
        return runReport(args);
    }
    if (command == QStringLiteral("clear")) {
        return runClear(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int TallyCli::runStart(const QStringList &args)
{
    const QStringList words = positionalArgs(args);
    if (words.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const std::string project = words.join(QLatin1Char(' ')).toStdString();

    LedgerStore store;
    TimeTracker tracker(store);
    const StartResult result = tracker.start(project, Clock::now());
    if (!result.started) {
        std::cout << "Already tracking '" << result.entry.project << "' since "
                  << formatStartedAt(result.entry.start)
                  << ". Use 'tally stop' first." << std::endl;
        return 0;
    }
    std::cout << "Started tracking: " << project << std::endl;

    if (args.contains(QStringLiteral("--no-clock"))) {
        return 0;
    }

    const auto start = fromLocalIso8601(result.entry.start);
    ClockDisplay clock(project, start.value_or(Clock::now()), std::cout);
    const int signalNumber = clock.run();

    // Every way out of the clock finalizes the interval; stop() is a no-op
    // when another process already closed it.
    const auto stopped = tracker.stop(Clock::now());
    if (stopped.has_value()) {
        std::cout << "\nStopped (via " << ClockDisplay::signalLabel(signalNumber).toStdString()
                  << "): " << stopped->project << std::endl;
    }
    return 0;
}

int TallyCli::runStop(const QStringList &)
{
    LedgerStore store;
    TimeTracker tracker(store);
    const auto stopped = tracker.stop(Clock::now());
    if (!stopped.has_value()) {
        std::cout << "No active timer." << std::endl;
        return 0;
    }
    std::cout << "Stopped: " << stopped->project << std::endl;
    return 0;
}

int TallyCli::runLog(const QStringList &args)
{
    const QStringList positional = positionalArgs(args);
    if (positional.size() != 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const std::string project = positional.at(0).toStdString();

    std::chrono::seconds duration{0};
    try {
        duration = parseHoursOrDuration(positional.at(1).toStdString());
    } catch (const InvalidDuration &ex) {
        TLOG_WARN(QStringLiteral("TallyCli"),
                  QStringLiteral("runLog"),
                  QStringLiteral("invalid_duration"),
                  (nlohmann::json{{"input", positional.at(1).toStdString()},
                                  {"error", ex.what()}}));
        std::cout << "Invalid duration: " << ex.what() << std::endl;
        return 1;
    }

    LedgerStore store;
    TimeTracker tracker(store);
    tracker.log(project, duration, Clock::now());

    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(duration).count();
    std::cout << "Logged " << minutes << "m to: " << project << std::endl;
    return 0;
}

int TallyCli::runReport(const QStringList &args)
{
    // Sampled once so every ongoing interval is clamped to the same instant.
    const TimePoint now = Clock::now();

    const QString format = getFormat(args);
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    QDate reference = localDate(now);
    const QString monthValue = getArgValue(args, QStringLiteral("--month"));
    if (!monthValue.isEmpty()) {
        const auto month = parseMonth(monthValue);
        if (!month.has_value()) {
            std::cerr << "Invalid month. Use YYYY-MM." << std::endl;
            return 1;
        }
        reference = *month;
    }

    LedgerStore store;
    const auto entries = store.load();
    if (entries.empty()) {
        std::cout << "No entries yet. Start with: tally start <project>" << std::endl;
        return 0;
    }

    const CollectedIntervals collected = collectIntervals(entries);
    const ReportModel report = buildMonthlyReport(collected.intervals, reference, now);

    TLOG_INFO(QStringLiteral("TallyCli"),
              QStringLiteral("runReport"),
              QStringLiteral("report_built"),
              (nlohmann::json{{"entries", entries.size()},
                              {"skipped", collected.skipped},
                              {"month", report.firstDay.toString(QStringLiteral("yyyy-MM")).toStdString()},
                              {"format", format.toStdString()}}));

    if (format == QStringLiteral("json")) {
        renderReportJson(std::cout, report);
    } else {
        renderReportText(std::cout, report);
    }

    if (args.contains(QStringLiteral("--no-export"))) {
        return 0;
    }

    const QString exportPath = exportReportCsv(exportBaseDirPath(), report);
    const std::string url = QUrl::fromLocalFile(exportPath).toString().toStdString();
    // Keep stdout machine-readable in json mode.
    std::ostream &note = format == QStringLiteral("json") ? std::cerr : std::cout;
    note << "\nExported report to: " << osc8Link(exportPath.toStdString(), url) << std::endl;
    return 0;
}

int TallyCli::runClear(const QStringList &)
{
    // The configured ledger, plus a project-local ./timelog.json if present.
    QStringList targets{QFileInfo(LedgerStore().path()).absoluteFilePath()};
    const QString local = QDir::current().absoluteFilePath(QStringLiteral("timelog.json"));
    if (!targets.contains(local)) {
        targets.push_back(local);
    }

    int result = 0;
    for (const QString &target : targets) {
        const std::string path = QDir::toNativeSeparators(target).toStdString();
        try {
            if (LedgerStore(target).clear()) {
                std::cout << "Deleted log file: " << path << std::endl;
            } else {
                std::cout << "No log file to delete: " << path << std::endl;
            }
        } catch (const std::runtime_error &ex) {
            std::cout << "Failed to delete " << path << ": " << ex.what() << std::endl;
            result = 1;
        }
    }
    return result;
}

std::optional<QDate> TallyCli::parseMonth(const QString &value) const
{
    const QDate month = QDate::fromString(value + QStringLiteral("-01"), Qt::ISODate);
    if (!month.isValid() || value.size() != 7) {
        return std::nullopt;
    }
    return month;
}

} // namespace tally
