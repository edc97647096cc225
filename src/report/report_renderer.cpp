#include "report/report_renderer.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>

#include <QDir>
#include <QFileInfo>
#include <QLocale>
#include <QSaveFile>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/duration.hpp"

namespace tally {

namespace {

QString formatDate(const QDate &date, const QString &pattern)
{
    return QLocale::c().toString(date, pattern);
}

std::string isoDate(const QDate &date)
{
    return date.toString(Qt::ISODate).toStdString();
}

QString csvField(const QString &value)
{
    if (!value.contains(QLatin1Char(',')) && !value.contains(QLatin1Char('"'))
        && !value.contains(QLatin1Char('\n')) && !value.contains(QLatin1Char('\r'))) {
        return value;
    }
    QString escaped = value;
    escaped.replace(QStringLiteral("\""), QStringLiteral("\"\""));
    return QLatin1Char('"') + escaped + QLatin1Char('"');
}

void appendRow(QByteArray &out, const QStringList &fields)
{
    QStringList escaped;
    escaped.reserve(fields.size());
    for (const QString &field : fields) {
        escaped.push_back(csvField(field));
    }
    out += escaped.join(QLatin1Char(',')).toUtf8();
    out += "\r\n";
}

QString fromSeconds(std::int64_t seconds)
{
    return QString::fromStdString(formatHoursMinutes(std::chrono::seconds{seconds}));
}

} // namespace

QString monthLabel(const ReportModel &report)
{
    return formatDate(report.firstDay, QStringLiteral("MMMM yyyy"));
}

void renderReportText(std::ostream &out, const ReportModel &report)
{
    out << "Report for " << monthLabel(report).toStdString() << " (from "
        << isoDate(report.firstDay) << " to " << isoDate(report.lastDay) << ")\n\n";

    for (const auto &week : report.weeks) {
        out << "Week " << isoWeekLabel(week.key) << " ("
            << formatDate(week.firstDay, QStringLiteral("MMM dd")).toStdString() << " - "
            << formatDate(week.lastDay, QStringLiteral("MMM dd")).toStdString() << ")\n";
        if (week.noTime) {
            out << "  (no time)\n";
        }
        for (const auto &day : week.days) {
            out << "  "
                << formatDate(day.date, QStringLiteral("yyyy-MM-dd (ddd)")).toStdString()
                << ": " << day.total.human << "\n";
            for (const auto &project : day.projects) {
                out << "    - " << project.name << ": " << project.duration.human << "\n";
            }
        }
        out << "\n";
    }

    out << "Monthly totals:\n";
    if (report.monthlyTotals.empty()) {
        out << "(no time this month)\n";
        return;
    }
    for (const auto &project : report.monthlyTotals) {
        out << "- " << project.name << ": " << project.duration.human << "\n";
    }
    out << "- Overall: " << report.overallTotal.human << "\n";
}

void renderReportJson(std::ostream &out, const ReportModel &report)
{
    const nlohmann::ordered_json payload = report;
    out << payload.dump(2) << std::endl;
}

QString csvExportPath(const QString &baseDir, const ReportModel &report)
{
    const QString folder = formatDate(report.firstDay, QStringLiteral("MMMM-yyyy"));
    return baseDir + QDir::separator() + folder + QDir::separator()
        + QStringLiteral("Time Sheet - ") + monthLabel(report) + QStringLiteral(".csv");
}

QString exportReportCsv(const QString &baseDir, const ReportModel &report)
{
    const QString path = csvExportPath(baseDir, report);
    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        throw std::runtime_error("failed to create export directory: " + dir.toStdString());
    }

    const QString label = monthLabel(report);
    QByteArray out;
    appendRow(out, {QStringLiteral("Report for ") + label});
    appendRow(out, {QStringLiteral("From %1 to %2")
                        .arg(report.firstDay.toString(Qt::ISODate),
                             report.lastDay.toString(Qt::ISODate))});
    appendRow(out, {});
    appendRow(out, {QStringLiteral("Date"), QStringLiteral("Weekday"),
                    QStringLiteral("Project"), QStringLiteral("Duration (HH:MM)")});

    for (const auto &week : report.weeks) {
        for (const auto &day : week.days) {
            for (const auto &project : day.projects) {
                appendRow(out, {day.date.toString(Qt::ISODate),
                                formatDate(day.date, QStringLiteral("ddd")),
                                QString::fromStdString(project.name),
                                fromSeconds(project.duration.seconds)});
            }
        }
    }

    appendRow(out, {});
    appendRow(out, {QStringLiteral("Monthly totals")});
    if (report.monthlyTotals.empty()) {
        appendRow(out, {QStringLiteral("(no time this month)")});
    } else {
        for (const auto &project : report.monthlyTotals) {
            appendRow(out, {QString::fromStdString(project.name),
                            fromSeconds(project.duration.seconds)});
        }
        appendRow(out, {QStringLiteral("Overall"), fromSeconds(report.overallTotal.seconds)});
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw std::runtime_error("failed to open export file: " + path.toStdString());
    }
    if (file.write(out) != out.size() || !file.commit()) {
        throw std::runtime_error("failed to write export file: " + path.toStdString());
    }

    TLOG_INFO(QStringLiteral("ReportRenderer"),
              QStringLiteral("exportReportCsv"),
              QStringLiteral("report_exported"),
              (nlohmann::json{{"path", path.toStdString()},
                              {"projects", report.monthlyTotals.size()}}));
    return path;
}

std::string osc8Link(const std::string &text, const std::string &url)
{
    return "\x1b]8;;" + url + "\x1b\\" + text + "\x1b]8;;\x1b\\";
}

} // namespace tally
