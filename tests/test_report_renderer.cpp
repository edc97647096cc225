#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "engine/report_builder.hpp"
#include "report/report_renderer.hpp"

namespace {

tally::TimePoint at(int year, int month, int day, int hour = 0, int minute = 0)
{
    return tally::fromDateTime(QDateTime(QDate(year, month, day), QTime(hour, minute)));
}

tally::ReportModel marchReport()
{
    const std::vector<tally::Interval> ledger = {
        {"alpha", at(2024, 3, 1, 9), at(2024, 3, 1, 11)},
        {"beta", at(2024, 3, 1, 11), at(2024, 3, 1, 11, 45)},
        {"Client, Inc", at(2024, 3, 12, 9), at(2024, 3, 12, 9, 30)},
    };
    return tally::buildMonthlyReport(ledger, QDate(2024, 3, 1), at(2024, 3, 20));
}

} // namespace

class ReportRendererTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testTextReport();
    void testTextReportWithoutTime();
    void testJsonReport();
    void testCsvExport();
    void testOsc8Link();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void ReportRendererTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ReportRendererTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ReportRendererTests::testTextReport()
{
    std::ostringstream out;
    tally::renderReportText(out, marchReport());
    const QString text = QString::fromStdString(out.str());

    QVERIFY(text.startsWith(QStringLiteral("Report for March 2024 (from 2024-03-01 to 2024-03-31)\n\n")));
    QVERIFY(text.contains(QStringLiteral("Week 2024-W09 (Mar 01 - Mar 03)\n"
                                         "  2024-03-01 (Fri): 2h45m\n"
                                         "    - alpha: 2h00m\n"
                                         "    - beta: 45m\n")));
    QVERIFY(text.contains(QStringLiteral("Week 2024-W10 (Mar 04 - Mar 10)\n  (no time)\n")));
    QVERIFY(text.contains(QStringLiteral("  2024-03-12 (Tue): 30m\n    - Client, Inc: 30m\n")));
    QVERIFY(text.endsWith(QStringLiteral("Monthly totals:\n"
                                         "- alpha: 2h00m\n"
                                         "- beta: 45m\n"
                                         "- Client, Inc: 30m\n"
                                         "- Overall: 3h15m\n")));
}

void ReportRendererTests::testTextReportWithoutTime()
{
    const auto report = tally::buildMonthlyReport({}, QDate(2024, 2, 10), at(2024, 2, 10));
    std::ostringstream out;
    tally::renderReportText(out, report);
    const QString text = QString::fromStdString(out.str());

    QVERIFY(text.startsWith(QStringLiteral("Report for February 2024 (from 2024-02-01 to 2024-02-29)")));
    QVERIFY(text.endsWith(QStringLiteral("Monthly totals:\n(no time this month)\n")));
}

void ReportRendererTests::testJsonReport()
{
    std::ostringstream out;
    tally::renderReportJson(out, marchReport());
    const auto parsed = nlohmann::json::parse(out.str());
    QCOMPARE(parsed.at("monthly_totals").size(), size_t(3));
    QCOMPARE(QString::fromStdString(parsed.at("overall_total").at("human").get<std::string>()),
             QStringLiteral("3h15m"));
}

void ReportRendererTests::testCsvExport()
{
    const QString base = m_tempDir.path() + "/exports";
    const QString path = tally::exportReportCsv(base, marchReport());
    QCOMPARE(path, base + "/March-2024/Time Sheet - March 2024.csv");

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray csv = file.readAll();

    QVERIFY(csv.startsWith("Report for March 2024\r\nFrom 2024-03-01 to 2024-03-31\r\n\r\n"));
    QVERIFY(csv.contains("Date,Weekday,Project,Duration (HH:MM)\r\n"
                         "2024-03-01,Fri,alpha,02:00\r\n"
                         "2024-03-01,Fri,beta,00:45\r\n"
                         "2024-03-12,Tue,\"Client, Inc\",00:30\r\n"));
    QVERIFY(csv.endsWith("Monthly totals\r\n"
                         "alpha,02:00\r\n"
                         "beta,00:45\r\n"
                         "\"Client, Inc\",00:30\r\n"
                         "Overall,03:15\r\n"));
}

void ReportRendererTests::testOsc8Link()
{
    const std::string link = tally::osc8Link("report.csv", "file:///tmp/report.csv");
    QCOMPARE(QString::fromStdString(link),
             QStringLiteral("\x1b]8;;file:///tmp/report.csv\x1b\\report.csv\x1b]8;;\x1b\\"));
}

QTEST_MAIN(ReportRendererTests)
#include "test_report_renderer.moc"
