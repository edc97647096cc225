#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QTimer>

#include <csignal>

#include <iostream>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

#include "cli/TallyCli.hpp"
#include "common/json_utils.hpp"
#include "ledger/ledger_store.hpp"

class TallyCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testUsage();
    void testEmptyLedgerReport();
    void testStartStop();
    void testStartClockStopsOnSignal();
    void testLogInvalidDuration();
    void testLogAndJsonReport();
    void testTextReportExportsCsv();
    void testReportSkipsMalformedRecords();
    void testInvalidMonth();
    void testClear();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString ledgerPath() const;
    QString exportDir() const;
    int runCli(const QStringList &args, std::string &out);
};

void TallyCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qputenv("TALLY_FILE", ledgerPath().toUtf8());
    qputenv("TALLY_EXPORT_DIR", exportDir().toUtf8());
}

void TallyCliTests::cleanupTestCase()
{
    qunsetenv("TALLY_FILE");
    qunsetenv("TALLY_EXPORT_DIR");
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void TallyCliTests::init()
{
    QFile::remove(ledgerPath());
    QDir(exportDir()).removeRecursively();
}

QString TallyCliTests::ledgerPath() const
{
    return m_tempDir.path() + "/timelog.json";
}

QString TallyCliTests::exportDir() const
{
    return m_tempDir.path() + "/sheets";
}

int TallyCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    tally::TallyCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    utf8Args.push_back(QByteArrayLiteral("tally"));
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void TallyCliTests::testUsage()
{
    std::string out;
    QCOMPARE(runCli({}, out), 1);
    QVERIFY(QString::fromStdString(out).contains(QStringLiteral("Usage:")));

    QCOMPARE(runCli({QStringLiteral("bogus")}, out), 1);
    QCOMPARE(runCli({QStringLiteral("log"), QStringLiteral("alpha")}, out), 1);
}

void TallyCliTests::testEmptyLedgerReport()
{
    std::string out;
    QCOMPARE(runCli({QStringLiteral("report"), QStringLiteral("--no-export")}, out), 0);
    QVERIFY(QString::fromStdString(out).startsWith(QStringLiteral("No entries yet.")));
}

void TallyCliTests::testStartStop()
{
    std::string out;
    QCOMPARE(runCli({QStringLiteral("start"), QStringLiteral("deep"), QStringLiteral("work"),
                     QStringLiteral("--no-clock")}, out), 0);
    QCOMPARE(QString::fromStdString(out), QStringLiteral("Started tracking: deep work\n"));

    QCOMPARE(runCli({QStringLiteral("start"), QStringLiteral("other"),
                     QStringLiteral("--no-clock")}, out), 0);
    QVERIFY(QString::fromStdString(out).startsWith(QStringLiteral("Already tracking 'deep work' since ")));

    QCOMPARE(runCli({QStringLiteral("stop")}, out), 0);
    QCOMPARE(QString::fromStdString(out), QStringLiteral("Stopped: deep work\n"));

    QCOMPARE(runCli({QStringLiteral("stop")}, out), 0);
    QCOMPARE(QString::fromStdString(out), QStringLiteral("No active timer.\n"));

    const auto entries = tally::LedgerStore(ledgerPath()).load();
    QCOMPARE(entries.size(), size_t(1));
    QVERIFY(entries[0].end.has_value());
    QVERIFY(entries[0].durationSeconds.has_value());
}

void TallyCliTests::testStartClockStopsOnSignal()
{
    // Delivered while the live clock's event loop is running.
    QTimer::singleShot(200, []() { std::raise(SIGTERM); });

    std::string out;
    QCOMPARE(runCli({QStringLiteral("start"), QStringLiteral("alpha")}, out), 0);
    const QString text = QString::fromStdString(out);
    QVERIFY(text.startsWith(QStringLiteral("Started tracking: alpha\n")));
    QVERIFY(text.contains(QStringLiteral("currently working on: alpha")));
    QVERIFY(text.endsWith(QStringLiteral("\nStopped (via SIGTERM): alpha\n")));

    const auto entries = tally::LedgerStore(ledgerPath()).load();
    QCOMPARE(entries.size(), size_t(1));
    QVERIFY(entries[0].end.has_value());
    QVERIFY(entries[0].durationSeconds.has_value());
}

void TallyCliTests::testLogInvalidDuration()
{
    std::string out;
    QCOMPARE(runCli({QStringLiteral("log"), QStringLiteral("alpha"), QStringLiteral("h30m")}, out), 1);
    QCOMPARE(QString::fromStdString(out),
             QStringLiteral("Invalid duration: Missing number before unit\n"));
    QVERIFY(!QFile::exists(ledgerPath()));

    QCOMPARE(runCli({QStringLiteral("log"), QStringLiteral("alpha"), QStringLiteral("0")}, out), 1);
    QCOMPARE(QString::fromStdString(out), QStringLiteral("Invalid duration: Duration must be > 0\n"));
}

void TallyCliTests::testLogAndJsonReport()
{
    std::string out;
    QCOMPARE(runCli({QStringLiteral("log"), QStringLiteral("alpha"), QStringLiteral("1h30m")}, out), 0);
    QCOMPARE(QString::fromStdString(out), QStringLiteral("Logged 90m to: alpha\n"));

    QCOMPARE(runCli({QStringLiteral("log"), QStringLiteral("beta"), QStringLiteral("0.5")}, out), 0);
    QCOMPARE(QString::fromStdString(out), QStringLiteral("Logged 30m to: beta\n"));

    // Logged entries end now; near midnight a slice can fall into the
    // previous month, so only the overall figure is pinned down loosely.
    QCOMPARE(runCli({QStringLiteral("report"), QStringLiteral("--format"), QStringLiteral("json"),
                     QStringLiteral("--no-export")}, out), 0);
    const auto parsed = nlohmann::json::parse(out);
    QVERIFY(parsed.contains("weeks"));
    QVERIFY(parsed.at("overall_total").at("seconds").get<qint64>() > 0);
    QVERIFY(parsed.at("overall_total").at("seconds").get<qint64>() <= 120 * 60);
    QVERIFY(!QDir(exportDir()).exists());
}

void TallyCliTests::testTextReportExportsCsv()
{
    const QByteArray ledger = R"([
        {"project": "alpha", "start": "2024-03-01T09:00:00", "end": "2024-03-01T11:00:00"},
        {"project": "beta", "start": "2024-03-01T11:00:00", "end": "2024-03-01T11:45:00"}
    ])";
    QFile file(ledgerPath());
    QVERIFY(file.open(QIODevice::WriteOnly));
    QCOMPARE(file.write(ledger), qint64(ledger.size()));
    file.close();

    std::string out;
    QCOMPARE(runCli({QStringLiteral("report"), QStringLiteral("--month"), QStringLiteral("2024-03")}, out), 0);
    const QString text = QString::fromStdString(out);
    QVERIFY(text.startsWith(QStringLiteral("Report for March 2024")));
    QVERIFY(text.contains(QStringLiteral("- Overall: 2h45m\n")));
    QVERIFY(text.contains(QStringLiteral("Exported report to: ")));
    QVERIFY(QFile::exists(exportDir() + "/March-2024/Time Sheet - March 2024.csv"));
}

void TallyCliTests::testReportSkipsMalformedRecords()
{
    const QByteArray ledger = R"([
        {"project": "alpha", "start": "2024-03-04T09:00:00", "end": "2024-03-04T10:00:00"},
        {"project": "broken", "start": "not a time", "end": null},
        {"project": "missing"}
    ])";
    QFile file(ledgerPath());
    QVERIFY(file.open(QIODevice::WriteOnly));
    QCOMPARE(file.write(ledger), qint64(ledger.size()));
    file.close();

    std::string out;
    QCOMPARE(runCli({QStringLiteral("report"), QStringLiteral("--month"), QStringLiteral("2024-03"),
                     QStringLiteral("--no-export")}, out), 0);
    const QString text = QString::fromStdString(out);
    QVERIFY(text.contains(QStringLiteral("- alpha: 1h00m\n- Overall: 1h00m\n")));
    QVERIFY(!text.contains(QStringLiteral("broken")));
}

void TallyCliTests::testInvalidMonth()
{
    std::string out;
    QCOMPARE(runCli({QStringLiteral("log"), QStringLiteral("alpha"), QStringLiteral("1h")}, out), 0);
    QCOMPARE(runCli({QStringLiteral("report"), QStringLiteral("--month"), QStringLiteral("2024-13")}, out), 1);
    QCOMPARE(runCli({QStringLiteral("report"), QStringLiteral("--format"), QStringLiteral("xml")}, out), 1);
}

void TallyCliTests::testClear()
{
    const QString previousDir = QDir::currentPath();
    const QString workDir = m_tempDir.path() + "/work";
    QVERIFY(QDir().mkpath(workDir));
    QVERIFY(QDir::setCurrent(workDir));
    const QString localLedger = workDir + "/timelog.json";

    std::string out;
    QCOMPARE(runCli({QStringLiteral("clear")}, out), 0);
    QCOMPARE(QString::fromStdString(out),
             QStringLiteral("No log file to delete: %1\nNo log file to delete: %2\n")
                 .arg(QDir::toNativeSeparators(ledgerPath()),
                      QDir::toNativeSeparators(localLedger)));

    QCOMPARE(runCli({QStringLiteral("log"), QStringLiteral("alpha"), QStringLiteral("45m")}, out), 0);
    QFile local(localLedger);
    QVERIFY(local.open(QIODevice::WriteOnly));
    local.write("[]");
    local.close();

    QCOMPARE(runCli({QStringLiteral("clear")}, out), 0);
    QCOMPARE(QString::fromStdString(out),
             QStringLiteral("Deleted log file: %1\nDeleted log file: %2\n")
                 .arg(QDir::toNativeSeparators(ledgerPath()),
                      QDir::toNativeSeparators(localLedger)));
    QVERIFY(!QFile::exists(ledgerPath()));
    QVERIFY(!QFile::exists(localLedger));

    QVERIFY(QDir::setCurrent(previousDir));
}

QTEST_MAIN(TallyCliTests)
#include "test_tally_cli.moc"
