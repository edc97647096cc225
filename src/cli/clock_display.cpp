#include "cli/clock_display.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <csignal>
#include <map>
#include <utility>
#include <vector>

#include <QDateTime>
#include <QEventLoop>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace tally {

namespace {

using Glyph = std::array<const char *, 5>;

volatile std::sig_atomic_t g_pendingSignal = 0;

extern "C" void recordSignal(int signalNumber)
{
    g_pendingSignal = signalNumber;
}

const std::map<QChar, Glyph> &glyphs()
{
    static const std::map<QChar, Glyph> table = {
        {QLatin1Char('0'), {" ░░░ ", "░   ░", "░   ░", "░   ░", " ░░░ "}},
        {QLatin1Char('1'), {"  ░  ", " ░░  ", "  ░  ", "  ░  ", " ░░░ "}},
        {QLatin1Char('2'), {" ░░░ ", "    ░", " ░░░ ", "░    ", "░░░░░"}},
        {QLatin1Char('3'), {"░░░░ ", "    ░", " ░░░ ", "    ░", "░░░░ "}},
        {QLatin1Char('4'), {"░  ░ ", "░  ░ ", "░░░░░", "   ░ ", "   ░ "}},
        {QLatin1Char('5'), {"░░░░░", "░    ", "░░░░ ", "    ░", "░░░░ "}},
        {QLatin1Char('6'), {" ░░░ ", "░    ", "░░░░ ", "░   ░", " ░░░ "}},
        {QLatin1Char('7'), {"░░░░░", "   ░ ", "  ░  ", " ░   ", " ░   "}},
        {QLatin1Char('8'), {" ░░░ ", "░   ░", " ░░░ ", "░   ░", " ░░░ "}},
        {QLatin1Char('9'), {" ░░░ ", "░   ░", " ░░░░", "    ░", " ░░░ "}},
        {QLatin1Char(':'), {"     ", "  ░  ", "     ", "  ░  ", "     "}},
    };
    return table;
}

class SignalGuard {
public:
    SignalGuard()
    {
        g_pendingSignal = 0;
        for (const int sig : {SIGINT, SIGTERM, SIGHUP}) {
            m_previous.emplace_back(sig, std::signal(sig, recordSignal));
        }
    }

    ~SignalGuard()
    {
        for (const auto &item : m_previous) {
            std::signal(item.first, item.second);
        }
    }

private:
    std::vector<std::pair<int, void (*)(int)>> m_previous;
};

} // namespace

ClockDisplay::ClockDisplay(std::string project, TimePoint start, std::ostream &out)
    : m_project(std::move(project))
    , m_start(start)
    , m_out(out)
{
}

std::vector<std::string> ClockDisplay::renderBigText(const QString &text)
{
    std::vector<std::string> rows(5);
    const auto &table = glyphs();
    for (const QChar ch : text) {
        auto it = table.find(ch);
        if (it == table.end()) {
            it = table.find(QLatin1Char('0'));
        }
        for (size_t row = 0; row < rows.size(); ++row) {
            rows[row] += it->second[row];
            rows[row] += "  ";
        }
    }
    return rows;
}

QString ClockDisplay::signalLabel(int signalNumber)
{
    switch (signalNumber) {
    case SIGINT:
        return QStringLiteral("Ctrl-C");
    case SIGTERM:
        return QStringLiteral("SIGTERM");
    case SIGHUP:
        return QStringLiteral("SIGHUP");
    }
    return QString::number(signalNumber);
}

void ClockDisplay::drawFrame(TimePoint now)
{
    const QDateTime local = toLocalDateTime(now);

    // Clear screen and home the cursor.
    m_out << "\x1b[2J\x1b[H";
    for (const auto &row : renderBigText(local.toString(QStringLiteral("HH:mm:ss")))) {
        m_out << row << "\n";
    }

    std::int64_t elapsed =
        std::chrono::duration_cast<std::chrono::seconds>(now - m_start).count();
    if (elapsed < 0) {
        elapsed = 0;
    }
    m_out << "\n"
          << "currently working on: "
          << QString::fromStdString(m_project).toLower().toStdString() << "\n"
          << "time: " << local.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")).toStdString()
          << "\n"
          << "elapsed: "
          << QStringLiteral("%1h%2m%3s")
                 .arg(elapsed / 3600)
                 .arg((elapsed % 3600) / 60, 2, 10, QLatin1Char('0'))
                 .arg(elapsed % 60, 2, 10, QLatin1Char('0'))
                 .toStdString()
          << std::endl;
}

int ClockDisplay::run()
{
    SignalGuard guard;
    QEventLoop loop;

    QTimer refresh;
    refresh.setInterval(1000);
    QObject::connect(&refresh, &QTimer::timeout, [this]() { drawFrame(Clock::now()); });

    // Signal handlers only record the signal; the loop notices it here.
    QTimer poll;
    poll.setInterval(100);
    QObject::connect(&poll, &QTimer::timeout, [&loop]() {
        if (g_pendingSignal != 0) {
            loop.quit();
        }
    });

    TLOG_DEBUG(QStringLiteral("ClockDisplay"),
               QStringLiteral("run"),
               QStringLiteral("clock_start"),
               (nlohmann::json{{"project", m_project}}));

    drawFrame(Clock::now());
    refresh.start();
    poll.start();
    loop.exec();

    return static_cast<int>(g_pendingSignal);
}

} // namespace tally
