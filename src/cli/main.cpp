#include <QCoreApplication>
#include <QStringList>

#include <vector>

#include "cli/TallyCli.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tally"));

    bool trace = tally::traceRequestedByEnvironment();
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    tally::logging::initLogging(QStringLiteral("tally"), trace);
    TLOG_DEBUG(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("cli_start"),
               (nlohmann::json{{"args", filteredArgs.size()}}));

    // Delegate to TallyCli for argument parsing and output.
    tally::TallyCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
