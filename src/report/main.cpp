#include <QCoreApplication>

#include "report/HistoryCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("jobhist"));

    bool trace = qEnvironmentVariableIntValue("JOBHIST_TRACE") == 1;
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
    jobhist::logging::initLogging(QStringLiteral("jobhist"), trace);
    JLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("jobhist_start"),
              QStringLiteral("user_invocation"),
              (nlohmann::json{{"args", filteredArgs.size()}}));

    jobhist::HistoryCli cli;
    return cli.run(filteredArgs);
}
