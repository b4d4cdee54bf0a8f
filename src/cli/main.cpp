#include <QCoreApplication>

#include "cli/FetchCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("mountfetch"));
    QCoreApplication::setApplicationVersion(QStringLiteral(MOUNTFETCH_VERSION));

    bool trace = qEnvironmentVariableIntValue("MOUNTFETCH_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    mountfetch::logging::initLogging(QStringLiteral("mountfetch"), trace);
    MFLOG_DEBUG(QStringLiteral("main"),
                QStringLiteral("main"),
                QStringLiteral("cli_start"),
                QStringLiteral("user_invocation"),
                (nlohmann::json{{"args", argc - 1}}));

    mountfetch::FetchCli cli;
    return cli.run(argc, argv);
}
