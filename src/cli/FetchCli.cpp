#include "cli/FetchCli.hpp"

#include <iostream>
#include <utility>

#include <QCommandLineOption>
#include <QCommandLineParser>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "report/banner_renderer.hpp"
#include "report/json_exporter.hpp"

#ifndef MOUNTFETCH_VERSION
#define MOUNTFETCH_VERSION "0.0.0"
#endif

namespace mountfetch {

namespace {

const QCommandLineOption kPercentOption(
    QStringList{QStringLiteral("p"), QStringLiteral("percent")},
    QStringLiteral("Show RAM usage as a percentage."));
const QCommandLineOption kDiskOption(
    QStringList{QStringLiteral("d"), QStringLiteral("disk")},
    QStringLiteral("Show root filesystem usage."));
const QCommandLineOption kTempOption(
    QStringList{QStringLiteral("t"), QStringLiteral("temp")},
    QStringLiteral("Show CPU temperature (coretemp sensor)."));
const QCommandLineOption kExportOption(
    QStringList{QStringLiteral("e"), QStringLiteral("export")},
    QStringLiteral("Export the collected information as JSON to <path>."),
    QStringLiteral("path"));
const QCommandLineOption kTraceOption(
    QStringLiteral("trace"),
    QStringLiteral("Enable verbose trace logging."));

void configureParser(QCommandLineParser &parser)
{
    parser.setApplicationDescription(
        QStringLiteral("Display system information next to a mountain banner."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOption(kPercentOption);
    parser.addOption(kDiskOption);
    parser.addOption(kTempOption);
    parser.addOption(kExportOption);
    parser.addOption(kTraceOption);
}

} // namespace

FetchCli::FetchCli(CollectorSources sources)
    : m_collector(std::move(sources))
{
}

int FetchCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    if (args.isEmpty()) {
        args.push_back(QStringLiteral("mountfetch"));
    }

    ReportOptions options;
    int exitCode = 0;
    if (!parseOptions(args, &options, &exitCode)) {
        return exitCode;
    }

    MFLOG_INFO(QStringLiteral("FetchCli"),
               QStringLiteral("run"),
               QStringLiteral("fetch_start"),
               QStringLiteral("user_invocation"),
               (nlohmann::json{{"percent", options.ramPercent},
                               {"disk", options.includeDisk},
                               {"temp", options.includeTemperature},
                               {"export", !options.exportPath.isEmpty()}}));

    const SystemSnapshot snapshot = m_collector.collect(options);
    std::cout << renderReport(snapshot) << std::flush;

    if (!options.exportPath.isEmpty()) {
        return exportReport(snapshot, options.exportPath);
    }
    return 0;
}

bool FetchCli::parseOptions(const QStringList &args, ReportOptions *options, int *exitCode)
{
    QCommandLineParser parser;
    configureParser(parser);

    if (!parser.parse(args)) {
        std::cerr << "mountfetch: " << parser.errorText().toStdString() << "\n\n"
                  << parser.helpText().toStdString();
        *exitCode = 1;
        return false;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        std::cout << parser.helpText().toStdString();
        *exitCode = 0;
        return false;
    }
    if (parser.isSet(QStringLiteral("version"))) {
        std::cout << "mountfetch " << MOUNTFETCH_VERSION << std::endl;
        *exitCode = 0;
        return false;
    }
    if (!parser.positionalArguments().isEmpty()) {
        std::cerr << "mountfetch: unexpected argument '"
                  << parser.positionalArguments().constFirst().toStdString() << "'\n\n"
                  << parser.helpText().toStdString();
        *exitCode = 1;
        return false;
    }

    options->ramPercent = parser.isSet(kPercentOption);
    options->includeDisk = parser.isSet(kDiskOption);
    options->includeTemperature = parser.isSet(kTempOption);
    options->exportPath = parser.value(kExportOption);

    if (parser.isSet(kExportOption) && options->exportPath.isEmpty()) {
        std::cerr << "mountfetch: --export needs a non-empty path" << std::endl;
        *exitCode = 1;
        return false;
    }
    return true;
}

int FetchCli::exportReport(const SystemSnapshot &snapshot, const QString &path)
{
    QString error;
    if (!exportSnapshot(snapshot, path, &error)) {
        std::cerr << "mountfetch: export failed, " << error.toStdString() << std::endl;
        return 1;
    }

    std::cout << "Exported system information to " << path.toStdString() << std::endl;
    return 0;
}

} // namespace mountfetch
