#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "cli/commands.hpp"
#include "core/logging.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("tuid");
    app.setApplicationVersion("0.2.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Generate, inspect and check typed UUIDs"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption schemeOption(
        QStringList{QStringLiteral("s"), QStringLiteral("scheme")},
        QStringLiteral("UUID version for 'generate' and 'check' (1, 3-8)."),
        QStringLiteral("version"),
        QStringLiteral("4"));
    parser.addOption(schemeOption);

    const QCommandLineOption namespaceOption(
        QStringList{QStringLiteral("namespace")},
        QStringLiteral("Namespace for v3/v5: dns, url, oid, x500 or a UUID."),
        QStringLiteral("ns"));
    parser.addOption(namespaceOption);

    const QCommandLineOption nameOption(
        QStringList{QStringLiteral("name")},
        QStringLiteral("Name for v3/v5."),
        QStringLiteral("name"));
    parser.addOption(nameOption);

    const QCommandLineOption nodeOption(
        QStringList{QStringLiteral("node")},
        QStringLiteral("Node id for v1/v6 as 12 hex digits (random if omitted)."),
        QStringLiteral("hex"));
    parser.addOption(nodeOption);

    const QCommandLineOption bytesOption(
        QStringList{QStringLiteral("bytes")},
        QStringLiteral("Payload for v8 as 32 hex digits."),
        QStringLiteral("hex"));
    parser.addOption(bytesOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append log messages to this file."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable tuid.* debug logging."));
    parser.addOption(debugOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("generate | inspect <uuid> | check <uuid> | features"));
    parser.process(app);

    if (parser.isSet(logFileOption)) {
        const auto path = parser.value(logFileOption);
        if (!tuid::install_file_logging(path)) {
            QTextStream(stderr) << "Cannot open log file " << path << '\n';
            return 1;
        }
    }
    tuid::set_debug_logging(parser.isSet(debugOption));

    bool schemeOk = false;
    const int scheme = parser.value(schemeOption).toInt(&schemeOk);
    if (!schemeOk) {
        QTextStream(stderr) << "Invalid --scheme: " << parser.value(schemeOption) << '\n';
        return 1;
    }

    const auto positional = parser.positionalArguments();
    const auto command = positional.value(0);

    tuid::cli::CommandResult result = tuid::cli::CommandResult::err(QString{});
    if (command == QStringLiteral("generate")) {
        tuid::cli::GenerateOptions options;
        options.scheme = scheme;
        options.ns = parser.value(namespaceOption);
        options.name = parser.value(nameOption);
        options.node = parser.value(nodeOption);
        options.payload = parser.value(bytesOption);
        result = tuid::cli::generate(options);
    } else if (command == QStringLiteral("inspect") && positional.size() == 2) {
        result = tuid::cli::inspect(positional.at(1));
    } else if (command == QStringLiteral("check") && positional.size() == 2) {
        result = tuid::cli::check(positional.at(1), scheme);
    } else if (command == QStringLiteral("features")) {
        result = tuid::cli::CommandResult::ok(tuid::cli::features());
    } else {
        parser.showHelp(1);
    }

    if (result.is_err()) {
        qCInfo(tuid::lcCli) << "command" << command << "failed:" << result.unwrap_err();
        QTextStream(stderr) << result.unwrap_err() << '\n';
        return 1;
    }

    QTextStream(stdout) << result.unwrap();
    return 0;
}
