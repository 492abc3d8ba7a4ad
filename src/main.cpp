#include <QCoreApplication>
#include <QDir>
#include <QTextStream>

#include "cli/options.hpp"
#include "site/logging.hpp"
#include "site/site_builder.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("slate");
    app.setApplicationVersion("0.1.0");

    const auto parsed = slate::cli::parse_command_line(app.arguments(), QDir::currentPath());
    if (parsed.is_err()) {
        QTextStream(stderr) << "error: " << QString::fromStdString(parsed.unwrap_err().message) << '\n'
                            << "Run with --help for usage.\n";
        return 2;
    }

    const auto& cli = parsed.unwrap();
    if (cli.showHelp) {
        QTextStream(stdout) << cli.helpText;
        return 0;
    }
    if (cli.showVersion) {
        QTextStream(stdout) << app.applicationName() << ' ' << app.applicationVersion() << '\n';
        return 0;
    }

    slate::site::install_console_logging(cli.verbose);

    slate::site::SiteBuilder builder(cli.build);
    const auto result = builder.build();
    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        const auto kind = slate::to_string(error.kind);
        QTextStream(stderr) << "error[" << QString::fromUtf8(kind.data(), static_cast<qsizetype>(kind.size()))
                            << "]: " << QString::fromStdString(error.message) << '\n';
        return error.kind == slate::ErrorKind::Usage ? 2 : 1;
    }
    return 0;
}
