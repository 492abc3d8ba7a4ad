#include "cli/options.hpp"

#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>

#include "site/problem_reporter.hpp"
#include "site/templates.hpp"

namespace slate::cli {

namespace {

Result<CommandLine> usage_error(const QString& message) {
    return Result<CommandLine>::err(site::make_error(ErrorKind::Usage, message));
}

} // namespace

Result<CommandLine> parse_command_line(const QStringList& arguments, const QString& workingDir) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Djot and Markdown static site generator"));
    const auto helpOption = parser.addHelpOption();
    const auto versionOption = parser.addVersionOption();

    const QCommandLineOption fileOption(
        QStringList{QStringLiteral("f"), QStringLiteral("file")},
        QStringLiteral("Process a single file instead of a directory."),
        QStringLiteral("file"));
    parser.addOption(fileOption);

    const QCommandLineOption outputOption(
        QStringList{QStringLiteral("o"), QStringLiteral("output")},
        QStringLiteral("Output path override. Defaults to ./output for directories."),
        QStringLiteral("path"));
    parser.addOption(outputOption);

    const QCommandLineOption cleanOption(
        QStringList{QStringLiteral("clean")},
        QStringLiteral("Clean the output directory before generating the site."));
    parser.addOption(cleanOption);

    const QCommandLineOption webPrefixOption(
        QStringList{QStringLiteral("web-prefix")},
        QStringLiteral("Website prefix prepended to internal links (defaults to local paths, or SLATE_WEB_PREFIX)."),
        QStringLiteral("prefix"));
    parser.addOption(webPrefixOption);

    const QCommandLineOption templateOption(
        QStringList{QStringLiteral("t"), QStringLiteral("template")},
        QStringLiteral("Template for every page: a built-in name (%1) or a template file. "
                       "Overrides any template.html in the source tree.")
            .arg(site::built_in_template_names().join(QStringLiteral(", "))),
        QStringLiteral("template"));
    parser.addOption(templateOption);

    const QCommandLineOption strictOption(
        QStringList{QStringLiteral("strict")},
        QStringLiteral("Treat warnings (missing index, dangling links, unreadable entries) as errors. "
                       "Also enabled by SLATE_STRICT=1."));
    parser.addOption(strictOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("verbose")},
        QStringLiteral("Print progress and debug logging."));
    parser.addOption(verboseOption);

    parser.addPositionalArgument(QStringLiteral("directory"),
                                 QStringLiteral("Directory to generate the site from (not required with -f)."),
                                 QStringLiteral("[directory]"));

    if (!parser.parse(arguments)) {
        return usage_error(parser.errorText());
    }

    CommandLine cli;
    cli.helpText = parser.helpText();
    cli.showHelp = parser.isSet(helpOption);
    cli.showVersion = parser.isSet(versionOption);
    if (cli.showHelp || cli.showVersion) {
        return Result<CommandLine>::ok(std::move(cli));
    }

    const auto positional = parser.positionalArguments();
    if (positional.size() > 1) {
        return usage_error(QStringLiteral("Expected at most one directory, got %1").arg(positional.size()));
    }
    const QDir cwd(workingDir);
    const bool hasDirectory = !positional.isEmpty();
    const bool hasFile = parser.isSet(fileOption);

    auto& build = cli.build;
    if (hasDirectory && hasFile) {
        return usage_error(QStringLiteral("Cannot specify both a directory and a path! (Specified %1 and -f %2)")
                               .arg(positional.first(), parser.value(fileOption)));
    }
    if (hasDirectory) {
        build.sourcePath = cwd.absoluteFilePath(positional.first());
        if (QFileInfo(build.sourcePath).isFile()) {
            return usage_error(QStringLiteral("Path %1 is a file. Specify -f <FILE> if this was intended.")
                                   .arg(positional.first()));
        }
        build.outputPath = cwd.absoluteFilePath(QStringLiteral("output"));
    } else if (hasFile) {
        build.sourcePath = cwd.absoluteFilePath(parser.value(fileOption));
        if (QFileInfo(build.sourcePath).isDir()) {
            return usage_error(QStringLiteral("Path %1 is a directory. Specify <DIRECTORY> without -f if this "
                                              "was intended.")
                                   .arg(parser.value(fileOption)));
        }
        if (parser.isSet(cleanOption)) {
            return usage_error(QStringLiteral("--clean cannot be combined with -f"));
        }
        build.singleFile = true;
        build.outputPath = cwd.absolutePath();
    } else {
        return usage_error(QStringLiteral("Must specify either a directory <DIRECTORY> or a path with -f <PATH>"));
    }

    if (parser.isSet(outputOption)) {
        build.outputPath = cwd.absoluteFilePath(parser.value(outputOption));
    }
    build.clean = parser.isSet(cleanOption);
    build.webPrefix = parser.isSet(webPrefixOption) ? parser.value(webPrefixOption)
                                                    : qEnvironmentVariable("SLATE_WEB_PREFIX");
    build.forcedTemplate = parser.value(templateOption);
    build.strict = parser.isSet(strictOption) || qEnvironmentVariable("SLATE_STRICT") == QStringLiteral("1");
    cli.verbose = parser.isSet(verboseOption);

    return Result<CommandLine>::ok(std::move(cli));
}

} // namespace slate::cli
