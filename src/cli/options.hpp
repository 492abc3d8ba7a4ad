#pragma once

#include <QString>
#include <QStringList>

#include "core/result.hpp"
#include "site/build_options.hpp"

namespace slate::cli {

struct CommandLine {
    site::BuildOptions build;
    bool verbose = false;
    bool showHelp = false;
    bool showVersion = false;
    QString helpText;
};

/**
 * Parses slate's arguments (argv[0] first) into build options.
 *
 *   slate [DIRECTORY] [-f FILE] [-o PATH] [--clean] [--web-prefix PREFIX]
 *         [-t NAME|PATH] [--strict] [--verbose]
 *
 * SLATE_WEB_PREFIX and SLATE_STRICT=1 in the environment act as defaults for
 * --web-prefix and --strict. Relative default output paths resolve against
 * workingDir. Conflicting or missing arguments yield a Usage error.
 */
[[nodiscard]] Result<CommandLine> parse_command_line(const QStringList& arguments, const QString& workingDir);

} // namespace slate::cli
