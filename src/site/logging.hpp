#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(slateBuildLog)
Q_DECLARE_LOGGING_CATEGORY(slateWalkLog)
Q_DECLARE_LOGGING_CATEGORY(slateRenderLog)
Q_DECLARE_LOGGING_CATEGORY(slateTocLog)

namespace slate::site {

// Installs a Qt message handler that writes "LEVEL category: message" lines
// to stderr. By default only warnings and above are shown; verbose enables
// info and debug output for the slate.* categories. QT_LOGGING_RULES still
// applies on top.
void install_console_logging(bool verbose);

// Single-letter level tag used in log lines ("W" for warnings, ...).
[[nodiscard]] QString level_tag(QtMsgType type);

} // namespace slate::site
