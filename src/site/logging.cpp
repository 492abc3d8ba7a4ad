#include "site/logging.hpp"

#include <QMutex>
#include <QTextStream>

#include <cstdio>

Q_LOGGING_CATEGORY(slateBuildLog, "slate.build", QtInfoMsg)
Q_LOGGING_CATEGORY(slateWalkLog, "slate.walk", QtInfoMsg)
Q_LOGGING_CATEGORY(slateRenderLog, "slate.render", QtInfoMsg)
Q_LOGGING_CATEGORY(slateTocLog, "slate.toc", QtInfoMsg)

namespace slate::site {
namespace {

QMutex& stderr_mutex() {
    static QMutex mu;
    return mu;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    QMutexLocker lock(&stderr_mutex());

    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
    QTextStream err(stderr);
    err << level_tag(type) << QLatin1Char(' ');
    if (!cat.isEmpty() && cat != QStringLiteral("default")) {
        err << cat << QStringLiteral(": ");
    }
    err << msg << QLatin1Char('\n');
    err.flush();
}

} // namespace

QString level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return QStringLiteral("D");
        case QtInfoMsg: return QStringLiteral("I");
        case QtWarningMsg: return QStringLiteral("W");
        case QtCriticalMsg: return QStringLiteral("E");
        case QtFatalMsg: return QStringLiteral("F");
    }
    return QStringLiteral("?");
}

void install_console_logging(bool verbose) {
    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("slate.*.debug=true\nslate.*.info=true\n"));
    } else {
        QLoggingCategory::setFilterRules(QStringLiteral("slate.*.debug=false\nslate.*.info=false\n"));
    }
    qInstallMessageHandler(message_handler);
}

} // namespace slate::site
