#include "site/problem_reporter.hpp"

#include <QDebug>

namespace slate::site {

Error make_error(ErrorKind kind, const QString& message, const QString& path) {
    return Error{kind, message.toStdString(), path.toStdString()};
}

QString missing_index_message() {
    return QStringLiteral("index.{dj|djot|md} not found! consider creating one in the base target "
                          "directory as the default page.");
}

QString path_not_under_root_message(const QString& path) {
    return QStringLiteral("Path %1 is not relative to target directory").arg(path);
}

QString traversal_entry_message(const QString& path, const QString& reason) {
    return QStringLiteral("An entry returned error: %1 (%2)").arg(reason, path);
}

QString dangling_link_message(const QString& referencedPath) {
    return QStringLiteral("Referenced file path %1 does not exist!").arg(referencedPath);
}

Status ProblemReporter::report(ErrorKind kind,
                               const QString& message,
                               const QString& path,
                               LogCategory category) {
    problems_.append(Problem{kind, message, path});

    if (!strict_) {
        qCWarning(category).noquote() << message;
        return Status::ok();
    }

    qCCritical(category).noquote() << message;
    return Status::err(make_error(kind, message, path));
}

qsizetype ProblemReporter::count(ErrorKind kind) const {
    qsizetype n = 0;
    for (const auto& problem : problems_) {
        if (problem.kind == kind) n++;
    }
    return n;
}

} // namespace slate::site
