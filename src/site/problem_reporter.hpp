#pragma once

#include <QList>
#include <QLoggingCategory>
#include <QString>

#include "core/result.hpp"

namespace slate::site {

using LogCategory = const QLoggingCategory& (*)();

struct Problem {
    ErrorKind kind{ErrorKind::Io};
    QString message;
    QString path;
};

[[nodiscard]] Error make_error(ErrorKind kind, const QString& message, const QString& path = {});

// Standard wording for each reportable kind.
[[nodiscard]] QString missing_index_message();
[[nodiscard]] QString path_not_under_root_message(const QString& path);
[[nodiscard]] QString traversal_entry_message(const QString& path, const QString& reason);
[[nodiscard]] QString dangling_link_message(const QString& referencedPath);

/**
 * Applies the run-wide strict/lenient policy to reportable problems.
 *
 * Lenient: the problem is logged as a warning, recorded, and report()
 * returns ok so the caller carries on with best-effort output.
 * Strict: the problem is logged as critical, recorded, and report() returns
 * the error for the caller to propagate.
 */
class ProblemReporter {
public:
    explicit ProblemReporter(bool strict)
        : strict_(strict) {}

    [[nodiscard]] Status report(ErrorKind kind,
                                const QString& message,
                                const QString& path,
                                LogCategory category);

    [[nodiscard]] bool strict() const { return strict_; }
    [[nodiscard]] const QList<Problem>& problems() const { return problems_; }
    [[nodiscard]] qsizetype count(ErrorKind kind) const;

private:
    bool strict_;
    QList<Problem> problems_;
};

} // namespace slate::site
