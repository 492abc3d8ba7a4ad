#include "site/site_walker.hpp"

#include <QDir>
#include <QFile>

#include "core/link_rewriter.hpp"
#include "site/logging.hpp"
#include "site/markup.hpp"
#include "site/page_renderer.hpp"
#include "site/problem_reporter.hpp"
#include "site/templates.hpp"

namespace slate::site {

namespace {

QString clean_absolute(const QString& path) {
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

} // namespace

Status ensure_parent_dir(const QString& filePath) {
    const auto dir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(dir)) {
        return Status::err(make_error(ErrorKind::Io, QStringLiteral("Failed to create directory %1").arg(dir), dir));
    }
    return Status::ok();
}

SiteWalker::SiteWalker(QString sourceRoot, QString outputRoot, PageRenderer& renderer, ProblemReporter& reporter)
    : sourceRoot_(clean_absolute(sourceRoot))
    , outputRoot_(clean_absolute(outputRoot))
    , renderer_(renderer)
    , reporter_(reporter) {
}

Result<Ledger> SiteWalker::walk() {
    Ledger ledger;
    const auto status = walk_dir(QFileInfo(sourceRoot_), 0, ledger);
    if (status.is_err()) {
        return Result<Ledger>::err(status.unwrap_err());
    }
    qCInfo(slateWalkLog) << "walked" << ledger.size() << "entries:" << pagesRendered_ << "pages,"
                         << assetsCopied_ << "assets";
    return Result<Ledger>::ok(std::move(ledger));
}

std::optional<QString> SiteWalker::relative_path(const QFileInfo& info) const {
    const auto absolute = clean_absolute(info.absoluteFilePath());
    if (absolute == sourceRoot_) {
        return QString();
    }
    const auto prefix = sourceRoot_.endsWith(QLatin1Char('/')) ? sourceRoot_ : sourceRoot_ + QLatin1Char('/');
    if (!absolute.startsWith(prefix)) {
        return std::nullopt;
    }
    return absolute.mid(prefix.size());
}

Status SiteWalker::walk_dir(const QFileInfo& info, std::size_t depth, Ledger& ledger) {
    const auto path = info.absoluteFilePath();
    const auto relative = relative_path(info);
    if (!relative) {
        return reporter_.report(ErrorKind::PathNotUnderRoot, path_not_under_root_message(path), path, slateWalkLog);
    }
    if (!info.isReadable() || !info.isExecutable()) {
        return reporter_.report(ErrorKind::TraversalEntry,
                                traversal_entry_message(path, QStringLiteral("directory is not readable")),
                                path, slateWalkLog);
    }

    qCDebug(slateWalkLog) << "dir" << *relative << "depth" << depth;
    ledger.push_back(DirEntry{depth, relative->toStdString()});

    const QDir dir(path);
    const auto entries = dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
                                           QDir::Name | QDir::DirsLast);
    for (const auto& entry : entries) {
        if (entry.isDir()) {
            if (clean_absolute(entry.absoluteFilePath()) == outputRoot_) {
                qCDebug(slateWalkLog) << "skipping output directory" << entry.filePath();
                continue;
            }
            if (entry.isSymLink()) {
                qCDebug(slateWalkLog) << "skipping symlinked directory" << entry.filePath();
                continue;
            }
            const auto status = walk_dir(entry, depth + 1, ledger);
            if (status.is_err()) return status;
        } else {
            const auto status = process_file(entry, depth + 1, ledger);
            if (status.is_err()) return status;
        }
    }
    return Status::ok();
}

Status SiteWalker::process_file(const QFileInfo& info, std::size_t depth, Ledger& ledger) {
    const auto path = info.absoluteFilePath();
    const auto relative = relative_path(info);
    if (!relative) {
        return reporter_.report(ErrorKind::PathNotUnderRoot, path_not_under_root_message(path), path, slateWalkLog);
    }

    if (info.fileName() == TEMPLATE_FILE_NAME) {
        qCDebug(slateWalkLog) << "template" << *relative << "is configuration, skipping";
        return Status::ok();
    }

    if (!info.exists() || !info.isReadable()) {
        return reporter_.report(ErrorKind::TraversalEntry,
                                traversal_entry_message(path, QStringLiteral("file is not readable")),
                                path, slateWalkLog);
    }

    const auto format = markup_format_for_suffix(info.suffix());
    if (!format) {
        return copy_asset(info, *relative);
    }

    auto html = renderer_.render_file(path, *format);
    if (html.is_err()) {
        return Status::err(html.unwrap_err());
    }

    auto pagePath = replace_extension(relative->toStdString(), RENDERED_EXTENSION);
    qCDebug(slateWalkLog) << "page" << *relative << "->" << QString::fromStdString(pagePath) << "depth" << depth;
    ledger.push_back(PageEntry{depth, std::move(pagePath), std::move(html).unwrap().toStdString()});
    pagesRendered_++;
    return Status::ok();
}

Status SiteWalker::copy_asset(const QFileInfo& info, const QString& relative) {
    const auto target = QDir(outputRoot_).filePath(relative);
    if (clean_absolute(target) == clean_absolute(info.absoluteFilePath())) {
        qCDebug(slateWalkLog) << "asset" << relative << "is already in place";
        return Status::ok();
    }
    const auto parent = ensure_parent_dir(target);
    if (parent.is_err()) {
        return parent;
    }

    if (QFileInfo::exists(target) && !QFile::remove(target)) {
        return Status::err(make_error(ErrorKind::Io, QStringLiteral("Failed to replace %1").arg(target), target));
    }
    QFile source(info.absoluteFilePath());
    if (!source.copy(target)) {
        return Status::err(make_error(
            ErrorKind::Io,
            QStringLiteral("Failed to copy %1 to %2: %3").arg(info.absoluteFilePath(), target, source.errorString()),
            target));
    }

    qCDebug(slateWalkLog) << "copied" << relative;
    assetsCopied_++;
    return Status::ok();
}

} // namespace slate::site
