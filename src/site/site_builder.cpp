#include "site/site_builder.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSaveFile>

#include "core/table_of_contents.hpp"
#include "site/logging.hpp"
#include "site/page_renderer.hpp"
#include "site/site_walker.hpp"
#include "site/templates.hpp"

namespace slate::site {

namespace {

Status write_bytes_atomic(const QString& path, const QByteArray& bytes) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return Status::err(make_error(
            ErrorKind::Io, QStringLiteral("Failed to open %1 for writing: %2").arg(path, file.errorString()), path));
    }
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        return Status::err(make_error(
            ErrorKind::Io, QStringLiteral("Failed to write %1: %2").arg(path, file.errorString()), path));
    }
    return Status::ok();
}

} // namespace

bool has_index_page(const QString& root) {
    const QDir dir(root);
    for (const auto& name : {QStringLiteral("index.dj"), QStringLiteral("index.djot"), QStringLiteral("index.md")}) {
        if (QFileInfo(dir.filePath(name)).isFile()) {
            return true;
        }
    }
    return false;
}

Result<int> write_pages(const Ledger& ledger, const QString& outputRoot, const QString& webPrefix) {
    const QDir out(outputRoot);
    const auto prefix = webPrefix.toStdString();
    int written = 0;

    for (const auto& entry : ledger) {
        const auto* page = std::get_if<PageEntry>(&entry);
        if (!page) {
            continue;
        }

        const auto toc = assemble_table_of_contents(ledger, page->depth, page->relative_path, prefix);
        qCDebug(slateTocLog).noquote() << QString::fromStdString(page->relative_path) << "toc:"
                                       << QString::fromStdString(toc);
        const auto html = substitute_table_of_contents(page->html, toc);

        const auto target = out.filePath(QString::fromStdString(page->relative_path));
        const auto parent = ensure_parent_dir(target);
        if (parent.is_err()) {
            return Result<int>::err(parent.unwrap_err());
        }
        const auto status = write_bytes_atomic(target, QByteArray::fromStdString(html));
        if (status.is_err()) {
            return Result<int>::err(status.unwrap_err());
        }
        written++;
    }
    return Result<int>::ok(written);
}

SiteBuilder::SiteBuilder(BuildOptions options)
    : options_(std::move(options))
    , reporter_(options_.strict) {
}

Status SiteBuilder::clean_output() const {
    QDir out(options_.outputPath);
    if (!out.exists()) {
        qCDebug(slateBuildLog) << "nothing to clean at" << options_.outputPath;
        return Status::ok();
    }
    qCDebug(slateBuildLog) << "cleaning output path" << options_.outputPath;
    if (!out.removeRecursively()) {
        return Status::err(make_error(ErrorKind::Io,
                                      QStringLiteral("Failed to clean output directory %1").arg(options_.outputPath),
                                      options_.outputPath));
    }
    return Status::ok();
}

Result<Ledger> SiteBuilder::first_pass(int& assetsCopied) {
    const QFileInfo source(options_.sourcePath);
    const auto siteRoot = options_.singleFile ? source.absolutePath() : source.absoluteFilePath();

    auto templates = TemplateResolver::create(siteRoot, options_.forcedTemplate);
    if (templates.is_err()) {
        return Result<Ledger>::err(templates.unwrap_err());
    }

    PageRenderer renderer(siteRoot, options_.webPrefix, templates.unwrap(), reporter_);
    SiteWalker walker(siteRoot, options_.outputPath, renderer, reporter_);

    if (options_.singleFile) {
        Ledger ledger;
        return walker.process_file(source, 1, ledger).and_then([&] {
            assetsCopied = walker.assets_copied();
            return Result<Ledger>::ok(std::move(ledger));
        });
    }

    auto ledger = walker.walk();
    assetsCopied = walker.assets_copied();
    return ledger;
}

Result<BuildSummary> SiteBuilder::build() {
    using R = Result<BuildSummary>;

    const QFileInfo source(options_.sourcePath);
    if (options_.singleFile ? !source.isFile() : !source.isDir()) {
        return R::err(make_error(
            ErrorKind::Usage,
            QStringLiteral("Target path %1 is not a %2.")
                .arg(options_.sourcePath, options_.singleFile ? QStringLiteral("file") : QStringLiteral("directory")),
            options_.sourcePath));
    }

    const auto sourceRoot = QDir::cleanPath(source.absoluteFilePath());
    const auto outputRoot = QDir::cleanPath(QFileInfo(options_.outputPath).absoluteFilePath());
    if (!options_.singleFile && outputRoot == sourceRoot) {
        return R::err(make_error(
            ErrorKind::Usage,
            QStringLiteral("Output path %1 is the source directory; choose a different output path.")
                .arg(options_.outputPath),
            options_.outputPath));
    }

    if (options_.clean) {
        const auto cleaned = clean_output();
        if (cleaned.is_err()) {
            return R::err(cleaned.unwrap_err());
        }
    }

    if (!QDir().mkpath(options_.outputPath)) {
        return R::err(make_error(ErrorKind::Io,
                                 QStringLiteral("Failed to create output directory %1").arg(options_.outputPath),
                                 options_.outputPath));
    }

    qCInfo(slateBuildLog) << "1/3: Site generation and indexing...";
    if (!options_.singleFile && !has_index_page(options_.sourcePath)) {
        const auto status = reporter_.report(ErrorKind::MissingIndex, missing_index_message(),
                                             options_.sourcePath, slateBuildLog);
        if (status.is_err()) {
            return R::err(status.unwrap_err());
        }
    }

    BuildSummary summary;
    auto ledger = first_pass(summary.assetsCopied);
    if (ledger.is_err()) {
        return R::err(ledger.unwrap_err());
    }

    qCInfo(slateBuildLog) << "2/3: Generating tables of contents and saving...";
    return write_pages(ledger.unwrap(), options_.outputPath, options_.webPrefix).map([&](int pagesWritten) {
        summary.pagesWritten = pagesWritten;
        summary.problems = reporter_.problems();
        qCInfo(slateBuildLog) << "3/3: Done!" << summary.pagesWritten << "pages," << summary.assetsCopied
                              << "assets";
        return std::move(summary);
    });
}

} // namespace slate::site
