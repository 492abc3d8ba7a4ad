#pragma once

#include <QFileInfo>
#include <QString>

#include <optional>

#include "core/ledger.hpp"
#include "core/result.hpp"

namespace slate::site {

class PageRenderer;
class ProblemReporter;

/**
 * First pass over a source tree.
 *
 * Visits entries in pre-order (files before subdirectories, each sorted by
 * name; dotfiles included) and for every entry:
 * - directory: records a DirEntry and recurses;
 * - template.html: skips it;
 * - markup document: renders it and records a PageEntry (kept in memory);
 * - anything else: copies it byte for byte to the mirrored output path.
 */
class SiteWalker {
public:
    SiteWalker(QString sourceRoot, QString outputRoot, PageRenderer& renderer, ProblemReporter& reporter);

    [[nodiscard]] Result<Ledger> walk();

    // Classifies and processes one file at the given walk depth.
    [[nodiscard]] Status process_file(const QFileInfo& info, std::size_t depth, Ledger& ledger);

    [[nodiscard]] int pages_rendered() const { return pagesRendered_; }
    [[nodiscard]] int assets_copied() const { return assetsCopied_; }

private:
    [[nodiscard]] Status walk_dir(const QFileInfo& dir, std::size_t depth, Ledger& ledger);
    [[nodiscard]] std::optional<QString> relative_path(const QFileInfo& info) const;
    [[nodiscard]] Status copy_asset(const QFileInfo& info, const QString& relative);

    QString sourceRoot_;
    QString outputRoot_;
    PageRenderer& renderer_;
    ProblemReporter& reporter_;
    int pagesRendered_ = 0;
    int assetsCopied_ = 0;
};

// Creates the parent directory of filePath if needed.
[[nodiscard]] Status ensure_parent_dir(const QString& filePath);

} // namespace slate::site
