#pragma once

#include <QString>

#include <optional>

#include "core/result.hpp"
#include "site/markup.hpp"

namespace slate::site {

class ProblemReporter;
class TemplateResolver;

/**
 * Converts one document to a page.
 *
 * The returned HTML is final except for the table of contents: templates
 * keep their TABLE_OF_CONTENTS_MARKER, which the second pass fills in.
 */
class PageRenderer {
public:
    PageRenderer(QString siteRoot, QString webPrefix, TemplateResolver& templates, ProblemReporter& reporter)
        : siteRoot_(std::move(siteRoot))
        , webPrefix_(std::move(webPrefix))
        , templates_(templates)
        , reporter_(reporter) {}

    // Renders text of the given format. Relative links resolve against
    // sourceDir, "/"-rooted ones against the site root; dangling links go
    // through the ProblemReporter.
    [[nodiscard]] Result<QString> render(const QString& text,
                                         MarkupFormat format,
                                         const QString& sourceDir,
                                         const std::optional<QString>& templateHtml);

    // Reads the document at filePath and renders it with its resolved template.
    [[nodiscard]] Result<QString> render_file(const QString& filePath, MarkupFormat format);

private:
    QString siteRoot_;
    QString webPrefix_;
    TemplateResolver& templates_;
    ProblemReporter& reporter_;
};

} // namespace slate::site
