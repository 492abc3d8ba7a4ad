#pragma once

#include <QHash>
#include <QString>
#include <QStringList>

#include <optional>

#include "core/result.hpp"

namespace slate::site {

// Placeholder a page template carries where the rendered document goes.
inline const QString CONTENT_MARKER = QStringLiteral("<!-- {CONTENT} -->");

// Reserved file name; never copied to the output.
inline const QString TEMPLATE_FILE_NAME = QStringLiteral("template.html");

enum class BuiltInTemplate {
    Default,
    Minimal,
};

[[nodiscard]] std::optional<BuiltInTemplate> built_in_template_from_name(const QString& name);
[[nodiscard]] QStringList built_in_template_names();
[[nodiscard]] QString built_in_template_html(BuiltInTemplate which);

// Nearest template.html from documentDir upward to siteRoot (inclusive).
// Returns an empty string when there is none.
[[nodiscard]] QString find_template(const QString& documentDir, const QString& siteRoot);

// Substitutes the fragment at CONTENT_MARKER; without a template the fragment is returned as is.
[[nodiscard]] QString wrap_html_content(const QString& fragment, const std::optional<QString>& templateHtml);

/**
 * Decides which template wraps a document.
 *
 * A forced template (built-in name or file path) always wins. Otherwise the
 * nearest template.html is used; files are read once and cached.
 */
class TemplateResolver {
public:
    [[nodiscard]] static Result<TemplateResolver> create(const QString& siteRoot, const QString& forcedTemplate);

    [[nodiscard]] Result<std::optional<QString>> template_for(const QString& documentDir);

private:
    TemplateResolver(QString siteRoot, std::optional<QString> forced)
        : siteRoot_(std::move(siteRoot))
        , forced_(std::move(forced)) {}

    [[nodiscard]] Result<QString> load(const QString& path);

    QString siteRoot_;
    std::optional<QString> forced_;
    QHash<QString, QString> cache_;
};

} // namespace slate::site
