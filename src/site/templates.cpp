#include "site/templates.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "site/logging.hpp"
#include "site/problem_reporter.hpp"

namespace slate::site {

namespace {

const QString DEFAULT_TEMPLATE = QStringLiteral(R"HTML(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<style>
body { display: flex; margin: 0; font-family: sans-serif; line-height: 1.5; }
nav { min-width: 14em; padding: 1em 2em 1em 1em; border-right: 1px solid #ddd; }
nav ul { padding-left: 1.2em; }
main { max-width: 48em; padding: 1em 2em; }
pre { background: #f6f6f6; padding: 0.6em; overflow-x: auto; }
</style>
</head>
<body>
<nav><!-- {TABLE_OF_CONTENTS} --></nav>
<main><!-- {CONTENT} --></main>
</body>
</html>
)HTML");

const QString MINIMAL_TEMPLATE = QStringLiteral(R"HTML(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
</head>
<body>
<!-- {CONTENT} -->
</body>
</html>
)HTML");

QString normalized(const QString& path) {
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

} // namespace

std::optional<BuiltInTemplate> built_in_template_from_name(const QString& name) {
    const auto n = name.trimmed().toLower();
    if (n == QStringLiteral("default")) return BuiltInTemplate::Default;
    if (n == QStringLiteral("minimal")) return BuiltInTemplate::Minimal;
    return std::nullopt;
}

QStringList built_in_template_names() {
    return {QStringLiteral("default"), QStringLiteral("minimal")};
}

QString built_in_template_html(BuiltInTemplate which) {
    switch (which) {
        case BuiltInTemplate::Default: return DEFAULT_TEMPLATE;
        case BuiltInTemplate::Minimal: return MINIMAL_TEMPLATE;
    }
    return DEFAULT_TEMPLATE;
}

QString find_template(const QString& documentDir, const QString& siteRoot) {
    const auto root = normalized(siteRoot);
    QDir dir(normalized(documentDir));

    while (true) {
        const auto candidate = dir.filePath(TEMPLATE_FILE_NAME);
        if (QFileInfo(candidate).isFile()) {
            return candidate;
        }
        const auto current = QDir::cleanPath(dir.absolutePath());
        if (current == root || !current.startsWith(root) || !dir.cdUp()) {
            return {};
        }
    }
}

QString wrap_html_content(const QString& fragment, const std::optional<QString>& templateHtml) {
    if (!templateHtml) {
        return fragment;
    }
    if (!templateHtml->contains(CONTENT_MARKER)) {
        qCDebug(slateRenderLog) << "template has no content marker; page body is dropped";
    }
    auto page = *templateHtml;
    page.replace(CONTENT_MARKER, fragment);
    return page;
}

Result<TemplateResolver> TemplateResolver::create(const QString& siteRoot, const QString& forcedTemplate) {
    if (forcedTemplate.isEmpty()) {
        return Result<TemplateResolver>::ok(TemplateResolver(siteRoot, std::nullopt));
    }

    if (const auto builtIn = built_in_template_from_name(forcedTemplate)) {
        return Result<TemplateResolver>::ok(TemplateResolver(siteRoot, built_in_template_html(*builtIn)));
    }

    QFile file(forcedTemplate);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<TemplateResolver>::err(make_error(
            ErrorKind::Template,
            QStringLiteral("Template %1 is neither a built-in template (%2) nor a readable file")
                .arg(forcedTemplate, built_in_template_names().join(QStringLiteral(", "))),
            forcedTemplate));
    }
    return Result<TemplateResolver>::ok(TemplateResolver(siteRoot, QString::fromUtf8(file.readAll())));
}

Result<std::optional<QString>> TemplateResolver::template_for(const QString& documentDir) {
    using R = Result<std::optional<QString>>;
    if (forced_) {
        return R::ok(forced_);
    }

    const auto path = find_template(documentDir, siteRoot_);
    if (path.isEmpty()) {
        return R::ok(std::nullopt);
    }
    auto loaded = load(path);
    if (loaded.is_err()) {
        return R::err(loaded.unwrap_err());
    }
    return R::ok(std::optional<QString>(std::move(loaded).unwrap()));
}

Result<QString> TemplateResolver::load(const QString& path) {
    const auto it = cache_.constFind(path);
    if (it != cache_.constEnd()) {
        return Result<QString>::ok(it.value());
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<QString>::err(make_error(
            ErrorKind::Io, QStringLiteral("Failed to read template %1: %2").arg(path, file.errorString()), path));
    }
    const auto html = QString::fromUtf8(file.readAll());
    qCDebug(slateRenderLog) << "loaded template" << path;
    cache_.insert(path, html);
    return Result<QString>::ok(html);
}

} // namespace slate::site
