#include "site/page_renderer.hpp"

#include <QFile>
#include <QFileInfo>

#include "core/link_rewriter.hpp"
#include "site/logging.hpp"
#include "site/problem_reporter.hpp"
#include "site/templates.hpp"

namespace slate::site {

Result<QString> PageRenderer::render(const QString& text,
                                     MarkupFormat format,
                                     const QString& sourceDir,
                                     const std::optional<QString>& templateHtml) {
    const LinkRewriter rewriter(sourceDir.toStdString(), siteRoot_.toStdString(), webPrefix_.toStdString(),
                                [](const std::string& path) {
                                    return QFileInfo::exists(QString::fromStdString(path));
                                });

    auto output = format == MarkupFormat::Markdown ? render_markdown(text, rewriter)
                                                   : render_djot(text, rewriter);

    for (const auto& link : output.danglingLinks) {
        const auto path = QString::fromStdString(link.referenced_path);
        const auto status = reporter_.report(ErrorKind::DanglingLink, dangling_link_message(path), path,
                                             slateRenderLog);
        if (status.is_err()) {
            return Result<QString>::err(status.unwrap_err());
        }
    }

    return Result<QString>::ok(wrap_html_content(output.html, templateHtml));
}

Result<QString> PageRenderer::render_file(const QString& filePath, MarkupFormat format) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<QString>::err(make_error(
            ErrorKind::Io, QStringLiteral("Failed to read %1: %2").arg(filePath, file.errorString()), filePath));
    }
    const auto text = QString::fromUtf8(file.readAll());
    const auto sourceDir = QFileInfo(filePath).absolutePath();

    return templates_.template_for(sourceDir).and_then([&](std::optional<QString> templateHtml) {
        qCDebug(slateRenderLog) << "rendering" << filePath;
        return render(text, format, sourceDir, templateHtml);
    });
}

} // namespace slate::site
