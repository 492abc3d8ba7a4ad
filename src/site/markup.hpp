#pragma once

#include <QString>

#include <optional>
#include <vector>

#include "core/link_rewriter.hpp"

namespace slate::site {

enum class MarkupFormat {
    Djot,
    Markdown,
};

// "dj"/"djot" -> Djot, "md" -> Markdown, anything else -> nullopt.
[[nodiscard]] std::optional<MarkupFormat> markup_format_for_suffix(const QString& suffix);

struct MarkupOutput {
    QString html;
    // Links that were rewritten although their source document is missing.
    std::vector<LinkRewrite> danglingLinks;
};

// Parses CommonMark with cmark, rewrites link URLs through the rewriter and
// renders HTML. Raw HTML in the source is passed through.
[[nodiscard]] MarkupOutput render_markdown(const QString& markdown, const LinkRewriter& rewriter);

// Parses djot, rewrites link events through the rewriter and renders HTML.
[[nodiscard]] MarkupOutput render_djot(const QString& djot, const LinkRewriter& rewriter);

} // namespace slate::site
