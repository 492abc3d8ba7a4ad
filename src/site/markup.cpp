#include "site/markup.hpp"

#include <cmark.h>

#include <cstdlib>
#include <memory>

#include "markup/djot.hpp"

namespace slate::site {

namespace {

using NodePtr = std::unique_ptr<cmark_node, decltype(&cmark_node_free)>;
using IterPtr = std::unique_ptr<cmark_iter, decltype(&cmark_iter_free)>;

constexpr int CMARK_OPTIONS = CMARK_OPT_DEFAULT | CMARK_OPT_UNSAFE;

// Applies one rewrite and remembers it when the target is missing.
std::string apply_rewrite(const LinkRewriter& rewriter, std::string_view destination, MarkupOutput& out) {
    auto rewrite = rewriter.rewrite(destination);
    auto result = rewrite.destination;
    if (rewrite.dangling) {
        out.danglingLinks.push_back(std::move(rewrite));
    }
    return result;
}

} // namespace

std::optional<MarkupFormat> markup_format_for_suffix(const QString& suffix) {
    if (!is_markup_extension(suffix.toStdString())) {
        return std::nullopt;
    }
    return suffix == QStringLiteral("md") ? MarkupFormat::Markdown : MarkupFormat::Djot;
}

MarkupOutput render_markdown(const QString& markdown, const LinkRewriter& rewriter) {
    MarkupOutput out;
    if (markdown.isEmpty()) {
        return out;
    }

    const auto utf8 = markdown.toUtf8();
    NodePtr doc(cmark_parse_document(utf8.constData(), static_cast<size_t>(utf8.size()), CMARK_OPTIONS),
                cmark_node_free);
    if (!doc) {
        return out;
    }

    {
        IterPtr iter(cmark_iter_new(doc.get()), cmark_iter_free);
        cmark_event_type event;
        while ((event = cmark_iter_next(iter.get())) != CMARK_EVENT_DONE) {
            cmark_node* node = cmark_iter_get_node(iter.get());
            if (event != CMARK_EVENT_ENTER || cmark_node_get_type(node) != CMARK_NODE_LINK) {
                continue;
            }
            const char* url = cmark_node_get_url(node);
            const auto destination = apply_rewrite(rewriter, url ? url : "", out);
            cmark_node_set_url(node, destination.c_str());
        }
    }

    char* html = cmark_render_html(doc.get(), CMARK_OPTIONS);
    if (!html) {
        return out;
    }
    out.html = QString::fromUtf8(html);
    free(html);
    return out;
}

MarkupOutput render_djot(const QString& djot, const LinkRewriter& rewriter) {
    MarkupOutput out;
    auto events = djot::parse(djot.toStdString());

    // Start and End of a link both carry the destination; keep them in step.
    std::vector<std::string> open_links;
    for (auto& ev : events) {
        if (ev.is_start(djot::Container::Link)) {
            ev.destination = apply_rewrite(rewriter, ev.destination, out);
            open_links.push_back(ev.destination);
        } else if (ev.is_end(djot::Container::Link) && !open_links.empty()) {
            ev.destination = open_links.back();
            open_links.pop_back();
        }
    }

    out.html = QString::fromStdString(djot::render_html(events));
    return out;
}

} // namespace slate::site
