#include "markup/djot.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <utility>

namespace slate::djot {

namespace {

using Lines = std::vector<std::string>;

// Reference label -> destination.
using References = std::map<std::string, std::string>;

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_blank(std::string_view line) {
    for (const char c : line) {
        if (!is_space(c)) return false;
    }
    return true;
}

std::size_t leading_spaces(std::string_view line) {
    std::size_t n = 0;
    while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) n++;
    return n;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

Lines split_lines(std::string_view input) {
    Lines lines;
    std::size_t start = 0;
    while (start <= input.size()) {
        auto end = input.find('\n', start);
        if (end == std::string_view::npos) end = input.size();
        auto line = input.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

std::string escape_html(std::string_view text, bool attribute) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"':
                if (attribute) {
                    out += "&quot;";
                } else {
                    out += c;
                }
                break;
            default: out += c; break;
        }
    }
    return out;
}

Event start_event(Container c, std::string destination = {}) {
    Event ev;
    ev.kind = EventKind::Start;
    ev.container = c;
    ev.destination = std::move(destination);
    return ev;
}

Event end_event(Container c, std::string destination = {}) {
    Event ev;
    ev.kind = EventKind::End;
    ev.container = c;
    ev.destination = std::move(destination);
    return ev;
}

// ============================================================================
// Inlines
// ============================================================================

// A `verbatim` span starting at s[i]: closed by a backtick run of the same length.
struct VerbatimSpan {
    std::size_t content_begin;
    std::size_t content_end;
    std::size_t next;
};

std::optional<VerbatimSpan> verbatim_at(std::string_view s, std::size_t i) {
    std::size_t run = 0;
    while (i + run < s.size() && s[i + run] == '`') run++;
    std::size_t j = i + run;
    while (j < s.size()) {
        if (s[j] != '`') {
            j++;
            continue;
        }
        std::size_t close = 0;
        while (j + close < s.size() && s[j + close] == '`') close++;
        if (close == run) {
            return VerbatimSpan{i + run, j, j + close};
        }
        j += close;
    }
    return std::nullopt;
}

std::size_t skip_verbatim(std::string_view s, std::size_t i) {
    if (const auto span = verbatim_at(s, i)) return span->next;
    while (i < s.size() && s[i] == '`') i++;
    return i;
}

std::optional<std::size_t> closing_bracket(std::string_view s, std::size_t open) {
    int depth = 0;
    for (std::size_t j = open; j < s.size();) {
        const char c = s[j];
        if (c == '\\') {
            j += 2;
            continue;
        }
        if (c == '`') {
            j = skip_verbatim(s, j);
            continue;
        }
        if (c == '[') depth++;
        if (c == ']' && --depth == 0) return j;
        j++;
    }
    return std::nullopt;
}

std::optional<std::size_t> closing_paren(std::string_view s, std::size_t open) {
    int depth = 0;
    for (std::size_t j = open; j < s.size(); j++) {
        const char c = s[j];
        if (c == '\\') {
            j++;
            continue;
        }
        if (c == '(') depth++;
        if (c == ')' && --depth == 0) return j;
    }
    return std::nullopt;
}

// Labels match after trimming and collapsing whitespace runs to one space.
std::string normalize_label(std::string_view label) {
    std::string out;
    bool pending_space = false;
    for (const char c : trim(label)) {
        if (is_space(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

struct InlineLink {
    std::size_t text_begin;
    std::size_t text_end;
    std::string destination;
    std::size_t next;
};

// [text](destination), [text][label] or [text][] with s[open] == '['.
std::optional<InlineLink> inline_link_at(std::string_view s, std::size_t open, const References& references) {
    const auto close = closing_bracket(s, open);
    if (!close || *close + 1 >= s.size()) return std::nullopt;

    if (s[*close + 1] == '[') {
        const auto label_end = s.find(']', *close + 2);
        if (label_end == std::string_view::npos) return std::nullopt;
        auto label = s.substr(*close + 2, label_end - *close - 2);
        if (label.empty()) label = s.substr(open + 1, *close - open - 1);
        const auto found = references.find(normalize_label(label));
        if (found == references.end()) return std::nullopt;
        return InlineLink{open + 1, *close, found->second, label_end + 1};
    }

    if (s[*close + 1] != '(') return std::nullopt;
    const auto paren = closing_paren(s, *close + 1);
    if (!paren) return std::nullopt;

    std::string destination;
    for (const char c : s.substr(*close + 2, *paren - *close - 2)) {
        if (c != '\n' && c != '\r') destination += c;
    }
    return InlineLink{open + 1, *close, std::string(trim(destination)), *paren + 1};
}

struct Autolink {
    std::string label;
    std::string destination;
    std::size_t next;
};

std::optional<Autolink> autolink_at(std::string_view s, std::size_t open) {
    const auto close = s.find('>', open + 1);
    if (close == std::string_view::npos || close == open + 1) return std::nullopt;
    const auto body = s.substr(open + 1, close - open - 1);
    for (const char c : body) {
        if (is_space(c) || c == '<') return std::nullopt;
    }
    if (body.find(':') != std::string_view::npos) {
        return Autolink{std::string(body), std::string(body), close + 1};
    }
    if (body.find('@') != std::string_view::npos) {
        return Autolink{std::string(body), "mailto:" + std::string(body), close + 1};
    }
    return std::nullopt;
}

// First closing `delim` after `from` that is not preceded by whitespace.
// Verbatim spans, escapes, links and autolinks are opaque to the search.
std::optional<std::size_t> emphasis_closer(std::string_view s, std::size_t from, char delim,
                                           const References& references) {
    for (std::size_t j = from; j < s.size();) {
        const char c = s[j];
        if (c == '\\') {
            j += 2;
            continue;
        }
        if (c == '`') {
            j = skip_verbatim(s, j);
            continue;
        }
        if (c == '[') {
            if (const auto link = inline_link_at(s, j, references)) {
                j = link->next;
                continue;
            }
        }
        if (c == '<') {
            if (const auto autolink = autolink_at(s, j)) {
                j = autolink->next;
                continue;
            }
        }
        if (c == delim && j > from && !is_space(s[j - 1])) return j;
        j++;
    }
    return std::nullopt;
}

class InlineParser {
public:
    InlineParser(std::vector<Event>& out, const References& references)
        : out_(out)
        , references_(references) {
    }

    void parse(std::string_view s) {
        std::size_t i = 0;
        while (i < s.size()) {
            const char c = s[i];

            if (c == '\\') {
                if (i + 1 < s.size() && s[i + 1] == '\n') {
                    trim_trailing_text();
                    flush();
                    Event ev;
                    ev.kind = EventKind::HardBreak;
                    out_.push_back(std::move(ev));
                    i += 2;
                    continue;
                }
                if (i + 1 < s.size() && std::ispunct(static_cast<unsigned char>(s[i + 1]))) {
                    text_ += s[i + 1];
                    i += 2;
                    continue;
                }
                text_ += c;
                i++;
                continue;
            }

            if (c == '\n') {
                trim_trailing_text();
                flush();
                Event ev;
                ev.kind = EventKind::SoftBreak;
                out_.push_back(std::move(ev));
                i++;
                continue;
            }

            if (c == '`') {
                if (const auto span = verbatim_at(s, i)) {
                    flush();
                    out_.push_back(start_event(Container::Verbatim));
                    text_ = std::string(s.substr(span->content_begin, span->content_end - span->content_begin));
                    flush();
                    out_.push_back(end_event(Container::Verbatim));
                    i = span->next;
                    continue;
                }
                const auto next = skip_verbatim(s, i);
                text_.append(s.substr(i, next - i));
                i = next;
                continue;
            }

            if (c == '!' && i + 1 < s.size() && s[i + 1] == '[') {
                if (const auto link = inline_link_at(s, i + 1, references_)) {
                    emit_link(Container::Image, s, *link);
                    i = link->next;
                    continue;
                }
            }

            if (c == '[') {
                if (const auto link = inline_link_at(s, i, references_)) {
                    emit_link(Container::Link, s, *link);
                    i = link->next;
                    continue;
                }
            }

            if (c == '<') {
                if (const auto autolink = autolink_at(s, i)) {
                    flush();
                    out_.push_back(start_event(Container::Link, autolink->destination));
                    text_ = autolink->label;
                    flush();
                    out_.push_back(end_event(Container::Link, autolink->destination));
                    i = autolink->next;
                    continue;
                }
            }

            if ((c == '_' || c == '*') && i + 1 < s.size() && !is_space(s[i + 1])) {
                if (const auto closer = emphasis_closer(s, i + 1, c, references_)) {
                    const auto container = c == '_' ? Container::Emphasis : Container::Strong;
                    flush();
                    out_.push_back(start_event(container));
                    parse(s.substr(i + 1, *closer - i - 1));
                    flush();
                    out_.push_back(end_event(container));
                    i = *closer + 1;
                    continue;
                }
            }

            text_ += c;
            i++;
        }
        flush();
    }

private:
    void emit_link(Container container, std::string_view s, const InlineLink& link) {
        flush();
        out_.push_back(start_event(container, link.destination));
        parse(s.substr(link.text_begin, link.text_end - link.text_begin));
        flush();
        out_.push_back(end_event(container, link.destination));
    }

    void trim_trailing_text() {
        while (!text_.empty() && (text_.back() == ' ' || text_.back() == '\t')) text_.pop_back();
    }

    void flush() {
        if (text_.empty()) return;
        Event ev;
        ev.kind = EventKind::Text;
        ev.text = std::move(text_);
        out_.push_back(std::move(ev));
        text_.clear();
    }

    std::vector<Event>& out_;
    const References& references_;
    std::string text_;
};

// ============================================================================
// Blocks
// ============================================================================

struct ListMarker {
    bool ordered = false;
    char delimiter = '-';
    int number = 1;
    std::size_t content_offset = 0;
};

std::optional<ListMarker> list_marker(std::string_view line) {
    const auto i = leading_spaces(line);
    if (i >= line.size()) return std::nullopt;

    const char c = line[i];
    if (c == '-' || c == '*' || c == '+') {
        if (i + 1 == line.size() || line[i + 1] == ' ') {
            return ListMarker{false, c, 1, std::min(i + 2, line.size())};
        }
        return std::nullopt;
    }

    std::size_t j = i;
    int number = 0;
    while (j < line.size() && std::isdigit(static_cast<unsigned char>(line[j])) && j - i < 9) {
        number = number * 10 + (line[j] - '0');
        j++;
    }
    if (j == i || j >= line.size() || (line[j] != '.' && line[j] != ')')) return std::nullopt;
    if (j + 1 < line.size() && line[j + 1] != ' ') return std::nullopt;
    return ListMarker{true, line[j], number, std::min(j + 2, line.size())};
}

bool same_list(const ListMarker& a, const ListMarker& b) {
    return a.ordered == b.ordered && a.delimiter == b.delimiter;
}

bool is_thematic_break(std::string_view line) {
    char mark = 0;
    int count = 0;
    for (const char c : line) {
        if (c == ' ' || c == '\t') continue;
        if (c != '*' && c != '-') return false;
        if (mark != 0 && c != mark) return false;
        mark = c;
        count++;
    }
    return count >= 3;
}

int heading_level(std::string_view line) {
    int level = 0;
    while (static_cast<std::size_t>(level) < line.size() && line[level] == '#') level++;
    if (level == 0 || level > 6) return 0;
    if (static_cast<std::size_t>(level) < line.size() && line[level] != ' ') return 0;
    return level;
}

std::size_t fence_length(std::string_view line) {
    const auto body = line.substr(leading_spaces(line));
    std::size_t n = 0;
    while (n < body.size() && body[n] == '`') n++;
    return n >= 3 ? n : 0;
}

struct ReferenceDefinition {
    std::string label;
    std::string destination;
};

// `[label]: destination` on a line of its own.
std::optional<ReferenceDefinition> reference_definition(std::string_view line) {
    line = trim(line);
    if (line.size() < 4 || line.front() != '[') return std::nullopt;
    const auto close = line.find(']');
    if (close == std::string_view::npos || close == 1 || close + 1 >= line.size() || line[close + 1] != ':') {
        return std::nullopt;
    }
    const auto label = line.substr(1, close - 1);
    if (label.find('[') != std::string_view::npos) return std::nullopt;
    const auto destination = trim(line.substr(close + 2));
    if (destination.empty()) return std::nullopt;
    return ReferenceDefinition{normalize_label(label), std::string(destination)};
}

bool is_blockquote_line(std::string_view line) {
    const auto i = leading_spaces(line);
    return i < line.size() && line[i] == '>' && (i + 1 == line.size() || line[i + 1] == ' ');
}

// Heading ids follow djot: punctuation dropped, whitespace runs become '-'.
class IdRegistry {
public:
    std::string unique(std::string_view heading_text) {
        std::string id;
        bool pending_separator = false;
        for (const char c : heading_text) {
            const auto u = static_cast<unsigned char>(c);
            if (is_space(c)) {
                pending_separator = !id.empty();
                continue;
            }
            if (u < 0x80 && std::ispunct(u) && c != '-' && c != '_') continue;
            if (pending_separator) {
                id += '-';
                pending_separator = false;
            }
            id += c;
        }
        if (id.empty()) id = "s";

        auto& count = used_[id];
        count++;
        return count == 1 ? id : id + "-" + std::to_string(count - 1);
    }

private:
    std::map<std::string, int> used_;
};

class BlockParser {
public:
    BlockParser(std::vector<Event>& out, References& references)
        : out_(out)
        , references_(references) {
    }

    void parse(const Lines& lines) {
        std::size_t i = 0;
        while (i < lines.size()) {
            const std::string_view line = lines[i];
            if (is_blank(line)) {
                i++;
                continue;
            }
            if (const auto fence = fence_length(line)) {
                i = parse_code_block(lines, i, fence);
            } else if (is_thematic_break(line)) {
                Event ev;
                ev.kind = EventKind::ThematicBreak;
                out_.push_back(std::move(ev));
                i++;
            } else if (const auto level = heading_level(line.substr(leading_spaces(line)))) {
                i = parse_heading(lines, i, level);
            } else if (is_blockquote_line(line)) {
                i = parse_blockquote(lines, i);
            } else if (const auto marker = list_marker(line)) {
                i = parse_list(lines, i, *marker);
            } else if (auto definition = reference_definition(line)) {
                // The first definition of a label wins.
                references_.emplace(std::move(definition->label), std::move(definition->destination));
                i++;
            } else {
                i = parse_paragraph(lines, i);
            }
        }
    }

private:
    std::size_t parse_code_block(const Lines& lines, std::size_t i, std::size_t fence) {
        const std::string_view opener = lines[i];
        const auto language = trim(opener.substr(leading_spaces(opener) + fence));

        std::string body;
        i++;
        while (i < lines.size()) {
            const std::string_view line = lines[i];
            const auto closing = fence_length(line);
            if (closing >= fence && is_blank(line.substr(leading_spaces(line) + closing))) {
                i++;
                break;
            }
            body.append(line);
            body += '\n';
            i++;
        }

        auto start = start_event(Container::CodeBlock);
        start.attribute = std::string(language.substr(0, language.find(' ')));
        out_.push_back(std::move(start));
        if (!body.empty()) {
            Event text;
            text.kind = EventKind::Text;
            text.text = std::move(body);
            out_.push_back(std::move(text));
        }
        out_.push_back(end_event(Container::CodeBlock));
        return i;
    }

    std::size_t parse_heading(const Lines& lines, std::size_t i, int level) {
        std::string text;
        while (i < lines.size() && !is_blank(lines[i])) {
            std::string_view line = trim(lines[i]);
            if (heading_level(line) == level) {
                line = trim(line.substr(static_cast<std::size_t>(level)));
            }
            if (!text.empty()) text += '\n';
            text.append(line);
            i++;
        }

        const auto start_index = out_.size();
        auto start = start_event(Container::Heading);
        start.level = level;
        out_.push_back(std::move(start));
        InlineParser(out_, references_).parse(text);

        std::string plain;
        for (std::size_t k = start_index + 1; k < out_.size(); k++) {
            if (out_[k].kind == EventKind::Text) plain += out_[k].text;
            if (out_[k].kind == EventKind::SoftBreak) plain += ' ';
        }
        out_[start_index].attribute = ids_.unique(plain);

        auto end = end_event(Container::Heading);
        end.level = level;
        out_.push_back(std::move(end));
        return i;
    }

    std::size_t parse_blockquote(const Lines& lines, std::size_t i) {
        Lines inner;
        while (i < lines.size() && !is_blank(lines[i])) {
            const std::string_view line = lines[i];
            if (is_blockquote_line(line)) {
                auto rest = line.substr(leading_spaces(line) + 1);
                if (!rest.empty() && rest.front() == ' ') rest.remove_prefix(1);
                inner.emplace_back(rest);
            } else {
                inner.emplace_back(line);
            }
            i++;
        }

        out_.push_back(start_event(Container::Blockquote));
        parse(inner);
        out_.push_back(end_event(Container::Blockquote));
        return i;
    }

    std::size_t parse_list(const Lines& lines, std::size_t i, const ListMarker& first) {
        std::vector<Lines> items;
        bool tight = true;
        bool pending_blank = false;
        std::size_t indent = 0;

        while (i < lines.size()) {
            const std::string_view line = lines[i];
            if (is_blank(line)) {
                pending_blank = true;
                i++;
                continue;
            }

            const auto lead = leading_spaces(line);
            if (lead < indent || items.empty()) {
                if (is_thematic_break(line) && !items.empty()) break;
                const auto marker = list_marker(line);
                if (marker && same_list(*marker, first)) {
                    if (pending_blank && !items.empty()) tight = false;
                    items.emplace_back();
                    items.back().emplace_back(line.substr(marker->content_offset));
                    indent = marker->content_offset;
                    pending_blank = false;
                    i++;
                    continue;
                }
                if (pending_blank || marker || is_blockquote_line(line) || fence_length(line) ||
                    heading_level(line.substr(lead)) != 0) {
                    break;
                }
                // Lazy paragraph continuation.
                items.back().emplace_back(line.substr(lead));
                i++;
                continue;
            }

            if (pending_blank) {
                tight = false;
                items.back().emplace_back();
            }
            items.back().emplace_back(line.substr(indent));
            pending_blank = false;
            i++;
        }

        const auto container = first.ordered ? Container::OrderedList : Container::BulletList;
        auto start = start_event(container);
        start.level = first.number;
        start.tight = tight;
        out_.push_back(std::move(start));
        for (const auto& item : items) {
            out_.push_back(start_event(Container::ListItem));
            parse(item);
            out_.push_back(end_event(Container::ListItem));
        }
        auto end = end_event(container);
        end.tight = tight;
        out_.push_back(std::move(end));
        return i;
    }

    std::size_t parse_paragraph(const Lines& lines, std::size_t i) {
        std::string text;
        while (i < lines.size() && !is_blank(lines[i])) {
            if (!text.empty()) text += '\n';
            text.append(trim(lines[i]));
            i++;
        }
        out_.push_back(start_event(Container::Paragraph));
        InlineParser(out_, references_).parse(text);
        out_.push_back(end_event(Container::Paragraph));
        return i;
    }

    std::vector<Event>& out_;
    References& references_;
    IdRegistry ids_;
};

} // namespace

std::vector<Event> parse(std::string_view input) {
    const auto lines = split_lines(input);

    // A definition may follow its first use, so a first pass only collects them.
    References references;
    std::vector<Event> discarded;
    BlockParser(discarded, references).parse(lines);

    std::vector<Event> events;
    BlockParser(events, references).parse(lines);
    return events;
}

std::string render_html(const std::vector<Event>& events) {
    std::string out;
    // One entry per open list or block quote: whether paragraphs are bare.
    std::vector<bool> tight_context;
    int image_depth = 0;
    std::string image_alt;
    std::string image_src;

    const auto in_tight_item = [&tight_context]() {
        return !tight_context.empty() && tight_context.back();
    };
    const auto ensure_newline = [&out]() {
        if (!out.empty() && out.back() != '\n') out += '\n';
    };

    for (const auto& ev : events) {
        if (image_depth > 0) {
            if (ev.kind == EventKind::Text) image_alt += ev.text;
            if (ev.kind == EventKind::SoftBreak || ev.kind == EventKind::HardBreak) image_alt += ' ';
            if (ev.is_start(Container::Image)) image_depth++;
            if (ev.is_end(Container::Image) && --image_depth == 0) {
                out += "<img alt=\"" + escape_html(image_alt, true) + "\" src=\"" +
                       escape_html(image_src, true) + "\">";
            }
            continue;
        }

        switch (ev.kind) {
            case EventKind::Text:
                out += escape_html(ev.text, false);
                break;
            case EventKind::SoftBreak:
                out += '\n';
                break;
            case EventKind::HardBreak:
                out += "<br>\n";
                break;
            case EventKind::ThematicBreak:
                out += "<hr>\n";
                break;
            case EventKind::Start:
                switch (ev.container) {
                    case Container::Paragraph:
                        if (!in_tight_item()) out += "<p>";
                        break;
                    case Container::Heading:
                        out += "<h" + std::to_string(ev.level);
                        if (!ev.attribute.empty()) out += " id=\"" + escape_html(ev.attribute, true) + "\"";
                        out += '>';
                        break;
                    case Container::Blockquote:
                        tight_context.push_back(false);
                        out += "<blockquote>\n";
                        break;
                    case Container::BulletList:
                        ensure_newline();
                        tight_context.push_back(ev.tight);
                        out += "<ul>\n";
                        break;
                    case Container::OrderedList:
                        ensure_newline();
                        tight_context.push_back(ev.tight);
                        out += ev.level == 1 ? std::string("<ol>\n")
                                             : "<ol start=\"" + std::to_string(ev.level) + "\">\n";
                        break;
                    case Container::ListItem:
                        out += in_tight_item() ? "<li>" : "<li>\n";
                        break;
                    case Container::CodeBlock:
                        out += "<pre><code";
                        if (!ev.attribute.empty()) {
                            out += " class=\"language-" + escape_html(ev.attribute, true) + "\"";
                        }
                        out += '>';
                        break;
                    case Container::Emphasis: out += "<em>"; break;
                    case Container::Strong: out += "<strong>"; break;
                    case Container::Verbatim: out += "<code>"; break;
                    case Container::Link:
                        out += "<a href=\"" + escape_html(ev.destination, true) + "\">";
                        break;
                    case Container::Image:
                        image_depth = 1;
                        image_alt.clear();
                        image_src = ev.destination;
                        break;
                }
                break;
            case EventKind::End:
                switch (ev.container) {
                    case Container::Paragraph:
                        if (!in_tight_item()) out += "</p>\n";
                        break;
                    case Container::Heading:
                        out += "</h" + std::to_string(ev.level) + ">\n";
                        break;
                    case Container::Blockquote:
                        if (!tight_context.empty()) tight_context.pop_back();
                        out += "</blockquote>\n";
                        break;
                    case Container::BulletList:
                        if (!tight_context.empty()) tight_context.pop_back();
                        out += "</ul>\n";
                        break;
                    case Container::OrderedList:
                        if (!tight_context.empty()) tight_context.pop_back();
                        out += "</ol>\n";
                        break;
                    case Container::ListItem:
                        out += "</li>\n";
                        break;
                    case Container::CodeBlock: out += "</code></pre>\n"; break;
                    case Container::Emphasis: out += "</em>"; break;
                    case Container::Strong: out += "</strong>"; break;
                    case Container::Verbatim: out += "</code>"; break;
                    case Container::Link: out += "</a>"; break;
                    case Container::Image: break;
                }
                break;
        }
    }
    return out;
}

} // namespace slate::djot
