#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace slate::djot {

enum class Container {
    Paragraph,
    Heading,
    Blockquote,
    BulletList,
    OrderedList,
    ListItem,
    CodeBlock,
    Emphasis,
    Strong,
    Verbatim,
    Link,
    Image,
};

enum class EventKind {
    Start,
    End,
    Text,
    SoftBreak,
    HardBreak,
    ThematicBreak,
};

/**
 * One step of a parsed djot document.
 *
 * Start/End pairs bracket containers. Link and Image carry their destination
 * on both the Start and the matching End so either can be rewritten; the
 * renderer reads the Start.
 */
struct Event {
    EventKind kind{EventKind::Text};
    Container container{Container::Paragraph};
    std::string text;         // Text payload
    std::string destination;  // Link / Image
    std::string attribute;    // heading id, code block language
    int level = 0;            // heading level, ordered list start
    bool tight = false;       // lists

    [[nodiscard]] bool is_start(Container c) const { return kind == EventKind::Start && container == c; }
    [[nodiscard]] bool is_end(Container c) const { return kind == EventKind::End && container == c; }
};

/**
 * Parses djot markup into an ordered, finite event sequence.
 *
 * Supported blocks: paragraphs, ATX headings (with generated ids), block
 * quotes, bullet and ordered lists (tight and loose), fenced code blocks and
 * thematic breaks. Supported inlines: _emphasis_, *strong*, `verbatim`,
 * [links](dest), reference links ([text][label] and [text][] against
 * `[label]: dest` definitions), ![images](src), <autolinks>, backslash
 * escapes and hard line breaks.
 */
[[nodiscard]] std::vector<Event> parse(std::string_view input);

// Serializes an event sequence to an HTML fragment.
[[nodiscard]] std::string render_html(const std::vector<Event>& events);

} // namespace slate::djot
