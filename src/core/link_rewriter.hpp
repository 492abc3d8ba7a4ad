#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace slate {

inline constexpr std::string_view RENDERED_EXTENSION = "html";

// True for the source extensions the site renders ("dj", "djot", "md"), without the dot.
[[nodiscard]] bool is_markup_extension(std::string_view extension);

// Extension of the last path segment, without the dot; empty when there is none.
[[nodiscard]] std::string_view path_extension(std::string_view path);

// Swaps the extension of the last path segment ("a/b.dj" -> "a/b.html").
[[nodiscard]] std::string replace_extension(std::string_view path, std::string_view extension);

struct LinkRewrite {
    std::string destination;
    bool rewritten = false;
    // The referenced source document did not exist when the link was rewritten.
    bool dangling = false;
    // Source document the link resolved to, set when rewritten. Relative links
    // resolve against source_dir, "/"-rooted ones against site_root.
    std::string referenced_path;
};

/**
 * Rewrites link destinations that point at another source document so they
 * point at its rendered page. One instance serves one document; both markup
 * formats feed their link events through the same rewrite() so the
 * destination handling cannot drift between them.
 */
class LinkRewriter {
public:
    using ExistsCheck = std::function<bool(const std::string& path)>;

    LinkRewriter(std::string source_dir, std::string site_root, std::string site_prefix, ExistsCheck exists);

    [[nodiscard]] LinkRewrite rewrite(std::string_view destination) const;

    [[nodiscard]] const std::string& source_dir() const { return source_dir_; }

private:
    std::string source_dir_;
    std::string site_root_;
    std::string site_prefix_;
    ExistsCheck exists_;
};

} // namespace slate
