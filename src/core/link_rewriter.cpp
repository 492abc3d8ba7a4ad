#include "core/link_rewriter.hpp"

#include <array>
#include <cctype>

namespace slate {

namespace {

constexpr std::array<std::string_view, 3> MARKUP_EXTENSIONS = {"dj", "djot", "md"};

// RFC 3986 scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
bool has_url_scheme(std::string_view destination) {
    const auto colon = destination.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(destination[0]))) {
        return false;
    }
    for (std::size_t i = 1; i < colon; ++i) {
        const auto c = static_cast<unsigned char>(destination[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

std::string join_path(std::string_view dir, std::string_view relative) {
    while (!relative.empty() && relative.front() == '/') {
        relative.remove_prefix(1);
    }
    if (dir.empty()) {
        return std::string(relative);
    }
    std::string out(dir);
    if (out.back() != '/') {
        out += '/';
    }
    out.append(relative);
    return out;
}

// prefix + path with exactly one '/' where they meet.
std::string prefixed(std::string_view prefix, std::string path) {
    if (!prefix.empty() && prefix.back() == '/' && !path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }
    return std::string(prefix) + path;
}

} // namespace

bool is_markup_extension(std::string_view extension) {
    for (const auto candidate : MARKUP_EXTENSIONS) {
        if (candidate == extension) {
            return true;
        }
    }
    return false;
}

std::string_view path_extension(std::string_view path) {
    const auto slash = path.rfind('/');
    const auto name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return {};
    }
    return name.substr(dot + 1);
}

std::string replace_extension(std::string_view path, std::string_view extension) {
    const auto current = path_extension(path);
    std::string out(path.substr(0, path.size() - current.size()));
    if (current.empty()) {
        out += '.';
    }
    out.append(extension);
    return out;
}

LinkRewriter::LinkRewriter(std::string source_dir, std::string site_root, std::string site_prefix,
                           ExistsCheck exists)
    : source_dir_(std::move(source_dir))
    , site_root_(std::move(site_root))
    , site_prefix_(std::move(site_prefix))
    , exists_(std::move(exists)) {
}

LinkRewrite LinkRewriter::rewrite(std::string_view destination) const {
    LinkRewrite result;
    result.destination = std::string(destination);

    if (destination.empty() || destination.front() == '#' || has_url_scheme(destination)) {
        return result;
    }

    // "page.dj#intro" and "page.dj?x=1" keep their suffix.
    const auto suffix_at = destination.find_first_of("?#");
    const auto path = destination.substr(0, suffix_at);
    const auto suffix = suffix_at == std::string_view::npos ? std::string_view{} : destination.substr(suffix_at);

    if (!is_markup_extension(path_extension(path))) {
        return result;
    }

    const bool site_absolute = path.front() == '/';
    result.referenced_path = join_path(site_absolute ? site_root_ : source_dir_, path);
    result.dangling = exists_ ? !exists_(result.referenced_path) : false;
    result.destination = prefixed(site_prefix_, replace_extension(path, RENDERED_EXTENSION)) + std::string(suffix);
    result.rewritten = true;
    return result;
}

} // namespace slate
