#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace slate {

/**
 * A directory met during the walk. The site root is depth 0 with an empty
 * relative path; its direct children are depth 1.
 */
struct DirEntry {
    std::size_t depth{0};
    std::string relative_path;

    bool operator==(const DirEntry& other) const = default;
};

/**
 * A converted document. relative_path is '/'-separated, relative to the site
 * root and always ends in ".html". depth is the walk depth of the file itself,
 * so a page directly in the root has depth 1.
 */
struct PageEntry {
    std::size_t depth{0};
    std::string relative_path;
    std::string html;

    bool operator==(const PageEntry& other) const = default;
};

using Entry = std::variant<DirEntry, PageEntry>;

// Pre-order walk order: every entry follows its containing directory.
using Ledger = std::vector<Entry>;

[[nodiscard]] inline std::size_t entry_depth(const Entry& entry) {
    return std::visit([](const auto& e) { return e.depth; }, entry);
}

[[nodiscard]] inline const std::string& entry_path(const Entry& entry) {
    return std::visit([](const auto& e) -> const std::string& { return e.relative_path; }, entry);
}

// Last '/'-separated segment of a relative path.
[[nodiscard]] inline std::string_view path_file_name(std::string_view path) {
    const auto slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

// File name without its final extension ("a/b.html" -> "b").
[[nodiscard]] inline std::string_view path_stem(std::string_view path) {
    const auto name = path_file_name(path);
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return name;
    }
    return name.substr(0, dot);
}

} // namespace slate
