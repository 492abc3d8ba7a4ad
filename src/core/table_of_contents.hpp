#pragma once

#include "core/ledger.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace slate {

// Placeholder a page template carries where the navigation list goes.
inline constexpr std::string_view TABLE_OF_CONTENTS_MARKER = "<!-- {TABLE_OF_CONTENTS} -->";

/**
 * Builds the navigation list shown on one page.
 *
 * Scans the whole ledger once and reconstructs nested <ul> lists from entry
 * depths:
 * - folders become non-clickable headings, opened only when a page inside
 *   them is reached (folders without pages never appear);
 * - the page at target_relative_path is emitted in bold, unlinked;
 * - every other page links to "../" x (target_depth - 1) + site_prefix + path.
 *
 * The result is always balanced and depends only on its arguments.
 */
[[nodiscard]] std::string assemble_table_of_contents(const Ledger& ledger,
                                                     std::size_t target_depth,
                                                     std::string_view target_relative_path,
                                                     std::string_view site_prefix);

// Replaces every TABLE_OF_CONTENTS_MARKER in html with toc.
[[nodiscard]] std::string substitute_table_of_contents(std::string_view html, std::string_view toc);

} // namespace slate
