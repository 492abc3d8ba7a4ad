#include "core/table_of_contents.hpp"

#include <utility>
#include <vector>

namespace slate {

namespace {

struct PendingFolder {
    std::size_t depth;
    std::string name;
};

std::string escape_html(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

// Open/pending folder bookkeeping for a single page's scan.
class FolderStack {
public:
    explicit FolderStack(std::string& out) : out_(out) {}

    // Drops everything at or below `depth`: pending folders silently (they
    // never held a page), opened folders by closing their list.
    void unwind_to(std::size_t depth) {
        while (!pending_.empty() && pending_.back().depth >= depth) {
            pending_.pop_back();
        }
        while (!opened_.empty() && opened_.back() >= depth) {
            out_ += "</ul>";
            opened_.pop_back();
        }
    }

    void push(std::size_t depth, std::string name) {
        pending_.push_back(PendingFolder{depth, std::move(name)});
    }

    // Pending folders form the ancestor chain of the page being emitted.
    void flush() {
        for (auto& folder : pending_) {
            out_ += "<li><b><u>";
            out_ += escape_html(folder.name);
            out_ += ":</u></b></li><ul>";
            opened_.push_back(folder.depth);
        }
        pending_.clear();
    }

    void close_all() {
        pending_.clear();
        while (!opened_.empty()) {
            out_ += "</ul>";
            opened_.pop_back();
        }
    }

private:
    std::string& out_;
    std::vector<PendingFolder> pending_;
    std::vector<std::size_t> opened_;
};

std::string up_prefix(std::size_t target_depth) {
    std::string up;
    for (std::size_t i = 1; i < target_depth; ++i) {
        up += "../";
    }
    return up;
}

} // namespace

std::string assemble_table_of_contents(const Ledger& ledger,
                                       std::size_t target_depth,
                                       std::string_view target_relative_path,
                                       std::string_view site_prefix) {
    std::string out = "<ul>";
    FolderStack folders(out);
    const auto up = up_prefix(target_depth);

    for (const auto& entry : ledger) {
        if (const auto* dir = std::get_if<DirEntry>(&entry)) {
            folders.unwind_to(dir->depth);
            if (dir->depth > 0) {
                folders.push(dir->depth, std::string(path_file_name(dir->relative_path)));
            }
            continue;
        }

        const auto& page = std::get<PageEntry>(entry);
        folders.unwind_to(page.depth);
        folders.flush();

        const auto stem = escape_html(path_stem(page.relative_path));
        if (page.relative_path == target_relative_path) {
            out += "<li><b>" + stem + "</b></li>";
        } else {
            out += "<li><a href=\"";
            out += up;
            out += escape_html(site_prefix);
            out += escape_html(page.relative_path);
            out += "\">" + stem + "</a></li>";
        }
    }

    folders.close_all();
    out += "</ul>";
    return out;
}

std::string substitute_table_of_contents(std::string_view html, std::string_view toc) {
    std::string out;
    out.reserve(html.size() + toc.size());
    std::size_t pos = 0;
    while (true) {
        const auto hit = html.find(TABLE_OF_CONTENTS_MARKER, pos);
        if (hit == std::string_view::npos) {
            out.append(html.substr(pos));
            break;
        }
        out.append(html.substr(pos, hit - pos));
        out.append(toc);
        pos = hit + TABLE_OF_CONTENTS_MARKER.size();
    }
    return out;
}

} // namespace slate
