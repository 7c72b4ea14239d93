#include "nav/navigation.hpp"

#include <algorithm>
#include <string>

#include "util/file_util.hpp"
#include "util/text_util.hpp"

namespace mangashelf {

bool list_pages(Chapter& chapter, std::vector<Page>& pages, CatalogError& err) {
    std::vector<DirEntry> entries;
    std::string error_msg;
    if (!list_directory(chapter.path, entries, error_msg)) {
        return err.set(ErrorKind::kChapterNotFound,
                       "cannot read pages for chapter " + chapter.number.to_string() +
                       " of manga " + chapter.series_id + ": " + error_msg);
    }

    pages.clear();
    for (const auto& e : entries) {
        if (e.is_dir || is_metadata_file_name(e.name)) continue;

        int number = 0;
        if (!parse_int(file_stem(e.name), number) || number <= 0) {
            number = static_cast<int>(pages.size()) + 1;
        }

        Page page;
        page.number = number;
        page.chapter_id = chapter.id;
        page.series_id = chapter.series_id;
        page.image_path = join_path(chapter.path, e.name);
        pages.push_back(std::move(page));
    }

    std::stable_sort(pages.begin(), pages.end(),
                     [](const Page& a, const Page& b) { return a.number < b.number; });

    chapter.page_count = static_cast<int>(pages.size());
    return true;
}

size_t find_page(const std::vector<Page>& pages, int number) {
    for (size_t i = 0; i < pages.size(); i++) {
        if (pages[i].number == number) return i;
    }
    return kNoPage;
}

bool first_page(Chapter& chapter, Page& out, CatalogError& err) {
    std::vector<Page> pages;
    if (!list_pages(chapter, pages, err)) return false;
    if (pages.empty()) {
        return err.set(ErrorKind::kPageNotFound, "chapter has no pages");
    }
    out = pages.front();
    return true;
}

bool resolve_page_view(const std::vector<Chapter>& chapters, size_t chapter_index,
                       const std::vector<Page>& pages, int page_number,
                       PageView& view, CatalogError& err) {
    size_t idx = find_page(pages, page_number);
    if (idx == kNoPage) {
        std::string chapter_label = chapter_index < chapters.size()
            ? chapters[chapter_index].number.to_string() : "?";
        return err.set(ErrorKind::kPageNotFound,
                       "page " + std::to_string(page_number) +
                       " not found in chapter " + chapter_label);
    }

    view = PageView{};
    view.page = pages[idx];
    view.total_pages = static_cast<int>(pages.size());
    view.next_page = next_page_number(view.page);
    view.prev_page = prev_page_number(view.page);

    if (page_number >= view.total_pages && chapter_index + 1 < chapters.size()) {
        view.next_chapter = chapters[chapter_index + 1].number;
    }
    if (page_number == 1 && chapter_index > 0 && chapter_index < chapters.size()) {
        view.prev_chapter = chapters[chapter_index - 1].number;
    }
    return true;
}

} // namespace mangashelf
