#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "core/types.hpp"
#include "model/catalog_error.hpp"
#include "model/chapter.hpp"
#include "model/page.hpp"

namespace mangashelf {

// A page together with its reader navigation.
struct PageView {
    Page page;
    int total_pages = 0;
    int next_page = 0;                           // unbounded: number + 1
    int prev_page = 0;                           // 0 = none
    std::optional<ChapterNumber> next_chapter;   // set on the last page only
    std::optional<ChapterNumber> prev_chapter;   // set on page 1 only
};

// Pages of a chapter ordered by number.
//
// Directories and metadata files (metadata.json or any .json) are skipped.
// A page number is the integer value of the file stem ("007.jpg" -> 7);
// files whose stem is not a positive integer get pages_so_far + 1 in name
// order. The sort is stable, so equal numbers keep discovery order.
// Overwrites chapter.page_count. kChapterNotFound when the chapter directory
// cannot be listed.
bool list_pages(Chapter& chapter, std::vector<Page>& pages, CatalogError& err);

inline constexpr size_t kNoPage = static_cast<size_t>(-1);

// Index of the first page numbered `number`, or kNoPage.
size_t find_page(const std::vector<Page>& pages, int number);

// First page of a chapter; kPageNotFound when the chapter has none.
bool first_page(Chapter& chapter, Page& out, CatalogError& err);

inline int next_page_number(const Page& page) { return page.number + 1; }
inline int prev_page_number(const Page& page) {
    return page.number <= 1 ? 0 : page.number - 1;
}

// Build the view of page `page_number` of chapters[chapter_index].
//
// Chapter adjacency follows the array order of `chapters` (scan order),
// not numeric order: next_chapter is set when page_number >= pages.size()
// and a following entry exists; prev_chapter when page_number == 1 and a
// preceding entry exists. kPageNotFound when no page has that number.
bool resolve_page_view(const std::vector<Chapter>& chapters, size_t chapter_index,
                       const std::vector<Page>& pages, int page_number,
                       PageView& view, CatalogError& err);

} // namespace mangashelf
