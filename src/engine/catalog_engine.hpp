#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "model/catalog_error.hpp"
#include "model/chapter.hpp"
#include "model/page.hpp"
#include "model/series.hpp"
#include "nav/navigation.hpp"
#include "scan/catalog_scanner.hpp"
#include "store/record_store.hpp"
#include "util/logger.hpp"

namespace mangashelf {

struct ChapterDetail {
    Chapter chapter;
    std::vector<Page> pages;
};

// Admin input for a new series. The id is the slug of the title.
struct SeriesDraft {
    std::string title;
    std::string description;
    std::string author;
    std::string artist;
    std::vector<std::string> genres;
    std::string status;
};

// Partial series update: empty fields leave the stored value unchanged.
using SeriesPatch = SeriesDraft;

struct ChapterDraft {
    ChapterNumber number;
    std::string title;
    int volume = 0;
    bool special = false;
};

// Title is replaced only when non-empty; volume and special always are.
struct ChapterPatch {
    std::string title;
    int volume = 0;
    bool special = false;
};

// Query and admin API over one catalog root. Bound to its root for its
// lifetime; keeps no cache, so each call reflects the current disk state.
// Every operation returns false and fills `err` on failure.
class CatalogEngine {
public:
    CatalogEngine(const std::string& root_dir, const Logger& logger);

    // Shares ownership of the logger, for engines that may outlive the
    // scope that created the logger (detached request workers).
    CatalogEngine(const std::string& root_dir, std::shared_ptr<const Logger> logger);

    const std::string& root_dir() const { return scanner_.root_dir(); }

    bool list_series(std::vector<Series>& out, CatalogError& err) const;
    bool get_series(const std::string& id, Series& out, CatalogError& err) const;
    bool list_chapters(const std::string& series_id, std::vector<Chapter>& out,
                       CatalogError& err) const;

    // Chapter with its ordered pages; page_count reflects the listing.
    bool get_chapter(const std::string& series_id, const ChapterNumber& number,
                     ChapterDetail& out, CatalogError& err) const;

    // One page with navigation. Image dimensions are filled best-effort.
    bool get_page(const std::string& series_id, const ChapterNumber& number,
                  int page_number, PageView& out, CatalogError& err) const;

    // Case-insensitive match of `query` against title, description and alt
    // titles, and of `genre` against genres (equality). Empty filters match
    // everything.
    bool search(const std::string& query, const std::string& genre,
                std::vector<Series>& out, CatalogError& err) const;

    bool create_series(const SeriesDraft& draft, Series& out, CatalogError& err) const;
    bool update_series(const std::string& id, const SeriesPatch& patch,
                       Series& out, CatalogError& err) const;
    bool create_chapter(const std::string& series_id, const ChapterDraft& draft,
                        Chapter& out, CatalogError& err) const;
    bool update_chapter(const std::string& series_id, const ChapterNumber& number,
                        const ChapterPatch& patch, Chapter& out,
                        CatalogError& err) const;

private:
    // Declared first: constructed before and destroyed after the members
    // that refer to it. Null when the logger is borrowed.
    std::shared_ptr<const Logger> owned_logger_;
    const Logger& logger_;
    CatalogScanner scanner_;
    RecordStore store_;

    // Series, its chapters, and the index of chapter `number` among them.
    bool locate_chapter(const std::string& series_id, const ChapterNumber& number,
                        std::vector<Chapter>& chapters, size_t& index,
                        CatalogError& err) const;
};

} // namespace mangashelf
