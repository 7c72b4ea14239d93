#include "engine/catalog_engine.hpp"

#include "util/file_util.hpp"
#include "util/text_util.hpp"
#include "util/time_format.hpp"

namespace mangashelf {

CatalogEngine::CatalogEngine(const std::string& root_dir, const Logger& logger)
    : logger_(logger), scanner_(root_dir, logger), store_(logger) {}

CatalogEngine::CatalogEngine(const std::string& root_dir,
                             std::shared_ptr<const Logger> logger)
    : owned_logger_(std::move(logger)),
      logger_(*owned_logger_),
      scanner_(root_dir, *owned_logger_),
      store_(*owned_logger_) {}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool CatalogEngine::list_series(std::vector<Series>& out, CatalogError& err) const {
    return scanner_.scan_series(out, err);
}

bool CatalogEngine::get_series(const std::string& id, Series& out,
                               CatalogError& err) const {
    return scanner_.get_series_by_id(id, out, err);
}

bool CatalogEngine::list_chapters(const std::string& series_id,
                                  std::vector<Chapter>& out,
                                  CatalogError& err) const {
    Series series;
    if (!scanner_.get_series_by_id(series_id, series, err)) return false;
    return scanner_.scan_chapters(series, out, err);
}

bool CatalogEngine::locate_chapter(const std::string& series_id,
                                   const ChapterNumber& number,
                                   std::vector<Chapter>& chapters, size_t& index,
                                   CatalogError& err) const {
    Series series;
    if (!scanner_.get_series_by_id(series_id, series, err)) return false;
    if (!scanner_.scan_chapters(series, chapters, err)) return false;

    index = CatalogScanner::find_chapter(chapters, number);
    if (index == CatalogScanner::npos) {
        logger_.warn("Chapter %s not found in manga %s",
                     number.to_string().c_str(), series_id.c_str());
        return err.set(ErrorKind::kChapterNotFound,
                       "chapter " + number.to_string() + " not found in manga " + series_id);
    }
    return true;
}

bool CatalogEngine::get_chapter(const std::string& series_id,
                                const ChapterNumber& number,
                                ChapterDetail& out, CatalogError& err) const {
    std::vector<Chapter> chapters;
    size_t index = 0;
    if (!locate_chapter(series_id, number, chapters, index, err)) return false;

    out.chapter = chapters[index];
    if (!list_pages(out.chapter, out.pages, err)) {
        logger_.error("Failed to list pages of %s: %s",
                      out.chapter.path.c_str(), err.message.c_str());
        return false;
    }
    logger_.debug("Chapter %s of %s: %d pages", number.to_string().c_str(),
                  series_id.c_str(), out.chapter.page_count);
    return true;
}

bool CatalogEngine::get_page(const std::string& series_id,
                             const ChapterNumber& number, int page_number,
                             PageView& out, CatalogError& err) const {
    std::vector<Chapter> chapters;
    size_t index = 0;
    if (!locate_chapter(series_id, number, chapters, index, err)) return false;

    std::vector<Page> pages;
    if (!list_pages(chapters[index], pages, err)) return false;

    if (!resolve_page_view(chapters, index, pages, page_number, out, err)) {
        logger_.warn("Page %d not found in chapter %s of %s", page_number,
                     number.to_string().c_str(), series_id.c_str());
        return false;
    }

    CatalogError image_err;
    if (!out.page.load_image_metadata(image_err)) {
        logger_.debug("No image metadata for %s: %s",
                      out.page.image_path.c_str(), image_err.message.c_str());
    }
    return true;
}

bool CatalogEngine::search(const std::string& query, const std::string& genre,
                           std::vector<Series>& out, CatalogError& err) const {
    std::vector<Series> all;
    if (!scanner_.scan_series(all, err)) return false;

    out.clear();
    for (auto& s : all) {
        if (!query.empty() &&
            !contains_ignore_case(s.title, query) &&
            !contains_ignore_case(s.description, query)) {
            bool alt_match = false;
            for (const auto& alt : s.alt_titles) {
                if (contains_ignore_case(alt, query)) {
                    alt_match = true;
                    break;
                }
            }
            if (!alt_match) continue;
        }
        if (!genre.empty()) {
            bool genre_match = false;
            for (const auto& g : s.genres) {
                if (equal_ignore_case(g, genre)) {
                    genre_match = true;
                    break;
                }
            }
            if (!genre_match) continue;
        }
        out.push_back(std::move(s));
    }

    logger_.info("Search q='%s' genre='%s': %zu results",
                 query.c_str(), genre.c_str(), out.size());
    return true;
}

// ---------------------------------------------------------------------------
// Admin write path
// ---------------------------------------------------------------------------

bool CatalogEngine::create_series(const SeriesDraft& draft, Series& out,
                                  CatalogError& err) const {
    if (draft.title.empty()) {
        return err.set(ErrorKind::kValidation, "manga title is required");
    }
    std::string id = create_slug(draft.title);
    if (id.empty()) {
        return err.set(ErrorKind::kValidation,
                       "manga title '" + draft.title + "' yields an empty ID");
    }

    Series existing;
    CatalogError lookup_err;
    if (scanner_.get_series_by_id(id, existing, lookup_err)) {
        logger_.warn("Manga with ID %s already exists", id.c_str());
        return err.set(ErrorKind::kAlreadyExists,
                       "manga with ID " + id + " already exists");
    }
    if (lookup_err.kind != ErrorKind::kSeriesNotFound) {
        err = lookup_err;
        return false;
    }

    Series series;
    series.id = id;
    series.title = draft.title;
    series.description = draft.description;
    series.author = draft.author;
    series.artist = draft.artist;
    series.genres = draft.genres;
    series.status = draft.status;
    series.last_updated = now_seconds();
    series.path = join_path(root_dir(), id);

    std::string error_msg;
    if (!make_directories(series.path, error_msg)) {
        logger_.error("Failed to create manga directory: %s", error_msg.c_str());
        return err.set(ErrorKind::kMetadata,
                       "failed to create manga directory: " + error_msg);
    }
    if (!store_.save_series(series, RecordStore::sidecar_path_for(series.path), err)) {
        return false;
    }

    logger_.info("Manga created: %s", series.id.c_str());
    out = std::move(series);
    return true;
}

bool CatalogEngine::update_series(const std::string& id, const SeriesPatch& patch,
                                  Series& out, CatalogError& err) const {
    Series series;
    if (!scanner_.get_series_by_id(id, series, err)) return false;

    if (!patch.title.empty()) series.title = patch.title;
    if (!patch.description.empty()) series.description = patch.description;
    if (!patch.author.empty()) series.author = patch.author;
    if (!patch.artist.empty()) series.artist = patch.artist;
    if (!patch.genres.empty()) series.genres = patch.genres;
    if (!patch.status.empty()) series.status = patch.status;
    series.last_updated = now_seconds();

    if (!store_.save_series(series, RecordStore::sidecar_path_for(series.path), err)) {
        return false;
    }

    logger_.info("Manga updated: %s", series.id.c_str());
    out = std::move(series);
    return true;
}

bool CatalogEngine::create_chapter(const std::string& series_id,
                                   const ChapterDraft& draft, Chapter& out,
                                   CatalogError& err) const {
    if (!draft.number.positive()) {
        return err.set(ErrorKind::kValidation, "chapter number must be positive");
    }

    Series series;
    if (!scanner_.get_series_by_id(series_id, series, err)) return false;

    std::vector<Chapter> chapters;
    if (!scanner_.scan_chapters(series, chapters, err)) return false;
    if (CatalogScanner::find_chapter(chapters, draft.number) != CatalogScanner::npos) {
        return err.set(ErrorKind::kAlreadyExists,
                       "chapter " + draft.number.to_string() +
                       " already exists in manga " + series_id);
    }

    Chapter chapter;
    chapter.id = "chapter-" + draft.number.to_string();
    chapter.series_id = series_id;
    chapter.number = draft.number;
    chapter.title = draft.title;
    chapter.release_date = now_seconds();
    chapter.volume = draft.volume;
    chapter.special = draft.special;
    chapter.path = join_path(series.path, chapter.id);

    // The directory may hold a chapter whose sidecar gives another number.
    if (file_exists(chapter.path)) {
        logger_.warn("Chapter directory already exists: %s", chapter.path.c_str());
        return err.set(ErrorKind::kAlreadyExists,
                       "chapter directory " + chapter.id +
                       " already exists in manga " + series_id);
    }

    std::string error_msg;
    if (!make_directories(chapter.path, error_msg)) {
        logger_.error("Failed to create chapter directory: %s", error_msg.c_str());
        return err.set(ErrorKind::kMetadata,
                       "failed to create chapter directory: " + error_msg);
    }
    if (!store_.save_chapter(chapter, RecordStore::sidecar_path_for(chapter.path), err)) {
        return false;
    }

    logger_.info("Chapter created: %s/%s", series_id.c_str(), chapter.id.c_str());
    out = std::move(chapter);
    return true;
}

bool CatalogEngine::update_chapter(const std::string& series_id,
                                   const ChapterNumber& number,
                                   const ChapterPatch& patch, Chapter& out,
                                   CatalogError& err) const {
    std::vector<Chapter> chapters;
    size_t index = 0;
    if (!locate_chapter(series_id, number, chapters, index, err)) return false;

    Chapter chapter = chapters[index];
    if (!patch.title.empty()) chapter.title = patch.title;
    chapter.volume = patch.volume;
    chapter.special = patch.special;

    if (!store_.save_chapter(chapter, RecordStore::sidecar_path_for(chapter.path), err)) {
        return false;
    }

    logger_.info("Chapter updated: %s/%s", series_id.c_str(), chapter.id.c_str());
    out = std::move(chapter);
    return true;
}

} // namespace mangashelf
