#include "scan/catalog_scanner.hpp"

#include "scan/directory_inference.hpp"
#include "util/file_util.hpp"

namespace mangashelf {

CatalogScanner::CatalogScanner(const std::string& root_dir, const Logger& logger)
    : root_dir_(root_dir), logger_(logger), store_(logger) {}

bool CatalogScanner::resolve_series(const std::string& dir, Resolved<Series>& out,
                                    CatalogError& err) const {
    std::string sidecar = RecordStore::sidecar_path_for(dir);
    if (file_exists(sidecar)) {
        out.source = RecordSource::kSidecar;
        return store_.load_series(sidecar, out.record, err);
    }

    out.source = RecordSource::kInferred;
    out.record = infer_series(dir, logger_, [this](const Series& s) {
        return count_chapters(s);
    });
    return true;
}

bool CatalogScanner::resolve_chapter(const std::string& series_id,
                                     const std::string& dir,
                                     Resolved<Chapter>& out,
                                     CatalogError& err) const {
    std::string sidecar = RecordStore::sidecar_path_for(dir);
    if (file_exists(sidecar)) {
        out.source = RecordSource::kSidecar;
        return store_.load_chapter(sidecar, out.record, err);
    }

    out.source = RecordSource::kInferred;
    out.record = infer_chapter(series_id, dir, logger_);
    return true;
}

bool CatalogScanner::scan_series(std::vector<Series>& out, CatalogError& err) const {
    logger_.debug("Scanning for manga in %s", root_dir_.c_str());

    std::vector<DirEntry> entries;
    std::string error_msg;
    if (!list_directory(root_dir_, entries, error_msg)) {
        logger_.error("Failed to read root directory: %s", error_msg.c_str());
        return err.set(ErrorKind::kMetadata,
                       "failed to read root directory: " + error_msg);
    }

    out.clear();
    for (const auto& e : entries) {
        if (!e.is_dir) continue;

        std::string dir = join_path(root_dir_, e.name);
        Resolved<Series> resolved;
        CatalogError entry_err;
        if (!resolve_series(dir, resolved, entry_err)) {
            logger_.warn("Skipping manga directory %s: %s",
                         dir.c_str(), entry_err.what().c_str());
            continue;
        }
        out.push_back(std::move(resolved.record));
    }

    logger_.info("Manga scan complete: %zu found in %s",
                 out.size(), root_dir_.c_str());
    return true;
}

bool CatalogScanner::get_series_by_id(const std::string& id, Series& out,
                                      CatalogError& err) const {
    bool direct_ok = !id.empty() && id != "." && id != ".." &&
                     id.find('/') == std::string::npos;
    if (direct_ok) {
        std::string sidecar = RecordStore::sidecar_path_for(join_path(root_dir_, id));
        if (file_exists(sidecar)) {
            logger_.debug("Direct metadata hit for manga %s", id.c_str());
            return store_.load_series(sidecar, out, err);
        }
    }

    logger_.debug("No direct metadata for manga %s; scanning all manga", id.c_str());

    std::vector<Series> all;
    if (!scan_series(all, err)) return false;

    for (auto& s : all) {
        if (s.id == id) {
            out = std::move(s);
            return true;
        }
    }

    logger_.warn("No manga found with ID %s", id.c_str());
    return err.set(ErrorKind::kSeriesNotFound, "no manga with ID: " + id);
}

bool CatalogScanner::scan_chapters(const Series& series, std::vector<Chapter>& out,
                                   CatalogError& err) const {
    std::vector<DirEntry> entries;
    std::string error_msg;
    if (!list_directory(series.path, entries, error_msg)) {
        logger_.error("Failed to read manga directory: %s", error_msg.c_str());
        return err.set(ErrorKind::kMetadata,
                       "failed to read manga directory: " + error_msg);
    }

    out.clear();
    for (const auto& e : entries) {
        if (!e.is_dir || e.name[0] == '.') continue;

        std::string dir = join_path(series.path, e.name);
        Resolved<Chapter> resolved;
        CatalogError entry_err;
        if (!resolve_chapter(series.id, dir, resolved, entry_err)) {
            logger_.warn("Skipping chapter directory %s: %s",
                         dir.c_str(), entry_err.what().c_str());
            continue;
        }
        out.push_back(std::move(resolved.record));
    }

    logger_.debug("Chapter scan of %s complete: %zu chapters",
                  series.id.c_str(), out.size());
    return true;
}

size_t CatalogScanner::find_chapter(const std::vector<Chapter>& chapters,
                                    const ChapterNumber& number) {
    for (size_t i = 0; i < chapters.size(); i++) {
        if (chapters[i].number == number) return i;
    }
    return npos;
}

int CatalogScanner::count_chapters(const Series& series) const {
    std::vector<Chapter> chapters;
    CatalogError err;
    if (!scan_chapters(series, chapters, err)) return 0;
    return static_cast<int>(chapters.size());
}

} // namespace mangashelf
