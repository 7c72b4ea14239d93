#include "store/record_store.hpp"

#include "core/config.hpp"
#include "store/record_codec.hpp"
#include "util/file_util.hpp"

namespace mangashelf {

std::string RecordStore::sidecar_path_for(const std::string& dir) {
    return join_path(dir, kMetadataFileName);
}

bool RecordStore::load_series(const std::string& sidecar_path, Series& out,
                              CatalogError& err) const {
    logger_.debug("Loading manga metadata: %s", sidecar_path.c_str());

    std::string text, error_msg;
    if (!read_file_string(sidecar_path, text, error_msg)) {
        logger_.error("Failed to read manga metadata file %s: %s",
                      sidecar_path.c_str(), error_msg.c_str());
        return err.set(ErrorKind::kMetadata,
                       "failed to read manga metadata: " + error_msg);
    }

    Json::Value root;
    Series series;
    if (!parse_json(text, root, error_msg) ||
        !series_from_json(root, series, error_msg)) {
        logger_.error("Failed to parse manga metadata %s: %s",
                      sidecar_path.c_str(), error_msg.c_str());
        return err.set(ErrorKind::kMetadata,
                       "failed to parse manga metadata " + sidecar_path + ": " + error_msg);
    }

    series.path = parent_dir(sidecar_path);
    out = std::move(series);
    logger_.debug("Manga metadata loaded: id=%s path=%s",
                  out.id.c_str(), out.path.c_str());
    return true;
}

bool RecordStore::save_series(const Series& series, const std::string& sidecar_path,
                              CatalogError& err) const {
    std::string error_msg;
    if (!write_file_atomic(sidecar_path, to_pretty_json(series_to_json(series)),
                           error_msg)) {
        logger_.error("Failed to write manga metadata for %s: %s",
                      series.id.c_str(), error_msg.c_str());
        return err.set(ErrorKind::kMetadata,
                       "failed to write manga metadata: " + error_msg);
    }
    logger_.info("Manga metadata saved: %s", sidecar_path.c_str());
    return true;
}

bool RecordStore::load_chapter(const std::string& sidecar_path, Chapter& out,
                               CatalogError& err) const {
    logger_.debug("Loading chapter metadata: %s", sidecar_path.c_str());

    std::string text, error_msg;
    if (!read_file_string(sidecar_path, text, error_msg)) {
        logger_.error("Failed to read chapter metadata file %s: %s",
                      sidecar_path.c_str(), error_msg.c_str());
        return err.set(ErrorKind::kMetadata,
                       "failed to read chapter metadata: " + error_msg);
    }

    Json::Value root;
    Chapter chapter;
    if (!parse_json(text, root, error_msg) ||
        !chapter_from_json(root, chapter, error_msg)) {
        logger_.error("Failed to parse chapter metadata %s: %s",
                      sidecar_path.c_str(), error_msg.c_str());
        return err.set(ErrorKind::kMetadata,
                       "failed to parse chapter metadata " + sidecar_path + ": " + error_msg);
    }

    chapter.path = parent_dir(sidecar_path);
    out = std::move(chapter);
    logger_.debug("Chapter metadata loaded: id=%s manga=%s number=%s",
                  out.id.c_str(), out.series_id.c_str(),
                  out.number.to_string().c_str());
    return true;
}

bool RecordStore::save_chapter(const Chapter& chapter, const std::string& sidecar_path,
                               CatalogError& err) const {
    std::string error_msg;
    if (!write_file_atomic(sidecar_path, to_pretty_json(chapter_to_json(chapter)),
                           error_msg)) {
        logger_.error("Failed to write chapter metadata for %s: %s",
                      chapter.id.c_str(), error_msg.c_str());
        return err.set(ErrorKind::kMetadata,
                       "failed to write chapter metadata: " + error_msg);
    }
    logger_.info("Chapter metadata saved: %s", sidecar_path.c_str());
    return true;
}

} // namespace mangashelf
