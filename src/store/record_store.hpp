#pragma once

#include <string>

#include "model/catalog_error.hpp"
#include "model/chapter.hpp"
#include "model/series.hpp"
#include "util/logger.hpp"

namespace mangashelf {

// Reads and writes sidecar metadata files.
//
// load_* stamps the record's path as the sidecar's parent directory; a path
// stored in the file is never trusted, so a relocated directory corrects
// itself on the next load. save_* replaces the sidecar atomically
// (temporary file + rename): a failed save leaves the previous file intact.
// All failures are reported as ErrorKind::kMetadata.
class RecordStore {
public:
    explicit RecordStore(const Logger& logger) : logger_(logger) {}

    bool load_series(const std::string& sidecar_path, Series& out,
                     CatalogError& err) const;
    bool save_series(const Series& series, const std::string& sidecar_path,
                     CatalogError& err) const;

    bool load_chapter(const std::string& sidecar_path, Chapter& out,
                      CatalogError& err) const;
    bool save_chapter(const Chapter& chapter, const std::string& sidecar_path,
                      CatalogError& err) const;

    // "<dir>/metadata.json"
    static std::string sidecar_path_for(const std::string& dir);

private:
    const Logger& logger_;
};

} // namespace mangashelf
