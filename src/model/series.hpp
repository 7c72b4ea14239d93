#pragma once

#include <string>
#include <vector>

#include "model/catalog_error.hpp"
#include "util/time_format.hpp"

namespace mangashelf {

struct Series {
    std::string id;             // slug; equals directory base name for fast lookup
    std::string title;
    std::string description;
    std::string author;
    std::string artist;         // optional
    std::string cover_image;    // file name inside the series directory
    std::vector<std::string> genres;
    std::string status;         // "ongoing", "completed", "Unknown", ...
    int published_year = 0;     // 0 = unknown
    Timestamp last_updated{};
    int chapter_count = 0;      // derived, not authoritative
    std::vector<std::string> alt_titles;

    // Owning directory. Never serialized; recomputed from the sidecar
    // location on every load.
    std::string path;

    // Empty id or title -> kValidation.
    bool validate(CatalogError& err) const;

    // Absolute path of the cover file ("" when there is no cover).
    std::string cover_image_path() const;

    // "/manga-images/<series dir>/<cover file>" ("" when there is no cover).
    std::string cover_image_url() const;
};

} // namespace mangashelf
