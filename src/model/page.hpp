#pragma once

#include <cstdint>
#include <string>

#include "model/catalog_error.hpp"

namespace mangashelf {

struct Page {
    int number = 0;             // 1-based
    std::string chapter_id;
    std::string series_id;
    std::string image_path;     // absolute; internal only

    // Populated lazily by load_image_metadata(), never during listing.
    int width = 0;
    int height = 0;
    uint64_t file_size = 0;
    std::string mime_type;

    // Non-positive number, empty chapter id or empty image path -> kValidation.
    bool validate(CatalogError& err) const;

    bool image_exists() const;

    // "/manga-images/<series dir>/<chapter dir>/<file>", derived from
    // image_path so that it always points at what the static server serves.
    std::string image_url() const;

    // Fill file_size, width, height and mime_type from the image file.
    // Unsupported or truncated images -> kMetadata (file_size still set).
    bool load_image_metadata(CatalogError& err);
};

} // namespace mangashelf
