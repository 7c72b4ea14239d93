#pragma once

#include <string>

#include "core/types.hpp"
#include "model/catalog_error.hpp"
#include "util/time_format.hpp"

namespace mangashelf {

struct Chapter {
    std::string id;             // directory base name or generated slug
    std::string series_id;
    ChapterNumber number;       // unique key within a series
    std::string title;
    Timestamp release_date{};
    int page_count = 0;         // derived; authoritative only after list_pages()
    int volume = 0;             // 0 = not part of a volume
    bool special = false;

    // Owning directory. Never serialized.
    std::string path;

    // Empty series id or non-positive number -> kValidation.
    bool validate(CatalogError& err) const;
};

} // namespace mangashelf
