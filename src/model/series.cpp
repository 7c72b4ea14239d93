#include "model/series.hpp"

#include "core/config.hpp"
#include "util/file_util.hpp"

namespace mangashelf {

bool Series::validate(CatalogError& err) const {
    if (id.empty()) {
        return err.set(ErrorKind::kValidation, "manga ID is required");
    }
    if (title.empty()) {
        return err.set(ErrorKind::kValidation, "manga title is required");
    }
    return true;
}

std::string Series::cover_image_path() const {
    if (cover_image.empty()) return "";
    return join_path(path, base_name(cover_image));
}

std::string Series::cover_image_url() const {
    if (cover_image.empty()) return "";
    // Static files are served by directory name, which may differ from id.
    std::string dir = path.empty() ? id : base_name(path);
    return std::string(kImageUrlPrefix) + "/" + dir + "/" + base_name(cover_image);
}

} // namespace mangashelf
