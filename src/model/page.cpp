#include "model/page.hpp"

#include <filesystem>
#include <system_error>

#include "core/config.hpp"
#include "io/image_probe.hpp"
#include "util/file_util.hpp"

namespace mangashelf {

bool Page::validate(CatalogError& err) const {
    if (number <= 0) {
        return err.set(ErrorKind::kValidation, "page number must be positive");
    }
    if (chapter_id.empty()) {
        return err.set(ErrorKind::kValidation, "chapter ID is required");
    }
    if (image_path.empty()) {
        return err.set(ErrorKind::kValidation, "image path is required");
    }
    return true;
}

bool Page::image_exists() const {
    return !image_path.empty() && file_exists(image_path);
}

std::string Page::image_url() const {
    std::string chapter_dir = parent_dir(image_path);
    std::string series_dir = parent_dir(chapter_dir);
    return std::string(kImageUrlPrefix) + "/" + base_name(series_dir) + "/" +
           base_name(chapter_dir) + "/" + base_name(image_path);
}

bool Page::load_image_metadata(CatalogError& err) {
    std::error_code ec;
    auto size = std::filesystem::file_size(image_path, ec);
    if (ec) {
        return err.set(ErrorKind::kMetadata,
                       "failed to get page file info: " + ec.message());
    }
    file_size = static_cast<uint64_t>(size);

    ImageInfo info;
    std::string error_msg;
    if (!probe_image(image_path, info, error_msg)) {
        return err.set(ErrorKind::kMetadata,
                       "failed to decode page image: " + error_msg);
    }
    width = info.width;
    height = info.height;
    mime_type = info.mime_type;
    return true;
}

} // namespace mangashelf
