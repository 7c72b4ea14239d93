#pragma once

#include <string>

namespace mangashelf {

struct ImageInfo {
    int width = 0;
    int height = 0;
    std::string mime_type;  // "image/png" or "image/jpeg"
};

// Read dimensions from a PNG (IHDR) or JPEG (SOFn) header without decoding
// pixel data. Returns false and sets error_msg for other formats or
// truncated headers.
bool probe_image(const std::string& path, ImageInfo& info, std::string& error_msg);

} // namespace mangashelf
