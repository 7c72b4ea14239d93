#pragma once

#include <cstdint>

namespace mangashelf {

// Sidecar metadata file name, at series and chapter directory roots.
inline constexpr const char* kMetadataFileName = "metadata.json";

// Defaults applied by directory inference.
inline constexpr const char* kDefaultDescription = "No description available";
inline constexpr const char* kDefaultStatus = "Unknown";

// URL prefix under which the root directory is served statically.
inline constexpr const char* kImageUrlPrefix = "/manga-images";

// ChapterNumber fixed-point scale: three fractional digits.
inline constexpr int64_t kChapterNumberScale = 1000;

// mkstemp template suffix used for atomic sidecar replacement.
inline constexpr const char* kTempSuffix = ".tmp.XXXXXX";

} // namespace mangashelf
