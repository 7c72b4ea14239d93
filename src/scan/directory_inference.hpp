#pragma once

#include <functional>
#include <string>

#include "model/chapter.hpp"
#include "model/series.hpp"
#include "util/logger.hpp"

namespace mangashelf {

// Counts the chapters of an inferred series. The catalog scanner passes its
// own chapter scan so that inferred counts include sidecar chapters.
using ChapterCounter = std::function<int(const Series&)>;

// Synthesize a series from a directory without a sidecar. Never fails:
// missing information gets defaults. Cover selection: a file whose name
// contains "cover" (any case) or is thumbnail.jpg/png, else the first image
// in name order. chapter_count comes from count_chapters; when that is
// empty, non-hidden subdirectories are counted.
Series infer_series(const std::string& dir_path, const Logger& logger,
                    const ChapterCounter& count_chapters = {});

// Synthesize a chapter from a directory without a sidecar. Never fails.
// The number is parsed from the directory name after a leading
// "chapter-" / "chapter" / "ch" token; unparseable or non-positive gives 1.
Chapter infer_chapter(const std::string& series_id, const std::string& dir_path,
                      const Logger& logger);

// Chapter number heuristic on a directory base name. Returns false (and
// sets `number` to 1) when no positive number can be read.
bool chapter_number_from_dir_name(const std::string& dir_name, ChapterNumber& number);

// "my-series-name" -> "my series name"
std::string title_from_dir_name(const std::string& dir_name);

// Cover file name in `dir_path`, or "" if it holds no image.
std::string find_cover_image(const std::string& dir_path);

// Number of immediate .jpg/.jpeg/.png files.
int count_image_files(const std::string& dir_path);

} // namespace mangashelf
