#include "scan/directory_inference.hpp"

#include <vector>

#include "core/config.hpp"
#include "util/file_util.hpp"
#include "util/text_util.hpp"

namespace mangashelf {

std::string title_from_dir_name(const std::string& dir_name) {
    return replace_all(dir_name, "-", " ");
}

bool chapter_number_from_dir_name(const std::string& dir_name, ChapterNumber& number) {
    // Longest token first so "chapter-12" does not leave "-12" behind.
    static const char* const kPrefixes[] = {"chapter-", "chapter", "ch"};

    std::string rest = dir_name;
    for (const char* prefix : kPrefixes) {
        if (starts_with_ignore_case(rest, prefix)) {
            rest = rest.substr(std::string(prefix).size());
            break;
        }
    }
    if (!rest.empty() &&
        (rest[0] == '-' || rest[0] == '_' || rest[0] == ' ' || rest[0] == '.')) {
        rest = rest.substr(1);
    }

    ChapterNumber parsed;
    if (ChapterNumber::parse(rest, parsed) && parsed.positive()) {
        number = parsed;
        return true;
    }
    number = ChapterNumber::from_int(1);
    return false;
}

std::string find_cover_image(const std::string& dir_path) {
    std::vector<DirEntry> entries;
    std::string error_msg;
    if (!list_directory(dir_path, entries, error_msg)) return "";

    for (const auto& e : entries) {
        if (!e.is_regular) continue;
        std::string lower = to_lower(e.name);
        if (lower.find("cover") != std::string::npos ||
            lower == "thumbnail.jpg" || lower == "thumbnail.png") {
            return e.name;
        }
    }
    for (const auto& e : entries) {
        if (e.is_regular && is_image_file_name(e.name)) return e.name;
    }
    return "";
}

int count_image_files(const std::string& dir_path) {
    std::vector<DirEntry> entries;
    std::string error_msg;
    if (!list_directory(dir_path, entries, error_msg)) return 0;

    int count = 0;
    for (const auto& e : entries) {
        if (e.is_regular && is_image_file_name(e.name)) count++;
    }
    return count;
}

static int count_chapter_dirs(const std::string& dir_path) {
    std::vector<DirEntry> entries;
    std::string error_msg;
    if (!list_directory(dir_path, entries, error_msg)) return 0;

    int count = 0;
    for (const auto& e : entries) {
        if (e.is_dir && e.name[0] != '.') count++;
    }
    return count;
}

Series infer_series(const std::string& dir_path, const Logger& logger,
                    const ChapterCounter& count_chapters) {
    std::string dir_name = base_name(dir_path);

    Series series;
    series.id = dir_name;
    series.title = title_from_dir_name(dir_name);
    series.description = kDefaultDescription;
    series.status = kDefaultStatus;
    series.last_updated = now_seconds();
    series.path = dir_path;

    series.cover_image = find_cover_image(dir_path);
    if (series.cover_image.empty()) {
        logger.debug("No cover image in %s", dir_path.c_str());
    }

    series.chapter_count = count_chapters ? count_chapters(series)
                                          : count_chapter_dirs(dir_path);

    logger.debug("Inferred manga %s from directory (chapters: %d, cover: %s)",
                 series.id.c_str(), series.chapter_count,
                 series.cover_image.empty() ? "-" : series.cover_image.c_str());
    return series;
}

Chapter infer_chapter(const std::string& series_id, const std::string& dir_path,
                      const Logger& logger) {
    std::string dir_name = base_name(dir_path);

    Chapter chapter;
    chapter.id = dir_name;
    chapter.series_id = series_id;
    chapter.title = title_from_dir_name(dir_name);
    chapter.release_date = now_seconds();
    chapter.page_count = count_image_files(dir_path);
    chapter.path = dir_path;

    if (!chapter_number_from_dir_name(dir_name, chapter.number)) {
        logger.warn("Cannot read a chapter number from '%s' in manga %s; using 1",
                    dir_name.c_str(), series_id.c_str());
    }

    logger.debug("Inferred chapter %s of %s (number %s, %d pages)",
                 chapter.id.c_str(), series_id.c_str(),
                 chapter.number.to_string().c_str(), chapter.page_count);
    return chapter;
}

} // namespace mangashelf
