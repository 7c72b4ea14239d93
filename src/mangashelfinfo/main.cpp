#include "api/response_format.hpp"
#include "core/types.hpp"
#include "core/version.hpp"
#include "engine/catalog_engine.hpp"
#include "store/record_codec.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace mangashelf;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s -root <dir> [options]\n"
        "\n"
        "Required:\n"
        "  -root <dir>              Catalog root directory\n"
        "\n"
        "Options:\n"
        "  -series <id>             Show one series and its chapters\n"
        "  -chapter <number>        Show one chapter of -series (e.g. 12, 1.5)\n"
        "  -pages                   With -chapter: read image headers of every page\n"
        "  -outfmt <text|json>      Output format (default: text)\n"
        "  -log_level <level>       error, warn, info or debug (default: warn)\n"
        "  -v, --verbose            Verbose logging\n"
        "  -h, --help               Show this help\n",
        prog);
}

static std::string format_size(uint64_t bytes) {
    if (bytes >= uint64_t(1) << 20) {
        return std::to_string(bytes / (uint64_t(1) << 20)) + "."
             + std::to_string((bytes % (uint64_t(1) << 20)) * 10 / (uint64_t(1) << 20))
             + " MiB";
    } else if (bytes >= uint64_t(1) << 10) {
        return std::to_string(bytes / (uint64_t(1) << 10)) + "."
             + std::to_string((bytes % (uint64_t(1) << 10)) * 10 / (uint64_t(1) << 10))
             + " KiB";
    }
    return std::to_string(bytes) + " B";
}

static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

static int report_error(const CatalogError& err) {
    std::fprintf(stderr, "Error: %s\n", err.what().c_str());
    return 1;
}

// --- whole catalog ---

static int show_catalog(const CatalogEngine& engine, bool json) {
    std::vector<Series> all;
    CatalogError err;
    if (!engine.list_series(all, err)) return report_error(err);

    if (json) {
        Json::Value arr(Json::arrayValue);
        for (const auto& s : all) arr.append(series_summary_json(s));
        std::printf("%s", to_pretty_json(arr).c_str());
        return 0;
    }

    std::printf("=== mangashelf Catalog ===\n\n");
    std::printf("Root:   %s\n", engine.root_dir().c_str());
    std::printf("Series: %zu\n\n", all.size());
    for (const auto& s : all) {
        std::printf("%-32s %4d ch  %-10s %s\n", s.id.c_str(), s.chapter_count,
                    s.status.c_str(), s.title.c_str());
    }
    return 0;
}

// --- one series ---

static int show_series(const CatalogEngine& engine, const std::string& id, bool json) {
    Series series;
    std::vector<Chapter> chapters;
    CatalogError err;
    if (!engine.get_series(id, series, err)) return report_error(err);
    if (!engine.list_chapters(id, chapters, err)) return report_error(err);

    if (json) {
        Json::Value obj = series_detail_json(series);
        Json::Value arr(Json::arrayValue);
        for (const auto& c : chapters) arr.append(chapter_json(c));
        obj["chapters"] = std::move(arr);
        std::printf("%s", to_pretty_json(obj).c_str());
        return 0;
    }

    std::printf("=== %s ===\n\n", series.title.c_str());
    std::printf("ID:           %s\n", series.id.c_str());
    std::printf("Author:       %s\n", series.author.c_str());
    if (!series.artist.empty()) {
        std::printf("Artist:       %s\n", series.artist.c_str());
    }
    std::printf("Status:       %s\n", series.status.c_str());
    if (series.published_year != 0) {
        std::printf("Published:    %d\n", series.published_year);
    }
    std::printf("Genres:       %s\n", join(series.genres).c_str());
    if (!series.alt_titles.empty()) {
        std::printf("Alt titles:   %s\n", join(series.alt_titles).c_str());
    }
    std::printf("Updated:      %s\n", format_rfc3339(series.last_updated).c_str());
    std::printf("Cover:        %s\n",
                series.cover_image.empty() ? "(none)" : series.cover_image_url().c_str());
    if (!series.cover_image.empty()) {
        std::printf("Cover file:   %s\n", series.cover_image_path().c_str());
    }
    std::printf("Description:  %s\n\n", series.description.c_str());

    std::printf("--- Chapters (%zu) ---\n\n", chapters.size());
    for (const auto& c : chapters) {
        std::printf("%8s  %-24s %s%s\n", c.number.to_string().c_str(), c.id.c_str(),
                    c.title.c_str(), c.special ? " [special]" : "");
    }
    return 0;
}

// --- one chapter ---

static int show_chapter(const CatalogEngine& engine, const std::string& id,
                        const ChapterNumber& number, bool with_pages, bool json,
                        const Logger& logger) {
    ChapterDetail detail;
    CatalogError err;
    if (!engine.get_chapter(id, number, detail, err)) return report_error(err);

    if (with_pages) {
        for (auto& p : detail.pages) {
            CatalogError image_err;
            if (!p.load_image_metadata(image_err)) {
                logger.warn("%s: %s", p.image_path.c_str(), image_err.message.c_str());
            }
        }
    }

    if (json) {
        Json::Value obj = chapter_detail_json(detail);
        if (with_pages) {
            for (Json::ArrayIndex i = 0; i < obj["pages"].size(); i++) {
                const Page& p = detail.pages[i];
                Json::Value& pobj = obj["pages"][i];
                pobj["width"] = p.width;
                pobj["height"] = p.height;
                pobj["mimeType"] = p.mime_type;
                pobj["fileSize"] = static_cast<Json::UInt64>(p.file_size);
            }
        }
        std::printf("%s", to_pretty_json(obj).c_str());
        return 0;
    }

    const Chapter& c = detail.chapter;
    std::printf("=== %s chapter %s ===\n\n", id.c_str(), c.number.to_string().c_str());
    std::printf("ID:        %s\n", c.id.c_str());
    std::printf("Title:     %s\n", c.title.c_str());
    std::printf("Released:  %s\n", format_rfc3339(c.release_date).c_str());
    if (c.volume != 0) std::printf("Volume:    %d\n", c.volume);
    if (c.special) std::printf("Special:   yes\n");
    std::printf("Pages:     %d\n\n", c.page_count);

    uint64_t total_size = 0;
    for (const auto& p : detail.pages) {
        if (with_pages) {
            std::printf("%4d  %-48s %5dx%-5d %-10s %s\n", p.number,
                        p.image_url().c_str(), p.width, p.height,
                        p.mime_type.empty() ? "-" : p.mime_type.c_str(),
                        format_size(p.file_size).c_str());
            total_size += p.file_size;
        } else {
            std::printf("%4d  %s\n", p.number, p.image_url().c_str());
        }
    }
    if (with_pages) {
        std::printf("\nTotal size: %s (%lu bytes)\n", format_size(total_size).c_str(),
                    static_cast<unsigned long>(total_size));
    }
    return 0;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "mangashelfinfo")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    if (!cli.has("-root")) {
        print_usage(argv[0]);
        return 1;
    }

    Logger logger = make_logger(cli);
    if (!cli.has("-v") && !cli.has("--verbose") && !cli.has("-log_level")) {
        logger.set_level(Logger::kWarn);
    }

    std::string outfmt = cli.get_string("-outfmt", "text");
    if (outfmt != "text" && outfmt != "json") {
        std::fprintf(stderr, "Error: -outfmt must be 'text' or 'json'\n");
        return 1;
    }
    bool json = (outfmt == "json");

    if (cli.has("-chapter") && !cli.has("-series")) {
        std::fprintf(stderr, "Error: -chapter requires -series\n");
        return 1;
    }
    if (cli.has("-pages") && !cli.has("-chapter")) {
        std::fprintf(stderr, "Error: -pages requires -chapter\n");
        return 1;
    }

    CatalogEngine engine(cli.get_string("-root"), logger);

    if (!cli.has("-series")) {
        return show_catalog(engine, json);
    }

    std::string series_id = cli.get_string("-series");
    if (!cli.has("-chapter")) {
        return show_series(engine, series_id, json);
    }

    std::string chapter_text = cli.get_string("-chapter");
    ChapterNumber number;
    if (!ChapterNumber::parse(chapter_text, number)) {
        std::fprintf(stderr, "Error: invalid chapter number '%s'\n", chapter_text.c_str());
        return 1;
    }
    return show_chapter(engine, series_id, number, cli.has("-pages"), json, logger);
}
