#include "test_util.hpp"
#include "catalog_test_fixture.hpp"

#include "scan/catalog_scanner.hpp"
#include "util/logger.hpp"

#include <string>
#include <vector>

using namespace mangashelf;
using namespace catalog_fixture;

static std::string root;
static const Logger quiet(Logger::kError);

// root/
//   alpha/            metadata.json (id "alpha")
//     chapter-1/      two pages
//     chapter-2/      metadata.json (number 2, title "Two")
//     .hidden/
//   beta-series/      no sidecar, cover.png
//     ch1/
//   broken/           malformed metadata.json
//   renamed-dir/      metadata.json with id "gamma"
//   stray.txt
static void build_catalog() {
    root = make_temp_dir("scan");

    make_dir(root + "/alpha/chapter-1");
    make_dir(root + "/alpha/chapter-2");
    make_dir(root + "/alpha/.hidden");
    write_file(root + "/alpha/metadata.json",
               series_sidecar("alpha", "Alpha", "\"genres\": [\"Action\"]"));
    write_file(root + "/alpha/chapter-1/1.jpg", "x");
    write_file(root + "/alpha/chapter-1/2.jpg", "x");
    write_file(root + "/alpha/chapter-2/metadata.json",
               chapter_sidecar("chapter-2", "alpha", "2", "\"title\": \"Two\""));

    make_dir(root + "/beta-series/ch1");
    write_file(root + "/beta-series/cover.png", "x");

    make_dir(root + "/broken");
    write_file(root + "/broken/metadata.json", "{ \"id\": ");

    make_dir(root + "/renamed-dir");
    write_file(root + "/renamed-dir/metadata.json", series_sidecar("gamma", "Gamma"));

    write_file(root + "/stray.txt", "not a series");
}

static void test_scan_series() {
    CatalogScanner scanner(root, quiet);
    std::vector<Series> all;
    CatalogError err;
    CHECK(scanner.scan_series(all, err));

    // "broken" is skipped, "stray.txt" is not a directory.
    CHECK_EQ(all.size(), 3u);
    if (all.size() != 3) return;
    CHECK_STR_EQ(all[0].id, "alpha");
    CHECK_STR_EQ(all[1].id, "beta-series");
    CHECK_STR_EQ(all[2].id, "gamma");

    CHECK_STR_EQ(all[0].path, root + "/alpha");
    CHECK_STR_EQ(all[1].title, "beta series");
    CHECK_STR_EQ(all[1].cover_image, "cover.png");
    CHECK_EQ(all[1].chapter_count, 1);
    CHECK_STR_EQ(all[2].path, root + "/renamed-dir");
}

static void test_resolve_source() {
    CatalogScanner scanner(root, quiet);
    CatalogError err;

    Resolved<Series> a;
    CHECK(scanner.resolve_series(root + "/alpha", a, err));
    CHECK(a.source == RecordSource::kSidecar);

    Resolved<Series> b;
    CHECK(scanner.resolve_series(root + "/beta-series", b, err));
    CHECK(b.source == RecordSource::kInferred);

    Resolved<Series> bad;
    CHECK(!scanner.resolve_series(root + "/broken", bad, err));
    CHECK(err.kind == ErrorKind::kMetadata);

    Resolved<Chapter> c;
    err.clear();
    CHECK(scanner.resolve_chapter("alpha", root + "/alpha/chapter-2", c, err));
    CHECK(c.source == RecordSource::kSidecar);
    CHECK_STR_EQ(c.record.title, "Two");

    CHECK(scanner.resolve_chapter("alpha", root + "/alpha/chapter-1", c, err));
    CHECK(c.source == RecordSource::kInferred);
    CHECK_EQ(c.record.page_count, 2);
}

static void test_get_series_by_id() {
    CatalogScanner scanner(root, quiet);
    Series s;
    CatalogError err;

    // Fast path: root/<id>/metadata.json.
    CHECK(scanner.get_series_by_id("alpha", s, err));
    CHECK_STR_EQ(s.title, "Alpha");
    CHECK(s.genres.size() == 1 && s.genres[0] == "Action");

    // Id differs from the directory name: found by the full scan.
    CHECK(scanner.get_series_by_id("gamma", s, err));
    CHECK_STR_EQ(s.path, root + "/renamed-dir");

    // Inferred series.
    CHECK(scanner.get_series_by_id("beta-series", s, err));
    CHECK_STR_EQ(s.description, "No description available");

    err.clear();
    CHECK(!scanner.get_series_by_id("nonexistent", s, err));
    CHECK(err.kind == ErrorKind::kSeriesNotFound);
    CHECK(err.is_not_found());
    CHECK_STR_EQ(err.what(), "manga not found: no manga with ID: nonexistent");

    err.clear();
    CHECK(!scanner.get_series_by_id("../alpha", s, err));
    CHECK(err.kind == ErrorKind::kSeriesNotFound);

    // A corrupt sidecar on the fast path is reported, not hidden.
    err.clear();
    CHECK(!scanner.get_series_by_id("broken", s, err));
    CHECK(err.kind == ErrorKind::kMetadata);
}

static void test_scan_chapters() {
    CatalogScanner scanner(root, quiet);
    Series alpha;
    CatalogError err;
    CHECK(scanner.get_series_by_id("alpha", alpha, err));

    std::vector<Chapter> chapters;
    CHECK(scanner.scan_chapters(alpha, chapters, err));
    CHECK_EQ(chapters.size(), 2u);
    if (chapters.size() != 2) return;
    CHECK(chapters[0].number == ChapterNumber::from_int(1));
    CHECK(chapters[1].number == ChapterNumber::from_int(2));
    CHECK_STR_EQ(chapters[0].series_id, "alpha");
    CHECK_STR_EQ(chapters[1].path, root + "/alpha/chapter-2");

    CHECK_EQ(CatalogScanner::find_chapter(chapters, ChapterNumber::from_int(2)), 1u);
    CHECK(CatalogScanner::find_chapter(chapters, ChapterNumber::from_int(9)) ==
          CatalogScanner::npos);

    Series ghost;
    ghost.id = "ghost";
    ghost.path = root + "/ghost";
    CHECK(!scanner.scan_chapters(ghost, chapters, err));
    CHECK(err.kind == ErrorKind::kMetadata);
}

static void test_unreadable_root() {
    CatalogScanner scanner(root + "/does-not-exist", quiet);
    std::vector<Series> all;
    CatalogError err;
    CHECK(!scanner.scan_series(all, err));
    CHECK(err.kind == ErrorKind::kMetadata);
}

static void test_rescan_sees_changes() {
    CatalogScanner scanner(root, quiet);
    std::vector<Series> before, after;
    CatalogError err;
    CHECK(scanner.scan_series(before, err));

    make_dir(root + "/zeta");
    CHECK(scanner.scan_series(after, err));
    CHECK_EQ(after.size(), before.size() + 1);
    remove_recursive(root + "/zeta");
}

int main() {
    build_catalog();

    test_scan_series();
    test_resolve_source();
    test_get_series_by_id();
    test_scan_chapters();
    test_unreadable_root();
    test_rescan_sees_changes();

    remove_recursive(root);
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
