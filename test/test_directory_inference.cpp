#include "test_util.hpp"
#include "catalog_test_fixture.hpp"

#include "core/config.hpp"
#include "scan/directory_inference.hpp"
#include "util/logger.hpp"

#include <string>

using namespace mangashelf;
using namespace catalog_fixture;

static std::string test_dir;
static const Logger quiet(Logger::kError);

static ChapterNumber number_of(const std::string& dir_name, bool* ok = nullptr) {
    ChapterNumber n;
    bool parsed = chapter_number_from_dir_name(dir_name, n);
    if (ok) *ok = parsed;
    return n;
}

static void test_chapter_number_heuristic() {
    CHECK_EQ(number_of("chapter-12").thousandths(), 12000);
    CHECK_EQ(number_of("Chapter 7").thousandths(), 7000);
    CHECK_EQ(number_of("chapter5").thousandths(), 5000);
    CHECK_EQ(number_of("ch_3").thousandths(), 3000);
    CHECK_EQ(number_of("Ch.5").thousandths(), 5000);
    CHECK_EQ(number_of("ch10.5").thousandths(), 10500);
    CHECK_EQ(number_of("42").thousandths(), 42000);
    CHECK_EQ(number_of("chapter-1.5").thousandths(), 1500);

    bool ok = true;
    CHECK_EQ(number_of("extras", &ok).thousandths(), 1000);
    CHECK(!ok);
    CHECK_EQ(number_of("chapter-0", &ok).thousandths(), 1000);
    CHECK(!ok);
    CHECK_EQ(number_of("chapter-abc", &ok).thousandths(), 1000);
    CHECK(!ok);
}

static void test_title_from_dir_name() {
    CHECK_STR_EQ(title_from_dir_name("my-series-name"), "my series name");
    CHECK_STR_EQ(title_from_dir_name("plain"), "plain");
}

static void test_cover_selection() {
    std::string dir = test_dir + "/covers";
    make_dir(dir);
    CHECK_STR_EQ(find_cover_image(dir), "");

    write_file(dir + "/b.png", "x");
    write_file(dir + "/a.jpg", "x");
    CHECK_STR_EQ(find_cover_image(dir), "a.jpg");

    write_file(dir + "/thumbnail.png", "x");
    CHECK_STR_EQ(find_cover_image(dir), "thumbnail.png");

    write_file(dir + "/My-Cover.webp", "x");
    CHECK_STR_EQ(find_cover_image(dir), "My-Cover.webp");

    CHECK_STR_EQ(find_cover_image(test_dir + "/missing"), "");
}

static void test_infer_series() {
    std::string dir = test_dir + "/dragon-quest";
    make_dir(dir + "/chapter-1");
    make_dir(dir + "/chapter-2");
    make_dir(dir + "/.trash");
    write_file(dir + "/cover.jpg", "x");

    Series s = infer_series(dir, quiet);
    CHECK_STR_EQ(s.id, "dragon-quest");
    CHECK_STR_EQ(s.title, "dragon quest");
    CHECK_STR_EQ(s.description, kDefaultDescription);
    CHECK_STR_EQ(s.status, kDefaultStatus);
    CHECK_STR_EQ(s.cover_image, "cover.jpg");
    CHECK_STR_EQ(s.cover_image_url(), "/manga-images/dragon-quest/cover.jpg");
    CHECK_EQ(s.chapter_count, 2);
    CHECK_STR_EQ(s.path, dir);
    CHECK(s.last_updated != Timestamp{});

    int calls = 0;
    Series counted = infer_series(dir, quiet, [&calls](const Series& series) {
        calls++;
        return series.id == "dragon-quest" ? 7 : 0;
    });
    CHECK_EQ(calls, 1);
    CHECK_EQ(counted.chapter_count, 7);

    CatalogError err;
    CHECK(s.validate(err));
}

static void test_infer_chapter() {
    std::string dir = test_dir + "/dragon-quest/chapter-2";
    write_file(dir + "/01.jpg", "x");
    write_file(dir + "/02.png", "x");
    write_file(dir + "/notes.txt", "x");

    Chapter c = infer_chapter("dragon-quest", dir, quiet);
    CHECK_STR_EQ(c.id, "chapter-2");
    CHECK_STR_EQ(c.series_id, "dragon-quest");
    CHECK(c.number == ChapterNumber::from_int(2));
    CHECK_STR_EQ(c.title, "chapter 2");
    CHECK_EQ(c.page_count, 2);
    CHECK_STR_EQ(c.path, dir);

    std::string odd = test_dir + "/dragon-quest/bonus";
    make_dir(odd);
    Chapter fallback = infer_chapter("dragon-quest", odd, quiet);
    CHECK(fallback.number == ChapterNumber::from_int(1));
    CHECK_EQ(fallback.page_count, 0);

    CatalogError err;
    CHECK(c.validate(err));
}

int main() {
    test_dir = make_temp_dir("infer");

    test_chapter_number_heuristic();
    test_title_from_dir_name();
    test_cover_selection();
    test_infer_series();
    test_infer_chapter();

    remove_recursive(test_dir);
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
