#include "test_util.hpp"

#include "api/response_format.hpp"
#include "store/record_codec.hpp"

#include <string>

using namespace mangashelf;

static Json::Value parse(const std::string& text) {
    Json::Value v;
    std::string error_msg;
    parse_json(text, v, error_msg);
    return v;
}

static Series sample_series() {
    Series s;
    s.id = "dragon-tales";
    s.title = "Dragon Tales";
    s.description = "Wings";
    s.author = "A";
    s.cover_image = "cover.jpg";
    s.genres = {"Action"};
    s.status = "ongoing";
    s.chapter_count = 4;
    s.path = "/srv/manga/dragon-tales";
    return s;
}

static void test_series_bodies() {
    Series s = sample_series();

    Json::Value summary = series_summary_json(s);
    CHECK(summary["coverImage"].asString() == "/manga-images/dragon-tales/cover.jpg");
    CHECK_EQ(summary["chapterCount"].asInt(), 4);
    CHECK(!summary.isMember("lastUpdated"));
    CHECK(!summary.isMember("path"));

    Json::Value detail = series_detail_json(s);
    CHECK(detail.isMember("artist"));
    CHECK(detail["altTitles"].isArray());
    CHECK(detail["lastUpdated"].asString() == "1970-01-01T00:00:00Z");

    Json::Value search_item = series_search_json(s);
    CHECK(!search_item.isMember("status"));
    CHECK(search_item["genres"][0].asString() == "Action");

    Json::Value admin = series_admin_json(s);
    CHECK(!admin.isMember("coverImage"));
    CHECK(admin["status"].asString() == "ongoing");

    CHECK_STR_EQ(s.cover_image_path(), "/srv/manga/dragon-tales/cover.jpg");

    s.cover_image.clear();
    CHECK(series_summary_json(s)["coverImage"].asString().empty());
    CHECK(s.cover_image_path().empty());
}

static void test_chapter_bodies() {
    Chapter c;
    c.id = "chapter-1.5";
    c.series_id = "dragon-tales";
    c.number = ChapterNumber::from_thousandths(1500);
    c.page_count = 2;
    c.path = "/srv/manga/dragon-tales/chapter-1.5";

    Json::Value obj = chapter_json(c);
    CHECK(obj["number"].asDouble() == 1.5);
    CHECK_EQ(obj["pageCount"].asInt(), 2);
    CHECK_EQ(obj["volume"].asInt(), 0);
    CHECK(obj["special"].isBool());

    CHECK(!chapter_admin_json(c).isMember("pageCount"));

    ChapterDetail detail;
    detail.chapter = c;
    Page p;
    p.number = 1;
    p.image_path = c.path + "/01.jpg";
    detail.pages.push_back(p);
    Json::Value d = chapter_detail_json(detail);
    CHECK_EQ(d["pages"].size(), 1u);
    CHECK(d["pages"][0]["imageUrl"].asString() ==
          "/manga-images/dragon-tales/chapter-1.5/01.jpg");

    detail.pages.clear();
    CHECK(chapter_detail_json(detail)["pages"].isArray());
}

static void test_page_view_body() {
    PageView view;
    view.page.number = 3;
    view.page.chapter_id = "chapter-2";
    view.page.image_path = "/srv/manga/dragon-tales/chapter-2/3.jpg";
    view.total_pages = 3;
    view.next_page = 4;
    view.prev_page = 2;
    view.next_chapter = ChapterNumber::from_thousandths(2500);

    Json::Value obj = page_view_json(view, "dragon-tales");
    CHECK(obj["imageUrl"].asString() == "/manga-images/dragon-tales/chapter-2/3.jpg");
    CHECK_EQ(obj["pageNumber"].asInt(), 3);
    CHECK(obj["chapterID"].asString() == "chapter-2");
    CHECK(obj["mangaID"].asString() == "dragon-tales");
    CHECK(obj["nextChapter"].asString() == "2.5");
    CHECK(!obj.isMember("prevChapter"));
    CHECK(!obj.isMember("width"));
    CHECK(!obj.isMember("fileSize"));

    view.page.width = 800;
    view.page.height = 1200;
    view.page.mime_type = "image/png";
    view.page.file_size = 4096;
    obj = page_view_json(view, "dragon-tales");
    CHECK_EQ(obj["width"].asInt(), 800);
    CHECK(obj["mimeType"].asString() == "image/png");
    CHECK_EQ(obj["fileSize"].asUInt64(), 4096u);
}

static void test_status_mapping() {
    CHECK_EQ(http_status_for(ErrorKind::kSeriesNotFound), 404);
    CHECK_EQ(http_status_for(ErrorKind::kChapterNotFound), 404);
    CHECK_EQ(http_status_for(ErrorKind::kPageNotFound), 404);
    CHECK_EQ(http_status_for(ErrorKind::kValidation), 400);
    CHECK_EQ(http_status_for(ErrorKind::kAlreadyExists), 409);
    CHECK_EQ(http_status_for(ErrorKind::kMetadata), 500);

    CHECK(error_json("boom")["error"].asString() == "boom");
}

static void test_series_request_bodies() {
    SeriesDraft draft;
    std::string error_msg;
    CHECK(series_draft_from_json(
        parse("{\"title\": \"T\", \"genres\": [\"A\", \"B\"], \"status\": \"done\"}"),
        true, draft, error_msg));
    CHECK_STR_EQ(draft.title, "T");
    CHECK_EQ(draft.genres.size(), 2u);

    CHECK(!series_draft_from_json(parse("{\"author\": \"x\"}"), true, draft, error_msg));
    CHECK(error_msg.find("title") != std::string::npos);

    CHECK(series_draft_from_json(parse("{\"author\": \"x\"}"), false, draft, error_msg));
    CHECK_STR_EQ(draft.author, "x");

    CHECK(!series_draft_from_json(parse("{\"title\": 5}"), false, draft, error_msg));
    CHECK(!series_draft_from_json(parse("{\"genres\": \"Action\"}"), false, draft, error_msg));
    CHECK(!series_draft_from_json(parse("[]"), false, draft, error_msg));
}

static void test_chapter_request_bodies() {
    ChapterDraft draft;
    std::string error_msg;
    CHECK(chapter_draft_from_json(
        parse("{\"number\": 1.5, \"title\": \"x\", \"volume\": 2, \"special\": true}"),
        draft, error_msg));
    CHECK(draft.number == ChapterNumber::from_thousandths(1500));
    CHECK_EQ(draft.volume, 2);
    CHECK(draft.special);

    CHECK(!chapter_draft_from_json(parse("{\"title\": \"x\"}"), draft, error_msg));
    CHECK(!chapter_draft_from_json(parse("{\"number\": \"1\"}"), draft, error_msg));
    CHECK(!chapter_draft_from_json(parse("{\"number\": 1e300}"), draft, error_msg));
    CHECK(error_msg.find("out of range") != std::string::npos);
    CHECK(!chapter_draft_from_json(parse("{\"number\": -1e300}"), draft, error_msg));
    CHECK(!chapter_draft_from_json(parse("{\"number\": 1, \"volume\": \"2\"}"),
                                   draft, error_msg));

    ChapterPatch patch;
    CHECK(chapter_patch_from_json(parse("{}"), patch, error_msg));
    CHECK(patch.title.empty());
    CHECK_EQ(patch.volume, 0);
    CHECK(!chapter_patch_from_json(parse("{\"special\": 1}"), patch, error_msg));
}

int main() {
    test_series_bodies();
    test_chapter_bodies();
    test_page_view_body();
    test_status_mapping();
    test_series_request_bodies();
    test_chapter_request_bodies();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
