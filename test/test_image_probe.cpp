#include "test_util.hpp"
#include "catalog_test_fixture.hpp"

#include "io/image_probe.hpp"
#include "model/page.hpp"

#include <string>

using namespace mangashelf;
using namespace catalog_fixture;

static std::string test_dir;

static void test_probe_png() {
    std::string path = test_dir + "/a.png";
    write_file(path, png_bytes(800, 1200));

    ImageInfo info;
    std::string error_msg;
    CHECK(probe_image(path, info, error_msg));
    CHECK_EQ(info.width, 800);
    CHECK_EQ(info.height, 1200);
    CHECK_STR_EQ(info.mime_type, "image/png");
}

static void test_probe_jpeg() {
    std::string path = test_dir + "/b.jpg";
    write_file(path, jpeg_bytes(640, 960));

    ImageInfo info;
    std::string error_msg;
    CHECK(probe_image(path, info, error_msg));
    CHECK_EQ(info.width, 640);
    CHECK_EQ(info.height, 960);
    CHECK_STR_EQ(info.mime_type, "image/jpeg");
}

static void test_probe_rejects() {
    ImageInfo info;
    std::string error_msg;

    write_file(test_dir + "/text.jpg", "plain text, not an image");
    CHECK(!probe_image(test_dir + "/text.jpg", info, error_msg));
    CHECK(!error_msg.empty());

    write_file(test_dir + "/short.png", png_bytes(1, 1).substr(0, 12));
    error_msg.clear();
    CHECK(!probe_image(test_dir + "/short.png", info, error_msg));

    // SOI followed directly by EOI: no frame header.
    write_file(test_dir + "/empty.jpg", std::string("\xFF\xD8\xFF\xD9", 4));
    error_msg.clear();
    CHECK(!probe_image(test_dir + "/empty.jpg", info, error_msg));

    error_msg.clear();
    CHECK(!probe_image(test_dir + "/missing.png", info, error_msg));
}

static void test_page_image_metadata() {
    std::string dir = test_dir + "/series/chapter-1";
    make_dir(dir);
    std::string bytes = jpeg_bytes(100, 150);
    write_file(dir + "/1.jpg", bytes);

    Page page;
    page.number = 1;
    page.chapter_id = "chapter-1";
    page.series_id = "series";
    page.image_path = dir + "/1.jpg";

    CatalogError err;
    CHECK(page.validate(err));
    CHECK(page.image_exists());
    CHECK(page.load_image_metadata(err));
    CHECK_EQ(page.width, 100);
    CHECK_EQ(page.height, 150);
    CHECK_STR_EQ(page.mime_type, "image/jpeg");
    CHECK_EQ(page.file_size, bytes.size());

    // Unsupported content: size is known, dimensions are not.
    write_file(dir + "/2.png", "garbage!");
    Page bad = page;
    bad.number = 2;
    bad.width = bad.height = 0;
    bad.mime_type.clear();
    bad.image_path = dir + "/2.png";
    err.clear();
    CHECK(!bad.load_image_metadata(err));
    CHECK(err.kind == ErrorKind::kMetadata);
    CHECK_EQ(bad.file_size, 8u);
    CHECK_EQ(bad.width, 0);

    Page gone = page;
    gone.image_path = dir + "/9.jpg";
    err.clear();
    CHECK(!gone.image_exists());
    CHECK(!gone.load_image_metadata(err));
    CHECK(err.kind == ErrorKind::kMetadata);

    Page invalid;
    err.clear();
    CHECK(!invalid.validate(err));
    CHECK(err.kind == ErrorKind::kValidation);
}

int main() {
    test_dir = make_temp_dir("image");

    test_probe_png();
    test_probe_jpeg();
    test_probe_rejects();
    test_page_image_metadata();

    remove_recursive(test_dir);
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
