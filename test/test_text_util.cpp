#include "test_util.hpp"
#include "util/cli_parser.hpp"
#include "util/listen_address.hpp"
#include "util/text_util.hpp"
#include "util/time_format.hpp"

#include <vector>

using namespace mangashelf;

static void test_create_slug() {
    CHECK_STR_EQ(create_slug("One Piece!"), "one-piece");
    CHECK_STR_EQ(create_slug("Attack on Titan"), "attack-on-titan");
    CHECK_STR_EQ(create_slug("  Spaced   Out  "), "spaced-out");
    CHECK_STR_EQ(create_slug("Re:Zero - Starting Life"), "rezero-starting-life");
    CHECK_STR_EQ(create_slug("already-a-slug"), "already-a-slug");
    CHECK_STR_EQ(create_slug("!!!"), "");
    CHECK_STR_EQ(create_slug(""), "");
}

static void test_case_helpers() {
    CHECK(contains_ignore_case("The Dragon Ball", "dragon"));
    CHECK(contains_ignore_case("anything", ""));
    CHECK(!contains_ignore_case("Naruto", "bleach"));
    CHECK(equal_ignore_case("Action", "ACTION"));
    CHECK(!equal_ignore_case("Action", "Actions"));
    CHECK(starts_with_ignore_case("Chapter-5", "chapter"));
    CHECK(!starts_with_ignore_case("ch", "chapter"));
    CHECK_STR_EQ(replace_all("a-b-c", "-", " "), "a b c");
}

static void test_parse_int() {
    int v = 0;
    CHECK(parse_int("007", v));
    CHECK_EQ(v, 7);
    CHECK(parse_int("-3", v));
    CHECK_EQ(v, -3);
    CHECK(!parse_int("", v));
    CHECK(!parse_int("+", v));
    CHECK(!parse_int("12a", v));
    CHECK(!parse_int("1.5", v));
    CHECK(!parse_int("99999999999", v));
}

static void test_file_names() {
    CHECK_STR_EQ(file_stem("001.jpg"), "001");
    CHECK_STR_EQ(file_stem("page"), "page");
    CHECK_STR_EQ(file_stem(".hidden"), ".hidden");
    CHECK_STR_EQ(file_extension_lower("A.JPG"), ".jpg");
    CHECK_STR_EQ(file_extension_lower("none"), "");

    CHECK(is_image_file_name("1.jpg"));
    CHECK(is_image_file_name("cover.JPEG"));
    CHECK(is_image_file_name("x.Png"));
    CHECK(!is_image_file_name("x.gif"));
    CHECK(!is_image_file_name("notes.txt"));

    CHECK(is_metadata_file_name("metadata.json"));
    CHECK(is_metadata_file_name("info.json"));
    CHECK(!is_metadata_file_name("info.JSON"));
    CHECK(!is_metadata_file_name("1.jpg"));
}

static void test_rfc3339() {
    Timestamp t;
    CHECK(parse_rfc3339("2024-03-01T12:30:45Z", t));
    CHECK_STR_EQ(format_rfc3339(t), "2024-03-01T12:30:45Z");

    CHECK(parse_rfc3339("2024-03-01T14:30:45+02:00", t));
    CHECK_STR_EQ(format_rfc3339(t), "2024-03-01T12:30:45Z");

    CHECK(parse_rfc3339("2024-03-01T12:30:45.123456789Z", t));
    CHECK_STR_EQ(format_rfc3339(t), "2024-03-01T12:30:45Z");

    CHECK(!parse_rfc3339("yesterday", t));
    CHECK(!parse_rfc3339("2024-03-01", t));

    CHECK_STR_EQ(format_rfc3339(Timestamp{}), "1970-01-01T00:00:00Z");
}

static void test_cli_parser() {
    const char* args[] = {"prog", "-root", "/srv/manga", "-v", "--outfmt=json",
                          "-series", "a", "-series", "b", "-threads", "x", "extra"};
    std::vector<char*> argv;
    for (const char* a : args) argv.push_back(const_cast<char*>(a));
    CliParser cli(static_cast<int>(argv.size()), argv.data());

    CHECK_STR_EQ(cli.get_string("-root"), "/srv/manga");
    CHECK(cli.has("-v"));
    CHECK_STR_EQ(cli.get_string("--outfmt"), "json");
    CHECK_STR_EQ(cli.get_string("-series"), "b");
    CHECK_EQ(cli.get_int("-threads", 4), 4);
    CHECK_STR_EQ(cli.get_string("-missing", "dflt"), "dflt");
    CHECK_EQ(cli.positional().size(), 1u);
}

static void test_listen_address() {
    std::string host;
    uint16_t port = 0;
    CHECK(parse_host_port("127.0.0.1:8080", host, port));
    CHECK_STR_EQ(host, "127.0.0.1");
    CHECK_EQ(port, 8080);

    CHECK(parse_host_port(":9000", host, port));
    CHECK_STR_EQ(host, "0.0.0.0");
    CHECK_EQ(port, 9000);

    CHECK(!parse_host_port("localhost", host, port));
    CHECK(!parse_host_port("localhost:0", host, port));
    CHECK(!parse_host_port("localhost:70000", host, port));
    CHECK(!parse_host_port("localhost:http", host, port));
}

int main() {
    test_create_slug();
    test_case_helpers();
    test_parse_int();
    test_file_names();
    test_rfc3339();
    test_cli_parser();
    test_listen_address();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
