#include "store/record_codec.hpp"

#include <memory>

namespace mangashelf {

// ---------------------------------------------------------------------------
// Field helpers
// ---------------------------------------------------------------------------

static bool present(const Json::Value& root, const char* key) {
    return root.isMember(key) && !root[key].isNull();
}

static bool read_string(const Json::Value& root, const char* key,
                        std::string& out, std::string& error_msg) {
    if (!present(root, key)) return true;
    const auto& v = root[key];
    if (!v.isString()) {
        error_msg = std::string("field '") + key + "' must be a string";
        return false;
    }
    out = v.asString();
    return true;
}

static bool read_int(const Json::Value& root, const char* key,
                     int& out, std::string& error_msg) {
    if (!present(root, key)) return true;
    const auto& v = root[key];
    if (!v.isInt()) {
        error_msg = std::string("field '") + key + "' must be an integer";
        return false;
    }
    out = v.asInt();
    return true;
}

static bool read_bool(const Json::Value& root, const char* key,
                      bool& out, std::string& error_msg) {
    if (!present(root, key)) return true;
    const auto& v = root[key];
    if (!v.isBool()) {
        error_msg = std::string("field '") + key + "' must be a boolean";
        return false;
    }
    out = v.asBool();
    return true;
}

static bool read_string_list(const Json::Value& root, const char* key,
                             std::vector<std::string>& out,
                             std::string& error_msg) {
    if (!present(root, key)) return true;
    const auto& v = root[key];
    if (!v.isArray()) {
        error_msg = std::string("field '") + key + "' must be an array of strings";
        return false;
    }
    out.clear();
    for (const auto& item : v) {
        if (!item.isString()) {
            error_msg = std::string("field '") + key + "' must be an array of strings";
            return false;
        }
        out.push_back(item.asString());
    }
    return true;
}

static bool read_timestamp(const Json::Value& root, const char* key,
                           Timestamp& out, std::string& error_msg) {
    std::string text;
    if (!read_string(root, key, text, error_msg)) return false;
    if (text.empty()) return true;
    if (!parse_rfc3339(text, out)) {
        error_msg = std::string("field '") + key + "' is not an RFC 3339 time: " + text;
        return false;
    }
    return true;
}

static Json::Value string_array(const std::vector<std::string>& items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& s : items) arr.append(s);
    return arr;
}

Json::Value chapter_number_to_json(const ChapterNumber& n) {
    if (n.thousandths() % kChapterNumberScale == 0) {
        return Json::Value(static_cast<Json::Int64>(n.thousandths() / kChapterNumberScale));
    }
    return Json::Value(n.to_double());
}

// ---------------------------------------------------------------------------
// Series
// ---------------------------------------------------------------------------

Json::Value series_to_json(const Series& s) {
    Json::Value root(Json::objectValue);
    root["id"] = s.id;
    root["title"] = s.title;
    root["description"] = s.description;
    root["author"] = s.author;
    if (!s.artist.empty()) root["artist"] = s.artist;
    root["coverImage"] = s.cover_image;
    root["genres"] = string_array(s.genres);
    root["status"] = s.status;
    if (s.published_year != 0) root["publishedYear"] = s.published_year;
    root["lastUpdated"] = format_rfc3339(s.last_updated);
    root["chapterCount"] = s.chapter_count;
    if (!s.alt_titles.empty()) root["altTitles"] = string_array(s.alt_titles);
    return root;
}

bool series_from_json(const Json::Value& root, Series& s, std::string& error_msg) {
    if (!root.isObject()) {
        error_msg = "manga metadata must be a JSON object";
        return false;
    }
    s = Series{};
    return read_string(root, "id", s.id, error_msg) &&
           read_string(root, "title", s.title, error_msg) &&
           read_string(root, "description", s.description, error_msg) &&
           read_string(root, "author", s.author, error_msg) &&
           read_string(root, "artist", s.artist, error_msg) &&
           read_string(root, "coverImage", s.cover_image, error_msg) &&
           read_string_list(root, "genres", s.genres, error_msg) &&
           read_string(root, "status", s.status, error_msg) &&
           read_int(root, "publishedYear", s.published_year, error_msg) &&
           read_timestamp(root, "lastUpdated", s.last_updated, error_msg) &&
           read_int(root, "chapterCount", s.chapter_count, error_msg) &&
           read_string_list(root, "altTitles", s.alt_titles, error_msg);
}

// ---------------------------------------------------------------------------
// Chapter
// ---------------------------------------------------------------------------

Json::Value chapter_to_json(const Chapter& c) {
    Json::Value root(Json::objectValue);
    root["id"] = c.id;
    root["mangaId"] = c.series_id;
    root["number"] = chapter_number_to_json(c.number);
    root["title"] = c.title;
    root["releaseDate"] = format_rfc3339(c.release_date);
    root["pageCount"] = c.page_count;
    if (c.volume != 0) root["volume"] = c.volume;
    if (c.special) root["special"] = true;
    return root;
}

bool chapter_from_json(const Json::Value& root, Chapter& c, std::string& error_msg) {
    if (!root.isObject()) {
        error_msg = "chapter metadata must be a JSON object";
        return false;
    }
    c = Chapter{};

    if (present(root, "number")) {
        const auto& v = root["number"];
        if (!v.isNumeric()) {
            error_msg = "field 'number' must be a number";
            return false;
        }
        if (!ChapterNumber::from_double(v.asDouble(), c.number)) {
            error_msg = "field 'number' is out of range";
            return false;
        }
    }

    return read_string(root, "id", c.id, error_msg) &&
           read_string(root, "mangaId", c.series_id, error_msg) &&
           read_string(root, "title", c.title, error_msg) &&
           read_timestamp(root, "releaseDate", c.release_date, error_msg) &&
           read_int(root, "pageCount", c.page_count, error_msg) &&
           read_int(root, "volume", c.volume, error_msg) &&
           read_bool(root, "special", c.special, error_msg);
}

// ---------------------------------------------------------------------------
// Text
// ---------------------------------------------------------------------------

std::string to_pretty_json(const Json::Value& v) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    writer["precision"] = 15;
    return Json::writeString(writer, v) + "\n";
}

bool parse_json(const std::string& text, Json::Value& root, std::string& error_msg) {
    Json::CharReaderBuilder reader_builder;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());

    std::string parse_errors;
    if (!reader->parse(text.c_str(), text.c_str() + text.size(),
                       &root, &parse_errors)) {
        error_msg = parse_errors;
        return false;
    }
    return true;
}

} // namespace mangashelf
