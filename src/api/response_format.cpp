#include "api/response_format.hpp"

#include "store/record_codec.hpp"
#include "util/time_format.hpp"

namespace mangashelf {

static Json::Value string_list(const std::vector<std::string>& items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& s : items) arr.append(s);
    return arr;
}

// ---------------------------------------------------------------------------
// Series
// ---------------------------------------------------------------------------

Json::Value series_summary_json(const Series& s) {
    Json::Value obj(Json::objectValue);
    obj["id"] = s.id;
    obj["title"] = s.title;
    obj["description"] = s.description;
    obj["coverImage"] = s.cover_image_url();
    obj["genres"] = string_list(s.genres);
    obj["author"] = s.author;
    obj["status"] = s.status;
    obj["chapterCount"] = s.chapter_count;
    return obj;
}

Json::Value series_detail_json(const Series& s) {
    Json::Value obj = series_summary_json(s);
    obj["artist"] = s.artist;
    obj["publishedYear"] = s.published_year;
    obj["lastUpdated"] = format_rfc3339(s.last_updated);
    obj["altTitles"] = string_list(s.alt_titles);
    return obj;
}

Json::Value series_search_json(const Series& s) {
    Json::Value obj(Json::objectValue);
    obj["id"] = s.id;
    obj["title"] = s.title;
    obj["description"] = s.description;
    obj["coverImage"] = s.cover_image_url();
    obj["genres"] = string_list(s.genres);
    obj["author"] = s.author;
    return obj;
}

Json::Value series_admin_json(const Series& s) {
    Json::Value obj(Json::objectValue);
    obj["id"] = s.id;
    obj["title"] = s.title;
    obj["description"] = s.description;
    obj["author"] = s.author;
    obj["artist"] = s.artist;
    obj["genres"] = string_list(s.genres);
    obj["status"] = s.status;
    return obj;
}

// ---------------------------------------------------------------------------
// Chapters and pages
// ---------------------------------------------------------------------------

Json::Value chapter_admin_json(const Chapter& c) {
    Json::Value obj(Json::objectValue);
    obj["id"] = c.id;
    obj["mangaId"] = c.series_id;
    obj["number"] = chapter_number_to_json(c.number);
    obj["title"] = c.title;
    obj["releaseDate"] = format_rfc3339(c.release_date);
    obj["volume"] = c.volume;
    obj["special"] = c.special;
    return obj;
}

Json::Value chapter_json(const Chapter& c) {
    Json::Value obj = chapter_admin_json(c);
    obj["pageCount"] = c.page_count;
    return obj;
}

Json::Value chapter_detail_json(const ChapterDetail& detail) {
    Json::Value obj = chapter_json(detail.chapter);

    Json::Value pages_arr(Json::arrayValue);
    for (const auto& p : detail.pages) {
        Json::Value pobj(Json::objectValue);
        pobj["number"] = p.number;
        pobj["imageUrl"] = p.image_url();
        pages_arr.append(std::move(pobj));
    }
    obj["pages"] = std::move(pages_arr);
    return obj;
}

Json::Value page_view_json(const PageView& view, const std::string& series_id) {
    const Page& page = view.page;

    Json::Value obj(Json::objectValue);
    obj["imageUrl"] = page.image_url();
    obj["pageNumber"] = page.number;
    obj["totalPages"] = view.total_pages;
    obj["chapterID"] = page.chapter_id;
    obj["mangaID"] = series_id;
    obj["nextPage"] = view.next_page;
    obj["prevPage"] = view.prev_page;
    if (view.next_chapter) obj["nextChapter"] = view.next_chapter->to_string();
    if (view.prev_chapter) obj["prevChapter"] = view.prev_chapter->to_string();

    if (page.width > 0 && page.height > 0) {
        obj["width"] = page.width;
        obj["height"] = page.height;
        obj["mimeType"] = page.mime_type;
    }
    if (page.file_size > 0) {
        obj["fileSize"] = static_cast<Json::UInt64>(page.file_size);
    }
    return obj;
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

Json::Value error_json(const std::string& message) {
    Json::Value body(Json::objectValue);
    body["error"] = message;
    return body;
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kSeriesNotFound:
    case ErrorKind::kChapterNotFound:
    case ErrorKind::kPageNotFound:
        return 404;
    case ErrorKind::kValidation:
        return 400;
    case ErrorKind::kAlreadyExists:
        return 409;
    case ErrorKind::kNone:
        return 200;
    case ErrorKind::kMetadata:
        break;
    }
    return 500;
}

// ---------------------------------------------------------------------------
// Request bodies
// ---------------------------------------------------------------------------

static bool body_string(const Json::Value& body, const char* key,
                        std::string& out, std::string& error_msg) {
    if (!body.isMember(key) || body[key].isNull()) return true;
    if (!body[key].isString()) {
        error_msg = std::string("'") + key + "' must be a string";
        return false;
    }
    out = body[key].asString();
    return true;
}

static bool body_int(const Json::Value& body, const char* key,
                     int& out, std::string& error_msg) {
    if (!body.isMember(key) || body[key].isNull()) return true;
    if (!body[key].isInt()) {
        error_msg = std::string("'") + key + "' must be an integer";
        return false;
    }
    out = body[key].asInt();
    return true;
}

static bool body_bool(const Json::Value& body, const char* key,
                      bool& out, std::string& error_msg) {
    if (!body.isMember(key) || body[key].isNull()) return true;
    if (!body[key].isBool()) {
        error_msg = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = body[key].asBool();
    return true;
}

bool series_draft_from_json(const Json::Value& body, bool require_title,
                            SeriesDraft& draft, std::string& error_msg) {
    if (!body.isObject()) {
        error_msg = "request body must be a JSON object";
        return false;
    }
    draft = SeriesDraft{};
    if (!body_string(body, "title", draft.title, error_msg) ||
        !body_string(body, "description", draft.description, error_msg) ||
        !body_string(body, "author", draft.author, error_msg) ||
        !body_string(body, "artist", draft.artist, error_msg) ||
        !body_string(body, "status", draft.status, error_msg)) {
        return false;
    }

    if (body.isMember("genres") && !body["genres"].isNull()) {
        const auto& g = body["genres"];
        if (!g.isArray()) {
            error_msg = "'genres' must be an array of strings";
            return false;
        }
        for (const auto& item : g) {
            if (!item.isString()) {
                error_msg = "'genres' must be an array of strings";
                return false;
            }
            draft.genres.push_back(item.asString());
        }
    }

    if (require_title && draft.title.empty()) {
        error_msg = "'title' is required";
        return false;
    }
    return true;
}

bool chapter_draft_from_json(const Json::Value& body, ChapterDraft& draft,
                             std::string& error_msg) {
    if (!body.isObject()) {
        error_msg = "request body must be a JSON object";
        return false;
    }
    draft = ChapterDraft{};
    if (!body.isMember("number") || body["number"].isNull()) {
        error_msg = "'number' is required";
        return false;
    }
    if (!body["number"].isNumeric()) {
        error_msg = "'number' must be a number";
        return false;
    }
    if (!ChapterNumber::from_double(body["number"].asDouble(), draft.number)) {
        error_msg = "'number' is out of range";
        return false;
    }

    return body_string(body, "title", draft.title, error_msg) &&
           body_int(body, "volume", draft.volume, error_msg) &&
           body_bool(body, "special", draft.special, error_msg);
}

bool chapter_patch_from_json(const Json::Value& body, ChapterPatch& patch,
                             std::string& error_msg) {
    if (!body.isObject()) {
        error_msg = "request body must be a JSON object";
        return false;
    }
    patch = ChapterPatch{};
    return body_string(body, "title", patch.title, error_msg) &&
           body_int(body, "volume", patch.volume, error_msg) &&
           body_bool(body, "special", patch.special, error_msg);
}

} // namespace mangashelf
