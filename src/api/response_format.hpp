#pragma once

#include <string>

#include <json/json.h>

#include "engine/catalog_engine.hpp"
#include "model/catalog_error.hpp"

namespace mangashelf {

// JSON bodies of the HTTP API. Internal filesystem paths never appear in
// these documents; images are referenced by /manga-images URLs.

// GET /api/manga entries.
Json::Value series_summary_json(const Series& s);

// GET /api/manga/{id}.
Json::Value series_detail_json(const Series& s);

// GET /api/search entries.
Json::Value series_search_json(const Series& s);

// Admin create/update responses.
Json::Value series_admin_json(const Series& s);

// GET /api/manga/{id}/chapters entries.
Json::Value chapter_json(const Chapter& c);

// GET /api/manga/{id}/chapter/{n}: chapter fields plus "pages".
Json::Value chapter_detail_json(const ChapterDetail& detail);

// Admin chapter create/update responses (no pageCount).
Json::Value chapter_admin_json(const Chapter& c);

// GET .../page/{p}. nextChapter/prevChapter are strings and present only
// when set; width/height/mimeType only when the image header was read.
Json::Value page_view_json(const PageView& view, const std::string& series_id);

// {"error": message}
Json::Value error_json(const std::string& message);

// 404 for not-found kinds, 400 validation, 409 already exists, 500 otherwise.
int http_status_for(ErrorKind kind);

// Request bodies. require_title: the create form needs a title, the patch
// form does not. Wrongly typed fields set error_msg and return false.
bool series_draft_from_json(const Json::Value& body, bool require_title,
                            SeriesDraft& draft, std::string& error_msg);

// "number" is required and must be numeric; positivity is checked by the
// engine.
bool chapter_draft_from_json(const Json::Value& body, ChapterDraft& draft,
                             std::string& error_msg);

bool chapter_patch_from_json(const Json::Value& body, ChapterPatch& patch,
                             std::string& error_msg);

} // namespace mangashelf
