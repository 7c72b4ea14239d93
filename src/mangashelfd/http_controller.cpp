#include "mangashelfd/http_controller.hpp"

#include <thread>
#include <utility>

#include <drogon/HttpAppFramework.h>

#include "api/response_format.hpp"
#include "util/text_util.hpp"

namespace mangashelf {

// Run `work` on a detached thread and hand its response to the callback.
template <typename Work>
static void run_detached(HttpController::Callback&& callback, Work work) {
    auto cb = std::make_shared<HttpController::Callback>(std::move(callback));
    std::thread([cb, work]() {
        (*cb)(work());
    }).detach();
}

HttpController::HttpController(std::shared_ptr<const CatalogEngine> engine,
                               const Logger& logger)
    : engine_(std::move(engine)), logger_(logger) {}

void HttpController::register_routes(const std::string& path_prefix) {
    std::string prefix = path_prefix;
    if (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }

    auto self = this;

    drogon::app().registerHandler(
        prefix + "/api/manga",
        [self](const drogon::HttpRequestPtr& req, Callback&& callback) {
            self->list_series(req, std::move(callback));
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/manga/{id}",
        [self](const drogon::HttpRequestPtr& req, Callback&& callback,
               const std::string& id) {
            self->get_series(req, std::move(callback), id);
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/manga/{id}/chapters",
        [self](const drogon::HttpRequestPtr& req, Callback&& callback,
               const std::string& id) {
            self->list_chapters(req, std::move(callback), id);
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/manga/{id}/chapter/{number}",
        [self](const drogon::HttpRequestPtr& req, Callback&& callback,
               const std::string& id, const std::string& number) {
            self->get_chapter(req, std::move(callback), id, number);
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/manga/{id}/chapter/{number}/page/{page}",
        [self](const drogon::HttpRequestPtr& req, Callback&& callback,
               const std::string& id, const std::string& number,
               const std::string& page) {
            self->get_page(req, std::move(callback), id, number, page);
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/search",
        [self](const drogon::HttpRequestPtr& req, Callback&& callback) {
            self->search(req, std::move(callback));
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/admin/manga",
        [self](const drogon::HttpRequestPtr& req, Callback&& callback) {
            self->create_series(req, std::move(callback));
        },
        {drogon::Post});

    drogon::app().registerHandler(
        prefix + "/api/admin/manga/{id}",
        [self](const drogon::HttpRequestPtr& req, Callback&& callback,
               const std::string& id) {
            self->update_series(req, std::move(callback), id);
        },
        {drogon::Put});

    drogon::app().registerHandler(
        prefix + "/api/admin/manga/{id}/chapter",
        [self](const drogon::HttpRequestPtr& req, Callback&& callback,
               const std::string& id) {
            self->create_chapter(req, std::move(callback), id);
        },
        {drogon::Post});

    drogon::app().registerHandler(
        prefix + "/api/admin/manga/{id}/chapter/{number}",
        [self](const drogon::HttpRequestPtr& req, Callback&& callback,
               const std::string& id, const std::string& number) {
            self->update_chapter(req, std::move(callback), id, number);
        },
        {drogon::Put});

    drogon::app().registerHandler(
        prefix + "/api/health",
        [self](const drogon::HttpRequestPtr& req, Callback&& callback) {
            self->health(req, std::move(callback));
        },
        {drogon::Get});
}

// ---------------------------------------------------------------------------
// Read API
// ---------------------------------------------------------------------------

void HttpController::list_series(const drogon::HttpRequestPtr& /*req*/,
                                 Callback&& callback) {
    auto engine = engine_;
    run_detached(std::move(callback), [engine]() {
        std::vector<Series> series;
        CatalogError err;
        if (!engine->list_series(series, err)) return make_error_response(err);

        Json::Value result(Json::arrayValue);
        for (const auto& s : series) result.append(series_summary_json(s));
        return make_json_response(std::move(result), 200);
    });
}

void HttpController::get_series(const drogon::HttpRequestPtr& /*req*/,
                                Callback&& callback, const std::string& id) {
    auto engine = engine_;
    run_detached(std::move(callback), [engine, id]() {
        Series series;
        CatalogError err;
        if (!engine->get_series(id, series, err)) return make_error_response(err);
        return make_json_response(series_detail_json(series), 200);
    });
}

void HttpController::list_chapters(const drogon::HttpRequestPtr& /*req*/,
                                   Callback&& callback, const std::string& id) {
    auto engine = engine_;
    run_detached(std::move(callback), [engine, id]() {
        std::vector<Chapter> chapters;
        CatalogError err;
        if (!engine->list_chapters(id, chapters, err)) return make_error_response(err);

        Json::Value result(Json::arrayValue);
        for (const auto& c : chapters) result.append(chapter_json(c));
        return make_json_response(std::move(result), 200);
    });
}

void HttpController::get_chapter(const drogon::HttpRequestPtr& /*req*/,
                                 Callback&& callback, const std::string& id,
                                 const std::string& number) {
    ChapterNumber chapter_number;
    if (!ChapterNumber::parse(number, chapter_number)) {
        logger_.warn("Invalid chapter number '%s'", number.c_str());
        callback(make_error_response(400, "invalid chapter number"));
        return;
    }

    auto engine = engine_;
    run_detached(std::move(callback), [engine, id, chapter_number]() {
        ChapterDetail detail;
        CatalogError err;
        if (!engine->get_chapter(id, chapter_number, detail, err)) {
            return make_error_response(err);
        }
        return make_json_response(chapter_detail_json(detail), 200);
    });
}

void HttpController::get_page(const drogon::HttpRequestPtr& /*req*/,
                              Callback&& callback, const std::string& id,
                              const std::string& number, const std::string& page) {
    ChapterNumber chapter_number;
    if (!ChapterNumber::parse(number, chapter_number)) {
        logger_.warn("Invalid chapter number '%s'", number.c_str());
        callback(make_error_response(400, "invalid chapter number"));
        return;
    }
    int page_number = 0;
    if (!parse_int(page, page_number)) {
        logger_.warn("Invalid page number '%s'", page.c_str());
        callback(make_error_response(400, "invalid page number"));
        return;
    }

    auto engine = engine_;
    run_detached(std::move(callback), [engine, id, chapter_number, page_number]() {
        PageView view;
        CatalogError err;
        if (!engine->get_page(id, chapter_number, page_number, view, err)) {
            return make_error_response(err);
        }
        return make_json_response(page_view_json(view, id), 200);
    });
}

void HttpController::search(const drogon::HttpRequestPtr& req, Callback&& callback) {
    std::string query = req->getParameter("q");
    std::string genre = req->getParameter("genre");

    auto engine = engine_;
    run_detached(std::move(callback), [engine, query, genre]() {
        std::vector<Series> results;
        CatalogError err;
        if (!engine->search(query, genre, results, err)) return make_error_response(err);

        Json::Value result(Json::arrayValue);
        for (const auto& s : results) result.append(series_search_json(s));
        return make_json_response(std::move(result), 200);
    });
}

// ---------------------------------------------------------------------------
// Admin API
// ---------------------------------------------------------------------------

void HttpController::create_series(const drogon::HttpRequestPtr& req,
                                   Callback&& callback) {
    auto body = require_json_body(req, callback);
    if (!body) return;

    SeriesDraft draft;
    std::string error_msg;
    if (!series_draft_from_json(*body, true, draft, error_msg)) {
        callback(make_error_response(400, "invalid request: " + error_msg));
        return;
    }

    auto engine = engine_;
    run_detached(std::move(callback), [engine, draft]() {
        Series series;
        CatalogError err;
        if (!engine->create_series(draft, series, err)) return make_error_response(err);
        return make_json_response(series_admin_json(series), 201);
    });
}

void HttpController::update_series(const drogon::HttpRequestPtr& req,
                                   Callback&& callback, const std::string& id) {
    auto body = require_json_body(req, callback);
    if (!body) return;

    SeriesPatch patch;
    std::string error_msg;
    if (!series_draft_from_json(*body, false, patch, error_msg)) {
        callback(make_error_response(400, "invalid request: " + error_msg));
        return;
    }

    auto engine = engine_;
    run_detached(std::move(callback), [engine, id, patch]() {
        Series series;
        CatalogError err;
        if (!engine->update_series(id, patch, series, err)) {
            return make_error_response(err);
        }
        return make_json_response(series_admin_json(series), 200);
    });
}

void HttpController::create_chapter(const drogon::HttpRequestPtr& req,
                                    Callback&& callback, const std::string& id) {
    auto body = require_json_body(req, callback);
    if (!body) return;

    ChapterDraft draft;
    std::string error_msg;
    if (!chapter_draft_from_json(*body, draft, error_msg)) {
        callback(make_error_response(400, "invalid request: " + error_msg));
        return;
    }

    auto engine = engine_;
    run_detached(std::move(callback), [engine, id, draft]() {
        Chapter chapter;
        CatalogError err;
        if (!engine->create_chapter(id, draft, chapter, err)) {
            return make_error_response(err);
        }
        return make_json_response(chapter_admin_json(chapter), 201);
    });
}

void HttpController::update_chapter(const drogon::HttpRequestPtr& req,
                                    Callback&& callback, const std::string& id,
                                    const std::string& number) {
    ChapterNumber chapter_number;
    if (!ChapterNumber::parse(number, chapter_number)) {
        logger_.warn("Invalid chapter number '%s'", number.c_str());
        callback(make_error_response(400, "invalid chapter number"));
        return;
    }

    auto body = require_json_body(req, callback);
    if (!body) return;

    ChapterPatch patch;
    std::string error_msg;
    if (!chapter_patch_from_json(*body, patch, error_msg)) {
        callback(make_error_response(400, "invalid request: " + error_msg));
        return;
    }

    auto engine = engine_;
    run_detached(std::move(callback), [engine, id, chapter_number, patch]() {
        Chapter chapter;
        CatalogError err;
        if (!engine->update_chapter(id, chapter_number, patch, chapter, err)) {
            return make_error_response(err);
        }
        return make_json_response(chapter_admin_json(chapter), 200);
    });
}

void HttpController::health(const drogon::HttpRequestPtr& /*req*/,
                            Callback&& callback) {
    Json::Value result;
    result["status"] = "ok";
    callback(make_json_response(std::move(result), 200));
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::shared_ptr<const Json::Value> HttpController::require_json_body(
    const drogon::HttpRequestPtr& req, const Callback& callback) {
    auto json = req->getJsonObject();
    if (!json) {
        std::string detail = req->getJsonError();
        callback(make_error_response(
            400, detail.empty() ? "invalid or missing JSON body"
                                : "invalid JSON body: " + detail));
        return nullptr;
    }
    return json;
}

drogon::HttpResponsePtr HttpController::make_json_response(Json::Value body,
                                                           int status) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(std::move(body));
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(status));
    return resp;
}

drogon::HttpResponsePtr HttpController::make_error_response(
    int status, const std::string& message) {
    return make_json_response(error_json(message), status);
}

drogon::HttpResponsePtr HttpController::make_error_response(const CatalogError& err) {
    return make_error_response(http_status_for(err.kind), err.message);
}

} // namespace mangashelf
