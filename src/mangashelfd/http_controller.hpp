#pragma once

#include <functional>
#include <memory>
#include <string>

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>
#include <json/json.h>

#include "engine/catalog_engine.hpp"
#include "util/logger.hpp"

namespace mangashelf {

// HTTP REST API controller.
// Translates HTTP requests into CatalogEngine calls and engine results into
// JSON responses. Engine calls touch the filesystem, so they run on a
// detached worker thread and never on a Drogon event loop.
class HttpController {
public:
    using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

    HttpController(std::shared_ptr<const CatalogEngine> engine, const Logger& logger);

    // Register HTTP routes with Drogon. Must be called before app().run().
    void register_routes(const std::string& path_prefix);

    // GET /api/manga
    void list_series(const drogon::HttpRequestPtr& req, Callback&& callback);

    // GET /api/manga/{id}
    void get_series(const drogon::HttpRequestPtr& req, Callback&& callback,
                    const std::string& id);

    // GET /api/manga/{id}/chapters
    void list_chapters(const drogon::HttpRequestPtr& req, Callback&& callback,
                       const std::string& id);

    // GET /api/manga/{id}/chapter/{n}
    void get_chapter(const drogon::HttpRequestPtr& req, Callback&& callback,
                     const std::string& id, const std::string& number);

    // GET /api/manga/{id}/chapter/{n}/page/{p}
    void get_page(const drogon::HttpRequestPtr& req, Callback&& callback,
                  const std::string& id, const std::string& number,
                  const std::string& page);

    // GET /api/search?q=&genre=
    void search(const drogon::HttpRequestPtr& req, Callback&& callback);

    // POST /api/admin/manga
    void create_series(const drogon::HttpRequestPtr& req, Callback&& callback);

    // PUT /api/admin/manga/{id}
    void update_series(const drogon::HttpRequestPtr& req, Callback&& callback,
                       const std::string& id);

    // POST /api/admin/manga/{id}/chapter
    void create_chapter(const drogon::HttpRequestPtr& req, Callback&& callback,
                        const std::string& id);

    // PUT /api/admin/manga/{id}/chapter/{n}
    void update_chapter(const drogon::HttpRequestPtr& req, Callback&& callback,
                        const std::string& id, const std::string& number);

    // GET /api/health
    void health(const drogon::HttpRequestPtr& req, Callback&& callback);

private:
    std::shared_ptr<const CatalogEngine> engine_;
    const Logger& logger_;

    static drogon::HttpResponsePtr make_json_response(Json::Value body, int status);
    static drogon::HttpResponsePtr make_error_response(int status,
                                                       const std::string& message);
    static drogon::HttpResponsePtr make_error_response(const CatalogError& err);

    // Request body as JSON, or nullptr after answering 400.
    static std::shared_ptr<const Json::Value> require_json_body(
        const drogon::HttpRequestPtr& req, const Callback& callback);
};

} // namespace mangashelf
