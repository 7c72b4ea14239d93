#include "mangashelfd/http_controller.hpp"
#include "core/config.hpp"
#include "core/version.hpp"
#include "engine/catalog_engine.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/file_util.hpp"
#include "util/listen_address.hpp"
#include "util/logger.hpp"

#include <drogon/HttpAppFramework.h>
#include <trantor/utils/Logger.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include <unistd.h>

using namespace mangashelf;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Options:\n"
        "  -root <dir>                 Catalog root directory (default: ./manga)\n"
        "  -listen <host>:<port>       HTTP listen address (default: 0.0.0.0:8080)\n"
        "  -path_prefix <prefix>       API path prefix (e.g., /reader)\n"
        "  -static_dir <dir>           Frontend files served at / and /static\n"
        "  -threads <int>              Drogon I/O threads (default: all cores)\n"
        "  -pid <path>                 PID file path\n"
        "  -log_level <level>          error, warn, info or debug (default: info)\n"
        "  -v, --verbose               Verbose logging\n"
        "  --version                   Print version and exit\n",
        prog);
}

static trantor::Logger::LogLevel drogon_log_level(Logger::Level level) {
    switch (level) {
    case Logger::kDebug: return trantor::Logger::kDebug;
    case Logger::kInfo:  return trantor::Logger::kInfo;
    case Logger::kWarn:  return trantor::Logger::kWarn;
    case Logger::kError: return trantor::Logger::kError;
    }
    return trantor::Logger::kWarn;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "mangashelfd")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    // Shared with the engine: detached request workers may still be using
    // it after run() returns.
    auto shared_logger = std::make_shared<const Logger>(make_logger(cli));
    const Logger& logger = *shared_logger;

    // Catalog root: created when missing, then made absolute so that the
    // image location does not depend on the working directory.
    std::string root_dir = cli.get_string("-root", "./manga");
    std::string error_msg;
    if (!dir_exists(root_dir)) {
        if (!make_directories(root_dir, error_msg)) {
            std::fprintf(stderr, "Error: cannot create catalog root '%s': %s\n",
                         root_dir.c_str(), error_msg.c_str());
            return 1;
        }
        logger.info("Created catalog root %s", root_dir.c_str());
    }
    std::error_code ec;
    std::string abs_root = std::filesystem::absolute(root_dir, ec).lexically_normal().string();
    if (ec) {
        std::fprintf(stderr, "Error: cannot resolve catalog root '%s': %s\n",
                     root_dir.c_str(), ec.message().c_str());
        return 1;
    }
    if (abs_root.size() > 1 && abs_root.back() == '/') abs_root.pop_back();

    std::string static_dir = cli.get_string("-static_dir");
    if (!static_dir.empty() && !dir_exists(static_dir)) {
        std::fprintf(stderr, "Error: static directory '%s' does not exist\n",
                     static_dir.c_str());
        return 1;
    }

    // Parse listen address
    std::string listen_addr = cli.get_string("-listen", "0.0.0.0:8080");
    std::string host;
    uint16_t port;
    if (!parse_host_port(listen_addr, host, port)) {
        std::fprintf(stderr,
            "Error: invalid listen address '%s' (expected host:port)\n",
            listen_addr.c_str());
        return 1;
    }

    auto engine = std::make_shared<const CatalogEngine>(abs_root, shared_logger);

    // Create HTTP controller and register routes
    HttpController controller(engine, logger);

    std::string path_prefix = cli.get_string("-path_prefix");
    controller.register_routes(path_prefix);

    int threads = resolve_threads(cli);

    // Page and cover images; URLs in API responses point here.
    drogon::app().addALocation(kImageUrlPrefix, "", abs_root, true, false, true);

    if (!static_dir.empty()) {
        drogon::app().setDocumentRoot(static_dir);
        drogon::app().addALocation("/static", "", static_dir, true, false, true);
    } else {
        drogon::app().setDocumentRoot(abs_root);
    }

    drogon::app().registerPostHandlingAdvice(
        [shared_logger](const drogon::HttpRequestPtr& req,
                        const drogon::HttpResponsePtr& resp) {
            shared_logger->debug("[%s] %s %s %d", req->methodString(),
                                 req->path().c_str(), req->peerAddr().toIp().c_str(),
                                 static_cast<int>(resp->statusCode()));
        });

    // Configure Drogon
    drogon::app()
        .addListener(host, port)
        .setThreadNum(static_cast<size_t>(threads))
        .setLogLevel(drogon_log_level(logger.level()));

    // PID file
    std::string pid_file = cli.get_string("-pid");
    if (!pid_file.empty()) {
        FILE* f = std::fopen(pid_file.c_str(), "w");
        if (f) {
            std::fprintf(f, "%d\n", ::getpid());
            std::fclose(f);
        } else {
            logger.warn("Cannot write PID file %s", pid_file.c_str());
        }
    }

    logger.info("Starting HTTP server on %s:%u (threads: %d)",
                host.c_str(), port, threads);
    logger.info("Catalog root: %s", abs_root.c_str());
    if (!path_prefix.empty()) {
        logger.info("API path prefix: %s", path_prefix.c_str());
    }
    if (!static_dir.empty()) {
        logger.info("Static files: %s", static_dir.c_str());
    }

    // Run Drogon (blocks until shutdown via SIGTERM/SIGINT)
    drogon::app().run();

    // Cleanup PID file
    if (!pid_file.empty()) {
        std::remove(pid_file.c_str());
    }

    return 0;
}
