#include <httplib.h>
#include <nlohmann/json.hpp>

#include "cutout/WorkerPool.hpp"
#include "BackgroundRemover.hpp"
#include "NcnnSegmenter.hpp"
#include "Pipeline.hpp"
#include "ServiceConfig.hpp"
#include "routes.hpp"

#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

std::optional<std::string> config_path_from(int argc, char* argv[], const cutout::EnvLookup& env) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--config requires a path");
            }
            return std::string(argv[i + 1]);
        }
    }
    return env("CUTOUT_CONFIG");
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::cout << "==========================================================\n";
    std::cout << "  Background Removal Service\n";
    std::cout << "==========================================================\n\n";

    cutout::ServiceConfig config;
    try {
        auto env = cutout::process_environment();
        config = cutout::ServiceConfig::load(config_path_from(argc, argv, env), env);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Invalid configuration: " << e.what() << "\n";
        return 2;
    }

    std::cout << "Server configuration:\n" << config.to_json().dump(2) << "\n\n";

    // Loaded once, shared read-only by every request
    std::cout << "Loading segmentation model...\n";
    std::shared_ptr<const cutout::Segmenter> segmenter;
    try {
        segmenter = std::make_shared<cutout::NcnnSegmenter>(config.model);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Failed to load segmentation model: " << e.what() << "\n";
        return 1;
    }
    std::cout << "  - Model: " << segmenter->name()
              << (config.model.serialize ? " (serialized)" : " (concurrent)") << "\n\n";

    auto remover = std::make_shared<const cutout::BackgroundRemover>(segmenter, config.model.serialize);
    cutout::Pipeline pipeline(config.pipeline, remover);

    // Declared after the pipeline so its workers are joined before the pipeline goes away
    cutout::WorkerPool pool(config.server.worker_threads, config.server.max_pending);
    std::cout << "Worker pool: " << pool.size() << " threads, backlog "
              << pool.max_pending() << "\n\n";

    httplib::Server server;

    // Multipart framing and base64 inflate the body beyond the image itself
    const size_t max_upload = config.pipeline.validation.max_upload_bytes;
    server.set_payload_max_length(max_upload + max_upload / 3 + 64 * 1024);

    server.set_default_headers({
        {"Access-Control-Allow-Origin", config.server.cors_origins}
    });

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << req.method << " " << req.path << " -> " << res.status << "\n";
    });

    server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) return;
        const char* code = "bad_request";
        if (res.status == 404) code = "not_found";
        else if (res.status == 413) code = "payload_too_large";
        else if (res.status >= 500) code = "internal_error";
        nlohmann::json error = {
            {"success", false},
            {"error", code},
            {"message", httplib::status_message(res.status)}
        };
        res.set_content(error.dump(2), "application/json");
    });

    // Health check endpoint
    const std::string model_name = segmenter->name();
    server.Get("/health", [model_name](const httplib::Request&, httplib::Response& res) {
        nlohmann::json health = {
            {"status", "healthy"},
            {"service", "background-removal-api"},
            {"model", model_name}
        };
        res.set_content(health.dump(2), "application/json");
    });

    // Root endpoint (welcome message)
    server.Get("/", [](const httplib::Request&, httplib::Response& res) {
        const char* json = R"json({
  "message": "Background Removal API",
  "version": "1.0.0",
  "endpoints": {
    "GET /": "This message",
    "GET /health": "Health check",
    "GET /api-info": "Parameters, supported formats and limits",
    "POST /remove-background": "Multipart upload, returns a PNG",
    "POST /remove-background/base64": "JSON upload, returns base64 PNG"
  }
})json";

        res.set_content(json, "application/json");
    });

    cutout::ServiceContext context{config, pipeline, pool, model_name};
    cutout::register_routes(server, context);

    std::cout << "Starting server on http://" << config.server.host << ":" << config.server.port << "\n";
    std::cout << "Press Ctrl+C to stop the server...\n\n";

    // Start server (blocking call)
    bool success = server.listen(config.server.host, config.server.port);

    if (!success) {
        std::cerr << "ERROR: Failed to start server on port " << config.server.port << "\n";
        std::cerr << "Make sure the port is not already in use.\n";
        return 1;
    }

    return 0;
}
