#include "routes.hpp"
#include "ImageProcessor.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <iostream>
#include <optional>

using json = nlohmann::json;
using namespace cutout;

namespace {

/**
 * @brief Parse JSON request body
 */
json parse_request(const httplib::Request& req, httplib::Response& res) {
    try {
        return json::parse(req.body);
    } catch (const std::exception& e) {
        res.status = 400;
        json error = {
            {"success", false},
            {"error", "bad_request"},
            {"message", "Invalid JSON body"}
        };
        res.set_content(error.dump(2), "application/json");
        return json();
    }
}

/**
 * @brief Send JSON response
 */
void send_response(httplib::Response& res, const json& data, int status = 200) {
    res.status = status;
    res.set_content(data.dump(2), "application/json");
}

/**
 * @brief Send error response; carries a stable code and a short message only
 */
void send_error(httplib::Response& res, const std::string& code,
                const std::string& message, int status = 400) {
    json error = {
        {"success", false},
        {"error", code},
        {"message", message}
    };
    send_response(res, error, status);
}

void send_failure(httplib::Response& res, const ProcessingFailure& failure) {
    send_error(res, error_code(failure.kind), error_message(failure.kind),
               http_status(failure.kind));
}

void set_no_cache(httplib::Response& res) {
    res.set_header("Cache-Control", "no-cache, no-store, must-revalidate");
    res.set_header("Pragma", "no-cache");
    res.set_header("Expires", "0");
}

/**
 * @brief "photo.final.jpg" -> "removed_bg_photo.final.png"
 */
std::string download_name(const std::string& filename) {
    std::string stem = filename.substr(0, filename.rfind('.'));
    for (char& c : stem) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_';
        if (!safe) c = '_';
    }
    if (stem.empty()) stem = "image";
    return "removed_bg_" + stem + ".png";
}

/**
 * @brief Form field from a multipart or urlencoded body; empty means absent
 */
std::optional<std::string> form_field(const httplib::Request& req, const std::string& name) {
    std::string value;
    if (req.has_file(name)) {
        value = req.get_file_value(name).content;
    } else if (req.has_param(name)) {
        value = req.get_param_value(name);
    }
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Hand the upload to the worker pool and wait for it within the deadline
 *
 * On anything but success the error response is already written and
 * nullopt is returned. A run that misses the deadline keeps going on its
 * worker; its result is discarded.
 */
std::optional<EncodedImage> run_pipeline(ServiceContext& context, UploadedImage upload,
                                         std::optional<std::string> color,
                                         httplib::Response& res) {
    std::future<ProcessingResult> future;
    try {
        const Pipeline& pipeline = context.pipeline;
        future = context.pool.submit([&pipeline, upload = std::move(upload), color]() {
            return pipeline.process(upload, color);
        });
    } catch (const PoolSaturated& e) {
        std::cerr << "[busy] " << e.what() << "\n";
        send_error(res, "busy", "Server is busy, please retry later", 503);
        return std::nullopt;
    }

    auto timeout = std::chrono::milliseconds(context.config.server.request_timeout_ms);
    if (future.wait_for(timeout) != std::future_status::ready) {
        std::cerr << "[timeout] processing exceeded " << timeout.count() << " ms\n";
        send_error(res, "timeout", "Processing took too long", 504);
        return std::nullopt;
    }

    ProcessingResult result = future.get();
    if (!result.ok()) {
        const ProcessingFailure& failure = result.error();
        if (is_server_fault(failure.kind)) {
            std::cerr << "[error] " << error_code(failure.kind) << ": " << failure.detail << "\n";
        } else {
            std::cout << "[rejected] " << error_code(failure.kind) << ": " << failure.detail << "\n";
        }
        send_failure(res, failure);
        return std::nullopt;
    }

    return std::move(result.image());
}

} // anonymous namespace

namespace cutout {

void register_routes(httplib::Server& server, ServiceContext& context) {

    // ========================================================================
    // POST /remove-background - multipart upload, PNG response
    // ========================================================================
    server.Post("/remove-background", [&context](const httplib::Request& req, httplib::Response& res) {
        try {
            if (!req.has_file("image")) {
                send_error(res, "missing_image", "Please upload an image file");
                return;
            }

            const auto& file = req.get_file_value("image");
            if (file.filename.empty()) {
                send_error(res, "missing_image", "Please select an image file");
                return;
            }

            std::cout << "Processing image: " << file.filename
                      << " (" << file.content.size() << " bytes)\n";

            UploadedImage upload{
                std::vector<uint8_t>(file.content.begin(), file.content.end()),
                file.filename,
                file.content_type
            };

            auto encoded = run_pipeline(context, std::move(upload),
                                        form_field(req, "background_color"), res);
            if (!encoded) return;  // Error already sent

            set_no_cache(res);
            res.set_header("Content-Disposition",
                           "attachment; filename=\"" + download_name(file.filename) + "\"");
            res.status = 200;
            res.set_content(std::string(encoded->bytes.begin(), encoded->bytes.end()),
                            encoded->content_type);

        } catch (const std::exception& e) {
            std::cerr << "[error] /remove-background: " << e.what() << "\n";
            send_failure(res, ProcessingFailure{ErrorKind::InternalError, e.what()});
        }
    });

    // ========================================================================
    // POST /remove-background/base64 - JSON in, JSON out
    // ========================================================================
    server.Post("/remove-background/base64", [&context](const httplib::Request& req, httplib::Response& res) {
        auto start = std::chrono::high_resolution_clock::now();

        json request = parse_request(req, res);
        if (request.is_null()) return;  // Error already sent

        try {
            if (!request.is_object() || !request.contains("image") || !request["image"].is_string()) {
                send_error(res, "missing_image", "Missing required field: image");
                return;
            }

            std::string base64_image = request["image"];
            // Accept data URLs as produced by browsers
            auto comma = base64_image.find(',');
            if (base64_image.compare(0, 5, "data:") == 0 && comma != std::string::npos) {
                base64_image.erase(0, comma + 1);
            }

            UploadedImage upload;
            try {
                upload.bytes = Base64::decode(base64_image);
            } catch (const std::exception&) {
                send_error(res, "bad_request", "Field image is not valid base64");
                return;
            }
            for (const char* field : {"filename", "content_type"}) {
                if (request.contains(field) && !request[field].is_null() &&
                    !request[field].is_string()) {
                    send_error(res, "bad_request", std::string("Field ") + field + " must be a string");
                    return;
                }
            }
            if (request.contains("filename") && request["filename"].is_string()) {
                upload.filename = request["filename"].get<std::string>();
            }
            if (request.contains("content_type") && request["content_type"].is_string()) {
                upload.content_type = request["content_type"].get<std::string>();
            }

            std::optional<std::string> color;
            if (request.contains("background_color") && request["background_color"].is_string()) {
                std::string value = request["background_color"];
                if (!value.empty()) color = value;
            } else if (request.contains("background_color") && !request["background_color"].is_null()) {
                send_failure(res, ProcessingFailure{ErrorKind::InvalidColor, "non-string color"});
                return;
            }

            auto encoded = run_pipeline(context, std::move(upload), color, res);
            if (!encoded) return;

            auto end = std::chrono::high_resolution_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

            json response = {
                {"success", true},
                {"image", Base64::encode(encoded->bytes.data(), encoded->bytes.size())},
                {"content_type", encoded->content_type},
                {"width", encoded->width},
                {"height", encoded->height},
                {"execution_time_ms", duration.count()}
            };
            set_no_cache(res);
            send_response(res, response);

        } catch (const std::exception& e) {
            std::cerr << "[error] /remove-background/base64: " << e.what() << "\n";
            send_failure(res, ProcessingFailure{ErrorKind::InternalError, e.what()});
        }
    });

    // ========================================================================
    // GET /api-info - Describe the processing endpoints and limits
    // ========================================================================
    server.Get("/api-info", [&context](const httplib::Request&, httplib::Response& res) {
        const ValidationPolicy& policy = context.config.pipeline.validation;

        json response = {
            {"service", "Background Removal API"},
            {"version", "1.0.0"},
            {"endpoints", {
                {"POST /remove-background", {
                    {"description", "Remove background from uploaded image"},
                    {"parameters", {
                        {"image", "Image file (required)"},
                        {"background_color", "Hex color like #FF0000 (optional)"}
                    }}
                }},
                {"POST /remove-background/base64", {
                    {"description", "Same as /remove-background with a JSON body"},
                    {"parameters", {
                        {"image", "Base64-encoded image (required)"},
                        {"filename", "Original file name, used for the format check"},
                        {"background_color", "Hex color like #FF0000 (optional)"}
                    }}
                }}
            }},
            {"supported_formats", policy.allowed_extensions},
            {"limits", {
                {"max_upload_bytes", policy.max_upload_bytes},
                {"min_dimension", policy.min_dimension},
                {"max_width", policy.max_width},
                {"max_height", policy.max_height},
                {"processing_max_dimension", context.config.pipeline.processing_max_dimension}
            }},
            {"model", context.model_name}
        };
        send_response(res, response);
    });

    // ========================================================================
    // OPTIONS * - CORS preflight
    // ========================================================================
    server.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.status = 204;
    });
}

} // namespace cutout
