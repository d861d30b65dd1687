#include "ServiceConfig.hpp"

#include <algorithm>
#include <cstdlib>
#include <climits>
#include <fstream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace cutout {

namespace {

template<typename T>
void read(const json& section, const char* key, T& target) {
    if (!section.contains(key)) {
        return;
    }
    try {
        target = section.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Config key '") + key + "': " + e.what());
    }
}

// Counts are read signed so that a negative value is reported instead of wrapping
void read_count(const json& section, const char* key, size_t& target) {
    long long value = static_cast<long long>(target);
    read(section, key, value);
    if (value < 0) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must not be negative");
    }
    target = static_cast<size_t>(value);
}

// Read wide and range checked; get<int>() would narrow out-of-range numbers silently
void read_int(const json& section, const char* key, int& target) {
    long long value = target;
    read(section, key, value);
    if (value < INT_MIN || value > INT_MAX) {
        throw std::invalid_argument(std::string("Config key '") + key + "' is out of range");
    }
    target = static_cast<int>(value);
}

const json& section_of(const json& doc, const char* name) {
    static const json empty = json::object();
    if (!doc.contains(name)) {
        return empty;
    }
    const json& section = doc.at(name);
    if (!section.is_object()) {
        throw std::invalid_argument(std::string("Config section '") + name + "' must be an object");
    }
    return section;
}

long long parse_number(const std::string& name, const std::string& text) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Environment variable " + name + "='" + text +
                                    "' is not a number");
    }
}

} // anonymous namespace

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

ServiceConfig ServiceConfig::defaults() {
    ServiceConfig config;
    config.server.worker_threads = std::max(1u, std::thread::hardware_concurrency());
    return config;
}

ServiceConfig ServiceConfig::load(const std::optional<std::string>& config_path,
                                  const EnvLookup& env) {
    ServiceConfig config = defaults();

    if (config_path) {
        std::ifstream in(*config_path);
        if (!in.is_open()) {
            throw std::invalid_argument("Cannot open config file: " + *config_path);
        }
        json doc;
        try {
            doc = json::parse(in);
        } catch (const json::parse_error& e) {
            throw std::invalid_argument("Invalid JSON in " + *config_path + ": " + e.what());
        }
        config.apply_json(doc);
    }

    config.apply_environment(env);
    config.validate();
    return config;
}

void ServiceConfig::apply_json(const json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("Config document must be a JSON object");
    }

    const json& srv = section_of(doc, "server");
    read(srv, "host", server.host);
    read_int(srv, "port", server.port);
    read_count(srv, "worker_threads", server.worker_threads);
    read_count(srv, "max_pending", server.max_pending);
    read_int(srv, "request_timeout_ms", server.request_timeout_ms);
    read(srv, "cors_origins", server.cors_origins);

    const json& limits = section_of(doc, "limits");
    ValidationPolicy& policy = pipeline.validation;
    read_count(limits, "max_upload_bytes", policy.max_upload_bytes);
    read_int(limits, "min_dimension", policy.min_dimension);
    read_int(limits, "max_width", policy.max_width);
    read_int(limits, "max_height", policy.max_height);
    read_int(limits, "processing_max_dimension", pipeline.processing_max_dimension);
    read(limits, "allowed_formats", policy.allowed_extensions);

    const json& mdl = section_of(doc, "model");
    read(mdl, "param_path", model.param_path);
    read(mdl, "bin_path", model.bin_path);
    read_int(mdl, "input_size", model.input_size);
    read(mdl, "input_blob", model.input_blob);
    read(mdl, "output_blob", model.output_blob);
    read_int(mdl, "threads", model.threads);
    read(mdl, "serialize", model.serialize);
}

void ServiceConfig::apply_environment(const EnvLookup& env) {
    auto text = [&env](const char* name, std::string& target) {
        if (auto value = env(name)) {
            target = *value;
        }
    };
    auto integer = [&env](const char* name, int& target) {
        if (auto value = env(name)) {
            long long parsed = parse_number(name, *value);
            if (parsed < INT_MIN || parsed > INT_MAX) {
                throw std::invalid_argument(std::string("Environment variable ") + name +
                                            " is out of range");
            }
            target = static_cast<int>(parsed);
        }
    };
    auto count = [&env](const char* name, size_t& target) {
        if (auto value = env(name)) {
            long long parsed = parse_number(name, *value);
            if (parsed < 0) {
                throw std::invalid_argument(std::string("Environment variable ") + name +
                                            " must not be negative");
            }
            target = static_cast<size_t>(parsed);
        }
    };

    // Unprefixed names follow the usual container deployment conventions
    text("HOST", server.host);
    integer("PORT", server.port);
    text("CORS_ORIGINS", server.cors_origins);
    count("MAX_FILE_SIZE", pipeline.validation.max_upload_bytes);
    integer("MIN_IMAGE_SIZE", pipeline.validation.min_dimension);
    integer("MAX_IMAGE_WIDTH", pipeline.validation.max_width);
    integer("MAX_IMAGE_HEIGHT", pipeline.validation.max_height);

    count("CUTOUT_WORKERS", server.worker_threads);
    count("CUTOUT_MAX_PENDING", server.max_pending);
    integer("CUTOUT_REQUEST_TIMEOUT_MS", server.request_timeout_ms);
    integer("CUTOUT_PROCESSING_MAX_DIM", pipeline.processing_max_dimension);
    text("CUTOUT_MODEL_PARAM", model.param_path);
    text("CUTOUT_MODEL_BIN", model.bin_path);
    integer("CUTOUT_MODEL_THREADS", model.threads);
}

void ServiceConfig::validate() const {
    const ValidationPolicy& policy = pipeline.validation;

    if (server.port <= 0 || server.port > 65535) {
        throw std::invalid_argument("server.port must be between 1 and 65535");
    }
    if (server.worker_threads == 0) {
        throw std::invalid_argument("server.worker_threads must be at least 1");
    }
    if (server.request_timeout_ms <= 0) {
        throw std::invalid_argument("server.request_timeout_ms must be positive");
    }
    if (policy.max_upload_bytes == 0) {
        throw std::invalid_argument("limits.max_upload_bytes must be positive");
    }
    // The stb decoders take the buffer length as int
    if (policy.max_upload_bytes > static_cast<size_t>(INT_MAX)) {
        throw std::invalid_argument("limits.max_upload_bytes must not exceed " +
                                    std::to_string(INT_MAX));
    }
    if (policy.min_dimension <= 0 || policy.max_width <= 0 || policy.max_height <= 0) {
        throw std::invalid_argument("limits dimensions must be positive");
    }
    if (policy.min_dimension > policy.max_width || policy.min_dimension > policy.max_height) {
        throw std::invalid_argument("limits.min_dimension exceeds the maximum dimensions");
    }
    if (pipeline.processing_max_dimension <= 0) {
        throw std::invalid_argument("limits.processing_max_dimension must be positive");
    }
    if (policy.allowed_extensions.empty()) {
        throw std::invalid_argument("limits.allowed_formats must not be empty");
    }
    if (model.param_path.empty() || model.bin_path.empty()) {
        throw std::invalid_argument("model.param_path and model.bin_path are required");
    }
    if (model.input_size <= 0) {
        throw std::invalid_argument("model.input_size must be positive");
    }
}

json ServiceConfig::to_json() const {
    const ValidationPolicy& policy = pipeline.validation;
    return json{
        {"server", {
            {"host", server.host},
            {"port", server.port},
            {"worker_threads", server.worker_threads},
            {"max_pending", server.max_pending},
            {"request_timeout_ms", server.request_timeout_ms},
            {"cors_origins", server.cors_origins}
        }},
        {"limits", {
            {"max_upload_bytes", policy.max_upload_bytes},
            {"min_dimension", policy.min_dimension},
            {"max_width", policy.max_width},
            {"max_height", policy.max_height},
            {"processing_max_dimension", pipeline.processing_max_dimension},
            {"allowed_formats", policy.allowed_extensions}
        }},
        {"model", {
            {"param_path", model.param_path},
            {"bin_path", model.bin_path},
            {"input_size", model.input_size},
            {"input_blob", model.input_blob},
            {"output_blob", model.output_blob},
            {"threads", model.threads},
            {"serialize", model.serialize}
        }}
    };
}

} // namespace cutout
