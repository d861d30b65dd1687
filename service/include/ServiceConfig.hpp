#ifndef CUTOUT_SERVICECONFIG_HPP
#define CUTOUT_SERVICECONFIG_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "ModelConfig.hpp"
#include "Pipeline.hpp"

namespace cutout {

struct ServerSettings {
    std::string host = "0.0.0.0";
    int port = 8000;
    size_t worker_threads = 1;
    size_t max_pending = 64;
    int request_timeout_ms = 60000;
    std::string cors_origins = "*";
};

/**
 * @brief Looks up one environment variable; nullopt when unset
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief EnvLookup backed by the process environment
 */
EnvLookup process_environment();

/**
 * @brief Complete service configuration
 *
 * Layered as compiled defaults, then an optional JSON file, then
 * environment variables. Layout of the JSON file:
 * @code
 *   {
 *     "server": {"host", "port", "worker_threads", "max_pending",
 *                "request_timeout_ms", "cors_origins"},
 *     "limits": {"max_upload_bytes", "min_dimension", "max_width", "max_height",
 *                "processing_max_dimension", "allowed_formats": [...]},
 *     "model":  {"param_path", "bin_path", "input_size", "input_blob",
 *                "output_blob", "threads", "serialize"}
 *   }
 * @endcode
 * Every key is optional.
 */
struct ServiceConfig {
    ServerSettings server;
    PipelineOptions pipeline;
    ModelConfig model;

    /**
     * @brief Compiled defaults; worker_threads follows hardware concurrency
     */
    static ServiceConfig defaults();

    /**
     * @brief Build the full configuration
     * @param config_path JSON file to apply on top of the defaults, if any
     * @param env Source of environment overrides
     * @throws std::invalid_argument on unreadable files, malformed values or
     *         a configuration that fails validate()
     */
    static ServiceConfig load(const std::optional<std::string>& config_path, const EnvLookup& env);

    /**
     * @throws std::invalid_argument on type mismatches
     */
    void apply_json(const nlohmann::json& doc);

    /**
     * @throws std::invalid_argument if a variable is set but not a valid number
     */
    void apply_environment(const EnvLookup& env);

    /**
     * @throws std::invalid_argument describing the first violated constraint
     */
    void validate() const;

    nlohmann::json to_json() const;
};

} // namespace cutout

#endif // CUTOUT_SERVICECONFIG_HPP
