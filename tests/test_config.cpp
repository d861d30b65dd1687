#define BOOST_TEST_MODULE ServiceConfigTests
#include <boost/test/unit_test.hpp>

#include "ServiceConfig.hpp"

#include <climits>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

using namespace cutout;
using json = nlohmann::json;

namespace {

EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

// Writes a config file under the temp directory and removes it afterwards
struct TempConfigFile {
    std::string path;

    explicit TempConfigFile(const std::string& contents) {
        static int counter = 0;
        path = (std::filesystem::temp_directory_path() /
                ("cutout_config_" + std::to_string(counter++) + ".json")).string();
        std::ofstream out(path);
        out << contents;
    }

    ~TempConfigFile() { std::remove(path.c_str()); }
};

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(Defaults)

BOOST_AUTO_TEST_CASE(compiled_defaults) {
    ServiceConfig config = ServiceConfig::defaults();

    BOOST_CHECK_EQUAL(config.server.host, "0.0.0.0");
    BOOST_CHECK_EQUAL(config.server.port, 8000);
    BOOST_CHECK_GE(config.server.worker_threads, 1);
    BOOST_CHECK_EQUAL(config.server.cors_origins, "*");
    BOOST_CHECK_EQUAL(config.pipeline.validation.max_upload_bytes, 16u * 1024 * 1024);
    BOOST_CHECK_EQUAL(config.pipeline.validation.min_dimension, 100);
    BOOST_CHECK_EQUAL(config.pipeline.validation.max_width, 4000);
    BOOST_CHECK_EQUAL(config.pipeline.validation.max_height, 4000);
    BOOST_CHECK_EQUAL(config.pipeline.processing_max_dimension, 2048);
    BOOST_CHECK_EQUAL(config.pipeline.validation.allowed_extensions.size(), 6);
    BOOST_CHECK(config.model.serialize);
    BOOST_CHECK_NO_THROW(config.validate());
}

BOOST_AUTO_TEST_CASE(load_without_file_or_env) {
    ServiceConfig config = ServiceConfig::load(std::nullopt, fake_env({}));
    BOOST_CHECK_EQUAL(config.server.port, 8000);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonLayer)

BOOST_AUTO_TEST_CASE(applies_every_section) {
    ServiceConfig config = ServiceConfig::defaults();
    config.apply_json(json::parse(R"({
        "server": {"host": "127.0.0.1", "port": 9090, "worker_threads": 3,
                   "max_pending": 5, "request_timeout_ms": 1500, "cors_origins": "https://a.example"},
        "limits": {"max_upload_bytes": 2048, "min_dimension": 20, "max_width": 800,
                   "max_height": 600, "processing_max_dimension": 512,
                   "allowed_formats": ["png", "webp"]},
        "model":  {"param_path": "m.param", "bin_path": "m.bin", "input_size": 512,
                   "input_blob": "input", "output_blob": "mask", "threads": 2, "serialize": false}
    })"));

    BOOST_CHECK_EQUAL(config.server.host, "127.0.0.1");
    BOOST_CHECK_EQUAL(config.server.port, 9090);
    BOOST_CHECK_EQUAL(config.server.worker_threads, 3);
    BOOST_CHECK_EQUAL(config.server.max_pending, 5);
    BOOST_CHECK_EQUAL(config.server.request_timeout_ms, 1500);
    BOOST_CHECK_EQUAL(config.server.cors_origins, "https://a.example");

    const ValidationPolicy& policy = config.pipeline.validation;
    BOOST_CHECK_EQUAL(policy.max_upload_bytes, 2048);
    BOOST_CHECK_EQUAL(policy.min_dimension, 20);
    BOOST_CHECK_EQUAL(policy.max_width, 800);
    BOOST_CHECK_EQUAL(policy.max_height, 600);
    BOOST_CHECK_EQUAL(config.pipeline.processing_max_dimension, 512);
    BOOST_CHECK(policy.allowed_extensions == (std::set<std::string>{"png", "webp"}));

    BOOST_CHECK_EQUAL(config.model.param_path, "m.param");
    BOOST_CHECK_EQUAL(config.model.bin_path, "m.bin");
    BOOST_CHECK_EQUAL(config.model.input_size, 512);
    BOOST_CHECK_EQUAL(config.model.input_blob, "input");
    BOOST_CHECK_EQUAL(config.model.output_blob, "mask");
    BOOST_CHECK_EQUAL(config.model.threads, 2);
    BOOST_CHECK(!config.model.serialize);
}

BOOST_AUTO_TEST_CASE(missing_keys_keep_defaults) {
    ServiceConfig config = ServiceConfig::defaults();
    config.apply_json(json::parse(R"({"server": {"port": 8123}})"));

    BOOST_CHECK_EQUAL(config.server.port, 8123);
    BOOST_CHECK_EQUAL(config.server.host, "0.0.0.0");
    BOOST_CHECK_EQUAL(config.pipeline.validation.min_dimension, 100);
}

BOOST_AUTO_TEST_CASE(type_mismatch_throws) {
    ServiceConfig config = ServiceConfig::defaults();
    BOOST_CHECK_THROW(config.apply_json(json::parse(R"({"server": {"port": "eighty"}})")),
                      std::invalid_argument);
    BOOST_CHECK_THROW(config.apply_json(json::parse(R"({"server": []})")), std::invalid_argument);
    BOOST_CHECK_THROW(config.apply_json(json::parse(R"([1, 2])")), std::invalid_argument);
    BOOST_CHECK_THROW(config.apply_json(json::parse(R"({"server": {"worker_threads": -2}})")),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(out_of_range_integers_throw) {
    ServiceConfig config = ServiceConfig::defaults();
    BOOST_CHECK_THROW(config.apply_json(json::parse(R"({"server": {"port": 4294975296}})")),
                      std::invalid_argument);
    BOOST_CHECK_THROW(config.apply_json(json::parse(R"({"model": {"threads": -4294967297}})")),
                      std::invalid_argument);
    BOOST_CHECK_EQUAL(config.server.port, 8000);
}

BOOST_AUTO_TEST_CASE(load_reads_file) {
    TempConfigFile file(R"({"server": {"port": 7001}, "limits": {"min_dimension": 64}})");

    ServiceConfig config = ServiceConfig::load(file.path, fake_env({}));
    BOOST_CHECK_EQUAL(config.server.port, 7001);
    BOOST_CHECK_EQUAL(config.pipeline.validation.min_dimension, 64);
}

BOOST_AUTO_TEST_CASE(load_rejects_bad_files) {
    BOOST_CHECK_THROW(ServiceConfig::load(std::string("/nonexistent/cutout.json"), fake_env({})),
                      std::invalid_argument);

    TempConfigFile broken("{ not json");
    BOOST_CHECK_THROW(ServiceConfig::load(broken.path, fake_env({})), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EnvironmentLayer)

BOOST_AUTO_TEST_CASE(environment_overrides_file) {
    TempConfigFile file(R"({"server": {"port": 7001, "host": "10.0.0.1"}})");

    ServiceConfig config = ServiceConfig::load(file.path, fake_env({
        {"PORT", "7002"},
        {"MAX_FILE_SIZE", "1048576"},
        {"MIN_IMAGE_SIZE", "32"},
        {"MAX_IMAGE_WIDTH", "1024"},
        {"MAX_IMAGE_HEIGHT", "768"},
        {"CORS_ORIGINS", "https://app.example"},
        {"CUTOUT_WORKERS", "6"},
        {"CUTOUT_MAX_PENDING", "0"},
        {"CUTOUT_REQUEST_TIMEOUT_MS", "2500"},
        {"CUTOUT_PROCESSING_MAX_DIM", "1024"},
        {"CUTOUT_MODEL_PARAM", "/models/a.param"},
        {"CUTOUT_MODEL_BIN", "/models/a.bin"},
        {"CUTOUT_MODEL_THREADS", "4"}
    }));

    BOOST_CHECK_EQUAL(config.server.port, 7002);
    BOOST_CHECK_EQUAL(config.server.host, "10.0.0.1");
    BOOST_CHECK_EQUAL(config.server.cors_origins, "https://app.example");
    BOOST_CHECK_EQUAL(config.server.worker_threads, 6);
    BOOST_CHECK_EQUAL(config.server.max_pending, 0);
    BOOST_CHECK_EQUAL(config.server.request_timeout_ms, 2500);
    BOOST_CHECK_EQUAL(config.pipeline.validation.max_upload_bytes, 1048576);
    BOOST_CHECK_EQUAL(config.pipeline.validation.min_dimension, 32);
    BOOST_CHECK_EQUAL(config.pipeline.validation.max_width, 1024);
    BOOST_CHECK_EQUAL(config.pipeline.validation.max_height, 768);
    BOOST_CHECK_EQUAL(config.pipeline.processing_max_dimension, 1024);
    BOOST_CHECK_EQUAL(config.model.param_path, "/models/a.param");
    BOOST_CHECK_EQUAL(config.model.bin_path, "/models/a.bin");
    BOOST_CHECK_EQUAL(config.model.threads, 4);
}

BOOST_AUTO_TEST_CASE(non_numeric_values_throw) {
    ServiceConfig config = ServiceConfig::defaults();
    BOOST_CHECK_THROW(config.apply_environment(fake_env({{"PORT", "http"}})), std::invalid_argument);
    BOOST_CHECK_THROW(config.apply_environment(fake_env({{"MAX_FILE_SIZE", "10MB"}})),
                      std::invalid_argument);
    BOOST_CHECK_THROW(config.apply_environment(fake_env({{"CUTOUT_WORKERS", "-1"}})),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(out_of_range_values_do_not_wrap) {
    // 2^32 + 8000 would truncate to a valid looking port
    ServiceConfig config = ServiceConfig::defaults();
    BOOST_CHECK_THROW(config.apply_environment(fake_env({{"PORT", "4294975296"}})),
                      std::invalid_argument);
    BOOST_CHECK_THROW(config.apply_environment(fake_env({{"MAX_IMAGE_WIDTH", "-2147483649"}})),
                      std::invalid_argument);
    BOOST_CHECK_EQUAL(config.server.port, 8000);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Validation)

BOOST_AUTO_TEST_CASE(rejects_inconsistent_settings) {
    auto invalid = [](auto mutate) {
        ServiceConfig config = ServiceConfig::defaults();
        mutate(config);
        BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
    };

    invalid([](ServiceConfig& c) { c.server.port = 0; });
    invalid([](ServiceConfig& c) { c.server.port = 70000; });
    invalid([](ServiceConfig& c) { c.server.worker_threads = 0; });
    invalid([](ServiceConfig& c) { c.server.request_timeout_ms = 0; });
    invalid([](ServiceConfig& c) { c.pipeline.validation.max_upload_bytes = 0; });
    invalid([](ServiceConfig& c) {
        c.pipeline.validation.max_upload_bytes = static_cast<size_t>(INT_MAX) + 1;
    });
    invalid([](ServiceConfig& c) { c.pipeline.validation.min_dimension = 5000; });
    invalid([](ServiceConfig& c) { c.pipeline.processing_max_dimension = -1; });
    invalid([](ServiceConfig& c) { c.pipeline.validation.allowed_extensions.clear(); });
    invalid([](ServiceConfig& c) { c.model.bin_path.clear(); });
    invalid([](ServiceConfig& c) { c.model.input_size = 0; });
}

BOOST_AUTO_TEST_CASE(load_validates_final_result) {
    BOOST_CHECK_THROW(ServiceConfig::load(std::nullopt, fake_env({{"PORT", "0"}})),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Serialisation)

BOOST_AUTO_TEST_CASE(to_json_reloads_to_same_values) {
    ServiceConfig written = ServiceConfig::defaults();
    written.server.port = 9001;
    written.pipeline.validation.allowed_extensions = {"png"};
    written.model.serialize = false;

    ServiceConfig reloaded = ServiceConfig::defaults();
    reloaded.apply_json(written.to_json());

    BOOST_CHECK_EQUAL(reloaded.server.port, 9001);
    BOOST_CHECK_EQUAL(reloaded.pipeline.validation.allowed_extensions.size(), 1);
    BOOST_CHECK(!reloaded.model.serialize);
    BOOST_CHECK_EQUAL(reloaded.to_json().dump(), written.to_json().dump());
}

BOOST_AUTO_TEST_SUITE_END()
