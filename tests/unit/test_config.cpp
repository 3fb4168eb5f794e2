// Sluice Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "../../src/control/config.hpp"

using namespace sluice::control;

namespace {

bool has_message(const std::vector<std::string>& messages, const std::string& needle) {
    for (const auto& m : messages) {
        if (m.find(needle) != std::string::npos) return true;
    }
    return false;
}

Config valid_config() {
    Config config;
    config.server.listen_port = 3333;
    config.pools.push_back(PoolConfig{"pool.example.com", 3334});
    return config;
}

}  // namespace

TEST_CASE("Config defaults", "[control][config]") {
    Config config;

    REQUIRE(config.server.worker_threads == 1);
    REQUIRE(config.server.listen_address == "0.0.0.0");
    REQUIRE(config.server.listen_port == 3333);
    REQUIRE(config.pools.empty());
    REQUIRE(config.health_check.enabled);
    REQUIRE(config.health_check.interval == 30);
    REQUIRE(config.health_check.timeout == 5);
    REQUIRE(config.logging.level == "info");
    REQUIRE(config.logging.format == "json");
    REQUIRE(config.metrics.enabled);
    REQUIRE(config.metrics.port == 3000);
    REQUIRE(config.metrics.path == "/metrics");
}

TEST_CASE("Config JSON serialization", "[control][config]") {
    Config config = valid_config();
    config.server.worker_threads = 4;

    std::string json = ConfigLoader::to_json(config);
    REQUIRE_FALSE(json.empty());

    auto j = nlohmann::json::parse(json);
    REQUIRE(j["server"]["listen_port"] == 3333);
    REQUIRE(j["server"]["worker_threads"] == 4);
    REQUIRE(j["pools"].size() == 1);
    REQUIRE(j["pools"][0]["host"] == "pool.example.com");
    REQUIRE(j["pools"][0]["port"] == 3334);
    REQUIRE(j["health_check"]["interval"] == 30);
    REQUIRE(j["metrics"]["path"] == "/metrics");
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "server": {
            "worker_threads": 2,
            "listen_address": "127.0.0.1",
            "listen_port": 4444
        },
        "pools": [
            {"host": "a.example", "port": 3333},
            {"host": "b.example", "port": 4444}
        ],
        "health_check": {"interval": 10, "timeout": 2},
        "logging": {"level": "debug", "format": "text", "rotation": {"max_files": 3}},
        "metrics": {"port": 9100, "path": "/stats"}
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());

    const auto& config = *maybe_config;
    REQUIRE(config.server.worker_threads == 2);
    REQUIRE(config.server.listen_address == "127.0.0.1");
    REQUIRE(config.server.listen_port == 4444);
    REQUIRE(config.pools.size() == 2);
    REQUIRE(config.pools[0].host == "a.example");
    REQUIRE(config.pools[1].port == 4444);
    REQUIRE(config.health_check.interval == 10);
    REQUIRE(config.health_check.timeout == 2);
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.logging.format == "text");
    REQUIRE(config.logging.rotation.max_files == 3);
    REQUIRE(config.logging.rotation.max_size_mb == 100);
    REQUIRE(config.metrics.port == 9100);
    REQUIRE(config.metrics.path == "/stats");
}

TEST_CASE("Legacy flat configuration keys", "[control][config]") {
    const char* json = R"({
        "pools": [{"host": "10.0.0.1", "port": 3333}],
        "proxyPort": 5555,
        "metricsPort": 5556
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());
    REQUIRE(maybe_config->server.listen_port == 5555);
    REQUIRE(maybe_config->metrics.port == 5556);
    REQUIRE(maybe_config->pools.size() == 1);
}

TEST_CASE("Config validation - valid config", "[control][config]") {
    auto result = ConfigLoader::validate(valid_config());
    REQUIRE(result.valid);
    REQUIRE(result.errors.empty());
    REQUIRE(result.warnings.empty());
}

TEST_CASE("Config validation - errors", "[control][config]") {
    Config config = valid_config();

    SECTION("zero listen port") {
        config.server.listen_port = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_message(result.errors, "listen_port"));
    }

    SECTION("pool without host") {
        config.pools.push_back(PoolConfig{"", 3333});
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_message(result.errors, "host cannot be empty"));
    }

    SECTION("pool with zero port") {
        config.pools[0].port = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.valid);
    }

    SECTION("zero health interval") {
        config.health_check.interval = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_message(result.errors, "interval"));
    }

    SECTION("zero health interval is fine when disabled") {
        config.health_check.enabled = false;
        config.health_check.interval = 0;
        REQUIRE(ConfigLoader::validate(config).valid);
    }

    SECTION("unknown log level") {
        config.logging.level = "verbose";
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_message(result.errors, "verbose"));
    }

    SECTION("unknown log format") {
        config.logging.format = "xml";
        REQUIRE_FALSE(ConfigLoader::validate(config).valid);
    }

    SECTION("metrics port equals relay port") {
        config.metrics.port = config.server.listen_port;
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_message(result.errors, "conflicts"));
    }

    SECTION("metrics port conflict ignored when metrics disabled") {
        config.metrics.enabled = false;
        config.metrics.port = config.server.listen_port;
        REQUIRE(ConfigLoader::validate(config).valid);
    }

    SECTION("metrics path without leading slash") {
        config.metrics.path = "metrics";
        REQUIRE_FALSE(ConfigLoader::validate(config).valid);
    }
}

TEST_CASE("Config validation - warnings", "[control][config]") {
    Config config = valid_config();

    SECTION("no pools") {
        config.pools.clear();
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE(has_message(result.warnings, "No pools configured"));
    }

    SECTION("duplicate pool") {
        config.pools.push_back(config.pools[0]);
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE(has_message(result.warnings, "more than once"));
    }

    SECTION("health timeout not below interval") {
        config.health_check.interval = 5;
        config.health_check.timeout = 5;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE(has_message(result.warnings, "timeout"));
    }
}

TEST_CASE("Out-of-range numbers are rejected, not wrapped", "[control][config]") {
    ValidationResult result;

    SECTION("pool port above 65535") {
        auto config = ConfigLoader::load_from_json(
            R"({"pools": [{"host": "pool.example.com", "port": 70000}]})", &result);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(has_message(result.errors, "port must be in 1..65535, got 70000"));
    }

    SECTION("negative legacy proxyPort") {
        auto config = ConfigLoader::load_from_json(
            R"({"pools": [{"host": "pool.example.com", "port": 3334}], "proxyPort": -1})", &result);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(has_message(result.errors, "listen_port must be in 1..65535, got -1"));
    }

    SECTION("metrics port above 65535") {
        auto config = ConfigLoader::load_from_json(
            R"({"pools": [{"host": "pool.example.com", "port": 3334}], "metricsPort": 65536})",
            &result);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(has_message(result.errors, "Metrics port"));
    }

    SECTION("negative worker_threads") {
        auto config = ConfigLoader::load_from_json(
            R"({"server": {"worker_threads": -1}, "pools": [{"host": "h", "port": 1}]})", &result);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(has_message(result.errors, "worker_threads"));
    }

    SECTION("boundary values are accepted") {
        auto config = ConfigLoader::load_from_json(
            R"({"server": {"listen_port": 65535, "worker_threads": 0},
                "pools": [{"host": "h", "port": 1}]})",
            &result);
        REQUIRE(config.has_value());
        REQUIRE(config->server.listen_port == 65535);
        REQUIRE(config->server.worker_threads == 0);
        REQUIRE(config->pools[0].port == 1);
    }
}

TEST_CASE("Log rotation size is bounded", "[control][config]") {
    Config config = valid_config();

    SECTION("zero") {
        config.logging.rotation.max_size_mb = 0;
        REQUIRE_FALSE(ConfigLoader::validate(config).valid);
    }

    SECTION("past 32-bit byte counts") {
        // 5000 MB no longer fits in 32 bits once converted to bytes
        config.logging.rotation.max_size_mb = 5000;
        REQUIRE(ConfigLoader::validate(config).valid);
    }

    SECTION("absurdly large") {
        config.logging.rotation.max_size_mb = 4'000'000;
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_message(result.errors, "max_size_mb"));
    }
}

TEST_CASE("Invalid JSON is reported", "[control][config]") {
    ValidationResult result;
    auto config = ConfigLoader::load_from_json("{\"pools\": [", &result);

    REQUIRE_FALSE(config.has_value());
    REQUIRE_FALSE(result.valid);
    REQUIRE(has_message(result.errors, "JSON parsing error"));
}

TEST_CASE("Wrongly typed field is reported", "[control][config]") {
    ValidationResult result;
    auto config = ConfigLoader::load_from_json(R"({"server": {"listen_port": "abc"}})", &result);

    REQUIRE_FALSE(config.has_value());
    REQUIRE(has_message(result.errors, "JSON parsing error"));
}

TEST_CASE("Validation failure from load_from_json", "[control][config]") {
    ValidationResult result;
    auto config = ConfigLoader::load_from_json(R"({"server": {"listen_port": 0}})", &result);

    REQUIRE_FALSE(config.has_value());
    REQUIRE(has_message(result.errors, "listen_port"));
}

TEST_CASE("Config file loading", "[control][config]") {
    auto path = std::filesystem::temp_directory_path() / "sluice_test_config.json";

    {
        std::ofstream out(path);
        out << R"({"server": {"listen_port": 7777}, "pools": [{"host": "h", "port": 1}]})";
    }

    ValidationResult result;
    auto config = ConfigLoader::load_from_file(path.string(), &result);
    REQUIRE(config.has_value());
    REQUIRE(config->server.listen_port == 7777);
    REQUIRE(config->pools.size() == 1);
    REQUIRE(result.valid);

    std::filesystem::remove(path);
}

TEST_CASE("Missing config file", "[control][config]") {
    ValidationResult result;
    auto config = ConfigLoader::load_from_file("/nonexistent/sluice.json", &result);

    REQUIRE_FALSE(config.has_value());
    REQUIRE(has_message(result.errors, "Cannot open configuration file"));
}
