/**
 * Unit tests for BridgeConfig and the log sink
 */

#include <catch2/catch_test_macros.hpp>
#include <fixtures/scene_fixture.h>
#include <opbridge/config/bridge_config.h>
#include <opbridge/util/scope.h>

using namespace opbridge;
using namespace opbridge::value;
using namespace opbridge::testing;

TEST_CASE("BridgeConfig - defaults", "[config]") {
    BridgeConfig config;

    REQUIRE(config.default_max_results == 1000);
    REQUIRE(config.log_level == LogLevel::Info);
    REQUIRE(config.log_conversion_failures);
    REQUIRE(config.warn_on_handler_overwrite);
    REQUIRE(config.to_mapping() == Mapping{{"defaultMaxResults", 1000},
                                           {"logLevel", "info"},
                                           {"logConversionFailures", true},
                                           {"warnOnHandlerOverwrite", true}});
}

TEST_CASE("BridgeConfig - overlaying a mapping", "[config]") {
    BridgeConfig base;
    base.warn_on_handler_overwrite = false;

    auto config = BridgeConfig::from_mapping(
        Mapping{{"defaultMaxResults", 50}, {"logLevel", "WARNING"}, {"logConversionFailures", false}, {"other", 1}}, base);

    REQUIRE(config.default_max_results == 50);
    REQUIRE(config.log_level == LogLevel::Warning);
    REQUIRE_FALSE(config.log_conversion_failures);
    REQUIRE_FALSE(config.warn_on_handler_overwrite);
}

TEST_CASE("BridgeConfig - a mapping without a base overlays the defaults", "[config]") {
    BridgeConfig customised;
    customised.default_max_results = 7;
    customised.log_conversion_failures = false;
    BridgeConfig::set(customised);
    auto restore = make_scope_exit([] { BridgeConfig::set(BridgeConfig{}); });

    auto config = BridgeConfig::from_mapping(Mapping{{"warnOnHandlerOverwrite", false}});

    REQUIRE(config.default_max_results == 1000);
    REQUIRE(config.log_level == LogLevel::Info);
    REQUIRE(config.log_conversion_failures);
    REQUIRE_FALSE(config.warn_on_handler_overwrite);

    auto empty = BridgeConfig::from_mapping(Mapping{});
    REQUIRE(empty.to_mapping() == BridgeConfig{}.to_mapping());
}

TEST_CASE("BridgeConfig - rejects keys of the wrong kind", "[config]") {
    REQUIRE_THROWS_AS(BridgeConfig::from_mapping(Mapping{{"defaultMaxResults", 0}}), ValidationError);
    REQUIRE_THROWS_AS(BridgeConfig::from_mapping(Mapping{{"defaultMaxResults", "10"}}), ValidationError);
    REQUIRE_THROWS_AS(BridgeConfig::from_mapping(Mapping{{"logLevel", 2}}), ValidationError);
    REQUIRE_THROWS_AS(BridgeConfig::from_mapping(Mapping{{"logLevel", "verbose"}}), ValidationError);
    REQUIRE_THROWS_WITH(BridgeConfig::from_mapping(Mapping{{"warnOnHandlerOverwrite", "yes"}}),
                        "config key 'warnOnHandlerOverwrite' must be a Bool, got String");
}

TEST_CASE("BridgeConfig - set replaces the instance and applies the log level", "[config]") {
    const auto previous = BridgeConfig::instance();
    const auto previous_level = log_level();
    auto restore = make_scope_exit([&] {
        BridgeConfig::set(previous);
        set_log_level(previous_level);
    });

    BridgeConfig config;
    config.default_max_results = 7;
    config.log_level = LogLevel::Error;
    BridgeConfig::set(config);

    REQUIRE(BridgeConfig::instance().default_max_results == 7);
    REQUIRE(log_level() == LogLevel::Error);
}

TEST_CASE("parse_log_level - names are case-insensitive", "[config]") {
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("Info") == LogLevel::Info);
    REQUIRE(parse_log_level("OFF") == LogLevel::Off);
}

TEST_CASE("Logging - messages below the active level are dropped", "[config][log]") {
    LogCapture logs(LogLevel::Warning);

    log_debug("debug {}", 1);
    log_info("info {}", 2);
    log_warning("warning {}", 3);
    log_error("error {}", 4);

    REQUIRE(logs.lines.size() == 2);
    REQUIRE(logs.lines[0] == std::pair<LogLevel, std::string>{LogLevel::Warning, "warning 3"});
    REQUIRE(logs.lines[1] == std::pair<LogLevel, std::string>{LogLevel::Error, "error 4"});
}

TEST_CASE("Logging - off silences everything", "[config][log]") {
    LogCapture logs(LogLevel::Off);

    log_error("dropped");

    REQUIRE(logs.lines.empty());
    REQUIRE_FALSE(log_enabled(LogLevel::Error));
    REQUIRE_FALSE(log_enabled(LogLevel::Off));
    REQUIRE(to_string(LogLevel::Warning) == "warning");
}
