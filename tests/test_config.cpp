#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "venture/data/config.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace venture;

TEST_CASE("EngineConfig defaults", "[Config]") {
    EngineConfig config;

    REQUIRE(config.instruments.days_per_year == Catch::Approx(365.0));
    REQUIRE(config.instruments.maturity_warning_days == 30);
    REQUIRE(config.irr.max_iterations == 100);
    REQUIRE(config.irr.tolerance == Catch::Approx(1e-7));
    REQUIRE(config.performance.risk_free_rate == Catch::Approx(0.02));
    REQUIRE(config.performance.periods_per_year == 12);
    REQUIRE(config.risk.hhi_high == Catch::Approx(0.25));
    REQUIRE(config.cache.ttl_seconds == Catch::Approx(300.0));
    REQUIRE(config.cache.capacity == 1000);
    REQUIRE_FALSE(config.verbose);
}

TEST_CASE("EngineConfig reads overrides and keeps other defaults", "[Config]") {
    nlohmann::json j = {
        {"instruments", {{"maturity_warning_days", 60}}},
        {"irr", {{"max_iterations", 50}, {"tolerance", 1e-9}}},
        {"performance", {{"risk_free_rate", 0.03}, {"periods_per_year", 4}}},
        {"risk", {{"hhi", {{"moderate", 0.1}, {"high", 0.2}, {"very_high", 0.4}}}, {"holdings", {{"few", 3}}}}},
        {"cache", {{"ttl_seconds", 60}, {"capacity", 10}}},
        {"verbose", true}};

    EngineConfig config = EngineConfig::from_json(j);

    REQUIRE(config.instruments.maturity_warning_days == 60);
    REQUIRE(config.instruments.days_per_year == Catch::Approx(365.0));
    REQUIRE(config.instruments.verbose);
    REQUIRE(config.irr.max_iterations == 50);
    REQUIRE(config.irr.tolerance == Catch::Approx(1e-9));
    REQUIRE(config.irr.max_bisection_iterations == 200);
    REQUIRE(config.performance.risk_free_rate == Catch::Approx(0.03));
    REQUIRE(config.performance.periods_per_year == 4);
    REQUIRE(config.risk.hhi_moderate == Catch::Approx(0.1));
    REQUIRE(config.risk.hhi_very_high == Catch::Approx(0.4));
    REQUIRE(config.risk.holdings_few == 3);
    REQUIRE(config.risk.holdings_some == 10);
    REQUIRE(config.risk.volatility_high == Catch::Approx(0.25));
    REQUIRE(config.cache.ttl_seconds == Catch::Approx(60.0));
    REQUIRE(config.cache.capacity == 10);
    REQUIRE(config.verbose);
}

TEST_CASE("EngineConfig rejects invalid values", "[Config]") {
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"irr", {{"tolerance", 0.0}}}}), std::invalid_argument);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"irr", {{"lower_bound", -1.5}}}}), std::invalid_argument);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"performance", {{"periods_per_year", 0}}}}), std::invalid_argument);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"cache", {{"capacity", 0}}}}), std::invalid_argument);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"cache", {{"ttl_seconds", -5}}}}), std::invalid_argument);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"instruments", {{"maturity_warning_days", -1}}}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"risk", {{"hhi", {{"moderate", 0.3}, {"high", 0.2}}}}}}),
                      std::invalid_argument);
}

TEST_CASE("EngineConfig to_json reloads to the same values", "[Config]") {
    EngineConfig config;
    config.instruments.maturity_warning_days = 45;
    config.irr.initial_guess = 0.2;
    config.risk.score_high = 7;
    config.cache.capacity = 25;

    EngineConfig reloaded = EngineConfig::from_json(config.to_json());

    REQUIRE(reloaded.instruments.maturity_warning_days == 45);
    REQUIRE(reloaded.irr.initial_guess == Catch::Approx(0.2));
    REQUIRE(reloaded.risk.score_high == 7);
    REQUIRE(reloaded.cache.capacity == 25);
}
