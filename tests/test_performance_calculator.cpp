#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "venture/analytics/performance_calculator.hpp"
#include "venture/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <cmath>

using namespace venture;
using namespace venture::analytics;
using Catch::Matchers::WithinAbs;

namespace {

data::InvestmentRecord investment(const std::string& id, const core::Date& date, double amount,
                                  double valuation, data::InvestmentStatus status)
{
    data::InvestmentRecord r;
    r.id = id;
    r.portfolio_id = "P1";
    r.amount = amount;
    r.investment_date = date;
    r.current_valuation = valuation;
    r.status = status;
    return r;
}

// Two 10k investments on 2022-01-01. B exits for 12k after one year,
// A is held at 15k two years in.
data::PortfolioRecords two_year_portfolio()
{
    data::PortfolioRecords p;
    p.portfolio_id = "P1";
    p.name = "Two Year";
    p.as_of = core::Date(2024, 1, 1);
    p.investments = {
        investment("A", core::Date(2022, 1, 1), 10000.0, 15000.0, data::InvestmentStatus::ACTIVE),
        investment("B", core::Date(2022, 1, 1), 10000.0, 0.0, data::InvestmentStatus::EXITED),
    };
    p.distributions = {{"B", core::Date(2023, 1, 1), 12000.0}};
    p.valuations = {
        {core::Date(2023, 9, 30), 100.0},
        {core::Date(2023, 10, 31), 110.0},
        {core::Date(2023, 11, 30), 99.0},
        {core::Date(2023, 12, 31), 108.9},
    };
    return p;
}

} // namespace

TEST_CASE("PerformanceCalculator return metrics", "[PerformanceCalculator]") {
    data::InMemoryPortfolioSource source;
    source.add(two_year_portfolio());
    PerformanceCalculator calc(source);

    auto perf = calc.calculate_portfolio_performance("P1", data::DateRange());

    REQUIRE(perf.portfolio_id == "P1");
    REQUIRE(perf.as_of == core::Date(2024, 1, 1));
    REQUIRE(perf.num_investments == 2);
    REQUIRE(perf.num_cash_flows == 4);
    REQUIRE_THAT(perf.total_invested, WithinAbs(20000.0, 1e-9));
    REQUIRE_THAT(perf.total_distributions, WithinAbs(12000.0, 1e-9));
    REQUIRE_THAT(perf.current_value, WithinAbs(15000.0, 1e-9));

    REQUIRE_THAT(perf.moic, WithinAbs(1.35, 1e-12));
    REQUIRE_THAT(perf.cash_on_cash, WithinAbs(0.60, 1e-12));
    REQUIRE_THAT(perf.total_return, WithinAbs(0.35, 1e-12));
    // 730 days between first and last flow
    REQUIRE_THAT(perf.annualized_return, WithinAbs(std::sqrt(1.35) - 1.0, 1e-12));

    // -20000 + 12000 / (1 + r) + 15000 / (1 + r)^2 = 0
    double r = perf.irr;
    double npv = -20000.0 + 12000.0 / (1.0 + r) + 15000.0 / std::pow(1.0 + r, 2.0);
    REQUIRE_THAT(npv, WithinAbs(0.0, 47000.0 * 1e-7));
    REQUIRE_THAT(perf.irr, WithinAbs(0.2165, 1e-3));
    REQUIRE(perf.irr_iterations >= 1);
}

TEST_CASE("PerformanceCalculator volatility and Sharpe", "[PerformanceCalculator]") {
    data::InMemoryPortfolioSource source;
    source.add(two_year_portfolio());
    PerformanceCalculator calc(source);

    auto perf = calc.calculate_portfolio_performance("P1", data::DateRange());

    // monthly returns +10%, -10%, +10%: population stdev scaled by sqrt(12)
    double mean = 0.1 / 3.0;
    double var = (std::pow(0.1 - mean, 2) + std::pow(-0.1 - mean, 2) + std::pow(0.1 - mean, 2)) / 3.0;
    double expected_vol = std::sqrt(var) * std::sqrt(12.0);

    REQUIRE(perf.num_periods == 3);
    REQUIRE_THAT(perf.volatility, WithinAbs(expected_vol, 1e-9));
    REQUIRE_THAT(perf.sharpe_ratio, WithinAbs((perf.annualized_return - 0.02) / expected_vol, 1e-9));

    SECTION("Custom risk-free rate and period count") {
        PerformanceConfig config;
        config.risk_free_rate = 0.05;
        config.periods_per_year = 4;
        PerformanceCalculator quarterly(source, config);
        auto q = quarterly.calculate_portfolio_performance("P1", data::DateRange());
        REQUIRE_THAT(q.volatility, WithinAbs(std::sqrt(var) * 2.0, 1e-9));
        REQUIRE_THAT(q.sharpe_ratio, WithinAbs((q.annualized_return - 0.05) / q.volatility, 1e-9));
    }
}

TEST_CASE("PerformanceCalculator without valuation history", "[PerformanceCalculator]") {
    auto p = two_year_portfolio();
    p.valuations.clear();
    data::InMemoryPortfolioSource source;
    source.add(p);
    PerformanceCalculator calc(source);

    auto perf = calc.calculate_portfolio_performance("P1", data::DateRange());
    REQUIRE(perf.num_periods == 0);
    REQUIRE(perf.volatility == 0.0);
    REQUIRE(perf.sharpe_ratio == 0.0);
    REQUIRE(perf.moic > 1.0);
}

TEST_CASE("PerformanceCalculator with nothing invested", "[PerformanceCalculator]") {
    SECTION("Only pending investments") {
        data::PortfolioRecords p;
        p.portfolio_id = "EMPTY";
        p.as_of = core::Date(2024, 1, 1);
        p.investments = {
            investment("X", core::Date(2023, 1, 1), 5000.0, 5000.0, data::InvestmentStatus::PENDING),
        };
        data::InMemoryPortfolioSource empty_source;
        PerformanceCalculator calc(empty_source);
        auto perf = calc.calculate(p, data::DateRange());
        REQUIRE(perf.total_invested == 0.0);
        REQUIRE(perf.irr == 0.0);
        REQUIRE(perf.moic == 0.0);
        REQUIRE(perf.cash_on_cash == 0.0);
        REQUIRE(perf.annualized_return == 0.0);
        REQUIRE(perf.irr_iterations == 0);
    }

    SECTION("Range excludes every investment") {
        data::InMemoryPortfolioSource source;
        source.add(two_year_portfolio());
        PerformanceCalculator calc(source);

        data::DateRange range;
        range.start = core::Date(2022, 6, 1);
        range.end = core::Date(2023, 6, 30);
        auto perf = calc.calculate_portfolio_performance("P1", range);

        REQUIRE(perf.total_invested == 0.0);
        REQUIRE_THAT(perf.total_distributions, WithinAbs(12000.0, 1e-9));
        REQUIRE(perf.moic == 0.0);
        REQUIRE(perf.irr == 0.0);
        REQUIRE(perf.as_of == core::Date(2023, 6, 30));
    }
}

TEST_CASE("PerformanceCalculator unknown portfolio", "[PerformanceCalculator]") {
    data::InMemoryPortfolioSource source;
    PerformanceCalculator calc(source);
    REQUIRE_THROWS_AS(calc.calculate_portfolio_performance("NOPE", data::DateRange()), core::NotFoundError);
}

TEST_CASE("PerformanceCalculator static helpers", "[PerformanceCalculator]") {
    REQUIRE(PerformanceCalculator::annualize(0.5, 0.0) == 0.0);
    REQUIRE(PerformanceCalculator::annualize(-1.5, 2.0) == -1.0);
    REQUIRE_THAT(PerformanceCalculator::annualize(0.21, 2.0), WithinAbs(0.10, 1e-12));

    std::vector<data::DatedReturn> one = {{core::Date(2024, 1, 31), 0.05}};
    REQUIRE(PerformanceCalculator::annualized_volatility(one, 12) == 0.0);

    std::vector<data::DatedReturn> flat = {{core::Date(2024, 1, 31), 0.01}, {core::Date(2024, 2, 29), 0.01}};
    REQUIRE_THAT(PerformanceCalculator::annualized_volatility(flat, 12), WithinAbs(0.0, 1e-15));
}

TEST_CASE("PerformanceSnapshot export", "[PerformanceCalculator]") {
    data::InMemoryPortfolioSource source;
    source.add(two_year_portfolio());
    PerformanceCalculator calc(source);
    auto perf = calc.calculate_portfolio_performance("P1", data::DateRange());

    auto text = perf.summary();
    REQUIRE(text.find("Portfolio Performance: P1") != std::string::npos);
    REQUIRE(text.find("MOIC:") != std::string::npos);

    auto j = nlohmann::json::parse(perf.to_json());
    REQUIRE(j["portfolio_id"] == "P1");
    REQUIRE(j["range"]["start"].is_null());
    REQUIRE_THAT(j["return_metrics"]["moic"].get<double>(), WithinAbs(1.35, 1e-12));
    REQUIRE(j["risk_metrics"]["num_periods"] == 3);
}
