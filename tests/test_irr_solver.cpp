#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "venture/analytics/irr_solver.hpp"
#include "venture/core/errors.hpp"

#include <cmath>
#include <vector>

using namespace venture;
using namespace venture::analytics;
using Catch::Matchers::WithinAbs;

namespace {

data::CashFlowEvent flow(const core::Date& date, double amount)
{
    data::CashFlowEvent f;
    f.date = date;
    f.amount = amount;
    f.kind = amount < 0.0 ? data::CashFlowKind::INVESTMENT : data::CashFlowKind::DISTRIBUTION;
    return f;
}

} // namespace

TEST_CASE("IrrSolver single period", "[IrrSolver]") {
    IrrSolver solver;
    std::vector<data::CashFlowEvent> flows = {
        flow(core::Date(2023, 1, 1), -1000.0),
        flow(core::Date(2024, 1, 1), 1100.0),
    };

    auto result = solver.solve(flows);
    REQUIRE_THAT(result.rate, WithinAbs(0.10, 1e-6));
    REQUIRE_FALSE(result.used_bisection);
    REQUIRE(result.iterations >= 1);
}

TEST_CASE("IrrSolver multi-year Newton convergence", "[IrrSolver]") {
    IrrSolver solver;
    std::vector<data::CashFlowEvent> flows = {
        flow(core::Date(2021, 1, 1), -1000.0),
        flow(core::Date(2023, 1, 1), 1500.0),
    };

    auto result = solver.solve(flows);
    REQUIRE_THAT(result.rate, WithinAbs(std::sqrt(1.5) - 1.0, 1e-5));
    REQUIRE_THAT(solver.npv(flows, result.rate), WithinAbs(0.0, 1e-3));
}

TEST_CASE("IrrSolver irregular flows", "[IrrSolver]") {
    IrrSolver solver;
    std::vector<data::CashFlowEvent> flows = {
        flow(core::Date(2020, 1, 1), -20000.0),
        flow(core::Date(2020, 7, 1), -5000.0),
        flow(core::Date(2021, 3, 15), 3000.0),
        flow(core::Date(2023, 9, 30), 40000.0),
    };

    auto result = solver.solve(flows);
    REQUIRE(result.rate > 0.0);
    REQUIRE_THAT(solver.npv(flows, result.rate), WithinAbs(0.0, 68000.0 * 1e-7));
}

TEST_CASE("IrrSolver falls back to bisection", "[IrrSolver]") {
    IrrConfig config;
    config.max_iterations = 1;
    IrrSolver solver(config);

    std::vector<data::CashFlowEvent> flows = {
        flow(core::Date(2023, 1, 1), -1000.0),
        flow(core::Date(2024, 1, 1), 1300.0),
    };

    auto result = solver.solve(flows);
    REQUIRE(result.used_bisection);
    REQUIRE_THAT(result.rate, WithinAbs(0.30, 1e-5));
}

TEST_CASE("IrrSolver handles total loss", "[IrrSolver]") {
    IrrSolver solver;
    std::vector<data::CashFlowEvent> flows = {
        flow(core::Date(2023, 1, 1), -1000.0),
        flow(core::Date(2024, 1, 1), 100.0),
    };

    auto result = solver.solve(flows);
    REQUIRE_THAT(result.rate, WithinAbs(-0.90, 1e-5));
}

TEST_CASE("IrrSolver reports undefined IRR", "[IrrSolver]") {
    IrrSolver solver;

    SECTION("No outflow") {
        std::vector<data::CashFlowEvent> flows = {
            flow(core::Date(2023, 1, 1), 1000.0),
            flow(core::Date(2024, 1, 1), 100.0),
        };
        REQUIRE_THROWS_AS(solver.solve(flows), core::NonConvergenceError);
    }

    SECTION("No inflow") {
        std::vector<data::CashFlowEvent> flows = {
            flow(core::Date(2023, 1, 1), -1000.0),
            flow(core::Date(2024, 1, 1), -100.0),
        };
        REQUIRE_THROWS_AS(solver.solve(flows), core::NonConvergenceError);
    }

    SECTION("No flows") {
        REQUIRE_THROWS_AS(solver.solve({}), core::NonConvergenceError);
    }

    SECTION("NPV never changes sign") {
        // -1000 + 500x - 1000x^2 < 0 for every discount factor x
        std::vector<data::CashFlowEvent> flows = {
            flow(core::Date(2020, 1, 1), -1000.0),
            flow(core::Date(2020, 12, 31), 500.0),
            flow(core::Date(2021, 12, 31), -1000.0),
        };
        try {
            solver.solve(flows);
            FAIL("expected NonConvergenceError");
        } catch (const core::NonConvergenceError& e) {
            REQUIRE(e.code() == "NON_CONVERGENCE");
        }
    }
}

TEST_CASE("IrrSolver npv and derivative", "[IrrSolver]") {
    IrrSolver solver;
    std::vector<data::CashFlowEvent> flows = {
        flow(core::Date(2023, 1, 1), -1000.0),
        flow(core::Date(2024, 1, 1), 1100.0),
    };

    REQUIRE_THAT(solver.npv(flows, 0.0), WithinAbs(100.0, 1e-9));
    REQUIRE_THAT(solver.npv(flows, 0.10), WithinAbs(0.0, 1e-9));
    // d/dr [1100 / (1 + r)] = -1100 / (1 + r)^2
    REQUIRE_THAT(solver.npv_derivative(flows, 0.0), WithinAbs(-1100.0, 1e-9));
    REQUIRE(solver.npv({}, 0.1) == 0.0);
}
