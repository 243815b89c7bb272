/**
 * @file irr_solver.cpp
 * @brief Implementation of IrrSolver
 */

#include "venture/analytics/irr_solver.hpp"
#include "venture/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace venture
{
    namespace analytics
    {

        namespace
        {

            // Candidate rates scanned for a sign change, in increasing order.
            const double kScanGrid[] = {-0.99, -0.95, -0.9, -0.75, -0.5, -0.25, -0.1, 0.0, 0.05, 0.1, 0.2,
                                        0.35, 0.5, 0.75, 1.0, 1.5, 2.0, 3.0, 5.0, 10.0, 25.0, 50.0,
                                        100.0, 250.0, 500.0};

            core::Date first_date(const std::vector<data::CashFlowEvent> &flows)
            {
                core::Date first = flows.front().date;
                for (const auto &f : flows)
                {
                    first = std::min(first, f.date);
                }
                return first;
            }

        } // anonymous namespace

        IrrSolver::IrrSolver(IrrConfig config, double days_per_year)
            : config_(config), days_per_year_(days_per_year)
        {
            config_.validate();
        }

        double IrrSolver::npv(const std::vector<data::CashFlowEvent> &flows, double rate) const
        {
            if (flows.empty())
            {
                return 0.0;
            }

            core::Date t0 = first_date(flows);
            double base = 1.0 + rate;
            double total = 0.0;
            for (const auto &f : flows)
            {
                double years = static_cast<double>(core::Date::days_between(t0, f.date)) / days_per_year_;
                total += f.amount / std::pow(base, years);
            }
            return total;
        }

        double IrrSolver::npv_derivative(const std::vector<data::CashFlowEvent> &flows, double rate) const
        {
            if (flows.empty())
            {
                return 0.0;
            }

            core::Date t0 = first_date(flows);
            double base = 1.0 + rate;
            double total = 0.0;
            for (const auto &f : flows)
            {
                double years = static_cast<double>(core::Date::days_between(t0, f.date)) / days_per_year_;
                total -= years * f.amount / std::pow(base, years + 1.0);
            }
            return total;
        }

        IrrResult IrrSolver::solve(const std::vector<data::CashFlowEvent> &flows) const
        {
            bool has_negative = false;
            bool has_positive = false;
            double scale = 0.0;
            for (const auto &f : flows)
            {
                has_negative = has_negative || f.amount < 0.0;
                has_positive = has_positive || f.amount > 0.0;
                scale += std::abs(f.amount);
            }

            if (!has_negative || !has_positive)
            {
                throw core::NonConvergenceError(
                    "IRR is undefined: cash flows must contain both an outflow and an inflow", 0);
            }

            scale = std::max(1.0, scale);

            auto result = newton(flows, scale);
            if (result)
            {
                return *result;
            }

            return bisect(flows, scale, config_.max_iterations);
        }

        std::optional<IrrResult> IrrSolver::newton(const std::vector<data::CashFlowEvent> &flows, double scale) const
        {
            double rate = config_.initial_guess;

            for (int i = 0; i < config_.max_iterations; ++i)
            {
                double f = npv(flows, rate);
                if (!std::isfinite(f))
                {
                    return std::nullopt;
                }
                if (std::abs(f) <= config_.tolerance * scale)
                {
                    return IrrResult{rate, i + 1, false};
                }

                double df = npv_derivative(flows, rate);
                if (!std::isfinite(df) || std::abs(df) < 1e-18)
                {
                    return std::nullopt;
                }

                double next = rate - f / df;
                if (!std::isfinite(next) || next <= config_.lower_bound || next >= config_.upper_bound)
                {
                    return std::nullopt;
                }
                rate = next;
            }

            return std::nullopt;
        }

        IrrResult IrrSolver::bisect(const std::vector<data::CashFlowEvent> &flows, double scale, int iterations_so_far) const
        {
            std::vector<double> grid;
            grid.push_back(config_.lower_bound);
            for (double r : kScanGrid)
            {
                if (r > config_.lower_bound && r < config_.upper_bound)
                {
                    grid.push_back(r);
                }
            }
            grid.push_back(config_.upper_bound);

            double lo = 0.0;
            double hi = 0.0;
            double f_lo = 0.0;
            bool bracketed = false;

            double prev_rate = grid.front();
            double prev_value = npv(flows, prev_rate);
            for (size_t i = 1; i < grid.size(); ++i)
            {
                double value = npv(flows, grid[i]);
                if (std::isfinite(prev_value) && std::isfinite(value))
                {
                    if (std::abs(prev_value) <= config_.tolerance * scale)
                    {
                        return IrrResult{prev_rate, iterations_so_far, true};
                    }
                    if ((prev_value < 0.0) != (value < 0.0))
                    {
                        lo = prev_rate;
                        hi = grid[i];
                        f_lo = prev_value;
                        bracketed = true;
                        break;
                    }
                }
                prev_rate = grid[i];
                prev_value = value;
            }

            if (!bracketed)
            {
                throw core::NonConvergenceError(
                    "IRR solver found no sign change of NPV in [" + std::to_string(config_.lower_bound) + ", " +
                        std::to_string(config_.upper_bound) + "]",
                    iterations_so_far);
            }

            for (int i = 0; i < config_.max_bisection_iterations; ++i)
            {
                double mid = 0.5 * (lo + hi);
                double f_mid = npv(flows, mid);

                if (std::abs(f_mid) <= config_.tolerance * scale || (hi - lo) < 1e-12)
                {
                    return IrrResult{mid, iterations_so_far + i + 1, true};
                }

                if ((f_mid < 0.0) == (f_lo < 0.0))
                {
                    lo = mid;
                    f_lo = f_mid;
                }
                else
                {
                    hi = mid;
                }
            }

            throw core::NonConvergenceError(
                "IRR solver did not converge within " + std::to_string(config_.max_iterations) +
                    " Newton and " + std::to_string(config_.max_bisection_iterations) + " bisection iterations",
                iterations_so_far + config_.max_bisection_iterations);
        }

    } // namespace analytics
} // namespace venture
