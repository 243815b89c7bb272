/**
 * @file performance_calculator.cpp
 * @brief Implementation of PerformanceCalculator and PerformanceSnapshot export.
 */

#include "venture/analytics/performance_calculator.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace venture
{
    namespace analytics
    {

        // ===================================================================
        // PerformanceSnapshot
        // ===================================================================

        std::string PerformanceSnapshot::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Portfolio Performance: " << portfolio_id << "\n";
            oss << "==============================\n";
            oss << "  Range:               " << range.to_key() << " (as of " << as_of.to_string() << ")\n";
            oss << "\n";

            oss << "Capital:\n";
            oss << "  Invested:            " << std::setprecision(2) << total_invested << "\n";
            oss << "  Distributions:       " << std::setprecision(2) << total_distributions << "\n";
            oss << "  Current Value:       " << std::setprecision(2) << current_value << "\n";
            oss << "  Investments:         " << num_investments << "\n";
            oss << "\n";

            oss << "Return Metrics:\n";
            oss << "  IRR:                 " << std::setprecision(4) << irr * 100.0 << "%\n";
            oss << "  MOIC:                " << std::setprecision(4) << moic << "x\n";
            oss << "  Cash-on-Cash:        " << std::setprecision(4) << cash_on_cash * 100.0 << "%\n";
            oss << "  Total Return:        " << std::setprecision(4) << total_return * 100.0 << "%\n";
            oss << "  Annualized Return:   " << std::setprecision(4) << annualized_return * 100.0 << "%\n";
            oss << "\n";

            oss << "Risk Metrics:\n";
            oss << "  Volatility:          " << std::setprecision(4) << volatility * 100.0 << "%\n";
            oss << "  Sharpe Ratio:        " << std::setprecision(4) << sharpe_ratio << "\n";
            oss << "  Periods:             " << num_periods << "\n";

            return oss.str();
        }

        std::string PerformanceSnapshot::to_json() const
        {
            nlohmann::json j;

            j["portfolio_id"] = portfolio_id;
            j["range"]["start"] = range.start ? nlohmann::json(range.start->to_string()) : nlohmann::json();
            j["range"]["end"] = range.end ? nlohmann::json(range.end->to_string()) : nlohmann::json();
            j["as_of"] = as_of.to_string();

            j["capital"]["total_invested"] = total_invested;
            j["capital"]["total_distributions"] = total_distributions;
            j["capital"]["current_value"] = current_value;
            j["capital"]["num_investments"] = num_investments;

            j["return_metrics"]["irr"] = irr;
            j["return_metrics"]["irr_iterations"] = irr_iterations;
            j["return_metrics"]["moic"] = moic;
            j["return_metrics"]["cash_on_cash"] = cash_on_cash;
            j["return_metrics"]["total_return"] = total_return;
            j["return_metrics"]["annualized_return"] = annualized_return;

            j["risk_metrics"]["volatility"] = volatility;
            j["risk_metrics"]["sharpe_ratio"] = sharpe_ratio;
            j["risk_metrics"]["num_periods"] = num_periods;

            j["num_cash_flows"] = num_cash_flows;

            return j.dump(2);
        }

        // ===================================================================
        // PerformanceCalculator
        // ===================================================================

        PerformanceCalculator::PerformanceCalculator(const data::PortfolioDataSource &source,
                                                     PerformanceConfig config,
                                                     IrrConfig irr_config)
            : source_(source), config_(config), irr_solver_(irr_config, config.days_per_year)
        {
            config_.validate();
        }

        PerformanceSnapshot PerformanceCalculator::calculate_portfolio_performance(const std::string &portfolio_id,
                                                                                   const data::DateRange &range) const
        {
            data::PortfolioRecords records = source_.load(portfolio_id);
            return calculate(records, range);
        }

        PerformanceSnapshot PerformanceCalculator::calculate(const data::PortfolioRecords &records,
                                                             const data::DateRange &range) const
        {
            PerformanceSnapshot snap;
            snap.portfolio_id = records.portfolio_id;
            snap.range = range;
            snap.as_of = data::CashFlowExtractor::resolve_end(range, records.as_of);

            auto flows = data::CashFlowExtractor::extract(records, range);
            snap.num_cash_flows = static_cast<int>(flows.size());

            for (const auto &f : flows)
            {
                switch (f.kind)
                {
                case data::CashFlowKind::INVESTMENT:
                    snap.total_invested += -f.amount;
                    ++snap.num_investments;
                    break;
                case data::CashFlowKind::DISTRIBUTION:
                    snap.total_distributions += f.amount;
                    break;
                case data::CashFlowKind::TERMINAL_VALUE:
                    snap.current_value += f.amount;
                    break;
                }
            }

            // Return metrics
            if (snap.total_invested > 0.0)
            {
                double realized_and_held = snap.current_value + snap.total_distributions;
                snap.moic = realized_and_held / snap.total_invested;
                snap.cash_on_cash = snap.total_distributions / snap.total_invested;
                snap.total_return = (realized_and_held - snap.total_invested) / snap.total_invested;

                double span_days = static_cast<double>(
                    core::Date::days_between(flows.front().date, flows.back().date));
                snap.annualized_return = annualize(snap.total_return, span_days / config_.days_per_year);

                IrrResult irr = irr_solver_.solve(flows);
                snap.irr = irr.rate;
                snap.irr_iterations = irr.iterations;
            }

            // Risk metrics
            auto returns = data::CashFlowExtractor::periodic_returns(records.valuations, range);
            snap.num_periods = static_cast<int>(returns.size());
            snap.volatility = annualized_volatility(returns, config_.periods_per_year);
            snap.sharpe_ratio = snap.volatility > 0.0
                                    ? (snap.annualized_return - config_.risk_free_rate) / snap.volatility
                                    : 0.0;

            return snap;
        }

        double PerformanceCalculator::annualized_volatility(const std::vector<data::DatedReturn> &returns,
                                                            int periods_per_year)
        {
            if (returns.size() < 2)
            {
                return 0.0;
            }

            double n = static_cast<double>(returns.size());
            double mean = 0.0;
            for (const auto &r : returns)
            {
                mean += r.value;
            }
            mean /= n;

            double sum_sq = 0.0;
            for (const auto &r : returns)
            {
                double diff = r.value - mean;
                sum_sq += diff * diff;
            }

            return std::sqrt(sum_sq / n) * std::sqrt(static_cast<double>(periods_per_year));
        }

        double PerformanceCalculator::annualize(double total_return, double years)
        {
            if (years <= 0.0)
            {
                return 0.0;
            }
            double growth = 1.0 + total_return;
            if (growth <= 0.0)
            {
                return -1.0;
            }
            return std::pow(growth, 1.0 / years) - 1.0;
        }

    } // namespace analytics
} // namespace venture
