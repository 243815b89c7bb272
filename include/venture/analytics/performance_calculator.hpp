/**
 * @file performance_calculator.hpp
 * @brief Portfolio performance metrics over a date range.
 *
 * All metrics derive from two series built by CashFlowExtractor:
 *  - signed cash flows (investments, distributions, terminal value), used
 *    for IRR, MOIC, cash-on-cash and total/annualized return;
 *  - periodic returns between valuation snapshots, used for volatility
 *    and the Sharpe ratio.
 *
 * Definitions:
 *   MOIC              = (current value + distributions) / invested
 *   cash-on-cash      = distributions / invested
 *   total return      = (current value + distributions - invested) / invested
 *   annualized return = (1 + total)^(365 / span_days) - 1
 *   volatility        = population stdev(periodic returns) * sqrt(periods_per_year)
 *   Sharpe            = (annualized return - risk free) / volatility
 *
 * When nothing has been invested in the range, IRR, MOIC, cash-on-cash and
 * both returns are reported as 0.
 */

#ifndef VENTURE_ANALYTICS_PERFORMANCE_CALCULATOR_HPP
#define VENTURE_ANALYTICS_PERFORMANCE_CALCULATOR_HPP

#include "venture/analytics/irr_solver.hpp"
#include "venture/data/cash_flow_extractor.hpp"
#include "venture/data/config.hpp"
#include "venture/data/portfolio_records.hpp"

#include <string>
#include <vector>

namespace venture
{
    namespace analytics
    {

        /**
         * @struct PerformanceSnapshot
         * @brief Derived metrics for one portfolio and range. Never a source of truth.
         */
        struct PerformanceSnapshot
        {
            std::string portfolio_id;
            data::DateRange range;
            core::Date as_of;             ///< Date of the terminal value

            double total_invested = 0.0;
            double total_distributions = 0.0;
            double current_value = 0.0;   ///< Valuation of in-range ACTIVE investments

            double irr = 0.0;
            int irr_iterations = 0;
            double moic = 0.0;
            double cash_on_cash = 0.0;
            double total_return = 0.0;
            double annualized_return = 0.0;
            double volatility = 0.0;
            double sharpe_ratio = 0.0;

            int num_investments = 0;      ///< Funded investments in range
            int num_cash_flows = 0;
            int num_periods = 0;          ///< Periodic returns behind the volatility

            /** @brief Formatted text report. */
            std::string summary() const;

            /** @brief JSON export (pretty-printed). */
            std::string to_json() const;
        };

        /**
         * @class PerformanceCalculator
         * @brief Computes PerformanceSnapshot values.
         *
         * Usage:
         * @code
         *   PerformanceCalculator calc(source);
         *   auto perf = calc.calculate_portfolio_performance("P1", data::DateRange{});
         *   std::cout << perf.summary();
         * @endcode
         *
         * Thread safety: const methods only; safe to call concurrently as long
         * as the data source is.
         */
        class PerformanceCalculator
        {
        public:
            /**
             * @param source Portfolio records. Must outlive the calculator.
             */
            explicit PerformanceCalculator(const data::PortfolioDataSource &source,
                                           PerformanceConfig config = PerformanceConfig(),
                                           IrrConfig irr_config = IrrConfig());

            /**
             * @brief Load the portfolio and compute its metrics.
             * @throws core::NotFoundError If the portfolio is unknown.
             * @throws core::NonConvergenceError If the IRR cannot be solved.
             */
            PerformanceSnapshot calculate_portfolio_performance(const std::string &portfolio_id,
                                                                const data::DateRange &range) const;

            /**
             * @brief Compute metrics from already-loaded records.
             * @throws core::NonConvergenceError If the IRR cannot be solved.
             */
            PerformanceSnapshot calculate(const data::PortfolioRecords &records,
                                          const data::DateRange &range) const;

            /**
             * @brief Annualized population standard deviation of @p returns.
             * @return 0 with fewer than two returns.
             */
            static double annualized_volatility(const std::vector<data::DatedReturn> &returns, int periods_per_year);

            /**
             * @brief (1 + total)^(1 / years) - 1
             * @return 0 when @p years is not positive.
             */
            static double annualize(double total_return, double years);

            const data::PortfolioDataSource &source() const { return source_; }
            const PerformanceConfig &config() const { return config_; }

        private:
            const data::PortfolioDataSource &source_;
            PerformanceConfig config_;
            IrrSolver irr_solver_;
        };

    } // namespace analytics
} // namespace venture

#endif // VENTURE_ANALYTICS_PERFORMANCE_CALCULATOR_HPP
