/**
 * @file benchmark_comparator.hpp
 * @brief Portfolio performance relative to a market index and to peers.
 *
 * Index comparison aligns the portfolio's periodic returns with the
 * benchmark's returns on equal dates and computes, over the aligned
 * periods:
 *   portfolio / benchmark return = prod(1 + r) - 1
 *   beta            = Cov(p, b) / Var(b)          (0 when Var(b) = 0)
 *   alpha           = R_p - beta * R_b
 *   correlation     = Cov(p, b) / (sd_p * sd_b)   (0 when either sd = 0)
 *   tracking error  = sd(p - b)
 * Moments are population moments.
 *
 * Peer comparison ranks the portfolio's annualized return among a set of
 * peer returns.
 */

#ifndef VENTURE_ANALYTICS_BENCHMARK_COMPARATOR_HPP
#define VENTURE_ANALYTICS_BENCHMARK_COMPARATOR_HPP

#include "venture/analytics/performance_calculator.hpp"
#include "venture/data/portfolio_records.hpp"

#include <string>
#include <vector>

namespace venture
{
    namespace analytics
    {

        /**
         * @struct IndexComparison
         * @brief Portfolio versus one benchmark series.
         */
        struct IndexComparison
        {
            std::string portfolio_id;
            std::string benchmark_name;
            int aligned_periods = 0;

            double portfolio_return = 0.0; ///< Compounded over the aligned periods
            double benchmark_return = 0.0; ///< Compounded over the aligned periods
            double outperformance = 0.0;   ///< portfolio_return - benchmark_return
            double alpha = 0.0;
            double beta = 0.0;
            double correlation = 0.0;
            double tracking_error = 0.0;   ///< Per period, not annualized

            std::string summary() const;
            std::string to_json() const;
        };

        /**
         * @struct PeerComparison
         * @brief Portfolio's annualized return ranked among peers.
         */
        struct PeerComparison
        {
            std::string portfolio_id;
            double portfolio_return = 0.0;
            int peer_count = 0;
            double percentile_rank = 0.0; ///< Share of peers strictly below, in percent
            double peer_average = 0.0;
            double peer_median = 0.0;     ///< sorted[n / 2]
            double top_quartile = 0.0;    ///< sorted[floor(0.75 n)]
            double bottom_quartile = 0.0; ///< sorted[floor(0.25 n)]

            std::string summary() const;
            std::string to_json() const;
        };

        /**
         * @class BenchmarkComparator
         * @brief Index and peer comparisons for stored portfolios.
         *
         * Usage:
         * @code
         *   PerformanceCalculator calc(source);
         *   BenchmarkComparator comparator(calc);
         *   auto vs_index = comparator.compare_to_index("P1", sp500, range);
         *   auto vs_peers = comparator.compare_to_peers("P1", {0.05, 0.12, 0.30});
         * @endcode
         *
         * Thread safety: const methods only.
         */
        class BenchmarkComparator
        {
        public:
            /**
             * @param calculator Performance calculator bound to the portfolio source.
             *        Must outlive the comparator.
             */
            explicit BenchmarkComparator(const PerformanceCalculator &calculator);

            /**
             * @brief Compare a portfolio's periodic returns with @p benchmark.
             * @throws core::NotFoundError If the portfolio is unknown.
             * @throws core::InsufficientDataError With fewer than two aligned periods.
             */
            IndexComparison compare_to_index(const std::string &portfolio_id,
                                             const data::BenchmarkSeries &benchmark,
                                             const data::DateRange &range) const;

            /**
             * @brief Rank the portfolio's annualized return among @p peer_returns.
             * @throws core::NotFoundError If the portfolio is unknown.
             * @throws core::InsufficientDataError If @p peer_returns is empty.
             */
            PeerComparison compare_to_peers(const std::string &portfolio_id,
                                            const std::vector<double> &peer_returns,
                                            const data::DateRange &range = data::DateRange()) const;

            /**
             * @brief Statistics for two return series already aligned by date.
             * @throws core::InsufficientDataError With fewer than two aligned periods.
             */
            static IndexComparison compare_returns(const std::vector<double> &portfolio_returns,
                                                   const std::vector<double> &benchmark_returns);

            /**
             * @brief Percentile and distribution of @p peer_returns around @p value.
             * @throws core::InsufficientDataError If @p peer_returns is empty.
             */
            static PeerComparison rank_among_peers(double value, const std::vector<double> &peer_returns);

        private:
            const PerformanceCalculator &calculator_;
        };

    } // namespace analytics
} // namespace venture

#endif // VENTURE_ANALYTICS_BENCHMARK_COMPARATOR_HPP
