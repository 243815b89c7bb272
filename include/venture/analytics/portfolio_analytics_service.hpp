/**
 * @file portfolio_analytics_service.hpp
 * @brief Cached entry points for portfolio analytics consumers.
 *
 * Cache keys have the form "<operation>:<portfolio>:<start>:<end>[:<extra>]"
 * with "*" for an open range bound.
 */

#ifndef VENTURE_ANALYTICS_PORTFOLIO_ANALYTICS_SERVICE_HPP
#define VENTURE_ANALYTICS_PORTFOLIO_ANALYTICS_SERVICE_HPP

#include "venture/analytics/benchmark_comparator.hpp"
#include "venture/analytics/concentration_risk_analyzer.hpp"
#include "venture/analytics/performance_calculator.hpp"
#include "venture/analytics/result_cache.hpp"
#include "venture/core/clock.hpp"
#include "venture/data/config.hpp"
#include "venture/data/portfolio_records.hpp"

#include <string>
#include <vector>

namespace venture
{
    namespace analytics
    {

        /**
         * @class PortfolioAnalyticsService
         * @brief Performance, benchmark, peer and risk results served through ResultCache.
         *
         * Usage:
         * @code
         *   PortfolioAnalyticsService service(source, clock, config);
         *   auto perf = service.performance("P1", range);
         *   auto risk = service.risk_report("P1", range);
         *   service.invalidate("P1"); // after the portfolio's records change
         * @endcode
         *
         * Thread safety: All methods may be called concurrently.
         */
        class PortfolioAnalyticsService
        {
        public:
            PortfolioAnalyticsService(const data::PortfolioDataSource &source,
                                      const core::Clock &clock,
                                      const EngineConfig &config = EngineConfig());

            PerformanceSnapshot performance(const std::string &portfolio_id, const data::DateRange &range);

            IndexComparison compare_to_index(const std::string &portfolio_id,
                                             const data::BenchmarkSeries &benchmark,
                                             const data::DateRange &range);

            PeerComparison compare_to_peers(const std::string &portfolio_id,
                                            const std::vector<double> &peer_returns,
                                            const data::DateRange &range = data::DateRange());

            RiskReport risk_report(const std::string &portfolio_id, const data::DateRange &range);

            /**
             * @brief Drop every cached result of one portfolio.
             * @return Number of entries removed.
             */
            size_t invalidate(const std::string &portfolio_id);

            CacheStats performance_cache_stats() const { return performance_cache_.stats(); }

            const PerformanceCalculator &calculator() const { return calculator_; }

        private:
            static std::string make_key(const std::string &operation,
                                        const std::string &portfolio_id,
                                        const data::DateRange &range);

            const data::PortfolioDataSource &source_;
            PerformanceCalculator calculator_;
            BenchmarkComparator comparator_;
            ConcentrationRiskAnalyzer risk_analyzer_;
            bool verbose_;

            ResultCache<PerformanceSnapshot> performance_cache_;
            ResultCache<IndexComparison> index_cache_;
            ResultCache<PeerComparison> peer_cache_;
            ResultCache<RiskReport> risk_cache_;
        };

    } // namespace analytics
} // namespace venture

#endif // VENTURE_ANALYTICS_PORTFOLIO_ANALYTICS_SERVICE_HPP
