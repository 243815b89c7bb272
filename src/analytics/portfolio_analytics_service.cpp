/**
 * @file portfolio_analytics_service.cpp
 * @brief Implementation of PortfolioAnalyticsService
 */

#include "venture/analytics/portfolio_analytics_service.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace venture
{
    namespace analytics
    {

        namespace
        {

            std::chrono::system_clock::duration ttl_from(const CacheConfig &config)
            {
                return std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    std::chrono::duration<double>(config.ttl_seconds));
            }

            // Name plus every dated return, so differently valued series never share a key.
            std::string series_key(const data::BenchmarkSeries &series)
            {
                std::ostringstream key;
                key.precision(17);
                key << series.name;
                for (const auto &r : series.returns)
                {
                    key << ":" << r.date.to_string() << "=" << r.value;
                }
                return key.str();
            }

        } // anonymous namespace

        PortfolioAnalyticsService::PortfolioAnalyticsService(const data::PortfolioDataSource &source,
                                                             const core::Clock &clock,
                                                             const EngineConfig &config)
            : source_(source),
              calculator_(source, config.performance, config.irr),
              comparator_(calculator_),
              risk_analyzer_(config.risk),
              verbose_(config.verbose),
              performance_cache_(clock, ttl_from(config.cache), config.cache.capacity),
              index_cache_(clock, ttl_from(config.cache), config.cache.capacity),
              peer_cache_(clock, ttl_from(config.cache), config.cache.capacity),
              risk_cache_(clock, ttl_from(config.cache), config.cache.capacity)
        {
        }

        PerformanceSnapshot PortfolioAnalyticsService::performance(const std::string &portfolio_id,
                                                                   const data::DateRange &range)
        {
            auto compute = [&]()
            {
                if (verbose_)
                {
                    std::cout << "Computing performance for " << portfolio_id << " " << range.to_key() << std::endl;
                }
                return calculator_.calculate_portfolio_performance(portfolio_id, range);
            };
            return performance_cache_.get_or_compute(make_key("performance", portfolio_id, range), compute);
        }

        IndexComparison PortfolioAnalyticsService::compare_to_index(const std::string &portfolio_id,
                                                                    const data::BenchmarkSeries &benchmark,
                                                                    const data::DateRange &range)
        {
            std::string key = make_key("index", portfolio_id, range) + ":" + series_key(benchmark);
            auto compute = [&]()
            {
                return comparator_.compare_to_index(portfolio_id, benchmark, range);
            };
            return index_cache_.get_or_compute(key, compute);
        }

        PeerComparison PortfolioAnalyticsService::compare_to_peers(const std::string &portfolio_id,
                                                                   const std::vector<double> &peer_returns,
                                                                   const data::DateRange &range)
        {
            std::ostringstream peers;
            peers.precision(17);
            for (size_t i = 0; i < peer_returns.size(); ++i)
            {
                peers << (i == 0 ? "" : ",") << peer_returns[i];
            }

            std::string key = make_key("peers", portfolio_id, range) + ":" + peers.str();
            auto compute = [&]()
            {
                PerformanceSnapshot perf = performance(portfolio_id, range);
                PeerComparison result = BenchmarkComparator::rank_among_peers(perf.annualized_return, peer_returns);
                result.portfolio_id = portfolio_id;
                return result;
            };
            return peer_cache_.get_or_compute(key, compute);
        }

        RiskReport PortfolioAnalyticsService::risk_report(const std::string &portfolio_id, const data::DateRange &range)
        {
            auto compute = [&]()
            {
                PerformanceSnapshot perf = performance(portfolio_id, range);
                data::PortfolioRecords records = source_.load(portfolio_id);
                return risk_analyzer_.analyze(records, perf);
            };
            return risk_cache_.get_or_compute(make_key("risk", portfolio_id, range), compute);
        }

        size_t PortfolioAnalyticsService::invalidate(const std::string &portfolio_id)
        {
            auto belongs = [&](const std::string &key)
            {
                auto first = key.find(':');
                return first != std::string::npos && key.compare(first + 1, portfolio_id.size() + 1, portfolio_id + ":") == 0;
            };

            size_t removed = performance_cache_.erase_if(belongs) + index_cache_.erase_if(belongs) +
                             peer_cache_.erase_if(belongs) + risk_cache_.erase_if(belongs);

            if (verbose_)
            {
                std::cout << "Invalidated " << removed << " cached results for " << portfolio_id << std::endl;
            }
            return removed;
        }

        std::string PortfolioAnalyticsService::make_key(const std::string &operation,
                                                        const std::string &portfolio_id,
                                                        const data::DateRange &range)
        {
            return operation + ":" + portfolio_id + ":" + range.to_key();
        }

    } // namespace analytics
} // namespace venture
