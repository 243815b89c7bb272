/**
 * @file benchmark_comparator.cpp
 * @brief Implementation of BenchmarkComparator.
 *
 * Aligned series are held in Eigen vectors so the moments reduce to
 * dot products over centered data.
 */

#include "venture/analytics/benchmark_comparator.hpp"
#include "venture/core/errors.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace venture
{
    namespace analytics
    {

        // ===================================================================
        // Export
        // ===================================================================

        std::string IndexComparison::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Benchmark Comparison: " << portfolio_id << " vs " << benchmark_name << "\n";
            oss << "==========================\n";
            oss << "  Aligned Periods:     " << aligned_periods << "\n";
            oss << "  Portfolio Return:    " << std::setprecision(4) << portfolio_return * 100.0 << "%\n";
            oss << "  Benchmark Return:    " << std::setprecision(4) << benchmark_return * 100.0 << "%\n";
            oss << "  Outperformance:      " << std::setprecision(4) << outperformance * 100.0 << "%\n";
            oss << "  Alpha:               " << std::setprecision(4) << alpha * 100.0 << "%\n";
            oss << "  Beta:                " << std::setprecision(4) << beta << "\n";
            oss << "  Correlation:         " << std::setprecision(4) << correlation << "\n";
            oss << "  Tracking Error:      " << std::setprecision(4) << tracking_error * 100.0 << "%\n";

            return oss.str();
        }

        std::string IndexComparison::to_json() const
        {
            nlohmann::json j;
            j["portfolio_id"] = portfolio_id;
            j["benchmark"] = benchmark_name;
            j["aligned_periods"] = aligned_periods;
            j["portfolio_return"] = portfolio_return;
            j["benchmark_return"] = benchmark_return;
            j["outperformance"] = outperformance;
            j["alpha"] = alpha;
            j["beta"] = beta;
            j["correlation"] = correlation;
            j["tracking_error"] = tracking_error;
            return j.dump(2);
        }

        std::string PeerComparison::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Peer Comparison: " << portfolio_id << "\n";
            oss << "==========================\n";
            oss << "  Annualized Return:   " << std::setprecision(4) << portfolio_return * 100.0 << "%\n";
            oss << "  Percentile Rank:     " << std::setprecision(1) << percentile_rank << "\n";
            oss << "  Peers:               " << peer_count << "\n";
            oss << "  Peer Average:        " << std::setprecision(4) << peer_average * 100.0 << "%\n";
            oss << "  Peer Median:         " << std::setprecision(4) << peer_median * 100.0 << "%\n";
            oss << "  Top Quartile:        " << std::setprecision(4) << top_quartile * 100.0 << "%\n";
            oss << "  Bottom Quartile:     " << std::setprecision(4) << bottom_quartile * 100.0 << "%\n";

            return oss.str();
        }

        std::string PeerComparison::to_json() const
        {
            nlohmann::json j;
            j["portfolio_id"] = portfolio_id;
            j["portfolio_return"] = portfolio_return;
            j["peer_count"] = peer_count;
            j["percentile_rank"] = percentile_rank;
            j["peer_average"] = peer_average;
            j["peer_median"] = peer_median;
            j["top_quartile"] = top_quartile;
            j["bottom_quartile"] = bottom_quartile;
            return j.dump(2);
        }

        // ===================================================================
        // BenchmarkComparator
        // ===================================================================

        BenchmarkComparator::BenchmarkComparator(const PerformanceCalculator &calculator)
            : calculator_(calculator)
        {
        }

        IndexComparison BenchmarkComparator::compare_to_index(const std::string &portfolio_id,
                                                              const data::BenchmarkSeries &benchmark,
                                                              const data::DateRange &range) const
        {
            data::PortfolioRecords records = calculator_.source().load(portfolio_id);
            auto portfolio_returns = data::CashFlowExtractor::periodic_returns(records.valuations, range);

            std::map<long long, double> benchmark_by_day;
            for (const auto &r : benchmark.returns)
            {
                if (range.contains(r.date))
                {
                    benchmark_by_day[r.date.days_since_epoch()] = r.value;
                }
            }

            std::vector<double> p;
            std::vector<double> b;
            for (const auto &r : portfolio_returns)
            {
                auto it = benchmark_by_day.find(r.date.days_since_epoch());
                if (it != benchmark_by_day.end())
                {
                    p.push_back(r.value);
                    b.push_back(it->second);
                }
            }

            if (p.size() < 2)
            {
                throw core::InsufficientDataError(
                    "Benchmark comparison for portfolio " + portfolio_id + " needs at least 2 aligned periods, got: " +
                    std::to_string(p.size()));
            }

            IndexComparison result = compare_returns(p, b);
            result.portfolio_id = portfolio_id;
            result.benchmark_name = benchmark.name;
            return result;
        }

        PeerComparison BenchmarkComparator::compare_to_peers(const std::string &portfolio_id,
                                                             const std::vector<double> &peer_returns,
                                                             const data::DateRange &range) const
        {
            if (peer_returns.empty())
            {
                throw core::InsufficientDataError("Peer comparison for portfolio " + portfolio_id + " needs at least one peer");
            }

            PerformanceSnapshot perf = calculator_.calculate_portfolio_performance(portfolio_id, range);

            PeerComparison result = rank_among_peers(perf.annualized_return, peer_returns);
            result.portfolio_id = portfolio_id;
            return result;
        }

        IndexComparison BenchmarkComparator::compare_returns(const std::vector<double> &portfolio_returns,
                                                             const std::vector<double> &benchmark_returns)
        {
            if (portfolio_returns.size() != benchmark_returns.size())
            {
                throw std::invalid_argument(
                    "Portfolio return series size (" + std::to_string(portfolio_returns.size()) +
                    ") must match benchmark return series size (" + std::to_string(benchmark_returns.size()) + ")");
            }
            if (portfolio_returns.size() < 2)
            {
                throw core::InsufficientDataError(
                    "At least 2 aligned periods are required, got: " + std::to_string(portfolio_returns.size()));
            }

            const Eigen::Index n = static_cast<Eigen::Index>(portfolio_returns.size());
            Eigen::Map<const Eigen::VectorXd> p(portfolio_returns.data(), n);
            Eigen::Map<const Eigen::VectorXd> b(benchmark_returns.data(), n);
            const double nd = static_cast<double>(n);

            IndexComparison result;
            result.aligned_periods = static_cast<int>(n);

            result.portfolio_return = (p.array() + 1.0).prod() - 1.0;
            result.benchmark_return = (b.array() + 1.0).prod() - 1.0;
            result.outperformance = result.portfolio_return - result.benchmark_return;

            Eigen::VectorXd pc = p.array() - p.mean();
            Eigen::VectorXd bc = b.array() - b.mean();

            double cov = pc.dot(bc) / nd;
            double var_p = pc.squaredNorm() / nd;
            double var_b = bc.squaredNorm() / nd;

            result.beta = (std::abs(var_b) < 1e-18) ? 0.0 : cov / var_b;
            result.alpha = result.portfolio_return - result.beta * result.benchmark_return;

            double sd_p = std::sqrt(var_p);
            double sd_b = std::sqrt(var_b);
            result.correlation = (sd_p < 1e-12 || sd_b < 1e-12) ? 0.0 : cov / (sd_p * sd_b);

            Eigen::VectorXd diff = p - b;
            Eigen::VectorXd diff_c = diff.array() - diff.mean();
            result.tracking_error = std::sqrt(diff_c.squaredNorm() / nd);

            return result;
        }

        PeerComparison BenchmarkComparator::rank_among_peers(double value, const std::vector<double> &peer_returns)
        {
            if (peer_returns.empty())
            {
                throw core::InsufficientDataError("Peer comparison needs at least one peer");
            }

            std::vector<double> sorted = peer_returns;
            std::sort(sorted.begin(), sorted.end());
            const size_t n = sorted.size();

            PeerComparison result;
            result.portfolio_return = value;
            result.peer_count = static_cast<int>(n);

            size_t below = static_cast<size_t>(std::count_if(sorted.begin(), sorted.end(),
                                                             [value](double r)
                                                             { return r < value; }));
            result.percentile_rank = static_cast<double>(below) / static_cast<double>(n) * 100.0;

            result.peer_average = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(n);
            result.peer_median = sorted[n / 2];
            result.top_quartile = sorted[std::min(n - 1, static_cast<size_t>(std::floor(0.75 * static_cast<double>(n))))];
            result.bottom_quartile = sorted[static_cast<size_t>(std::floor(0.25 * static_cast<double>(n)))];

            return result;
        }

    } // namespace analytics
} // namespace venture
