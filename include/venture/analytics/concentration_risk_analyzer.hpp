/**
 * @file concentration_risk_analyzer.hpp
 * @brief Herfindahl-Hirschman concentration, sector exposure and the
 *        overall portfolio risk level.
 *
 * HHI = sum_i (amount_i / total)^2 over ACTIVE investments.
 * 1/N for N equal holdings, 1.0 for a single holding, 0 for none.
 *
 * Overall risk score:
 *   volatility    > very_high: 3, > high: 2, > moderate: 1
 *   HHI           > very_high: 3, > high: 2, > moderate: 1
 *   holdings      < few: 2, < some: 1
 *   score >= score_high: High, >= score_moderate: Moderate, else Low
 */

#ifndef VENTURE_ANALYTICS_CONCENTRATION_RISK_ANALYZER_HPP
#define VENTURE_ANALYTICS_CONCENTRATION_RISK_ANALYZER_HPP

#include "venture/analytics/performance_calculator.hpp"
#include "venture/data/config.hpp"
#include "venture/data/portfolio_records.hpp"

#include <string>
#include <vector>

namespace venture
{
    namespace analytics
    {

        /**
         * @enum RiskLevel
         * @brief Overall portfolio risk band.
         */
        enum class RiskLevel
        {
            LOW,
            MODERATE,
            HIGH
        };

        /** @brief "Low Risk", "Moderate Risk" or "High Risk". */
        std::string to_string(RiskLevel level);

        /**
         * @struct SectorExposure
         * @brief Capital in one sector.
         */
        struct SectorExposure
        {
            std::string sector;
            double amount = 0.0;
            double share = 0.0; ///< Fraction of the total, 0-1
            int count = 0;
        };

        /**
         * @struct SectorConcentration
         * @brief Capital by sector, largest first.
         */
        struct SectorConcentration
        {
            std::vector<SectorExposure> sectors;
            std::string top_sector;      ///< Empty when there are no ACTIVE investments
            double top_sector_share = 0.0;
            double total = 0.0;
        };

        /**
         * @struct RiskReport
         * @brief Concentration and risk overview of one portfolio.
         */
        struct RiskReport
        {
            std::string portfolio_id;
            int holdings = 0; ///< ACTIVE investments

            double hhi = 0.0;
            std::string hhi_label;
            SectorConcentration sector_concentration;

            double volatility = 0.0;
            std::string volatility_label;
            double sharpe_ratio = 0.0;
            std::string sharpe_label;

            int risk_score = 0;
            RiskLevel risk_level = RiskLevel::LOW;

            std::string summary() const;
            std::string to_json() const;
        };

        /**
         * @class ConcentrationRiskAnalyzer
         * @brief Concentration metrics and risk banding with configurable thresholds.
         *
         * Thread safety: Immutable after construction.
         */
        class ConcentrationRiskAnalyzer
        {
        public:
            explicit ConcentrationRiskAnalyzer(RiskThresholds thresholds = RiskThresholds());

            /** @brief HHI over ACTIVE investments; 0 when there are none. */
            double herfindahl_index(const std::vector<data::InvestmentRecord> &investments) const;

            /** @brief Presentation band for an HHI value. */
            std::string classify_hhi(double hhi) const;

            /** @brief ACTIVE capital grouped by sector. Empty sectors count as "Other". */
            SectorConcentration sector_concentration(const std::vector<data::InvestmentRecord> &investments) const;

            /** @brief Sum of the volatility, concentration and holdings bands (0-8). */
            int risk_score(double volatility, double hhi, int investment_count) const;

            RiskLevel overall_risk_level(double volatility, double hhi, int investment_count) const;

            std::string interpret_volatility(double volatility) const;

            std::string interpret_sharpe(double sharpe) const;

            /**
             * @brief Full report from records and their performance snapshot.
             */
            RiskReport analyze(const data::PortfolioRecords &records, const PerformanceSnapshot &performance) const;

            const RiskThresholds &thresholds() const { return thresholds_; }

        private:
            RiskThresholds thresholds_;
        };

    } // namespace analytics
} // namespace venture

#endif // VENTURE_ANALYTICS_CONCENTRATION_RISK_ANALYZER_HPP
