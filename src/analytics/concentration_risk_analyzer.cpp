/**
 * @file concentration_risk_analyzer.cpp
 * @brief Implementation of ConcentrationRiskAnalyzer
 */

#include "venture/analytics/concentration_risk_analyzer.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>

namespace venture
{
    namespace analytics
    {

        std::string to_string(RiskLevel level)
        {
            switch (level)
            {
            case RiskLevel::LOW:
                return "Low Risk";
            case RiskLevel::MODERATE:
                return "Moderate Risk";
            case RiskLevel::HIGH:
                return "High Risk";
            }
            return "Unknown";
        }

        // ===================================================================
        // RiskReport
        // ===================================================================

        std::string RiskReport::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Risk Report: " << portfolio_id << "\n";
            oss << "==========================\n";
            oss << "  Overall:             " << to_string(risk_level) << " (score " << risk_score << ")\n";
            oss << "  Holdings:            " << holdings << "\n";
            oss << "\n";

            oss << "Concentration:\n";
            oss << "  HHI:                 " << std::setprecision(4) << hhi << " (" << hhi_label << ")\n";
            if (!sector_concentration.top_sector.empty())
            {
                oss << "  Top Sector:          " << sector_concentration.top_sector << " ("
                    << std::setprecision(2) << sector_concentration.top_sector_share * 100.0 << "%)\n";
            }
            for (const auto &s : sector_concentration.sectors)
            {
                oss << "    " << std::left << std::setw(20) << s.sector << std::right
                    << std::setprecision(2) << s.share * 100.0 << "%  (" << s.count << ")\n";
            }
            oss << "\n";

            oss << "Volatility / Sharpe:\n";
            oss << "  Volatility:          " << std::setprecision(4) << volatility * 100.0 << "% (" << volatility_label << ")\n";
            oss << "  Sharpe Ratio:        " << std::setprecision(4) << sharpe_ratio << " (" << sharpe_label << ")\n";

            return oss.str();
        }

        std::string RiskReport::to_json() const
        {
            nlohmann::json j;
            j["portfolio_id"] = portfolio_id;
            j["holdings"] = holdings;

            j["concentration"]["hhi"] = hhi;
            j["concentration"]["interpretation"] = hhi_label;
            j["concentration"]["top_sector"] = sector_concentration.top_sector;
            j["concentration"]["top_sector_share"] = sector_concentration.top_sector_share;
            j["concentration"]["sectors"] = nlohmann::json::array();
            for (const auto &s : sector_concentration.sectors)
            {
                j["concentration"]["sectors"].push_back(
                    {{"sector", s.sector}, {"amount", s.amount}, {"share", s.share}, {"count", s.count}});
            }

            j["volatility"]["value"] = volatility;
            j["volatility"]["interpretation"] = volatility_label;
            j["sharpe_ratio"]["value"] = sharpe_ratio;
            j["sharpe_ratio"]["interpretation"] = sharpe_label;

            j["risk_score"] = risk_score;
            j["risk_level"] = to_string(risk_level);

            return j.dump(2);
        }

        // ===================================================================
        // ConcentrationRiskAnalyzer
        // ===================================================================

        ConcentrationRiskAnalyzer::ConcentrationRiskAnalyzer(RiskThresholds thresholds)
            : thresholds_(thresholds)
        {
            thresholds_.validate();
        }

        double ConcentrationRiskAnalyzer::herfindahl_index(const std::vector<data::InvestmentRecord> &investments) const
        {
            double total = 0.0;
            for (const auto &inv : investments)
            {
                if (inv.status == data::InvestmentStatus::ACTIVE)
                {
                    total += inv.amount;
                }
            }

            if (total <= 0.0)
            {
                return 0.0;
            }

            double hhi = 0.0;
            for (const auto &inv : investments)
            {
                if (inv.status == data::InvestmentStatus::ACTIVE)
                {
                    double w = inv.amount / total;
                    hhi += w * w;
                }
            }
            return hhi;
        }

        std::string ConcentrationRiskAnalyzer::classify_hhi(double hhi) const
        {
            if (hhi < thresholds_.hhi_moderate)
                return "Well diversified";
            if (hhi < thresholds_.hhi_high)
                return "Moderately concentrated";
            if (hhi < thresholds_.hhi_very_high)
                return "Highly concentrated";
            return "Very highly concentrated";
        }

        SectorConcentration ConcentrationRiskAnalyzer::sector_concentration(
            const std::vector<data::InvestmentRecord> &investments) const
        {
            std::map<std::string, SectorExposure> by_sector;
            SectorConcentration result;

            for (const auto &inv : investments)
            {
                if (inv.status != data::InvestmentStatus::ACTIVE)
                {
                    continue;
                }
                auto &exposure = by_sector[inv.sector_or_default()];
                exposure.sector = inv.sector_or_default();
                exposure.amount += inv.amount;
                ++exposure.count;
                result.total += inv.amount;
            }

            for (auto &entry : by_sector)
            {
                SectorExposure exposure = entry.second;
                exposure.share = result.total > 0.0 ? exposure.amount / result.total : 0.0;
                result.sectors.push_back(exposure);
            }

            // Largest first; ties by name for a stable order
            std::sort(result.sectors.begin(), result.sectors.end(),
                      [](const SectorExposure &a, const SectorExposure &b)
                      {
                          if (a.amount != b.amount)
                              return a.amount > b.amount;
                          return a.sector < b.sector;
                      });

            if (!result.sectors.empty())
            {
                result.top_sector = result.sectors.front().sector;
                result.top_sector_share = result.sectors.front().share;
            }

            return result;
        }

        int ConcentrationRiskAnalyzer::risk_score(double volatility, double hhi, int investment_count) const
        {
            int score = 0;

            if (volatility > thresholds_.volatility_very_high)
                score += 3;
            else if (volatility > thresholds_.volatility_high)
                score += 2;
            else if (volatility > thresholds_.volatility_moderate)
                score += 1;

            if (hhi > thresholds_.hhi_very_high)
                score += 3;
            else if (hhi > thresholds_.hhi_high)
                score += 2;
            else if (hhi > thresholds_.hhi_moderate)
                score += 1;

            if (investment_count < thresholds_.holdings_few)
                score += 2;
            else if (investment_count < thresholds_.holdings_some)
                score += 1;

            return score;
        }

        RiskLevel ConcentrationRiskAnalyzer::overall_risk_level(double volatility, double hhi, int investment_count) const
        {
            int score = risk_score(volatility, hhi, investment_count);
            if (score >= thresholds_.score_high)
                return RiskLevel::HIGH;
            if (score >= thresholds_.score_moderate)
                return RiskLevel::MODERATE;
            return RiskLevel::LOW;
        }

        std::string ConcentrationRiskAnalyzer::interpret_volatility(double volatility) const
        {
            if (volatility < thresholds_.volatility_moderate)
                return "Low volatility";
            if (volatility < thresholds_.volatility_high)
                return "Moderate volatility";
            if (volatility < thresholds_.volatility_very_high)
                return "High volatility";
            return "Very high volatility";
        }

        std::string ConcentrationRiskAnalyzer::interpret_sharpe(double sharpe) const
        {
            if (sharpe < 0.0)
                return "Poor risk-adjusted returns";
            if (sharpe < 1.0)
                return "Below average risk-adjusted returns";
            if (sharpe < 2.0)
                return "Good risk-adjusted returns";
            if (sharpe < 3.0)
                return "Very good risk-adjusted returns";
            return "Excellent risk-adjusted returns";
        }

        RiskReport ConcentrationRiskAnalyzer::analyze(const data::PortfolioRecords &records,
                                                      const PerformanceSnapshot &performance) const
        {
            RiskReport report;
            report.portfolio_id = records.portfolio_id;

            report.holdings = static_cast<int>(std::count_if(records.investments.begin(), records.investments.end(),
                                                             [](const data::InvestmentRecord &inv)
                                                             { return inv.status == data::InvestmentStatus::ACTIVE; }));

            report.hhi = herfindahl_index(records.investments);
            report.hhi_label = classify_hhi(report.hhi);
            report.sector_concentration = sector_concentration(records.investments);

            report.volatility = performance.volatility;
            report.volatility_label = interpret_volatility(performance.volatility);
            report.sharpe_ratio = performance.sharpe_ratio;
            report.sharpe_label = interpret_sharpe(performance.sharpe_ratio);

            report.risk_score = risk_score(report.volatility, report.hhi, report.holdings);
            report.risk_level = overall_risk_level(report.volatility, report.hhi, report.holdings);

            return report;
        }

    } // namespace analytics
} // namespace venture
