/**
 * @file config.cpp
 * @brief from_json and validation for the engine configuration sections.
 */

#include "venture/data/config.hpp"

#include <stdexcept>

namespace venture
{

    // =============================================
    // InstrumentConfig
    // =============================================

    void InstrumentConfig::validate() const
    {
        if (days_per_year <= 0.0)
        {
            throw std::invalid_argument(
                "Expected positive value for parameter 'instruments.days_per_year', got: " + std::to_string(days_per_year));
        }
        if (maturity_warning_days < 0)
        {
            throw std::invalid_argument(
                "Expected non-negative value for parameter 'instruments.maturity_warning_days', got: " + std::to_string(maturity_warning_days));
        }
    }

    InstrumentConfig InstrumentConfig::from_json(const nlohmann::json &j)
    {
        InstrumentConfig config;
        config.days_per_year = j.value("days_per_year", 365.0);
        config.maturity_warning_days = j.value("maturity_warning_days", 30);
        config.verbose = j.value("verbose", false);
        config.validate();
        return config;
    }

    // =============================================
    // IrrConfig
    // =============================================

    void IrrConfig::validate() const
    {
        if (max_iterations < 1)
        {
            throw std::invalid_argument(
                "Expected positive value for parameter 'irr.max_iterations', got: " + std::to_string(max_iterations));
        }
        if (max_bisection_iterations < 1)
        {
            throw std::invalid_argument(
                "Expected positive value for parameter 'irr.max_bisection_iterations', got: " + std::to_string(max_bisection_iterations));
        }
        if (tolerance <= 0.0)
        {
            throw std::invalid_argument(
                "Expected positive value for parameter 'irr.tolerance', got: " + std::to_string(tolerance));
        }
        if (lower_bound <= -1.0)
        {
            throw std::invalid_argument(
                "irr.lower_bound must be greater than -1, got: " + std::to_string(lower_bound));
        }
        if (upper_bound <= lower_bound)
        {
            throw std::invalid_argument(
                "irr.upper_bound (" + std::to_string(upper_bound) + ") must exceed irr.lower_bound (" + std::to_string(lower_bound) + ")");
        }
        if (initial_guess <= lower_bound || initial_guess >= upper_bound)
        {
            throw std::invalid_argument(
                "irr.initial_guess must lie inside (lower_bound, upper_bound), got: " + std::to_string(initial_guess));
        }
    }

    IrrConfig IrrConfig::from_json(const nlohmann::json &j)
    {
        IrrConfig config;
        config.max_iterations = j.value("max_iterations", 100);
        config.max_bisection_iterations = j.value("max_bisection_iterations", 200);
        config.tolerance = j.value("tolerance", 1e-7);
        config.initial_guess = j.value("initial_guess", 0.1);
        config.lower_bound = j.value("lower_bound", -0.9999);
        config.upper_bound = j.value("upper_bound", 1000.0);
        config.validate();
        return config;
    }

    // =============================================
    // PerformanceConfig
    // =============================================

    void PerformanceConfig::validate() const
    {
        if (periods_per_year <= 0)
        {
            throw std::invalid_argument(
                "Expected positive value for parameter 'performance.periods_per_year', got: " + std::to_string(periods_per_year));
        }
        if (days_per_year <= 0.0)
        {
            throw std::invalid_argument(
                "Expected positive value for parameter 'performance.days_per_year', got: " + std::to_string(days_per_year));
        }
    }

    PerformanceConfig PerformanceConfig::from_json(const nlohmann::json &j)
    {
        PerformanceConfig config;
        config.risk_free_rate = j.value("risk_free_rate", 0.02);
        config.periods_per_year = j.value("periods_per_year", 12);
        config.days_per_year = j.value("days_per_year", 365.0);
        config.validate();
        return config;
    }

    // =============================================
    // RiskThresholds
    // =============================================

    void RiskThresholds::validate() const
    {
        if (!(hhi_moderate < hhi_high && hhi_high < hhi_very_high))
        {
            throw std::invalid_argument("risk.hhi thresholds must be strictly increasing");
        }
        if (!(volatility_moderate < volatility_high && volatility_high < volatility_very_high))
        {
            throw std::invalid_argument("risk.volatility thresholds must be strictly increasing");
        }
        if (!(holdings_few < holdings_some))
        {
            throw std::invalid_argument("risk.holdings.few must be less than risk.holdings.some");
        }
        if (!(0 < score_moderate && score_moderate < score_high))
        {
            throw std::invalid_argument("risk.score thresholds must satisfy 0 < moderate < high");
        }
    }

    RiskThresholds RiskThresholds::from_json(const nlohmann::json &j)
    {
        RiskThresholds config;

        if (j.contains("hhi"))
        {
            const auto &hhi = j["hhi"];
            config.hhi_moderate = hhi.value("moderate", 0.15);
            config.hhi_high = hhi.value("high", 0.25);
            config.hhi_very_high = hhi.value("very_high", 0.50);
        }

        if (j.contains("volatility"))
        {
            const auto &vol = j["volatility"];
            config.volatility_moderate = vol.value("moderate", 0.15);
            config.volatility_high = vol.value("high", 0.25);
            config.volatility_very_high = vol.value("very_high", 0.40);
        }

        if (j.contains("holdings"))
        {
            const auto &holdings = j["holdings"];
            config.holdings_few = holdings.value("few", 5);
            config.holdings_some = holdings.value("some", 10);
        }

        if (j.contains("score"))
        {
            const auto &score = j["score"];
            config.score_moderate = score.value("moderate", 3);
            config.score_high = score.value("high", 6);
        }

        config.validate();
        return config;
    }

    // =============================================
    // CacheConfig
    // =============================================

    void CacheConfig::validate() const
    {
        if (ttl_seconds <= 0.0)
        {
            throw std::invalid_argument(
                "Expected positive value for parameter 'cache.ttl_seconds', got: " + std::to_string(ttl_seconds));
        }
        if (capacity == 0)
        {
            throw std::invalid_argument("Expected positive value for parameter 'cache.capacity', got: 0");
        }
    }

    CacheConfig CacheConfig::from_json(const nlohmann::json &j)
    {
        CacheConfig config;
        config.ttl_seconds = j.value("ttl_seconds", 300.0);
        config.capacity = j.value("capacity", static_cast<size_t>(1000));
        config.validate();
        return config;
    }

    // =============================================
    // EngineConfig
    // =============================================

    EngineConfig EngineConfig::from_json(const nlohmann::json &j)
    {
        EngineConfig config;

        if (j.contains("instruments"))
        {
            config.instruments = InstrumentConfig::from_json(j["instruments"]);
        }
        if (j.contains("irr"))
        {
            config.irr = IrrConfig::from_json(j["irr"]);
        }
        if (j.contains("performance"))
        {
            config.performance = PerformanceConfig::from_json(j["performance"]);
        }
        if (j.contains("risk"))
        {
            config.risk = RiskThresholds::from_json(j["risk"]);
        }
        if (j.contains("cache"))
        {
            config.cache = CacheConfig::from_json(j["cache"]);
        }

        config.verbose = j.value("verbose", false);
        if (config.verbose)
        {
            config.instruments.verbose = true;
        }

        return config;
    }

    nlohmann::json EngineConfig::to_json() const
    {
        nlohmann::json j;

        j["instruments"]["days_per_year"] = instruments.days_per_year;
        j["instruments"]["maturity_warning_days"] = instruments.maturity_warning_days;
        j["instruments"]["verbose"] = instruments.verbose;

        j["irr"]["max_iterations"] = irr.max_iterations;
        j["irr"]["max_bisection_iterations"] = irr.max_bisection_iterations;
        j["irr"]["tolerance"] = irr.tolerance;
        j["irr"]["initial_guess"] = irr.initial_guess;
        j["irr"]["lower_bound"] = irr.lower_bound;
        j["irr"]["upper_bound"] = irr.upper_bound;

        j["performance"]["risk_free_rate"] = performance.risk_free_rate;
        j["performance"]["periods_per_year"] = performance.periods_per_year;
        j["performance"]["days_per_year"] = performance.days_per_year;

        j["risk"]["hhi"]["moderate"] = risk.hhi_moderate;
        j["risk"]["hhi"]["high"] = risk.hhi_high;
        j["risk"]["hhi"]["very_high"] = risk.hhi_very_high;
        j["risk"]["volatility"]["moderate"] = risk.volatility_moderate;
        j["risk"]["volatility"]["high"] = risk.volatility_high;
        j["risk"]["volatility"]["very_high"] = risk.volatility_very_high;
        j["risk"]["holdings"]["few"] = risk.holdings_few;
        j["risk"]["holdings"]["some"] = risk.holdings_some;
        j["risk"]["score"]["moderate"] = risk.score_moderate;
        j["risk"]["score"]["high"] = risk.score_high;

        j["cache"]["ttl_seconds"] = cache.ttl_seconds;
        j["cache"]["capacity"] = cache.capacity;

        j["verbose"] = verbose;
        return j;
    }

} // namespace venture
