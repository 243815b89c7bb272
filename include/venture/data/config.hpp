/**
 * @file config.hpp
 * @brief Engine configuration sections.
 *
 * Each section is a plain struct with defaults and a from_json factory.
 * Missing keys fall back to the defaults; present keys are validated.
 *
 * Example file:
 * @code
 * {
 *   "instruments": { "days_per_year": 365, "maturity_warning_days": 30 },
 *   "performance": { "risk_free_rate": 0.02, "periods_per_year": 12 },
 *   "irr": { "max_iterations": 100, "tolerance": 1e-7 },
 *   "risk": { "hhi": { "moderate": 0.15, "high": 0.25, "very_high": 0.5 } },
 *   "cache": { "ttl_seconds": 300, "capacity": 1000 },
 *   "verbose": false
 * }
 * @endcode
 */

#ifndef VENTURE_DATA_CONFIG_HPP
#define VENTURE_DATA_CONFIG_HPP

#include <nlohmann/json.hpp>

#include <string>

namespace venture
{

    /**
     * @struct InstrumentConfig
     * @brief Accrual and maturity-monitoring settings.
     */
    struct InstrumentConfig
    {
        double days_per_year = 365.0;   ///< Day-count denominator for accrual
        int maturity_warning_days = 30; ///< Window flagged by the accrual job
        bool verbose = false;           ///< Log lifecycle events to stdout/stderr

        void validate() const;
        static InstrumentConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct IrrConfig
     * @brief Root-finder bounds for XIRR.
     */
    struct IrrConfig
    {
        int max_iterations = 100;        ///< Newton-Raphson iteration bound
        int max_bisection_iterations = 200;
        double tolerance = 1e-7;         ///< |NPV| / max(1, |flows|) acceptance threshold
        double initial_guess = 0.1;
        double lower_bound = -0.9999;    ///< Rates at or below -100% are undefined
        double upper_bound = 1000.0;     ///< Highest rate scanned for a bracket

        void validate() const;
        static IrrConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct PerformanceConfig
     * @brief Annualization settings for performance metrics.
     */
    struct PerformanceConfig
    {
        double risk_free_rate = 0.02; ///< Annualized
        int periods_per_year = 12;    ///< Valuation snapshots are monthly by default
        double days_per_year = 365.0; ///< Used for IRR exponents and CAGR

        void validate() const;
        static PerformanceConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct RiskThresholds
     * @brief Band boundaries for concentration and overall risk scoring.
     */
    struct RiskThresholds
    {
        double hhi_moderate = 0.15;
        double hhi_high = 0.25;
        double hhi_very_high = 0.50;

        double volatility_moderate = 0.15;
        double volatility_high = 0.25;
        double volatility_very_high = 0.40;

        int holdings_few = 5;   ///< Fewer holdings than this scores 2
        int holdings_some = 10; ///< Fewer holdings than this scores 1

        int score_moderate = 3; ///< Score at or above this is Moderate risk
        int score_high = 6;     ///< Score at or above this is High risk

        void validate() const;
        static RiskThresholds from_json(const nlohmann::json &j);
    };

    /**
     * @struct CacheConfig
     * @brief Result cache sizing.
     */
    struct CacheConfig
    {
        double ttl_seconds = 300.0;
        size_t capacity = 1000;

        void validate() const;
        static CacheConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct EngineConfig
     * @brief Complete engine configuration.
     */
    struct EngineConfig
    {
        InstrumentConfig instruments;
        IrrConfig irr;
        PerformanceConfig performance;
        RiskThresholds risk;
        CacheConfig cache;
        bool verbose = false;

        static EngineConfig from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;
    };

} // namespace venture

#endif // VENTURE_DATA_CONFIG_HPP
