/**
 * @file data_loader.hpp
 * @brief Loading of configuration, portfolio records and benchmark series.
 *
 * Portfolios and configuration come from JSON files. Benchmark series can
 * be JSON or a two-column CSV (date,return).
 */

#ifndef VENTURE_DATA_DATA_LOADER_HPP
#define VENTURE_DATA_DATA_LOADER_HPP

#include "venture/data/config.hpp"
#include "venture/data/portfolio_records.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace venture {
namespace data {

/**
 * @class DataLoader
 * @brief Reads engine inputs from files.
 *
 * Expected portfolio file:
 * @code
 * {
 *   "portfolios": [
 *     {
 *       "id": "P1", "as_of": "2024-12-31",
 *       "investments": [ { "id": "I1", "startup_name": "Acme", "sector": "Fintech",
 *                          "amount": 25000, "investment_date": "2022-03-01",
 *                          "current_valuation": 40000, "status": "ACTIVE" } ],
 *       "distributions": [ { "investment_id": "I1", "date": "2023-06-30", "amount": 5000 } ],
 *       "valuations": [ { "date": "2022-03-31", "value": 25000 } ]
 *     }
 *   ]
 * }
 * @endcode
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // JSON
    // ========================================================================

    /**
     * @brief Load a JSON file
     * @param filepath Path to JSON file
     * @return JSON object
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load engine configuration
     * @param config_path Path to config JSON file
     * @throws std::runtime_error on IO or parse errors
     * @throws std::invalid_argument if a value is out of range
     */
    static EngineConfig load_config(const std::string& config_path);

    /**
     * @brief Load every portfolio in a portfolio file
     *
     * Accepts either {"portfolios": [...]} or a single portfolio object.
     *
     * @throws std::runtime_error on IO or parse errors
     * @throws core::ValidationError on invalid records
     */
    static std::vector<PortfolioRecords> load_portfolios(const std::string& filepath);

    // ========================================================================
    // Benchmarks
    // ========================================================================

    /**
     * @brief Load a benchmark return series
     *
     * Files ending in ".csv" are read as "date,return" rows with a header;
     * anything else is parsed as BenchmarkSeries JSON.
     *
     * @throws std::runtime_error on IO or parse errors
     */
    static BenchmarkSeries load_benchmark(const std::string& filepath);

    /**
     * @brief Load a benchmark series from CSV
     *
     * Expected format:
     * date,return
     * 2024-01-31,0.012
     */
    static BenchmarkSeries load_benchmark_csv(const std::string& filepath);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);
};

} // namespace data
} // namespace venture

#endif // VENTURE_DATA_DATA_LOADER_HPP
