/**
 * @file portfolio_records.hpp
 * @brief Investment, distribution and valuation records of a portfolio,
 *        and the data source interface the calculators read them through.
 */

#ifndef VENTURE_DATA_PORTFOLIO_RECORDS_HPP
#define VENTURE_DATA_PORTFOLIO_RECORDS_HPP

#include "venture/core/date.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace venture {
namespace data {

/**
 * @enum InvestmentStatus
 * @brief Lifecycle state of a single investment.
 */
enum class InvestmentStatus {
    PENDING,   ///< Committed, funds not yet transferred
    ACTIVE,    ///< Held; carries a current valuation
    EXITED,    ///< Realized; value returned through distributions
    CANCELLED  ///< Never funded
};

std::string to_string(InvestmentStatus status);

/**
 * @throws core::ValidationError On an unknown status name.
 */
InvestmentStatus parse_investment_status(const std::string& text);

/**
 * @struct InvestmentRecord
 * @brief One investment held in a portfolio.
 */
struct InvestmentRecord {
    std::string id;
    std::string portfolio_id;
    std::string startup_name;
    std::string sector;                  ///< Empty means "Other"
    double amount = 0.0;                 ///< Capital invested
    core::Date investment_date;
    double current_valuation = 0.0;      ///< Mark-to-market value of the holding
    InvestmentStatus status = InvestmentStatus::ACTIVE;

    /** @brief Sector name with "Other" substituted for an empty one. */
    std::string sector_or_default() const { return sector.empty() ? "Other" : sector; }

    /** @brief Funded investments contribute capital outflows. */
    bool is_funded() const {
        return status == InvestmentStatus::ACTIVE || status == InvestmentStatus::EXITED;
    }

    static InvestmentRecord from_json(const nlohmann::json& j);
};

/**
 * @struct Distribution
 * @brief Cash returned to the investor for one investment.
 */
struct Distribution {
    std::string investment_id;
    core::Date date;
    double amount = 0.0;  ///< Positive

    static Distribution from_json(const nlohmann::json& j);
};

/**
 * @struct ValuationSnapshot
 * @brief Total portfolio value on one date.
 */
struct ValuationSnapshot {
    core::Date date;
    double value = 0.0;
};

/**
 * @struct DatedReturn
 * @brief Simple return for the period ending on @c date.
 */
struct DatedReturn {
    core::Date date;
    double value = 0.0;
};

/**
 * @struct BenchmarkSeries
 * @brief Externally supplied dated return series (market index or peer aggregate).
 */
struct BenchmarkSeries {
    std::string name;
    std::vector<DatedReturn> returns;

    static BenchmarkSeries from_json(const nlohmann::json& j);
};

/**
 * @struct DateRange
 * @brief Inclusive date filter. Unset bounds are open.
 */
struct DateRange {
    std::optional<core::Date> start;
    std::optional<core::Date> end;

    bool contains(const core::Date& d) const {
        return (!start || *start <= d) && (!end || d <= *end);
    }

    /** @brief "start:end" with "*" for an open bound. Used in cache keys. */
    std::string to_key() const;
};

/**
 * @struct PortfolioRecords
 * @brief Everything the calculators need about one portfolio.
 */
struct PortfolioRecords {
    std::string portfolio_id;
    std::string name;
    core::Date as_of;  ///< Valuation date; default end of a DateRange
    std::vector<InvestmentRecord> investments;
    std::vector<Distribution> distributions;
    std::vector<ValuationSnapshot> valuations;

    /**
     * @brief Parse one portfolio object.
     *
     * When "as_of" is absent, the latest date found in the records is used.
     *
     * @throws core::ValidationError On a missing id or an invalid record.
     */
    static PortfolioRecords from_json(const nlohmann::json& j);
};

/**
 * @class PortfolioDataSource
 * @brief Read-only access to portfolio records.
 */
class PortfolioDataSource {
public:
    virtual ~PortfolioDataSource() = default;

    /**
     * @throws core::NotFoundError If the portfolio is unknown.
     */
    virtual PortfolioRecords load(const std::string& portfolio_id) const = 0;

    virtual std::vector<std::string> portfolio_ids() const = 0;
};

/**
 * @class InMemoryPortfolioSource
 * @brief Map-backed PortfolioDataSource. Thread-safe.
 *
 * @code
 * InMemoryPortfolioSource source;
 * for (auto& p : DataLoader::load_portfolios("data/portfolios.json")) {
 *     source.add(std::move(p));
 * }
 * @endcode
 */
class InMemoryPortfolioSource : public PortfolioDataSource {
public:
    InMemoryPortfolioSource() = default;

    /** @brief Insert or replace a portfolio. */
    void add(PortfolioRecords records);

    PortfolioRecords load(const std::string& portfolio_id) const override;
    std::vector<std::string> portfolio_ids() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, PortfolioRecords> portfolios_;
};

} // namespace data
} // namespace venture

#endif // VENTURE_DATA_PORTFOLIO_RECORDS_HPP
