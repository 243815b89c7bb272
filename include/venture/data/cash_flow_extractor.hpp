/**
 * @file cash_flow_extractor.hpp
 * @brief Builds dated cash-flow and periodic-return series from portfolio records.
 */

#ifndef VENTURE_DATA_CASH_FLOW_EXTRACTOR_HPP
#define VENTURE_DATA_CASH_FLOW_EXTRACTOR_HPP

#include "venture/data/portfolio_records.hpp"

#include <string>
#include <vector>

namespace venture
{
    namespace data
    {

        /**
         * @enum CashFlowKind
         * @brief Origin of a cash flow.
         */
        enum class CashFlowKind
        {
            INVESTMENT,    ///< Capital outflow, negative
            DISTRIBUTION,  ///< Realized proceeds, positive
            TERMINAL_VALUE ///< Imputed liquidation of held positions, positive
        };

        std::string to_string(CashFlowKind kind);

        /**
         * @struct CashFlowEvent
         * @brief Signed, dated amount tied to one investment (or the whole
         *        portfolio for the terminal value).
         */
        struct CashFlowEvent
        {
            core::Date date;
            double amount = 0.0;
            CashFlowKind kind = CashFlowKind::INVESTMENT;
            std::string investment_id;
        };

        /**
         * @class CashFlowExtractor
         * @brief Stateless series builders.
         *
         * Usage:
         * @code
         *   auto flows = CashFlowExtractor::extract(records, range);
         *   auto returns = CashFlowExtractor::periodic_returns(records.valuations, range);
         * @endcode
         */
        class CashFlowExtractor
        {
        public:
            /**
             * @brief Signed cash flows of a portfolio within @p range.
             *
             * - one outflow per funded (ACTIVE or EXITED) investment dated in range
             * - one inflow per distribution dated in range
             * - one terminal inflow equal to the current valuation of in-range
             *   ACTIVE investments, dated at the range end (records.as_of when open);
             *   omitted when zero
             *
             * @return Flows ordered by date; equal dates keep insertion order.
             */
            static std::vector<CashFlowEvent> extract(const PortfolioRecords &records, const DateRange &range);

            /**
             * @brief Simple returns between consecutive in-range snapshots.
             *
             * Periods whose starting value is not positive are skipped.
             */
            static std::vector<DatedReturn> periodic_returns(const std::vector<ValuationSnapshot> &snapshots,
                                                             const DateRange &range);

            /** @brief Range end, or @p as_of when the range is open-ended. */
            static core::Date resolve_end(const DateRange &range, const core::Date &as_of)
            {
                return range.end ? *range.end : as_of;
            }
        };

    } // namespace data
} // namespace venture

#endif // VENTURE_DATA_CASH_FLOW_EXTRACTOR_HPP
