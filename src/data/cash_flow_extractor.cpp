/**
 * @file cash_flow_extractor.cpp
 * @brief Implementation of CashFlowExtractor
 */

#include "venture/data/cash_flow_extractor.hpp"

#include <algorithm>

namespace venture
{
    namespace data
    {

        std::string to_string(CashFlowKind kind)
        {
            switch (kind)
            {
            case CashFlowKind::INVESTMENT:
                return "INVESTMENT";
            case CashFlowKind::DISTRIBUTION:
                return "DISTRIBUTION";
            case CashFlowKind::TERMINAL_VALUE:
                return "TERMINAL_VALUE";
            }
            return "UNKNOWN";
        }

        std::vector<CashFlowEvent> CashFlowExtractor::extract(const PortfolioRecords &records, const DateRange &range)
        {
            std::vector<CashFlowEvent> flows;
            double terminal_value = 0.0;

            for (const auto &inv : records.investments)
            {
                if (!inv.is_funded() || !range.contains(inv.investment_date))
                {
                    continue;
                }

                flows.push_back({inv.investment_date, -inv.amount, CashFlowKind::INVESTMENT, inv.id});

                if (inv.status == InvestmentStatus::ACTIVE)
                {
                    terminal_value += inv.current_valuation;
                }
            }

            for (const auto &d : records.distributions)
            {
                if (range.contains(d.date))
                {
                    flows.push_back({d.date, d.amount, CashFlowKind::DISTRIBUTION, d.investment_id});
                }
            }

            if (terminal_value > 0.0)
            {
                flows.push_back({resolve_end(range, records.as_of), terminal_value, CashFlowKind::TERMINAL_VALUE, ""});
            }

            std::stable_sort(flows.begin(), flows.end(),
                             [](const CashFlowEvent &a, const CashFlowEvent &b)
                             { return a.date < b.date; });
            return flows;
        }

        std::vector<DatedReturn> CashFlowExtractor::periodic_returns(const std::vector<ValuationSnapshot> &snapshots,
                                                                     const DateRange &range)
        {
            std::vector<ValuationSnapshot> in_range;
            for (const auto &s : snapshots)
            {
                if (range.contains(s.date))
                {
                    in_range.push_back(s);
                }
            }

            std::stable_sort(in_range.begin(), in_range.end(),
                             [](const ValuationSnapshot &a, const ValuationSnapshot &b)
                             { return a.date < b.date; });

            std::vector<DatedReturn> returns;
            for (size_t i = 1; i < in_range.size(); ++i)
            {
                double prev = in_range[i - 1].value;
                if (prev <= 0.0)
                {
                    continue;
                }
                returns.push_back({in_range[i].date, (in_range[i].value - prev) / prev});
            }
            return returns;
        }

    } // namespace data
} // namespace venture
