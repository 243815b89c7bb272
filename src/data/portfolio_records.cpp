/**
 * @file portfolio_records.cpp
 * @brief JSON mapping for portfolio records and the in-memory data source
 */

#include "venture/data/portfolio_records.hpp"
#include "venture/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace venture
{
    namespace data
    {

        namespace
        {

            core::Date required_date(const nlohmann::json &j, const char *key)
            {
                if (!j.contains(key) || !j.at(key).is_string())
                {
                    throw core::ValidationError(key, std::string("Missing date field '") + key + "'");
                }
                return core::Date::parse(j.at(key).get<std::string>());
            }

        } // anonymous namespace

        std::string to_string(InvestmentStatus status)
        {
            switch (status)
            {
            case InvestmentStatus::PENDING:
                return "PENDING";
            case InvestmentStatus::ACTIVE:
                return "ACTIVE";
            case InvestmentStatus::EXITED:
                return "EXITED";
            case InvestmentStatus::CANCELLED:
                return "CANCELLED";
            }
            return "UNKNOWN";
        }

        InvestmentStatus parse_investment_status(const std::string &text)
        {
            if (text == "PENDING")
                return InvestmentStatus::PENDING;
            if (text == "ACTIVE")
                return InvestmentStatus::ACTIVE;
            if (text == "EXITED")
                return InvestmentStatus::EXITED;
            if (text == "CANCELLED")
                return InvestmentStatus::CANCELLED;
            throw core::ValidationError("status", "Unknown investment status: '" + text + "'");
        }

        // =============================================
        // Records
        // =============================================

        InvestmentRecord InvestmentRecord::from_json(const nlohmann::json &j)
        {
            InvestmentRecord record;
            record.id = j.value("id", "");
            record.portfolio_id = j.value("portfolio_id", "");
            record.startup_name = j.value("startup_name", "");
            record.sector = j.value("sector", "");
            record.amount = j.value("amount", 0.0);
            record.investment_date = required_date(j, "investment_date");
            record.current_valuation = j.value("current_valuation", record.amount);
            record.status = parse_investment_status(j.value("status", "ACTIVE"));

            if (record.id.empty())
            {
                throw core::ValidationError("id", "Investment record without an id");
            }
            if (!std::isfinite(record.amount) || record.amount < 0.0)
            {
                throw core::ValidationError("amount",
                                            "Expected non-negative value for parameter 'amount', got: " + std::to_string(record.amount));
            }
            return record;
        }

        Distribution Distribution::from_json(const nlohmann::json &j)
        {
            Distribution d;
            d.investment_id = j.value("investment_id", "");
            d.date = required_date(j, "date");
            d.amount = j.value("amount", 0.0);
            if (!std::isfinite(d.amount) || d.amount <= 0.0)
            {
                throw core::ValidationError("amount",
                                            "Expected positive value for parameter 'amount', got: " + std::to_string(d.amount));
            }
            return d;
        }

        BenchmarkSeries BenchmarkSeries::from_json(const nlohmann::json &j)
        {
            BenchmarkSeries series;
            series.name = j.value("name", "benchmark");

            if (j.contains("returns"))
            {
                for (const auto &r : j["returns"])
                {
                    DatedReturn point;
                    point.date = required_date(r, "date");
                    point.value = r.value("return", 0.0);
                    series.returns.push_back(point);
                }
            }

            std::stable_sort(series.returns.begin(), series.returns.end(),
                             [](const DatedReturn &a, const DatedReturn &b)
                             { return a.date < b.date; });
            return series;
        }

        std::string DateRange::to_key() const
        {
            return (start ? start->to_string() : std::string("*")) + ":" + (end ? end->to_string() : std::string("*"));
        }

        PortfolioRecords PortfolioRecords::from_json(const nlohmann::json &j)
        {
            PortfolioRecords records;
            records.portfolio_id = j.value("id", "");
            records.name = j.value("name", records.portfolio_id);

            if (records.portfolio_id.empty())
            {
                throw core::ValidationError("id", "Portfolio without an id");
            }

            if (j.contains("investments"))
            {
                for (const auto &inv : j["investments"])
                {
                    InvestmentRecord record = InvestmentRecord::from_json(inv);
                    if (record.portfolio_id.empty())
                    {
                        record.portfolio_id = records.portfolio_id;
                    }
                    records.investments.push_back(record);
                }
            }

            if (j.contains("distributions"))
            {
                for (const auto &d : j["distributions"])
                {
                    records.distributions.push_back(Distribution::from_json(d));
                }
            }

            if (j.contains("valuations"))
            {
                for (const auto &v : j["valuations"])
                {
                    ValuationSnapshot snapshot;
                    snapshot.date = required_date(v, "date");
                    snapshot.value = v.value("value", 0.0);
                    records.valuations.push_back(snapshot);
                }
            }

            if (j.contains("as_of"))
            {
                records.as_of = required_date(j, "as_of");
            }
            else
            {
                core::Date latest;
                for (const auto &inv : records.investments)
                    latest = std::max(latest, inv.investment_date);
                for (const auto &d : records.distributions)
                    latest = std::max(latest, d.date);
                for (const auto &v : records.valuations)
                    latest = std::max(latest, v.date);
                records.as_of = latest;
            }

            return records;
        }

        // =============================================
        // InMemoryPortfolioSource
        // =============================================

        void InMemoryPortfolioSource::add(PortfolioRecords records)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::string id = records.portfolio_id;
            portfolios_[id] = std::move(records);
        }

        PortfolioRecords InMemoryPortfolioSource::load(const std::string &portfolio_id) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = portfolios_.find(portfolio_id);
            if (it == portfolios_.end())
            {
                throw core::NotFoundError("Portfolio not found: " + portfolio_id);
            }
            return it->second;
        }

        std::vector<std::string> InMemoryPortfolioSource::portfolio_ids() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<std::string> ids;
            ids.reserve(portfolios_.size());
            for (const auto &p : portfolios_)
            {
                ids.push_back(p.first);
            }
            return ids;
        }

    } // namespace data
} // namespace venture
