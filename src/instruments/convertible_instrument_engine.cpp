/**
 * @file convertible_instrument_engine.cpp
 * @brief Implementation of ConvertibleInstrumentEngine
 */

#include "venture/instruments/convertible_instrument_engine.hpp"
#include "venture/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace venture
{
    namespace instruments
    {

        namespace
        {

            std::string format_money(double value)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(2) << value;
                return oss.str();
            }

        } // anonymous namespace

        ConvertibleInstrumentEngine::ConvertibleInstrumentEngine(InstrumentStore &store,
                                                                 const core::Clock &clock,
                                                                 InstrumentEventLog *event_log,
                                                                 InstrumentConfig config)
            : store_(store), clock_(clock), event_log_(event_log), config_(config)
        {
            config_.validate();
        }

        // ===================================================================
        // Pure helpers
        // ===================================================================

        double ConvertibleInstrumentEngine::interest_for_period(const ConvertibleInstrument &instrument,
                                                                double days,
                                                                double days_per_year)
        {
            if (!(days > 0.0))
            {
                return 0.0;
            }

            double rate = instrument.terms.interest_rate / 100.0;
            if (rate == 0.0)
            {
                return 0.0;
            }

            double years = days / days_per_year;

            if (instrument.terms.compounding == CompoundingMode::COMPOUND)
            {
                // expm1/log1p keep precision for short periods
                return instrument.balance() * std::expm1(years * std::log1p(rate));
            }

            return instrument.terms.principal * rate * years;
        }

        double ConvertibleInstrumentEngine::resolve_conversion_price(const InstrumentTerms &terms,
                                                                     const FinancingRound &round)
        {
            round.validate();

            double round_price = round.price_per_share;

            double discount_price = round_price;
            if (terms.discount_rate)
            {
                discount_price = round_price * (1.0 - *terms.discount_rate / 100.0);
            }

            double cap_price = std::numeric_limits<double>::infinity();
            if (terms.valuation_cap)
            {
                cap_price = *terms.valuation_cap / round.fully_diluted_shares;
            }

            return std::min({discount_price, cap_price, round_price});
        }

        // ===================================================================
        // Lifecycle
        // ===================================================================

        ConvertibleInstrument ConvertibleInstrumentEngine::create_instrument(const InstrumentTerms &terms)
        {
            terms.validate();

            ConvertibleInstrument instrument;
            instrument.terms = terms;
            if (instrument.terms.kind == InstrumentKind::SAFE && !instrument.terms.safe_type)
            {
                instrument.terms.safe_type = SafeType::POST_MONEY;
            }
            instrument.status = InstrumentStatus::ACTIVE;
            instrument.accrued_interest = 0.0;
            instrument.last_accrual = terms.issue_date.to_timestamp();

            ConvertibleInstrument stored = store_.insert(instrument);

            record_event(InstrumentEventType::CREATED, stored, stored.terms.principal,
                         to_string(stored.terms.kind) + " issued " + stored.terms.issue_date.to_string());

            if (config_.verbose)
            {
                std::cout << "Created " << to_string(stored.terms.kind) << " " << stored.id
                          << " for investment " << stored.terms.investment_id
                          << ": principal $" << format_money(stored.terms.principal)
                          << ", matures " << stored.terms.maturity_date.to_string() << std::endl;
            }

            return stored;
        }

        ConvertibleInstrument ConvertibleInstrumentEngine::get(const std::string &id) const
        {
            return load(id);
        }

        AccrualResult ConvertibleInstrumentEngine::accrue_interest(const std::string &id)
        {
            auto guard = lock_for(id);
            std::lock_guard<std::mutex> lock(*guard);

            ConvertibleInstrument working = load_active(id, "accrue interest on");

            AccrualResult result;
            core::Timestamp now = clock_.now();
            if (now <= working.last_accrual)
            {
                result.instrument = working;
                return result;
            }

            result.interest_added = accrue_to(working, now, result.days_elapsed);
            result.instrument = store_.update(working);

            if (result.interest_added > 0.0)
            {
                record_event(InstrumentEventType::ACCRUED, result.instrument, result.interest_added,
                             std::to_string(result.days_elapsed) + " days");
            }

            return result;
        }

        ConvertibleInstrument ConvertibleInstrumentEngine::update_terms(const std::string &id, const TermsUpdate &update)
        {
            auto guard = lock_for(id);
            std::lock_guard<std::mutex> lock(*guard);

            ConvertibleInstrument working = load_active(id, "update terms of");

            if (update.empty())
            {
                return working;
            }

            std::ostringstream changes;
            if (update.discount_rate)
            {
                working.terms.discount_rate = *update.discount_rate;
                changes << "discount_rate=" << *update.discount_rate << " ";
            }
            if (update.valuation_cap)
            {
                working.terms.valuation_cap = *update.valuation_cap;
                changes << "valuation_cap=" << *update.valuation_cap << " ";
            }
            if (update.qualified_financing_threshold)
            {
                working.terms.qualified_financing_threshold = *update.qualified_financing_threshold;
                changes << "qualified_financing_threshold=" << *update.qualified_financing_threshold << " ";
            }
            if (update.auto_conversion)
            {
                working.terms.auto_conversion = *update.auto_conversion;
                changes << "auto_conversion=" << (*update.auto_conversion ? "true" : "false") << " ";
            }

            working.terms.validate();

            ConvertibleInstrument stored = store_.update(working);
            record_event(InstrumentEventType::TERMS_UPDATED, stored, 0.0, changes.str());

            if (config_.verbose)
            {
                std::cout << "Updated terms of " << stored.id << ": " << changes.str() << std::endl;
            }

            return stored;
        }

        double ConvertibleInstrumentEngine::calculate_conversion_price(const std::string &id,
                                                                       const FinancingRound &round) const
        {
            ConvertibleInstrument instrument = load(id);
            return resolve_conversion_price(instrument.terms, round);
        }

        ConversionResult ConvertibleInstrumentEngine::convert(const std::string &id, const FinancingRound &round)
        {
            auto guard = lock_for(id);
            std::lock_guard<std::mutex> lock(*guard);

            ConvertibleInstrument working = load_active(id, "convert");

            double conversion_price = resolve_conversion_price(working.terms, round);

            core::Timestamp now = clock_.now();
            double days = 0.0;
            double final_interest = accrue_to(working, now, days);

            ConversionResult result;
            result.total_amount = working.balance();
            result.conversion_price = conversion_price;
            result.shares = std::floor(result.total_amount / conversion_price);
            result.final_interest = final_interest;

            working.status = InstrumentStatus::CONVERTED;
            working.conversion_price = conversion_price;
            working.conversion_shares = result.shares;
            working.closed_at = std::max(now, working.last_accrual);

            result.instrument = store_.update(working);
            release_lock(id);

            if (final_interest > 0.0)
            {
                record_event(InstrumentEventType::ACCRUED, result.instrument, final_interest, "final accrual");
            }
            record_event(InstrumentEventType::CONVERTED, result.instrument, result.total_amount,
                         round.round_id, conversion_price, result.shares);

            if (config_.verbose)
            {
                std::cout << "Converted " << result.instrument.id << " into " << std::fixed << std::setprecision(0)
                          << result.shares << " shares at $" << std::setprecision(4) << conversion_price
                          << " per share (amount $" << format_money(result.total_amount) << ")" << std::endl;
            }

            return result;
        }

        RepaymentResult ConvertibleInstrumentEngine::repay(const std::string &id, double repayment_amount)
        {
            if (!std::isfinite(repayment_amount) || repayment_amount < 0.0)
            {
                throw core::ValidationError("repayment_amount",
                                            "Expected non-negative value for parameter 'repayment_amount', got: " +
                                                std::to_string(repayment_amount));
            }

            auto guard = lock_for(id);
            std::lock_guard<std::mutex> lock(*guard);

            ConvertibleInstrument working = load_active(id, "repay");

            core::Timestamp now = clock_.now();
            double days = 0.0;
            double final_interest = accrue_to(working, now, days);
            double total_owed = working.balance();

            if (repayment_amount < total_owed)
            {
                throw core::InsufficientRepaymentError(
                    "Repayment of $" + format_money(repayment_amount) + " is less than $" + format_money(total_owed) +
                        " owed on instrument " + id,
                    total_owed, repayment_amount);
            }

            working.status = InstrumentStatus::REPAID;
            working.closed_at = std::max(now, working.last_accrual);

            RepaymentResult result;
            result.instrument = store_.update(working);
            release_lock(id);
            result.total_owed = total_owed;
            result.repayment_amount = repayment_amount;
            result.final_interest = final_interest;

            if (final_interest > 0.0)
            {
                record_event(InstrumentEventType::ACCRUED, result.instrument, final_interest, "final accrual");
            }
            record_event(InstrumentEventType::REPAID, result.instrument, repayment_amount,
                         "owed " + format_money(total_owed));

            if (config_.verbose)
            {
                std::cout << "Repaid " << result.instrument.id << ": $" << format_money(repayment_amount)
                          << " against $" << format_money(total_owed) << " owed" << std::endl;
            }

            return result;
        }

        bool ConvertibleInstrumentEngine::check_qualified_financing(const std::string &id, double round_amount) const
        {
            ConvertibleInstrument instrument = load(id);
            if (!instrument.terms.qualified_financing_threshold)
            {
                return true;
            }
            return round_amount >= *instrument.terms.qualified_financing_threshold;
        }

        // ===================================================================
        // Queries
        // ===================================================================

        std::vector<ConvertibleInstrument> ConvertibleInstrumentEngine::list_maturing_within(int days) const
        {
            if (days < 0)
            {
                throw core::ValidationError("days",
                                            "Expected non-negative value for parameter 'days', got: " + std::to_string(days));
            }

            core::Date horizon = clock_.today().add_days(days);

            std::vector<ConvertibleInstrument> out;
            for (auto &instrument : store_.find_by_status(InstrumentStatus::ACTIVE))
            {
                if (instrument.terms.maturity_date <= horizon)
                {
                    out.push_back(std::move(instrument));
                }
            }

            std::stable_sort(out.begin(), out.end(),
                             [](const ConvertibleInstrument &a, const ConvertibleInstrument &b)
                             { return a.terms.maturity_date < b.terms.maturity_date; });
            return out;
        }

        std::vector<ConvertibleInstrument> ConvertibleInstrumentEngine::list_by_startup(const std::string &startup_id) const
        {
            return store_.find_by_startup(startup_id);
        }

        std::vector<ConvertibleInstrument> ConvertibleInstrumentEngine::list_by_investor(const std::string &investor_id) const
        {
            return store_.find_by_investor(investor_id);
        }

        // ===================================================================
        // Batch jobs
        // ===================================================================

        AccrualJobSummary ConvertibleInstrumentEngine::accrue_all_active()
        {
            AccrualJobSummary summary;
            auto active = store_.find_by_status(InstrumentStatus::ACTIVE);
            summary.total_instruments = static_cast<int>(active.size());

            core::Date today = clock_.today();

            for (const auto &instrument : active)
            {
                try
                {
                    AccrualResult accrual = accrue_interest(instrument.id);
                    summary.interest_accrued += accrual.interest_added;
                    ++summary.processed;
                }
                catch (const core::InvalidStateError &)
                {
                    // Converted or repaid after the listing
                    ++summary.skipped;
                    continue;
                }
                catch (const core::EngineError &e)
                {
                    summary.failures.push_back({instrument.id, e.code(), e.what()});
                    std::cerr << "Accrual failed for " << instrument.id << ": " << e.what() << std::endl;
                    continue;
                }

                long long days_to_maturity = core::Date::days_between(today, instrument.terms.maturity_date);
                if (days_to_maturity < 0)
                {
                    summary.overdue.push_back(instrument.id);
                    if (config_.verbose)
                    {
                        std::cerr << "Warning: " << instrument.id << " is " << -days_to_maturity
                                  << " days past maturity" << std::endl;
                    }
                }
                else if (days_to_maturity <= config_.maturity_warning_days)
                {
                    summary.approaching_maturity.push_back(instrument.id);
                    if (config_.verbose)
                    {
                        std::cerr << "Warning: " << instrument.id << " matures in " << days_to_maturity
                                  << " days" << std::endl;
                    }
                }
            }

            if (config_.verbose)
            {
                std::cout << "Accrual job: " << summary.processed << "/" << summary.total_instruments
                          << " processed, $" << format_money(summary.interest_accrued) << " accrued, "
                          << summary.failures.size() << " failures" << std::endl;
            }

            return summary;
        }

        FinancingRoundOutcome ConvertibleInstrumentEngine::process_financing_round(const std::string &startup_id,
                                                                                   const FinancingRound &round)
        {
            round.validate();

            FinancingRoundOutcome outcome;

            for (const auto &instrument : store_.find_by_startup(startup_id))
            {
                if (!instrument.is_active())
                {
                    continue;
                }

                bool qualified = !instrument.terms.qualified_financing_threshold ||
                                 round.amount_raised >= *instrument.terms.qualified_financing_threshold;
                if (!instrument.terms.auto_conversion || !qualified)
                {
                    outcome.skipped.push_back(instrument.id);
                    continue;
                }

                try
                {
                    outcome.converted.push_back(convert(instrument.id, round));
                }
                catch (const core::EngineError &e)
                {
                    outcome.failures.push_back({instrument.id, e.code(), e.what()});
                    std::cerr << "Auto-conversion failed for " << instrument.id << ": " << e.what() << std::endl;
                }
            }

            if (config_.verbose)
            {
                std::cout << "Financing round " << round.round_id << " for " << startup_id << ": "
                          << outcome.converted.size() << " converted, " << outcome.skipped.size()
                          << " skipped, " << outcome.failures.size() << " failed" << std::endl;
            }

            return outcome;
        }

        // ===================================================================
        // Private helpers
        // ===================================================================

        std::shared_ptr<std::mutex> ConvertibleInstrumentEngine::lock_for(const std::string &id)
        {
            std::lock_guard<std::mutex> lock(locks_mutex_);
            auto &slot = locks_[id];
            if (!slot)
            {
                slot = std::make_shared<std::mutex>();
            }
            return slot;
        }

        void ConvertibleInstrumentEngine::release_lock(const std::string &id)
        {
            // Holders keep their shared_ptr; later callers find the instrument terminal.
            std::lock_guard<std::mutex> lock(locks_mutex_);
            locks_.erase(id);
        }

        size_t ConvertibleInstrumentEngine::tracked_lock_count() const
        {
            std::lock_guard<std::mutex> lock(locks_mutex_);
            return locks_.size();
        }

        ConvertibleInstrument ConvertibleInstrumentEngine::load(const std::string &id) const
        {
            auto instrument = store_.find(id);
            if (!instrument)
            {
                throw core::NotFoundError("Convertible instrument not found: " + id);
            }
            return *instrument;
        }

        ConvertibleInstrument ConvertibleInstrumentEngine::load_active(const std::string &id,
                                                                       const std::string &operation)
        {
            // Caller holds the instrument lock. Unknown and closed ids keep no lock entry.
            auto instrument = store_.find(id);
            if (!instrument)
            {
                release_lock(id);
                throw core::NotFoundError("Convertible instrument not found: " + id);
            }
            if (!instrument->is_active())
            {
                release_lock(id);
            }
            require_active(*instrument, operation);
            return *instrument;
        }

        void ConvertibleInstrumentEngine::require_active(const ConvertibleInstrument &instrument,
                                                         const std::string &operation)
        {
            if (!instrument.is_active())
            {
                throw core::InvalidStateError("Cannot " + operation + " instrument " + instrument.id +
                                              " with status " + to_string(instrument.status));
            }
        }

        double ConvertibleInstrumentEngine::accrue_to(ConvertibleInstrument &instrument,
                                                      const core::Timestamp &now,
                                                      double &days_elapsed) const
        {
            days_elapsed = core::days_between(instrument.last_accrual, now);
            if (days_elapsed <= 0.0)
            {
                days_elapsed = 0.0;
                return 0.0;
            }

            double interest = interest_for_period(instrument, days_elapsed, config_.days_per_year);
            instrument.accrued_interest += interest;
            instrument.last_accrual = now;
            return interest;
        }

        void ConvertibleInstrumentEngine::record_event(InstrumentEventType type,
                                                       const ConvertibleInstrument &instrument,
                                                       double amount,
                                                       const std::string &detail,
                                                       double price,
                                                       double shares) const
        {
            if (event_log_ == nullptr)
            {
                return;
            }

            InstrumentEvent event;
            event.instrument_id = instrument.id;
            event.type = type;
            event.at = clock_.now();
            event.amount = amount;
            event.balance_after = instrument.balance();
            event.price = price;
            event.shares = shares;
            event.detail = detail;
            event_log_->record(event);
        }

    } // namespace instruments
} // namespace venture
