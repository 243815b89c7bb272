/**
 * @file convertible_instrument_engine.hpp
 * @brief Lifecycle, interest accrual, and conversion/repayment math for
 *        convertible notes and SAFEs.
 *
 * Every mutating operation follows the same pattern: take the
 * instrument's lock, read a copy from the store, compute the new state
 * on the copy, and commit it with a single versioned write. A failure
 * anywhere before the write leaves the stored record untouched.
 *
 * Accrual:
 *   SIMPLE:   interest = principal * r * days / 365
 *   COMPOUND: interest = (principal + accrued) * ((1 + r)^(days / 365) - 1)
 *
 * Compounding on the running balance makes the result independent of how
 * often accrual runs: (1+r)^a * (1+r)^b = (1+r)^(a+b).
 *
 * Conversion price:
 *   min(round_price * (1 - discount), cap / fully_diluted_shares, round_price)
 */

#ifndef VENTURE_INSTRUMENTS_CONVERTIBLE_INSTRUMENT_ENGINE_HPP
#define VENTURE_INSTRUMENTS_CONVERTIBLE_INSTRUMENT_ENGINE_HPP

#include "venture/core/clock.hpp"
#include "venture/data/config.hpp"
#include "venture/instruments/convertible_instrument.hpp"
#include "venture/instruments/instrument_event_log.hpp"
#include "venture/instruments/instrument_store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace venture
{
    namespace instruments
    {

        /**
         * @struct AccrualResult
         * @brief Outcome of one accrual call.
         */
        struct AccrualResult
        {
            ConvertibleInstrument instrument; ///< State after the accrual
            double interest_added = 0.0;      ///< Interest accrued by this call
            double days_elapsed = 0.0;        ///< Fractional days since the previous accrual
        };

        /**
         * @struct ConversionResult
         * @brief Outcome of converting an instrument into equity.
         */
        struct ConversionResult
        {
            ConvertibleInstrument instrument;
            double total_amount = 0.0;     ///< principal + accrued interest at conversion
            double conversion_price = 0.0; ///< Resolved price per share
            double shares = 0.0;           ///< floor(total_amount / conversion_price)
            double final_interest = 0.0;   ///< Interest added by the final accrual
        };

        /**
         * @struct RepaymentResult
         * @brief Outcome of repaying an instrument.
         */
        struct RepaymentResult
        {
            ConvertibleInstrument instrument;
            double total_owed = 0.0;
            double repayment_amount = 0.0;
            double final_interest = 0.0;
        };

        /**
         * @struct InstrumentFailure
         * @brief One instrument a batch job could not process.
         */
        struct InstrumentFailure
        {
            std::string instrument_id;
            std::string code;    ///< core::EngineError code
            std::string message;
        };

        /**
         * @struct AccrualJobSummary
         * @brief Result of accruing every ACTIVE instrument.
         */
        struct AccrualJobSummary
        {
            int total_instruments = 0;
            int processed = 0;
            int skipped = 0; ///< Left ACTIVE state between listing and accrual
            double interest_accrued = 0.0;
            std::vector<InstrumentFailure> failures;
            std::vector<std::string> approaching_maturity; ///< Inside the warning window
            std::vector<std::string> overdue;              ///< Past maturity, still ACTIVE
        };

        /**
         * @struct FinancingRoundOutcome
         * @brief Result of applying a priced round to a startup's instruments.
         */
        struct FinancingRoundOutcome
        {
            std::vector<ConversionResult> converted;
            std::vector<std::string> skipped; ///< Not auto-converting or round not qualified
            std::vector<InstrumentFailure> failures;
        };

        /**
         * @class ConvertibleInstrumentEngine
         * @brief Owns instrument lifecycle and money-bearing state changes.
         *
         * Usage:
         * @code
         *   InMemoryInstrumentStore store;
         *   core::SystemClock clock;
         *   ConvertibleInstrumentEngine engine(store, clock);
         *   auto note = engine.create_instrument(terms);
         *   engine.accrue_interest(note.id);
         *   auto result = engine.convert(note.id, round);
         * @endcode
         *
         * Thread safety: All public methods are safe to call concurrently.
         * Operations on one instrument are serialized by a per-instrument
         * mutex; the store's version check rejects writers outside this
         * engine instance.
         */
        class ConvertibleInstrumentEngine
        {
        public:
            /**
             * @param store Instrument persistence. Must outlive the engine.
             * @param clock Time source for accrual. Must outlive the engine.
             * @param event_log Optional audit trail. Must outlive the engine when set.
             * @param config Day count, maturity window, and logging settings.
             */
            ConvertibleInstrumentEngine(InstrumentStore &store,
                                        const core::Clock &clock,
                                        InstrumentEventLog *event_log = nullptr,
                                        InstrumentConfig config = InstrumentConfig());

            // ---------------------------------------------------------------
            // Lifecycle
            // ---------------------------------------------------------------

            /**
             * @brief Validate terms and store a new ACTIVE instrument.
             * @return Instrument with zero accrued interest and last accrual at
             *         the start of the issue date.
             * @throws core::ValidationError Naming the violated field.
             */
            ConvertibleInstrument create_instrument(const InstrumentTerms &terms);

            /**
             * @throws core::NotFoundError If the id is unknown.
             */
            ConvertibleInstrument get(const std::string &id) const;

            /**
             * @brief Accrue interest from the last accrual up to now.
             *
             * Calling twice at the same instant adds nothing. A clock earlier
             * than the last accrual adds nothing and writes nothing.
             *
             * @throws core::NotFoundError, core::InvalidStateError
             */
            AccrualResult accrue_interest(const std::string &id);

            /**
             * @brief Amend negotiable terms of an ACTIVE instrument.
             * @throws core::InvalidStateError If the instrument is not ACTIVE.
             * @throws core::ValidationError If the amended terms are invalid.
             */
            ConvertibleInstrument update_terms(const std::string &id, const TermsUpdate &update);

            /**
             * @brief Price per share the instrument would convert at in @p round.
             * @throws core::ValidationError If the round's price or share basis is not positive.
             */
            double calculate_conversion_price(const std::string &id, const FinancingRound &round) const;

            /**
             * @brief Final accrual, then convert into shares. Terminal.
             * @throws core::InvalidStateError If the instrument is not ACTIVE.
             */
            ConversionResult convert(const std::string &id, const FinancingRound &round);

            /**
             * @brief Final accrual, then mark repaid. Terminal.
             * @throws core::InvalidStateError If the instrument is not ACTIVE.
             * @throws core::InsufficientRepaymentError If the amount is below
             *         principal plus accrued interest. Nothing is written.
             */
            RepaymentResult repay(const std::string &id, double repayment_amount);

            /**
             * @brief Whether a round of @p round_amount meets the instrument's threshold.
             * @return true when no threshold is configured.
             */
            bool check_qualified_financing(const std::string &id, double round_amount) const;

            // ---------------------------------------------------------------
            // Queries
            // ---------------------------------------------------------------

            /**
             * @brief ACTIVE instruments maturing on or before today + @p days,
             *        ascending by maturity date. Overdue instruments are included.
             * @throws core::ValidationError If days is negative.
             */
            std::vector<ConvertibleInstrument> list_maturing_within(int days) const;

            std::vector<ConvertibleInstrument> list_by_startup(const std::string &startup_id) const;
            std::vector<ConvertibleInstrument> list_by_investor(const std::string &investor_id) const;

            // ---------------------------------------------------------------
            // Batch jobs
            // ---------------------------------------------------------------

            /**
             * @brief Accrue every ACTIVE instrument and flag maturity issues.
             *
             * A failure on one instrument is recorded and the batch continues.
             */
            AccrualJobSummary accrue_all_active();

            /**
             * @brief Convert every auto-converting ACTIVE instrument of a startup
             *        for which @p round is a qualified financing.
             * @throws core::ValidationError If the round itself is invalid.
             */
            FinancingRoundOutcome process_financing_round(const std::string &startup_id,
                                                          const FinancingRound &round);

            // ---------------------------------------------------------------
            // Pure helpers
            // ---------------------------------------------------------------

            /**
             * @brief Interest earned over @p days on the instrument's current state.
             * @return 0 for non-positive @p days.
             */
            static double interest_for_period(const ConvertibleInstrument &instrument,
                                              double days,
                                              double days_per_year = 365.0);

            /**
             * @brief min(discount price, cap price, round price).
             * @throws core::ValidationError If the round is invalid.
             */
            static double resolve_conversion_price(const InstrumentTerms &terms,
                                                   const FinancingRound &round);

            const InstrumentConfig &config() const { return config_; }

            /** @brief Per-instrument locks currently held in the table. Terminal instruments have none. */
            size_t tracked_lock_count() const;

        private:
            std::shared_ptr<std::mutex> lock_for(const std::string &id);
            void release_lock(const std::string &id);
            ConvertibleInstrument load(const std::string &id) const;
            ConvertibleInstrument load_active(const std::string &id, const std::string &operation);
            static void require_active(const ConvertibleInstrument &instrument, const std::string &operation);

            /**
             * @brief Bring accrued interest up to @p now on a working copy.
             * @return Interest added.
             */
            double accrue_to(ConvertibleInstrument &instrument, const core::Timestamp &now, double &days_elapsed) const;

            void record_event(InstrumentEventType type,
                              const ConvertibleInstrument &instrument,
                              double amount,
                              const std::string &detail,
                              double price = 0.0,
                              double shares = 0.0) const;

            InstrumentStore &store_;
            const core::Clock &clock_;
            InstrumentEventLog *event_log_;
            InstrumentConfig config_;

            mutable std::mutex locks_mutex_;
            std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
        };

    } // namespace instruments
} // namespace venture

#endif // VENTURE_INSTRUMENTS_CONVERTIBLE_INSTRUMENT_ENGINE_HPP
