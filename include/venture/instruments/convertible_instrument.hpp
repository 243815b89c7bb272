/**
 * @file convertible_instrument.hpp
 * @brief Convertible note and SAFE records and their term structures.
 *
 * An instrument is created ACTIVE at deal closing and leaves that state
 * exactly once, either by converting into equity at a priced financing
 * round or by being repaid. Terminal states are never left again.
 */

#ifndef VENTURE_INSTRUMENTS_CONVERTIBLE_INSTRUMENT_HPP
#define VENTURE_INSTRUMENTS_CONVERTIBLE_INSTRUMENT_HPP

#include "venture/core/date.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace venture
{
    namespace instruments
    {

        /**
         * @enum InstrumentKind
         * @brief Legal form of the convertible.
         */
        enum class InstrumentKind
        {
            CONVERTIBLE_NOTE, ///< Debt that accrues interest until conversion or repayment
            SAFE              ///< Simple agreement for future equity (no interest)
        };

        /**
         * @enum SafeType
         * @brief Valuation basis of a SAFE cap.
         */
        enum class SafeType
        {
            POST_MONEY,
            PRE_MONEY
        };

        /**
         * @enum CompoundingMode
         * @brief Interest accrual method.
         */
        enum class CompoundingMode
        {
            SIMPLE,  ///< principal * rate * days / 365
            COMPOUND ///< annual compounding on the running balance
        };

        /**
         * @enum InstrumentStatus
         * @brief Lifecycle state. ACTIVE -> CONVERTED | REPAID only.
         */
        enum class InstrumentStatus
        {
            ACTIVE,
            CONVERTED,
            REPAID
        };

        std::string to_string(InstrumentKind kind);
        std::string to_string(SafeType type);
        std::string to_string(CompoundingMode mode);
        std::string to_string(InstrumentStatus status);

        /**
         * @brief Parse enum names as written by to_string().
         * @throws core::ValidationError On an unknown name.
         */
        InstrumentKind parse_instrument_kind(const std::string &text);
        SafeType parse_safe_type(const std::string &text);
        CompoundingMode parse_compounding_mode(const std::string &text);

        /**
         * @struct InstrumentTerms
         * @brief Terms negotiated at deal closing.
         *
         * Percentages are expressed on a 0-100 scale (8.0 = 8%).
         */
        struct InstrumentTerms
        {
            std::string investment_id;                            ///< Owning investment reference
            std::string startup_id;                               ///< Issuing startup
            std::string investor_id;                              ///< Holder
            InstrumentKind kind = InstrumentKind::CONVERTIBLE_NOTE;
            std::optional<SafeType> safe_type;                    ///< Only meaningful for SAFEs
            double principal = 0.0;                               ///< Invested amount
            double interest_rate = 0.0;                           ///< Annual rate, 0-100
            core::Date issue_date;
            core::Date maturity_date;
            std::optional<double> discount_rate;                  ///< 0-100
            std::optional<double> valuation_cap;                  ///< Currency amount, > 0
            std::optional<double> qualified_financing_threshold;  ///< Minimum round size, > 0
            bool auto_conversion = true;                          ///< Convert automatically on a qualified round
            CompoundingMode compounding = CompoundingMode::SIMPLE;

            /**
             * @brief Check every term.
             * @throws core::ValidationError Naming the first violated field.
             */
            void validate() const;

            static InstrumentTerms from_json(const nlohmann::json &j);
        };

        /**
         * @struct TermsUpdate
         * @brief Amendment of an ACTIVE instrument's negotiable terms.
         *
         * Only fields that are set are applied.
         */
        struct TermsUpdate
        {
            std::optional<double> discount_rate;
            std::optional<double> valuation_cap;
            std::optional<double> qualified_financing_threshold;
            std::optional<bool> auto_conversion;

            bool empty() const
            {
                return !discount_rate && !valuation_cap && !qualified_financing_threshold && !auto_conversion;
            }
        };

        /**
         * @struct FinancingRound
         * @brief Priced equity round that can trigger a conversion.
         */
        struct FinancingRound
        {
            std::string round_id;
            double price_per_share = 0.0;     ///< Price paid by new investors
            double fully_diluted_shares = 0.0; ///< Round's fully-diluted capitalization (cap price basis)
            double amount_raised = 0.0;        ///< Round size, for qualified-financing checks

            /**
             * @throws core::ValidationError If price or share basis is not positive.
             */
            void validate() const;
        };

        /**
         * @struct ConvertibleInstrument
         * @brief Stored instrument record.
         */
        struct ConvertibleInstrument
        {
            std::string id;
            InstrumentTerms terms;
            InstrumentStatus status = InstrumentStatus::ACTIVE;
            double accrued_interest = 0.0;
            core::Timestamp last_accrual;
            std::optional<double> conversion_price;   ///< Set on conversion only
            std::optional<double> conversion_shares;  ///< Set on conversion only
            std::optional<core::Timestamp> closed_at; ///< Time of conversion or repayment
            std::uint64_t version = 0;                ///< Bumped by every committed write

            bool is_active() const { return status == InstrumentStatus::ACTIVE; }

            /** @brief principal + accrued interest. */
            double balance() const { return terms.principal + accrued_interest; }

            nlohmann::json to_json() const;
        };

    } // namespace instruments
} // namespace venture

#endif // VENTURE_INSTRUMENTS_CONVERTIBLE_INSTRUMENT_HPP
