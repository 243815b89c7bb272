/**
 * @file convertible_instrument.cpp
 * @brief Term validation, enum names, and JSON mapping for instruments.
 */

#include "venture/instruments/convertible_instrument.hpp"
#include "venture/core/errors.hpp"

#include <chrono>
#include <cmath>

namespace venture
{
    namespace instruments
    {

        using core::ValidationError;

        namespace
        {

            void require_percentage(const std::string &field, double value)
            {
                if (!std::isfinite(value) || value < 0.0 || value > 100.0)
                {
                    throw ValidationError(field,
                                          "Expected value in [0, 100] for parameter '" + field + "', got: " + std::to_string(value));
                }
            }

            void require_positive(const std::string &field, double value)
            {
                if (!std::isfinite(value) || value <= 0.0)
                {
                    throw ValidationError(field,
                                          "Expected positive value for parameter '" + field + "', got: " + std::to_string(value));
                }
            }

            std::optional<double> optional_number(const nlohmann::json &j, const char *key)
            {
                if (!j.contains(key) || j.at(key).is_null())
                {
                    return std::nullopt;
                }
                return j.at(key).get<double>();
            }

        } // anonymous namespace

        // ===================================================================
        // Enum names
        // ===================================================================

        std::string to_string(InstrumentKind kind)
        {
            return kind == InstrumentKind::SAFE ? "SAFE" : "CONVERTIBLE_NOTE";
        }

        std::string to_string(SafeType type)
        {
            return type == SafeType::PRE_MONEY ? "PRE_MONEY" : "POST_MONEY";
        }

        std::string to_string(CompoundingMode mode)
        {
            return mode == CompoundingMode::COMPOUND ? "COMPOUND" : "SIMPLE";
        }

        std::string to_string(InstrumentStatus status)
        {
            switch (status)
            {
            case InstrumentStatus::ACTIVE:
                return "ACTIVE";
            case InstrumentStatus::CONVERTED:
                return "CONVERTED";
            case InstrumentStatus::REPAID:
                return "REPAID";
            }
            return "UNKNOWN";
        }

        InstrumentKind parse_instrument_kind(const std::string &text)
        {
            if (text == "CONVERTIBLE_NOTE")
                return InstrumentKind::CONVERTIBLE_NOTE;
            if (text == "SAFE")
                return InstrumentKind::SAFE;
            throw ValidationError("kind", "Unknown instrument kind: '" + text + "'");
        }

        SafeType parse_safe_type(const std::string &text)
        {
            if (text == "POST_MONEY")
                return SafeType::POST_MONEY;
            if (text == "PRE_MONEY")
                return SafeType::PRE_MONEY;
            throw ValidationError("safe_type", "Unknown SAFE type: '" + text + "'");
        }

        CompoundingMode parse_compounding_mode(const std::string &text)
        {
            if (text == "SIMPLE")
                return CompoundingMode::SIMPLE;
            if (text == "COMPOUND")
                return CompoundingMode::COMPOUND;
            throw ValidationError("compounding", "Unknown compounding mode: '" + text + "'");
        }

        // ===================================================================
        // InstrumentTerms
        // ===================================================================

        void InstrumentTerms::validate() const
        {
            if (investment_id.empty())
            {
                throw ValidationError("investment_id", "Instrument must reference an investment");
            }

            require_positive("principal", principal);
            require_percentage("interest_rate", interest_rate);

            if (maturity_date <= issue_date)
            {
                throw ValidationError("maturity_date",
                                      "Maturity date (" + maturity_date.to_string() + ") must be after issue date (" + issue_date.to_string() + ")");
            }

            if (discount_rate)
            {
                require_percentage("discount_rate", *discount_rate);
            }
            if (valuation_cap)
            {
                require_positive("valuation_cap", *valuation_cap);
            }
            if (qualified_financing_threshold)
            {
                require_positive("qualified_financing_threshold", *qualified_financing_threshold);
            }

            if (kind == InstrumentKind::SAFE)
            {
                if (interest_rate != 0.0)
                {
                    throw ValidationError("interest_rate",
                                          "SAFE agreements do not accrue interest, got rate: " + std::to_string(interest_rate));
                }
                if (!valuation_cap && !discount_rate)
                {
                    throw ValidationError("valuation_cap", "SAFE must have either a valuation cap or discount rate");
                }
            }
            else if (safe_type)
            {
                throw ValidationError("safe_type", "safe_type is only valid for SAFE agreements");
            }
        }

        InstrumentTerms InstrumentTerms::from_json(const nlohmann::json &j)
        {
            InstrumentTerms terms;
            terms.investment_id = j.value("investment_id", "");
            terms.startup_id = j.value("startup_id", "");
            terms.investor_id = j.value("investor_id", "");
            terms.kind = parse_instrument_kind(j.value("kind", "CONVERTIBLE_NOTE"));
            if (j.contains("safe_type"))
            {
                terms.safe_type = parse_safe_type(j.at("safe_type").get<std::string>());
            }
            else if (terms.kind == InstrumentKind::SAFE)
            {
                terms.safe_type = SafeType::POST_MONEY;
            }
            terms.principal = j.value("principal", 0.0);
            terms.interest_rate = j.value("interest_rate", 0.0);
            terms.issue_date = core::Date::parse(j.at("issue_date").get<std::string>());
            terms.maturity_date = core::Date::parse(j.at("maturity_date").get<std::string>());
            terms.discount_rate = optional_number(j, "discount_rate");
            terms.valuation_cap = optional_number(j, "valuation_cap");
            terms.qualified_financing_threshold = optional_number(j, "qualified_financing_threshold");
            terms.auto_conversion = j.value("auto_conversion", true);
            terms.compounding = parse_compounding_mode(j.value("compounding", "SIMPLE"));
            return terms;
        }

        // ===================================================================
        // FinancingRound
        // ===================================================================

        void FinancingRound::validate() const
        {
            require_positive("price_per_share", price_per_share);
            require_positive("fully_diluted_shares", fully_diluted_shares);
            if (!std::isfinite(amount_raised) || amount_raised < 0.0)
            {
                throw ValidationError("amount_raised",
                                      "Expected non-negative value for parameter 'amount_raised', got: " + std::to_string(amount_raised));
            }
        }

        // ===================================================================
        // ConvertibleInstrument
        // ===================================================================

        nlohmann::json ConvertibleInstrument::to_json() const
        {
            nlohmann::json j;
            j["id"] = id;
            j["investment_id"] = terms.investment_id;
            j["startup_id"] = terms.startup_id;
            j["investor_id"] = terms.investor_id;
            j["kind"] = to_string(terms.kind);
            if (terms.safe_type)
            {
                j["safe_type"] = to_string(*terms.safe_type);
            }
            j["principal"] = terms.principal;
            j["interest_rate"] = terms.interest_rate;
            j["issue_date"] = terms.issue_date.to_string();
            j["maturity_date"] = terms.maturity_date.to_string();
            j["discount_rate"] = terms.discount_rate ? nlohmann::json(*terms.discount_rate) : nlohmann::json();
            j["valuation_cap"] = terms.valuation_cap ? nlohmann::json(*terms.valuation_cap) : nlohmann::json();
            j["qualified_financing_threshold"] = terms.qualified_financing_threshold
                                                     ? nlohmann::json(*terms.qualified_financing_threshold)
                                                     : nlohmann::json();
            j["auto_conversion"] = terms.auto_conversion;
            j["compounding"] = to_string(terms.compounding);
            j["status"] = to_string(status);
            j["accrued_interest"] = accrued_interest;
            j["last_accrual"] = core::Date::from_timestamp(last_accrual).to_string();
            j["conversion_price"] = conversion_price ? nlohmann::json(*conversion_price) : nlohmann::json();
            j["conversion_shares"] = conversion_shares ? nlohmann::json(*conversion_shares) : nlohmann::json();
            j["version"] = version;
            return j;
        }

    } // namespace instruments
} // namespace venture
