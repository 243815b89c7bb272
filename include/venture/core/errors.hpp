/**
 * @file errors.hpp
 * @brief Exception taxonomy for the valuation and conversion engine.
 *
 * Every failure the engine reports derives from EngineError, which is a
 * std::runtime_error. Each kind carries a stable code string that the
 * surrounding service maps to its own error responses.
 */

#ifndef VENTURE_CORE_ERRORS_HPP
#define VENTURE_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace venture
{
    namespace core
    {

        /**
         * @class EngineError
         * @brief Base class of all engine exceptions.
         */
        class EngineError : public std::runtime_error
        {
        public:
            EngineError(const std::string &code, const std::string &message)
                : std::runtime_error(message), code_(code)
            {
            }

            /** @brief Stable, documented error code (e.g. "INVALID_STATE"). */
            const std::string &code() const { return code_; }

        private:
            std::string code_;
        };

        /**
         * @class ValidationError
         * @brief Malformed input terms. Names the offending field.
         */
        class ValidationError : public EngineError
        {
        public:
            ValidationError(const std::string &field, const std::string &message)
                : EngineError("VALIDATION_ERROR", message), field_(field)
            {
            }

            const std::string &field() const { return field_; }

        private:
            std::string field_;
        };

        /** @brief Unknown instrument or portfolio id. */
        class NotFoundError : public EngineError
        {
        public:
            explicit NotFoundError(const std::string &message)
                : EngineError("NOT_FOUND", message)
            {
            }
        };

        /** @brief Operation on an instrument that is no longer ACTIVE. */
        class InvalidStateError : public EngineError
        {
        public:
            explicit InvalidStateError(const std::string &message)
                : EngineError("INVALID_STATE", message)
            {
            }
        };

        /**
         * @class InsufficientRepaymentError
         * @brief Repayment below the principal plus accrued interest.
         */
        class InsufficientRepaymentError : public EngineError
        {
        public:
            InsufficientRepaymentError(const std::string &message, double amount_owed, double amount_offered)
                : EngineError("INSUFFICIENT_REPAYMENT", message), amount_owed_(amount_owed), amount_offered_(amount_offered)
            {
            }

            double amount_owed() const { return amount_owed_; }
            double amount_offered() const { return amount_offered_; }

        private:
            double amount_owed_;
            double amount_offered_;
        };

        /** @brief Too few aligned observations for a comparison. */
        class InsufficientDataError : public EngineError
        {
        public:
            explicit InsufficientDataError(const std::string &message)
                : EngineError("INSUFFICIENT_DATA", message)
            {
            }
        };

        /** @brief Root finder exhausted its iteration bound or found no bracket. */
        class NonConvergenceError : public EngineError
        {
        public:
            NonConvergenceError(const std::string &message, int iterations)
                : EngineError("NON_CONVERGENCE", message), iterations_(iterations)
            {
            }

            int iterations() const { return iterations_; }

        private:
            int iterations_;
        };

        /** @brief A versioned write lost against a concurrent writer. */
        class ConcurrentModificationError : public EngineError
        {
        public:
            explicit ConcurrentModificationError(const std::string &message)
                : EngineError("CONCURRENT_MODIFICATION", message)
            {
            }
        };

        /**
         * @brief Stable code for any exception escaping the engine.
         * @return The EngineError code, or "INTERNAL_ERROR" for anything else.
         */
        std::string error_code(const std::exception &e);

    } // namespace core
} // namespace venture

#endif // VENTURE_CORE_ERRORS_HPP
