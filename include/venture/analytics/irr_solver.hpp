/**
 * @file irr_solver.hpp
 * @brief Internal rate of return for irregularly dated cash flows (XIRR).
 *
 * Solves
 *   NPV(r) = sum_i cf_i / (1 + r)^(t_i / 365) = 0
 * where t_i is the number of days from the first cash flow.
 *
 * Newton-Raphson runs first from the configured guess. If it leaves the
 * admissible interval, stalls on a flat derivative, or exhausts its
 * iteration bound, the solver scans for a sign change and bisects.
 */

#ifndef VENTURE_ANALYTICS_IRR_SOLVER_HPP
#define VENTURE_ANALYTICS_IRR_SOLVER_HPP

#include "venture/data/cash_flow_extractor.hpp"
#include "venture/data/config.hpp"

#include <optional>
#include <vector>

namespace venture
{
    namespace analytics
    {

        /**
         * @struct IrrResult
         * @brief Root found by the solver.
         */
        struct IrrResult
        {
            double rate = 0.0;          ///< Annualized IRR (0.10 = 10%)
            int iterations = 0;         ///< Total iterations across both methods
            bool used_bisection = false;
        };

        /**
         * @class IrrSolver
         * @brief Bounded Newton-Raphson with bisection fallback.
         *
         * Usage:
         * @code
         *   IrrSolver solver;
         *   IrrResult r = solver.solve(flows);
         * @endcode
         *
         * Thread safety: Stateless after construction.
         */
        class IrrSolver
        {
        public:
            explicit IrrSolver(IrrConfig config = IrrConfig(), double days_per_year = 365.0);

            /**
             * @brief Solve for the IRR of @p flows.
             * @throws core::NonConvergenceError If the flows do not change sign,
             *         no bracket exists in [lower_bound, upper_bound], or neither
             *         method converges within its iteration bound.
             */
            IrrResult solve(const std::vector<data::CashFlowEvent> &flows) const;

            /** @brief NPV at @p rate, discounting from the earliest flow date. */
            double npv(const std::vector<data::CashFlowEvent> &flows, double rate) const;

            /** @brief d NPV / d rate. */
            double npv_derivative(const std::vector<data::CashFlowEvent> &flows, double rate) const;

        private:
            std::optional<IrrResult> newton(const std::vector<data::CashFlowEvent> &flows, double scale) const;
            IrrResult bisect(const std::vector<data::CashFlowEvent> &flows, double scale, int iterations_so_far) const;

            IrrConfig config_;
            double days_per_year_;
        };

    } // namespace analytics
} // namespace venture

#endif // VENTURE_ANALYTICS_IRR_SOLVER_HPP
