/**
 * @file cost_of_capital.hpp
 * @brief Weighted average cost of capital (WACC)
 *
 * Formula:
 *     cost_of_equity = r_f + beta * MRP                       (CAPM)
 *     cost_of_debt   = r_f + spread
 *     w_E            = E / (E + D),  w_D = 1 - w_E
 *     WACC           = w_E * cost_of_equity + w_D * cost_of_debt * (1 - t)
 *
 * The debt spread is a simplifying assumption (0.02 by default), not a
 * credit-derived figure.
 */

#pragma once

#include "data/financial_inputs.hpp"

namespace valuation
{
    namespace model
    {

        /**
         * @struct CostOfCapital
         * @brief WACC together with its components
         */
        struct CostOfCapital
        {
            double cost_of_equity = 0.0;          ///< CAPM cost of equity
            double cost_of_debt = 0.0;            ///< Pre-tax cost of debt
            double after_tax_cost_of_debt = 0.0;  ///< cost_of_debt * (1 - tax)
            double equity_weight = 1.0;           ///< E / (E + D)
            double debt_weight = 0.0;             ///< D / (E + D)
            double wacc = 0.0;                    ///< Weighted average cost of capital
        };

        /**
         * @class CostOfCapitalCalculator
         * @brief Derives the base discount rate from capital structure and market risk
         *
         * Computed once per request; scenario discount rates are offsets from
         * this base rate.
         */
        class CostOfCapitalCalculator
        {
        public:
            static constexpr double DEFAULT_DEBT_SPREAD = 0.02;

            /**
             * @brief Construct calculator
             * @param debt_spread Spread over the risk-free rate for the cost of debt
             * @throws std::invalid_argument if debt_spread is negative or not finite
             */
            explicit CostOfCapitalCalculator(double debt_spread = DEFAULT_DEBT_SPREAD);

            /**
             * @brief Compute WACC and its components
             * @param bundle Financial inputs (capital structure and market risk)
             * @return CostOfCapital breakdown
             *
             * If market_cap + total_debt is zero the WACC equals the cost of equity.
             */
            CostOfCapital calculate(const FinancialInputBundle &bundle) const;

            /**
             * @brief Compute WACC only
             */
            double calculate_wacc(const FinancialInputBundle &bundle) const;

            /**
             * @brief CAPM cost of equity
             */
            static double cost_of_equity(double risk_free_rate, double beta, double market_risk_premium);

            double get_debt_spread() const { return debt_spread_; }

        private:
            double debt_spread_; ///< Spread added to the risk-free rate
        };

    } // namespace model
} // namespace valuation
